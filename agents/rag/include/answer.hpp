#pragma once
#include "services.hpp"
#include <string>
#include <variant>

struct AnswerOptions {
    int max_new_tokens{256};
    int max_input_tokens{2048};
    float temperature{0.7f};
    bool sampling{true};
    TruncationSide truncation{TruncationSide::KeepTail};
    std::string delimiter{"Answer:"};
};

struct DelimiterFound {
    std::string text; // after the last delimiter, trimmed
};

struct DelimiterMissing {
    std::string raw; // model output, untouched
};

using ExtractedAnswer = std::variant<DelimiterFound, DelimiterMissing>;

ExtractedAnswer extract_answer(const std::string& raw, const std::string& delimiter);
const std::string& answer_text(const ExtractedAnswer& a);
inline bool delimiter_found(const ExtractedAnswer& a) { return std::holds_alternative<DelimiterFound>(a); }

class AnswerGenerator {
public:
    explicit AnswerGenerator(GenerativeModel& model, AnswerOptions opts = {});

    std::string build_prompt(const std::string& question, const std::string& context) const;

    // Builds the prompt, truncates it to max_input_tokens and generates. Any
    // failure of the model is rethrown as GenerationFailure.
    ExtractedAnswer answer(const std::string& question, const std::string& context);

    const AnswerOptions& options() const { return opts_; }

private:
    GenerativeModel& model_;
    AnswerOptions opts_;
};
