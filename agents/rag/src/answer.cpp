#include "../include/answer.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <sstream>

ExtractedAnswer extract_answer(const std::string& raw, const std::string& delimiter) {
    if (delimiter.empty()) return DelimiterMissing{raw};
    auto pos = raw.rfind(delimiter);
    if (pos == std::string::npos) return DelimiterMissing{raw};
    return DelimiterFound{trim(raw.substr(pos + delimiter.size()))};
}

const std::string& answer_text(const ExtractedAnswer& a) {
    if (auto* f = std::get_if<DelimiterFound>(&a)) return f->text;
    return std::get<DelimiterMissing>(a).raw;
}

AnswerGenerator::AnswerGenerator(GenerativeModel& model, AnswerOptions opts)
    : model_(model), opts_(std::move(opts)) {}

std::string AnswerGenerator::build_prompt(const std::string& question, const std::string& context) const {
    std::ostringstream oss;
    oss << "You are a research assistant. Answer the question using only the numbered sources below.\n"
        << "Cite the sources you use by their number in square brackets, for example [1].\n"
        << "If the sources do not contain the answer, say so.\n\n"
        << "Sources:\n" << context << "\n\n"
        << "Question: " << question << "\n\n"
        << opts_.delimiter;
    return oss.str();
}

ExtractedAnswer AnswerGenerator::answer(const std::string& question, const std::string& context) {
    auto prompt = build_prompt(question, context);
    GenerationParams params;
    params.max_new_tokens = opts_.max_new_tokens;
    params.temperature = opts_.temperature;
    params.sampling = opts_.sampling;

    std::string raw;
    try {
        int prompt_tokens = model_.token_count(prompt);
        if (prompt_tokens > opts_.max_input_tokens) {
            log_warn("answer", "prompt has " + std::to_string(prompt_tokens) + " tokens, truncating to " +
                               std::to_string(opts_.max_input_tokens));
            prompt = model_.truncate(prompt, opts_.max_input_tokens, opts_.truncation);
        }
        raw = model_.generate(prompt, params);
    } catch (const GenerationFailure&) {
        throw;
    } catch (const ServiceTimeout& e) {
        throw GenerationFailure(std::string("generation timed out: ") + e.what(), true);
    } catch (const std::exception& e) {
        throw GenerationFailure(std::string("generation failed: ") + e.what(), false);
    }

    auto extracted = extract_answer(raw, opts_.delimiter);
    if (!delimiter_found(extracted)) {
        log_debug("answer", "delimiter '" + opts_.delimiter + "' not in model output, returning it unmodified");
    }
    return extracted;
}
