#pragma once
#include "config.hpp"
#include "services.hpp"
#include <string>
#include <vector>

// Tokenizer and completion endpoints of a llama.cpp server.
class LlamaServerModel : public GenerativeModel {
public:
    explicit LlamaServerModel(LlmConfig cfg);

    int token_count(const std::string& text) override;
    std::string truncate(const std::string& text, int max_tokens, TruncationSide side) override;
    // The server returns only the continuation; the prompt is echoed in front
    // of it like a text-generation pipeline does.
    std::string generate(const std::string& prompt, const GenerationParams& params) override;

private:
    std::vector<int> tokenize(const std::string& text);
    std::string detokenize(const std::vector<int>& tokens);

    LlmConfig cfg_;
};

std::string make_completion_request(const std::string& prompt, const GenerationParams& params);
std::vector<int> parse_tokenize_response(const std::string& body);
std::string parse_completion_response(const std::string& body);
