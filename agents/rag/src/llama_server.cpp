#include "../include/llama_server.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

LlamaServerModel::LlamaServerModel(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.server_url.empty() && cfg_.server_url.back() == '/') cfg_.server_url.pop_back();
}

std::string make_completion_request(const std::string& prompt, const GenerationParams& params) {
    json body = {
        {"prompt", prompt},
        {"n_predict", params.max_new_tokens},
        {"temperature", params.sampling ? params.temperature : 0.0f},
        {"cache_prompt", true},
        {"stream", false}
    };
    if (!params.sampling) body["top_k"] = 1;
    return body.dump();
}

std::vector<int> parse_tokenize_response(const std::string& body) {
    auto data = json::parse(body);
    if (!data.contains("tokens") || !data["tokens"].is_array()) {
        throw std::runtime_error("tokenize response missing 'tokens'");
    }
    return data["tokens"].get<std::vector<int>>();
}

std::string parse_completion_response(const std::string& body) {
    auto data = json::parse(body);
    if (!data.contains("content") || !data["content"].is_string()) {
        throw std::runtime_error("completion response missing 'content'");
    }
    return data["content"].get<std::string>();
}

std::vector<int> LlamaServerModel::tokenize(const std::string& text) {
    json body = {{"content", text}, {"add_special", false}};
    auto r = http_post_json(cfg_.server_url + "/tokenize", body.dump(), cfg_.timeout_ms);
    ensure_ok(r, "tokenize");
    return parse_tokenize_response(r.body);
}

std::string LlamaServerModel::detokenize(const std::vector<int>& tokens) {
    json body = {{"tokens", tokens}};
    auto r = http_post_json(cfg_.server_url + "/detokenize", body.dump(), cfg_.timeout_ms);
    ensure_ok(r, "detokenize");
    auto data = json::parse(r.body);
    return data.value("content", std::string());
}

int LlamaServerModel::token_count(const std::string& text) {
    return (int)tokenize(text).size();
}

std::string LlamaServerModel::truncate(const std::string& text, int max_tokens, TruncationSide side) {
    if (max_tokens <= 0) return {};
    auto tokens = tokenize(text);
    if ((int)tokens.size() <= max_tokens) return text;
    if (side == TruncationSide::KeepTail) {
        tokens.erase(tokens.begin(), tokens.end() - max_tokens);
    } else {
        tokens.resize((size_t)max_tokens);
    }
    return detokenize(tokens);
}

std::string LlamaServerModel::generate(const std::string& prompt, const GenerationParams& params) {
    auto r = http_post_json(cfg_.server_url + "/completion", make_completion_request(prompt, params), cfg_.timeout_ms);
    ensure_ok(r, "completion");
    return prompt + parse_completion_response(r.body);
}
