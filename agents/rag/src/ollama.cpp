#include "../include/ollama.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string make_embed_request(const std::string& model, const std::vector<std::string>& batch) {
    json body = {
        {"model", model},
        {"input", batch}
    };
    return body.dump();
}

std::vector<std::vector<float>> parse_embed_response(const std::string& body, size_t expected) {
    auto data = json::parse(body);
    if (!data.contains("embeddings") || !data["embeddings"].is_array()) {
        throw std::runtime_error("Ollama embed response missing 'embeddings'");
    }
    auto vecs = data["embeddings"].get<std::vector<std::vector<float>>>();
    if (vecs.size() != expected) {
        throw std::runtime_error("Ollama returned " + std::to_string(vecs.size()) + " embeddings for " +
                                 std::to_string(expected) + " inputs");
    }
    for (auto& v : vecs) {
        if (v.empty() || v.size() != vecs.front().size()) {
            throw std::runtime_error("Ollama returned embeddings of inconsistent dimension");
        }
    }
    return vecs;
}

std::vector<std::vector<float>> OllamaEmbedder::embed(const std::vector<std::string>& batch) {
    if (batch.empty()) return {};
    auto r = http_post_json(cfg_.ollama_url + "/api/embed", make_embed_request(cfg_.embed_model, batch), cfg_.timeout_ms);
    ensure_ok(r, "embedding");
    return parse_embed_response(r.body, batch.size());
}
