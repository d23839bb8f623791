#pragma once
#include "config.hpp"
#include "services.hpp"
#include <string>
#include <vector>

// Embeddings from an Ollama server's /api/embed endpoint.
class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedConfig cfg);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& batch) override;
    std::string model() const override { return cfg_.embed_model; }

private:
    EmbedConfig cfg_;
};

std::string make_embed_request(const std::string& model, const std::vector<std::string>& batch);
// Checks one vector per input and a single shared dimension.
std::vector<std::vector<float>> parse_embed_response(const std::string& body, size_t expected);
