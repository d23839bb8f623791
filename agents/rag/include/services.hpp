#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Collaborators the pipeline talks to. Concrete HTTP clients live in
// ollama.hpp, llama_server.hpp, semantic_scholar.hpp and directory_source.hpp;
// tests substitute in-process fakes.

class DocumentSource {
public:
    virtual ~DocumentSource() = default;
    virtual std::vector<DocumentRef> search(const std::string& query, int limit) = 0;
    // Throws SourceUnavailable when the document cannot be turned into text.
    virtual Paper fetch(const DocumentRef& ref) = 0;
};

class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    virtual std::string extract_text(const std::string& bytes) = 0;
};

class Embedder {
public:
    virtual ~Embedder() = default;
    // One vector per input, all of the same dimension.
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& batch) = 0;
    virtual std::string model() const = 0;
};

enum class TruncationSide {
    KeepHead,
    KeepTail,
};

struct GenerationParams {
    int max_new_tokens{256};
    float temperature{0.7f};
    bool sampling{true};
};

class GenerativeModel {
public:
    virtual ~GenerativeModel() = default;
    virtual int token_count(const std::string& text) = 0;
    virtual std::string truncate(const std::string& text, int max_tokens, TruncationSide side) = 0;
    // Returns the prompt followed by the generated continuation.
    virtual std::string generate(const std::string& prompt, const GenerationParams& params) = 0;
};
