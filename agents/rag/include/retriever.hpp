#pragma once
#include "services.hpp"
#include "vector_index.hpp"
#include <memory>
#include <string>
#include <vector>

struct RetrievedChunk {
    Chunk chunk;
    size_t ordinal{0};
    float distance{0.0f};
};

class Retriever {
public:
    Retriever(Embedder& embedder, std::shared_ptr<const CorpusSnapshot> corpus);

    // At most k chunks, nearest first. Throws RetrievalEmpty when there is no
    // corpus or it holds no chunks.
    std::vector<RetrievedChunk> retrieve(const std::string& question, int k) const;

private:
    Embedder& embedder_;
    std::shared_ptr<const CorpusSnapshot> corpus_;
};
