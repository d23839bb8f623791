#include "../include/retriever.hpp"
#include "../include/errors.hpp"
#include <stdexcept>

Retriever::Retriever(Embedder& embedder, std::shared_ptr<const CorpusSnapshot> corpus)
    : embedder_(embedder), corpus_(std::move(corpus)) {}

std::vector<RetrievedChunk> Retriever::retrieve(const std::string& question, int k) const {
    if (!corpus_) throw RetrievalEmpty("no corpus has been ingested");
    if (corpus_->empty()) throw RetrievalEmpty("the corpus index holds no chunks");

    auto vecs = embedder_.embed({question});
    if (vecs.size() != 1) {
        throw std::runtime_error("embedder returned " + std::to_string(vecs.size()) + " vectors for one question");
    }
    auto neighbors = corpus_->index->search(vecs.front(), k);

    std::vector<RetrievedChunk> out;
    out.reserve(neighbors.size());
    for (auto& n : neighbors) {
        if (n.ordinal >= corpus_->chunks.size()) {
            throw std::logic_error("index ordinal " + std::to_string(n.ordinal) + " has no chunk");
        }
        out.push_back({corpus_->chunks[n.ordinal], n.ordinal, n.distance});
    }
    return out;
}
