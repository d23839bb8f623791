#pragma once
#include "services.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <memory>
#include <vector>

struct Neighbor {
    size_t ordinal{0};
    float distance{0.0f}; // squared L2
};

// Exhaustive squared-L2 index. Row i is the embedding of chunk i.
class FlatL2Index {
public:
    explicit FlatL2Index(size_t dim);

    void add(const std::vector<float>& vec);
    void add(const std::vector<std::vector<float>>& vecs);

    // Nearest first; equal distances keep ordinal order. k beyond size() returns everything.
    std::vector<Neighbor> search(const std::vector<float>& query, int k) const;

    size_t dim() const { return dim_; }
    size_t size() const { return dim_ == 0 ? 0 : data_.size() / dim_; }
    std::vector<float> vector(size_t ordinal) const;

private:
    size_t dim_;
    std::vector<float> data_;
};

float squared_l2(const float* a, const float* b, size_t dim);

// Embeds every chunk through the embedder in batches and inserts the vectors in
// chunk order. An empty chunk list yields an empty index.
std::shared_ptr<FlatL2Index> build_index(const std::vector<Chunk>& chunks, Embedder& embedder, int batch_size = 32);

// The immutable product of one ingestion: papers, their chunks and the index over them.
struct CorpusSnapshot {
    std::vector<std::shared_ptr<const Paper>> papers;
    std::vector<Chunk> chunks;
    std::shared_ptr<const FlatL2Index> index;
    std::string embed_model;

    bool empty() const { return chunks.empty() || !index || index->size() == 0; }
};
