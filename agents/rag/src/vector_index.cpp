#include "../include/vector_index.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

FlatL2Index::FlatL2Index(size_t dim) : dim_(dim) {}

void FlatL2Index::add(const std::vector<float>& vec) {
    if (dim_ == 0) throw std::invalid_argument("FlatL2Index: zero dimension");
    if (vec.size() != dim_) {
        throw std::invalid_argument("FlatL2Index: vector of dimension " + std::to_string(vec.size()) +
                                    " does not match index dimension " + std::to_string(dim_));
    }
    data_.insert(data_.end(), vec.begin(), vec.end());
}

void FlatL2Index::add(const std::vector<std::vector<float>>& vecs) {
    data_.reserve(data_.size() + vecs.size() * dim_);
    for (auto& v : vecs) add(v);
}

std::vector<float> FlatL2Index::vector(size_t ordinal) const {
    if (ordinal >= size()) throw std::out_of_range("FlatL2Index: ordinal out of range");
    auto first = data_.begin() + (std::ptrdiff_t)(ordinal * dim_);
    return std::vector<float>(first, first + (std::ptrdiff_t)dim_);
}

float squared_l2(const float* a, const float* b, size_t dim) {
    double sum = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double d = (double)a[i] - (double)b[i];
        sum += d * d;
    }
    return (float)sum;
}

std::vector<Neighbor> FlatL2Index::search(const std::vector<float>& query, int k) const {
    std::vector<Neighbor> out;
    if (k <= 0 || size() == 0) return out;
    if (query.size() != dim_) {
        throw std::invalid_argument("FlatL2Index: query of dimension " + std::to_string(query.size()) +
                                    " does not match index dimension " + std::to_string(dim_));
    }
    out.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        out.push_back({i, squared_l2(query.data(), data_.data() + i * dim_, dim_)});
    }
    auto closer = [](const Neighbor& a, const Neighbor& b) {
        if (a.distance == b.distance) return a.ordinal < b.ordinal;
        return a.distance < b.distance;
    };
    size_t n = std::min(out.size(), (size_t)k);
    std::partial_sort(out.begin(), out.begin() + (std::ptrdiff_t)n, out.end(), closer);
    out.resize(n);
    return out;
}

std::shared_ptr<FlatL2Index> build_index(const std::vector<Chunk>& chunks, Embedder& embedder, int batch_size) {
    if (batch_size <= 0) throw std::invalid_argument("build_index: batch size must be positive");
    if (chunks.empty()) return std::make_shared<FlatL2Index>(0);

    std::shared_ptr<FlatL2Index> index;
    for (size_t start = 0; start < chunks.size(); start += (size_t)batch_size) {
        size_t end = std::min(chunks.size(), start + (size_t)batch_size);
        std::vector<std::string> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; ++i) batch.push_back(chunks[i].text);

        auto vecs = embedder.embed(batch);
        if (vecs.size() != batch.size()) {
            throw std::runtime_error("embedder returned " + std::to_string(vecs.size()) +
                                     " vectors for a batch of " + std::to_string(batch.size()));
        }
        if (!index) {
            if (vecs.front().empty()) throw std::runtime_error("embedder returned an empty vector");
            index = std::make_shared<FlatL2Index>(vecs.front().size());
        }
        index->add(vecs);
        log_debug("index", "embedded chunks " + std::to_string(end) + "/" + std::to_string(chunks.size()));
    }
    return index;
}
