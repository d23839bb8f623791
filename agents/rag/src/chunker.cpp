#include "../include/chunker.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <stdexcept>

const std::string& Chunk::source_id() const {
    if (!paper) throw std::logic_error("chunk has no source paper");
    return paper->ref.id;
}

const std::string& Chunk::title() const {
    if (!paper) throw std::logic_error("chunk has no source paper");
    return paper->ref.title;
}

std::vector<Chunk> chunk_paper(const std::shared_ptr<const Paper>& paper, const ChunkOptions& opts) {
    if (!paper) throw std::invalid_argument("chunk_paper: null paper");
    if (opts.window < 1 || opts.stride < 1) {
        throw std::invalid_argument("chunk_paper: window and stride must be positive");
    }
    std::vector<Chunk> chunks;
    auto paragraphs = split_paragraphs(paper->text);
    if ((int)paragraphs.size() < opts.window) return chunks;

    int next_index = 0;
    for (size_t i = 0; i < paragraphs.size(); i += (size_t)opts.stride) {
        size_t end = std::min(paragraphs.size(), i + (size_t)opts.window);
        std::string text;
        for (size_t j = i; j < end; ++j) {
            if (!text.empty()) text += "\n\n";
            text += paragraphs[j];
        }
        if (word_count(text) <= opts.min_words) continue;
        Chunk c;
        c.text = std::move(text);
        c.index = next_index++;
        c.paper = paper;
        chunks.push_back(std::move(c));
    }
    return chunks;
}
