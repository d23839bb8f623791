#pragma once
#include "types.hpp"
#include <memory>
#include <vector>

struct ChunkOptions {
    int window{2};     // paragraphs per chunk
    int stride{2};     // paragraphs the window advances by
    int min_words{30}; // a chunk must have strictly more words than this
};

// Splits a paper into paragraph windows. Papers with fewer paragraphs than
// one window, and windows at or below min_words, produce nothing.
std::vector<Chunk> chunk_paper(const std::shared_ptr<const Paper>& paper, const ChunkOptions& opts = {});
