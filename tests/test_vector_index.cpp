#include "fakes.hpp"
#include "../agents/rag/include/vector_index.hpp"
#include <gtest/gtest.h>

TEST(FlatL2Index, NearestFirst) {
    FlatL2Index idx(2);
    idx.add({{0.0f, 0.0f}, {10.0f, 0.0f}, {1.0f, 1.0f}});
    auto hits = idx.search({0.9f, 0.9f}, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].ordinal, 2u);
    EXPECT_EQ(hits[1].ordinal, 0u);
    EXPECT_EQ(hits[2].ordinal, 1u);
    EXPECT_NEAR(hits[0].distance, 0.02f, 1e-5);
    EXPECT_LE(hits[0].distance, hits[1].distance);
}

TEST(FlatL2Index, TiesKeepInsertionOrder) {
    FlatL2Index idx(1);
    idx.add(std::vector<std::vector<float>>{{1.0f}, {-1.0f}, {1.0f}});
    auto hits = idx.search({0.0f}, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].ordinal, 0u);
    EXPECT_EQ(hits[1].ordinal, 1u);
    EXPECT_EQ(hits[2].ordinal, 2u);
}

TEST(FlatL2Index, KLargerThanSizeReturnsAll) {
    FlatL2Index idx(2);
    idx.add({{0.0f, 0.0f}, {1.0f, 0.0f}});
    EXPECT_EQ(idx.search({0.0f, 0.0f}, 10).size(), 2u);
    EXPECT_TRUE(idx.search({0.0f, 0.0f}, 0).empty());
}

TEST(FlatL2Index, DimensionMismatchThrows) {
    FlatL2Index idx(3);
    EXPECT_THROW(idx.add({1.0f, 2.0f}), std::invalid_argument);
    idx.add({1.0f, 2.0f, 3.0f});
    EXPECT_THROW(idx.search({1.0f}, 1), std::invalid_argument);
    FlatL2Index zero(0);
    EXPECT_THROW(zero.add(std::vector<float>{1.0f}), std::invalid_argument);
}

TEST(FlatL2Index, VectorRoundTripsRow) {
    FlatL2Index idx(2);
    idx.add({{1.0f, 2.0f}, {3.0f, 4.0f}});
    EXPECT_EQ(idx.vector(1), (std::vector<float>{3.0f, 4.0f}));
    EXPECT_THROW(idx.vector(2), std::out_of_range);
}

TEST(BuildIndex, OneRowPerChunkInBatches) {
    auto p = make_paper("p1", "");
    std::vector<Chunk> chunks;
    for (int i = 0; i < 5; ++i) chunks.push_back(make_chunk(p, words(i + 1), i));
    FakeEmbedder emb;
    auto idx = build_index(chunks, emb, 2);
    EXPECT_EQ(idx->size(), 5u);
    EXPECT_EQ(idx->dim(), 8u);
    EXPECT_EQ(emb.calls, 3);
}

TEST(BuildIndex, RebuildIsIdempotent) {
    auto p = make_paper("p1", "");
    std::vector<Chunk> chunks = {make_chunk(p, "alpha beta"), make_chunk(p, "gamma delta epsilon", 1)};
    FakeEmbedder emb;
    auto a = build_index(chunks, emb);
    auto b = build_index(chunks, emb);
    ASSERT_EQ(a->size(), b->size());
    for (size_t i = 0; i < a->size(); ++i) EXPECT_EQ(a->vector(i), b->vector(i));
}

TEST(BuildIndex, EmptyChunksGiveEmptyIndex) {
    FakeEmbedder emb;
    auto idx = build_index({}, emb);
    EXPECT_EQ(idx->size(), 0u);
    EXPECT_EQ(emb.calls, 0);
    EXPECT_THROW(build_index({}, emb, 0), std::invalid_argument);
}

TEST(BuildIndex, InconsistentDimensionThrows) {
    auto p = make_paper("p1", "");
    std::vector<Chunk> chunks = {make_chunk(p, "a"), make_chunk(p, "b", 1)};
    FakeEmbedder emb;
    emb.fixed["a"] = {1.0f, 0.0f};
    emb.fixed["b"] = {1.0f, 0.0f, 0.0f};
    EXPECT_THROW(build_index(chunks, emb), std::invalid_argument);
}
