#include "fakes.hpp"
#include "../agents/rag/include/chunker.hpp"
#include <gtest/gtest.h>

TEST(Chunker, SingleParagraphYieldsNothing) {
    auto p = make_paper("p1", words(500));
    EXPECT_TRUE(chunk_paper(p).empty());
}

TEST(Chunker, EmptyTextYieldsNothing) {
    EXPECT_TRUE(chunk_paper(make_paper("p1", "")).empty());
    EXPECT_TRUE(chunk_paper(make_paper("p1", "\n\n   \n\n")).empty());
}

TEST(Chunker, MinimumWordCountIsStrict) {
    // two paragraphs of 15 words each: exactly 30, dropped
    auto at_threshold = make_paper("p1", words(15, "a") + "\n\n" + words(15, "b"));
    EXPECT_TRUE(chunk_paper(at_threshold).empty());

    auto above = make_paper("p2", words(15, "a") + "\n\n" + words(16, "b"));
    auto chunks = chunk_paper(above);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(word_count(chunks[0].text), 31);
}

TEST(Chunker, FiveParagraphsGiveThreeWindows) {
    auto p = make_paper("p1", paragraphs(5, 40));
    auto chunks = chunk_paper(p);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(word_count(chunks[0].text), 80);
    EXPECT_EQ(word_count(chunks[1].text), 80);
    EXPECT_EQ(word_count(chunks[2].text), 40);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].source_id(), "p1");
        EXPECT_EQ(chunks[i].paper, p);
    }
}

TEST(Chunker, ParagraphsAreJoinedWithBlankLine) {
    auto p = make_paper("p1", words(20, "a") + "\n\n\n" + words(20, "b"));
    auto chunks = chunk_paper(p);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, words(20, "a") + "\n\n" + words(20, "b"));
}

TEST(Chunker, ShortWindowsDoNotConsumeIndexes) {
    // windows: [40+40], [5+5], [40]
    std::string text = words(40, "a") + "\n\n" + words(40, "b") + "\n\n" + words(5, "c") + "\n\n" +
                       words(5, "d") + "\n\n" + words(40, "e");
    auto chunks = chunk_paper(make_paper("p1", text));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[1].index, 1);
    EXPECT_EQ(chunks[1].text, words(40, "e"));
}

TEST(Chunker, InvalidOptionsThrow) {
    ChunkOptions bad;
    bad.window = 0;
    EXPECT_THROW(chunk_paper(make_paper("p1", paragraphs(3, 40)), bad), std::invalid_argument);
    EXPECT_THROW(chunk_paper(nullptr), std::invalid_argument);
}
