#include "fakes.hpp"
#include "../agents/rag/include/chunker.hpp"
#include "../agents/rag/include/store.hpp"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
struct StoreTest : ::testing::Test {
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("paperqa_store_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
        db = (dir / "corpus.db").string();
    }
    void TearDown() override { fs::remove_all(dir); }

    std::shared_ptr<CorpusSnapshot> sample() {
        auto snap = std::make_shared<CorpusSnapshot>();
        auto p1 = std::make_shared<Paper>(*make_paper("p1", paragraphs(3, 40, "a"), "First"));
        p1->authors = {"Ada Lovelace", "Alan Turing"};
        p1->url = "https://example.org/p1";
        p1->year = 2021;
        auto p2 = make_paper("p2", paragraphs(2, 40, "b"), "Second");
        snap->papers = {p1, p2};
        for (auto& p : snap->papers) {
            for (auto& c : chunk_paper(p)) snap->chunks.push_back(c);
        }
        FakeEmbedder emb;
        snap->index = build_index(snap->chunks, emb);
        snap->embed_model = emb.model();
        return snap;
    }

    fs::path dir;
    std::string db;
};
}

TEST_F(StoreTest, EmptyDatabaseLoadsNothing) {
    CorpusStore store(db);
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.embed_model(), "");
}

TEST_F(StoreTest, SaveThenLoadRestoresSnapshot) {
    auto snap = sample();
    {
        CorpusStore store(db);
        store.save(*snap);
    }
    CorpusStore store(db);
    auto loaded = store.load();
    ASSERT_TRUE(loaded);
    EXPECT_EQ(store.embed_model(), "fake-embed");
    EXPECT_EQ(loaded->embed_model, "fake-embed");
    ASSERT_EQ(loaded->papers.size(), 2u);
    EXPECT_EQ(loaded->papers[0]->ref.title, "First");
    EXPECT_EQ(loaded->papers[0]->authors, (std::vector<std::string>{"Ada Lovelace", "Alan Turing"}));
    EXPECT_EQ(loaded->papers[0]->year, 2021);
    ASSERT_EQ(loaded->chunks.size(), snap->chunks.size());
    ASSERT_EQ(loaded->index->size(), snap->index->size());
    for (size_t i = 0; i < snap->chunks.size(); ++i) {
        EXPECT_EQ(loaded->chunks[i].text, snap->chunks[i].text);
        EXPECT_EQ(loaded->chunks[i].source_id(), snap->chunks[i].source_id());
        EXPECT_EQ(loaded->index->vector(i), snap->index->vector(i));
    }
    // chunks of one paper share one Paper object
    EXPECT_EQ(loaded->chunks[0].paper, loaded->chunks[1].paper);
}

TEST_F(StoreTest, SaveReplacesPreviousSnapshot) {
    CorpusStore store(db);
    store.save(*sample());
    auto small = std::make_shared<CorpusSnapshot>();
    auto p = make_paper("only", paragraphs(2, 40));
    small->papers = {p};
    small->chunks = chunk_paper(p);
    FakeEmbedder emb;
    small->index = build_index(small->chunks, emb);
    small->embed_model = "other-model";
    store.save(*small);

    auto loaded = store.load();
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->papers.size(), 1u);
    EXPECT_EQ(loaded->chunks.size(), 1u);
    EXPECT_EQ(store.embed_model(), "other-model");
}

TEST_F(StoreTest, ResetEmptiesStore) {
    CorpusStore store(db);
    store.save(*sample());
    store.reset();
    EXPECT_FALSE(store.load());
}

TEST_F(StoreTest, MalformedVectorIsRejected) {
    {
        CorpusStore store(db);
        store.save(*sample());
    }
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db.c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "UPDATE chunks SET vector = X'0102' WHERE ordinal = 0;", nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(raw);

    CorpusStore store(db);
    EXPECT_THROW(store.load(), std::runtime_error);
}

TEST_F(StoreTest, SnapshotWithoutIndexIsRejected) {
    CorpusStore store(db);
    store.save(*sample());
    auto broken = sample();
    broken->index.reset();
    EXPECT_THROW(store.save(*broken), std::logic_error);
    // the earlier corpus is untouched
    auto loaded = store.load();
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->papers.size(), 2u);
}

TEST_F(StoreTest, PapersTableHoldsOnlyLoadedColumns) {
    {
        CorpusStore store(db);
        store.save(*sample());
    }
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db.c_str(), &raw), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(raw, "SELECT name FROM pragma_table_info('papers');", -1, &stmt, nullptr), SQLITE_OK);
    std::vector<std::string> columns;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        columns.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    sqlite3_close(raw);
    EXPECT_EQ(columns, (std::vector<std::string>{"id", "title", "location", "authors", "publication_id", "url", "year"}));
}
