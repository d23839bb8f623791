#pragma once
#include "vector_index.hpp"
#include <memory>
#include <string>

// SQLite persistence of a CorpusSnapshot so that ingest and ask can run in
// separate processes. Vectors are stored as raw float blobs and the index is
// rebuilt on load without re-embedding.
class CorpusStore {
public:
    explicit CorpusStore(const std::string& db_path);
    ~CorpusStore();

    CorpusStore(const CorpusStore&) = delete;
    CorpusStore& operator=(const CorpusStore&) = delete;

    void reset();

    // Replaces whatever was stored before, in one transaction.
    void save(const CorpusSnapshot& snapshot);

    // nullptr when nothing has been saved.
    std::shared_ptr<const CorpusSnapshot> load();

    std::string embed_model();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    std::string meta(const std::string& key);
    void set_meta(const std::string& key, const std::string& value);

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_paper_stmt_ {nullptr};
    struct sqlite3_stmt* insert_chunk_stmt_ {nullptr};
    struct sqlite3_stmt* papers_stmt_ {nullptr};
    struct sqlite3_stmt* chunks_stmt_ {nullptr};
    struct sqlite3_stmt* get_meta_stmt_ {nullptr};
    struct sqlite3_stmt* set_meta_stmt_ {nullptr};
};
