#include "../include/store.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cstring>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    auto p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, idx)) : std::string();
}

static void prepare(sqlite3* db, const char* sql, sqlite3_stmt** st) {
    if (sqlite3_prepare_v2(db, sql, -1, st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
    }
}

CorpusStore::CorpusStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

CorpusStore::~CorpusStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void CorpusStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS papers (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  title TEXT,\n"
         "  location TEXT,\n"
         "  authors TEXT,\n"
         "  publication_id TEXT,\n"
         "  url TEXT,\n"
         "  year INTEGER\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  ordinal INTEGER PRIMARY KEY,\n"
         "  paper_id TEXT NOT NULL,\n"
         "  chunk_index INTEGER,\n"
         "  text TEXT,\n"
         "  vector BLOB\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT);");
}

void CorpusStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void CorpusStore::prepare_statements() {
    prepare(db_, "INSERT OR REPLACE INTO papers (id, title, location, authors, publication_id, url, year) \n"
                 "VALUES (?, ?, ?, ?, ?, ?, ?);", &insert_paper_stmt_);
    prepare(db_, "INSERT INTO chunks (ordinal, paper_id, chunk_index, text, vector) VALUES (?, ?, ?, ?, ?);",
            &insert_chunk_stmt_);
    prepare(db_, "SELECT id, title, location, authors, publication_id, url, year FROM papers ORDER BY rowid;",
            &papers_stmt_);
    prepare(db_, "SELECT ordinal, paper_id, chunk_index, text, vector FROM chunks ORDER BY ordinal;", &chunks_stmt_);
    prepare(db_, "SELECT value FROM meta WHERE key = ?;", &get_meta_stmt_);
    prepare(db_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);", &set_meta_stmt_);
}

void CorpusStore::close_statements() {
    for (auto st : {&insert_paper_stmt_, &insert_chunk_stmt_, &papers_stmt_, &chunks_stmt_, &get_meta_stmt_,
                    &set_meta_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

std::string CorpusStore::meta(const std::string& key) {
    sqlite3_reset(get_meta_stmt_);
    sqlite3_clear_bindings(get_meta_stmt_);
    bind_text(get_meta_stmt_, 1, key);
    std::string value;
    if (sqlite3_step(get_meta_stmt_) == SQLITE_ROW) value = column_text(get_meta_stmt_, 0);
    sqlite3_reset(get_meta_stmt_);
    return value;
}

void CorpusStore::set_meta(const std::string& key, const std::string& value) {
    sqlite3_reset(set_meta_stmt_);
    sqlite3_clear_bindings(set_meta_stmt_);
    bind_text(set_meta_stmt_, 1, key);
    bind_text(set_meta_stmt_, 2, value);
    if (sqlite3_step(set_meta_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("set meta '" + key + "' failed: " + sqlite3_errmsg(db_));
    }
    sqlite3_reset(set_meta_stmt_);
}

void CorpusStore::reset() {
    exec("DELETE FROM chunks; DELETE FROM papers; DELETE FROM meta;");
}

std::string CorpusStore::embed_model() {
    return meta("embed_model");
}

void CorpusStore::save(const CorpusSnapshot& snapshot) {
    if (!snapshot.chunks.empty() && !snapshot.index) {
        throw std::logic_error("snapshot has " + std::to_string(snapshot.chunks.size()) + " chunks but no index");
    }
    if (!snapshot.chunks.empty() && snapshot.index->size() != snapshot.chunks.size()) {
        throw std::logic_error("snapshot index has " + std::to_string(snapshot.index->size()) + " rows for " +
                               std::to_string(snapshot.chunks.size()) + " chunks");
    }
    exec("BEGIN IMMEDIATE;");
    try {
        reset();
        for (auto& p : snapshot.papers) {
            sqlite3_reset(insert_paper_stmt_);
            sqlite3_clear_bindings(insert_paper_stmt_);
            bind_text(insert_paper_stmt_, 1, p->ref.id);
            bind_text(insert_paper_stmt_, 2, p->ref.title);
            bind_text(insert_paper_stmt_, 3, p->ref.location);
            bind_text(insert_paper_stmt_, 4, json(p->authors).dump());
            bind_text(insert_paper_stmt_, 5, p->publication_id);
            bind_text(insert_paper_stmt_, 6, p->url);
            sqlite3_bind_int(insert_paper_stmt_, 7, p->year);
            if (sqlite3_step(insert_paper_stmt_) != SQLITE_DONE) {
                throw std::runtime_error("insert paper failed: " + std::string(sqlite3_errmsg(db_)));
            }
        }
        for (size_t i = 0; i < snapshot.chunks.size(); ++i) {
            const auto& c = snapshot.chunks[i];
            sqlite3_reset(insert_chunk_stmt_);
            sqlite3_clear_bindings(insert_chunk_stmt_);
            sqlite3_bind_int64(insert_chunk_stmt_, 1, (sqlite3_int64)i);
            bind_text(insert_chunk_stmt_, 2, c.source_id());
            sqlite3_bind_int(insert_chunk_stmt_, 3, c.index);
            bind_text(insert_chunk_stmt_, 4, c.text);
            bind_blob(insert_chunk_stmt_, 5, snapshot.index->vector(i));
            if (sqlite3_step(insert_chunk_stmt_) != SQLITE_DONE) {
                throw std::runtime_error("insert chunk failed: " + std::string(sqlite3_errmsg(db_)));
            }
        }
        set_meta("embed_model", snapshot.embed_model);
        set_meta("dimension", std::to_string(snapshot.index ? snapshot.index->dim() : 0));
        exec("COMMIT;");
    } catch (...) {
        sqlite3_reset(insert_paper_stmt_);
        sqlite3_reset(insert_chunk_stmt_);
        exec("ROLLBACK;");
        throw;
    }
    sqlite3_reset(insert_paper_stmt_);
    sqlite3_reset(insert_chunk_stmt_);
}

std::shared_ptr<const CorpusSnapshot> CorpusStore::load() {
    auto snap = std::make_shared<CorpusSnapshot>();
    snap->embed_model = meta("embed_model");
    auto dim_text = meta("dimension");
    size_t dim = dim_text.empty() ? 0 : (size_t)parse_int_setting("dimension", dim_text);

    std::map<std::string, std::shared_ptr<const Paper>> by_id;
    sqlite3_reset(papers_stmt_);
    while (sqlite3_step(papers_stmt_) == SQLITE_ROW) {
        auto p = std::make_shared<Paper>();
        p->ref.id = column_text(papers_stmt_, 0);
        p->ref.title = column_text(papers_stmt_, 1);
        p->ref.location = column_text(papers_stmt_, 2);
        p->ref.has_full_text = true;
        auto authors = column_text(papers_stmt_, 3);
        if (!authors.empty()) p->authors = json::parse(authors).get<std::vector<std::string>>();
        p->publication_id = column_text(papers_stmt_, 4);
        p->url = column_text(papers_stmt_, 5);
        p->year = sqlite3_column_int(papers_stmt_, 6);
        by_id[p->ref.id] = p;
        snap->papers.push_back(p);
    }
    sqlite3_reset(papers_stmt_);

    auto index = std::make_shared<FlatL2Index>(dim);
    sqlite3_reset(chunks_stmt_);
    while (sqlite3_step(chunks_stmt_) == SQLITE_ROW) {
        auto ordinal = (size_t)sqlite3_column_int64(chunks_stmt_, 0);
        if (ordinal != snap->chunks.size()) {
            sqlite3_reset(chunks_stmt_);
            throw std::runtime_error("corpus DB has a gap at chunk ordinal " + std::to_string(snap->chunks.size()));
        }
        Chunk c;
        auto paper_id = column_text(chunks_stmt_, 1);
        auto it = by_id.find(paper_id);
        if (it == by_id.end()) {
            sqlite3_reset(chunks_stmt_);
            throw std::runtime_error("chunk " + std::to_string(ordinal) + " refers to unknown paper " + paper_id);
        }
        c.paper = it->second;
        c.index = sqlite3_column_int(chunks_stmt_, 2);
        c.text = column_text(chunks_stmt_, 3);

        const void* blob = sqlite3_column_blob(chunks_stmt_, 4);
        int bytes = sqlite3_column_bytes(chunks_stmt_, 4);
        if (bytes <= 0 || bytes % (int)sizeof(float) != 0 || (size_t)bytes / sizeof(float) != dim) {
            sqlite3_reset(chunks_stmt_);
            throw std::runtime_error("chunk " + std::to_string(ordinal) + " has a malformed vector (" +
                                     std::to_string(bytes) + " bytes, dimension " + std::to_string(dim) + ")");
        }
        std::vector<float> vec(bytes / sizeof(float));
        std::memcpy(vec.data(), blob, bytes);
        index->add(vec);
        snap->chunks.push_back(std::move(c));
    }
    sqlite3_reset(chunks_stmt_);

    if (snap->chunks.empty()) return nullptr;
    snap->index = index;
    return snap;
}
