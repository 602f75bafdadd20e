#include "../include/vector_index.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    auto p = reinterpret_cast<const char*>(sqlite3_column_text(st, idx));
    return p ? std::string(p, sqlite3_column_bytes(st, idx)) : std::string();
}

VectorIndex::VectorIndex(const std::string& db_path, SimilarityFn similarity)
    : similarity_(similarity ? std::move(similarity) : SimilarityFn(cosine_similarity)) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        throw std::runtime_error("Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        throw;
    }
}

VectorIndex::~VectorIndex() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void VectorIndex::init() {
    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  chunk_index INTEGER,\n"
         "  char_offset INTEGER,\n"
         "  text TEXT,\n"
         "  metadata TEXT,\n"
         "  vector BLOB\n"
         ");");
    // A file-backed index may already hold entries from an earlier run.
    exec("DELETE FROM chunks;");
}

void VectorIndex::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void VectorIndex::prepare_statements() {
    const char* ins = "INSERT INTO chunks \n"
                      "(chunk_index, char_offset, text, metadata, vector) \n"
                      "VALUES (?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare insert failed");
    }
    const char* all = "SELECT chunk_index, char_offset, text, metadata, vector FROM chunks ORDER BY seq;";
    if (sqlite3_prepare_v2(db_, all, -1, &all_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare select failed");
    }
}

void VectorIndex::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (all_stmt_) { sqlite3_finalize(all_stmt_); all_stmt_ = nullptr; }
}

void VectorIndex::clear() {
    exec("DELETE FROM chunks;");
    count_ = 0;
    dim_ = 0;
}

void VectorIndex::add(const std::vector<IndexEntry>& entries) {
    if (entries.empty()) return;
    size_t dim = dim_ ? dim_ : entries.front().embedding.size();
    if (dim == 0) throw ConfigError("cannot index an empty embedding");
    for (auto& e : entries) {
        if (e.embedding.size() != dim) {
            throw ConfigError("embedding dimension mismatch: expected " + std::to_string(dim) +
                              ", got " + std::to_string(e.embedding.size()));
        }
    }

    exec("BEGIN;");
    try {
        for (auto& e : entries) {
            sqlite3_reset(insert_stmt_);
            sqlite3_clear_bindings(insert_stmt_);
            sqlite3_bind_int64(insert_stmt_, 1, (sqlite3_int64)e.chunk.index);
            sqlite3_bind_int64(insert_stmt_, 2, (sqlite3_int64)e.chunk.offset);
            bind_text(insert_stmt_, 3, e.chunk.text);
            bind_text(insert_stmt_, 4, json(e.chunk.metadata).dump());
            bind_blob(insert_stmt_, 5, e.embedding);
            if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
                throw std::runtime_error(std::string("insert chunk failed: ") + sqlite3_errmsg(db_));
            }
        }
        sqlite3_reset(insert_stmt_);
        exec("COMMIT;");
    } catch (...) {
        sqlite3_reset(insert_stmt_);
        exec("ROLLBACK;");
        throw;
    }
    count_ += entries.size();
    dim_ = dim;
}

RetrievalResult VectorIndex::search(const std::vector<float>& query, size_t k) {
    RetrievalResult out;
    if (count_ == 0 || k == 0) return out;
    if (query.size() != dim_) {
        throw ConfigError("query dimension " + std::to_string(query.size()) +
                          " does not match index dimension " + std::to_string(dim_));
    }
    out.reserve(count_);
    sqlite3_reset(all_stmt_);
    while (sqlite3_step(all_stmt_) == SQLITE_ROW) {
        ScoredChunk sc;
        sc.chunk.index = (size_t)sqlite3_column_int64(all_stmt_, 0);
        sc.chunk.offset = (size_t)sqlite3_column_int64(all_stmt_, 1);
        sc.chunk.text = column_text(all_stmt_, 2);
        sc.chunk.metadata = json::parse(column_text(all_stmt_, 3)).get<Metadata>();
        const void* blob = sqlite3_column_blob(all_stmt_, 4);
        int bytes = sqlite3_column_bytes(all_stmt_, 4);
        std::vector<float> vec(bytes / (int)sizeof(float));
        if (bytes > 0) std::memcpy(vec.data(), blob, bytes);
        sc.score = similarity_(query, vec);
        out.push_back(std::move(sc));
    }
    sqlite3_reset(all_stmt_);
    // rows arrive in insertion order, so a stable sort keeps earlier entries first on ties
    std::stable_sort(out.begin(), out.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b){ return a.score > b.score; });
    if (out.size() > k) out.resize(k);
    return out;
}
