#pragma once
#include "chunk.hpp"
#include <functional>
#include <string>
#include <vector>

using SimilarityFn = std::function<float(const std::vector<float>&, const std::vector<float>&)>;

// (embedding, chunk) store with exhaustive nearest-neighbour search, backed
// by SQLite. The default ":memory:" database makes every instance private to
// the session that owns it.
class VectorIndex {
public:
    explicit VectorIndex(const std::string& db_path = ":memory:", SimilarityFn similarity = {});
    ~VectorIndex();
    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Additive. All embeddings must share one dimension, including those
    // already stored; a mismatch throws ConfigError and adds nothing.
    void add(const std::vector<IndexEntry>& entries);

    // Top min(k, size()) entries by similarity. Empty index gives an empty result.
    RetrievalResult search(const std::vector<float>& query, size_t k);

    void clear();
    size_t size() const { return count_; }
    size_t dimension() const { return dim_; }

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* all_stmt_ {nullptr};
    SimilarityFn similarity_;
    size_t count_{0};
    size_t dim_{0};
};
