#pragma once
#include <map>
#include <string>
#include <vector>

using Metadata = std::map<std::string, std::string>;

// Immutable raw text of one uploaded file plus its origin metadata
// ("source", "file_type", "doc_id").
struct Document {
    std::string text;
    Metadata metadata;
};

struct Chunk {
    std::string text;
    Metadata metadata;
    size_t index{0};
    size_t offset{0}; // in code points from the start of the document
};

struct IndexEntry {
    std::vector<float> embedding;
    Chunk chunk;
};

struct ScoredChunk {
    Chunk chunk;
    float score{0.0f};
};

// Ordered by descending score, ties in insertion order.
using RetrievalResult = std::vector<ScoredChunk>;
