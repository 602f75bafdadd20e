#pragma once
#include "chunk.hpp"
#include <string>
#include <vector>

struct ChunkerOptions {
    size_t chunk_size{1000};
    size_t overlap{200};
};

// Fixed windows of at most `chunk_size` code points, each starting
// `chunk_size - overlap` code points after the previous one, the last one
// ending at the end of `text`. Empty text yields no chunks.
// Throws ConfigError if chunk_size == 0 or overlap >= chunk_size.
std::vector<Chunk> split_text(const std::string& text, const ChunkerOptions& opts);
std::vector<Chunk> split_document(const Document& doc, const ChunkerOptions& opts);

// Number of chunks split_text produces for a text of `length` code points.
size_t expected_chunk_count(size_t length, const ChunkerOptions& opts);
