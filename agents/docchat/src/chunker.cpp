#include "../include/chunker.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <algorithm>

namespace {
void validate(const ChunkerOptions& opts) {
    if (opts.chunk_size == 0) throw ConfigError("chunk_size must be positive");
    if (opts.overlap >= opts.chunk_size) {
        throw ConfigError("chunk overlap (" + std::to_string(opts.overlap) +
                          ") must be smaller than chunk size (" + std::to_string(opts.chunk_size) + ")");
    }
}
}

size_t expected_chunk_count(size_t length, const ChunkerOptions& opts) {
    validate(opts);
    if (length == 0) return 0;
    if (length <= opts.chunk_size) return 1;
    size_t step = opts.chunk_size - opts.overlap;
    return (length - opts.overlap + step - 1) / step;
}

std::vector<Chunk> split_text(const std::string& text, const ChunkerOptions& opts) {
    validate(opts);
    std::vector<Chunk> out;
    auto bounds = utf8_boundaries(text);
    size_t length = bounds.size() - 1;
    if (length == 0) return out;

    size_t step = opts.chunk_size - opts.overlap;
    for (size_t start = 0;; start += step) {
        size_t end = std::min(length, start + opts.chunk_size);
        Chunk c;
        c.text = text.substr(bounds[start], bounds[end] - bounds[start]);
        c.index = out.size();
        c.offset = start;
        out.push_back(std::move(c));
        if (end == length) break;
    }
    return out;
}

std::vector<Chunk> split_document(const Document& doc, const ChunkerOptions& opts) {
    auto chunks = split_text(doc.text, opts);
    for (auto& c : chunks) {
        c.metadata = doc.metadata;
        c.metadata["chunk_index"] = std::to_string(c.index);
        c.metadata["offset"] = std::to_string(c.offset);
    }
    return chunks;
}
