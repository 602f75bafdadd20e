#pragma once
#include "vector_index.hpp"
#include "../../../shared/cpp/llm_sdk/include/gateways.hpp"
#include <string>

class Retriever {
public:
    Retriever(EmbeddingGateway& embedder, VectorIndex& index) : embedder_(embedder), index_(index) {}

    // EmbeddingError from the gateway propagates.
    RetrievalResult retrieve(const std::string& query, size_t k = 4);

private:
    EmbeddingGateway& embedder_;
    VectorIndex& index_;
};
