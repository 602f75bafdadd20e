#include "../include/retriever.hpp"

RetrievalResult Retriever::retrieve(const std::string& query, size_t k) {
    auto qvec = embedder_.embed(query);
    return index_.search(qvec, k);
}
