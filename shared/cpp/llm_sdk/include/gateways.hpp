#pragma once
#include "conversation_memory.hpp"
#include <string>
#include <vector>

// Maps text to a fixed-dimension vector. Throws EmbeddingError on any failure.
class EmbeddingGateway {
public:
    virtual ~EmbeddingGateway() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

// Single-shot text generation conditioned on prior turns. Throws GatewayError on any failure.
class LlmGateway {
public:
    virtual ~LlmGateway() = default;
    virtual std::string generate(const std::string& prompt, const ConversationMemory& history) = 0;
};
