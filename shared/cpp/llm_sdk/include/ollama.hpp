#pragma once
#include "gateways.hpp"
#include <string>
#include <vector>

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"bge-m3"};
    int timeout_ms{120000};
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{240000};
    float temperature{0.7f};
    float top_p{0.9f};
    int max_tokens{4096};
    std::string system_prompt;
};

// Reads OLLAMA_URL / RAG_EMBED_MODEL / RAG_LLM_MODEL over the defaults above.
EmbedConfig embed_config_from_env();
LlmConfig llm_config_from_env();

class OllamaEmbedder : public EmbeddingGateway {
public:
    explicit OllamaEmbedder(EmbedConfig cfg);
    std::vector<float> embed(const std::string& text) override;

private:
    EmbedConfig cfg_;
};

class OllamaLlm : public LlmGateway {
public:
    explicit OllamaLlm(LlmConfig cfg);
    std::string generate(const std::string& prompt, const ConversationMemory& history) override;

private:
    LlmConfig cfg_;
};
