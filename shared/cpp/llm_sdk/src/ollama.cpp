#include "../include/ollama.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
std::string strip_slash(std::string url) {
    if (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}
}

EmbedConfig embed_config_from_env() {
    EmbedConfig c;
    c.ollama_url = getenv_or("OLLAMA_URL", c.ollama_url);
    c.embed_model = getenv_or("RAG_EMBED_MODEL", c.embed_model);
    return c;
}

LlmConfig llm_config_from_env() {
    LlmConfig c;
    c.ollama_url = getenv_or("OLLAMA_URL", c.ollama_url);
    c.llm_model = getenv_or("RAG_LLM_MODEL", c.llm_model);
    return c;
}

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    cfg_.ollama_url = strip_slash(cfg_.ollama_url);
}

std::vector<float> OllamaEmbedder::embed(const std::string& text) {
    json body = {
        {"model", cfg_.embed_model},
        {"prompt", text}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/embeddings", body.dump(), cfg_.timeout_ms);
    } catch (const std::runtime_error& e) {
        throw EmbeddingError(std::string("embedding request failed: ") + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw EmbeddingError("embedding failed: status " + std::to_string(r.status));
    }
    std::vector<float> vec;
    try {
        auto data = json::parse(r.body);
        for (auto& v : data.at("embedding")) vec.push_back(v.get<float>());
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("embedding response malformed: ") + e.what());
    }
    if (vec.empty()) throw EmbeddingError("embedding response was empty");
    return vec;
}

OllamaLlm::OllamaLlm(LlmConfig cfg) : cfg_(std::move(cfg)) {
    cfg_.ollama_url = strip_slash(cfg_.ollama_url);
}

std::string OllamaLlm::generate(const std::string& prompt, const ConversationMemory& history) {
    json messages = json::array();
    if (!cfg_.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", cfg_.system_prompt}});
    }
    for (auto& t : history.turns()) {
        messages.push_back({{"role", t.speaker == Speaker::Human ? "user" : "assistant"}, {"content", t.text}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});

    json body = {
        {"model", cfg_.llm_model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", cfg_.temperature},
            {"top_p", cfg_.top_p},
            {"num_predict", cfg_.max_tokens}
        }}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    } catch (const std::runtime_error& e) {
        throw GatewayError(std::string("chat request failed: ") + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw GatewayError("chat failed: status " + std::to_string(r.status));
    }
    try {
        auto data = json::parse(r.body);
        if (data.contains("message")) return data["message"].value("content", std::string());
        if (data.contains("error")) throw GatewayError("chat failed: " + data["error"].get<std::string>());
    } catch (const json::exception& e) {
        throw GatewayError(std::string("chat response malformed: ") + e.what());
    }
    return {};
}
