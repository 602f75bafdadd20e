#include "../include/document_chat.hpp"
#include "../include/document_loader.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <cstdlib>
#include <iostream>

namespace {
const ConversationMemory kNoHistory{};
const char* kSummaryQuery = "summary overview content";

size_t env_size(const char* key, size_t def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    return parse_size_arg(key, v);
}

// Restores Indexed when an answer attempt ends, successfully or not.
struct AnsweringGuard {
    ChatState& state;
    explicit AnsweringGuard(ChatState& s) : state(s) { state = ChatState::Answering; }
    ~AnsweringGuard() { state = ChatState::Indexed; }
};
}

ChatConfig chat_config_from_env() {
    ChatConfig c;
    c.chunk_size = env_size("RAG_CHUNK_SIZE", c.chunk_size);
    c.chunk_overlap = env_size("RAG_CHUNK_OVERLAP", c.chunk_overlap);
    c.top_k = env_size("RAG_TOP_K", c.top_k);
    return c;
}

const char* chat_state_name(ChatState s) {
    switch (s) {
    case ChatState::Empty: return "empty";
    case ChatState::Indexed: return "indexed";
    case ChatState::Answering: return "answering";
    }
    return "unknown";
}

DocumentChat::DocumentChat(EmbeddingGateway& embedder, LlmGateway& llm, ChatConfig cfg)
    : embedder_(embedder), llm_(llm), cfg_(cfg), retriever_(embedder_, index_) {
    if (cfg_.chunk_overlap >= cfg_.chunk_size) {
        throw ConfigError("chunk overlap (" + std::to_string(cfg_.chunk_overlap) +
                          ") must be smaller than chunk size (" + std::to_string(cfg_.chunk_size) + ")");
    }
    if (cfg_.top_k == 0) throw ConfigError("top_k must be positive");
}

size_t DocumentChat::ingest(const Document& doc) {
    auto chunks = split_document(doc, ChunkerOptions{cfg_.chunk_size, cfg_.chunk_overlap});

    clear();
    if (chunks.empty()) throw UnsupportedFormatError("document contains no text");

    std::vector<IndexEntry> entries;
    entries.reserve(chunks.size());
    for (auto& ch : chunks) {
        auto vec = embedder_.embed(ch.text);
        entries.push_back({std::move(vec), std::move(ch)});
    }
    try {
        index_.add(entries);
    } catch (...) {
        index_.clear();
        throw;
    }

    auto it = doc.metadata.find("source");
    current_document_ = it != doc.metadata.end() ? it->second : std::string("document");
    state_ = ChatState::Indexed;
    std::cerr << "[docchat] Indexed " << *current_document_ << ": " << entries.size() << " chunks\n";
    return entries.size();
}

std::string DocumentChat::build_prompt(const RetrievalResult& hits, const std::string& question) const {
    std::string ctx;
    for (auto& sc : hits) {
        ctx += sc.chunk.text;
        ctx += "\n\n";
    }
    return "Use the following pieces of context to answer the question at the end. "
           "If you don't know the answer, just say that you don't know, don't try to make up an answer.\n\n" +
           ctx + "Question: " + question + "\nHelpful Answer:";
}

Answer DocumentChat::ask(const std::string& question) {
    if (state_ != ChatState::Indexed) {
        throw NotReadyError("No document has been processed. Please upload a document first.");
    }
    AnsweringGuard guard(state_);

    auto hits = retriever_.retrieve(question, cfg_.top_k);
    auto text = llm_.generate(build_prompt(hits, question), memory_);
    memory_.append_exchange(question, text);

    Answer res;
    res.answer = std::move(text);
    res.question = question;
    for (auto& sc : hits) {
        res.sources.push_back({utf8_preview(sc.chunk.text, cfg_.preview_chars), sc.chunk.metadata});
    }
    return res;
}

std::string DocumentChat::summarize() {
    if (state_ == ChatState::Empty) return kNoDocument;
    try {
        auto hits = retriever_.retrieve(kSummaryQuery, cfg_.summary_k);
        std::string combined;
        for (auto& sc : hits) {
            if (!combined.empty()) combined += "\n\n";
            combined += sc.chunk.text;
        }
        std::string prompt = "Please provide a concise summary of the following document content:\n\n" +
                             combined + "\n\nSummary:";
        return llm_.generate(prompt, kNoHistory);
    } catch (const GatewayError& e) {
        std::cerr << "[docchat] Summary unavailable: " << e.what() << "\n";
        return kSummaryFallback;
    }
}

void DocumentChat::clear() {
    index_.clear();
    memory_.clear();
    current_document_.reset();
    state_ = ChatState::Empty;
}

void DocumentChat::clear_history() {
    memory_.clear();
}

std::vector<std::string> DocumentChat::get_supported_formats() {
    return supported_formats();
}
