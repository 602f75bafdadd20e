#pragma once
#include "chunk.hpp"
#include "chunker.hpp"
#include "retriever.hpp"
#include "vector_index.hpp"
#include "../../../shared/cpp/llm_sdk/include/conversation_memory.hpp"
#include "../../../shared/cpp/llm_sdk/include/gateways.hpp"
#include <optional>
#include <string>
#include <vector>

struct ChatConfig {
    size_t chunk_size{1000};
    size_t chunk_overlap{200};
    size_t top_k{4};
    size_t summary_k{3};
    size_t preview_chars{200};
};

// RAG_CHUNK_SIZE / RAG_CHUNK_OVERLAP / RAG_TOP_K over the defaults above.
ChatConfig chat_config_from_env();

struct SourcePreview {
    std::string content;
    Metadata metadata;
};

struct Answer {
    std::string answer;
    std::vector<SourcePreview> sources;
    std::string question;
};

enum class ChatState { Empty, Indexed, Answering };

const char* chat_state_name(ChatState s);

// One document-chat session: the index and the conversation belong to this
// object alone. Gateways are borrowed and must outlive it.
class DocumentChat {
public:
    DocumentChat(EmbeddingGateway& embedder, LlmGateway& llm, ChatConfig cfg = {});

    // Replaces whatever was indexed before and starts a fresh conversation.
    // Returns the number of chunks indexed. On failure the session is Empty.
    size_t ingest(const Document& doc);

    // Throws NotReadyError unless a document is indexed; GatewayError and
    // EmbeddingError propagate with the conversation left untouched.
    Answer ask(const std::string& question);

    // Best-effort; never throws for gateway failures.
    std::string summarize();

    void clear();
    void clear_history();

    static std::vector<std::string> get_supported_formats();

    ChatState state() const { return state_; }
    size_t chunk_count() const { return index_.size(); }
    const std::optional<std::string>& current_document() const { return current_document_; }
    const ConversationMemory& memory() const { return memory_; }
    const ChatConfig& config() const { return cfg_; }

    static constexpr const char* kNoDocument = "No document uploaded.";
    static constexpr const char* kSummaryFallback = "Unable to generate summary at this time.";

private:
    std::string build_prompt(const RetrievalResult& hits, const std::string& question) const;

    EmbeddingGateway& embedder_;
    LlmGateway& llm_;
    ChatConfig cfg_;
    VectorIndex index_;
    Retriever retriever_;
    ConversationMemory memory_;
    ChatState state_{ChatState::Empty};
    std::optional<std::string> current_document_;
};
