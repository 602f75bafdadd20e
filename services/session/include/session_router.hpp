#pragma once
#include "../../../agents/docchat/include/document_chat.hpp"
#include "../../../agents/research/include/research_agent.hpp"
#include "../../../shared/cpp/llm_sdk/include/gateways.hpp"
#include <map>
#include <mutex>
#include <string>

struct RouteRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct RouteReply {
    int status{200};
    std::string body;
};

// One document-chat session and one research session behind the HTTP routes.
// Each session is only touched under its own mutex, so handle() may be called
// from the server's worker threads.
//
//   GET    /health            POST /ask            GET    /tools
//   GET    /formats           GET  /summary        POST   /research
//   POST   /documents         DELETE /chat/history DELETE /research/memory
//   DELETE /documents
class SessionRouter {
public:
    SessionRouter(EmbeddingGateway& embedder, LlmGateway& llm, ChatConfig chat_cfg = {}, AgentConfig agent_cfg = {});

    // Never throws. Errors come back as {"error": ...}: NotReadyError 409,
    // UnsupportedFormatError, ConfigError and malformed JSON 400, GatewayError
    // 502, unknown routes 404, anything else 500.
    RouteReply handle(const RouteRequest& req);

private:
    RouteReply route(const RouteRequest& req);
    RouteReply handle_chat(const RouteRequest& req);
    RouteReply handle_research(const RouteRequest& req);

    std::mutex chat_mtx_;
    DocumentChat chat_;
    std::mutex agent_mtx_;
    ResearchAgent agent_;
};
