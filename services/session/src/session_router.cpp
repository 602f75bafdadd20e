#include "../include/session_router.hpp"
#include "../../../agents/docchat/include/document_loader.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace {

constexpr int kOk = 200;
constexpr int kBadRequest = 400;
constexpr int kNotFound = 404;
constexpr int kConflict = 409;
constexpr int kInternalError = 500;
constexpr int kBadGateway = 502;

RouteReply reply(const json& body) {
    return {kOk, body.dump()};
}

RouteReply error_reply(int status, const std::string& msg) {
    return {status, json({{"error", msg}}).dump()};
}

json answer_json(const Answer& a) {
    json sources = json::array();
    for (auto& s : a.sources) sources.push_back({{"content", s.content}, {"metadata", s.metadata}});
    return {{"answer", a.answer}, {"question", a.question}, {"sources", sources}};
}

json research_json(const ResearchResult& r) {
    json steps = json::array();
    for (auto& s : r.steps) {
        steps.push_back({
            {"sequence", s.sequence},
            {"thought", s.thought},
            {"tool", s.tool},
            {"tool_input", s.tool_input},
            {"observation", s.observation}
        });
    }
    return {
        {"success", r.success},
        {"response", r.response},
        {"tools_used", r.tools_used},
        {"error", r.error ? json(*r.error) : json(nullptr)},
        {"steps", steps},
        {"early_stopped", r.early_stopped}
    };
}

} // namespace

SessionRouter::SessionRouter(EmbeddingGateway& embedder, LlmGateway& llm, ChatConfig chat_cfg, AgentConfig agent_cfg)
    : chat_(embedder, llm, chat_cfg), agent_(llm, agent_cfg) {}

RouteReply SessionRouter::handle(const RouteRequest& req) {
    try {
        return route(req);
    } catch (const NotReadyError& e) {
        return error_reply(kConflict, e.what());
    } catch (const UnsupportedFormatError& e) {
        return error_reply(kBadRequest, e.what());
    } catch (const ConfigError& e) {
        return error_reply(kBadRequest, e.what());
    } catch (const json::exception& e) {
        return error_reply(kBadRequest, e.what());
    } catch (const GatewayError& e) {
        std::cerr << "[server] Model host error: " << e.what() << "\n";
        return error_reply(kBadGateway, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[server] Internal error on " << req.method << " " << req.path << ": " << e.what() << "\n";
        return error_reply(kInternalError, e.what());
    }
}

RouteReply SessionRouter::route(const RouteRequest& req) {
    if (req.method == "GET" && req.path == "/health") {
        std::lock_guard<std::mutex> lock(chat_mtx_);
        return reply({{"ok", true}, {"chat_state", chat_state_name(chat_.state())}});
    }
    if (req.path == "/tools" || req.path == "/research" || req.path == "/research/memory") {
        return handle_research(req);
    }
    return handle_chat(req);
}

RouteReply SessionRouter::handle_chat(const RouteRequest& req) {
    if (req.method == "GET" && req.path == "/formats") {
        return reply({{"formats", DocumentChat::get_supported_formats()}});
    }
    if (req.method == "POST" && req.path == "/documents") {
        auto it = req.query.find("name");
        if (it == req.query.end() || it->second.empty()) return error_reply(kBadRequest, "name query parameter required");
        auto type = req.query.find("type");
        auto doc = load_document(req.body, type != req.query.end() ? type->second : file_type_of(it->second), it->second);
        std::lock_guard<std::mutex> lock(chat_mtx_);
        size_t n = chat_.ingest(doc);
        return reply({{"document", it->second}, {"chunks", n}});
    }
    if (req.method == "DELETE" && req.path == "/documents") {
        std::lock_guard<std::mutex> lock(chat_mtx_);
        chat_.clear();
        return reply({{"ok", true}});
    }
    if (req.method == "POST" && req.path == "/ask") {
        auto j = json::parse(req.body);
        std::string question = j.at("question").get<std::string>();
        std::lock_guard<std::mutex> lock(chat_mtx_);
        return reply(answer_json(chat_.ask(question)));
    }
    if (req.method == "GET" && req.path == "/summary") {
        std::lock_guard<std::mutex> lock(chat_mtx_);
        return reply({{"summary", chat_.summarize()}});
    }
    if (req.method == "DELETE" && req.path == "/chat/history") {
        std::lock_guard<std::mutex> lock(chat_mtx_);
        chat_.clear_history();
        return reply({{"ok", true}});
    }
    return error_reply(kNotFound, "not found");
}

RouteReply SessionRouter::handle_research(const RouteRequest& req) {
    if (req.method == "GET" && req.path == "/tools") {
        json arr = json::array();
        for (auto& t : agent_.get_available_tools()) arr.push_back({{"name", t.name}, {"description", t.description}});
        return reply({{"tools", arr}});
    }
    if (req.method == "POST" && req.path == "/research") {
        auto j = json::parse(req.body);
        std::string query = j.at("query").get<std::string>();
        int max_iter = j.value("max_iterations", agent_.config().max_iterations);
        std::lock_guard<std::mutex> lock(agent_mtx_);
        return reply(research_json(agent_.research(query, max_iter)));
    }
    if (req.method == "DELETE" && req.path == "/research/memory") {
        std::lock_guard<std::mutex> lock(agent_mtx_);
        agent_.clear_memory();
        return reply({{"ok", true}});
    }
    return error_reply(kNotFound, "not found");
}
