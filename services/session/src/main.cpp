#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <cstdint>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <microhttpd.h>
#include "../include/session_router.hpp"
#include "../../../shared/cpp/llm_sdk/include/ollama.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

struct Server {
    OllamaEmbedder embedder;
    OllamaLlm llm;
    SessionRouter router;

    Server(const EmbedConfig& e, const LlmConfig& l, const ChatConfig& c, const AgentConfig& a)
        : embedder(e), llm(l), router(embedder, llm, c, a) {}
};

static std::unique_ptr<Server> g_server;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    RouteReply r = g_server->router.handle({ci->method, ci->url, parse_query(connection), ci->body});
    return send_response(connection, r.status, r.body);
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

int main(int, char**) {
    int port = 7100;
    try {
        port = getenv_int_or("SESSION_PORT", port);
        g_server = std::make_unique<Server>(embed_config_from_env(), llm_config_from_env(),
                                            chat_config_from_env(), agent_config_from_env());
    } catch (const std::exception& e) {
        std::cerr << "[server] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[server] Starting HTTP server on port " << port << "...\n";
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port, nullptr, nullptr,
                                            &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[server] Failed to start HTTP server" << std::endl;
        return 1;
    }
    std::signal(SIGTERM, [](int){ /* wake pause() so the daemon can stop */ });
    std::signal(SIGINT, [](int){});
    pause();
    std::cout << "[server] Shutting down\n";
    MHD_stop_daemon(d);
    return 0;
}
