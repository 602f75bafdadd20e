#include "../include/research_agent.hpp"
#include "../../../shared/cpp/llm_sdk/include/ollama.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <iostream>
#include <iterator>

static void usage() {
    std::cerr << "research_cli usage:\n"
              << "  tools\n"
              << "  query --query \"...\" [--max-iterations N] [--verbose] [--ollama <url>] [--llm <name>]\n"
              << "  demo [--verbose] [--ollama <url>] [--llm <name>]\n";
}

static void print_result(const ResearchResult& r) {
    if (r.success) {
        std::cout << "Response: " << r.response << "\n";
    } else {
        std::cout << "Error: " << r.response << "\n";
        if (r.error) std::cout << "Details: " << *r.error << "\n";
    }
    for (auto& s : r.steps) {
        std::cout << "  step " << s.sequence << ": " << s.tool << "(" << s.tool_input << ")\n";
    }
    if (r.early_stopped) std::cout << "  (stopped at the iteration limit)\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    try {
        if (cmd == "tools") {
            int i = 1;
            for (auto& t : ToolRegistry().specs()) {
                std::cout << i++ << ". " << t.name << ": " << t.description << "\n";
            }
            return 0;
        }
        if (cmd != "query" && cmd != "demo") { usage(); return 1; }

        LlmConfig l = llm_config_from_env();
        AgentConfig cfg = agent_config_from_env();
        std::string query;
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--query" && i + 1 < argc) query = argv[++i];
            else if (a == "--max-iterations" && i + 1 < argc) cfg.max_iterations = parse_int_arg(a, argv[++i]);
            else if (a == "--verbose") cfg.verbose = true;
            else if (a == "--ollama" && i + 1 < argc) l.ollama_url = argv[++i];
            else if (a == "--llm" && i + 1 < argc) l.llm_model = argv[++i];
            else { usage(); return 2; }
        }

        OllamaLlm llm(l);
        ResearchAgent agent(llm, cfg);
        std::cerr << "[research] Model " << l.llm_model << " at " << l.ollama_url
                  << ", up to " << cfg.max_iterations << " tool call(s) per query\n";

        if (cmd == "query") {
            if (query.empty()) { usage(); return 2; }
            auto r = agent.research(query);
            print_result(r);
            return r.success ? 0 : 1;
        }

        const char* samples[] = {
            "Calculate the square root of 144",
            "What is the current date and time?",
            "Tell me about Python programming language",
            "Analyze this text: LangChain is a framework for developing applications powered by language models. "
            "It provides tools for chaining together different components.",
            "How many days are there between 2024-01-01 and 2024-12-31?",
        };
        std::cerr << "[research] Running " << std::size(samples) << " demo queries\n";
        int n = 1;
        for (auto* q : samples) {
            std::cout << "\nQuery " << n++ << ": " << q << "\n" << std::string(40, '-') << "\n";
            print_result(agent.research(q));
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[ERROR] " << ex.what() << "\n";
        return 1;
    }
}
