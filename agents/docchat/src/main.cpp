#include "../include/document_chat.hpp"
#include "../include/document_loader.hpp"
#include "../../../shared/cpp/llm_sdk/include/ollama.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <iostream>
#include <filesystem>
#include <vector>

static void usage() {
    std::cerr << "docchat usage:\n"
              << "  formats\n"
              << "  summarize --file <path> [options]\n"
              << "  ask --file <path> [--question \"...\"]... [--summary] [options]\n"
              << "      without --question, questions are read from stdin, one per line\n"
              << "options: [--ollama <url>] [--embed-model <name>] [--llm <name>] [--top-k N]\n"
              << "         [--chunk-size N] [--chunk-overlap N]\n";
}

static void print_answer(const Answer& res) {
    std::cout << "\n==== Answer ====\n\n" << res.answer << "\n\n";
    std::cout << "==== Sources ====\n";
    int i = 1;
    for (auto& s : res.sources) {
        auto src = s.metadata.find("source");
        auto idx = s.metadata.find("chunk_index");
        std::cout << "[" << i++ << "] " << (src != s.metadata.end() ? src->second : std::string("?"))
                  << " (chunk " << (idx != s.metadata.end() ? idx->second : std::string("?")) << ")\n"
                  << "    " << s.content << "\n";
    }
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    try {
        if (cmd == "formats") {
            for (auto& f : DocumentChat::get_supported_formats()) std::cout << f << "\n";
            return 0;
        }
        if (cmd != "ask" && cmd != "summarize") { usage(); return 1; }

        EmbedConfig e = embed_config_from_env();
        LlmConfig l = llm_config_from_env();
        ChatConfig c = chat_config_from_env();
        std::string file;
        std::vector<std::string> questions;
        bool want_summary = cmd == "summarize";
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--file" && i + 1 < argc) file = argv[++i];
            else if (a == "--question" && i + 1 < argc) questions.push_back(argv[++i]);
            else if (a == "--summary") want_summary = true;
            else if (a == "--ollama" && i + 1 < argc) e.ollama_url = l.ollama_url = argv[++i];
            else if (a == "--embed-model" && i + 1 < argc) e.embed_model = argv[++i];
            else if (a == "--llm" && i + 1 < argc) l.llm_model = argv[++i];
            else if (a == "--top-k" && i + 1 < argc) c.top_k = parse_size_arg(a, argv[++i]);
            else if (a == "--chunk-size" && i + 1 < argc) c.chunk_size = parse_size_arg(a, argv[++i]);
            else if (a == "--chunk-overlap" && i + 1 < argc) c.chunk_overlap = parse_size_arg(a, argv[++i]);
            else { usage(); return 2; }
        }
        if (file.empty()) { usage(); return 2; }

        OllamaEmbedder embedder(e);
        OllamaLlm llm(l);
        DocumentChat chat(embedder, llm, c);

        auto doc = load_document_file(std::filesystem::path(file));
        size_t n = chat.ingest(doc);
        std::cout << "[OK] Document processed successfully! Created " << n << " text chunks.\n";

        if (want_summary) {
            std::cout << "\n==== Summary ====\n\n" << chat.summarize() << "\n";
        }
        if (cmd == "summarize") return 0;

        if (!questions.empty()) {
            for (auto& q : questions) print_answer(chat.ask(q));
            return 0;
        }
        std::string line;
        std::cout << "\nAsk a question about " << *chat.current_document() << " (empty line to quit)\n> " << std::flush;
        while (std::getline(std::cin, line)) {
            line = trim(line);
            if (line.empty()) break;
            print_answer(chat.ask(line));
            std::cout << "\n> " << std::flush;
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[ERROR] " << ex.what() << "\n";
        return 1;
    }
}
