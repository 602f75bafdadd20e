#include "../include/document_loader.hpp"
#include "../../../shared/cpp/llm_sdk/include/errors.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct Converter {
    const char* type;
    const char* tool;
    const char* package;
    std::string (*command)(const std::string& quoted_path);
};

std::string shell_escape(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

bool command_exists(const std::string& name) {
    std::string cmd = "command -v " + name + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

const Converter kConverters[] = {
    {"pdf", "pdftotext", "poppler-utils",
     [](const std::string& p) { return "pdftotext -layout -q -enc UTF-8 " + p + " -"; }},
    {"docx", "docx2txt", "docx2txt",
     [](const std::string& p) { return "docx2txt " + p + " -"; }},
    {"doc", "antiword", "antiword",
     [](const std::string& p) { return "antiword -m UTF-8.txt " + p; }},
};

// Removes the staged upload when the conversion is done.
class StagedFile {
public:
    StagedFile(const std::string& bytes, const std::string& ext) {
        std::string tmpl = (fs::temp_directory_path() / ("docchat-XXXXXX." + ext)).string();
        int fd = mkstemps(tmpl.data(), (int)ext.size() + 1);
        if (fd < 0) throw std::runtime_error("failed to create temporary file for upload");
        close(fd);
        path_ = tmpl;
        std::ofstream f(path_, std::ios::binary | std::ios::trunc);
        f.write(bytes.data(), (std::streamsize)bytes.size());
        if (!f) {
            std::error_code ec;
            fs::remove(path_, ec);
            throw std::runtime_error("failed to stage upload to " + path_.string());
        }
    }
    ~StagedFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::string run_converter(const Converter& conv, const std::string& bytes) {
    if (!command_exists(conv.tool)) {
        throw UnsupportedFormatError(std::string(conv.tool) + " not found; please install " + conv.package);
    }
    StagedFile staged(bytes, conv.type);
    std::string cmd = conv.command(shell_escape(staged.path().string())) + " 2>/dev/null";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) throw UnsupportedFormatError(std::string("failed to execute ") + conv.tool);

    std::string result;
    char buf[4096];
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), pipe);
        if (n > 0) result.append(buf, n);
        if (n < sizeof(buf)) break;
    }
    int rc = pclose(pipe);
    if (rc != 0) throw UnsupportedFormatError(std::string(conv.tool) + " failed to convert the " + conv.type + " file");
    return result;
}

std::string normalize_type(const std::string& declared) {
    std::string t = to_lower(trim(declared));
    if (!t.empty() && t.front() == '.') t.erase(0, 1);
    return t;
}

} // namespace

std::vector<std::string> supported_formats() {
    return {"pdf", "docx", "doc", "txt"};
}

std::string file_type_of(const std::string& name) {
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos) return {};
    return to_lower(name.substr(dot + 1));
}

Document load_document(const std::string& bytes, const std::string& declared_type, const std::string& name) {
    std::string type = normalize_type(declared_type);
    std::string text;
    if (type == "txt") {
        text = bytes;
        if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);
    } else {
        const Converter* conv = nullptr;
        for (auto& c : kConverters) {
            if (type == c.type) { conv = &c; break; }
        }
        if (!conv) throw UnsupportedFormatError("Unsupported file type: " + (type.empty() ? std::string("(none)") : type));
        text = run_converter(*conv, bytes);
    }
    text = trim(text);
    if (text.empty()) throw UnsupportedFormatError(name + " contains no extractable text");

    Document doc;
    doc.metadata["source"] = name;
    doc.metadata["file_type"] = type;
    doc.metadata["doc_id"] = sha1_hex(text);
    doc.text = std::move(text);
    return doc;
}

Document load_document_file(const fs::path& path) {
    auto name = path.filename().string();
    return load_document(read_text_file(path), file_type_of(name), name);
}
