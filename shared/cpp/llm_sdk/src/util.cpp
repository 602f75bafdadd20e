#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int parse_int_arg(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
}

size_t parse_size_arg(const std::string& name, const std::string& value) {
    int n = parse_int_arg(name, value);
    if (n < 0) throw ConfigError(name + " must not be negative, got '" + value + "'");
    return (size_t)n;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    return parse_int_arg(key, v);
}

std::string sha1_hex(const std::string& data) {
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open file: " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto b = std::find_if_not(s.begin(), s.end(), is_space);
    auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return b < e ? std::string(b, e) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::vector<size_t> utf8_boundaries(const std::string& text) {
    std::vector<size_t> out;
    out.reserve(text.size() + 1);
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        // continuation bytes never start a code point
        if ((c & 0xC0) != 0x80) out.push_back(i);
    }
    out.push_back(text.size());
    return out;
}

size_t utf8_length(const std::string& text) {
    return utf8_boundaries(text).size() - 1;
}

std::string utf8_preview(const std::string& text, size_t max_chars) {
    auto b = utf8_boundaries(text);
    if (b.size() - 1 <= max_chars) return text;
    return text.substr(0, b[max_chars]) + "...";
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}
