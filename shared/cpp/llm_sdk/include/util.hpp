#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
// Throws ConfigError when the variable is set but is not an integer.
int getenv_int_or(const char* key, int def);
int parse_int_arg(const std::string& name, const std::string& value);
// parse_int_arg that also rejects negative values.
size_t parse_size_arg(const std::string& name, const std::string& value);

std::string sha1_hex(const std::string& data);
std::string read_text_file(const std::filesystem::path& p);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Byte offset of every UTF-8 code point in `text`, plus text.size() as the final entry.
std::vector<size_t> utf8_boundaries(const std::string& text);
size_t utf8_length(const std::string& text);
// First `max_chars` code points of `text`, with "..." appended when anything was cut.
std::string utf8_preview(const std::string& text, size_t max_chars);

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
