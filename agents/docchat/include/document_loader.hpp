#pragma once
#include "chunk.hpp"
#include <filesystem>
#include <string>
#include <vector>

std::vector<std::string> supported_formats();

// `declared_type` is an extension such as "pdf" or ".TXT". pdf, docx and doc
// are converted by the external pdftotext, docx2txt and antiword tools.
// Throws UnsupportedFormatError for other types, missing converters and
// documents without text.
Document load_document(const std::string& bytes, const std::string& declared_type, const std::string& name);
Document load_document_file(const std::filesystem::path& path);

std::string file_type_of(const std::string& name);
