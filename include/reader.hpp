#pragma once
#include "document.hpp"
#include <string>
#include <vector>

// Plain text and markdown files become RawContent::text; a .json file is an
// extraction result produced elsewhere (text, tables, blocks, images).
// Other extensions throw UnsupportedFormatError, unreadable files ProcessingError.
RawContent read_raw(const std::string& path);

bool is_supported_input(const std::string& path);

// Supported files under root (recursively, sorted); root itself if it is a file.
std::vector<std::string> list_input_files(const std::string& root);
