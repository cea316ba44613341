#pragma once
#include "document.hpp"
#include "quality.hpp"
#include <string>
#include <vector>

// content.md (format "md") or content.json (format "json") plus info.json.
// Returns the paths written.
std::vector<std::string> write_refined(const RefinedContent& refined, const std::string& dir,
                                       const std::string& format);

// One NNN.md (front matter + content) or NNN.json per chunk, or one
// chunks.jsonl, plus an info.json manifest. report may be null.
std::vector<std::string> write_chunks(const std::vector<DocumentChunk>& chunks, const std::string& dir,
                                      const std::string& format, const RagQualityReport* report = nullptr);

// "001" style name for chunk index i of n.
std::string chunk_file_stem(int index, int count);
