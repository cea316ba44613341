#pragma once
#include "document.hpp"
#include <nlohmann/json.hpp>

// nlohmann::json conversions for the records that cross a file or database
// boundary. Output records only serialize; extraction input only parses.

void to_json(nlohmann::json& j, const ChunkProps& p);
void from_json(const nlohmann::json& j, ChunkProps& p);
void to_json(nlohmann::json& j, const SourceInfo& s);
void to_json(nlohmann::json& j, const DocumentChunk& c);

void to_json(nlohmann::json& j, const Section& s);
void to_json(nlohmann::json& j, const StructuredElement& s);
void to_json(nlohmann::json& j, const DocumentMetadata& m);
void to_json(nlohmann::json& j, const RefinementQuality& q);
void to_json(nlohmann::json& j, const RefinementInfo& i);
void to_json(nlohmann::json& j, const RefinedContent& r);

// Extraction results: every key optional, unknown keys ignored.
void from_json(const nlohmann::json& j, TableData& t);
void from_json(const nlohmann::json& j, TextBlock& b);
void from_json(const nlohmann::json& j, ImageInfo& i);
void from_json(const nlohmann::json& j, FileMetadata& f);
void from_json(const nlohmann::json& j, RawContent& r);
