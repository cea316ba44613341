#include "config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
template <class T>
void read(const json& j, const char* key, T& dst) {
  if (j.contains(key) && !j.at(key).is_null()) dst = j.at(key).get<T>();
}

void read_normalize(const json& j, NormalizeOptions& o) {
  read(j, "demote_annotation_headings", o.demote_annotation_headings);
  read(j, "remove_empty_headings", o.remove_empty_headings);
  read(j, "normalize_headings", o.normalize_headings);
  read(j, "normalize_lists", o.normalize_lists);
  read(j, "normalize_tables", o.normalize_tables);
  read(j, "normalize_whitespace", o.normalize_whitespace);
  read(j, "max_heading_jump", o.max_heading_jump);
  read(j, "promote_first_heading", o.promote_first_heading);
  read(j, "max_first_heading_level", o.max_first_heading_level);
  read(j, "max_column_variance", o.max_column_variance);
  read(j, "max_passes", o.max_passes);
}

void read_refine(const json& j, RefineOptions& o) {
  read(j, "clean_noise", o.clean_noise);
  read(j, "build_sections", o.build_sections);
  read(j, "convert_tables_to_markdown", o.convert_tables_to_markdown);
  read(j, "convert_blocks_to_markdown", o.convert_blocks_to_markdown);
  read(j, "normalize_markdown_structure", o.normalize_markdown_structure);
  read(j, "extract_structures", o.extract_structures);
  read(j, "normalize_whitespace", o.normalize_whitespace);
  read(j, "use_llm", o.use_llm);
  read(j, "remove_headers_footers", o.remove_headers_footers);
  read(j, "remove_page_numbers", o.remove_page_numbers);
  read(j, "clean_table_of_contents", o.clean_table_of_contents);
  if (j.contains("normalize")) read_normalize(j.at("normalize"), o.normalize);
}

void read_chunk(const json& j, ChunkOptions& o) {
  read(j, "strategy", o.strategy);
  read(j, "max_chunk_size", o.max_chunk_size);
  read(j, "min_chunk_size", o.min_chunk_size);
  read(j, "overlap_size", o.overlap_size);
  read(j, "target_chunk_size", o.target_chunk_size);
  read(j, "preserve_paragraphs", o.preserve_paragraphs);
  read(j, "preserve_sentences", o.preserve_sentences);
  read(j, "max_heading_level", o.max_heading_level);
}

void read_enrich(const json& j, EnrichOptions& o) {
  read(j, "enabled", o.enabled);
  read(j, "model_path", o.model_path);
  read(j, "summaries", o.summaries);
  read(j, "contextual", o.contextual);
  read(j, "metadata", o.metadata);
  read(j, "max_keywords", o.max_keywords);
  read(j, "max_summary_length", o.max_summary_length);
  read(j, "max_tokens", o.max_tokens);
  read(j, "context_size", o.context_size);
}

void read_output(const json& j, OutputOptions& o) {
  read(j, "dir", o.dir);
  read(j, "format", o.format);
  read(j, "sqlite_path", o.sqlite_path);
  read(j, "include_report", o.include_report);
}
}

Config parse_config(const std::string& json_text) {
  Config c;
  try {
    auto j = json::parse(json_text);
    if (!j.is_object()) throw std::runtime_error("config: top level must be an object");
    if (j.contains("refine")) read_refine(j.at("refine"), c.refine);
    if (j.contains("chunk"))  read_chunk(j.at("chunk"), c.chunk);
    if (j.contains("enrich")) read_enrich(j.at("enrich"), c.enrich);
    if (j.contains("output")) read_output(j.at("output"), c.output);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  if (c.chunk.max_chunk_size <= 0) throw std::runtime_error("config: max_chunk_size must be positive");
  if (c.chunk.overlap_size < 0) throw std::runtime_error("config: overlap_size must not be negative");
  return c;
}

Config load_config(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("config: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return parse_config(ss.str());
}
