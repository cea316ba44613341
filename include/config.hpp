#pragma once
#include <string>

struct NormalizeOptions {
  bool demote_annotation_headings = true;
  bool remove_empty_headings = true;
  bool normalize_headings = true;
  bool normalize_lists = true;
  bool normalize_tables = true;
  bool normalize_whitespace = true;
  int max_heading_jump = 1;
  bool promote_first_heading = false;
  int max_first_heading_level = 2;
  int max_column_variance = 2;
  int max_passes = 8;            // fixed-point cap; reaching it is logged
};

struct RefineOptions {
  bool clean_noise = true;
  bool build_sections = true;
  bool convert_tables_to_markdown = true;
  bool convert_blocks_to_markdown = true;
  bool normalize_markdown_structure = true;
  bool extract_structures = true;
  bool normalize_whitespace = true;
  bool use_llm = false;
  // off unless asked for
  bool remove_headers_footers = false;
  bool remove_page_numbers = false;
  bool clean_table_of_contents = false;
  NormalizeOptions normalize;
};

struct ChunkOptions {
  std::string strategy = "Auto";
  int max_chunk_size = 1024;
  int min_chunk_size = 200;
  int overlap_size = 128;
  int target_chunk_size = 0;   // 0 means max_chunk_size / 2
  bool preserve_paragraphs = true;
  bool preserve_sentences = true;
  int max_heading_level = 3;

  int target() const { return target_chunk_size > 0 ? target_chunk_size : max_chunk_size / 2; }
};

struct EnrichOptions {
  bool enabled = false;
  std::string model_path = "./models/instruct.gguf";
  bool summaries = true;
  bool contextual = true;
  bool metadata = false;
  int max_keywords = 5;
  int max_summary_length = 200;
  int max_tokens = 256;
  int context_size = 4096;
};

struct OutputOptions {
  std::string dir = "./out";
  std::string format = "md";   // refine: md|json, chunk: md|json|jsonl
  std::string sqlite_path;     // empty disables persistence
  bool include_report = true;
};

struct Config {
  RefineOptions refine;
  ChunkOptions chunk;
  EnrichOptions enrich;
  OutputOptions output;
};

// Every key is optional; missing keys keep the defaults above.
Config parse_config(const std::string& json_text);
Config load_config(const std::string& path);
