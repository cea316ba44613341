#pragma once
#include "cancel.hpp"
#include "completion.hpp"
#include "document.hpp"
#include <string>
#include <vector>

// ---- structured data -> markdown ----

std::string escape_table_cell(const std::string& cell);

// Explicit headers, else the first row when has_header (first_row becomes 1),
// padded with ColN or truncated to the column count.
std::vector<std::string> resolve_table_headers(const TableData& table, size_t& first_row);

// Header row, alignment row, one line per data row; plain_text_fallback when
// the table has no cells.
std::string table_to_markdown(const TableData& table);

// ordinal is the 1-based position of an ordered list item within its run.
std::string block_to_markdown(const TextBlock& block, int ordinal = 1);

std::string image_to_markdown(const ImageInfo& image, const std::string& alt);

// Blocks, tables and images merged in reading order (page, then Y from the
// top of the page). Image text extraction failures are appended to warnings.
std::string render_structured(const RawContent& raw, bool include_tables, bool include_blocks,
                              ImageTextService* images, const CancelToken& cancel,
                              std::vector<std::string>& warnings);

// ---- converters ----

struct MarkdownConversionOptions {
  bool convert_tables = true;
  bool preserve_headings = true;
  bool preserve_lists = true;
  bool image_placeholders = true;
  bool detect_code_blocks = true;
  bool normalize_whitespace = true;
  int min_heading_level = 1;
  int max_heading_level = 6;
};

struct MarkdownConversion {
  std::string markdown;
  bool success = false;
  bool used_llm = false;
  std::vector<std::string> warnings;
  int headings = 0;
  int tables = 0;
  int lists = 0;
  int code_blocks = 0;
  int images = 0;
};

class MarkdownConverter {
public:
  virtual ~MarkdownConverter() = default;
  virtual MarkdownConversion convert(const RawContent& raw, const MarkdownConversionOptions& options) = 0;
};

// Line heuristics over RawContent::text: code fences pass through, pipe rows
// gain a separator, bullet glyphs become "- ", all-caps lines become headings.
class HeuristicMarkdownConverter : public MarkdownConverter {
public:
  MarkdownConversion convert(const RawContent& raw, const MarkdownConversionOptions& options) override;
};

// Heuristic conversion followed by heading promotion from analyze_structure().
class LlmMarkdownConverter : public MarkdownConverter {
public:
  explicit LlmMarkdownConverter(CompletionService* completion) : completion_(completion) {}

  MarkdownConversion convert(const RawContent& raw, const MarkdownConversionOptions& options) override;

private:
  CompletionService* completion_;
  HeuristicMarkdownConverter heuristic_;
};

// Lines outside fenced code whose text equals a hint title become headings of
// the hinted level. Returns the number of lines promoted.
int apply_section_hints(std::string& markdown, const std::vector<SectionHint>& hints);
