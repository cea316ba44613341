#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// ---- raw extraction result (produced by readers) ----

enum class Alignment { Left, Right, Center, Justify };

struct FileMetadata {
  std::string name;        // file name with extension
  std::string extension;   // ".md", ".txt", ... (may be empty)
  std::string path;
  uint64_t size = 0;
  std::string created_at;  // ISO-8601, empty when unknown
  std::string modified_at;
};

struct TableData {
  std::vector<std::vector<std::string>> cells;  // rows x columns, ragged rows allowed
  std::vector<std::string> headers;             // explicit header row, empty when none
  bool has_header = false;                      // first row of cells is the header
  std::vector<Alignment> alignments;            // optional, <= column count
  double confidence = 1.0;
  bool has_merged_cells = false;
  int page_number = 0;
  std::optional<double> top;                    // Y position on the page when known
  std::optional<int> position;                  // reading-order index, same sequence as TextBlock::order
  std::string plain_text_fallback;              // used when cells is empty

  bool needs_llm_assist() const { return confidence < 0.7 || has_merged_cells; }
  size_t column_count() const;
};

enum class BlockType {
  Paragraph, Heading, ListItem, CodeBlock, Quote,
  Header, Footer, Caption, TocEntry, Note
};

struct BoundingBox {
  double left = 0, top = 0, right = 0, bottom = 0;
};

struct TextBlock {
  std::string content;
  BlockType type = BlockType::Paragraph;
  std::optional<int> heading_level;  // Heading only, 1..6
  int list_level = 0;                // ListItem only
  bool ordered = false;              // ListItem only
  std::string language;              // CodeBlock only
  int page_number = 0;
  int order = 0;                     // monotonic reading order
  std::optional<BoundingBox> location;
};

struct ImageInfo {
  std::string id;
  std::string mime_type;
  std::vector<uint8_t> data;         // raw bytes, may be empty
  std::string external_ref;
  std::string caption;
  std::optional<int> position;       // reading-order index, same sequence as TextBlock::order
  std::optional<int> page_number;
  std::optional<double> width;
  std::optional<double> height;
  std::optional<double> bounds_bottom;
  std::map<std::string, std::string> properties;  // anything else a reader attaches
};

struct RawContent {
  std::string id;
  std::string text;
  std::vector<TableData> tables;
  std::vector<TextBlock> blocks;
  std::vector<ImageInfo> images;
  FileMetadata file;
  std::vector<std::string> warnings;

  bool has_structured() const { return !tables.empty() || !blocks.empty(); }
};

// ---- refinement output ----

struct DocumentMetadata {
  std::string file_name;
  std::string file_type;   // upper-cased extension without the dot
  std::string file_path;
  uint64_t file_size = 0;
  std::string title;
  std::string created_at;
  std::string modified_at;
};

struct Section {
  std::string id;
  std::string title;
  int level = 1;
  size_t start = 0;   // offsets into RefinedContent::text
  size_t end = 0;
  std::string content;
};

enum class StructureType { Code, Table, List };

struct CodeData {
  std::string language;
  std::string content;
};

struct TableRows {
  std::vector<std::string> headers;
  std::vector<std::map<std::string, std::string>> rows;
};

struct ListData {
  std::vector<std::string> items;
  bool ordered = false;
};

struct StructuredElement {
  std::string caption;
  std::variant<CodeData, TableRows, ListData> data;
  size_t start = 0;   // (0,0) when the offset is not known
  size_t end = 0;
  std::string source_chunk_id;

  StructureType type() const { return static_cast<StructureType>(data.index()); }
};

struct RefinementQuality {
  size_t original_chars = 0;
  size_t refined_chars = 0;
  double structure_score = 0;
  double cleanup_score = 0;
  double retention_score = 0;
  double confidence_score = 0;

  double overall() const {
    return (structure_score + cleanup_score + retention_score + confidence_score) / 4.0;
  }
};

struct RefinementInfo {
  std::string refiner = "DocumentRefiner";
  bool used_llm = false;
  double duration_ms = 0;
  std::vector<std::string> warnings;
};

struct RefinedContent {
  std::string raw_id;
  std::string text;
  std::vector<Section> sections;
  std::vector<StructuredElement> structures;
  DocumentMetadata metadata;
  RefinementQuality quality;
  RefinementInfo info;
};

// ---- chunks ----

enum class DocumentDomain { General, Technical, Business, Academic };

struct SourceInfo {
  std::string source_id;
  std::string source_type;
  std::string title;
  std::string file_path;
  int chunk_count = 0;
  int word_count = 0;
  std::string language;
};

// Known annotations are named fields; collaborator output without a fixed
// shape goes to `extra`.
struct ChunkProps {
  std::optional<std::string> document_topic;     // title from the section analysis
  std::optional<std::string> document_summary;   // completion-service summary of the whole document
  std::vector<std::string> document_keywords;
  std::optional<std::string> summary;
  std::optional<std::string> contextual_summary;
  std::vector<std::string> keywords;
  std::map<std::string, std::string> extra;
};

struct DocumentChunk {
  std::string id;
  std::string content;
  int index = 0;
  size_t start = 0;   // offsets into the refined text
  size_t end = 0;
  std::string strategy;
  std::string content_type = "text";
  double quality_score = 0;
  double completeness = 0;
  double sentence_integrity = 0;
  double coherence = 0;
  std::string quality_grade;
  double importance = 0;
  double relevance_score = 0;
  double density = 0;
  int tokens = 0;
  bool oversized = false;   // single unit larger than the size limit
  std::string topic_category;
  std::string section_path; // "Intro > Scope" for hierarchical chunks
  DocumentDomain domain = DocumentDomain::General;
  ChunkProps props;
  SourceInfo source;
};

const char* to_string(BlockType t);
const char* to_string(StructureType t);
const char* to_string(DocumentDomain d);
const char* to_string(Alignment a);

// Lenient parsers used by readers; unknown names map to the first enumerator.
BlockType block_type_from(const std::string& s);
Alignment alignment_from(const std::string& s);
