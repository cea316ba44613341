#pragma once
#include "cancel.hpp"
#include "config.hpp"
#include "document.hpp"
#include <string>
#include <vector>

enum class ChunkStrategy { Auto, Sentence, Paragraph, Token, Semantic, Hierarchical };

// Case-insensitive; accepts Smart, Intelligent, FixedSize and PageLevel as
// aliases. Throws StrategyError for anything else.
ChunkStrategy parse_strategy(const std::string& name);
const char* to_string(ChunkStrategy s);

// Deterministic choice for Auto based on size, headings, code and tables.
ChunkStrategy resolve_auto(const std::string& text, const ChunkOptions& options);

// A trimmed [start, end) slice of the text being chunked.
struct Span {
  size_t start = 0;
  size_t end = 0;
  size_t size() const { return end - start; }
};

// Blank-line separated blocks. Heading lines stand alone, fenced code is one block.
std::vector<Span> paragraph_spans(const std::string& text, size_t begin, size_t end);
// Sentence ends at . ! ? followed by whitespace, skipping common abbreviations
// and initials, and before lines that open a markdown block.
std::vector<Span> sentence_spans(const std::string& text, size_t begin, size_t end);
// Whitespace separated words; words longer than max_len are cut at UTF-8 boundaries.
std::vector<Span> word_spans(const std::string& text, size_t begin, size_t end, size_t max_len = 0);

class Chunker {
public:
  // Empty text gives no chunks. Failures other than cancellation and an
  // unknown strategy are raised as ProcessingError(file, "chunk", ...).
  std::vector<DocumentChunk> chunk(const RefinedContent& refined, const ChunkOptions& options,
                                   const CancelToken& cancel = CancelToken()) const;
};

// Copies of structures with source_chunk_id set to the chunk holding each start offset.
std::vector<StructuredElement> link_structures(const std::vector<StructuredElement>& structures,
                                               const std::vector<DocumentChunk>& chunks);

// ---- per-chunk scoring ----

double completeness_score(const std::string& content);
double sentence_integrity(const std::string& content);
double coherence_score(const std::string& content);
std::string quality_grade(double score);
std::string content_type_of(const std::string& content);
DocumentDomain detect_domain(const std::string& text);

// Most frequent extracted terms, ties broken alphabetically.
std::vector<std::string> top_terms(const std::string& text, size_t n);
