#pragma once
#include "config.hpp"
#include <string>
#include <vector>

enum class NormalizationKind {
  AnnotationHeadingDemoted,
  EmptyHeadingRemoved,
  FirstHeadingPromoted,
  HeadingLevelAdjusted,
  ListIndentNormalized,
  ListMarkerNormalized,
  TableColumnsPadded,
  MalformedTableConverted,
  ComplexTableConverted,
  ExcessiveBlankLinesRemoved
};

struct NormalizationAction {
  NormalizationKind kind;
  int line = 0;          // 1-based, 0 when document-wide
  std::string before;
  std::string after;
  std::string reason;
};

struct NormalizationStats {
  int total_lines = 0;
  int headings_found = 0;
  int headings_demoted = 0;
  int headings_removed = 0;
  int headings_adjusted = 0;
  int list_items_normalized = 0;
  int tables_found = 0;
  int tables_preserved = 0;
  int tables_converted = 0;
  int blank_lines_removed = 0;
};

struct NormalizationResult {
  std::string markdown;
  std::vector<NormalizationAction> actions;
  NormalizationStats stats;
  bool converged = true;   // false when the pass cap was hit before the text settled

  bool changed() const { return !actions.empty(); }
};

// Format-agnostic markdown cleanup. normalize(normalize(x)) == normalize(x).
class MarkdownNormalizer {
public:
  explicit MarkdownNormalizer(const NormalizeOptions& options = NormalizeOptions());

  NormalizationResult normalize(const std::string& markdown) const;

private:
  NormalizeOptions opt_;
};

const char* to_string(NormalizationKind k);
