#pragma once
#include "document.hpp"
#include <optional>
#include <string>
#include <vector>

struct SemanticCompleteness {
  double complete_sentence_ratio = 0;
  double complete_thought_ratio = 0;
  double orphaned_fragment_ratio = 0;
  double average_boundary_score = 0;
  double overall_score = 0;
};

struct ContextPreservation {
  double average_overlap_score = 0;
  double continuity_score = 0;
  double reference_preservation_score = 0;
  double context_window_coverage = 0;
  double overall_score = 0;
};

struct InformationDensity {
  double average_token_density = 0;
  double redundancy_score = 0;
  double unique_term_ratio = 0;
  double information_entropy = 0;
  double overall_score = 0;
};

struct StructuralIntegrity {
  double header_preservation = 0;
  double list_preservation = 0;
  double code_block_preservation = 0;
  double table_preservation = 0;
  double broken_structure_ratio = 0;
  bool has_broken_structure = false;
  double overall_score = 0;
};

struct RetrievalReadiness {
  double self_contained_ratio = 0;
  double keyword_richness = 0;
  double average_summary_quality = 0;
  double query_match_potential = 0;
  double overall_score = 0;
};

struct BoundaryQuality {
  double clean_start_ratio = 0;
  double clean_end_ratio = 0;
  double transition_quality = 0;
  double overall_score = 0;
};

struct ContentCoverage {
  double coverage_ratio = 0;
  double missing_section_ratio = 0;
  double duplication_ratio = 0;
  double overall_score = 0;
};

struct RagQualityReport {
  int total_chunks = 0;
  double composite_score = 0;
  SemanticCompleteness semantic;
  ContextPreservation context;
  InformationDensity density;
  StructuralIntegrity structure;
  RetrievalReadiness retrieval;
  BoundaryQuality boundary;
  std::optional<ContentCoverage> coverage;
  std::vector<std::string> recommendations;
};

// A weight of zero leaves the metric out of the composite.
struct QualityWeights {
  double semantic = 0.25;
  double context = 0.20;
  double density = 0.15;
  double structure = 0.15;
  double retrieval = 0.15;
  double boundary = 0.10;
};

// Scores a chunk set. Never throws on chunk content; every score is in [0,1].
class QualityAnalyzer {
public:
  explicit QualityAnalyzer(bool parallel = false, QualityWeights weights = QualityWeights())
    : parallel_(parallel), weights_(weights) {}

  // original enables the coverage metric when non-empty.
  RagQualityReport analyze(const std::vector<DocumentChunk>& chunks,
                           const std::string& original = std::string()) const;

private:
  bool parallel_;
  QualityWeights weights_;
};

SemanticCompleteness semantic_completeness(const std::vector<std::string>& chunks);
ContextPreservation context_preservation(const std::vector<std::string>& chunks);
InformationDensity information_density(const std::vector<std::string>& chunks);
StructuralIntegrity structural_integrity(const std::vector<std::string>& chunks);
RetrievalReadiness retrieval_readiness(const std::vector<std::string>& chunks);
BoundaryQuality boundary_quality(const std::vector<std::string>& chunks);
ContentCoverage content_coverage(const std::vector<std::string>& chunks, const std::string& original);

// Longest suffix of prev that is also a prefix of curr, searched from
// min(256, |prev|, |curr|) down to min_len. 0 when none.
size_t overlap_length(const std::string& prev, const std::string& curr, size_t min_len = 1);
double overlap_quality(const std::string& prev, const std::string& curr);

double composite_score(const RagQualityReport& report, const QualityWeights& weights);
std::vector<std::string> recommendations_for(const RagQualityReport& report);

std::string report_to_json(const RagQualityReport& report, int indent = 2);
