#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "quality.hpp"

class QualityTest : public ::testing::Test {
protected:
  std::vector<DocumentChunk> chunks_of(const std::vector<std::string>& contents) {
    std::vector<DocumentChunk> out;
    for (size_t i = 0; i < contents.size(); ++i) {
      DocumentChunk c;
      c.index = (int)i;
      c.content = contents[i];
      out.push_back(c);
    }
    return out;
  }

  void expect_bounded(const RagQualityReport& r) {
    const double scores[] = {
      r.composite_score,
      r.semantic.overall_score, r.semantic.complete_sentence_ratio, r.semantic.orphaned_fragment_ratio,
      r.context.overall_score, r.context.average_overlap_score, r.context.context_window_coverage,
      r.density.overall_score, r.density.information_entropy, r.density.redundancy_score,
      r.structure.overall_score, r.structure.broken_structure_ratio,
      r.retrieval.overall_score, r.retrieval.query_match_potential,
      r.boundary.overall_score, r.boundary.transition_quality,
    };
    for (double s : scores) {
      EXPECT_GE(s, 0.0);
      EXPECT_LE(s, 1.0);
    }
  }

  bool has_recommendation(const RagQualityReport& r, const std::string& prefix) {
    for (auto& s : r.recommendations) {
      if (s.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
  }

  QualityAnalyzer analyzer_;
};

// ============================================================================
// Overlap
// ============================================================================

TEST_F(QualityTest, OverlapLengthFindsSharedTail) {
  EXPECT_EQ(overlap_length("...the quick brown fox.", "brown fox. jumps over"), 10u);
  EXPECT_EQ(overlap_length("...the quick brown fox.", "brown fox. jumps over", 21), 0u);
  EXPECT_EQ(overlap_length("abc", "xyz"), 0u);
  EXPECT_EQ(overlap_length("", "xyz"), 0u);
}

TEST_F(QualityTest, OverlapQualityRewardsSentenceOverlap) {
  std::string prev = "Intro text goes here. The shared tail sentence is right here.";
  std::string curr = "The shared tail sentence is right here. And more follows after that point.";
  EXPECT_DOUBLE_EQ(overlap_quality(prev, curr), 1.0);
  EXPECT_DOUBLE_EQ(overlap_quality("no shared text at all", "completely different words"), 0.0);
}

// ============================================================================
// Metrics
// ============================================================================

TEST_F(QualityTest, UnclosedFenceIsBrokenStructure) {
  auto broken = structural_integrity({"Example:\n```python\nprint('hi')\n"});
  auto whole = structural_integrity({"Example:\n```python\nprint('hi')\n```"});

  EXPECT_TRUE(broken.has_broken_structure);
  EXPECT_FALSE(whole.has_broken_structure);
  EXPECT_LT(broken.overall_score, whole.overall_score);
  EXPECT_DOUBLE_EQ(whole.code_block_preservation, 1.0);
}

TEST_F(QualityTest, SingleBulletIsBrokenList) {
  auto m = structural_integrity({"Steps:\n- only one item", "Steps:\n- first item\n- second item"});
  EXPECT_TRUE(m.has_broken_structure);
  EXPECT_DOUBLE_EQ(m.broken_structure_ratio, 0.5);
  EXPECT_DOUBLE_EQ(m.list_preservation, 0.5);
}

TEST_F(QualityTest, SingleChunkHasFullContextAndBoundary) {
  auto r = analyzer_.analyze(chunks_of({"A single self contained chunk of text."}));
  EXPECT_EQ(r.total_chunks, 1);
  EXPECT_DOUBLE_EQ(r.context.overall_score, 1.0);
  EXPECT_DOUBLE_EQ(r.boundary.overall_score, 1.0);
  EXPECT_FALSE(has_recommendation(r, "Low overlap between chunks."));
  expect_bounded(r);
}

TEST_F(QualityTest, EmptyChunkSetStaysBounded) {
  auto r = analyzer_.analyze({});
  EXPECT_EQ(r.total_chunks, 0);
  EXPECT_DOUBLE_EQ(r.semantic.overall_score, 0.0);
  EXPECT_DOUBLE_EQ(r.retrieval.overall_score, 0.0);
  EXPECT_FALSE(r.recommendations.empty());
  expect_bounded(r);
}

TEST_F(QualityTest, ContinuityMarkerIsRecognised) {
  auto m = context_preservation({"The first part ends here.", "However, the second part continues."});
  EXPECT_DOUBLE_EQ(m.continuity_score, 1.0);
  EXPECT_DOUBLE_EQ(m.reference_preservation_score, 1.0);
}

TEST_F(QualityTest, CoverageOfExactSplit) {
  auto m = content_coverage({"Alpha beta.", "Gamma delta."}, "Alpha beta. Gamma delta.");
  EXPECT_DOUBLE_EQ(m.coverage_ratio, 1.0);
  EXPECT_DOUBLE_EQ(m.missing_section_ratio, 0.0);
  EXPECT_DOUBLE_EQ(m.duplication_ratio, 0.0);
  EXPECT_DOUBLE_EQ(m.overall_score, 1.0);
}

TEST_F(QualityTest, DuplicatedChunksLoseCoverage) {
  auto m = content_coverage({"Same text.", "Same text."}, "Same text.");
  EXPECT_DOUBLE_EQ(m.duplication_ratio, 1.0);
  EXPECT_DOUBLE_EQ(m.overall_score, 0.0);
}

// ============================================================================
// Report
// ============================================================================

TEST_F(QualityTest, PoorChunksGetThresholdRecommendation) {
  auto r = analyzer_.analyze(chunks_of({"x", "y"}));
  EXPECT_LT(r.composite_score, 0.6);
  EXPECT_TRUE(has_recommendation(r, "Overall quality below threshold."));
  EXPECT_TRUE(has_recommendation(r, "High ratio of orphaned fragments detected."));
  expect_bounded(r);
}

TEST_F(QualityTest, ZeroWeightsAreLeftOut) {
  QualityWeights w;
  w.semantic = 1.0;
  w.context = 0;
  w.density = 0;
  w.structure = 0;
  w.retrieval = 0;
  w.boundary = 0;
  auto chunks = chunks_of({"The first chunk is a complete sentence.", "x"});
  auto r = QualityAnalyzer(false, w).analyze(chunks);
  EXPECT_DOUBLE_EQ(r.composite_score, r.semantic.overall_score);
}

TEST_F(QualityTest, ParallelMatchesSequential) {
  auto chunks = chunks_of({
    "# Setup\n\nInstall the package with the system package manager before running anything else.",
    "However, the configuration file must exist. It lives in the home directory of the user.",
    "- first step\n- second step\n- third step",
  });
  auto seq = QualityAnalyzer(false).analyze(chunks, "");
  auto par = QualityAnalyzer(true).analyze(chunks, "");
  EXPECT_DOUBLE_EQ(seq.composite_score, par.composite_score);
  EXPECT_DOUBLE_EQ(seq.context.overall_score, par.context.overall_score);
  EXPECT_EQ(seq.recommendations, par.recommendations);
}

TEST_F(QualityTest, ReportSerializesToJson) {
  auto chunks = chunks_of({"Alpha beta.", "Gamma delta."});
  auto with_coverage = nlohmann::json::parse(report_to_json(analyzer_.analyze(chunks, "Alpha beta. Gamma delta.")));
  auto without = nlohmann::json::parse(report_to_json(analyzer_.analyze(chunks)));

  EXPECT_EQ(with_coverage["total_chunks"].get<int>(), 2);
  EXPECT_TRUE(with_coverage.contains("composite_score"));
  EXPECT_TRUE(with_coverage["structural_integrity"].contains("has_broken_structure"));
  EXPECT_TRUE(with_coverage["recommendations"].is_array());
  EXPECT_TRUE(with_coverage.contains("content_coverage"));
  EXPECT_FALSE(without.contains("content_coverage"));
}
