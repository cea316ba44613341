#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "normalizer.hpp"
#include "text.hpp"

class NormalizerTest : public ::testing::Test {
protected:
  bool has_action(const NormalizationResult& r, NormalizationKind kind) {
    for (auto& a : r.actions) {
      if (a.kind == kind) return true;
    }
    return false;
  }

  MarkdownNormalizer normalizer_;
};

// ============================================================================
// Headings
// ============================================================================

TEST_F(NormalizerTest, HeadingJumpsAreClamped) {
  auto r = normalizer_.normalize("# A\n### B\n###### C\n## D");
  EXPECT_EQ(r.markdown, "# A\n## B\n### C\n## D");
  EXPECT_TRUE(has_action(r, NormalizationKind::HeadingLevelAdjusted));
  EXPECT_EQ(r.stats.headings_adjusted, 2);
  EXPECT_EQ(r.stats.headings_found, 4);
}

TEST_F(NormalizerTest, HeadingLevelsNeverJumpMoreThanOne) {
  auto r = normalizer_.normalize("## Start\n\n#### Deep\n\ntext\n\n# Top\n\n##### Deeper\n\n###### Deepest");
  int last = 0;
  for (auto& line : split_lines(r.markdown)) {
    size_t n = 0;
    while (n < line.size() && line[n] == '#') ++n;
    if (n == 0) continue;
    if (last > 0) EXPECT_LE((int)n, last + 1) << line;
    last = (int)n;
  }
}

TEST_F(NormalizerTest, FirstHeadingKeptUnlessPromotionEnabled) {
  EXPECT_EQ(normalizer_.normalize("### Start\nText").markdown, "### Start\nText");

  NormalizeOptions o;
  o.promote_first_heading = true;
  auto r = MarkdownNormalizer(o).normalize("### Start\nText");
  EXPECT_EQ(r.markdown, "# Start\nText");
  EXPECT_TRUE(has_action(r, NormalizationKind::FirstHeadingPromoted));
}

TEST_F(NormalizerTest, EmptyAndAnnotationHeadings) {
  auto r = normalizer_.normalize("# Title\n##\n## (see appendix)\nBody");
  EXPECT_EQ(r.markdown, "# Title\n(see appendix)\nBody");
  EXPECT_EQ(r.stats.headings_removed, 1);
  EXPECT_EQ(r.stats.headings_demoted, 1);
}

// ============================================================================
// Lists, Tables, Whitespace
// ============================================================================

TEST_F(NormalizerTest, BulletMarkersBecomeDashes) {
  auto r = normalizer_.normalize("* one\n+ two\n1. three");
  EXPECT_EQ(r.markdown, "- one\n- two\n1. three");
  EXPECT_EQ(r.stats.list_items_normalized, 2);
}

TEST_F(NormalizerTest, ShortTableRowsArePadded) {
  auto r = normalizer_.normalize("| a | b |\n|---|---|\n| c |");
  EXPECT_EQ(r.markdown, "| a | b |\n|---|---|\n| c | |");
  EXPECT_TRUE(has_action(r, NormalizationKind::TableColumnsPadded));
  EXPECT_EQ(r.stats.tables_preserved, 1);
}

TEST_F(NormalizerTest, RaggedTableBecomesTextBlock) {
  auto r = normalizer_.normalize("| a | b |\n| c | d | e | f | g |");
  EXPECT_EQ(r.markdown.find("| a"), std::string::npos);
  EXPECT_NE(r.markdown.find("<table>"), std::string::npos);
  EXPECT_NE(r.markdown.find("</table>"), std::string::npos);
  EXPECT_TRUE(has_action(r, NormalizationKind::MalformedTableConverted));
  EXPECT_EQ(r.stats.tables_converted, 1);
}

TEST_F(NormalizerTest, BlankLineRunsAreCapped) {
  auto r = normalizer_.normalize("a\n\n\n\n\nb");
  EXPECT_EQ(r.markdown, "a\n\n\nb");
  EXPECT_TRUE(has_action(r, NormalizationKind::ExcessiveBlankLinesRemoved));
}

TEST_F(NormalizerTest, FencedCodeIsUntouched) {
  std::string md = "# T\n```\n#### not a heading\n* item\n| x |\n```";
  auto r = normalizer_.normalize(md);
  EXPECT_EQ(r.markdown, md);
  EXPECT_FALSE(r.changed());
}

// ============================================================================
// Idempotence
// ============================================================================

TEST_F(NormalizerTest, NormalizeIsIdempotent) {
  std::string md =
    "### Intro\n\n##### Jump\n\n* a\n        * b\n\n\n\n\n"
    "| x | y |\n| 1 | 2 | 3 | 4 | 5 |\n\n## (note)\n#\ntext   \n";
  auto once = normalizer_.normalize(md).markdown;
  auto twice = normalizer_.normalize(once);
  EXPECT_EQ(twice.markdown, once);
  EXPECT_FALSE(twice.changed());
}

TEST_F(NormalizerTest, PassCapIsReported) {
  EXPECT_TRUE(normalizer_.normalize("# A\n### B").converged);

  NormalizeOptions o;
  o.max_passes = 1;
  MarkdownNormalizer capped(o);
  auto r = capped.normalize("# A\n### B");
  EXPECT_EQ(r.markdown, "# A\n## B");
  EXPECT_FALSE(r.converged);
  EXPECT_TRUE(capped.normalize("# A\n## B").converged);
}
