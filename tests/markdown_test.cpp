#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "markdown.hpp"
#include "text.hpp"

namespace {

class FakeImageText : public ImageTextService {
public:
  explicit FakeImageText(bool fail) : fail_(fail) {}

  bool is_available() override { return true; }
  ImageText extract_text(const std::vector<uint8_t>&, const ImageTextOptions&) override {
    if (fail_) throw std::runtime_error("vision backend offline");
    return ImageText{"A bar chart\nwith two series", 0.9};
  }

private:
  bool fail_;
};

class FakeStructure : public CompletionService {
public:
  bool is_available() override { return true; }
  std::string generate(const std::string&) override {
    return "Sure. {\"sections\": [{\"title\": \"Overview\", \"level\": 2}], \"confidence\": 0.8}";
  }
};

}  // namespace

class MarkdownTest : public ::testing::Test {
protected:
  TableData table(bool has_header) {
    TableData t;
    t.has_header = has_header;
    t.cells = {{"Name", "Qty"}, {"Apple", "3"}, {"Pear", "5"}};
    return t;
  }

  TextBlock block(BlockType type, const std::string& content, int order) {
    TextBlock b;
    b.type = type;
    b.content = content;
    b.order = order;
    return b;
  }

  HeuristicMarkdownConverter heuristic_;
  MarkdownConversionOptions options_;
};

// ============================================================================
// Tables
// ============================================================================

TEST_F(MarkdownTest, TableWithoutHeaderGetsGeneratedColumns) {
  auto md = table_to_markdown(table(false));
  auto lines = split_lines(md);
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[0], "| Col1 | Col2 |");
  EXPECT_EQ(lines[1], "| --- | --- |");
  EXPECT_EQ(lines[2], "| Name | Qty |");
}

TEST_F(MarkdownTest, TableHeaderRowIsConsumed) {
  auto lines = split_lines(table_to_markdown(table(true)));
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "| Name | Qty |");
  EXPECT_EQ(lines[2], "| Apple | 3 |");
}

TEST_F(MarkdownTest, TableCellsAreEscaped) {
  TableData t;
  t.cells = {{"a|b", "line\nbreak"}};
  t.headers = {"H1", "H2"};
  t.alignments = {Alignment::Left, Alignment::Right};
  auto lines = split_lines(table_to_markdown(t));
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[1], "| :--- | ---: |");
  EXPECT_EQ(lines[2], "| a\\|b | line break |");
}

TEST_F(MarkdownTest, LowConfidenceTableIsFlagged) {
  auto t = table(true);
  t.confidence = 0.5;
  auto md = table_to_markdown(t);
  EXPECT_NE(md.find("<!-- Table confidence: 0.50"), std::string::npos);
}

TEST_F(MarkdownTest, EmptyTableUsesFallbackText) {
  TableData t;
  t.plain_text_fallback = "  raw table text  ";
  EXPECT_EQ(table_to_markdown(t), "raw table text");
}

// ============================================================================
// Blocks and Images
// ============================================================================

TEST_F(MarkdownTest, BlocksRenderByType) {
  auto heading = block(BlockType::Heading, "Title", 0);
  heading.heading_level = 2;
  EXPECT_EQ(block_to_markdown(heading), "## Title");

  auto item = block(BlockType::ListItem, "third", 0);
  item.ordered = true;
  item.list_level = 1;
  EXPECT_EQ(block_to_markdown(item, 3), "  3. third");

  auto code = block(BlockType::CodeBlock, "x = 1\n", 0);
  code.language = "py";
  EXPECT_EQ(block_to_markdown(code), "```py\nx = 1\n```");

  EXPECT_EQ(block_to_markdown(block(BlockType::Quote, "one\ntwo", 0)), "> one\n> two");
  EXPECT_EQ(block_to_markdown(block(BlockType::Caption, "Figure 1", 0)), "*Figure 1*");
  EXPECT_EQ(block_to_markdown(block(BlockType::Paragraph, "   ", 0)), "");
}

TEST_F(MarkdownTest, ImageReferences) {
  ImageInfo img;
  img.id = "img1";
  EXPECT_EQ(image_to_markdown(img, "a [chart]"), "![a [chart\\]](embedded:img1)");
  img.external_ref = "media/chart.png";
  EXPECT_EQ(image_to_markdown(img, "chart"), "![chart](media/chart.png)");
}

TEST_F(MarkdownTest, StructuredContentFollowsReadingOrder) {
  RawContent raw;
  raw.blocks = {
    block(BlockType::Paragraph, "Body text.", 3),
    block(BlockType::ListItem, "b", 2),
    block(BlockType::ListItem, "a", 1),
    block(BlockType::Heading, "Title", 0),
  };
  raw.blocks[3].heading_level = 1;
  std::vector<std::string> warnings;
  auto md = render_structured(raw, true, true, nullptr, CancelToken(), warnings);
  EXPECT_EQ(md, "# Title\n\n- a\n- b\n\nBody text.");
  EXPECT_TRUE(warnings.empty());
}

TEST_F(MarkdownTest, UnlocatedTableKeepsItsPlaceBetweenBlocks) {
  RawContent raw;
  raw.blocks = {block(BlockType::Paragraph, "First.", 0), block(BlockType::Paragraph, "Second.", 2)};
  auto t = table(true);
  t.position = 1;
  raw.tables.push_back(t);
  std::vector<std::string> warnings;
  auto md = render_structured(raw, true, true, nullptr, CancelToken(), warnings);

  auto first = md.find("First.");
  auto row = md.find("| Apple | 3 |");
  auto second = md.find("Second.");
  ASSERT_NE(row, std::string::npos);
  EXPECT_LT(first, row);
  EXPECT_LT(row, second);
}

TEST_F(MarkdownTest, ImageWithoutPageFollowsReadingOrder) {
  RawContent raw;
  raw.blocks = {block(BlockType::Paragraph, "First.", 0), block(BlockType::Paragraph, "Second.", 1)};
  raw.blocks[0].page_number = 1;
  raw.blocks[1].page_number = 2;
  ImageInfo anchored;
  anchored.id = "img1";
  anchored.position = 0;
  ImageInfo loose;
  loose.id = "img2";
  raw.images = {loose, anchored};
  std::vector<std::string> warnings;

  EXPECT_EQ(render_structured(raw, true, true, nullptr, CancelToken(), warnings),
            "First.\n\n![image](embedded:img1)\n\nSecond.\n\n![image](embedded:img2)");
}

TEST_F(MarkdownTest, ImageTextBecomesAltText) {
  RawContent raw;
  ImageInfo img;
  img.id = "img1";
  img.data = {1, 2, 3};
  raw.images.push_back(img);
  std::vector<std::string> warnings;

  FakeImageText ok(false);
  EXPECT_EQ(render_structured(raw, true, true, &ok, CancelToken(), warnings), "![A bar chart](embedded:img1)");
  EXPECT_TRUE(warnings.empty());

  FakeImageText broken(true);
  EXPECT_EQ(render_structured(raw, true, true, &broken, CancelToken(), warnings), "![image](embedded:img1)");
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("vision backend offline"), std::string::npos);
}

// ============================================================================
// Converters
// ============================================================================

TEST_F(MarkdownTest, HeuristicConverterMarksHeadingsAndLists) {
  RawContent raw;
  raw.text = "INTRODUCTION\nSome text here.\n\xE2\x80\xA2 first\n\xE2\x80\xA2 second";
  auto r = heuristic_.convert(raw, options_);
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.markdown, "## Introduction\n\nSome text here.\n- first\n- second");
  EXPECT_EQ(r.headings, 1);
  EXPECT_EQ(r.lists, 2);
}

TEST_F(MarkdownTest, HeuristicConverterAddsTableSeparator) {
  RawContent raw;
  raw.text = "| a | b |\n| 1 | 2 |";
  auto r = heuristic_.convert(raw, options_);
  EXPECT_EQ(r.markdown, "| a | b |\n| --- | --- |\n| 1 | 2 |");
  EXPECT_EQ(r.tables, 1);
}

TEST_F(MarkdownTest, SectionHintsPromoteMatchingLines) {
  std::string md = "Intro\nOverview\n```\nOverview\n```";
  EXPECT_EQ(apply_section_hints(md, {SectionHint{"Overview", 2, 0.5}}), 1);
  EXPECT_EQ(md, "Intro\n## Overview\n```\nOverview\n```");
}

TEST_F(MarkdownTest, LlmConverterAppliesStructureHints) {
  FakeStructure completion;
  LlmMarkdownConverter converter(&completion);
  RawContent raw;
  raw.text = "Overview\nThe system has two parts.";
  raw.file.extension = ".txt";
  auto r = converter.convert(raw, options_);
  EXPECT_TRUE(r.used_llm);
  EXPECT_EQ(r.markdown.find("## Overview"), 0u);
}

TEST_F(MarkdownTest, LlmConverterWithoutServiceFallsBack) {
  LlmMarkdownConverter converter(nullptr);
  RawContent raw;
  raw.text = "Overview\nThe system has two parts.";
  auto r = converter.convert(raw, options_);
  EXPECT_TRUE(r.success);
  EXPECT_FALSE(r.used_llm);
  EXPECT_FALSE(r.warnings.empty());
}
