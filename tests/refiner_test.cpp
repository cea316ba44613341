#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "refiner.hpp"

namespace {

class FakeConverter : public MarkdownConverter {
public:
  explicit FakeConverter(bool fail) : fail_(fail) {}

  MarkdownConversion convert(const RawContent& raw, const MarkdownConversionOptions&) override {
    if (fail_) throw std::runtime_error("model offline");
    seen = raw.text;
    MarkdownConversion c;
    c.markdown = "# Converted\n\nBody.";
    c.success = true;
    c.used_llm = true;
    c.warnings.push_back("one hint ignored");
    return c;
  }

  std::string seen;

private:
  bool fail_;
};

}  // namespace

class RefinerTest : public ::testing::Test {
protected:
  RawContent raw(const std::string& text) {
    RawContent r;
    r.id = "raw-1";
    r.text = text;
    r.file.name = "notes.md";
    r.file.extension = ".md";
    r.file.path = "in/notes.md";
    r.file.size = text.size();
    return r;
  }

  Refiner refiner_;
  RefineOptions options_;
};

// ============================================================================
// Text Passes
// ============================================================================

TEST_F(RefinerTest, NumberedSectionsBecomeHeadings) {
  EXPECT_EQ(promote_numbered_sections("1. Introduction"), "## 1. Introduction");
  EXPECT_EQ(promote_numbered_sections("3-1. Technical Requirements"), "### 3-1. Technical Requirements");
  EXPECT_EQ(promote_numbered_sections("1-2-3. Deep Detail"), "#### 1-2-3. Deep Detail");
  EXPECT_EQ(promote_numbered_sections("(2) Details"), "### (2) Details");
  EXPECT_EQ(promote_numbered_sections("1. Ends like a sentence."), "1. Ends like a sentence.");
  EXPECT_EQ(promote_numbered_sections("1. First\n2. Second"), "1. First\n2. Second");
  EXPECT_EQ(promote_numbered_sections("```\n1. Inside code\n```"), "```\n1. Inside code\n```");
}

TEST_F(RefinerTest, NoiseCleanup) {
  EXPECT_EQ(clean_noise("Text  with   spaces"), "Text with spaces");
  auto cleaned = clean_noise("# Paragraph 3\nBody line\n\n\n\nNext");
  EXPECT_EQ(cleaned.find("Paragraph 3"), std::string::npos);
  EXPECT_EQ(cleaned.find("\n\n\n"), std::string::npos);
  EXPECT_EQ(clean_noise("```\nx  =  1\n```"), "```\nx  =  1\n```");
}

TEST_F(RefinerTest, PageArtifacts) {
  EXPECT_EQ(remove_page_artifacts("Intro\nPage 3 of 10\nBody", true, false, false), "Intro\nBody");
  EXPECT_EQ(remove_page_artifacts("Intro\n- 12 -\nBody", false, true, false), "Intro\nBody");
  EXPECT_EQ(remove_page_artifacts("Chapter one ........ 5", false, false, true), "Chapter one ");
  EXPECT_EQ(remove_page_artifacts("Intro\nPage 3 of 10\nBody", false, false, false), "Intro\nPage 3 of 10\nBody");
}

TEST_F(RefinerTest, PageArtifactsSkipFencedCode) {
  std::string md = "Intro\n42\n```\n42\nPage 1 of 2\nstep ....... 3\n```\nBody";
  EXPECT_EQ(remove_page_artifacts(md, true, true, true),
            "Intro\n```\n42\nPage 1 of 2\nstep ....... 3\n```\nBody");
}

TEST_F(RefinerTest, WhitespaceNormalization) {
  EXPECT_EQ(normalize_whitespace("a  \n\n\n\nb\n"), "a\n\nb");
  EXPECT_EQ(normalize_whitespace("  a\n \n \n b  "), "a\n\n b");
}

TEST_F(RefinerTest, Scores) {
  EXPECT_DOUBLE_EQ(structure_score(true, true), 0.9);
  EXPECT_DOUBLE_EQ(structure_score(false, true), 0.7);
  EXPECT_DOUBLE_EQ(structure_score(false, false), 0.5);
  EXPECT_DOUBLE_EQ(cleanup_score(100, 90), 0.9);
  EXPECT_DOUBLE_EQ(cleanup_score(100, 100), 0.8);
  EXPECT_DOUBLE_EQ(cleanup_score(100, 70), 0.7);
  EXPECT_DOUBLE_EQ(cleanup_score(100, 50), 0.5);
  EXPECT_DOUBLE_EQ(retention_score(100, 50), 0.5);
  EXPECT_DOUBLE_EQ(retention_score(0, 10), 1.0);
}

// ============================================================================
// Sections and Structures
// ============================================================================

TEST_F(RefinerTest, SectionsCoverTextFromFirstHeading) {
  std::string text = "Preface\n\n# A\n\nintro\n\n## B\n\nbody\n\n```\n# not a heading\n```";
  auto sections = build_sections(text);

  ASSERT_EQ(sections.size(), 2u);
  EXPECT_EQ(sections[0].title, "A");
  EXPECT_EQ(sections[0].level, 1);
  EXPECT_EQ(sections[0].start, text.find("# A"));
  EXPECT_EQ(sections[0].end, sections[1].start);
  EXPECT_EQ(sections[1].title, "B");
  EXPECT_EQ(sections[1].level, 2);
  EXPECT_EQ(sections[1].end, text.size());
  EXPECT_EQ(sections[1].content, text.substr(sections[1].start));
}

TEST_F(RefinerTest, StructuresCarryOffsets) {
  std::string text =
    "Intro.\n\n```python\nprint(1)\n```\n\n| a | b |\n|---|---|\n| 1 | 2 |\n\n- one\n- two\n- three";
  auto found = extract_structures(text);

  ASSERT_EQ(found.size(), 3u);
  EXPECT_EQ(found[0].type(), StructureType::Code);
  EXPECT_EQ(std::get<CodeData>(found[0].data).language, "python");
  EXPECT_EQ(std::get<CodeData>(found[0].data).content, "print(1)");
  EXPECT_EQ(text.substr(found[0].start, found[0].end - found[0].start), "```python\nprint(1)\n```");

  EXPECT_EQ(found[1].type(), StructureType::Table);
  const auto& table = std::get<TableRows>(found[1].data);
  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.headers, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(table.rows[0].at("b"), "2");

  EXPECT_EQ(found[2].type(), StructureType::List);
  const auto& list = std::get<ListData>(found[2].data);
  EXPECT_FALSE(list.ordered);
  EXPECT_EQ(list.items, (std::vector<std::string>{"one", "two", "three"}));
  EXPECT_EQ(found[2].end, text.size());
}

TEST_F(RefinerTest, UnclosedFenceIsNotAStructure) {
  auto found = extract_structures("Text\n```\nnever closed");
  EXPECT_TRUE(found.empty());
}

// ============================================================================
// Refiner
// ============================================================================

TEST_F(RefinerTest, RefinePromotesSubsectionHeading) {
  std::string text = "Overview text here.\n\n3-1. Technical Requirements\n\nDetails follow.";
  auto out = refiner_.refine(raw(text), options_);

  EXPECT_NE(out.text.find("### 3-1. Technical Requirements"), std::string::npos);
  ASSERT_EQ(out.sections.size(), 1u);
  EXPECT_EQ(out.sections[0].title, "3-1. Technical Requirements");
  EXPECT_EQ(out.sections[0].level, 3);
  EXPECT_EQ(out.sections[0].end, out.text.size());
  EXPECT_EQ(out.raw_id, "raw-1");
  EXPECT_EQ(out.metadata.file_type, "MD");
  EXPECT_EQ(out.quality.original_chars, text.size());
  EXPECT_EQ(out.quality.refined_chars, out.text.size());
  EXPECT_TRUE(out.info.warnings.empty());
}

TEST_F(RefinerTest, RefineRendersStructuredContent) {
  auto r = raw("ignored when blocks exist");
  TextBlock title;
  title.type = BlockType::Heading;
  title.heading_level = 1;
  title.content = "Title";
  title.order = 0;
  TextBlock body;
  body.content = "Body text.";
  body.order = 1;
  r.blocks = {body, title};
  TableData t;
  t.has_header = true;
  t.cells = {{"Name", "Qty"}, {"Apple", "3"}};
  r.tables.push_back(t);

  auto out = refiner_.refine(r, options_);
  EXPECT_EQ(out.text.find("# Title"), 0u);
  EXPECT_NE(out.text.find("Body text."), std::string::npos);
  EXPECT_NE(out.text.find("| Apple | 3 |"), std::string::npos);
  EXPECT_EQ(out.text.find("ignored"), std::string::npos);
  ASSERT_FALSE(out.structures.empty());
  EXPECT_EQ(out.structures[0].type(), StructureType::Table);
  EXPECT_EQ(std::get<TableRows>(out.structures[0].data).rows[0].at("Name"), "Apple");
}

TEST_F(RefinerTest, InvalidTableAlignmentIsProcessingError) {
  auto r = raw("text");
  TableData t;
  t.cells = {{"a", "b"}};
  t.alignments = {Alignment::Left, Alignment::Left, Alignment::Right};
  r.tables.push_back(t);

  try {
    refiner_.refine(r, options_);
    FAIL() << "expected ProcessingError";
  } catch (const ProcessingError& e) {
    EXPECT_EQ(e.stage(), "refine");
    EXPECT_EQ(e.file(), "in/notes.md");
  }
}

TEST_F(RefinerTest, DisabledStepsLeaveTextAlone) {
  RefineOptions o;
  o.clean_noise = false;
  o.build_sections = false;
  o.normalize_markdown_structure = false;
  o.extract_structures = false;
  o.normalize_whitespace = false;
  auto out = refiner_.refine(raw("1. Heading\nText  here"), o);
  EXPECT_EQ(out.text, "1. Heading\nText  here");
  EXPECT_TRUE(out.sections.empty());
  EXPECT_TRUE(out.structures.empty());
}

TEST_F(RefinerTest, CancelledTokenStopsRefining) {
  CancelToken cancel;
  cancel.cancel();
  EXPECT_THROW(refiner_.refine(raw("Some text."), options_, cancel), Cancelled);
}

TEST_F(RefinerTest, ConverterOutputReplacesText) {
  FakeConverter converter(false);
  Refiner refiner(&converter);
  auto out = refiner.refine(raw("plain text"), options_);
  EXPECT_EQ(converter.seen, "plain text");
  EXPECT_EQ(out.text, "# Converted\n\nBody.");
  EXPECT_TRUE(out.info.used_llm);
  ASSERT_EQ(out.info.warnings.size(), 1u);
  EXPECT_EQ(out.info.warnings[0], "converter: one hint ignored");
}

TEST_F(RefinerTest, FailingConverterKeepsCleanedText) {
  FakeConverter converter(true);
  Refiner refiner(&converter);
  auto out = refiner.refine(raw("plain text"), options_);
  EXPECT_EQ(out.text, "plain text");
  EXPECT_FALSE(out.info.used_llm);
  ASSERT_EQ(out.info.warnings.size(), 1u);
  EXPECT_NE(out.info.warnings[0].find("model offline"), std::string::npos);
}
