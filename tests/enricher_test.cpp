#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "completion.hpp"
#include "enricher.hpp"

namespace {

// Answers by prompt kind, like a small instruct model would.
class FakeCompletion : public CompletionService {
public:
  bool is_available() override { return available; }

  std::string generate(const std::string& prompt) override {
    prompts.push_back(prompt);
    if (fail) throw std::runtime_error("model crashed");
    if (prompt.find("Situate the chunk") != std::string::npos) return "  Context sentence.  ";
    if (prompt.find("Extract metadata") != std::string::npos)
      return R"({"keywords": ["meta"], "entities": ["Acme", "Bob"], "categories": ["manual"], "language": "en"})";
    if (prompt.find("Summarize") != std::string::npos)
      return R"(Here you go: {"summary": "A short summary.", "keywords": ["alpha", "beta", "gamma"], "confidence": 0.9})";
    return reply;
  }

  bool available = true;
  bool fail = false;
  std::string reply;
  std::vector<std::string> prompts;
};

// Stateless, so it can be called from several threads.
class FailingCompletion : public CompletionService {
public:
  bool is_available() override { return true; }
  std::string generate(const std::string&) override { throw std::runtime_error("model crashed"); }
};

}  // namespace

class EnricherTest : public ::testing::Test {
protected:
  std::vector<DocumentChunk> chunks() {
    std::vector<DocumentChunk> out;
    for (int i = 0; i < 2; ++i) {
      DocumentChunk c;
      c.id = "c" + std::to_string(i);
      c.index = i;
      c.start = (size_t)i * 20;
      c.content = i == 0 ? "The pump is rated for 40 bar." : "Service it every six months.";
      c.end = c.start + c.content.size();
      out.push_back(c);
    }
    return out;
  }

  RefinedContent refined() {
    RefinedContent r;
    r.text = "The pump is rated for 40 bar. Service it every six months.";
    r.metadata.title = "Pump manual";
    r.metadata.file_type = "MD";
    return r;
  }

  FakeCompletion completion_;
  EnrichOptions options_;
};

// ============================================================================
// Enrichment
// ============================================================================

TEST_F(EnricherTest, FillsSummariesAndContext) {
  Enricher enricher(&completion_, options_);
  auto in = chunks();
  auto result = enricher.enrich(in, refined());
  auto& out = result.chunks;

  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(result.failures, 0);
  for (size_t i = 0; i < out.size(); ++i) {
    EXPECT_EQ(out[i].content, in[i].content);
    EXPECT_EQ(out[i].start, in[i].start);
    EXPECT_EQ(out[i].end, in[i].end);
    EXPECT_EQ(out[i].props.document_summary.value_or(""), "A short summary.");
    EXPECT_EQ(out[i].props.summary.value_or(""), "A short summary.");
    EXPECT_EQ(out[i].props.contextual_summary.value_or(""), "Context sentence.");
    EXPECT_EQ(out[i].props.keywords, (std::vector<std::string>{"alpha", "beta", "gamma"}));
    EXPECT_TRUE(out[i].props.extra.empty());
  }
  // document summary, then summary + context per chunk
  EXPECT_EQ(completion_.prompts.size(), 5u);
  EXPECT_NE(completion_.prompts[2].find("Document summary: A short summary."), std::string::npos);
  EXPECT_NE(completion_.prompts[2].find("Document: Pump manual"), std::string::npos);
}

TEST_F(EnricherTest, DocumentSummaryKeepsSectionTopic) {
  auto in = chunks();
  for (auto& c : in) {
    c.props.document_topic = "Pump Manual";
    c.props.document_keywords = {"pump", "bar"};
  }
  Enricher enricher(&completion_, options_);
  auto out = enricher.enrich(in, refined()).chunks;

  EXPECT_EQ(out[0].props.document_topic.value_or(""), "Pump Manual");
  EXPECT_EQ(out[0].props.document_summary.value_or(""), "A short summary.");
  EXPECT_EQ(out[0].props.document_keywords, (std::vector<std::string>{"pump", "bar"}));
}

TEST_F(EnricherTest, KeywordsAreLimited) {
  options_.max_keywords = 2;
  Enricher enricher(&completion_, options_);
  auto out = enricher.enrich(chunks(), refined()).chunks;
  EXPECT_EQ(out[0].props.keywords, (std::vector<std::string>{"alpha", "beta"}));
  EXPECT_EQ(out[0].props.document_keywords, (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(EnricherTest, MetadataGoesIntoExtra) {
  options_.summaries = false;
  options_.contextual = false;
  options_.metadata = true;
  Enricher enricher(&completion_, options_);
  auto out = enricher.enrich(chunks(), refined()).chunks;

  EXPECT_EQ(out[1].props.extra.at("entities"), "Acme, Bob");
  EXPECT_EQ(out[1].props.extra.at("categories"), "manual");
  EXPECT_EQ(out[1].props.extra.at("language"), "en");
  EXPECT_EQ(out[1].props.keywords, (std::vector<std::string>{"meta"}));
  EXPECT_FALSE(out[1].props.summary.has_value());
  EXPECT_FALSE(out[1].props.document_summary.has_value());
}

TEST_F(EnricherTest, FailuresAreCountedAndSkipped) {
  completion_.fail = true;
  Enricher enricher(&completion_, options_);
  auto in = chunks();
  auto result = enricher.enrich(in, refined());
  auto& out = result.chunks;

  ASSERT_EQ(out.size(), in.size());
  EXPECT_EQ(result.failures, 5);
  EXPECT_FALSE(out[0].props.summary.has_value());
  EXPECT_FALSE(out[0].props.contextual_summary.has_value());
  EXPECT_EQ(out[0].content, in[0].content);

  completion_.fail = false;
  EXPECT_EQ(enricher.enrich(in, refined()).failures, 0);
  EXPECT_EQ(result.failures, 5);
}

TEST_F(EnricherTest, SharedEnricherAcrossThreads) {
  FailingCompletion failing;
  Enricher enricher(&failing, options_);
  const auto in = chunks();
  const auto doc = refined();
  std::vector<int> failures(4, -1);
  std::vector<std::thread> workers;
  for (size_t i = 0; i < failures.size(); ++i) {
    workers.emplace_back([&, i] { failures[i] = enricher.enrich(in, doc).failures; });
  }
  for (auto& w : workers) w.join();
  for (int f : failures) EXPECT_EQ(f, 5);
}

TEST_F(EnricherTest, UnavailableServiceLeavesChunksAlone) {
  completion_.available = false;
  Enricher enricher(&completion_, options_);
  auto out = enricher.enrich(chunks(), refined()).chunks;
  EXPECT_TRUE(completion_.prompts.empty());
  EXPECT_FALSE(out[0].props.summary.has_value());

  Enricher none(nullptr, options_);
  auto result = none.enrich(chunks(), refined());
  EXPECT_EQ(result.chunks.size(), 2u);
  EXPECT_EQ(result.failures, 0);
}

TEST_F(EnricherTest, CancelStopsEnrichment) {
  Enricher enricher(&completion_, options_);
  CancelToken cancel;
  cancel.cancel();
  EXPECT_THROW(enricher.enrich(chunks(), refined(), cancel), Cancelled);
}

// ============================================================================
// Completion parsing
// ============================================================================

TEST_F(EnricherTest, FirstJsonObjectIgnoresBracesInStrings) {
  EXPECT_EQ(extract_first_json_object(R"(note {"a": "}{", "b": {"c": 1}} trailing })"),
            R"({"a": "}{", "b": {"c": 1}})");
  EXPECT_EQ(extract_first_json_object(R"({"a": "say \"}\""})"), R"({"a": "say \"}\""})");
  EXPECT_EQ(extract_first_json_object("no object here"), "");
  EXPECT_EQ(extract_first_json_object("{\"open\": 1"), "");
}

TEST_F(EnricherTest, ClipKeepsWholeCharacters) {
  std::string korean = "\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4";
  EXPECT_EQ(clip_utf8(korean, 4), "\xED\x95\x9C");
  EXPECT_EQ(clip_utf8(korean, 6), "\xED\x95\x9C\xEA\xB5\xAD");
  EXPECT_EQ(clip_utf8("abc", 10), "abc");
}

TEST_F(EnricherTest, StructureAnalysisIsClamped) {
  completion_.reply =
    R"({"sections": [{"title": " Intro ", "level": 9, "importance": 2}, {"title": ""}, 5], "confidence": 3})";
  auto r = completion_.analyze_structure("Intro\nBody", "MD");
  ASSERT_EQ(r.sections.size(), 1u);
  EXPECT_EQ(r.sections[0].title, "Intro");
  EXPECT_EQ(r.sections[0].level, 6);
  EXPECT_DOUBLE_EQ(r.sections[0].importance, 1.0);
  EXPECT_DOUBLE_EQ(r.confidence, 1.0);
}

TEST_F(EnricherTest, ReplyWithoutJsonThrows) {
  completion_.reply = "I cannot help with that.";
  EXPECT_THROW(completion_.assess_quality("text"), std::runtime_error);
}
