#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "store.hpp"

class StoreTest : public ::testing::Test {
protected:
  StoreTest() : store_(":memory:") {}

  DocumentChunk chunk(const std::string& id, int index, const std::string& content) {
    DocumentChunk c;
    c.id = id;
    c.index = index;
    c.start = (size_t)index * 100;
    c.end = c.start + content.size();
    c.content = content;
    c.strategy = "Sentence";
    c.quality_score = 0.8;
    c.completeness = 0.75;
    return c;
  }

  StoredDocument document() {
    RefinedContent r;
    r.raw_id = "raw-1";
    r.text = "Hello world. Second part.";
    r.metadata.file_path = "in/hello.md";
    r.metadata.title = "hello.md";
    r.metadata.file_type = "MD";
    return document_record(r, {chunk("c1", 0, "Hello world.")});
  }

  ChunkStore store_;
};

// ============================================================================
// Documents
// ============================================================================

TEST_F(StoreTest, DocumentRecordIsStablePerPath) {
  auto a = document();
  auto b = document();
  EXPECT_EQ(a.id, b.id);
  EXPECT_EQ(a.file, "in/hello.md");
  EXPECT_EQ(a.chunk_count, 1);
  EXPECT_EQ(a.strategy, "Sentence");
  EXPECT_EQ(a.refined_chars, 25u);
}

// ============================================================================
// Chunks
// ============================================================================

TEST_F(StoreTest, ChunksRoundTrip) {
  auto doc = document();
  store_.upsert_document(doc);

  auto first = chunk("c1", 0, "Hello world.");
  first.props.summary = "A greeting.";
  first.props.keywords = {"hello", "world"};
  first.props.extra["language"] = "en";
  auto second = chunk("c2", 1, "Second part.");
  store_.upsert_chunks(doc.id, {second, first});

  EXPECT_EQ(store_.chunk_count(), 2);

  auto got = store_.get_chunk("c1");
  EXPECT_EQ(got.content, "Hello world.");
  EXPECT_EQ(got.index, 0);
  EXPECT_EQ(got.start, 0u);
  EXPECT_EQ(got.end, 12u);
  EXPECT_EQ(got.strategy, "Sentence");
  EXPECT_DOUBLE_EQ(got.quality_score, 0.8);
  EXPECT_DOUBLE_EQ(got.completeness, 0.75);
  ASSERT_TRUE(got.props.summary.has_value());
  EXPECT_EQ(*got.props.summary, "A greeting.");
  EXPECT_EQ(got.props.keywords, (std::vector<std::string>{"hello", "world"}));
  EXPECT_EQ(got.props.extra.at("language"), "en");

  auto all = store_.chunks_for(doc.id);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, "c1");
  EXPECT_EQ(all[1].id, "c2");
}

TEST_F(StoreTest, UpsertReplacesExistingChunks) {
  auto doc = document();
  store_.upsert_document(doc);
  store_.upsert_chunks(doc.id, {chunk("c1", 0, "old")});
  store_.upsert_chunks(doc.id, {chunk("c1", 0, "new")});
  store_.upsert_document(doc);

  EXPECT_EQ(store_.chunk_count(), 1);
  EXPECT_EQ(store_.get_chunk("c1").content, "new");
}

TEST_F(StoreTest, RechunkingDropsStaleRows) {
  auto doc = document();
  store_.upsert_document(doc);
  store_.upsert_chunks(doc.id, {chunk("c1", 0, "one"), chunk("c2", 1, "two"), chunk("c3", 2, "three")});
  store_.upsert_chunks("other-document", {chunk("o1", 0, "kept")});
  ASSERT_EQ(store_.chunk_count(), 4);

  store_.upsert_chunks(doc.id, {chunk("c9", 0, "one two three")});

  auto all = store_.chunks_for(doc.id);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].id, "c9");
  EXPECT_EQ(store_.chunk_count(), 2);
  EXPECT_THROW(store_.get_chunk("c2"), std::runtime_error);
  EXPECT_EQ(store_.get_chunk("o1").content, "kept");
}

TEST_F(StoreTest, MissingChunkThrows) {
  try {
    store_.get_chunk("nope");
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "store: chunk id not found");
  }
  EXPECT_TRUE(store_.chunks_for("no-such-document").empty());
}

TEST_F(StoreTest, SchemaIsReentrant) {
  store_.ensure_schema();
  store_.ensure_schema();
  EXPECT_EQ(store_.chunk_count(), 0);
}

TEST_F(StoreTest, BadPathFailsToOpen) {
  EXPECT_THROW(ChunkStore("/nonexistent-dir/sub/chunks.db"), std::runtime_error);
}
