#pragma once
#include "document.hpp"
#include <string>
#include <vector>

struct StoredDocument {
  std::string id;
  std::string file;
  std::string title;
  std::string file_type;
  size_t refined_chars = 0;
  int chunk_count = 0;
  std::string strategy;
};

// Document row for a refined file and its chunks; id is stable per file path.
StoredDocument document_record(const RefinedContent& refined, const std::vector<DocumentChunk>& chunks);

// SQLite persistence of documents and chunks. A stored chunk keeps its
// content, offsets, strategy, quality, completeness and props.
class ChunkStore {
public:
  explicit ChunkStore(const std::string& sqlite_path);
  ~ChunkStore();
  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;

  void ensure_schema();
  void upsert_document(const StoredDocument& doc);
  // Replaces the document's stored chunks in one transaction; nothing changes
  // if any insert fails.
  void upsert_chunks(const std::string& document_id, const std::vector<DocumentChunk>& chunks);

  DocumentChunk get_chunk(const std::string& id) const;
  std::vector<DocumentChunk> chunks_for(const std::string& document_id) const;
  int chunk_count() const;

private:
  struct Impl;
  Impl* impl_;
};
