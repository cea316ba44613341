#include "serialize.hpp"

using json = nlohmann::json;

namespace {

template <class T>
void read(const json& j, const char* key, T& dst) {
  if (j.contains(key) && !j.at(key).is_null()) dst = j.at(key).get<T>();
}

template <class T>
void read_opt(const json& j, const char* key, std::optional<T>& dst) {
  if (j.contains(key) && !j.at(key).is_null()) dst = j.at(key).get<T>();
}

template <class T>
void write_opt(json& j, const char* key, const std::optional<T>& v) {
  if (v) j[key] = *v;
}

}  // namespace

// ---------- chunks ----------

void to_json(json& j, const ChunkProps& p) {
  j = json::object();
  write_opt(j, "document_topic", p.document_topic);
  write_opt(j, "document_summary", p.document_summary);
  if (!p.document_keywords.empty()) j["document_keywords"] = p.document_keywords;
  write_opt(j, "summary", p.summary);
  write_opt(j, "contextual_summary", p.contextual_summary);
  if (!p.keywords.empty()) j["keywords"] = p.keywords;
  if (!p.extra.empty()) j["extra"] = p.extra;
}

void from_json(const json& j, ChunkProps& p) {
  read_opt(j, "document_topic", p.document_topic);
  read_opt(j, "document_summary", p.document_summary);
  read(j, "document_keywords", p.document_keywords);
  read_opt(j, "summary", p.summary);
  read_opt(j, "contextual_summary", p.contextual_summary);
  read(j, "keywords", p.keywords);
  read(j, "extra", p.extra);
}

void to_json(json& j, const SourceInfo& s) {
  j = json{
    {"source_id", s.source_id},
    {"source_type", s.source_type},
    {"title", s.title},
    {"file_path", s.file_path},
    {"chunk_count", s.chunk_count},
    {"word_count", s.word_count},
    {"language", s.language},
  };
}

void to_json(json& j, const DocumentChunk& c) {
  j = json{
    {"id", c.id},
    {"index", c.index},
    {"start", c.start},
    {"end", c.end},
    {"strategy", c.strategy},
    {"content_type", c.content_type},
    {"content", c.content},
    {"quality_score", c.quality_score},
    {"completeness", c.completeness},
    {"sentence_integrity", c.sentence_integrity},
    {"coherence", c.coherence},
    {"quality_grade", c.quality_grade},
    {"importance", c.importance},
    {"relevance_score", c.relevance_score},
    {"density", c.density},
    {"tokens", c.tokens},
    {"oversized", c.oversized},
    {"topic_category", c.topic_category},
    {"domain", to_string(c.domain)},
    {"props", c.props},
    {"source", c.source},
  };
  if (!c.section_path.empty()) j["section_path"] = c.section_path;
}

// ---------- refined content ----------

void to_json(json& j, const Section& s) {
  j = json{{"id", s.id}, {"title", s.title}, {"level", s.level}, {"start", s.start}, {"end", s.end}};
}

void to_json(json& j, const StructuredElement& s) {
  j = json{
    {"type", to_string(s.type())},
    {"caption", s.caption},
    {"start", s.start},
    {"end", s.end},
  };
  if (!s.source_chunk_id.empty()) j["source_chunk_id"] = s.source_chunk_id;
  if (auto* code = std::get_if<CodeData>(&s.data)) {
    j["data"] = {{"language", code->language}, {"content", code->content}};
  } else if (auto* table = std::get_if<TableRows>(&s.data)) {
    j["data"] = {{"headers", table->headers}, {"rows", table->rows}};
  } else if (auto* list = std::get_if<ListData>(&s.data)) {
    j["data"] = {{"items", list->items}, {"ordered", list->ordered}};
  }
}

void to_json(json& j, const DocumentMetadata& m) {
  j = json{
    {"file_name", m.file_name},
    {"file_type", m.file_type},
    {"file_path", m.file_path},
    {"file_size", m.file_size},
    {"title", m.title},
    {"created_at", m.created_at},
    {"modified_at", m.modified_at},
  };
}

void to_json(json& j, const RefinementQuality& q) {
  j = json{
    {"original_chars", q.original_chars},
    {"refined_chars", q.refined_chars},
    {"structure_score", q.structure_score},
    {"cleanup_score", q.cleanup_score},
    {"retention_score", q.retention_score},
    {"confidence_score", q.confidence_score},
    {"overall", q.overall()},
  };
}

void to_json(json& j, const RefinementInfo& i) {
  j = json{
    {"refiner", i.refiner},
    {"used_llm", i.used_llm},
    {"duration_ms", i.duration_ms},
    {"warnings", i.warnings},
  };
}

void to_json(json& j, const RefinedContent& r) {
  j = json{
    {"raw_id", r.raw_id},
    {"text", r.text},
    {"sections", r.sections},
    {"structures", r.structures},
    {"metadata", r.metadata},
    {"quality", r.quality},
    {"info", r.info},
  };
}

// ---------- extraction input ----------

void from_json(const json& j, TableData& t) {
  read(j, "cells", t.cells);
  read(j, "headers", t.headers);
  read(j, "has_header", t.has_header);
  if (j.contains("alignments") && j.at("alignments").is_array()) {
    for (auto& a : j.at("alignments")) t.alignments.push_back(alignment_from(a.get<std::string>()));
  }
  read(j, "confidence", t.confidence);
  read(j, "has_merged_cells", t.has_merged_cells);
  read(j, "page_number", t.page_number);
  read_opt(j, "top", t.top);
  read_opt(j, "position", t.position);
  read(j, "plain_text_fallback", t.plain_text_fallback);
}

void from_json(const json& j, TextBlock& b) {
  read(j, "content", b.content);
  if (j.contains("type") && j.at("type").is_string()) b.type = block_type_from(j.at("type").get<std::string>());
  read_opt(j, "heading_level", b.heading_level);
  read(j, "list_level", b.list_level);
  read(j, "ordered", b.ordered);
  read(j, "language", b.language);
  read(j, "page_number", b.page_number);
  read(j, "order", b.order);
  if (j.contains("location") && j.at("location").is_object()) {
    const json& l = j.at("location");
    BoundingBox box;
    read(l, "left", box.left);
    read(l, "top", box.top);
    read(l, "right", box.right);
    read(l, "bottom", box.bottom);
    b.location = box;
  }
}

void from_json(const json& j, ImageInfo& i) {
  read(j, "id", i.id);
  read(j, "mime_type", i.mime_type);
  read(j, "data", i.data);
  read(j, "external_ref", i.external_ref);
  read(j, "caption", i.caption);
  read_opt(j, "position", i.position);
  read_opt(j, "page_number", i.page_number);
  read_opt(j, "width", i.width);
  read_opt(j, "height", i.height);
  read_opt(j, "bounds_bottom", i.bounds_bottom);
  if (j.contains("properties") && j.at("properties").is_object()) {
    for (auto& kv : j.at("properties").items()) {
      i.properties[kv.key()] = kv.value().is_string() ? kv.value().get<std::string>() : kv.value().dump();
    }
  }
}

void from_json(const json& j, FileMetadata& f) {
  read(j, "name", f.name);
  read(j, "extension", f.extension);
  read(j, "path", f.path);
  read(j, "size", f.size);
  read(j, "created_at", f.created_at);
  read(j, "modified_at", f.modified_at);
}

void from_json(const json& j, RawContent& r) {
  read(j, "id", r.id);
  read(j, "text", r.text);
  read(j, "tables", r.tables);
  read(j, "blocks", r.blocks);
  read(j, "images", r.images);
  read(j, "file", r.file);
  read(j, "warnings", r.warnings);
}
