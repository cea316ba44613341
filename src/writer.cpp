#include "writer.hpp"
#include "log.hpp"
#include "serialize.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using std::string;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void make_dir(const string& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw std::runtime_error("writer: cannot create " + dir + ": " + ec.message());
}

string write_file(const string& dir, const string& name, const string& data) {
  string path = (fs::path(dir) / name).string();
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("writer: cannot write " + path);
  out << data;
  if (!out) throw std::runtime_error("writer: write failed for " + path);
  return path;
}

// YAML scalars are quoted when they could be misread.
string yaml_value(const string& s) {
  if (s.empty()) return "\"\"";
  if (s.find_first_of(":#\"'\n{}[],&*?|<>=!%@`") == string::npos && s.front() != ' ' && s.back() != ' ')
    return s;
  return json(s).dump();
}

string fixed2(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

string front_matter(const DocumentChunk& c) {
  string s = "---\n";
  s += "id: " + c.id + "\n";
  s += "index: " + std::to_string(c.index) + "\n";
  s += "start: " + std::to_string(c.start) + "\n";
  s += "end: " + std::to_string(c.end) + "\n";
  s += "strategy: " + yaml_value(c.strategy) + "\n";
  s += "content_type: " + c.content_type + "\n";
  s += "quality: " + fixed2(c.quality_score) + "\n";
  s += "grade: " + c.quality_grade + "\n";
  s += "tokens: " + std::to_string(c.tokens) + "\n";
  if (c.oversized) s += "oversized: true\n";
  if (!c.topic_category.empty()) s += "topic: " + yaml_value(c.topic_category) + "\n";
  if (!c.section_path.empty()) s += "section_path: " + yaml_value(c.section_path) + "\n";
  if (c.props.summary) s += "summary: " + yaml_value(*c.props.summary) + "\n";
  if (!c.props.keywords.empty()) s += "keywords: " + json(c.props.keywords).dump() + "\n";
  s += "---\n\n";
  return s;
}

}  // namespace

string chunk_file_stem(int index, int count) {
  int width = 3;
  for (int n = count; n >= 1000; n /= 10) ++width;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%0*d", width, index + 1);
  return buf;
}

std::vector<string> write_refined(const RefinedContent& refined, const string& dir, const string& format) {
  if (format != "md" && format != "json") throw std::invalid_argument("writer: unknown refine format '" + format + "'");
  make_dir(dir);
  std::vector<string> files;
  if (format == "md") files.push_back(write_file(dir, "content.md", refined.text));
  else files.push_back(write_file(dir, "content.json", json(refined).dump(2)));

  json info = {
    {"raw_id", refined.raw_id},
    {"metadata", refined.metadata},
    {"quality", refined.quality},
    {"info", refined.info},
    {"sections", refined.sections.size()},
    {"structures", refined.structures.size()},
    {"format", format},
    {"files", json::array()},
  };
  for (auto& f : files) info["files"].push_back(fs::path(f).filename().string());
  files.push_back(write_file(dir, "info.json", info.dump(2)));
  log_debug("writer", "refined content written to " + dir);
  return files;
}

std::vector<string> write_chunks(const std::vector<DocumentChunk>& chunks, const string& dir,
                                 const string& format, const RagQualityReport* report) {
  if (format != "md" && format != "json" && format != "jsonl")
    throw std::invalid_argument("writer: unknown chunk format '" + format + "'");
  make_dir(dir);

  std::vector<string> files;
  const int n = (int)chunks.size();
  if (format == "jsonl") {
    string data;
    for (auto& c : chunks) data += json(c).dump() + "\n";
    files.push_back(write_file(dir, "chunks.jsonl", data));
  } else {
    for (auto& c : chunks) {
      string stem = chunk_file_stem(c.index, n);
      if (format == "md") files.push_back(write_file(dir, stem + ".md", front_matter(c) + c.content + "\n"));
      else files.push_back(write_file(dir, stem + ".json", json(c).dump(2)));
    }
  }

  json manifest = {
    {"chunk_count", n},
    {"format", format},
    {"files", json::array()},
  };
  if (!chunks.empty()) {
    manifest["document"] = chunks.front().source;
    manifest["strategy"] = chunks.front().strategy;
    size_t chars = 0;
    int tokens = 0;
    for (auto& c : chunks) {
      chars += c.content.size();
      tokens += c.tokens;
    }
    manifest["total_chars"] = chars;
    manifest["total_tokens"] = tokens;
  }
  for (auto& f : files) manifest["files"].push_back(fs::path(f).filename().string());
  if (report) manifest["quality"] = json::parse(report_to_json(*report));
  files.push_back(write_file(dir, "info.json", manifest.dump(2)));
  log_debug("writer", std::to_string(n) + " chunks written to " + dir);
  return files;
}
