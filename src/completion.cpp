#include "completion.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const size_t kPromptTextLimit = 6000;

json ask_json(CompletionService& svc, const std::string& prompt) {
  std::string reply = svc.generate(prompt);
  std::string obj = extract_first_json_object(reply);
  if (obj.empty()) throw std::runtime_error("completion: reply carried no JSON object");
  try {
    return json::parse(obj);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("completion: bad JSON reply: ") + e.what());
  }
}

std::vector<std::string> strings_of(const json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j.at(key).is_array()) return out;
  for (auto& v : j.at(key)) {
    if (v.is_string()) out.push_back(v.get<std::string>());
  }
  return out;
}

double number_of(const json& j, const char* key, double def = 0) {
  if (!j.contains(key) || !j.at(key).is_number()) return def;
  double v = j.at(key).get<double>();
  return v < 0 ? 0 : (v > 1 ? 1 : v);
}

}  // namespace

StructureAnalysis CompletionService::analyze_structure(const std::string& text, const std::string& doc_type) {
  std::string prompt =
    "Identify the section headings of the following " + doc_type + " document.\n"
    "Return ONLY a single JSON object:\n"
    "{\"sections\": [{\"title\": \"...\", \"level\": 1, \"importance\": 0.5}], \"confidence\": 0.0}\n"
    "- title must be copied exactly from a line of the document.\n"
    "- level is 1 for top-level headings, up to 6.\n\n"
    "Document:\n" + clip_utf8(text, kPromptTextLimit) + "\nJSON:";

  StructureAnalysis r;
  auto j = ask_json(*this, prompt);
  r.raw_response = j.dump();
  r.confidence = number_of(j, "confidence");
  if (j.contains("sections") && j.at("sections").is_array()) {
    for (auto& s : j.at("sections")) {
      if (!s.is_object() || !s.contains("title") || !s.at("title").is_string()) continue;
      SectionHint h;
      h.title = trim(s.at("title").get<std::string>());
      if (s.contains("level") && s.at("level").is_number_integer()) h.level = s.at("level").get<int>();
      h.level = std::max(1, std::min(6, h.level));
      h.importance = number_of(s, "importance");
      if (!h.title.empty()) r.sections.push_back(std::move(h));
    }
  }
  return r;
}

SummaryResult CompletionService::summarize(const std::string& text, int max_length) {
  std::string prompt =
    "Summarize the following text in at most " + std::to_string(max_length) + " characters "
    "and list up to five keywords.\n"
    "Return ONLY a single JSON object:\n"
    "{\"summary\": \"...\", \"keywords\": [\"...\"], \"confidence\": 0.0}\n\n"
    "Text:\n" + clip_utf8(text, kPromptTextLimit) + "\nJSON:";

  SummaryResult r;
  auto j = ask_json(*this, prompt);
  if (j.contains("summary") && j.at("summary").is_string()) r.summary = trim(j.at("summary").get<std::string>());
  if (max_length > 0) r.summary = clip_utf8(r.summary, (size_t)max_length);
  r.keywords = strings_of(j, "keywords");
  r.confidence = number_of(j, "confidence");
  return r;
}

MetadataResult CompletionService::extract_metadata(const std::string& text, const std::string& doc_type) {
  std::string prompt =
    "Extract metadata from the following " + doc_type + " text.\n"
    "Return ONLY a single JSON object:\n"
    "{\"keywords\": [\"...\"], \"entities\": [\"...\"], \"categories\": [\"...\"], "
    "\"language\": \"en\", \"confidence\": 0.0}\n\n"
    "Text:\n" + clip_utf8(text, kPromptTextLimit) + "\nJSON:";

  MetadataResult r;
  auto j = ask_json(*this, prompt);
  r.keywords = strings_of(j, "keywords");
  r.entities = strings_of(j, "entities");
  r.categories = strings_of(j, "categories");
  if (j.contains("language") && j.at("language").is_string()) r.language = j.at("language").get<std::string>();
  r.confidence = number_of(j, "confidence");
  return r;
}

QualityAssessment CompletionService::assess_quality(const std::string& text) {
  std::string prompt =
    "Rate the following text chunk for retrieval use.\n"
    "Return ONLY a single JSON object with scores between 0 and 1:\n"
    "{\"confidence\": 0.0, \"completeness\": 0.0, \"consistency\": 0.0, \"suggestions\": [\"...\"]}\n\n"
    "Text:\n" + clip_utf8(text, kPromptTextLimit) + "\nJSON:";

  QualityAssessment r;
  auto j = ask_json(*this, prompt);
  r.confidence = number_of(j, "confidence");
  r.completeness = number_of(j, "completeness");
  r.consistency = number_of(j, "consistency");
  r.suggestions = strings_of(j, "suggestions");
  return r;
}

std::string extract_first_json_object(const std::string& text) {
  size_t start = text.find('{');
  if (start == std::string::npos) return "";
  int depth = 0;
  bool in_str = false, esc = false;
  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (in_str) {
      if (esc) esc = false;
      else if (c == '\\') esc = true;
      else if (c == '"') in_str = false;
      continue;
    }
    if (c == '"') in_str = true;
    else if (c == '{') depth++;
    else if (c == '}') {
      if (--depth == 0) return text.substr(start, i - start + 1);
    }
  }
  return "";
}

std::string clip_utf8(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t n = max_bytes;
  while (n > 0 && ((unsigned char)s[n] & 0xC0) == 0x80) --n;
  return s.substr(0, n);
}
