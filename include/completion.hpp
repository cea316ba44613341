#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct SectionHint {
  std::string title;
  int level = 1;
  double importance = 0;
};

struct StructureAnalysis {
  std::vector<SectionHint> sections;
  double confidence = 0;
  std::string raw_response;
};

struct SummaryResult {
  std::string summary;
  std::vector<std::string> keywords;
  double confidence = 0;
};

struct MetadataResult {
  std::vector<std::string> keywords;
  std::vector<std::string> entities;
  std::vector<std::string> categories;
  std::string language;
  double confidence = 0;
};

struct QualityAssessment {
  double confidence = 0;
  double completeness = 0;
  double consistency = 0;
  std::vector<std::string> suggestions;
};

// Text-completion collaborator. Implementations provide generate(); the
// structured calls ask for one JSON object and parse the first {...} in the
// reply. Every call may throw std::runtime_error.
class CompletionService {
public:
  virtual ~CompletionService() = default;

  virtual bool is_available() = 0;
  virtual std::string generate(const std::string& prompt) = 0;

  virtual StructureAnalysis analyze_structure(const std::string& text, const std::string& doc_type);
  virtual SummaryResult summarize(const std::string& text, int max_length = 200);
  virtual MetadataResult extract_metadata(const std::string& text, const std::string& doc_type);
  virtual QualityAssessment assess_quality(const std::string& text);
};

struct ImageTextOptions {
  std::string language = "auto";
  std::string image_type_hint;   // chart, table, document, photo
};

struct ImageText {
  std::string text;
  double confidence = 0;
};

class ImageTextService {
public:
  virtual ~ImageTextService() = default;

  virtual bool is_available() = 0;
  virtual ImageText extract_text(const std::vector<uint8_t>& image, const ImageTextOptions& options) = 0;
};

// First balanced {...} in text, ignoring braces inside JSON strings; "" if none.
std::string extract_first_json_object(const std::string& text);

// At most max_bytes of s, cut back to a UTF-8 character boundary.
std::string clip_utf8(const std::string& s, size_t max_bytes);
