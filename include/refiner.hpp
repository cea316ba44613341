#pragma once
#include "cancel.hpp"
#include "completion.hpp"
#include "config.hpp"
#include "document.hpp"
#include "markdown.hpp"
#include <string>
#include <vector>

// RawContent -> RefinedContent. Each step is optional and degrades to a
// warning; only invalid input or an unexpected failure raises ProcessingError.
class Refiner {
public:
  explicit Refiner(MarkdownConverter* converter = nullptr, ImageTextService* images = nullptr)
    : converter_(converter), images_(images) {}

  RefinedContent refine(const RawContent& raw, const RefineOptions& options,
                        const CancelToken& cancel = CancelToken()) const;

private:
  MarkdownConverter* converter_;
  ImageTextService* images_;
};

// "# Paragraph N" headings, image placeholder lines, runs of blank lines and
// of inner spaces.
std::string clean_noise(const std::string& text);

std::string remove_page_artifacts(const std::string& text, bool headers_footers,
                                  bool page_numbers, bool table_of_contents);

// 1. -> H2, 1-2. -> H3, 1-2-3. -> H4, circled and (N) numerals -> H3.
std::string promote_numbered_sections(const std::string& text);

std::string normalize_whitespace(const std::string& text);

// Fenced code, pipe tables and 3+ line lists with offsets into text.
std::vector<StructuredElement> extract_structures(const std::string& text);
StructuredElement table_structure(const TableData& table);

std::vector<Section> build_sections(const std::string& text);

double structure_score(bool has_structures, bool has_sections);
double cleanup_score(size_t original_chars, size_t refined_chars);
double retention_score(size_t original_chars, size_t refined_chars);
