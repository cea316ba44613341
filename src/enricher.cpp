#include "enricher.hpp"
#include "log.hpp"
#include "text.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

std::vector<std::string> first_n(const std::vector<std::string>& v, int n) {
  if (n <= 0 || (int)v.size() <= n) return v;
  return std::vector<std::string>(v.begin(), v.begin() + n);
}

std::string context_prompt(const RefinedContent& refined, const std::string& doc_summary, const std::string& chunk) {
  std::string p;
  p.reserve(1024 + chunk.size());
  p.append("Situate the chunk below within its document in one or two sentences.\n");
  p.append("Reply with the sentences only.\n\n");
  if (!refined.metadata.title.empty()) p.append("Document: " + refined.metadata.title + "\n");
  if (!doc_summary.empty()) p.append("Document summary: " + doc_summary + "\n");
  p.append("\nChunk:\n");
  p.append(clip_utf8(chunk, 4000));
  p.append("\nContext:");
  return p;
}

}  // namespace

EnrichResult Enricher::enrich(const std::vector<DocumentChunk>& chunks, const RefinedContent& refined,
                              const CancelToken& cancel) const {
  EnrichResult result;
  result.chunks = chunks;
  if (!completion_ || chunks.empty()) return result;
  int& failures = result.failures;

  // One collaborator call; failures other than cancellation are logged and counted.
  auto attempt = [&](const std::string& what, const auto& call) {
    try {
      call();
      return true;
    } catch (const Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      ++failures;
      log_warn("enricher", what + " failed: " + e.what());
      return false;
    }
  };

  bool available = false;
  attempt("availability check", [&] { available = completion_->is_available(); });
  if (!available) {
    log_info("enricher", "completion service unavailable, chunks left as produced");
    return result;
  }

  std::vector<DocumentChunk>& out = result.chunks;

  std::string doc_summary;
  if (options_.summaries) {
    attempt("document summary", [&] {
      SummaryResult r = completion_->summarize(refined.text, options_.max_summary_length);
      doc_summary = trim(r.summary);
      auto keywords = first_n(r.keywords, options_.max_keywords);
      for (auto& c : out) {
        if (!doc_summary.empty()) c.props.document_summary = doc_summary;
        if (!keywords.empty() && c.props.document_keywords.empty()) c.props.document_keywords = keywords;
      }
    });
  }

  for (auto& c : out) {
    cancel.check();
    const std::string where = "chunk " + std::to_string(c.index);

    if (options_.summaries) {
      attempt(where + " summary", [&] {
        SummaryResult r = completion_->summarize(c.content, options_.max_summary_length);
        std::string s = trim(r.summary);
        if (!s.empty()) c.props.summary = s;
        if (!r.keywords.empty()) c.props.keywords = first_n(r.keywords, options_.max_keywords);
      });
    }

    if (options_.contextual) {
      attempt(where + " context", [&] {
        std::string s = trim(completion_->generate(context_prompt(refined, doc_summary, c.content)));
        if (!s.empty()) c.props.contextual_summary = clip_utf8(s, (size_t)std::max(1, options_.max_summary_length * 2));
      });
    }

    if (options_.metadata) {
      attempt(where + " metadata", [&] {
        MetadataResult r = completion_->extract_metadata(c.content, refined.metadata.file_type);
        if (!r.entities.empty()) c.props.extra["entities"] = join(r.entities, ", ");
        if (!r.categories.empty()) c.props.extra["categories"] = join(r.categories, ", ");
        if (!r.language.empty()) c.props.extra["language"] = r.language;
        if (c.props.keywords.empty() && !r.keywords.empty()) c.props.keywords = first_n(r.keywords, options_.max_keywords);
      });
    }
  }

  if (failures > 0) log_warn("enricher", std::to_string(failures) + " enrichment calls skipped");
  return result;
}
