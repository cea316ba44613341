#include "quality.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <future>
#include <map>
#include <set>

using json = nlohmann::json;
using std::string;
using std::vector;

namespace {

double clamp01(double v) {
  if (!(v > 0)) return 0;   // also catches NaN
  return v > 1 ? 1 : v;
}

double mean(const vector<double>& v) {
  if (v.empty()) return 0;
  double s = 0;
  for (double x : v) s += x;
  return s / (double)v.size();
}

double ratio(size_t n, size_t total) {
  return total > 0 ? (double)n / (double)total : 0;
}

std::set<string> distinct_terms(const string& s) {
  auto v = extract_terms(s);
  return std::set<string>(v.begin(), v.end());
}

size_t intersection_size(const std::set<string>& a, const std::set<string>& b) {
  size_t n = 0;
  for (auto& t : a) n += b.count(t);
  return n;
}

bool ends_terminal(const string& t) {
  if (t.empty()) return false;
  char c = t.back();
  return c == '.' || c == '!' || c == '?';
}

bool is_complete_sentence(const string& sentence) {
  string t = trim(sentence);
  return t.size() > 10 && (ends_terminal(t) || t.back() == ':');
}

bool is_complete_thought(const string& content) {
  auto sentences = split_sentences(content);
  if (sentences.size() < 2 || content.size() <= 100) return false;
  for (auto& s : sentences) {
    if (!is_complete_sentence(s)) return false;
  }
  return true;
}

bool is_orphaned_fragment(const string& content) {
  string t = trim(content);
  return t.size() < 50 || t.find_first_of(".!?") == string::npos;
}

double sentence_boundary_score(const string& content) {
  string t = trim(content);
  if (t.empty()) return 0;
  double score = 0;
  if (is_upper(t.front())) score += 0.5;
  if (ends_terminal(t)) score += 0.5;
  return score;
}

double continuity(const string& curr) {
  static const char* markers[] = {
    "however", "therefore", "moreover", "furthermore",
    "additionally", "consequently", "thus", "hence"
  };
  string lower = to_lower(curr);
  for (const char* m : markers) {
    if (starts_with(lower, m) || lower.find(string(" ") + m) != string::npos) return 1.0;
  }
  return 0.5;
}

bool leads_with_reference(const string& text) {
  static const RE2 pronoun("(?i)\\b(?:he|she|it|they|this|that|these|those)\\b");
  return RE2::PartialMatch(text.substr(0, std::min<size_t>(100, text.size())), pronoun);
}

double token_density(const string& content) {
  auto words = split_words(content);
  if (words.empty()) return 0;
  size_t meaningful = 0;
  for (auto& w : words) {
    if (w.size() > 3 && !is_stop_word(w)) meaningful++;
  }
  return (double)meaningful / (double)words.size();
}

double similarity(const string& a, const string& b) {
  auto ta = distinct_terms(a), tb = distinct_terms(b);
  if (ta.empty() || tb.empty()) return 0;
  size_t inter = intersection_size(ta, tb);
  return (double)inter / (double)(ta.size() + tb.size() - inter);
}

double redundancy(const string& content) {
  auto sentences = split_sentences(content);
  size_t n = sentences.size();
  if (n < 2) return 0;
  double sum = 0;
  for (size_t i = 0; i + 1 < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      double s = similarity(sentences[i], sentences[j]);
      if (s > 0.7) sum += s;
    }
  }
  return sum / (double)(n * (n - 1) / 2);
}

double entropy(const vector<string>& chunks) {
  std::map<string, size_t> freq;
  size_t total = 0;
  for (auto& c : chunks) {
    for (auto& t : extract_terms(c)) {
      freq[t]++;
      total++;
    }
  }
  if (freq.size() <= 1) return 0;
  double h = 0;
  for (auto& kv : freq) {
    double p = (double)kv.second / (double)total;
    h -= p * std::log2(p);
  }
  return h / std::log2((double)freq.size());
}

size_t fence_count(const string& content) {
  size_t n = 0;
  for (auto& line : split_lines(content)) {
    if (starts_with(trim_start(line), "```")) n++;
  }
  return n;
}

size_t bullet_items(const string& content) {
  static const RE2 bullet("(?m)^[*\\-+]\\s+.+$");
  return (size_t)count_matches(bullet, content);
}

bool has_complete_header(const string& content) {
  static const RE2 atx("(?m)^#{1,6}\\s+.+$");
  static const RE2 setext("(?m)^.+\\n[=-]+$");
  return RE2::PartialMatch(content, atx) || RE2::PartialMatch(content, setext);
}

bool has_complete_list(const string& content) {
  static const RE2 numbered("(?m)^\\d+\\.\\s+.+$");
  return bullet_items(content) + (size_t)count_matches(numbered, content) >= 2;
}

bool has_complete_table(const string& content) {
  static const RE2 table("\\|.+\\|.*\\n\\|[-:\\s|]+\\|");
  return RE2::PartialMatch(content, table);
}

bool has_broken_structure(const string& content) {
  return fence_count(content) % 2 == 1 || bullet_items(content) == 1;
}

bool is_self_contained(const string& content) {
  static const RE2 leading("(?i)^(?:he|she|it|they|this|that|these|those)\\b");
  return is_complete_thought(content) && !RE2::PartialMatch(trim(content), leading);
}

bool is_keyword_rich(const string& content) {
  auto terms = extract_terms(content);
  std::set<string> unique(terms.begin(), terms.end());
  return unique.size() > 10 && (double)unique.size() / (double)terms.size() > 0.2;
}

double summary_quality(const string& content) {
  auto sentences = split_sentences(content);
  if (sentences.empty()) return 0;
  const string& first = sentences.front();
  double score = 0;
  if (first.size() > 20 && first.size() < 200) score += 0.3;
  if (is_complete_sentence(first)) score += 0.3;
  if (sentences.size() == 1) return score + 0.4;

  vector<string> rest(sentences.begin() + 1, sentences.end());
  auto rest_terms = distinct_terms(join(rest, " "));
  if (!rest_terms.empty()) {
    score += 0.4 * (double)intersection_size(distinct_terms(first), rest_terms) / (double)rest_terms.size();
  }
  return score;
}

double query_match_potential(const string& content) {
  static const RE2 wh("(?i)\\b(?:what|when|where|who|why|how)\\b");
  static const RE2 definition("(?i)\\bis\\b.*\\b(?:defined as|refers to|means)\\b");
  static const RE2 proper("\\b[A-Z][a-z]+\\b");
  static const RE2 number("\\b\\d+\\b");
  double score = 0;
  if (RE2::PartialMatch(content, wh)) score += 0.2;
  if (RE2::PartialMatch(content, definition)) score += 0.2;
  if (extract_terms(content).size() > 20) score += 0.2;
  if (count_matches(proper, content) > 2) score += 0.2;
  if (count_matches(number, content) > 2) score += 0.2;
  return std::min(1.0, score);
}

bool has_clean_start(const string& content) {
  string t = trim_start(content);
  if (t.empty()) return false;
  if (is_upper(t.front()) || t.front() == '#') return true;
  size_t d = 0;
  while (d < t.size() && std::isdigit((unsigned char)t[d])) ++d;
  return d > 0 && d < t.size() && t[d] == '.';
}

bool has_clean_end(const string& content) {
  string t = trim_end(content);
  return ends_terminal(t) || ends_with(t, "```");
}

vector<string> contents_of(const vector<DocumentChunk>& chunks) {
  vector<string> out;
  out.reserve(chunks.size());
  for (auto& c : chunks) out.push_back(c.content);
  return out;
}

}  // namespace

// ---------- overlap ----------

size_t overlap_length(const string& prev, const string& curr, size_t min_len) {
  size_t n = std::min<size_t>(256, std::min(prev.size(), curr.size()));
  if (min_len == 0) min_len = 1;
  for (; n >= min_len; --n) {
    if (prev.compare(prev.size() - n, n, curr, 0, n) == 0) return n;
  }
  return 0;
}

double overlap_quality(const string& prev, const string& curr) {
  size_t n = overlap_length(prev, curr, 21);
  if (n == 0) return 0;
  size_t expected = std::min<size_t>(128, std::min(prev.size(), curr.size()) / 4);
  if (expected == 0) expected = 1;
  double score = std::min(1.0, (double)n / (double)expected);
  // overlap that carries a sentence boundary gets a 1.2x bonus
  if (curr.substr(0, n).find_first_of(".!?") != string::npos) score = std::min(1.0, score * 1.2);
  return score;
}

// ---------- metrics ----------

SemanticCompleteness semantic_completeness(const vector<string>& chunks) {
  SemanticCompleteness m;
  if (chunks.empty()) return m;
  vector<double> sentence_ratios, boundaries;
  size_t thoughts = 0, orphans = 0;
  for (auto& raw : chunks) {
    string content = trim(raw);
    auto sentences = split_sentences(content);
    size_t complete = 0;
    for (auto& s : sentences) complete += is_complete_sentence(s) ? 1 : 0;
    sentence_ratios.push_back(ratio(complete, sentences.size()));
    if (is_complete_thought(content)) thoughts++;
    if (is_orphaned_fragment(content)) orphans++;
    boundaries.push_back(sentence_boundary_score(content));
  }
  m.complete_sentence_ratio = clamp01(mean(sentence_ratios));
  m.complete_thought_ratio = ratio(thoughts, chunks.size());
  m.orphaned_fragment_ratio = ratio(orphans, chunks.size());
  m.average_boundary_score = clamp01(mean(boundaries));
  m.overall_score = clamp01(m.complete_sentence_ratio * 0.3 + m.complete_thought_ratio * 0.3 +
                            (1 - m.orphaned_fragment_ratio) * 0.2 + m.average_boundary_score * 0.2);
  return m;
}

ContextPreservation context_preservation(const vector<string>& chunks) {
  ContextPreservation m;
  if (chunks.size() < 2) {
    m.overall_score = 1.0;
    return m;
  }
  vector<double> overlaps, continuities, references;
  for (size_t i = 1; i < chunks.size(); ++i) {
    overlaps.push_back(overlap_quality(chunks[i - 1], chunks[i]));
    continuities.push_back(continuity(chunks[i]));
    references.push_back(leads_with_reference(chunks[i]) ? 0.5 : 1.0);
  }

  vector<double> windows;
  vector<std::set<string>> terms;
  for (auto& c : chunks) terms.push_back(distinct_terms(c));
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (terms[i].empty()) { windows.push_back(0); continue; }
    std::set<string> around;
    size_t lo = i >= 2 ? i - 2 : 0, hi = std::min(chunks.size() - 1, i + 2);
    for (size_t k = lo; k <= hi; ++k) {
      if (k != i) around.insert(terms[k].begin(), terms[k].end());
    }
    windows.push_back((double)intersection_size(terms[i], around) / (double)terms[i].size());
  }

  m.average_overlap_score = clamp01(mean(overlaps));
  m.continuity_score = clamp01(mean(continuities));
  m.reference_preservation_score = clamp01(mean(references));
  m.context_window_coverage = clamp01(mean(windows));
  m.overall_score = clamp01(m.average_overlap_score * 0.3 + m.continuity_score * 0.3 +
                            m.reference_preservation_score * 0.2 + m.context_window_coverage * 0.2);
  return m;
}

InformationDensity information_density(const vector<string>& chunks) {
  InformationDensity m;
  vector<double> densities, redundancies, uniques;
  size_t all_terms = 0;
  for (auto& c : chunks) {
    densities.push_back(token_density(c));
    redundancies.push_back(redundancy(c));
    auto terms = extract_terms(c);
    std::set<string> unique(terms.begin(), terms.end());
    uniques.push_back(ratio(unique.size(), terms.size()));
    all_terms += terms.size();
  }
  if (all_terms == 0) return m;
  m.average_token_density = clamp01(mean(densities));
  m.redundancy_score = clamp01(mean(redundancies));
  m.unique_term_ratio = clamp01(mean(uniques));
  m.information_entropy = clamp01(entropy(chunks));
  m.overall_score = clamp01(m.average_token_density * 0.3 + (1 - m.redundancy_score) * 0.3 +
                            m.unique_term_ratio * 0.2 + m.information_entropy * 0.2);
  return m;
}

StructuralIntegrity structural_integrity(const vector<string>& chunks) {
  StructuralIntegrity m;
  size_t headers = 0, lists = 0, code = 0, tables = 0, broken = 0;
  for (auto& c : chunks) {
    if (has_complete_header(c)) headers++;
    if (has_complete_list(c)) lists++;
    if (fence_count(c) >= 2) code++;
    if (has_complete_table(c)) tables++;
    if (has_broken_structure(c)) broken++;
  }
  size_t n = chunks.size();
  size_t total = headers + lists + code + tables;
  m.header_preservation = ratio(headers, n);
  m.list_preservation = ratio(lists, n);
  m.code_block_preservation = ratio(code, n);
  m.table_preservation = ratio(tables, n);
  m.broken_structure_ratio = ratio(broken, n);
  m.has_broken_structure = broken > 0;
  m.overall_score = total > 0 ? clamp01(((double)total - (double)broken) / (double)total)
                              : clamp01(1.0 - m.broken_structure_ratio);
  return m;
}

RetrievalReadiness retrieval_readiness(const vector<string>& chunks) {
  RetrievalReadiness m;
  if (chunks.empty()) return m;
  size_t self_contained = 0, rich = 0;
  vector<double> summaries, queries;
  for (auto& c : chunks) {
    if (is_self_contained(c)) self_contained++;
    if (is_keyword_rich(c)) rich++;
    summaries.push_back(summary_quality(c));
    queries.push_back(query_match_potential(c));
  }
  m.self_contained_ratio = ratio(self_contained, chunks.size());
  m.keyword_richness = ratio(rich, chunks.size());
  m.average_summary_quality = clamp01(mean(summaries));
  m.query_match_potential = clamp01(mean(queries));
  m.overall_score = clamp01(m.self_contained_ratio * 0.3 + m.keyword_richness * 0.2 +
                            m.average_summary_quality * 0.25 + m.query_match_potential * 0.25);
  return m;
}

BoundaryQuality boundary_quality(const vector<string>& chunks) {
  BoundaryQuality m;
  if (chunks.size() < 2) {
    m.overall_score = 1.0;
    return m;
  }
  size_t starts = 0, ends = 0;
  vector<double> transitions;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (has_clean_start(chunks[i])) starts++;
    if (has_clean_end(chunks[i])) ends++;
    if (i + 1 < chunks.size()) {
      double t = overlap_quality(chunks[i], chunks[i + 1]) * 0.4 + continuity(chunks[i + 1]) * 0.3;
      if (has_clean_end(chunks[i])) t += 0.15;
      if (has_clean_start(chunks[i + 1])) t += 0.15;
      transitions.push_back(t);
    }
  }
  m.clean_start_ratio = ratio(starts, chunks.size());
  m.clean_end_ratio = ratio(ends, chunks.size());
  m.transition_quality = clamp01(mean(transitions));
  m.overall_score = clamp01(m.clean_start_ratio * 0.35 + m.clean_end_ratio * 0.35 + m.transition_quality * 0.30);
  return m;
}

ContentCoverage content_coverage(const vector<string>& chunks, const string& original) {
  ContentCoverage m;
  if (original.empty()) return m;
  string combined = join(chunks, " ");
  m.coverage_ratio = clamp01((double)combined.size() / (double)original.size());

  size_t original_sentences = split_sentences(original).size();
  if (original_sentences > 0) {
    double found = (double)split_sentences(combined).size();
    m.missing_section_ratio = clamp01(1.0 - found / (double)original_sentences);
  }

  std::map<string, size_t> seen;
  for (auto& c : chunks) seen[c]++;
  size_t dup = 0;
  for (auto& c : chunks) dup += seen[c] > 1 ? 1 : 0;
  m.duplication_ratio = ratio(dup, chunks.size());

  m.overall_score = clamp01(std::min(1.0, m.coverage_ratio) * (1 - m.missing_section_ratio) *
                            (1 - m.duplication_ratio));
  return m;
}

// ---------- report ----------

double composite_score(const RagQualityReport& r, const QualityWeights& w) {
  const std::pair<double, double> parts[] = {
    {r.semantic.overall_score, w.semantic},
    {r.context.overall_score, w.context},
    {r.density.overall_score, w.density},
    {r.structure.overall_score, w.structure},
    {r.retrieval.overall_score, w.retrieval},
    {r.boundary.overall_score, w.boundary},
  };
  double sum = 0, total = 0;
  for (auto& p : parts) {
    if (p.second <= 0) continue;
    sum += p.first * p.second;
    total += p.second;
  }
  return total > 0 ? clamp01(sum / total) : 0;
}

vector<string> recommendations_for(const RagQualityReport& r) {
  vector<string> out;
  if (r.semantic.orphaned_fragment_ratio > 0.2)
    out.push_back("High ratio of orphaned fragments detected. Consider increasing chunk size or improving boundary detection.");
  if (r.semantic.complete_sentence_ratio < 0.7)
    out.push_back("Many chunks lack complete sentences. Adjust chunking strategy to preserve sentence boundaries.");
  if (r.total_chunks > 1 && r.context.average_overlap_score < 0.3)
    out.push_back("Low overlap between chunks. Increase overlap size to improve context preservation.");
  if (r.total_chunks > 1 && r.context.reference_preservation_score < 0.5)
    out.push_back("Poor reference preservation. Consider using semantic-aware chunking strategies.");
  if (r.density.redundancy_score > 0.3)
    out.push_back("High redundancy detected. Optimize chunking to reduce duplicate information.");
  if (r.density.average_token_density < 0.5)
    out.push_back("Low information density. Consider filtering or preprocessing to remove filler content.");
  if (r.structure.broken_structure_ratio > 0.1)
    out.push_back("Broken structures detected. Use structure-aware chunking for documents with lists, tables, or code blocks.");
  if (r.retrieval.self_contained_ratio < 0.6)
    out.push_back("Many chunks are not self-contained. Adjust strategy to create more independent chunks.");
  if (r.retrieval.keyword_richness < 0.5)
    out.push_back("Low keyword richness. Consider preprocessing to enhance searchable terms.");
  if (r.total_chunks > 1 && r.boundary.transition_quality < 0.5)
    out.push_back("Poor transitions between chunks. Improve boundary detection algorithms.");
  if (r.composite_score < 0.6)
    out.push_back("Overall quality below threshold. Consider the Semantic chunking strategy with tuned sizes.");
  if (out.empty())
    out.push_back("Quality metrics are satisfactory. Current configuration is well-optimized for RAG.");
  return out;
}

RagQualityReport QualityAnalyzer::analyze(const vector<DocumentChunk>& chunks, const string& original) const {
  RagQualityReport r;
  r.total_chunks = (int)chunks.size();
  const vector<string> contents = contents_of(chunks);

  if (parallel_ && contents.size() > 1) {
    auto semantic = std::async(std::launch::async, semantic_completeness, std::cref(contents));
    auto context = std::async(std::launch::async, context_preservation, std::cref(contents));
    auto density = std::async(std::launch::async, information_density, std::cref(contents));
    auto structure = std::async(std::launch::async, structural_integrity, std::cref(contents));
    auto retrieval = std::async(std::launch::async, retrieval_readiness, std::cref(contents));
    auto boundary = std::async(std::launch::async, boundary_quality, std::cref(contents));
    r.semantic = semantic.get();
    r.context = context.get();
    r.density = density.get();
    r.structure = structure.get();
    r.retrieval = retrieval.get();
    r.boundary = boundary.get();
  } else {
    r.semantic = semantic_completeness(contents);
    r.context = context_preservation(contents);
    r.density = information_density(contents);
    r.structure = structural_integrity(contents);
    r.retrieval = retrieval_readiness(contents);
    r.boundary = boundary_quality(contents);
  }
  if (!original.empty()) r.coverage = content_coverage(contents, original);

  r.composite_score = composite_score(r, weights_);
  r.recommendations = recommendations_for(r);
  return r;
}

std::string report_to_json(const RagQualityReport& r, int indent) {
  json j;
  j["total_chunks"] = r.total_chunks;
  j["composite_score"] = r.composite_score;
  j["semantic_completeness"] = {
    {"complete_sentence_ratio", r.semantic.complete_sentence_ratio},
    {"complete_thought_ratio", r.semantic.complete_thought_ratio},
    {"orphaned_fragment_ratio", r.semantic.orphaned_fragment_ratio},
    {"average_boundary_score", r.semantic.average_boundary_score},
    {"overall_score", r.semantic.overall_score},
  };
  j["context_preservation"] = {
    {"average_overlap_score", r.context.average_overlap_score},
    {"continuity_score", r.context.continuity_score},
    {"reference_preservation_score", r.context.reference_preservation_score},
    {"context_window_coverage", r.context.context_window_coverage},
    {"overall_score", r.context.overall_score},
  };
  j["information_density"] = {
    {"average_token_density", r.density.average_token_density},
    {"redundancy_score", r.density.redundancy_score},
    {"unique_term_ratio", r.density.unique_term_ratio},
    {"information_entropy", r.density.information_entropy},
    {"overall_score", r.density.overall_score},
  };
  j["structural_integrity"] = {
    {"header_preservation", r.structure.header_preservation},
    {"list_preservation", r.structure.list_preservation},
    {"code_block_preservation", r.structure.code_block_preservation},
    {"table_preservation", r.structure.table_preservation},
    {"broken_structure_ratio", r.structure.broken_structure_ratio},
    {"has_broken_structure", r.structure.has_broken_structure},
    {"overall_score", r.structure.overall_score},
  };
  j["retrieval_readiness"] = {
    {"self_contained_ratio", r.retrieval.self_contained_ratio},
    {"keyword_richness", r.retrieval.keyword_richness},
    {"average_summary_quality", r.retrieval.average_summary_quality},
    {"query_match_potential", r.retrieval.query_match_potential},
    {"overall_score", r.retrieval.overall_score},
  };
  j["boundary_quality"] = {
    {"clean_start_ratio", r.boundary.clean_start_ratio},
    {"clean_end_ratio", r.boundary.clean_end_ratio},
    {"transition_quality", r.boundary.transition_quality},
    {"overall_score", r.boundary.overall_score},
  };
  if (r.coverage) {
    j["content_coverage"] = {
      {"coverage_ratio", r.coverage->coverage_ratio},
      {"missing_section_ratio", r.coverage->missing_section_ratio},
      {"duplication_ratio", r.coverage->duplication_ratio},
      {"overall_score", r.coverage->overall_score},
    };
  }
  j["recommendations"] = r.recommendations;
  return j.dump(indent);
}
