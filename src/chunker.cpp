#include "chunker.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "refiner.hpp"
#include "text.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_set>

using std::string;

// ---------- strategy names ----------

ChunkStrategy parse_strategy(const string& name) {
  static const std::map<string, ChunkStrategy> names = {
    {"auto", ChunkStrategy::Auto},
    {"sentence", ChunkStrategy::Sentence},
    {"paragraph", ChunkStrategy::Paragraph},
    {"token", ChunkStrategy::Token},
    {"semantic", ChunkStrategy::Semantic},
    {"hierarchical", ChunkStrategy::Hierarchical},
    {"smart", ChunkStrategy::Sentence},
    {"intelligent", ChunkStrategy::Semantic},
    {"fixedsize", ChunkStrategy::Token},
    {"pagelevel", ChunkStrategy::Paragraph},
  };
  auto it = names.find(to_lower(trim(name)));
  if (it == names.end()) throw StrategyError(name);
  return it->second;
}

const char* to_string(ChunkStrategy s) {
  switch (s) {
    case ChunkStrategy::Auto:         return "Auto";
    case ChunkStrategy::Sentence:     return "Sentence";
    case ChunkStrategy::Paragraph:    return "Paragraph";
    case ChunkStrategy::Token:        return "Token";
    case ChunkStrategy::Semantic:     return "Semantic";
    case ChunkStrategy::Hierarchical: return "Hierarchical";
  }
  return "Auto";
}

// ---------- spans ----------

namespace {

const size_t npos = string::npos;

Span trim_span(const string& text, size_t s, size_t e) {
  while (s < e && is_space(text[s])) ++s;
  while (e > s && is_space(text[e - 1])) --e;
  return Span{s, e};
}

bool is_fence(const string& line) {
  auto t = trim_start(line);
  return starts_with(t, "```") || starts_with(t, "~~~");
}

int heading_level(const string& line) {
  size_t n = 0;
  while (n < line.size() && line[n] == '#') ++n;
  if (n == 0 || n > 6 || n >= line.size()) return 0;
  return (line[n] == ' ' || line[n] == '\t') ? (int)n : 0;
}

// Does the line starting at pos open a markdown block (heading, list, quote, table)?
bool starts_block(const string& text, size_t pos, size_t end) {
  while (pos < end && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
  if (pos >= end) return false;
  char c = text[pos];
  if (c == '#' || c == '>' || c == '|') return true;
  if ((c == '-' || c == '*' || c == '+') && pos + 1 < end && (text[pos + 1] == ' ' || text[pos + 1] == '\t')) return true;
  size_t d = pos;
  while (d < end && std::isdigit((unsigned char)text[d])) ++d;
  return d > pos && d + 1 < end && (text[d] == '.' || text[d] == ')') && text[d + 1] == ' ';
}

bool is_abbreviation(const string& text, size_t sentence_start, size_t dot) {
  static const std::unordered_set<string> abbr = {
    "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st", "vs", "etc", "e.g", "i.e",
    "inc", "ltd", "co", "no", "fig", "approx", "dept", "est", "vol", "pp", "u.s", "cf", "al"
  };
  size_t w = dot;
  while (w > sentence_start && (std::isalnum((unsigned char)text[w - 1]) || text[w - 1] == '.')) --w;
  if (w == dot) return false;
  if (dot - w == 1) return is_upper(text[w]);   // initials: "J. Smith"
  return abbr.count(to_lower(text.substr(w, dot - w))) > 0;
}

}  // namespace

std::vector<Span> paragraph_spans(const string& text, size_t begin, size_t end) {
  std::vector<Span> out;
  end = std::min(end, text.size());
  size_t cur_s = npos, cur_e = 0;
  bool in_code = false;
  auto flush = [&]() {
    if (cur_s == npos) return;
    auto sp = trim_span(text, cur_s, cur_e);
    if (sp.end > sp.start) out.push_back(sp);
    cur_s = npos;
  };

  size_t ls = begin;
  while (ls < end) {
    size_t le = text.find('\n', ls);
    if (le == npos || le > end) le = end;
    string line = text.substr(ls, le - ls);
    bool fence = is_fence(line);
    if (in_code) {
      cur_e = le;
      if (fence) { in_code = false; flush(); }
    } else if (fence) {
      flush();
      cur_s = ls; cur_e = le;
      in_code = true;
    } else if (is_blank(line)) {
      flush();
    } else if (heading_level(trim_start(line)) > 0) {
      flush();
      cur_s = ls; cur_e = le;
      flush();
    } else {
      if (cur_s == npos) cur_s = ls;
      cur_e = le;
    }
    ls = le + 1;
  }
  flush();
  return out;
}

std::vector<Span> sentence_spans(const string& text, size_t begin, size_t end) {
  std::vector<Span> out;
  end = std::min(end, text.size());
  auto push = [&](size_t a, size_t b) {
    auto sp = trim_span(text, a, b);
    if (sp.end > sp.start) out.push_back(sp);
  };

  size_t s = begin;
  for (size_t i = begin; i < end; ++i) {
    char c = text[i];
    if (c == '\n') {
      if (i + 1 < end && starts_block(text, i + 1, end)) { push(s, i); s = i + 1; }
      continue;
    }
    if (c == '.' || c == '!' || c == '?') {
      size_t k = i + 1;
      while (k < end && (text[k] == '"' || text[k] == '\'' || text[k] == ')')) ++k;
      if (k < end && !is_space(text[k])) continue;
      if (c == '.' && is_abbreviation(text, s, i)) continue;
      push(s, k);
      s = k;
      i = k - 1;
      continue;
    }
    // U+3002 ideographic full stop
    if ((unsigned char)c == 0xE3 && i + 2 < end &&
        (unsigned char)text[i + 1] == 0x80 && (unsigned char)text[i + 2] == 0x82) {
      push(s, i + 3);
      s = i + 3;
      i += 2;
    }
  }
  push(s, end);
  return out;
}

std::vector<Span> word_spans(const string& text, size_t begin, size_t end, size_t max_len) {
  std::vector<Span> out;
  end = std::min(end, text.size());
  size_t i = begin;
  while (i < end) {
    while (i < end && is_space(text[i])) ++i;
    if (i >= end) break;
    size_t j = i;
    while (j < end && !is_space(text[j])) ++j;
    size_t a = i;
    while (max_len > 0 && j - a > max_len) {
      size_t cut = a + max_len;
      while (cut > a && ((unsigned char)text[cut] & 0xC0) == 0x80) --cut;
      if (cut == a) cut = a + max_len;
      out.push_back(Span{a, cut});
      a = cut;
    }
    out.push_back(Span{a, j});
    i = j;
  }
  return out;
}

// ---------- auto resolution ----------

ChunkStrategy resolve_auto(const string& text, const ChunkOptions& o) {
  int headings = 0;
  bool code = false, table = false, in_code = false;
  for (auto& line : split_lines(text)) {
    if (is_fence(line)) { code = true; in_code = !in_code; continue; }
    if (in_code) continue;
    auto t = trim(line);
    if (heading_level(t) > 0) headings++;
    if (t.size() >= 2 && t.front() == '|' && t.back() == '|') table = true;
  }
  size_t max = (size_t)std::max(1, o.max_chunk_size);
  if (headings >= 3 && text.size() > max) return ChunkStrategy::Hierarchical;
  if (code || table) return ChunkStrategy::Paragraph;
  if (text.size() <= max) return ChunkStrategy::Sentence;
  if (paragraph_spans(text, 0, text.size()).size() >= 5) return ChunkStrategy::Semantic;
  return ChunkStrategy::Sentence;
}

// ---------- units and packing ----------

namespace {

struct Unit {
  size_t s = 0;
  size_t e = 0;
  int group = -1;          // paragraph index, -1 when not grouped
  bool heading = false;
  int level = 0;
  bool code = false;
  bool hard_break = false; // no chunk spans the boundary before this unit
  size_t size() const { return e - s; }
};

struct Piece {
  size_t start = 0;
  size_t end = 0;
  bool oversized = false;
  bool starts_hard = false;
};

std::set<string> term_set(const string& s) {
  auto v = extract_terms(s);
  return std::set<string>(v.begin(), v.end());
}

double jaccard(const std::set<string>& a, const std::set<string>& b) {
  if (a.empty() && b.empty()) return 1.0;
  size_t inter = 0;
  for (auto& t : b) inter += a.count(t);
  return (double)inter / (double)(a.size() + b.size() - inter);
}

class UnitBuilder {
public:
  UnitBuilder(const string& text, const ChunkOptions& o)
    : text_(text), o_(o), max_((size_t)o.max_chunk_size) {}

  std::vector<Unit> build(ChunkStrategy st, const CancelToken& cancel) {
    if (st == ChunkStrategy::Token) {
      for (auto& w : word_spans(text_, 0, text_.size(), max_)) add(w, -1);
      return units_;
    }
    auto paras = paragraph_spans(text_, 0, text_.size());
    for (size_t g = 0; g < paras.size(); ++g) {
      cancel.check();
      const Span& p = paras[g];
      if (st == ChunkStrategy::Sentence) {
        if (is_code(p)) { add(p, (int)g); continue; }
        for (auto& s : sentence_spans(text_, p.start, p.end)) add_sentence(s, (int)g);
      } else {
        add_paragraph(p, (int)g);
      }
    }
    if (st == ChunkStrategy::Hierarchical) {
      for (auto& u : units_) u.hard_break = u.heading && u.level <= o_.max_heading_level;
    } else if (st == ChunkStrategy::Semantic) {
      mark_topic_shifts();
    }
    return units_;
  }

private:
  bool is_code(const Span& sp) const { return is_fence(text_.substr(sp.start, std::min<size_t>(sp.size(), 8))); }

  void add(const Span& sp, int group) {
    Unit u;
    u.s = sp.start;
    u.e = sp.end;
    u.group = group;
    string body = text_.substr(sp.start, sp.size());
    u.code = is_fence(body);
    if (body.find('\n') == npos) {
      u.level = heading_level(body);
      u.heading = u.level > 0;
    }
    units_.push_back(u);
  }

  void add_sentence(const Span& s, int group) {
    if (s.size() > max_ && !o_.preserve_sentences) {
      for (auto& w : word_spans(text_, s.start, s.end, max_)) add(w, group);
    } else {
      add(s, group);
    }
  }

  void add_paragraph(const Span& p, int group) {
    if (p.size() <= max_ || is_code(p)) { add(p, group); return; }
    for (auto& s : sentence_spans(text_, p.start, p.end)) add_sentence(s, group);
  }

  // Break before headings, and where a unit shares little vocabulary with a
  // group that already reached the target size.
  void mark_topic_shifts() {
    size_t target = (size_t)o_.target();
    size_t gs = 0, prev_end = 0;
    std::set<string> terms;
    bool open = false;
    for (auto& u : units_) {
      auto t = term_set(text_.substr(u.s, u.size()));
      if (open) {
        bool shift = prev_end - gs >= target && !t.empty() && jaccard(terms, t) < 0.1;
        if (u.heading || shift || u.e - gs > max_) {
          u.hard_break = u.heading || shift;
          gs = u.s;
          terms = t;
          prev_end = u.e;
          continue;
        }
      } else {
        open = true;
        gs = u.s;
      }
      terms.insert(t.begin(), t.end());
      prev_end = u.e;
    }
  }

  const string& text_;
  const ChunkOptions& o_;
  size_t max_;
  std::vector<Unit> units_;
};

std::vector<Piece> pack(const std::vector<Unit>& u, const ChunkOptions& o, const CancelToken& cancel) {
  std::vector<Piece> out;
  const size_t n = u.size();
  const size_t max = (size_t)o.max_chunk_size;
  const size_t overlap = (size_t)std::max(0, o.overlap_size);

  size_t i = 0;
  long prev_last = -1;
  while (i < n) {
    cancel.check();
    size_t j = i;
    while (j + 1 < n && !u[j + 1].hard_break && u[j + 1].e - u[i].s <= max) ++j;

    if (j + 1 < n && j > i) {
      size_t b = j;
      // keep a paragraph that fits in one chunk together
      if (o.preserve_paragraphs && u[j].group >= 0 && u[j + 1].group == u[j].group) {
        size_t g = j;
        while (g > i && u[g - 1].group == u[j].group) --g;
        size_t ge = j + 1;
        while (ge + 1 < n && u[ge + 1].group == u[j].group) ++ge;
        if (g > i && u[ge].e - u[g].s <= max) b = g - 1;
      }
      while (b > i && u[b].heading) --b;
      if ((long)b > prev_last) j = b;
    }

    out.push_back(Piece{u[i].s, u[j].e, j == i && u[i].size() > max, u[i].hard_break});
    prev_last = (long)j;
    if (j + 1 >= n) break;

    size_t k = j + 1;
    if (overlap > 0 && !u[j + 1].hard_break) {
      for (size_t c = i + 1; c <= j; ++c) {
        if (u[j].e - u[c].s <= overlap) { k = c; break; }
      }
      // the overlapped chunk must still reach past this one
      if (k <= j && u[j + 1].e - u[k].s > max) k = j + 1;
    }
    i = k;
  }

  if (out.size() >= 2) {
    Piece& last = out.back();
    Piece& prev = out[out.size() - 2];
    if (!last.starts_hard && last.end - last.start < (size_t)std::max(0, o.min_chunk_size) &&
        last.end - prev.start <= max) {
      prev.end = last.end;
      prev.oversized = prev.oversized || last.oversized;
      out.pop_back();
    }
  }
  return out;
}

std::optional<string> document_topic(const RefinedContent& r, const std::vector<Section>& sections) {
  for (auto& s : sections) {
    if (s.level == 1) return s.title;
  }
  if (!sections.empty()) return sections.front().title;
  if (!r.metadata.title.empty()) return r.metadata.title;
  return std::nullopt;
}

string section_path_at(const std::vector<Section>& sections, size_t pos, int max_level) {
  std::vector<const Section*> stack;
  for (auto& s : sections) {
    if (s.start > pos) break;
    if (s.level > max_level) continue;
    while (!stack.empty() && stack.back()->level >= s.level) stack.pop_back();
    stack.push_back(&s);
  }
  std::vector<string> titles;
  for (auto* s : stack) titles.push_back(s->title);
  return join(titles, " > ");
}

string enclosing_title(const std::vector<Section>& sections, size_t pos) {
  string title;
  for (auto& s : sections) {
    if (s.start > pos) break;
    title = s.title;
  }
  return title;
}

double importance_of(const string& content, int index, const string& type) {
  double v = 0.5;
  int best = 0;
  for (auto& line : split_lines(content)) {
    int lv = heading_level(trim(line));
    if (lv > 0 && (best == 0 || lv < best)) best = lv;
  }
  if (best > 0) v += 0.2;
  if (best > 0 && best <= 2) v += 0.1;
  if (index == 0) v += 0.1;
  if (type == "code" || type == "table") v += 0.1;
  return std::min(1.0, v);
}

double density_of(const string& content) {
  if (content.empty()) return 0;
  size_t solid = 0;
  for (char c : content) solid += is_space(c) ? 0 : 1;
  return (double)solid / (double)content.size();
}

string file_identity(const RefinedContent& r) {
  if (!r.metadata.file_path.empty()) return r.metadata.file_path;
  if (!r.metadata.file_name.empty()) return r.metadata.file_name;
  return r.raw_id;
}

}  // namespace

// ---------- Chunker ----------

std::vector<DocumentChunk> Chunker::chunk(const RefinedContent& refined, const ChunkOptions& o,
                                          const CancelToken& cancel) const {
  const ChunkStrategy requested = parse_strategy(o.strategy);
  const string file = file_identity(refined);
  try {
    if (o.max_chunk_size <= 0) throw std::invalid_argument("max_chunk_size must be positive");
    if (o.min_chunk_size < 0 || o.overlap_size < 0) throw std::invalid_argument("chunk sizes must not be negative");

    const string& text = refined.text;
    if (is_blank(text)) return {};

    ChunkStrategy st = requested == ChunkStrategy::Auto ? resolve_auto(text, o) : requested;
    string label = requested == ChunkStrategy::Auto ? string("Auto(") + to_string(st) + ")" : to_string(st);

    auto units = UnitBuilder(text, o).build(st, cancel);
    auto pieces = pack(units, o, cancel);

    auto sections = refined.sections.empty() ? build_sections(text) : refined.sections;
    auto keywords = top_terms(text, 5);
    auto topic = document_topic(refined, sections);
    auto domain = detect_domain(text);

    SourceInfo src;
    src.source_id = refined.raw_id;
    src.source_type = refined.metadata.file_type.empty() ? "TEXT" : refined.metadata.file_type;
    src.title = refined.metadata.title;
    src.file_path = refined.metadata.file_path;
    src.chunk_count = (int)pieces.size();
    src.word_count = (int)split_words(text).size();
    src.language = contains_hangul(text) ? "ko" : "en";

    std::vector<DocumentChunk> out;
    out.reserve(pieces.size());
    for (size_t k = 0; k < pieces.size(); ++k) {
      cancel.check();
      const Piece& p = pieces[k];
      DocumentChunk c;
      c.index = (int)k;
      c.start = p.start;
      c.end = p.end;
      c.content = text.substr(p.start, p.end - p.start);
      c.id = hash_id(file + ":" + std::to_string(k) + ":" + std::to_string(p.start));
      c.strategy = label;
      c.oversized = p.oversized;
      c.content_type = content_type_of(c.content);

      c.completeness = completeness_score(c.content);
      c.sentence_integrity = sentence_integrity(c.content);
      c.coherence = coherence_score(c.content);
      c.quality_score = (c.completeness + c.sentence_integrity + c.coherence) / 3.0;
      c.quality_grade = quality_grade(c.quality_score);
      c.importance = importance_of(c.content, c.index, c.content_type);
      c.density = density_of(c.content);
      c.tokens = estimate_tokens(c.content);

      if (!keywords.empty()) {
        auto terms = term_set(c.content);
        size_t hit = 0;
        for (auto& kw : keywords) hit += terms.count(kw);
        c.relevance_score = (double)hit / (double)keywords.size();
      }

      c.domain = domain;
      c.topic_category = enclosing_title(sections, p.start);
      if (st == ChunkStrategy::Hierarchical) c.section_path = section_path_at(sections, p.start, o.max_heading_level);
      c.props.document_topic = topic;
      c.props.document_keywords = keywords;
      c.source = src;
      out.push_back(std::move(c));
    }
    log_debug("chunker", file + ": " + std::to_string(out.size()) + " chunks (" + label + ")");
    return out;
  } catch (const Cancelled&) {
    throw;
  } catch (const std::exception& e) {
    throw ProcessingError(file, "chunk", string("Chunking failed: ") + e.what());
  }
}

std::vector<StructuredElement> link_structures(const std::vector<StructuredElement>& structures,
                                               const std::vector<DocumentChunk>& chunks) {
  std::vector<StructuredElement> out = structures;
  if (chunks.empty()) return out;
  for (auto& s : out) {
    if (s.start == 0 && s.end == 0) { s.source_chunk_id = chunks.front().id; continue; }
    const DocumentChunk* hit = nullptr;
    for (auto& c : chunks) {
      if (c.start <= s.start && s.start < c.end) { hit = &c; break; }
      if (c.start <= s.start) hit = &c;
    }
    if (hit) s.source_chunk_id = hit->id;
  }
  return out;
}

// ---------- scoring ----------

double completeness_score(const string& content) {
  string t = trim(content);
  if (t.empty()) return 0;
  char first = t.front(), last = t.back();
  int f = 0;
  if (last == '.' || last == '!' || last == '?' || ends_with(t, "\xE3\x80\x82")) f++;
  if (is_upper(first) || first == '#' || std::isdigit((unsigned char)first) || (unsigned char)first >= 0x80) f++;
  bool broken = ends_with(t, "...") || std::isalpha((unsigned char)last) || last == ',';
  if (!broken) f++;
  if (t.size() >= 100) f++;
  return f / 4.0;
}

double sentence_integrity(const string& content) {
  string t = trim(content);
  if (t.empty()) return 0;
  if (t.find("...") != npos || t.find("\xE2\x80\xA6") != npos) return 0.5;
  char last = t.back();
  bool clean = last == '.' || last == '!' || last == '?' || last == ':' || last == '|' ||
               last == ')' || last == '"' || ends_with(t, "```") || ends_with(t, "\xE3\x80\x82");
  return clean ? 1.0 : 0.3;
}

double coherence_score(const string& content) {
  std::map<string, int> counts;
  for (auto& w : split_words(to_lower(content))) {
    size_t a = 0, b = w.size();
    while (a < b && std::ispunct((unsigned char)w[a])) ++a;
    while (b > a && std::ispunct((unsigned char)w[b - 1])) --b;
    if (b - a > 3) counts[w.substr(a, b - a)]++;
  }
  if (counts.empty()) return 0;
  size_t repeated = 0;
  for (auto& kv : counts) repeated += kv.second >= 2 ? 1 : 0;
  return (double)repeated / (double)counts.size();
}

string quality_grade(double score) {
  if (score >= 0.9) return "A";
  if (score >= 0.8) return "B";
  if (score >= 0.7) return "C";
  if (score >= 0.6) return "D";
  return "F";
}

string content_type_of(const string& content) {
  string t = trim(content);
  if (starts_with(t, "```") || starts_with(t, "~~~")) return "code";
  string first = split_lines(t)[0];
  if (starts_with(first, "|")) return "table";
  if (heading_level(first) > 0 && t.find('\n') == npos) return "heading";
  static const RE2 list_item("\\s*(?:[-*+]|\\d+\\.)\\s+.*");
  if (RE2::FullMatch(first, list_item)) return "list";
  return "text";
}

DocumentDomain detect_domain(const string& text) {
  static const std::unordered_set<string> technical = {
    "api", "function", "class", "system", "server", "code", "algorithm", "database",
    "software", "implementation", "configuration", "module", "interface", "protocol", "network"
  };
  static const std::unordered_set<string> business = {
    "revenue", "market", "customer", "sales", "strategy", "profit", "business",
    "management", "investment", "budget", "stakeholder"
  };
  static const std::unordered_set<string> academic = {
    "research", "study", "hypothesis", "analysis", "theory", "methodology",
    "experiment", "literature", "abstract", "conclusion", "references"
  };
  int t = 0, b = 0, a = 0;
  for (auto& term : extract_terms(text)) {
    t += (int)technical.count(term);
    b += (int)business.count(term);
    a += (int)academic.count(term);
  }
  int best = std::max(t, std::max(b, a));
  if (best < 3) return DocumentDomain::General;
  if (t == best) return DocumentDomain::Technical;
  if (b == best) return DocumentDomain::Business;
  return DocumentDomain::Academic;
}

std::vector<string> top_terms(const string& text, size_t n) {
  std::map<string, int> counts;
  for (auto& t : extract_terms(text)) counts[t]++;
  std::vector<std::pair<string, int>> v(counts.begin(), counts.end());
  std::stable_sort(v.begin(), v.end(), [](const std::pair<string, int>& x, const std::pair<string, int>& y) {
    return x.second > y.second;
  });
  std::vector<string> out;
  for (size_t i = 0; i < v.size() && i < n; ++i) out.push_back(v[i].first);
  return out;
}
