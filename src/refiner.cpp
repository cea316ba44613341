#include "refiner.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "normalizer.hpp"
#include "text.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <stdexcept>

namespace {

bool is_fence(const std::string& line) {
  auto t = trim_start(line);
  return starts_with(t, "```") || starts_with(t, "~~~");
}

// Byte offset of the start of every line; one extra entry for text.size() + 1.
std::vector<size_t> line_starts(const std::string& text) {
  std::vector<size_t> v{0};
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') v.push_back(i + 1);
  }
  v.push_back(text.size() + 1);
  return v;
}

const std::vector<const RE2*>& header_footer_res() {
  static const RE2 page("(?i)^page\\s+\\d+\\s*(of\\s+\\d+)?$");
  static const RE2 slash("^\\d+\\s*/\\s*\\d+$");
  static const RE2 dashed("^-\\s*\\d+\\s*-$");
  static const RE2 bracket("^\\[\\s*\\d+\\s*\\]$");
  static const RE2 ko_page("^페이지\\s*\\d+");
  static const RE2 ko_page2("^\\d+\\s*페이지$");
  static const RE2 stamp("(?i)^(confidential|draft|internal|proprietary|secret)$");
  static const RE2 copy_sign("^©\\s*\\d{4}");
  static const RE2 copyright("(?i)^copyright\\s+");
  static const RE2 rights("(?i)^all rights reserved");
  static const RE2 version("(?i)^(version|rev\\.|revision)\\s*[\\d.]+$");
  static const RE2 date("^\\d{4}[-/]\\d{2}[-/]\\d{2}$");
  static const RE2 doc_id("(?i)^(document|doc)\\s*(id|#|no\\.?):\\s*");
  static const RE2 rule("^[-_=]{3,}\\s*$");
  static const RE2 box_rule("^[─━═]{3,}\\s*$");
  static const std::vector<const RE2*> all = {
    &page, &slash, &dashed, &bracket, &ko_page, &ko_page2, &stamp, &copy_sign,
    &copyright, &rights, &version, &date, &doc_id, &rule, &box_rule
  };
  return all;
}

bool is_header_footer_line(const std::string& t) {
  if (t.empty()) return false;
  for (auto* re : header_footer_res()) {
    if (RE2::PartialMatch(t, *re)) return true;
  }
  return false;
}

// Lines that open or close at least three form-feed separated pages.
std::vector<std::string> repeated_page_lines(const std::string& text) {
  auto pages = split_lines(replace_all(text, "\f", "\n\f\n"));
  std::vector<std::vector<std::string>> split;
  std::vector<std::string> cur;
  for (auto& l : pages) {
    if (l == "\f") { split.push_back(cur); cur.clear(); continue; }
    if (!is_blank(l)) cur.push_back(trim(l));
  }
  split.push_back(cur);
  if (split.size() < 3) return {};

  std::map<std::string, int> seen;
  for (auto& p : split) {
    std::vector<std::string> edge;
    for (size_t i = 0; i < p.size() && i < 2; ++i) edge.push_back(p[i]);
    for (size_t i = p.size() >= 2 ? p.size() - 2 : 0; i < p.size(); ++i) edge.push_back(p[i]);
    std::sort(edge.begin(), edge.end());
    edge.erase(std::unique(edge.begin(), edge.end()), edge.end());
    for (auto& e : edge) seen[e]++;
  }
  std::vector<std::string> out;
  for (auto& kv : seen) {
    if (kv.second >= 3) out.push_back(kv.first);
  }
  return out;
}

std::string run_step(const char* step, const std::string& text, std::vector<std::string>& warnings,
                     std::string (*fn)(const std::string&)) {
  try {
    return fn(text);
  } catch (const Cancelled&) {
    throw;
  } catch (const std::exception& e) {
    std::string w = std::string(step) + " skipped: " + e.what();
    log_warn("refiner", w);
    warnings.push_back(w);
    return text;
  }
}

std::string file_identity(const RawContent& raw) {
  if (!raw.file.path.empty()) return raw.file.path;
  if (!raw.file.name.empty()) return raw.file.name;
  return raw.id;
}

void validate(const RawContent& raw) {
  for (size_t i = 0; i < raw.tables.size(); ++i) {
    const auto& t = raw.tables[i];
    if (!t.cells.empty() && t.alignments.size() > t.column_count()) {
      throw std::invalid_argument("table " + std::to_string(i) + " has " +
                                  std::to_string(t.alignments.size()) + " alignments for " +
                                  std::to_string(t.column_count()) + " columns");
    }
  }
}

DocumentMetadata metadata_of(const FileMetadata& f) {
  DocumentMetadata m;
  m.file_name = f.name;
  std::string ext = f.extension;
  if (starts_with(ext, ".")) ext = ext.substr(1);
  for (auto& c : ext) c = (char)std::toupper((unsigned char)c);
  m.file_type = ext;
  m.file_path = f.path;
  m.file_size = f.size;
  m.title = f.name;
  m.created_at = f.created_at;
  m.modified_at = f.modified_at;
  return m;
}

std::vector<std::string> split_table_row(const std::string& line) {
  std::vector<std::string> out;
  for (auto& cell : split_lines(replace_all(trim(line), "|", "\n"))) {
    if (!cell.empty()) out.push_back(trim(cell));
  }
  return out;
}

}  // namespace

// ---------- text passes ----------

std::string clean_noise(const std::string& text) {
  static const RE2 paragraph_heading("(?mi)^#{1,6}[ \\t]*Paragraph[ \\t]+\\d+[ \\t]*$");
  static const RE2 image_placeholder("(?mi)^\\[(?:그림|Figure|Image|이미지|사진|도표|표)\\].*$");
  static const RE2 inner_spaces("(\\S)[ \\t]{2,}");
  static const RE2 blank_runs("\\n{3,}");

  std::string s = regex_replace(text, paragraph_heading, "");
  s = regex_replace(s, image_placeholder, "");

  auto lines = split_lines(s);
  bool in_code = false;
  for (auto& l : lines) {
    if (is_fence(l)) { in_code = !in_code; continue; }
    if (!in_code) RE2::GlobalReplace(&l, inner_spaces, "\\1 ");
  }
  s = join(lines, "\n");
  return regex_replace(s, blank_runs, "\n\n");
}

std::string remove_page_artifacts(const std::string& text, bool headers_footers,
                                  bool page_numbers, bool table_of_contents) {
  static const RE2 page_number("^-?\\s*\\d+\\s*-?$");
  static const RE2 dot_leader("(?m)\\.{3,}[ \\t]*\\d+[ \\t]*$");
  static const RE2 dash_leader("(?m)-{3,}[ \\t]*\\d+[ \\t]*$");
  static const RE2 bullet_leader("(?m)[·•]{3,}[ \\t]*\\d+[ \\t]*$");
  static const RE2 underscore_leader("(?m)_{3,}[ \\t]*\\d+[ \\t]*$");

  std::string s = headers_footers ? replace_all(text, "\f", "\n") : text;
  auto repeated = headers_footers ? repeated_page_lines(text) : std::vector<std::string>();

  // Fenced code is left as written, like the other cleanup passes.
  std::vector<std::string> kept;
  bool in_code = false;
  for (auto& l : split_lines(s)) {
    if (is_fence(l)) {
      in_code = !in_code;
      kept.push_back(l);
      continue;
    }
    if (in_code) {
      kept.push_back(l);
      continue;
    }
    auto t = trim(l);
    if (headers_footers) {
      if (is_header_footer_line(t)) continue;
      if (!t.empty() && std::binary_search(repeated.begin(), repeated.end(), t)) continue;
    }
    if (page_numbers && RE2::FullMatch(t, page_number)) continue;
    std::string line = l;
    if (table_of_contents) {
      line = regex_replace(line, dot_leader, "");
      line = regex_replace(line, dash_leader, "");
      line = regex_replace(line, bullet_leader, "");
      line = regex_replace(line, underscore_leader, "");
    }
    kept.push_back(line);
  }
  return join(kept, "\n");
}

std::string promote_numbered_sections(const std::string& text) {
  static const RE2 h4("\\d+-\\d+-\\d+\\.\\s+\\S.*");
  static const RE2 h3("\\d+-\\d+\\.\\s+\\S.*");
  static const RE2 h2("\\d+\\.\\s+\\S.*");
  static const RE2 circled("[①-⑳]\\s*\\S.*");
  static const RE2 paren("\\(\\d+\\)\\s+\\S.*");
  static const RE2 list_marker("\\s*(?:[-*+]|\\d+\\.)\\s+.*");

  auto lines = split_lines(text);
  auto is_list = [&](size_t i) { return i < lines.size() && RE2::FullMatch(lines[i], list_marker); };

  bool in_code = false;
  std::vector<std::string> out = lines;
  for (size_t i = 0; i < lines.size(); ++i) {
    const auto& l = lines[i];
    if (is_fence(l)) { in_code = !in_code; continue; }
    if (in_code || l.empty() || is_space(l[0])) continue;
    std::string t = trim(l);
    if (starts_with(t, "#")) continue;

    if (RE2::FullMatch(t, h4)) { out[i] = "#### " + t; continue; }
    if (RE2::FullMatch(t, h3)) { out[i] = "### " + t; continue; }
    bool short_line = t.size() <= 80;
    if (RE2::FullMatch(t, h2)) {
      char last = t.back();
      bool adjacent = (i > 0 && is_list(i - 1)) || is_list(i + 1);
      if (short_line && !adjacent && last != '.' && last != ',' && last != ';' && last != ':') {
        out[i] = "## " + t;
      }
      continue;
    }
    if (short_line && (RE2::FullMatch(t, circled) || RE2::FullMatch(t, paren))) out[i] = "### " + t;
  }
  return join(out, "\n");
}

std::string normalize_whitespace(const std::string& text) {
  static const RE2 blank_runs("\\n\\s*\\n\\s*\\n");
  static const RE2 trailing("(?m)[ \\t]+$");
  std::string s = text;
  // one pass can leave a new run where two replacements meet
  while (RE2::GlobalReplace(&s, blank_runs, "\n\n") > 0) {}
  RE2::GlobalReplace(&s, trailing, "");
  return trim(s);
}

// ---------- structures and sections ----------

StructuredElement table_structure(const TableData& t) {
  TableRows rows;
  size_t first_row = 0;
  rows.headers = resolve_table_headers(t, first_row);
  for (size_t r = first_row; r < t.cells.size(); ++r) {
    std::map<std::string, std::string> row;
    for (size_t c = 0; c < rows.headers.size() && c < t.cells[r].size(); ++c) {
      row[rows.headers[c]] = t.cells[r][c];
    }
    rows.rows.push_back(std::move(row));
  }
  StructuredElement e;
  e.caption = "Table (" + std::to_string(rows.rows.size()) + " rows)";
  e.data = std::move(rows);
  return e;
}

std::vector<StructuredElement> extract_structures(const std::string& text) {
  static const RE2 fence_lang("(?:```|~~~)\\s*(\\w+)?.*");
  static const RE2 table_row("\\|.+\\|\\s*");
  static const RE2 table_sep("\\|[-:\\s|]+\\|\\s*");
  static const RE2 list_item("[ \\t]*(?:[-*+]|\\d+\\.)[ \\t]+.+");
  static const RE2 list_marker("^\\s*(?:[-*+]|\\d+\\.)\\s*");
  static const RE2 ordered("^\\s*\\d+\\.");

  auto lines = split_lines(text);
  auto starts = line_starts(text);
  auto line_end = [&](size_t i) { return starts[i] + lines[i].size(); };

  std::vector<bool> code(lines.size(), false);
  std::vector<StructuredElement> codes, tables, lists;

  for (size_t i = 0; i < lines.size(); ++i) {
    if (!is_fence(lines[i])) continue;
    size_t j = i + 1;
    while (j < lines.size() && !is_fence(lines[j])) ++j;
    if (j >= lines.size()) break;   // unclosed fence

    std::string lang;
    RE2::FullMatch(trim(lines[i]), fence_lang, &lang);
    CodeData d;
    d.language = lang.empty() ? "text" : lang;
    std::vector<std::string> body(lines.begin() + (long)i + 1, lines.begin() + (long)j);
    d.content = trim(join(body, "\n"));

    StructuredElement e;
    e.caption = "Code block (" + d.language + ")";
    e.data = std::move(d);
    e.start = starts[i];
    e.end = line_end(j);
    codes.push_back(std::move(e));
    for (size_t k = i; k <= j; ++k) code[k] = true;
    i = j;
  }

  for (size_t i = 0; i + 2 < lines.size(); ++i) {
    if (code[i] || !RE2::FullMatch(lines[i], table_row) || !RE2::FullMatch(lines[i + 1], table_sep)) continue;
    size_t j = i + 2;
    while (j < lines.size() && !code[j] && RE2::FullMatch(lines[j], table_row)) ++j;
    if (j == i + 2) continue;

    TableRows t;
    t.headers = split_table_row(lines[i]);
    for (size_t r = i + 2; r < j; ++r) {
      auto cells = split_table_row(lines[r]);
      std::map<std::string, std::string> row;
      for (size_t c = 0; c < t.headers.size() && c < cells.size(); ++c) row[t.headers[c]] = cells[c];
      t.rows.push_back(std::move(row));
    }
    StructuredElement e;
    e.caption = "Table (" + std::to_string(t.rows.size()) + " rows)";
    e.data = std::move(t);
    e.start = starts[i];
    e.end = line_end(j - 1);
    tables.push_back(std::move(e));
    i = j - 1;
  }

  for (size_t i = 0; i < lines.size(); ++i) {
    if (code[i] || !RE2::FullMatch(lines[i], list_item)) continue;
    size_t j = i;
    while (j < lines.size() && !code[j] && RE2::FullMatch(lines[j], list_item)) ++j;
    if (j - i >= 3) {
      ListData d;
      d.ordered = RE2::PartialMatch(lines[i], ordered);
      for (size_t k = i; k < j; ++k) d.items.push_back(regex_replace(trim(lines[k]), list_marker, ""));
      StructuredElement e;
      e.caption = std::string(d.ordered ? "Ordered" : "Unordered") + " list (" +
                  std::to_string(d.items.size()) + " items)";
      e.data = std::move(d);
      e.start = starts[i];
      e.end = line_end(j - 1);
      lists.push_back(std::move(e));
    }
    i = j - 1;
  }

  std::vector<StructuredElement> out;
  for (auto* v : {&codes, &tables, &lists}) {
    for (auto& e : *v) out.push_back(std::move(e));
  }
  return out;
}

std::vector<Section> build_sections(const std::string& text) {
  static const RE2 heading("(#{1,6})[ \\t]+(.+)");
  auto lines = split_lines(text);
  auto starts = line_starts(text);

  std::vector<Section> out;
  bool in_code = false;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (is_fence(lines[i])) { in_code = !in_code; continue; }
    std::string hashes, title;
    if (in_code || !RE2::FullMatch(lines[i], heading, &hashes, &title)) continue;
    Section s;
    s.id = "section_" + std::to_string(out.size());
    s.title = trim(title);
    s.level = (int)hashes.size();
    s.start = starts[i];
    out.push_back(std::move(s));
  }
  for (size_t k = 0; k < out.size(); ++k) {
    out[k].end = k + 1 < out.size() ? out[k + 1].start : text.size();
    out[k].content = text.substr(out[k].start, out[k].end - out[k].start);
  }
  return out;
}

// ---------- scores ----------

double structure_score(bool has_structures, bool has_sections) {
  if (has_structures && has_sections) return 0.9;
  if (has_structures || has_sections) return 0.7;
  return 0.5;
}

double cleanup_score(size_t original_chars, size_t refined_chars) {
  if (original_chars == 0) return 1.0;
  double reduction = ((double)original_chars - (double)refined_chars) / (double)original_chars;
  if (reduction >= 0.05 && reduction <= 0.20) return 0.9;
  if (reduction >= 0 && reduction < 0.05) return 0.8;
  if (reduction > 0.20 && reduction <= 0.35) return 0.7;
  return 0.5;
}

double retention_score(size_t original_chars, size_t refined_chars) {
  if (original_chars == 0) return 1.0;
  return std::min(1.0, (double)refined_chars / (double)original_chars);
}

// ---------- Refiner ----------

RefinedContent Refiner::refine(const RawContent& raw, const RefineOptions& o, const CancelToken& cancel) const {
  auto t0 = std::chrono::steady_clock::now();
  std::string file = file_identity(raw);
  try {
    validate(raw);

    RefinedContent out;
    out.raw_id = raw.id;
    out.metadata = metadata_of(raw.file);
    auto& warnings = out.info.warnings;

    std::string text = replace_all(raw.text, "\r\n", "\n");

    if (o.clean_noise) {
      text = run_step("noise cleanup", text, warnings, clean_noise);
      if (o.remove_headers_footers || o.remove_page_numbers || o.clean_table_of_contents) {
        try {
          text = remove_page_artifacts(text, o.remove_headers_footers, o.remove_page_numbers,
                                       o.clean_table_of_contents);
        } catch (const std::exception& e) {
          warnings.push_back(std::string("page artifact removal skipped: ") + e.what());
          log_warn("refiner", warnings.back());
        }
      }
    }
    cancel.check();

    if (o.build_sections) text = run_step("section promotion", text, warnings, promote_numbered_sections);
    cancel.check();

    bool structured = raw.has_structured() && (o.convert_tables_to_markdown || o.convert_blocks_to_markdown);
    if (structured) {
      try {
        text = render_structured(raw, o.convert_tables_to_markdown, o.convert_blocks_to_markdown,
                                 images_, cancel, warnings);
        if (o.clean_noise) text = clean_noise(text);
      } catch (const Cancelled&) {
        throw;
      } catch (const std::exception& e) {
        warnings.push_back(std::string("structured conversion skipped: ") + e.what());
        log_warn("refiner", warnings.back());
      }
    } else if (converter_) {
      RawContent copy = raw;
      copy.text = text;
      MarkdownConversionOptions mo;
      mo.convert_tables = o.convert_tables_to_markdown;
      try {
        auto conv = converter_->convert(copy, mo);
        for (auto& w : conv.warnings) warnings.push_back("converter: " + w);
        if (conv.success) {
          text = conv.markdown;
          out.info.used_llm = conv.used_llm;
        }
      } catch (const Cancelled&) {
        throw;
      } catch (const std::exception& e) {
        warnings.push_back(std::string("markdown conversion skipped: ") + e.what());
        log_warn("refiner", warnings.back());
      }
    }
    cancel.check();

    if (o.normalize_markdown_structure) {
      try {
        MarkdownNormalizer normalizer(o.normalize);
        auto r = normalizer.normalize(text);
        text = r.markdown;
        if (!r.converged) warnings.push_back("markdown normalization stopped before the text settled");
        log_debug("refiner", std::to_string(r.actions.size()) + " normalization actions");
      } catch (const std::exception& e) {
        warnings.push_back(std::string("markdown normalization skipped: ") + e.what());
        log_warn("refiner", warnings.back());
      }
    }
    cancel.check();

    // Offsets recorded below index this final text, so whitespace goes first.
    if (o.normalize_whitespace) text = run_step("whitespace normalization", text, warnings, normalize_whitespace);

    if (o.extract_structures) {
      if (o.convert_tables_to_markdown) {
        for (auto& t : raw.tables) {
          if (t.column_count() > 0) out.structures.push_back(table_structure(t));
        }
      }
      try {
        auto found = extract_structures(text);
        out.structures.insert(out.structures.end(), found.begin(), found.end());
      } catch (const std::exception& e) {
        warnings.push_back(std::string("structure extraction skipped: ") + e.what());
        log_warn("refiner", warnings.back());
      }
    }
    cancel.check();

    if (o.build_sections) out.sections = build_sections(text);

    out.text = std::move(text);
    out.quality.original_chars = raw.text.size();
    out.quality.refined_chars = out.text.size();
    out.quality.structure_score = structure_score(!out.structures.empty(), !out.sections.empty());
    out.quality.cleanup_score = cleanup_score(out.quality.original_chars, out.quality.refined_chars);
    out.quality.retention_score = retention_score(out.quality.original_chars, out.quality.refined_chars);
    out.quality.confidence_score = 0.75;

    out.info.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    log_debug("refiner", file + ": " + std::to_string(out.quality.original_chars) + " -> " +
                         std::to_string(out.quality.refined_chars) + " chars, " +
                         std::to_string(out.sections.size()) + " sections, " +
                         std::to_string(out.structures.size()) + " structures");
    return out;
  } catch (const Cancelled&) {
    throw;
  } catch (const ProcessingError&) {
    throw;
  } catch (const std::exception& e) {
    throw ProcessingError(file, "refine", std::string("Refinement failed: ") + e.what());
  }
}
