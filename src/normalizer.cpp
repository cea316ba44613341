#include "normalizer.hpp"
#include "log.hpp"
#include "text.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cstdio>

namespace {

const RE2& heading_re()       { static const RE2 re("(#{1,6})[ \\t]+(.*)"); return re; }
const RE2& empty_heading_re() { static const RE2 re("#{1,6}[ \\t\\r]*"); return re; }
const RE2& list_item_re()     { static const RE2 re("([ \\t]*)([-*+]|\\d+\\.)[ \\t]+(.*)"); return re; }
const RE2& table_row_re()     { static const RE2 re("[ \\t]*\\|.*\\|[ \\t\\r]*"); return re; }
const RE2& table_sep_re()     { static const RE2 re("[ \\t]*\\|[ \\t:|+]*-[ \\t\\-:|+]*\\|[ \\t\\r]*"); return re; }

const std::vector<const RE2*>& annotation_res() {
  static const RE2 paren("^\\s*[\\(（].*[\\)）]\\s*$");
  static const RE2 note("^\\s*※");
  static const RE2 star("^\\s*\\*\\s*$");
  static const RE2 bullet("^\\s*•");
  static const RE2 number("^\\s*\\d+\\.\\s*$");
  static const RE2 punct("^\\s*[.,:;]+\\s*$");
  static const std::vector<const RE2*> all = { &paren, &note, &star, &bullet, &number, &punct };
  return all;
}

bool is_fence(const std::string& line) {
  auto t = trim_start(line);
  return starts_with(t, "```") || starts_with(t, "~~~");
}

// true for lines inside fenced code, fence lines included
std::vector<bool> code_mask(const std::vector<std::string>& lines) {
  std::vector<bool> mask(lines.size(), false);
  bool in_code = false;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (is_fence(lines[i])) { mask[i] = true; in_code = !in_code; continue; }
    mask[i] = in_code;
  }
  return mask;
}

std::string shorten(const std::string& s, size_t max = 40) {
  if (s.empty()) return "(empty)";
  if (s.size() <= max) return s;
  return s.substr(0, max - 3) + "...";
}

int count_pipes(const std::string& line) {
  int n = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '|' && (i == 0 || line[i-1] != '\\')) ++n;
  }
  return n;
}

int column_count(const std::string& line) {
  int pipes = count_pipes(line);
  return pipes > 1 ? pipes - 1 : pipes;
}

struct TableCheck {
  bool valid = true;
  std::string reason;
  int max_cols = 0;
  int min_cols = 0;
};

TableCheck check_table(const std::vector<std::string>& rows, int max_variance) {
  TableCheck r;
  if (rows.size() < 2) { r.valid = false; r.reason = "Table has fewer than 2 rows"; return r; }

  std::vector<int> cols;
  bool has_sep = false;
  std::vector<size_t> cell_lengths;
  for (auto& row : rows) {
    if (RE2::FullMatch(row, table_sep_re())) { has_sep = true; continue; }
    cols.push_back(column_count(row));
    for (auto& cell : split_lines(replace_all(row, "|", "\n"))) {
      if (!cell.empty()) cell_lengths.push_back(trim(cell).size());
    }
  }
  if (cols.empty()) { r.valid = false; r.reason = "No data rows in table"; return r; }

  r.min_cols = *std::min_element(cols.begin(), cols.end());
  r.max_cols = *std::max_element(cols.begin(), cols.end());
  int variance = r.max_cols - r.min_cols;
  if (variance > max_variance) {
    r.valid = false;
    r.reason = "Column count varies from " + std::to_string(r.min_cols) + " to " +
               std::to_string(r.max_cols) + " (variance: " + std::to_string(variance) +
               ", max allowed: " + std::to_string(max_variance) + ")";
    return r;
  }
  if (!has_sep && rows.size() > 2) {
    r.valid = false;
    r.reason = "Complex table structure (missing separator)";
    return r;
  }
  if (!cell_lengths.empty()) {
    double sum = 0;
    size_t mx = 0;
    for (auto n : cell_lengths) { sum += (double)n; mx = std::max(mx, n); }
    double avg = sum / (double)cell_lengths.size();
    if ((double)mx > avg * 5 && mx > 100) {
      r.valid = false;
      r.reason = "Complex table structure (possible merged cells)";
    }
  }
  return r;
}

std::vector<std::string> table_to_text_block(const std::vector<std::string>& rows, const std::string& reason) {
  std::vector<std::string> out = { "<!-- table: " + reason + " -->", "<table>" };
  for (auto& row : rows) {
    if (RE2::FullMatch(row, table_sep_re())) continue;
    auto line = trim(row);
    if (starts_with(line, "|")) line = line.substr(1);
    if (ends_with(line, "|")) line.pop_back();
    std::replace(line.begin(), line.end(), '|', '\t');
    line = trim(line);
    if (!line.empty()) out.push_back(line);
  }
  out.push_back("</table>");
  return out;
}

bool is_rule_content(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return c == '*' || c == '-' || c == '_' || is_space(c); });
}

class Pass {
public:
  Pass(const NormalizeOptions& o, std::vector<std::string>& lines,
       std::vector<NormalizationAction>& actions, NormalizationStats& stats)
    : o_(o), lines_(lines), actions_(actions), stats_(stats) {}

  void run() {
    if (o_.demote_annotation_headings) demote_annotations();
    if (o_.remove_empty_headings) remove_empty_headings();
    if (o_.normalize_tables) tables();
    if (o_.normalize_headings) heading_hierarchy();
    if (o_.normalize_lists) lists();
    if (o_.normalize_whitespace) whitespace();
  }

private:
  void record(NormalizationKind k, int line, std::string before, std::string after, std::string reason) {
    actions_.push_back({k, line, std::move(before), std::move(after), std::move(reason)});
  }

  void demote_annotations() {
    auto mask = code_mask(lines_);
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (mask[i]) continue;
      std::string hashes, content;
      if (!RE2::FullMatch(lines_[i], heading_re(), &hashes, &content)) continue;
      for (auto* re : annotation_res()) {
        if (!RE2::PartialMatch(content, *re)) continue;
        record(NormalizationKind::AnnotationHeadingDemoted, (int)i + 1, lines_[i], content,
               "Annotation pattern detected, demoted to plain text");
        lines_[i] = content;
        stats_.headings_demoted++;
        break;
      }
    }
  }

  void remove_empty_headings() {
    auto mask = code_mask(lines_);
    for (size_t k = lines_.size(); k-- > 0; ) {
      if (mask[k]) continue;
      if (!RE2::FullMatch(lines_[k], empty_heading_re())) continue;
      record(NormalizationKind::EmptyHeadingRemoved, (int)k + 1, lines_[k], "(removed)", "Empty heading removed");
      lines_.erase(lines_.begin() + (long)k);
      stats_.headings_removed++;
    }
  }

  void heading_hierarchy() {
    auto mask = code_mask(lines_);
    int last = 0;
    bool first = true;
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (mask[i]) continue;
      std::string hashes, content;
      if (!RE2::FullMatch(lines_[i], heading_re(), &hashes, &content)) continue;
      int level = (int)hashes.size();

      if (first) {
        first = false;
        if (o_.promote_first_heading && level > o_.max_first_heading_level) {
          lines_[i] = "# " + content;
          record(NormalizationKind::FirstHeadingPromoted, (int)i + 1,
                 "H" + std::to_string(level) + ": " + shorten(content), "H1: " + shorten(content),
                 "First heading promoted from H" + std::to_string(level) + " to H1");
          stats_.headings_adjusted++;
          last = 1;
        } else {
          last = level;
        }
        continue;
      }

      int allowed = last + o_.max_heading_jump;
      if (level > allowed && last > 0) {
        lines_[i] = std::string((size_t)allowed, '#') + " " + content;
        record(NormalizationKind::HeadingLevelAdjusted, (int)i + 1,
               "H" + std::to_string(level) + ": " + shorten(content),
               "H" + std::to_string(allowed) + ": " + shorten(content),
               "Level jump H" + std::to_string(last) + " -> H" + std::to_string(level) +
               " exceeded max jump of " + std::to_string(o_.max_heading_jump));
        stats_.headings_adjusted++;
        last = allowed;
      } else {
        last = level;
      }
    }
  }

  void lists() {
    auto mask = code_mask(lines_);
    bool in_list = false;
    int last_indent = 0;
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (mask[i]) { in_list = false; continue; }
      std::string indent_s, marker, content;
      if (!RE2::FullMatch(lines_[i], list_item_re(), &indent_s, &marker, &content)) {
        if (!is_blank(lines_[i])) { in_list = false; last_indent = 0; }
        continue;
      }
      if ((marker == "*" || marker == "+") && is_rule_content(content)) continue;

      int indent = (int)indent_s.size();
      int new_indent = indent;
      if (in_list && indent > last_indent + 4) new_indent = last_indent + 2;
      std::string new_marker = (marker == "*" || marker == "+") ? "-" : marker;

      if (new_indent != indent || new_marker != marker) {
        auto before = lines_[i];
        lines_[i] = std::string((size_t)new_indent, ' ') + new_marker + " " + content;
        if (new_indent != indent) {
          record(NormalizationKind::ListIndentNormalized, (int)i + 1,
                 "indent=" + std::to_string(indent), "indent=" + std::to_string(new_indent),
                 "List indent jump from " + std::to_string(last_indent) + " to " + std::to_string(indent) + " normalized");
        } else {
          record(NormalizationKind::ListMarkerNormalized, (int)i + 1, before, lines_[i],
                 "Bullet marker '" + marker + "' rewritten as '-'");
        }
        stats_.list_items_normalized++;
      }
      in_list = true;
      last_indent = new_indent;
    }
  }

  void tables() {
    auto mask = code_mask(lines_);
    std::vector<std::pair<size_t, size_t>> blocks;  // [start, end]
    bool open = false;
    size_t start = 0;
    for (size_t i = 0; i < lines_.size(); ++i) {
      bool row = !mask[i] && RE2::FullMatch(lines_[i], table_row_re());
      if (row && !open) { open = true; start = i; }
      else if (!row && open) { blocks.emplace_back(start, i - 1); open = false; }
    }
    if (open) blocks.emplace_back(start, lines_.size() - 1);
    stats_.tables_found += (int)blocks.size();

    for (size_t t = blocks.size(); t-- > 0; ) {
      size_t b = blocks[t].first, e = blocks[t].second;
      std::vector<std::string> rows(lines_.begin() + (long)b, lines_.begin() + (long)e + 1);
      auto check = check_table(rows, o_.max_column_variance);

      if (!check.valid) {
        auto text = table_to_text_block(rows, check.reason);
        lines_.erase(lines_.begin() + (long)b, lines_.begin() + (long)e + 1);
        lines_.insert(lines_.begin() + (long)b, text.begin(), text.end());
        bool complex = check.reason.find("Complex") != std::string::npos;
        record(complex ? NormalizationKind::ComplexTableConverted : NormalizationKind::MalformedTableConverted,
               (int)b + 1, "Table with " + std::to_string(rows.size()) + " rows",
               "Text block with <table> hint", check.reason);
        stats_.tables_converted++;
        continue;
      }

      bool padded = false;
      for (size_t i = b; i <= e; ++i) {
        bool sep = RE2::FullMatch(lines_[i], table_sep_re());
        int cols = column_count(lines_[i]);
        if (cols >= check.max_cols) continue;
        auto line = trim_end(lines_[i]);
        for (int c = cols; c < check.max_cols; ++c) line += sep ? "---|" : " |";
        lines_[i] = line;
        padded = true;
      }
      if (padded) {
        record(NormalizationKind::TableColumnsPadded, (int)b + 1,
               std::to_string(check.min_cols) + "-" + std::to_string(check.max_cols) + " columns",
               std::to_string(check.max_cols) + " columns", "Short rows padded to the widest row");
      }
      stats_.tables_preserved++;
    }
  }

  void whitespace() {
    for (auto& l : lines_) l = trim_end(l);
    int removed = 0;
    int blanks = 0;
    for (size_t k = lines_.size(); k-- > 0; ) {
      if (lines_[k].empty()) {
        if (++blanks > 2) { lines_.erase(lines_.begin() + (long)k); ++removed; }
      } else {
        blanks = 0;
      }
    }
    if (removed > 0) {
      stats_.blank_lines_removed += removed;
      record(NormalizationKind::ExcessiveBlankLinesRemoved, 0,
             std::to_string(removed) + " excessive blank lines", "removed",
             "Consecutive blank lines normalized to max 2");
    }
  }

  const NormalizeOptions& o_;
  std::vector<std::string>& lines_;
  std::vector<NormalizationAction>& actions_;
  NormalizationStats& stats_;
};

}  // namespace

MarkdownNormalizer::MarkdownNormalizer(const NormalizeOptions& options) : opt_(options) {}

NormalizationResult MarkdownNormalizer::normalize(const std::string& markdown) const {
  NormalizationResult r;
  auto lines = split_lines(markdown);
  r.stats.total_lines = (int)lines.size();

  // A rewrite can expose work for an earlier phase (a converted table row that
  // looks like a heading), so passes repeat until the text is stable.
  std::string current = markdown;
  NormalizationStats last;
  const int max_passes = std::max(1, opt_.max_passes);
  r.converged = false;
  for (int pass = 0; pass < max_passes; ++pass) {
    last = NormalizationStats();
    Pass(opt_, lines, r.actions, last).run();
    r.stats.headings_demoted += last.headings_demoted;
    r.stats.headings_removed += last.headings_removed;
    r.stats.headings_adjusted += last.headings_adjusted;
    r.stats.list_items_normalized += last.list_items_normalized;
    r.stats.tables_converted += last.tables_converted;
    r.stats.blank_lines_removed += last.blank_lines_removed;
    auto next = join(lines, "\n");
    if (next == current) {
      r.converged = true;
      break;
    }
    current = std::move(next);
  }
  if (!r.converged) {
    log_warn("normalizer", "still changing after " + std::to_string(max_passes) +
                           " passes; output may not be idempotent");
  }
  r.markdown = current;
  // tables seen by the final pass plus those converted to text on the way
  r.stats.tables_preserved = last.tables_preserved;
  r.stats.tables_found = last.tables_found + r.stats.tables_converted;

  auto mask = code_mask(lines);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!mask[i] && RE2::FullMatch(lines[i], heading_re())) r.stats.headings_found++;
  }
  return r;
}

const char* to_string(NormalizationKind k) {
  switch (k) {
    case NormalizationKind::AnnotationHeadingDemoted:   return "AnnotationHeadingDemoted";
    case NormalizationKind::EmptyHeadingRemoved:        return "EmptyHeadingRemoved";
    case NormalizationKind::FirstHeadingPromoted:       return "FirstHeadingPromoted";
    case NormalizationKind::HeadingLevelAdjusted:       return "HeadingLevelAdjusted";
    case NormalizationKind::ListIndentNormalized:       return "ListIndentNormalized";
    case NormalizationKind::ListMarkerNormalized:       return "ListMarkerNormalized";
    case NormalizationKind::TableColumnsPadded:         return "TableColumnsPadded";
    case NormalizationKind::MalformedTableConverted:    return "MalformedTableConverted";
    case NormalizationKind::ComplexTableConverted:      return "ComplexTableConverted";
    case NormalizationKind::ExcessiveBlankLinesRemoved: return "ExcessiveBlankLinesRemoved";
  }
  return "";
}
