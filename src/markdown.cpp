#include "markdown.hpp"
#include "log.hpp"
#include "text.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <limits>
#include <optional>
#include <variant>

// ---------- tables, blocks, images ----------

std::string escape_table_cell(const std::string& cell) {
  std::string s = replace_all(cell, "|", "\\|");
  s = replace_all(s, "\n", " ");
  s = replace_all(s, "\r", "");
  return trim(s);
}

std::vector<std::string> resolve_table_headers(const TableData& t, size_t& first_row) {
  size_t cols = t.column_count();
  std::vector<std::string> headers;
  first_row = 0;
  if (!t.headers.empty()) {
    headers = t.headers;
  } else if (t.has_header && !t.cells.empty()) {
    headers = t.cells[0];
    first_row = 1;
  }
  for (size_t i = headers.size(); i < cols; ++i) headers.push_back("Col" + std::to_string(i + 1));
  headers.resize(cols);
  return headers;
}

std::string table_to_markdown(const TableData& t) {
  size_t cols = t.column_count();
  if (cols == 0) return trim(t.plain_text_fallback);

  size_t first_row = 0;
  auto headers = resolve_table_headers(t, first_row);

  std::string out = "|";
  for (auto& h : headers) out += " " + escape_table_cell(h) + " |";
  out += "\n|";
  for (size_t i = 0; i < cols; ++i) {
    const char* sep = "---";
    if (i < t.alignments.size()) {
      switch (t.alignments[i]) {
        case Alignment::Left:    sep = ":---"; break;
        case Alignment::Right:   sep = "---:"; break;
        case Alignment::Center:
        case Alignment::Justify: sep = ":---:"; break;
      }
    }
    out += std::string(" ") + sep + " |";
  }
  for (size_t r = first_row; r < t.cells.size(); ++r) {
    out += "\n|";
    const auto& row = t.cells[r];
    for (size_t c = 0; c < cols; ++c) {
      out += " " + escape_table_cell(c < row.size() ? row[c] : std::string()) + " |";
    }
  }
  if (t.needs_llm_assist()) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "\n<!-- Table confidence: %.2f - may need verification -->", t.confidence);
    out += buf;
  }
  return out;
}

std::string block_to_markdown(const TextBlock& b, int ordinal) {
  std::string content = trim(b.content);
  if (content.empty()) return "";

  switch (b.type) {
    case BlockType::Heading: {
      int level = std::max(1, std::min(6, b.heading_level.value_or(1)));
      return std::string((size_t)level, '#') + " " + content;
    }
    case BlockType::ListItem: {
      std::string indent((size_t)std::max(0, b.list_level) * 2, ' ');
      return indent + (b.ordered ? std::to_string(ordinal) + ". " : std::string("- ")) + content;
    }
    case BlockType::CodeBlock:
      return "```" + b.language + "\n" + trim_end(b.content) + "\n```";
    case BlockType::Quote: {
      auto lines = split_lines(content);
      for (auto& l : lines) l = "> " + l;
      return join(lines, "\n");
    }
    case BlockType::Header:
      return "<!-- header: " + replace_all(content, "-->", "-- >") + " -->";
    case BlockType::Footer:
      return "<!-- footer: " + replace_all(content, "-->", "-- >") + " -->";
    case BlockType::Caption:
      return "*" + content + "*";
    case BlockType::Note:
      return "> **Note:** " + content;
    case BlockType::TocEntry:
    case BlockType::Paragraph:
      return content;
  }
  return content;
}

std::string image_to_markdown(const ImageInfo& img, const std::string& alt) {
  std::string a = replace_all(replace_all(alt, "\n", " "), "]", "\\]");
  std::string target = img.external_ref.empty() ? "embedded:" + img.id : img.external_ref;
  return "![" + trim(a) + "](" + target + ")";
}

namespace {

struct Item {
  std::variant<const TextBlock*, const TableData*, const ImageInfo*> ref;
  int page = 0;
  bool has_y = false;
  double y = 0;
  std::optional<int> order;
};

const int kNoPage = std::numeric_limits<int>::max();

// Page of the last block at or before a reading-order position. Without a
// position the item has no anchor and goes after everything else.
int page_at(const std::vector<const TextBlock*>& blocks, const std::optional<int>& position) {
  if (!position) return kNoPage;
  if (blocks.empty()) return 0;
  int page = blocks.front()->page_number;
  for (auto* b : blocks) {
    if (b->order > *position) break;
    page = b->page_number;
  }
  return page;
}

std::string image_alt(const ImageInfo& img, ImageTextService* images, std::vector<std::string>& warnings) {
  if (!trim(img.caption).empty()) return img.caption;
  if (!images || img.data.empty()) return "image";
  try {
    if (!images->is_available()) return "image";
    ImageTextOptions o;
    auto r = images->extract_text(img.data, o);
    auto text = trim(r.text);
    if (text.empty()) return "image";
    return clip_utf8(split_lines(text)[0], 200);
  } catch (const Cancelled&) {
    throw;
  } catch (const std::exception& e) {
    std::string w = "image " + img.id + ": text extraction failed: " + e.what();
    log_warn("refiner", w);
    warnings.push_back(w);
    return "image";
  }
}

}  // namespace

std::string render_structured(const RawContent& raw, bool include_tables, bool include_blocks,
                              ImageTextService* images, const CancelToken& cancel,
                              std::vector<std::string>& warnings) {
  std::vector<const TextBlock*> blocks;
  if (include_blocks) {
    for (auto& b : raw.blocks) blocks.push_back(&b);
    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const TextBlock* a, const TextBlock* b) { return a->order < b->order; });
  }

  std::vector<Item> items;
  for (auto* b : blocks) {
    items.push_back(Item{b, b->page_number, b->location.has_value(), b->location ? b->location->top : 0, b->order});
  }
  if (include_tables) {
    for (auto& t : raw.tables) {
      items.push_back(Item{&t, t.page_number, t.top.has_value(), t.top.value_or(0), t.position});
    }
  }
  for (auto& img : raw.images) {
    int page = img.page_number ? *img.page_number : page_at(blocks, img.position);
    items.push_back(Item{&img, page, img.bounds_bottom.has_value(), img.bounds_bottom.value_or(0), img.position});
  }

  std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) { return a.page < b.page; });

  // Within a page: by Y when every item is located (PDF origin is bottom-left,
  // so a larger Y is higher), otherwise by reading order. Items without an
  // order keep their input sequence at the end of the page.
  for (size_t b = 0; b < items.size();) {
    size_t e = b;
    while (e < items.size() && items[e].page == items[b].page) ++e;
    bool located = std::all_of(items.begin() + b, items.begin() + e, [](const Item& it) { return it.has_y; });
    if (located) {
      std::stable_sort(items.begin() + b, items.begin() + e, [](const Item& x, const Item& y) { return x.y > y.y; });
    } else {
      std::stable_sort(items.begin() + b, items.begin() + e, [](const Item& x, const Item& y) {
        return x.order.value_or(kNoPage) < y.order.value_or(kNoPage);
      });
    }
    b = e;
  }

  std::string out;
  bool prev_list = false;
  std::vector<int> ordinals;
  for (auto& it : items) {
    cancel.check();
    std::string piece;
    bool is_list = false;
    if (auto* pb = std::get_if<const TextBlock*>(&it.ref)) {
      const TextBlock& b = **pb;
      if (b.type == BlockType::ListItem) {
        is_list = true;
        size_t level = (size_t)std::max(0, b.list_level);
        if (!prev_list) ordinals.clear();
        ordinals.resize(level + 1, 0);
        piece = block_to_markdown(b, ++ordinals[level]);
      } else {
        piece = block_to_markdown(b);
      }
    } else if (auto* pt = std::get_if<const TableData*>(&it.ref)) {
      piece = table_to_markdown(**pt);
    } else {
      const ImageInfo& img = *std::get<const ImageInfo*>(it.ref);
      piece = image_to_markdown(img, image_alt(img, images, warnings));
    }
    if (piece.empty()) continue;
    if (!out.empty()) out += (is_list && prev_list) ? "\n" : "\n\n";
    out += piece;
    prev_list = is_list;
  }
  return out;
}

// ---------- heuristic converter ----------

namespace {

const RE2& md_heading_re()    { static const RE2 re("(#{1,6})\\s+(.+)"); return re; }
const RE2& caps_heading_re()  { static const RE2 re("[A-Z][A-Z0-9\\s\\-_]+"); return re; }
const RE2& numbered_sec_re()  { static const RE2 re("(\\d+(?:\\.\\d+)*)\\s+([A-Z].+)"); return re; }
const RE2& md_list_re()       { static const RE2 re("(?:[-*+]|\\d+\\.)\\s+.+"); return re; }
const RE2& bullet_re()        { static const RE2 re("[•●○■□▪▸►→]\\s*(.+)"); return re; }
const RE2& paren_list_re()    { static const RE2 re("[\\(\\[]?([0-9]+|[a-z])[\\)\\]]\\s+(.+)"); return re; }
const RE2& table_sep_re()     { static const RE2 re("^\\|?\\s*[-:]+\\s*\\|"); return re; }
const RE2& img_comment_re()   { static const RE2 re("(?i)<!--\\s*IMAGE[^>]*IMG_?(\\d+)[^>]*-->"); return re; }
const RE2& img_bracket_re()   { static const RE2 re("(?i)\\[image:([^\\]]+)\\]"); return re; }
const RE2& img_ref_re()       { static const RE2 re("(?i)\\[img_?(\\d+)\\]"); return re; }

bool is_fence(const std::string& t) { return starts_with(t, "```") || starts_with(t, "~~~"); }

bool is_table_line(const std::string& t) {
  if (t.empty() || starts_with(t, ">")) return false;
  return std::count(t.begin(), t.end(), '|') >= 2;
}

bool is_table_separator(const std::string& t) { return RE2::PartialMatch(t, table_sep_re()); }

std::string title_case(const std::string& s) {
  auto words = split_lines(replace_all(to_lower(s), " ", "\n"));
  for (auto& w : words) {
    if (!w.empty()) w[0] = (char)std::toupper((unsigned char)w[0]);
  }
  return join(words, " ");
}

int clamp_level(int level, const MarkdownConversionOptions& o) {
  return std::max(o.min_heading_level, std::min(o.max_heading_level, level));
}

void flush_table(std::vector<std::string>& out, std::vector<std::string>& rows, MarkdownConversion& r) {
  if (rows.empty()) return;
  bool has_sep = std::any_of(rows.begin(), rows.end(), is_table_separator);
  for (size_t i = 0; i < rows.size(); ++i) {
    out.push_back(rows[i]);
    if (i == 0 && !has_sep && rows.size() > 1) {
      std::string inner = rows[0];
      if (starts_with(inner, "|")) inner = inner.substr(1);
      if (ends_with(inner, "|")) inner.pop_back();
      size_t cols = (size_t)std::count(inner.begin(), inner.end(), '|') + 1;
      std::string sep = "|";
      for (size_t c = 0; c < cols; ++c) sep += " --- |";
      out.push_back(sep);
    }
  }
  out.push_back("");
  r.tables++;
  rows.clear();
}

std::string convert_image_placeholder(const std::string& t) {
  std::string n, desc;
  if (RE2::PartialMatch(t, img_comment_re(), &n)) return "![image](embedded:img_" + n + ")";
  if (RE2::PartialMatch(t, img_bracket_re(), &desc)) return "![" + desc + "](embedded:img_000)";
  if (t.find("embedded:img_") != std::string::npos) return t;
  if (RE2::PartialMatch(t, img_ref_re(), &n)) return "![image](embedded:img_" + n + ")";
  return t;
}

bool is_image_placeholder(const std::string& t) {
  return t.find("<!-- IMAGE") != std::string::npos || t.find("[image:") != std::string::npos ||
         t.find("embedded:img_") != std::string::npos || RE2::PartialMatch(t, img_ref_re());
}

// Blank line around headings and before opening fences, runs of blank lines
// capped at one.
std::string space_blocks(const std::string& md) {
  auto lines = split_lines(replace_all(md, "\r\n", "\n"));
  std::vector<std::string> out;
  bool in_code = false;
  for (size_t i = 0; i < lines.size(); ++i) {
    const auto& l = lines[i];
    bool fence = is_fence(trim(l));
    bool heading = !in_code && !fence && RE2::FullMatch(l, md_heading_re());
    bool opening = fence && !in_code;
    if ((heading || opening) && !out.empty() && !out.back().empty()) out.push_back("");
    if (l.empty() && !in_code && !out.empty() && out.back().empty()) continue;
    out.push_back(l);
    if (fence) in_code = !in_code;
    if (heading && i + 1 < lines.size() && !lines[i + 1].empty() && !starts_with(lines[i + 1], "#")) {
      out.push_back("");
    }
  }
  return trim(join(out, "\n"));
}

}  // namespace

MarkdownConversion HeuristicMarkdownConverter::convert(const RawContent& raw,
                                                       const MarkdownConversionOptions& o) {
  MarkdownConversion r;
  if (is_blank(raw.text)) {
    r.success = true;
    r.warnings.push_back("Empty content provided");
    return r;
  }

  std::vector<std::string> out;
  if (o.convert_tables) {
    for (auto& t : raw.tables) {
      auto md = table_to_markdown(t);
      if (md.empty()) continue;
      out.push_back(md);
      out.push_back("");
      r.tables++;
    }
  }

  std::vector<std::string> table_rows;
  bool in_code = false;
  for (auto& line : split_lines(replace_all(raw.text, "\r\n", "\n"))) {
    std::string t = trim(line);

    if (o.detect_code_blocks && is_fence(t)) {
      in_code = !in_code;
      out.push_back(line);
      if (!in_code) r.code_blocks++;
      continue;
    }
    if (in_code) { out.push_back(line); continue; }

    if (o.convert_tables && (is_table_line(t) || (!table_rows.empty() && is_table_separator(t)))) {
      table_rows.push_back(t);
      continue;
    }
    if (!table_rows.empty()) {
      flush_table(out, table_rows, r);
      if (t.empty()) continue;
    }

    if (o.preserve_headings) {
      std::string hashes, title, num;
      if (RE2::FullMatch(t, md_heading_re(), &hashes, &title)) {
        out.push_back(std::string((size_t)clamp_level((int)hashes.size(), o), '#') + " " + title);
        r.headings++;
        continue;
      }
      if (t.size() <= 100 && RE2::FullMatch(t, caps_heading_re())) {
        out.push_back(std::string((size_t)clamp_level(2, o), '#') + " " + title_case(t));
        r.headings++;
        continue;
      }
      if (RE2::FullMatch(t, numbered_sec_re(), &num)) {
        int depth = (int)std::count(num.begin(), num.end(), '.') + 1;
        out.push_back(std::string((size_t)clamp_level(std::min(depth + 1, 6), o), '#') + " " + t);
        r.headings++;
        continue;
      }
    }

    if (o.preserve_lists) {
      std::string indent = line.substr(0, line.size() - trim_start(line).size());
      std::string item, marker;
      if (RE2::FullMatch(t, md_list_re())) {
        out.push_back(line);
        r.lists++;
        continue;
      }
      if (RE2::FullMatch(t, bullet_re(), &item)) {
        out.push_back(indent + "- " + item);
        r.lists++;
        continue;
      }
      if (RE2::FullMatch(t, paren_list_re(), &marker, &item)) {
        bool numeric = std::isdigit((unsigned char)marker[0]) != 0;
        out.push_back(indent + (numeric ? marker + ". " : std::string("- ")) + item);
        r.lists++;
        continue;
      }
    }

    if (o.image_placeholders && is_image_placeholder(t)) {
      out.push_back(convert_image_placeholder(t));
      r.images++;
      continue;
    }
    out.push_back(line);
  }
  flush_table(out, table_rows, r);

  r.markdown = join(out, "\n");
  if (o.normalize_whitespace) r.markdown = space_blocks(r.markdown);
  r.success = true;
  return r;
}

// ---------- LLM-assisted converter ----------

int apply_section_hints(std::string& markdown, const std::vector<SectionHint>& hints) {
  if (hints.empty()) return 0;
  auto lines = split_lines(markdown);
  int promoted = 0;
  bool in_code = false;
  for (auto& l : lines) {
    auto t = trim(l);
    if (is_fence(t)) { in_code = !in_code; continue; }
    if (in_code || t.empty() || starts_with(t, "#")) continue;
    for (auto& h : hints) {
      if (h.title != t) continue;
      l = std::string((size_t)std::max(1, std::min(6, h.level)), '#') + " " + t;
      promoted++;
      break;
    }
  }
  markdown = join(lines, "\n");
  return promoted;
}

MarkdownConversion LlmMarkdownConverter::convert(const RawContent& raw, const MarkdownConversionOptions& o) {
  MarkdownConversion r = heuristic_.convert(raw, o);
  if (!r.success || r.markdown.empty()) return r;

  if (!completion_) {
    r.warnings.push_back("LLM inference requested but no completion service configured");
    return r;
  }
  try {
    if (!completion_->is_available()) {
      r.warnings.push_back("LLM inference requested but completion service not available");
      return r;
    }
    std::string doc_type = raw.file.extension.empty() ? "text" : raw.file.extension.substr(1);
    auto analysis = completion_->analyze_structure(r.markdown, doc_type);
    int n = apply_section_hints(r.markdown, analysis.sections);
    r.headings += n;
    r.used_llm = true;
    log_debug("converter", "promoted " + std::to_string(n) + " lines from structure analysis");
  } catch (const Cancelled&) {
    throw;
  } catch (const std::exception& e) {
    r.warnings.push_back(std::string("LLM enhancement failed, using heuristic result: ") + e.what());
    log_warn("converter", r.warnings.back());
  }
  return r;
}
