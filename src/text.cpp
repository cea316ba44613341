#include "text.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_set>

std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n\f\v");
  auto b = s.find_last_not_of(" \t\r\n\f\v");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}

std::string trim_start(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n\f\v");
  if (a == std::string::npos) return "";
  return s.substr(a);
}

std::string trim_end(const std::string& s) {
  auto b = s.find_last_not_of(" \t\r\n\f\v");
  if (b == std::string::npos) return "";
  return s.substr(0, b + 1);
}

std::string to_lower(std::string s) {
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_space(char c) { return std::isspace((unsigned char)c) != 0; }

bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return is_space(c); });
}

std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  size_t b = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\n') { out.push_back(s.substr(b, i - b)); b = i + 1; }
  }
  out.push_back(s.substr(b));
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
  if (from.empty()) return s;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (is_space(c)) {
      if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::vector<std::string> split_sentences(const std::string& s) {
  std::vector<std::string> out;
  auto push = [&](const std::string& part) {
    auto t = trim(part);
    if (!t.empty()) out.push_back(t);
  };
  size_t begin = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c != '.' && c != '!' && c != '?') continue;
    size_t j = i + 1;
    while (j < s.size() && is_space(s[j])) ++j;
    if (j == i + 1 || j >= s.size() || !is_upper(s[j])) continue;
    push(s.substr(begin, i + 1 - begin));
    begin = j;
    i = j - 1;
  }
  if (begin < s.size()) push(s.substr(begin));
  return out;
}

bool is_stop_word(const std::string& w) {
  static const std::unordered_set<std::string> stop = {
    "the", "is", "at", "which", "on", "and", "a", "an", "as", "are",
    "was", "were", "been", "be", "have", "has", "had", "do", "does",
    "did", "will", "would", "could", "should", "may", "might", "must",
    "can", "to", "of", "in", "for", "with", "by", "from", "about"
  };
  return stop.count(to_lower(w)) > 0;
}

std::vector<std::string> extract_terms(const std::string& s) {
  static const std::string seps = " \t\n\r.,!?;:\"'()";
  std::vector<std::string> out;
  std::string cur;
  auto flush = [&]() {
    if (cur.size() > 2 && !is_stop_word(cur)) out.push_back(cur);
    cur.clear();
  };
  for (char c : s) {
    if (seps.find(c) != std::string::npos) flush();
    else cur += (char)std::tolower((unsigned char)c);
  }
  flush();
  return out;
}

int estimate_tokens(const std::string& s) {
  return (int)(split_words(s).size() * 1.3);
}

bool contains_hangul(const std::string& s) {
  // Hangul syllables U+AC00..U+D7A3 encode with lead bytes 0xEA..0xED.
  for (size_t i = 0; i + 2 < s.size(); ++i) {
    unsigned char c = (unsigned char)s[i];
    if (c >= 0xEA && c <= 0xED) {
      unsigned cp = ((c & 0x0F) << 12) | (((unsigned char)s[i+1] & 0x3F) << 6) |
                    ((unsigned char)s[i+2] & 0x3F);
      if (cp >= 0xAC00 && cp <= 0xD7A3) return true;
    }
  }
  return false;
}

std::string hash_id(const std::string& key) {
  uint64_t h = 1469598103934665603ULL;
  for (char c : key) {
    h ^= (unsigned char)c;
    h *= 1099511628211ULL;
  }
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
  return buf;
}

std::vector<RegexMatch> find_all(const RE2& re, const std::string& text) {
  std::vector<RegexMatch> out;
  int n = re.NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> g(n);
  re2::StringPiece input(text);
  size_t pos = 0;
  while (pos <= text.size()) {
    if (!re.Match(input, pos, text.size(), RE2::UNANCHORED, g.data(), n)) break;
    RegexMatch m;
    m.start = (size_t)(g[0].data() - text.data());
    m.end = m.start + g[0].size();
    for (int i = 0; i < n; ++i) {
      m.groups.push_back(g[i].data() ? std::string(g[i].data(), g[i].size()) : std::string());
    }
    pos = m.end > m.start ? m.end : m.end + 1;
    out.push_back(std::move(m));
  }
  return out;
}

int count_matches(const RE2& re, const std::string& text) {
  return (int)find_all(re, text).size();
}

std::string regex_replace(const std::string& text, const RE2& re, const std::string& rewrite) {
  std::string out = text;
  RE2::GlobalReplace(&out, re, rewrite);
  return out;
}
