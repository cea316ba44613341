#pragma once
#include <re2/re2.h>
#include <cstdint>
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string trim_start(const std::string& s);
std::string trim_end(const std::string& s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
bool is_blank(const std::string& s);
bool is_space(char c);
bool is_upper(char c);   // ASCII only

// Splits on '\n' keeping empty lines; "a\n" -> {"a", ""}.
std::vector<std::string> split_lines(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
std::string replace_all(std::string s, const std::string& from, const std::string& to);

std::vector<std::string> split_words(const std::string& s);

// Breaks after . ! ? when followed by whitespace and an upper-case letter.
std::vector<std::string> split_sentences(const std::string& s);

// Lower-cased words longer than two chars that are not stop words.
std::vector<std::string> extract_terms(const std::string& s);
bool is_stop_word(const std::string& w);

int estimate_tokens(const std::string& s);   // words * 1.3
bool contains_hangul(const std::string& s);
std::string hash_id(const std::string& key); // FNV-1a, 16 hex chars

// ---- RE2 helpers ----

struct RegexMatch {
  size_t start = 0;
  size_t end = 0;
  std::vector<std::string> groups;  // groups[0] is the whole match
};

std::vector<RegexMatch> find_all(const RE2& re, const std::string& text);
int count_matches(const RE2& re, const std::string& text);
std::string regex_replace(const std::string& text, const RE2& re, const std::string& rewrite);
