#include "text_search.hpp"

static std::vector<size_t> kmp_build(std::string_view pat) {
  std::vector<size_t> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = j;
  }
  return pi;
}

std::vector<size_t> find_all(std::string_view text, std::string_view pattern) {
  std::vector<size_t> out;
  if (pattern.empty() || pattern.size() > text.size()) return out;
  auto pi = kmp_build(pattern);
  size_t j = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    while (j > 0 && text[i] != pattern[j]) j = pi[j - 1];
    if (text[i] == pattern[j]) ++j;
    if (j == pattern.size()) {
      out.push_back(i + 1 - pattern.size());
      j = 0; // restart after the match: no overlap
    }
  }
  return out;
}

bool contains(std::string_view text, std::string_view pattern) {
  if (pattern.empty()) return false;
  return text.find(pattern) != std::string_view::npos;
}
