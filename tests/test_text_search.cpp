#include "text_search.hpp"
#include <cassert>
#include <string>
#include <vector>

using V = std::vector<size_t>;

static void test_find_all() {
  assert(find_all("error: disk error", "error") == (V{0, 12}));
  assert(find_all("abc", "") == V{});
  assert(find_all("ab", "abc") == V{});
  assert(find_all("", "a") == V{});
  // matches never overlap
  assert(find_all("aaaa", "aa") == (V{0, 2}));
  assert(find_all("aaa", "aa") == V{0});
  assert(find_all("abababa", "aba") == (V{0, 4}));
  // case-sensitive
  assert(find_all("Error error", "error") == V{6});
  // partial prefix before a real match
  assert(find_all("aabaabaaab", "aaab") == V{6});
  assert(find_all("\xE6\x97\xA5\xE5\xBF\x97 x \xE5\xBF\x97", "\xE5\xBF\x97") == (V{3, 9}));
}

static void test_contains() {
  assert(contains("connection reset", "reset"));
  assert(!contains("connection reset", "Reset"));
  assert(!contains("abc", ""));
  assert(!contains("", "a"));
}

static void test_matches_std_find() {
  const std::string text = "xyxyyxyxyxyyxyxyxyyxyxy--xy";
  const std::vector<std::string> pats = {"x", "xy", "yx", "xyx", "xyxyy", "--", "zz"};
  for (const auto& p : pats) {
    V expect;
    for (size_t pos = text.find(p); pos != std::string::npos; pos = text.find(p, pos + p.size())) expect.push_back(pos);
    assert(find_all(text, p) == expect);
  }
}

int main() {
  test_find_all();
  test_contains();
  test_matches_std_find();
  return 0;
}
