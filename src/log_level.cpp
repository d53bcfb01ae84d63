#include "log_level.hpp"
#include <cctype>
#include <string>
#include <unordered_map>

static const std::unordered_map<std::string, LogLevel>& level_keywords() {
  static const std::unordered_map<std::string, LogLevel> kw = {
    {"fatal", LogLevel::Error}, {"critical", LogLevel::Error}, {"error", LogLevel::Error}, {"err", LogLevel::Error},
    {"warning", LogLevel::Warn}, {"warn", LogLevel::Warn},
    {"info", LogLevel::Info},
    {"debug", LogLevel::Debug},
    {"trace", LogLevel::Trace},
  };
  return kw;
}

LogLevel detect_level(std::string_view line) {
  auto is_word = [](unsigned char c){ return std::isalpha(c) != 0; };
  const auto& kw = level_keywords();
  size_t n = line.size();
  size_t p = 0;
  while (p < n) {
    if (!is_word(static_cast<unsigned char>(line[p]))) { p++; continue; }
    size_t start = p;
    while (p < n && is_word(static_cast<unsigned char>(line[p]))) p++;
    if (p - start > 8) continue;
    std::string tok(line.substr(start, p - start));
    for (char& c : tok) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (auto it = kw.find(tok); it != kw.end()) return it->second;
  }
  return LogLevel::None;
}

Style level_style(LogLevel level) {
  Style s;
  switch (level) {
    case LogLevel::Error: s.with_fg(Color::Red).add(Modifier::Bold); break;
    case LogLevel::Warn: s.with_fg(Color::Yellow); break;
    case LogLevel::Debug: case LogLevel::Trace: s.add(Modifier::Dim); break;
    case LogLevel::Info: case LogLevel::None: break;
  }
  return s;
}
