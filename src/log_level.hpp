#pragma once
/*
 * LogLevel
 *
 * Purpose: spot the severity keyword of a log line and map it to a base item
 *          style (used when `:set levelcolor on`).
 */
#include <string_view>
#include "style.hpp"

enum class LogLevel { None, Trace, Debug, Info, Warn, Error };

LogLevel detect_level(std::string_view line);
Style level_style(LogLevel level);
