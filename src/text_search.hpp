#pragma once
/*
 * TextSearch
 *
 * Purpose: case-sensitive substring search (KMP) shared by highlighting and n/N.
 * Note: find_all reports non-overlapping matches, left to right.
 */
#include <cstddef>
#include <string_view>
#include <vector>

std::vector<size_t> find_all(std::string_view text, std::string_view pattern);
bool contains(std::string_view text, std::string_view pattern);
