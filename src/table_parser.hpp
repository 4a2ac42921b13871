#pragma once

#include <string>
#include <string_view>
#include <vector>

// Header words the package tool prints above its tables, per locale.
inline const std::vector<std::string> TABLE_HEADER_TOKENS = {"Name", "名前"};
inline constexpr char TABLE_SEPARATOR = '-';

// Returns the data lines of a whitespace-aligned table: everything after the
// first header line, minus the dash ruler, blank lines and separator lines.
// Output without a header yields an empty result.
std::vector<std::string> extract_table_rows(std::string_view output);
