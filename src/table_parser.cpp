#include "table_parser.hpp"
#include "utils.hpp"

#include <algorithm>

namespace {

bool is_header_line(const std::string& line) {
    return std::any_of(TABLE_HEADER_TOKENS.begin(), TABLE_HEADER_TOKENS.end(),
                       [&](const std::string& token) { return line.find(token) != std::string::npos; });
}

bool is_ruler_line(const std::string& line) {
    const std::string trimmed = trim(line);
    return !trimmed.empty() &&
           std::all_of(trimmed.begin(), trimmed.end(), [](char c) { return c == TABLE_SEPARATOR; });
}

} // anonymous namespace

std::vector<std::string> extract_table_rows(std::string_view output) {
    const auto lines = split_lines(output);

    auto header = std::find_if(lines.begin(), lines.end(), is_header_line);
    if (header == lines.end()) {
        return {};
    }

    auto data = std::next(header);
    if (data != lines.end() && is_ruler_line(*data)) {
        ++data;
    }

    std::vector<std::string> rows;
    for (; data != lines.end(); ++data) {
        if (trim(*data).empty() || data->front() == TABLE_SEPARATOR) continue;
        rows.push_back(*data);
    }
    return rows;
}
