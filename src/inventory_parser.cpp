#include "inventory_parser.hpp"
#include "table_parser.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>

std::optional<PackageRecord> parse_inventory_row(const std::string& row, const std::string& source) {
    const auto tokens = split_whitespace(row);
    if (tokens.size() < 2) {
        return std::nullopt;
    }

    auto version_it = std::find_if(tokens.begin(), tokens.end(),
                                   [](const std::string& token) { return looks_like_version(token); });
    if (version_it == tokens.end()) {
        return std::nullopt;
    }

    // Need at least one name token in front of the id
    const size_t version_index = static_cast<size_t>(version_it - tokens.begin());
    if (version_index < 2) {
        return std::nullopt;
    }

    PackageRecord record;
    record.name = join(tokens, " ", 0, version_index - 1);
    record.id = tokens[version_index - 1];
    record.installed_version = *version_it;
    record.source = source;
    return record;
}

RecordList parse_installed_list(std::string_view output, const std::string& source) {
    RecordList records;
    for (const auto& row : extract_table_rows(output)) {
        if (auto record = parse_inventory_row(row, source)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}
