#include "upgrade_parser.hpp"
#include "table_parser.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>

bool is_upgrade_banner(const std::string& row) {
    const std::string lowered = to_lower(row);
    return std::any_of(UPGRADE_BANNER_TOKENS.begin(), UPGRADE_BANNER_TOKENS.end(),
                       [&](const std::string& token) { return lowered.find(to_lower(token)) != std::string::npos; });
}

std::optional<std::pair<std::string, std::string>> parse_upgrade_row(const std::string& row) {
    const auto tokens = split_whitespace(row);

    std::vector<size_t> version_positions;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (looks_like_version(tokens[i])) {
            version_positions.push_back(i);
        }
    }

    if (version_positions.size() < 2 || version_positions.front() == 0) {
        return std::nullopt;
    }

    return std::make_pair(tokens[version_positions[0] - 1], tokens[version_positions[1]]);
}

UpgradeMap parse_upgrade_list(std::string_view output) {
    UpgradeMap upgrades;
    for (const auto& row : extract_table_rows(output)) {
        if (is_upgrade_banner(row)) continue;
        if (auto entry = parse_upgrade_row(row)) {
            upgrades[entry->first] = std::move(entry->second);
        }
    }
    return upgrades;
}
