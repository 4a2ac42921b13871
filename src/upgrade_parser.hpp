#pragma once

#include "record.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Banner words the tool prints inside its upgrade table ("2 upgrades
// available."). Matched case-insensitively for the ASCII entry.
inline const std::vector<std::string> UPGRADE_BANNER_TOKENS = {"upgrade", "アップグレード"};

bool is_upgrade_banner(const std::string& row);

// Returns {id, available version} for a row listing an installed and an
// available version side by side.
std::optional<std::pair<std::string, std::string>> parse_upgrade_row(const std::string& row);

// Parses "list upgradable" output. A repeated id keeps the last row's version.
UpgradeMap parse_upgrade_list(std::string_view output);
