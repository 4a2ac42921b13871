#pragma once

#include "record.hpp"

#include <string>
#include <string_view>

// Parses one data row of the installed listing. Rows without a version
// token, or without a name in front of the id, yield nothing.
std::optional<PackageRecord> parse_inventory_row(const std::string& row, const std::string& source);

// Parses the full "list installed" output into records in listing order.
// available_version is left unset on every record.
RecordList parse_installed_list(std::string_view output, const std::string& source);
