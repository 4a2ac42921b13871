#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class UpdateStatus {
    Unknown,   // not checked yet
    UpToDate,
    Updatable
};

struct PackageRecord {
    std::string name;
    std::string id;
    std::string installed_version;
    std::optional<std::string> available_version;
    std::string source;

    // Derived from the two version fields on every call, never cached.
    bool has_update() const {
        return available_version.has_value() && *available_version != installed_version;
    }

    UpdateStatus status() const {
        if (!available_version) return UpdateStatus::Unknown;
        return has_update() ? UpdateStatus::Updatable : UpdateStatus::UpToDate;
    }

    bool operator==(const PackageRecord&) const = default;
};

using RecordList = std::vector<PackageRecord>;

// id-or-name -> available version, produced by the upgrade parser
using UpgradeMap = std::unordered_map<std::string, std::string>;

enum class RecordFilter {
    All,
    Updates,
    UpToDate
};

size_t count_updatable(const RecordList& records);
std::vector<std::string> updatable_ids(const RecordList& records);

// Case-insensitive search on name or id combined with a status filter.
// UpToDate keeps every record without an update, unknown ones included.
RecordList filter_records(const RecordList& records, const std::string& search, RecordFilter filter);
std::optional<RecordFilter> parse_record_filter(const std::string& value);

const PackageRecord* find_record(const RecordList& records, const std::string& id);
