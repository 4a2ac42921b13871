#include "record.hpp"
#include "utils.hpp"

#include <algorithm>

size_t count_updatable(const RecordList& records) {
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
                                             [](const PackageRecord& r) { return r.has_update(); }));
}

std::vector<std::string> updatable_ids(const RecordList& records) {
    std::vector<std::string> ids;
    for (const auto& record : records) {
        if (record.has_update()) {
            ids.push_back(record.id);
        }
    }
    return ids;
}

RecordList filter_records(const RecordList& records, const std::string& search, RecordFilter filter) {
    const std::string needle = to_lower(search);
    RecordList result;
    for (const auto& record : records) {
        if (!needle.empty() &&
            to_lower(record.name).find(needle) == std::string::npos &&
            to_lower(record.id).find(needle) == std::string::npos) {
            continue;
        }
        if (filter == RecordFilter::Updates && !record.has_update()) continue;
        if (filter == RecordFilter::UpToDate && record.has_update()) continue;
        result.push_back(record);
    }
    return result;
}

std::optional<RecordFilter> parse_record_filter(const std::string& value) {
    if (value == "all") return RecordFilter::All;
    if (value == "updates") return RecordFilter::Updates;
    if (value == "uptodate") return RecordFilter::UpToDate;
    return std::nullopt;
}

const PackageRecord* find_record(const RecordList& records, const std::string& id) {
    auto it = std::find_if(records.begin(), records.end(),
                           [&](const PackageRecord& r) { return r.id == id; });
    return it == records.end() ? nullptr : &*it;
}
