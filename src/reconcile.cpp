#include "reconcile.hpp"

size_t reconcile(RecordList& records, const UpgradeMap& upgrades) {
    for (auto& record : records) {
        auto match = upgrades.find(record.id);
        if (match == upgrades.end()) {
            match = upgrades.find(record.name);
        }

        if (match != upgrades.end()) {
            record.available_version = match->second;
        } else if (!record.available_version) {
            record.available_version = record.installed_version;
        }
    }
    return count_updatable(records);
}
