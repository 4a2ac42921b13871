#pragma once

#include "record.hpp"

// Merges upgrade data into the records in place. A record is matched by id
// first, then by display name. Unmatched records that were never checked
// become up to date; records already resolved are left alone, so running it
// again with the same map changes nothing. Returns the number of records
// that have an update afterwards.
size_t reconcile(RecordList& records, const UpgradeMap& upgrades);
