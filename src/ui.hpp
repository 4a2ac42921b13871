#pragma once

#include "coordinator.hpp"
#include "record.hpp"

#include <string>
#include <string_view>

// Terminal columns taken by a UTF-8 string; East Asian wide characters
// count as two.
size_t display_width(std::string_view text);

std::string status_label(UpdateStatus status);
void print_records(const RecordList& records);
void print_counts(const InventoryState& state);
void print_update_summary(const UpdateSummary& summary);
