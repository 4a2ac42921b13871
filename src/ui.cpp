#include "ui.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace {

constexpr size_t COLUMN_GAP = 2;

bool is_wide(char32_t cp) {
    return (cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0xA4CF) ||
           (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) || (cp >= 0xFF00 && cp <= 0xFF60) ||
           (cp >= 0xFFE0 && cp <= 0xFFE6) || (cp >= 0x1F300 && cp <= 0x1FAFF);
}

std::string pad(const std::string& text, size_t width) {
    const size_t w = display_width(text);
    return w >= width ? text : text + std::string(width - w, ' ');
}

std::string_view status_color(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::Updatable: return COLOR_GREEN;
        case UpdateStatus::Unknown: return COLOR_DIM;
        case UpdateStatus::UpToDate:
        default: return COLOR_WHITE;
    }
}

} // anonymous namespace

size_t display_width(std::string_view text) {
    size_t width = 0;
    for (size_t i = 0; i < text.size();) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 1;
        char32_t cp = lead;
        if (lead >= 0xF0) { length = 4; cp = lead & 0x07; }
        else if (lead >= 0xE0) { length = 3; cp = lead & 0x0F; }
        else if (lead >= 0xC0) { length = 2; cp = lead & 0x1F; }
        for (size_t k = 1; k < length && i + k < text.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        width += is_wide(cp) ? 2 : 1;
        i += length;
    }
    return width;
}

std::string status_label(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::Updatable: return get_string("label.status_update");
        case UpdateStatus::UpToDate: return get_string("label.status_uptodate");
        case UpdateStatus::Unknown:
        default: return get_string("label.status_unknown");
    }
}

void print_records(const RecordList& records) {
    const std::array<std::string, 5> headers = {
        get_string("label.name"), get_string("label.id"), get_string("label.installed"),
        get_string("label.available"), get_string("label.status")};

    std::vector<std::array<std::string, 5>> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        rows.push_back({record.name, record.id, record.installed_version,
                        record.available_version.value_or("-"), status_label(record.status())});
    }

    std::array<size_t, 5> widths{};
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = display_width(headers[c]);
        for (const auto& row : rows) {
            widths[c] = std::max(widths[c], display_width(row[c]));
        }
    }

    const bool color = stdout_is_tty();
    auto print_row = [&](const std::array<std::string, 5>& cells) {
        std::string line;
        for (size_t c = 0; c < cells.size(); ++c) {
            line += c + 1 < cells.size() ? pad(cells[c], widths[c] + COLUMN_GAP) : cells[c];
        }
        return line;
    };

    std::cout << print_row(headers) << '\n';
    size_t total_width = 0;
    for (auto w : widths) total_width += w + COLUMN_GAP;
    std::cout << std::string(total_width, '-') << '\n';

    for (size_t i = 0; i < rows.size(); ++i) {
        if (color) {
            std::cout << status_color(records[i].status()) << print_row(rows[i]) << COLOR_RESET << '\n';
        } else {
            std::cout << print_row(rows[i]) << '\n';
        }
    }
    std::cout.flush();
}

void print_counts(const InventoryState& state) {
    log_info(string_format("info.counts", state.records.size(), state.update_count));
}

void print_update_summary(const UpdateSummary& summary) {
    if (summary.all_succeeded()) {
        log_info(string_format("info.update_success", summary.succeeded, summary.total()));
        return;
    }

    log_warning(string_format("warning.update_partial", summary.succeeded, summary.total()));
    if (summary.bulk) {
        log_warning(string_format("warning.bulk_failed", summary.error_text.value_or("")));
        return;
    }
    for (const auto& item : summary.items) {
        if (item.success) continue;
        log_warning(string_format("warning.update_item_failed", item.id, item.error_text.value_or("")));
    }
}
