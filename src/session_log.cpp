#include "session_log.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const std::string RULE_WIDE(60, '=');
const std::string RULE_NARROW(50, '-');

std::string timestamp(const char* pattern) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, pattern);
    return out.str();
}

} // anonymous namespace

fs::path session_log_filename(const fs::path& log_dir) {
    return log_dir / ("updchk_" + timestamp("%Y%m%d_%H%M%S") + ".log");
}

SessionLog::SessionLog(const fs::path& log_dir) : path_(session_log_filename(log_dir)) {
    ensure_dir_exists(log_dir);
    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        throw UpdchkException(string_format("error.create_file_failed", path_.string()));
    }
    info(RULE_WIDE);
    info("Update checker session started");
    info("Log file: " + path_.string());
    info(RULE_WIDE);
}

SessionLog::~SessionLog() {
    info("Session closed");
}

void SessionLog::write(std::string_view level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mtx_);
    file_ << timestamp("%Y-%m-%d %H:%M:%S") << " | " << std::format("{:<8}", level) << " | " << message << '\n';
    file_.flush();
}

void SessionLog::info(const std::string& message) { write("INFO", message); }
void SessionLog::warning(const std::string& message) { write("WARNING", message); }
void SessionLog::error(const std::string& message) { write("ERROR", message); }
void SessionLog::debug(const std::string& message) { write("DEBUG", message); }
void SessionLog::status(const std::string& message) { write("INFO", "Status: " + message); }

void SessionLog::scan_completed(const RecordList& records) {
    info(std::format("Detected {} installed packages", records.size()));
    info(RULE_NARROW);
    for (const auto& record : records) {
        debug(std::format("  {} | {} | v{}", record.name, record.id, record.installed_version));
    }
}

void SessionLog::updates_found(const RecordList& records) {
    info(std::format("Updates available: {}", count_updatable(records)));
    info(RULE_NARROW);
    for (const auto& record : records) {
        if (!record.has_update()) continue;
        info("  UPDATE: " + record.name);
        info(std::format("          {} -> {}", record.installed_version, *record.available_version));
    }
}

void SessionLog::update_started(const std::vector<std::string>& ids, bool is_bulk) {
    if (is_bulk) {
        info(std::format("Starting update: ALL PACKAGES ({})", ids.size()));
        return;
    }
    info(std::format("Starting update: {} packages", ids.size()));
    for (const auto& id : ids) {
        info("  - " + id);
    }
}

void SessionLog::update_result(const std::string& id, bool success, const std::optional<std::string>& error_text) {
    if (success) {
        info("  SUCCESS: " + id);
        return;
    }
    error("  FAILED: " + id);
    if (error_text && !error_text->empty()) {
        error("    Error: " + *error_text);
    }
}

void SessionLog::bulk_update_result(const std::vector<std::string>& ids, bool success,
                                    const std::optional<std::string>& error_text) {
    if (success) {
        info(std::format("All {} updates completed successfully", ids.size()));
        return;
    }
    warning(std::format("Bulk update of {} packages reported failure; some may have been applied", ids.size()));
    if (error_text && !error_text->empty()) {
        warning("    Error: " + *error_text);
    }
}

void SessionLog::session_summary(size_t total, size_t updatable_count, size_t applied_count) {
    info(RULE_WIDE);
    info("SESSION SUMMARY");
    info(std::format("  Total software detected: {}", total));
    info(std::format("  Updates available: {}", updatable_count));
    info(std::format("  Updates applied: {}", applied_count));
    info(RULE_WIDE);
}
