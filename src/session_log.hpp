#pragma once

#include "events.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>

// Audit log of one session: a timestamped file under the log directory.
class SessionLog : public EventSink {
public:
    explicit SessionLog(const std::filesystem::path& log_dir);
    ~SessionLog() override;

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void scan_completed(const RecordList& records) override;
    void updates_found(const RecordList& records) override;
    void update_started(const std::vector<std::string>& ids, bool is_bulk) override;
    void update_result(const std::string& id, bool success, const std::optional<std::string>& error_text) override;
    void bulk_update_result(const std::vector<std::string>& ids, bool success,
                            const std::optional<std::string>& error_text) override;
    void session_summary(size_t total, size_t updatable_count, size_t applied_count) override;

    void status(const std::string& message) override;
    void debug(const std::string& message) override;
    void error(const std::string& message) override;
    void info(const std::string& message);
    void warning(const std::string& message);

private:
    void write(std::string_view level, std::string_view message);

    std::filesystem::path path_;
    std::ofstream file_;
    std::mutex mtx_;
};

std::filesystem::path session_log_filename(const std::filesystem::path& log_dir);
