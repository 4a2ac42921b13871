#pragma once

#include "record.hpp"

#include <optional>
#include <string>
#include <vector>

// Receives the discrete events of a session. Called from the coordinating
// thread only.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void scan_completed(const RecordList& records) = 0;
    virtual void updates_found(const RecordList& records) = 0;
    virtual void update_started(const std::vector<std::string>& ids, bool is_bulk) = 0;
    virtual void update_result(const std::string& id, bool success, const std::optional<std::string>& error_text) = 0;
    // Single outcome of an "update all" invocation; no per-id results exist.
    virtual void bulk_update_result(const std::vector<std::string>& ids, bool success,
                                    const std::optional<std::string>& error_text) = 0;
    virtual void session_summary(size_t total, size_t updatable_count, size_t applied_count) = 0;

    virtual void status(const std::string& message) { (void)message; }
    virtual void debug(const std::string& message) { (void)message; }
    virtual void error(const std::string& message) { (void)message; }
};
