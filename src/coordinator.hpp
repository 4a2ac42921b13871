#pragma once

#include "channel.hpp"
#include "events.hpp"
#include "process.hpp"
#include "record.hpp"
#include "tool_commands.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Activity {
    IDLE,
    SCANNING,
    CHECKING,
    UPDATING
};

// Outcome of the most recently applied cycle
enum class CycleResult {
    NONE,
    SCAN_OK,
    SCAN_FAILED,
    CHECK_OK,
    CHECK_FAILED,
    UPDATE_DONE
};

struct UpdateItemResult {
    std::string id;
    bool success = false;
    std::optional<std::string> error_text;
};

struct UpdateSummary {
    bool bulk = false;
    std::vector<std::string> ids;
    size_t succeeded = 0;
    std::vector<UpdateItemResult> items; // empty in bulk mode
    std::optional<std::string> error_text; // bulk mode only

    size_t total() const { return ids.size(); }
    bool all_succeeded() const { return succeeded == ids.size(); }
};

struct ScanOutcome {
    bool ok = false;
    int exit_code = 0;
    RecordList records;
    std::string error;
};

struct CheckOutcome {
    bool ok = false;
    int exit_code = 0;
    UpgradeMap upgrades;
    std::string error;
};

struct UpdateOutcome {
    UpdateSummary summary;
};

using WorkerResult = std::variant<ScanOutcome, CheckOutcome, UpdateOutcome>;

// Record set owned by the coordinating thread
struct InventoryState {
    RecordList records;
    size_t update_count = 0;
};

// Drives scan, check and update cycles. Every external command runs on a
// detached worker thread; the worker hands its result back through a
// channel and the owning thread applies it. Only one cycle may be in
// flight; a request made while busy is rejected, not queued.
class Coordinator {
public:
    using RecordObserver = std::function<void(const InventoryState&)>;

    Coordinator(std::shared_ptr<ProcessRunner> runner, ToolCommands commands, EventSink& events,
                std::string source = "winget");
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    bool request_scan();
    bool request_check();
    // Updates each id with its own invocation, in order.
    bool request_update(std::vector<std::string> ids);
    // One "update all" invocation covering every record with an update.
    bool request_update_all();

    // Blocks until the in-flight worker reports, then applies its result.
    // Returns false when nothing is in flight or after shutdown.
    bool wait_and_apply();
    // Applies a result if one is already waiting.
    bool apply_pending();
    // Applies results until no cycle is in flight, including the rescan
    // that follows an update.
    void run_until_idle();

    // Emits the session summary and stops consuming worker results. A
    // worker still running is left alone and its result is dropped.
    // Workers parse with static objects, so the process must not return
    // from main while one is still running; drain with run_until_idle()
    // first.
    void shutdown();

    void set_record_observer(RecordObserver observer) { observer_ = std::move(observer); }

    Activity activity() const { return activity_; }
    bool busy() const { return activity_ != Activity::IDLE; }
    const InventoryState& state() const { return state_; }
    const RecordList& records() const { return state_.records; }
    size_t update_count() const { return state_.update_count; }
    CycleResult last_result() const { return last_result_; }
    const std::string& last_error() const { return last_error_; }
    const std::optional<UpdateSummary>& last_update() const { return last_update_; }
    size_t applied_count() const { return applied_count_; }

private:
    bool begin(Activity activity);
    template <typename Job>
    void launch(Job job);

    void apply(WorkerResult result);
    void apply_scan(ScanOutcome outcome);
    void apply_check(CheckOutcome outcome);
    void apply_update(UpdateOutcome outcome);
    void notify();

    std::shared_ptr<ProcessRunner> runner_;
    ToolCommands commands_;
    EventSink& events_;
    std::string source_;
    std::shared_ptr<ResultChannel<WorkerResult>> channel_;

    InventoryState state_;
    Activity activity_ = Activity::IDLE;
    CycleResult last_result_ = CycleResult::NONE;
    std::string last_error_;
    std::optional<UpdateSummary> last_update_;
    size_t applied_count_ = 0;
    bool shut_down_ = false;
    RecordObserver observer_;
};

// Runs one update batch synchronously. Exposed for the worker and tests.
UpdateSummary run_updates(ProcessRunner& runner, const ToolCommands& commands,
                          const std::vector<std::string>& ids, bool bulk);

// Text reported for a failed invocation: stderr, else stdout, else the code.
std::string failure_text(const ProcessResult& result);
