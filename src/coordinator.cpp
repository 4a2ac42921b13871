#include "coordinator.hpp"
#include "inventory_parser.hpp"
#include "localization.hpp"
#include "reconcile.hpp"
#include "upgrade_parser.hpp"
#include "utils.hpp"

#include <thread>

std::string failure_text(const ProcessResult& result) {
    std::string text = trim(result.stderr_text);
    if (text.empty()) {
        text = trim(result.stdout_text);
    }
    if (text.empty()) {
        text = "exit code " + std::to_string(result.exit_code);
    }
    return text;
}

UpdateSummary run_updates(ProcessRunner& runner, const ToolCommands& commands,
                          const std::vector<std::string>& ids, bool bulk) {
    UpdateSummary summary;
    summary.bulk = bulk;
    summary.ids = ids;

    if (bulk) {
        try {
            ProcessResult result = runner.run(commands.update_all());
            if (result.ok()) {
                summary.succeeded = ids.size();
            } else {
                summary.error_text = failure_text(result);
            }
        } catch (const std::exception& e) {
            summary.error_text = e.what();
        }
        return summary;
    }

    // Failures never stop the batch
    for (const auto& id : ids) {
        UpdateItemResult item{id, false, std::nullopt};
        try {
            ProcessResult result = runner.run(commands.update_one(id));
            item.success = result.ok();
            if (!item.success) {
                item.error_text = failure_text(result);
            }
        } catch (const std::exception& e) {
            item.error_text = e.what();
        }
        if (item.success) ++summary.succeeded;
        summary.items.push_back(std::move(item));
    }
    return summary;
}

Coordinator::Coordinator(std::shared_ptr<ProcessRunner> runner, ToolCommands commands, EventSink& events,
                         std::string source)
    : runner_(std::move(runner)), commands_(std::move(commands)), events_(events), source_(std::move(source)),
      channel_(std::make_shared<ResultChannel<WorkerResult>>()) {}

Coordinator::~Coordinator() {
    channel_->close();
}

bool Coordinator::begin(Activity activity) {
    if (shut_down_ || activity_ != Activity::IDLE) {
        return false;
    }
    activity_ = activity;
    return true;
}

template <typename Job>
void Coordinator::launch(Job job) {
    // The worker keeps the channel alive on its own; a closed channel
    // silently drops the result.
    std::thread([channel = channel_, job = std::move(job)]() mutable {
        channel->push(job());
    }).detach();
}

bool Coordinator::request_scan() {
    if (!begin(Activity::SCANNING)) {
        events_.debug("Scan request rejected: another operation is in progress");
        return false;
    }
    events_.status(get_string("status.scanning"));
    events_.debug("Executing: " + format_command(commands_.list_installed()));

    launch([runner = runner_, commands = commands_, source = source_]() -> WorkerResult {
        ScanOutcome outcome;
        try {
            ProcessResult result = runner->run(commands.list_installed());
            outcome.exit_code = result.exit_code;
            outcome.records = parse_installed_list(result.stdout_text, source);
            outcome.ok = true;
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        return outcome;
    });
    return true;
}

bool Coordinator::request_check() {
    if (!begin(Activity::CHECKING)) {
        events_.debug("Check request rejected: another operation is in progress");
        return false;
    }
    events_.status(get_string("status.checking"));
    events_.debug("Executing: " + format_command(commands_.list_upgradable()));

    launch([runner = runner_, commands = commands_]() -> WorkerResult {
        CheckOutcome outcome;
        try {
            ProcessResult result = runner->run(commands.list_upgradable());
            outcome.exit_code = result.exit_code;
            outcome.upgrades = parse_upgrade_list(result.stdout_text);
            outcome.ok = true;
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        return outcome;
    });
    return true;
}

bool Coordinator::request_update(std::vector<std::string> ids) {
    if (ids.empty() || !begin(Activity::UPDATING)) {
        events_.debug("Update request rejected");
        return false;
    }
    events_.update_started(ids, false);
    events_.status(get_string("status.updating"));

    launch([runner = runner_, commands = commands_, ids = std::move(ids)]() -> WorkerResult {
        return UpdateOutcome{run_updates(*runner, commands, ids, false)};
    });
    return true;
}

bool Coordinator::request_update_all() {
    std::vector<std::string> ids = updatable_ids(state_.records);
    if (ids.empty() || !begin(Activity::UPDATING)) {
        events_.debug("Update request rejected");
        return false;
    }
    events_.update_started(ids, true);
    events_.status(get_string("status.updating"));
    events_.debug("Executing: " + format_command(commands_.update_all()));

    launch([runner = runner_, commands = commands_, ids = std::move(ids)]() -> WorkerResult {
        return UpdateOutcome{run_updates(*runner, commands, ids, true)};
    });
    return true;
}

bool Coordinator::wait_and_apply() {
    if (shut_down_ || activity_ == Activity::IDLE) {
        return false;
    }
    auto result = channel_->pop_wait();
    if (!result) {
        return false;
    }
    apply(std::move(*result));
    return true;
}

bool Coordinator::apply_pending() {
    if (shut_down_) {
        return false;
    }
    auto result = channel_->try_pop();
    if (!result) {
        return false;
    }
    apply(std::move(*result));
    return true;
}

void Coordinator::run_until_idle() {
    while (busy() && wait_and_apply()) {
    }
}

void Coordinator::shutdown() {
    if (shut_down_) return;
    events_.session_summary(state_.records.size(), state_.update_count, applied_count_);
    shut_down_ = true;
    channel_->close();
}

void Coordinator::apply(WorkerResult result) {
    activity_ = Activity::IDLE;
    std::visit([this](auto&& outcome) {
        using T = std::decay_t<decltype(outcome)>;
        if constexpr (std::is_same_v<T, ScanOutcome>) {
            apply_scan(std::move(outcome));
        } else if constexpr (std::is_same_v<T, CheckOutcome>) {
            apply_check(std::move(outcome));
        } else {
            apply_update(std::move(outcome));
        }
    }, std::move(result));
}

void Coordinator::apply_scan(ScanOutcome outcome) {
    if (!outcome.ok) {
        last_result_ = CycleResult::SCAN_FAILED;
        last_error_ = outcome.error;
        events_.error("Scan error: " + outcome.error);
        events_.status(string_format("status.error", outcome.error));
        return;
    }

    events_.debug("list returned code: " + std::to_string(outcome.exit_code));
    // A rescan replaces every record; nothing carries over
    state_.records = std::move(outcome.records);
    state_.update_count = count_updatable(state_.records);
    last_result_ = CycleResult::SCAN_OK;
    last_error_.clear();

    events_.scan_completed(state_.records);
    events_.status(string_format("status.scan_complete", state_.records.size()));
    notify();
}

void Coordinator::apply_check(CheckOutcome outcome) {
    if (!outcome.ok) {
        last_result_ = CycleResult::CHECK_FAILED;
        last_error_ = outcome.error;
        events_.error("Update check error: " + outcome.error);
        events_.status(string_format("status.error", outcome.error));
        return;
    }

    events_.debug("upgrade returned code: " + std::to_string(outcome.exit_code));
    state_.update_count = reconcile(state_.records, outcome.upgrades);
    last_result_ = CycleResult::CHECK_OK;
    last_error_.clear();

    events_.updates_found(state_.records);
    if (state_.update_count > 0) {
        events_.status(string_format("status.updates_available", state_.update_count));
    } else {
        events_.status(get_string("status.all_up_to_date"));
    }
    notify();
}

void Coordinator::apply_update(UpdateOutcome outcome) {
    UpdateSummary& summary = outcome.summary;
    applied_count_ += summary.succeeded;

    if (summary.bulk) {
        events_.bulk_update_result(summary.ids, summary.all_succeeded(), summary.error_text);
    } else {
        for (const auto& item : summary.items) {
            events_.update_result(item.id, item.success, item.error_text);
        }
    }

    if (summary.all_succeeded()) {
        events_.status(get_string("status.update_complete"));
    } else {
        events_.status(string_format("status.update_partial", summary.succeeded, summary.total()));
    }

    last_result_ = CycleResult::UPDATE_DONE;
    last_error_ = summary.all_succeeded() ? std::string() : summary.error_text.value_or(std::string());
    last_update_ = std::move(summary);

    // Installed versions are only trusted from a fresh listing
    request_scan();
}

void Coordinator::notify() {
    if (observer_) {
        observer_(state_);
    }
}
