#include "config.hpp"
#include "coordinator.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "session_log.hpp"
#include "tool_commands.hpp"
#include "ui.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr size_t CONFIRM_PREVIEW = 5;

// Console side of the session: everything goes to the audit log, status
// lines and failures are also shown to the user.
class CliEventSink : public EventSink {
public:
    explicit CliEventSink(SessionLog& log) : log_(log) {}

    void scan_completed(const RecordList& records) override { log_.scan_completed(records); }
    void updates_found(const RecordList& records) override { log_.updates_found(records); }
    void update_started(const std::vector<std::string>& ids, bool is_bulk) override {
        log_.update_started(ids, is_bulk);
    }
    void update_result(const std::string& id, bool success, const std::optional<std::string>& error_text) override {
        log_.update_result(id, success, error_text);
    }
    void bulk_update_result(const std::vector<std::string>& ids, bool success,
                            const std::optional<std::string>& error_text) override {
        log_.bulk_update_result(ids, success, error_text);
    }
    void session_summary(size_t total, size_t updatable_count, size_t applied_count) override {
        log_.session_summary(total, updatable_count, applied_count);
    }
    void status(const std::string& message) override {
        log_.status(message);
        log_info(message);
    }
    void debug(const std::string& message) override { log_.debug(message); }
    void error(const std::string& message) override { log_.error(message); }

private:
    SessionLog& log_;
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.scan_desc") << std::endl;
    std::cerr << get_string("info.check_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.update_desc") << std::endl;
    std::cerr << get_string("info.log_path_desc") << std::endl;
}

void pre_operation_check(const cxxopts::ParseResult& result, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    size_t count = result.count("packages") ? result["packages"].as<std::vector<std::string>>().size() : 0;
    if (count < min || (max.has_value() && count > max.value())) {
        print_usage_func();
        throw UpdchkException(get_string("error.invalid_arg_count"));
    }
}

// Runs one cycle to completion. Returns false when the cycle failed.
bool run_cycle(Coordinator& coordinator, bool (Coordinator::*request)()) {
    if (!(coordinator.*request)()) {
        throw UpdchkException(get_string("error.operation_in_progress"));
    }
    coordinator.run_until_idle();
    const CycleResult result = coordinator.last_result();
    if (result == CycleResult::SCAN_FAILED || result == CycleResult::CHECK_FAILED) {
        log_error(coordinator.last_error());
        return false;
    }
    return true;
}

std::string confirm_preview(const std::vector<std::string>& ids) {
    std::vector<std::string> shown(ids.begin(), ids.begin() + std::min(ids.size(), CONFIRM_PREVIEW));
    std::string preview = join(shown, ", ");
    if (ids.size() > CONFIRM_PREVIEW) preview += "...";
    return preview;
}

// Keeps only the requested ids whose record currently has an update.
std::vector<std::string> select_updatable(const RecordList& records, const std::vector<std::string>& requested) {
    std::vector<std::string> targets;
    for (const auto& id : requested) {
        const PackageRecord* record = find_record(records, id);
        if (record == nullptr) {
            log_warning(string_format("warning.unknown_package", id));
        } else if (!record->has_update()) {
            log_warning(string_format("warning.no_update_for", id));
        } else {
            targets.push_back(id);
        }
    }
    return targets;
}

int run_update(Coordinator& coordinator, const cxxopts::ParseResult& result, std::function<void()> usage_printer) {
    const bool update_all = result["all"].as<bool>();
    if (update_all) {
        pre_operation_check(result, usage_printer, 0, 0);
    } else {
        pre_operation_check(result, usage_printer, 1);
    }

    if (!run_cycle(coordinator, &Coordinator::request_scan) ||
        !run_cycle(coordinator, &Coordinator::request_check)) {
        return 1;
    }

    std::vector<std::string> targets;
    if (update_all) {
        targets = updatable_ids(coordinator.records());
    } else {
        targets = select_updatable(coordinator.records(), result["packages"].as<std::vector<std::string>>());
    }

    if (targets.empty()) {
        log_info(get_string("info.nothing_to_update"));
        return 0;
    }

    const std::string prompt = update_all
        ? string_format("prompt.update_all", targets.size())
        : string_format("prompt.update_selected", targets.size(), confirm_preview(targets));
    if (!user_confirms(prompt)) {
        log_info(get_string("info.update_cancelled"));
        return 0;
    }

    const bool accepted = update_all ? coordinator.request_update_all()
                                     : coordinator.request_update(targets);
    if (!accepted) {
        throw UpdchkException(get_string("error.operation_in_progress"));
    }
    // Includes the rescan that follows every update run
    coordinator.run_until_idle();

    const auto& summary = coordinator.last_update();
    if (summary) {
        print_update_summary(*summary);
    }
    if (coordinator.last_result() == CycleResult::SCAN_FAILED) {
        log_error(coordinator.last_error());
        return 1;
    }
    return summary && summary->all_succeeded() ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("a,all", get_string("help.all"), cxxopts::value<bool>()->default_value("false"))
            ("f,filter", get_string("help.filter"), cxxopts::value<std::string>()->default_value("all"))
            ("s,search", get_string("help.search"), cxxopts::value<std::string>()->default_value(""))
            ("non-interactive", get_string("info.non_interactive_option_desc"), cxxopts::value<std::string>()->implicit_value("y"))
            ("tool", get_string("help.tool"), cxxopts::value<std::string>())
            ("log-dir", get_string("help.log_dir"), cxxopts::value<std::string>())
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("root")) {
            set_root_path(result["root"].as<std::string>());
        }

        if (result.count("log-dir")) {
            set_log_dir(result["log-dir"].as<std::string>());
        }

        if (result.count("tool")) {
            set_tool_command(result["tool"].as<std::string>());
        }

        if (result.count("non-interactive")) {
            std::string value = result["non-interactive"].as<std::string>();
            if (value == "y" || value == "Y") {
                set_non_interactive_mode(NonInteractiveMode::YES);
            } else if (value == "n" || value == "N") {
                set_non_interactive_mode(NonInteractiveMode::NO);
            } else {
                log_error(get_string("error.invalid_non_interactive_value"));
                return 1;
            }
        }

        const auto filter = parse_record_filter(result["filter"].as<std::string>());
        if (!filter) {
            log_error(string_format("error.invalid_filter", result["filter"].as<std::string>()));
            return 1;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };

        if (command == "log-path") {
            pre_operation_check(result, usage_printer, 0, 0);
            std::cout << LOG_DIR.string() << std::endl;
            return 0;
        }

        if (command != "scan" && command != "check" && command != "list" && command != "update") {
            usage_printer();
            return 1;
        }

        init_filesystem();
        SessionLog session_log(LOG_DIR);
        CliEventSink events(session_log);

        Coordinator coordinator(std::make_shared<PosixProcessRunner>(), ToolCommands(get_tool_command()),
                                events, DEFAULT_SOURCE);
        coordinator.set_record_observer(print_counts);

        int exit_status = 0;
        if (command == "scan") {
            pre_operation_check(result, usage_printer, 0, 0);
            if (run_cycle(coordinator, &Coordinator::request_scan)) {
                print_records(coordinator.records());
            } else {
                exit_status = 1;
            }
        } else if (command == "check" || command == "list") {
            pre_operation_check(result, usage_printer, 0, 0);
            if (run_cycle(coordinator, &Coordinator::request_scan) &&
                run_cycle(coordinator, &Coordinator::request_check)) {
                const RecordFilter effective = command == "check" && !result.count("filter")
                    ? RecordFilter::Updates : *filter;
                print_records(filter_records(coordinator.records(), result["search"].as<std::string>(), effective));
            } else {
                exit_status = 1;
            }
        } else {
            exit_status = run_update(coordinator, result, usage_printer);
        }

        coordinator.run_until_idle();
        coordinator.shutdown();
        log_info(string_format("info.log_written", session_log.path().string()));
        return exit_status;

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const UpdchkException& e) {
        log_error(string_format("error.updchk_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
