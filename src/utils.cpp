#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    NonInteractiveMode non_interactive_mode = NonInteractiveMode::INTERACTIVE;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

bool stdout_is_tty() {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    return is_stdout_tty;
}

void set_non_interactive_mode(NonInteractiveMode mode) {
    non_interactive_mode = mode;
}

NonInteractiveMode get_non_interactive_mode() {
    return non_interactive_mode;
}

bool user_confirms(const std::string& prompt) {
    switch (get_non_interactive_mode()) {
        case NonInteractiveMode::YES:
            return true;
        case NonInteractiveMode::NO:
            return false;
        case NonInteractiveMode::INTERACTIVE:
        default:
            std::cout << prompt << " " << get_string("prompt.yes_no") << " ";
            std::string response;
            std::cin >> response;
            return (response == "y" || response == "Y");
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw UpdchkException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw UpdchkException(string_format("error.path_not_dir", path.string()));
    }
}

std::string trim(std::string_view text) {
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (first >= last) return {};
    return std::string(first, last);
}

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        // Tools writing to a console may emit CRLF and bare CR progress frames
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (const auto cr = line.rfind('\r'); cr != std::string::npos) {
            line.erase(0, cr + 1);
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<std::string> split_whitespace(std::string_view line) {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string(line)};
    std::string token;
    while (stream >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator, size_t begin, size_t end) {
    end = std::min(end, parts.size());
    std::string result;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) result += separator;
        result += parts[i];
    }
    return result;
}
