#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_DIM = "\033[2;37m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
bool stdout_is_tty();

// Interactive mode control
enum class NonInteractiveMode {
    INTERACTIVE,
    YES,
    NO
};

void set_non_interactive_mode(NonInteractiveMode mode);
NonInteractiveMode get_non_interactive_mode();

bool user_confirms(const std::string& prompt);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// Text utilities
std::string trim(std::string_view text);
std::string to_lower(std::string_view text);
std::vector<std::string> split_lines(std::string_view text);
std::vector<std::string> split_whitespace(std::string_view line);
std::string join(const std::vector<std::string>& parts, std::string_view separator,
                 size_t begin = 0, size_t end = std::string::npos);
