#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// Per-user state directory when one is known, else the system log dir
fs::path default_log_dir() {
    if (const char* state = getenv("XDG_STATE_HOME"); state && *state) {
        return fs::path(state) / "updchk" / "logs";
    }
    if (const char* home = getenv("HOME"); home && *home) {
        return fs::path(home) / ".local/state/updchk/logs";
    }
    return UPDCHK_LOG_DIR;
}

fs::path ROOT_DIR = "/";
fs::path CONFIG_DIR = UPDCHK_CONF_DIR;
fs::path L10N_DIR = UPDCHK_L10N_DIR;
fs::path LOG_DIR = default_log_dir();

// Derived paths
fs::path TOOL_CONF = fs::path(UPDCHK_CONF_DIR) / "tool.conf";

namespace {
    std::string g_tool_override;
    bool g_log_dir_overridden = false;
}

void set_root_path(const std::string& root_path) {
    ROOT_DIR = fs::path(root_path).lexically_normal();
    if (ROOT_DIR.empty()) ROOT_DIR = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return ROOT_DIR / p.relative_path();
        }
        return ROOT_DIR / p;
    };

    CONFIG_DIR = rebase(UPDCHK_CONF_DIR);
    L10N_DIR = rebase(UPDCHK_L10N_DIR);
    if (!g_log_dir_overridden) {
        LOG_DIR = rebase(UPDCHK_LOG_DIR);
    }

    TOOL_CONF = CONFIG_DIR / "tool.conf";
}

void set_log_dir(const std::string& log_dir) {
    if (log_dir.empty()) {
        g_log_dir_overridden = false;
        return;
    }
    LOG_DIR = fs::path(log_dir).lexically_normal();
    g_log_dir_overridden = true;
}

void init_filesystem() {
    ensure_dir_exists(LOG_DIR);
}

void set_tool_command(const std::string& tool) {
    g_tool_override = tool;
}

std::string get_tool_command() {
    if (!g_tool_override.empty()) {
        return g_tool_override;
    }

    std::ifstream tool_file(TOOL_CONF);
    if (!tool_file.is_open()) {
        return DEFAULT_TOOL;
    }
    std::string line;
    while (std::getline(tool_file, line)) {
        std::string tool = trim(line);
        if (tool.empty() || tool[0] == '#') continue;
        return tool;
    }
    throw UpdchkException(string_format("error.invalid_tool_config", TOOL_CONF.string()));
}
