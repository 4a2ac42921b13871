#pragma once

#include <string>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path ROOT_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path LOG_DIR;

// Derived paths
extern std::filesystem::path TOOL_CONF;

// Provenance tag stamped on every record
inline const std::string DEFAULT_SOURCE = "winget";
inline const std::string DEFAULT_TOOL = "winget";

// Functions
std::filesystem::path default_log_dir();
void set_root_path(const std::string& root_path);
void set_log_dir(const std::string& log_dir);
void init_filesystem();
void set_tool_command(const std::string& tool); // Manually override the package tool
std::string get_tool_command();
