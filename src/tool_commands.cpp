#include "tool_commands.hpp"
#include "utils.hpp"

namespace {
const std::vector<std::string> UNATTENDED_FLAGS = {
    "--silent", "--accept-package-agreements", "--accept-source-agreements"};
}

ToolCommands::ToolCommands(std::string tool) : tool_(std::move(tool)) {}

std::vector<std::string> ToolCommands::list_installed() const {
    return {tool_, "list", "--disable-interactivity"};
}

std::vector<std::string> ToolCommands::list_upgradable() const {
    return {tool_, "upgrade", "--disable-interactivity"};
}

std::vector<std::string> ToolCommands::update_one(const std::string& id) const {
    std::vector<std::string> argv = {tool_, "upgrade", id};
    argv.insert(argv.end(), UNATTENDED_FLAGS.begin(), UNATTENDED_FLAGS.end());
    return argv;
}

std::vector<std::string> ToolCommands::update_all() const {
    std::vector<std::string> argv = {tool_, "upgrade", "--all"};
    argv.insert(argv.end(), UNATTENDED_FLAGS.begin(), UNATTENDED_FLAGS.end());
    return argv;
}

std::string format_command(const std::vector<std::string>& argv) {
    return join(argv, " ");
}
