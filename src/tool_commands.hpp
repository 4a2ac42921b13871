#pragma once

#include <string>
#include <vector>

// Command lines issued to the package tool. Write commands run silently and
// accept package and source agreements.
class ToolCommands {
public:
    explicit ToolCommands(std::string tool);

    const std::string& tool() const { return tool_; }

    std::vector<std::string> list_installed() const;
    std::vector<std::string> list_upgradable() const;
    std::vector<std::string> update_one(const std::string& id) const;
    std::vector<std::string> update_all() const;

private:
    std::string tool_;
};

std::string format_command(const std::vector<std::string>& argv);
