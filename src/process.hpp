#pragma once

#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;

    bool ok() const { return exit_code == 0; }
};

// Synchronous command execution, called from worker threads.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Throws ToolUnavailableError when argv[0] cannot be started.
    virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// fork/execv runner capturing stdout and stderr through pipes.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv) override;
};

// Resolves a command name against PATH. Names containing '/' are checked as
// given. Returns an empty string when nothing executable is found.
std::string find_executable(const std::string& command);
