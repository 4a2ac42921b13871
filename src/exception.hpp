#pragma once

#include <stdexcept>
#include <string>

class UpdchkException : public std::runtime_error {
public:
    explicit UpdchkException(const std::string& message)
        : std::runtime_error(message) {}
};

// The external package tool could not be located or started.
class ToolUnavailableError : public UpdchkException {
public:
    explicit ToolUnavailableError(const std::string& message)
        : UpdchkException(message) {}
};
