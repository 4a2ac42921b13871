#include "version.hpp"

#include <regex>
#include <string>

bool looks_like_version(std::string_view token) {
    static const std::regex version_regex(R"(^\d+(\.\d+)+)");
    return std::regex_search(token.begin(), token.end(), version_regex);
}
