#pragma once

#include <string_view>

// True when the token starts with a dotted numeric run ("1.2", "10.0.19045",
// "1.0.0-beta"). Both listing parsers classify tokens with this.
bool looks_like_version(std::string_view token);
