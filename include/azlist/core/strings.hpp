#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// ASCII-only case helpers. ARM ids, type names and api-versions are ASCII.
std::string ToUpper(std::string_view s);
std::string ToLower(std::string_view s);
bool IEquals(std::string_view lhs, std::string_view rhs);

// Split on a single character. Empty fields are kept, so "a//b" yields
// {"a", "", "b"} and "a/" yields {"a", ""}.
std::vector<std::string> Split(std::string_view s, char sep);

std::string Join(const std::vector<std::string>& parts, std::string_view sep);

// Escape a string for embedding in a JSON string literal.
std::string JsonEscape(std::string_view s);

} // namespace azlist
