#pragma once

#include <string>

namespace sqlscope::util {

/// Folds ASCII letters to lowercase; bytes outside ASCII pass through untouched.
/// Used for alias and table lookups, which SQL Server compares case-insensitively.
std::string to_lower(const std::string& s);
/// Folds ASCII letters to uppercase for keyword and word matching.
std::string to_upper(const std::string& s);
/// Compares two words ignoring ASCII case, e.g. `percent` and `PERCENT`.
bool iequals(const std::string& a, const char* b);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Removes one pair of matching single or double quotes around a value.
std::string strip_quotes(const std::string& s);

}  // namespace sqlscope::util
