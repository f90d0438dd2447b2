#include "string_util.h"

#include <algorithm>
#include <cstring>

namespace sqlscope::util {

namespace {

char fold_lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

char fold_upper(char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string to_lower(const std::string& s) {
  std::string out(s.size(), '\0');
  std::transform(s.begin(), s.end(), out.begin(), fold_lower);
  return out;
}

std::string to_upper(const std::string& s) {
  std::string out(s.size(), '\0');
  std::transform(s.begin(), s.end(), out.begin(), fold_upper);
  return out;
}

bool iequals(const std::string& a, const char* b) {
  size_t len = std::strlen(b);
  if (a.size() != len) return false;
  for (size_t i = 0; i < len; ++i) {
    if (fold_upper(a[i]) != fold_upper(b[i])) return false;
  }
  return true;
}

std::string trim_ws(const std::string& s) {
  auto first = std::find_if_not(s.begin(), s.end(), is_blank);
  auto last = std::find_if_not(s.rbegin(), std::string::const_reverse_iterator(first), is_blank);
  return std::string(first, last.base());
}

std::string strip_quotes(const std::string& s) {
  if (s.size() < 2) return s;
  char open = s.front();
  if ((open == '"' || open == '\'') && s.back() == open) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

}  // namespace sqlscope::util
