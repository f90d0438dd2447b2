#include "sqlscope/config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "util/string_util.h"

namespace sqlscope {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true" || lower == "on" || lower == "1") {
    out = true;
    return true;
  }
  if (lower == "false" || lower == "off" || lower == "0") {
    out = false;
    return true;
  }
  return false;
}

bool parse_size(const std::string& raw, size_t& out) {
  if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) return false;
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size()) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

/// Applies one setting; keys are accepted with or without the analyzer section.
/// Unknown keys are ignored.
bool apply_setting(const std::string& full_key, const std::string& value, AnalyzerConfig& out) {
  std::string key = full_key;
  if (key.rfind("analyzer.", 0) == 0) key = key.substr(9);
  if (key == "cache_capacity") return parse_size(value, out.cache_capacity);
  if (key == "complex_join_threshold") return parse_size(value, out.complex_join_threshold);
  if (key == "cache_enabled") return parse_bool(value, out.cache_enabled);
  return true;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("SQLSCOPE_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "sqlscope" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "sqlscope" / "config.toml").string();
  }
  return "sqlscope.config.toml";
}

bool load_analyzer_config(const std::string& path, AnalyzerConfig& out, std::string& error) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    out = AnalyzerConfig{};
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  // Settings land in a copy so a rejected file leaves out untouched.
  AnalyzerConfig staged;
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      error = "Expected key = value at line " + std::to_string(line_no);
      return false;
    }
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::strip_quotes(util::trim_ws(trimmed.substr(eq + 1)));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    if (!apply_setting(full_key, value, staged)) {
      error = "Invalid " + full_key + " at line " + std::to_string(line_no);
      return false;
    }
  }
  out = staged;
  return true;
}

bool apply_env_overrides(AnalyzerConfig& out, std::string& error) {
  AnalyzerConfig updated = out;
  std::string capacity = get_env("SQLSCOPE_CACHE_CAPACITY");
  if (!capacity.empty() && !parse_size(capacity, updated.cache_capacity)) {
    error = "Invalid SQLSCOPE_CACHE_CAPACITY: " + capacity;
    return false;
  }
  std::string threshold = get_env("SQLSCOPE_JOIN_THRESHOLD");
  if (!threshold.empty() && !parse_size(threshold, updated.complex_join_threshold)) {
    error = "Invalid SQLSCOPE_JOIN_THRESHOLD: " + threshold;
    return false;
  }
  std::string enabled = get_env("SQLSCOPE_CACHE");
  if (!enabled.empty() && !parse_bool(enabled, updated.cache_enabled)) {
    error = "Invalid SQLSCOPE_CACHE: " + enabled;
    return false;
  }
  out = updated;
  return true;
}

}  // namespace sqlscope
