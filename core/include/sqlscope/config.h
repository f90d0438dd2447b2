#pragma once

#include <cstddef>
#include <string>

namespace sqlscope {

/// Settings for the analyzer and its result cache.
struct AnalyzerConfig {
  /// Maximum cached results; 0 keeps every result.
  size_t cache_capacity = 256;
  /// Joins above this count raise a COMPLEX_QUERY suggestion.
  size_t complex_join_threshold = 3;
  bool cache_enabled = true;
};

/// Resolves the config file location from SQLSCOPE_CONFIG, XDG_CONFIG_HOME, or HOME.
/// MUST return a usable relative fallback when no environment variable is set.
std::string resolve_config_path();
/// Loads `key = value` settings into out, starting from defaults.
/// Returns false when the file is absent or invalid; error is set only for invalid content.
/// An absent file resets out to defaults; invalid content leaves out unchanged.
bool load_analyzer_config(const std::string& path, AnalyzerConfig& out, std::string& error);
/// Applies SQLSCOPE_CACHE_CAPACITY, SQLSCOPE_JOIN_THRESHOLD and SQLSCOPE_CACHE on top of out.
/// Returns false and sets error when a variable holds an invalid value; out keeps prior values.
bool apply_env_overrides(AnalyzerConfig& out, std::string& error);

}  // namespace sqlscope
