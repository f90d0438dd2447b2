#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sqlscope/analysis_cache.h"
#include "sqlscope/ast.h"
#include "sqlscope/config.h"

namespace sqlscope {

enum class QueryType { Select, Insert, Update, Delete };
enum class Severity { Info, Warning, Critical };

struct TableInfo {
  std::string name;
  std::optional<std::string> schema;
  std::optional<std::string> alias;
  std::string usage;
};

/// A column occurrence; `table` is the qualifier as written, `usage` the clause it appeared in.
struct ColumnInfo {
  std::optional<std::string> table;
  std::string name;
  std::string usage;
};

struct JoinInfo {
  JoinType type = JoinType::Inner;
  std::optional<std::string> left_table;
  std::string right_table;
  std::string condition;
};

struct Suggestion {
  std::string kind;
  std::string description;
  Severity severity = Severity::Info;
};

/// Metadata derived from one statement.
/// MUST NOT be mutated once published through the cache.
struct AnalysisResult {
  QueryType query_type = QueryType::Select;
  std::vector<TableInfo> tables;
  std::vector<ColumnInfo> columns;
  std::vector<JoinInfo> joins;
  int complexity_score = 0;
  std::vector<Suggestion> suggestions;
};

const char* query_type_name(QueryType type);
const char* severity_name(Severity severity);

/// Derives tables, columns, joins, complexity and suggestions from a parsed statement.
/// MUST depend only on the tree and config; the same input always yields the same result.
/// Throws std::invalid_argument when the statement holds a null node.
AnalysisResult analyze_statement(const Statement& statement, const AnalyzerConfig& config = {});

/// Document handed to external formatters.
nlohmann::json analysis_to_json(const AnalysisResult& result);

/// Analysis entry point wrapped in a fingerprint-keyed result cache.
/// MUST be safe to call from several threads at once.
class Analyzer {
 public:
  explicit Analyzer(AnalyzerConfig config = {});

  std::shared_ptr<const AnalysisResult> analyze(const Statement& statement);

  const AnalyzerConfig& config() const { return config_; }
  AnalysisCache& cache() { return cache_; }
  /// Number of analyses actually computed, cache hits excluded.
  size_t computations() const { return computations_.load(); }

 private:
  AnalyzerConfig config_;
  AnalysisCache cache_;
  std::atomic<size_t> computations_{0};
};

}  // namespace sqlscope
