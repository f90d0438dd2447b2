#include "sqlscope/analyzer.h"

#include <cstring>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "sqlscope/render.h"
#include "../util/string_util.h"

namespace sqlscope {

namespace {

constexpr const char* kUsageSelect = "SELECT";
constexpr const char* kUsageJoin = "JOIN";
constexpr const char* kUsageWhere = "WHERE";
constexpr const char* kUsageGroupBy = "GROUP BY";
constexpr const char* kUsageHaving = "HAVING";
constexpr const char* kUsageOrderBy = "ORDER BY";

const ColumnRef* as_column(const Expr& expr) {
  const auto* column = std::get_if<std::unique_ptr<ColumnRef>>(&expr);
  if (column == nullptr) return nullptr;
  if (!*column) throw std::invalid_argument("null column reference");
  return column->get();
}

const FunctionCall* as_call(const Expr& expr) {
  const auto* call = std::get_if<std::unique_ptr<FunctionCall>>(&expr);
  if (call == nullptr) return nullptr;
  if (!*call) throw std::invalid_argument("null function call");
  return call->get();
}

bool references_column(const Expr& expr) {
  std::vector<const BinaryExpr*> spine;
  const Expr& leaf = left_spine(expr, spine);
  if (as_column(leaf) != nullptr) return true;
  if (const FunctionCall* call = as_call(leaf)) {
    for (const auto& arg : call->args) {
      if (references_column(arg)) return true;
    }
  }
  for (const BinaryExpr* binary : spine) {
    if (references_column(binary->right)) return true;
  }
  return false;
}

/// Counts AND/OR connectives so `a = 1 AND b = 2` counts as two predicates.
int count_connectives(const Expr& expr) {
  std::vector<const BinaryExpr*> spine;
  left_spine(expr, spine);
  int count = 0;
  for (const BinaryExpr* binary : spine) {
    if (binary->op == "AND" || binary->op == "OR") ++count;
    count += count_connectives(binary->right);
  }
  return count;
}

/// Collects column qualifiers in left-to-right order.
void collect_qualifiers(const Expr& expr, std::vector<std::string>& out) {
  std::vector<const BinaryExpr*> spine;
  const Expr& leaf = left_spine(expr, spine);
  if (const ColumnRef* column = as_column(leaf)) {
    if (column->table.has_value()) out.push_back(*column->table);
  } else if (const FunctionCall* call = as_call(leaf)) {
    for (const auto& arg : call->args) {
      collect_qualifiers(arg, out);
    }
  }
  for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
    collect_qualifiers((*it)->right, out);
  }
}

/// Single pass over a SELECT tree accumulating metadata into an AnalysisResult.
/// Tracks the clause being walked so every column records where it was used.
class SelectWalker {
 public:
  SelectWalker(const AnalyzerConfig& config, AnalysisResult& out) : config_(config), out_(out) {}

  void walk(const SelectStatement& select) {
    for (const auto& column : select.columns) {
      if (std::holds_alternative<StarExpr>(column)) select_star_ = true;
      walk_expr(column, kUsageSelect);
    }
    if (select.from.has_value()) {
      for (const auto& table : select.from->tables) {
        add_table(table);
      }
    }
    for (const auto& join : select.joins) {
      if (!join) throw std::invalid_argument("null join clause");
      walk_join(*join);
    }
    if (select.where.has_value()) {
      walk_expr(*select.where, kUsageWhere);
    }
    for (const auto& key : select.group_by) {
      walk_expr(key, kUsageGroupBy);
    }
    if (select.having.has_value()) {
      walk_expr(*select.having, kUsageHaving);
    }
    for (const auto& item : select.order_by) {
      walk_expr(item.expr, kUsageOrderBy);
    }
    out_.complexity_score = complexity(select);
    suggest(select);
  }

 private:
  void add_table(const TableReference& table) {
    TableInfo info;
    info.name = table.name;
    info.schema = table.schema;
    info.alias = table.alias;
    info.usage = query_type_name(out_.query_type);
    out_.tables.push_back(info);
    known_tables_[util::to_lower(table.name)] = table.name;
    if (table.alias.has_value()) {
      known_tables_[util::to_lower(*table.alias)] = table.name;
    }
  }

  void walk_join(const JoinClause& join) {
    JoinInfo info;
    info.type = join.type;
    info.right_table = join.table.name;
    info.condition = render_expr(join.condition);
    info.left_table = infer_left_table(join);
    out_.joins.push_back(info);
    add_table(join.table);
    walk_expr(join.condition, kUsageJoin);
  }

  /// Picks the first condition qualifier naming a table other than the joined one,
  /// falling back to the most recently introduced table.
  std::optional<std::string> infer_left_table(const JoinClause& join) const {
    std::unordered_set<std::string> right_keys = {util::to_lower(join.table.name)};
    if (join.table.alias.has_value()) right_keys.insert(util::to_lower(*join.table.alias));
    std::vector<std::string> qualifiers;
    collect_qualifiers(join.condition, qualifiers);
    for (const auto& qualifier : qualifiers) {
      std::string key = util::to_lower(qualifier);
      if (right_keys.count(key) > 0) continue;
      auto it = known_tables_.find(key);
      if (it != known_tables_.end()) return it->second;
    }
    if (out_.tables.empty()) return std::nullopt;
    return out_.tables.back().name;
  }

  /// Visits the leftmost operand first, then each right side from the innermost node out,
  /// so columns keep source order. Only the right sides recurse.
  void walk_expr(const Expr& expr, const char* usage) {
    std::vector<const BinaryExpr*> spine;
    const Expr& leaf = left_spine(expr, spine);
    if (const ColumnRef* column = as_column(leaf)) {
      add_column(*column, usage);
    } else if (const FunctionCall* call = as_call(leaf)) {
      ++function_calls_;
      for (const auto& arg : call->args) {
        if (std::strcmp(usage, kUsageWhere) == 0 && references_column(arg)) non_sargable_ = true;
        walk_expr(arg, usage);
      }
    }
    for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
      const BinaryExpr& binary = **it;
      if (binary.op == "LIKE") {
        const auto* pattern = std::get_if<Literal>(&binary.right);
        if (pattern != nullptr) {
          const auto* text = std::get_if<std::string>(&pattern->value);
          if (text != nullptr && !text->empty() && (*text)[0] == '%') leading_wildcard_ = true;
        }
      }
      walk_expr(binary.right, usage);
    }
  }

  void add_column(const ColumnRef& column, const char* usage) {
    std::string key = column.table.value_or("") + "\n" + column.column + "\n" + usage;
    if (!seen_columns_.insert(key).second) return;
    ColumnInfo info;
    info.table = column.table;
    info.name = column.column;
    info.usage = usage;
    out_.columns.push_back(info);
  }

  int complexity(const SelectStatement& select) const {
    int score = 1;
    score += static_cast<int>(select.joins.size());
    if (select.from.has_value() && select.from->tables.size() > 1) {
      score += static_cast<int>(select.from->tables.size() - 1);
    }
    if (select.where.has_value()) {
      score += 1 + count_connectives(*select.where);
    }
    score += static_cast<int>(select.group_by.size());
    if (select.having.has_value()) ++score;
    score += function_calls_;
    return score;
  }

  void suggest(const SelectStatement& select) {
    size_t join_count = select.joins.size();
    if (join_count > config_.complex_join_threshold) {
      add_suggestion("COMPLEX_QUERY",
                     "Query joins " + std::to_string(join_count + 1) +
                         " tables; consider splitting it into smaller queries or staging "
                         "intermediate results in temporary tables",
                     Severity::Info);
    }
    if (select_star_) {
      add_suggestion("SELECT_STAR",
                     "SELECT * returns every column; list only the columns the caller needs",
                     Severity::Warning);
    }
    if (out_.tables.size() > 1 && !select.where.has_value()) {
      add_suggestion("MISSING_WHERE",
                     "Query reads " + std::to_string(out_.tables.size()) +
                         " tables without a WHERE clause; the result may be much larger than "
                         "intended",
                     Severity::Warning);
    }
    if (select.top.has_value() && select.order_by.empty()) {
      add_suggestion("TOP_WITHOUT_ORDER_BY",
                     "TOP without ORDER BY returns an arbitrary set of rows",
                     Severity::Info);
    }
    if (leading_wildcard_) {
      add_suggestion("LEADING_WILDCARD",
                     "LIKE pattern starts with '%', which prevents index seeks",
                     Severity::Warning);
    }
    if (non_sargable_) {
      add_suggestion("NON_SARGABLE_PREDICATE",
                     "WHERE applies a function to a column, which prevents index seeks on it",
                     Severity::Warning);
    }
  }

  void add_suggestion(const std::string& kind, const std::string& description, Severity severity) {
    Suggestion suggestion;
    suggestion.kind = kind;
    suggestion.description = description;
    suggestion.severity = severity;
    out_.suggestions.push_back(suggestion);
  }

  const AnalyzerConfig& config_;
  AnalysisResult& out_;
  std::unordered_map<std::string, std::string> known_tables_;
  std::unordered_set<std::string> seen_columns_;
  int function_calls_ = 0;
  bool select_star_ = false;
  bool leading_wildcard_ = false;
  bool non_sargable_ = false;
};

AnalysisResult analyze_target(QueryType type, const TableReference& table) {
  AnalysisResult out;
  out.query_type = type;
  TableInfo info;
  info.name = table.name;
  info.schema = table.schema;
  info.alias = table.alias;
  info.usage = query_type_name(type);
  out.tables.push_back(info);
  out.complexity_score = 1;
  return out;
}

}  // namespace

const char* query_type_name(QueryType type) {
  switch (type) {
    case QueryType::Select: return "SELECT";
    case QueryType::Insert: return "INSERT";
    case QueryType::Update: return "UPDATE";
    case QueryType::Delete: return "DELETE";
  }
  return "SELECT";
}

const char* severity_name(Severity severity) {
  switch (severity) {
    case Severity::Info: return "INFO";
    case Severity::Warning: return "WARNING";
    case Severity::Critical: return "CRITICAL";
  }
  return "INFO";
}

AnalysisResult analyze_statement(const Statement& statement, const AnalyzerConfig& config) {
  if (const auto* select = std::get_if<std::unique_ptr<SelectStatement>>(&statement)) {
    if (!*select) throw std::invalid_argument("null select statement");
    AnalysisResult out;
    out.query_type = QueryType::Select;
    SelectWalker walker(config, out);
    walker.walk(**select);
    return out;
  }
  if (const auto* insert = std::get_if<InsertStatement>(&statement)) {
    return analyze_target(QueryType::Insert, insert->table);
  }
  if (const auto* update = std::get_if<UpdateStatement>(&statement)) {
    return analyze_target(QueryType::Update, update->table);
  }
  return analyze_target(QueryType::Delete, std::get<DeleteStatement>(statement).table);
}

Analyzer::Analyzer(AnalyzerConfig config)
    : config_(config), cache_(config.cache_capacity) {}

std::shared_ptr<const AnalysisResult> Analyzer::analyze(const Statement& statement) {
  if (!config_.cache_enabled) {
    ++computations_;
    return std::make_shared<const AnalysisResult>(analyze_statement(statement, config_));
  }
  return cache_.get_or_compute(fingerprint(statement), [&]() {
    ++computations_;
    return analyze_statement(statement, config_);
  });
}

}  // namespace sqlscope
