#include "test_harness.h"

#include <stdexcept>
#include <string>

#include "sqlscope/analyzer.h"
#include "sqlscope/parser.h"

namespace {

using namespace sqlscope;

AnalysisResult analyze_sql(const std::string& sql, const AnalyzerConfig& config = {}) {
  auto result = parse_sql(sql);
  if (!result.ok()) throw std::runtime_error("test query failed to parse: " + sql);
  return analyze_statement(result.statements[0], config);
}

bool has_suggestion(const AnalysisResult& result, const std::string& kind) {
  for (const auto& suggestion : result.suggestions) {
    if (suggestion.kind == kind) return true;
  }
  return false;
}

const Suggestion* find_suggestion(const AnalysisResult& result, const std::string& kind) {
  for (const auto& suggestion : result.suggestions) {
    if (suggestion.kind == kind) return &suggestion;
  }
  return nullptr;
}

void test_join_query_metadata() {
  auto result = analyze_sql("SELECT u.name, o.total FROM users u JOIN orders o ON u.id = o.user_id");
  expect_true(result.query_type == QueryType::Select, "select query");
  expect_eq(result.tables.size(), 2, "two tables");
  if (result.tables.size() == 2) {
    expect_true(result.tables[0].name == "users" &&
                    result.tables[0].alias == std::optional<std::string>("u"),
                "users aliased u");
    expect_true(result.tables[1].name == "orders" && result.tables[1].usage == "SELECT",
                "orders used by select");
  }
  expect_eq(result.columns.size(), 4, "select and join columns");
  if (result.columns.size() == 4) {
    expect_true(result.columns[0].name == "name" && result.columns[0].usage == "SELECT",
                "name in select");
    expect_true(result.columns[2].name == "id" && result.columns[2].usage == "JOIN",
                "id in join");
    expect_true(result.columns[2].table == std::optional<std::string>("u"), "qualifier kept");
  }
  expect_eq(result.joins.size(), 1, "one join");
  if (!result.joins.empty()) {
    expect_true(result.joins[0].type == JoinType::Inner, "inner join");
    expect_true(result.joins[0].left_table == std::optional<std::string>("users"), "left users");
    expect_true(result.joins[0].right_table == "orders", "right orders");
    expect_true(result.joins[0].condition == "u.id = o.user_id", "rendered condition");
  }
  expect_eq(static_cast<size_t>(result.complexity_score), 2, "one join adds one");
}

void test_left_table_inference() {
  auto result = analyze_sql(
      "SELECT * FROM a JOIN b ON a.id = b.id JOIN c ON A.id = c.aid JOIN d ON d.flag = 1");
  expect_eq(result.joins.size(), 3, "three joins");
  if (result.joins.size() != 3) return;
  expect_true(result.joins[0].left_table == std::optional<std::string>("a"), "first from a");
  expect_true(result.joins[1].left_table == std::optional<std::string>("a"),
              "qualifier resolved case-insensitively");
  expect_true(result.joins[2].left_table == std::optional<std::string>("c"),
              "falls back to previous table");
}

void test_complexity_score() {
  auto simple = analyze_sql("SELECT a FROM t");
  expect_eq(static_cast<size_t>(simple.complexity_score), 1, "baseline");
  auto listed = analyze_sql("SELECT a FROM t1, t2 WHERE a > 5 ORDER BY a DESC");
  expect_eq(static_cast<size_t>(listed.complexity_score), 3, "extra table and where");
  auto rich = analyze_sql(
      "SELECT dept, COUNT(*) FROM emp e JOIN d ON e.d = d.id "
      "WHERE e.a = 1 AND e.b = 2 GROUP BY dept HAVING COUNT(*) > 1");
  expect_eq(static_cast<size_t>(rich.complexity_score), 8, "weighted sum");
  expect_true(rich.complexity_score > listed.complexity_score, "richer query scores higher");
}

void test_column_usage_and_dedup() {
  auto result = analyze_sql(
      "SELECT a, a, b FROM t WHERE a = 1 GROUP BY b HAVING MAX(c) > 0 ORDER BY b");
  expect_eq(result.columns.size(), 6, "one entry per column and clause");
  if (result.columns.size() != 6) return;
  expect_true(result.columns[0].usage == "SELECT", "select usage");
  expect_true(result.columns[2].name == "a" && result.columns[2].usage == "WHERE", "where usage");
  expect_true(result.columns[3].usage == "GROUP BY", "group by usage");
  expect_true(result.columns[4].name == "c" && result.columns[4].usage == "HAVING",
              "having usage");
  expect_true(result.columns[5].usage == "ORDER BY", "order by usage");
}

void test_complex_query_threshold() {
  std::string sql =
      "SELECT a.x FROM a JOIN b ON a.id = b.id JOIN c ON a.id = c.id "
      "JOIN d ON a.id = d.id JOIN e ON a.id = e.id WHERE a.x = 1";
  auto result = analyze_sql(sql);
  const Suggestion* complex = find_suggestion(result, "COMPLEX_QUERY");
  expect_true(complex != nullptr, "four joins exceed default threshold");
  if (complex) {
    expect_true(complex->severity == Severity::Info, "info severity");
  }
  AnalyzerConfig relaxed;
  relaxed.complex_join_threshold = 4;
  expect_true(!has_suggestion(analyze_sql(sql, relaxed), "COMPLEX_QUERY"),
              "join count at threshold is fine");
}

void test_select_star_suggestion() {
  auto star = analyze_sql("SELECT * FROM t WHERE id = 1");
  const Suggestion* suggestion = find_suggestion(star, "SELECT_STAR");
  expect_true(suggestion != nullptr && suggestion->severity == Severity::Warning, "star warned");
  expect_true(!has_suggestion(analyze_sql("SELECT COUNT(*) FROM t"), "SELECT_STAR"),
              "count star is fine");
}

void test_missing_where_suggestion() {
  expect_true(has_suggestion(analyze_sql("SELECT a FROM t1, t2"), "MISSING_WHERE"),
              "cross product without where");
  expect_true(!has_suggestion(analyze_sql("SELECT a FROM t1"), "MISSING_WHERE"),
              "single table is fine");
  expect_true(!has_suggestion(analyze_sql("SELECT a FROM t1, t2 WHERE t1.id = t2.id"),
                              "MISSING_WHERE"),
              "filtered join is fine");
}

void test_top_without_order_by() {
  expect_true(has_suggestion(analyze_sql("SELECT TOP 5 a FROM t"), "TOP_WITHOUT_ORDER_BY"),
              "unordered top");
  expect_true(!has_suggestion(analyze_sql("SELECT TOP 5 a FROM t ORDER BY a"),
                              "TOP_WITHOUT_ORDER_BY"),
              "ordered top");
}

void test_predicate_suggestions() {
  auto wildcard = analyze_sql("SELECT a FROM t WHERE name LIKE '%son'");
  expect_true(has_suggestion(wildcard, "LEADING_WILDCARD"), "leading wildcard");
  auto prefix = analyze_sql("SELECT a FROM t WHERE name LIKE 'son%'");
  expect_true(!has_suggestion(prefix, "LEADING_WILDCARD"), "prefix search is fine");
  auto wrapped = analyze_sql("SELECT a FROM t WHERE YEAR(created) = 2020");
  expect_true(has_suggestion(wrapped, "NON_SARGABLE_PREDICATE"), "function on column");
  auto constant = analyze_sql("SELECT a FROM t WHERE created > GETDATE()");
  expect_true(!has_suggestion(constant, "NON_SARGABLE_PREDICATE"), "function on constant");
  auto projected = analyze_sql("SELECT UPPER(a) FROM t WHERE a = 1");
  expect_true(!has_suggestion(projected, "NON_SARGABLE_PREDICATE"), "select list ignored");
}

void test_statement_stubs() {
  TableReference table;
  table.schema = "dbo";
  table.name = "audit";
  Statement insert = InsertStatement{table};
  auto result = analyze_statement(insert);
  expect_true(result.query_type == QueryType::Insert, "insert type");
  expect_eq(result.tables.size(), 1, "target table");
  expect_true(!result.tables.empty() && result.tables[0].usage == "INSERT", "insert usage");
  expect_eq(static_cast<size_t>(result.complexity_score), 1, "baseline complexity");
  Statement removal = DeleteStatement{table};
  expect_true(analyze_statement(removal).query_type == QueryType::Delete, "delete type");
}

void test_analyzer_idempotent() {
  auto parsed = parse_sql("SELECT * FROM a JOIN b ON a.id = b.id WHERE a.v LIKE '%x'");
  expect_true(parsed.ok(), "query parses");
  if (!parsed.ok()) return;
  Analyzer analyzer;
  auto cold = analyzer.analyze(parsed.statements[0]);
  auto warm = analyzer.analyze(parsed.statements[0]);
  expect_true(cold == warm, "warm call returns cached instance");
  expect_eq(analyzer.computations(), 1, "computed once");
  expect_true(analysis_to_json(*cold).dump() == analysis_to_json(*warm).dump(), "identical output");
  std::string direct = analysis_to_json(analyze_statement(parsed.statements[0])).dump();
  expect_true(direct == analysis_to_json(*cold).dump(), "cache matches direct analysis");
}

void test_analyzer_cache_disabled() {
  auto parsed = parse_sql("SELECT a FROM t");
  if (!parsed.ok()) return;
  AnalyzerConfig config;
  config.cache_enabled = false;
  Analyzer analyzer(config);
  auto first = analyzer.analyze(parsed.statements[0]);
  auto second = analyzer.analyze(parsed.statements[0]);
  expect_eq(analyzer.computations(), 2, "every call computes");
  expect_eq(analyzer.cache().size(), 0, "cache untouched");
  expect_true(analysis_to_json(*first) == analysis_to_json(*second), "same content");
}

void test_equivalent_text_shares_entry() {
  auto a = parse_sql("SELECT a FROM t WHERE a = 1");
  auto b = parse_sql("select a\nfrom t\nwhere a = 1 -- again");
  if (!a.ok() || !b.ok()) return;
  Analyzer analyzer;
  auto first = analyzer.analyze(a.statements[0]);
  auto second = analyzer.analyze(b.statements[0]);
  expect_true(first == second, "same fingerprint shares result");
  expect_eq(analyzer.computations(), 1, "one computation");
}

void test_analysis_json_document() {
  auto result = analyze_sql("SELECT TOP 1 u.id FROM dbo.users u LEFT JOIN t ON u.id = t.uid");
  nlohmann::json doc = analysis_to_json(result);
  expect_true(doc["query_type"] == "SELECT", "query type");
  expect_true(doc["tables"][0]["schema"] == "dbo", "table schema");
  expect_true(doc["joins"][0]["type"] == "LEFT", "join type");
  expect_true(doc["joins"][0]["left_table"] == "users", "left table");
  expect_true(doc["complexity_score"] == 2, "complexity");
  bool found = false;
  for (const auto& suggestion : doc["suggestions"]) {
    if (suggestion["type"] == "TOP_WITHOUT_ORDER_BY") {
      found = suggestion["severity"] == "INFO";
    }
  }
  expect_true(found, "suggestion serialized");
}

void test_null_statement_rejected() {
  Statement empty = std::unique_ptr<SelectStatement>();
  bool threw = false;
  try {
    analyze_statement(empty);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "null select rejected");
}

}  // namespace

void register_analyzer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"analyzer_join_query_metadata", test_join_query_metadata});
  tests.push_back({"analyzer_left_table_inference", test_left_table_inference});
  tests.push_back({"analyzer_complexity_score", test_complexity_score});
  tests.push_back({"analyzer_column_usage_and_dedup", test_column_usage_and_dedup});
  tests.push_back({"analyzer_complex_query_threshold", test_complex_query_threshold});
  tests.push_back({"analyzer_select_star", test_select_star_suggestion});
  tests.push_back({"analyzer_missing_where", test_missing_where_suggestion});
  tests.push_back({"analyzer_top_without_order_by", test_top_without_order_by});
  tests.push_back({"analyzer_predicate_suggestions", test_predicate_suggestions});
  tests.push_back({"analyzer_statement_stubs", test_statement_stubs});
  tests.push_back({"analyzer_idempotent", test_analyzer_idempotent});
  tests.push_back({"analyzer_cache_disabled", test_analyzer_cache_disabled});
  tests.push_back({"analyzer_equivalent_text_shares_entry", test_equivalent_text_shares_entry});
  tests.push_back({"analyzer_json_document", test_analysis_json_document});
  tests.push_back({"analyzer_null_statement_rejected", test_null_statement_rejected});
}
