#include "test_harness.h"

#include <string>

#include "sqlscope/analyzer.h"
#include "sqlscope/node_pool.h"
#include "sqlscope/parser.h"
#include "sqlscope/render.h"

namespace {

using namespace sqlscope;

const SelectStatement* first_select(const ParseResult& result) {
  if (result.statements.empty()) return nullptr;
  const auto* select = std::get_if<std::unique_ptr<SelectStatement>>(&result.statements[0]);
  return select != nullptr ? select->get() : nullptr;
}

const BinaryExpr* binary_of(const Expr& expr) {
  const auto* binary = std::get_if<std::unique_ptr<BinaryExpr>>(&expr);
  return binary != nullptr ? binary->get() : nullptr;
}

void test_flat_left_associativity() {
  auto result = parse_sql("SELECT a + b * c FROM t");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr, "arithmetic parses");
  if (!select) return;
  const BinaryExpr* top = binary_of(select->columns[0]);
  expect_true(top != nullptr && top->op == "*", "last operator at the root");
  if (!top) return;
  const BinaryExpr* left = binary_of(top->left);
  expect_true(left != nullptr && left->op == "+", "first operator on the left");
  expect_true(render_expr(select->columns[0]) == "a + b * c", "rendered chain");
}

void test_grouping_on_right() {
  auto result = parse_sql("SELECT a FROM t WHERE c = 3 AND (a = 1 OR b = 2)");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr && select->where.has_value(), "where parses");
  if (!select || !select->where) return;
  const BinaryExpr* top = binary_of(*select->where);
  expect_true(top != nullptr && top->op == "AND", "AND at the root");
  if (!top) return;
  const BinaryExpr* right = binary_of(top->right);
  expect_true(right != nullptr && right->op == "OR", "grouped OR on the right");
  expect_true(render_expr(*select->where) == "c = 3 AND (a = 1 OR b = 2)", "rendered grouping");
}

void test_keyword_operators_upper_cased() {
  auto result = parse_sql("SELECT a FROM t WHERE name like 'x%' or flag in (1)");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr && select->where.has_value(), "where parses");
  if (!select || !select->where) return;
  expect_true(render_expr(*select->where) == "name LIKE 'x%' OR flag IN 1",
              "keyword operators normalized");
}

void test_function_calls() {
  auto result = parse_sql("SELECT UPPER(t.name), COUNT(*), GETDATE(), ISNULL(a, 0) FROM t");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr, "function calls parse");
  if (!select) return;
  expect_eq(select->columns.size(), 4, "four projections");
  const auto* upper = std::get_if<std::unique_ptr<FunctionCall>>(&select->columns[0]);
  expect_true(upper != nullptr && (*upper)->name == "UPPER" && (*upper)->args.size() == 1,
              "single argument call");
  const auto* count = std::get_if<std::unique_ptr<FunctionCall>>(&select->columns[1]);
  expect_true(count != nullptr && (*count)->args.size() == 1 &&
                  std::holds_alternative<StarExpr>((*count)->args[0]),
              "count star argument");
  const auto* now = std::get_if<std::unique_ptr<FunctionCall>>(&select->columns[2]);
  expect_true(now != nullptr && (*now)->args.empty(), "empty argument list");
  expect_true(render_expr(select->columns[3]) == "ISNULL(a, 0)", "rendered call");
}

void test_qualified_star() {
  auto result = parse_sql("SELECT o.*, u.name FROM orders o JOIN users u ON o.uid = u.id");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr, "qualified star parses");
  if (!select) return;
  const auto* star = std::get_if<StarExpr>(&select->columns[0]);
  expect_true(star != nullptr && star->table == std::optional<std::string>("o"), "o.*");
}

void test_literals() {
  auto result = parse_sql("SELECT -5, 2.5, 'it''s', N'wide', 10000000000");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr, "literals parse");
  if (!select || select->columns.size() != 5) return;
  const auto* negative = std::get_if<Literal>(&select->columns[0]);
  expect_true(negative != nullptr && std::get_if<int64_t>(&negative->value) != nullptr &&
                  std::get<int64_t>(negative->value) == -5,
              "negative integer");
  const auto* decimal = std::get_if<Literal>(&select->columns[1]);
  expect_true(decimal != nullptr && std::get_if<double>(&decimal->value) != nullptr &&
                  std::get<double>(decimal->value) == 2.5,
              "decimal value");
  expect_true(render_expr(select->columns[2]) == "'it''s'", "escaped string rendered");
  const auto* wide = std::get_if<Literal>(&select->columns[3]);
  expect_true(wide != nullptr && std::get_if<std::string>(&wide->value) != nullptr &&
                  std::get<std::string>(wide->value) == "wide",
              "unicode string");
  const auto* big = std::get_if<Literal>(&select->columns[4]);
  expect_true(big != nullptr && std::get_if<int64_t>(&big->value) != nullptr &&
                  std::get<int64_t>(big->value) == 10000000000LL,
              "64-bit integer");
}

void test_number_out_of_range() {
  auto result = parse_sql("SELECT 99999999999999999999999 FROM t");
  expect_true(!result.errors.empty(), "overflow reported");
  if (result.errors.empty()) return;
  expect_true(result.errors[0].message.find("could not parse") != std::string::npos,
              "overflow message");
}

void test_unclosed_group() {
  auto result = parse_sql("SELECT (a + 1 FROM t");
  expect_eq(result.errors.size(), 1, "one error");
  if (result.errors.empty()) return;
  expect_true(result.errors[0].expected == "')' to close expression", "expected close paren");
}

void test_unclosed_call() {
  auto result = parse_sql("SELECT COUNT(a FROM t");
  expect_eq(result.errors.size(), 1, "one error");
  if (result.errors.empty()) return;
  expect_true(result.errors[0].expected == "')' to close function call", "expected close paren");
}

void test_missing_right_operand() {
  auto result = parse_sql("SELECT a FROM t WHERE a =");
  expect_eq(result.errors.size(), 1, "one error");
  if (result.errors.empty()) return;
  expect_true(result.errors[0].kind == ParseErrorKind::NoPrefixParse, "no prefix for EOF");
  expect_true(result.errors[0].message.find("EOF") != std::string::npos, "message names EOF");
}

void test_bracketed_identifiers_render() {
  auto result = parse_sql("SELECT [order].[select], [plain] FROM [order]");
  const SelectStatement* select = first_select(result);
  expect_true(result.ok() && select != nullptr, "bracketed identifiers parse");
  if (!select) return;
  expect_true(render_expr(select->columns[0]) == "[order].[select]", "keywords stay quoted");
  expect_true(render_expr(select->columns[1]) == "plain", "plain name unquoted");
}

std::string where_chain(size_t extra_terms) {
  std::string sql = "SELECT a FROM t WHERE a = 1";
  for (size_t i = 0; i < extra_terms; ++i) {
    sql += " AND a = 1";
  }
  return sql;
}

void test_long_chain() {
  const size_t terms = 200000;
  std::string sql = where_chain(terms);
  NodePool pool;
  ParseOptions options;
  options.pool = &pool;
  auto result = parse_sql(sql, options);
  expect_true(result.ok(), "long chain parses");
  if (!result.ok()) return;
  const SelectStatement* select = first_select(result);
  expect_true(select != nullptr && select->where.has_value(), "where present");
  if (select == nullptr || !select->where.has_value()) return;
  std::string text = render_expr(*select->where);
  expect_true(text.compare(0, 15, "a = 1 AND a = 1") == 0, "rendered from the left");
  nlohmann::json where = expr_to_json(*select->where);
  expect_eq(where["ops"].size(), 2 * terms + 1, "chain emitted flat");
  expect_true(!fingerprint(result.statements[0]).empty(), "fingerprint computed");
  AnalysisResult analysis = analyze_statement(result.statements[0], AnalyzerConfig{});
  expect_eq(static_cast<size_t>(analysis.complexity_score), terms + 2, "every AND counted");
  expect_eq(analysis.columns.size(), 2, "select and where columns");
  pool.reclaim(std::move(result));
  expect_true(pool.stats().released > 2 * terms, "chain returned to the pool");

  // Destroyed without a pool on scope exit.
  auto unpooled = parse_sql(sql);
  expect_true(unpooled.ok(), "second long chain parses");
}

std::string nested_groups(size_t depth) {
  return "SELECT a FROM t WHERE " + std::string(depth, '(') + "a = 1" + std::string(depth, ')');
}

void test_nesting_limit() {
  auto shallow = parse_sql(nested_groups(200));
  expect_true(shallow.ok(), "200 levels parse");

  auto deep = parse_sql(nested_groups(100000));
  expect_eq(deep.errors.size(), 1, "one nesting error");
  expect_true(deep.statements.empty(), "statement dropped");
  if (deep.errors.empty()) return;
  expect_true(deep.errors[0].kind == ParseErrorKind::UnexpectedToken, "nesting kind");
  expect_true(deep.errors[0].message.find("nested too deeply") != std::string::npos,
              "nesting message");

  std::string calls = "SELECT ";
  for (int i = 0; i < 1000; ++i) calls += "f(";
  calls += "a";
  calls += std::string(1000, ')');
  auto nested_calls = parse_sql(calls + "; SELECT b FROM u");
  expect_eq(nested_calls.errors.size(), 1, "one error for nested calls");
  expect_eq(nested_calls.statements.size(), 1, "next statement recovered");
}

}  // namespace

void register_expression_tests(std::vector<TestCase>& tests) {
  tests.push_back({"expr_flat_left_associativity", test_flat_left_associativity});
  tests.push_back({"expr_grouping_on_right", test_grouping_on_right});
  tests.push_back({"expr_keyword_operators", test_keyword_operators_upper_cased});
  tests.push_back({"expr_function_calls", test_function_calls});
  tests.push_back({"expr_qualified_star", test_qualified_star});
  tests.push_back({"expr_literals", test_literals});
  tests.push_back({"expr_number_out_of_range", test_number_out_of_range});
  tests.push_back({"expr_unclosed_group", test_unclosed_group});
  tests.push_back({"expr_unclosed_call", test_unclosed_call});
  tests.push_back({"expr_missing_right_operand", test_missing_right_operand});
  tests.push_back({"expr_bracketed_identifiers", test_bracketed_identifiers_render});
  tests.push_back({"expr_long_chain", test_long_chain});
  tests.push_back({"expr_nesting_limit", test_nesting_limit});
}
