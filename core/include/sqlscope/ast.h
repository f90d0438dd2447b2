#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlscope {

struct Literal {
  std::variant<int64_t, double, std::string> value;
};

/// `*` or `table.*` in a select list or expression.
struct StarExpr {
  std::optional<std::string> table;
};

struct ColumnRef;
struct BinaryExpr;
struct FunctionCall;

/// Closed set of expression shapes; every node holds exactly one alternative.
/// MUST keep single ownership so the tree never shares or cycles nodes.
/// Heap alternatives are never null in a tree returned by the parser.
using Expr = std::variant<Literal,
                          StarExpr,
                          std::unique_ptr<ColumnRef>,
                          std::unique_ptr<BinaryExpr>,
                          std::unique_ptr<FunctionCall>>;

/// Column reference; `table` is set only when a qualifying dot was parsed.
struct ColumnRef {
  std::optional<std::string> table;
  std::string column;
};

/// Infix operation chained left to right without precedence.
/// `op` holds the operator text, upper-cased for keyword operators.
/// Chains nest on the left, so the destructor unlinks the left spine in a loop.
struct BinaryExpr {
  BinaryExpr() = default;
  ~BinaryExpr();
  BinaryExpr(BinaryExpr&&) = default;
  BinaryExpr& operator=(BinaryExpr&&) = default;

  Expr left;
  std::string op;
  Expr right;
};

struct FunctionCall {
  std::string name;
  std::vector<Expr> args;
};

struct TopClause {
  int64_t count = 0;
  bool percent = false;
};

struct TableReference {
  std::optional<std::string> schema;
  std::string name;
  std::optional<std::string> alias;
};

struct FromClause {
  std::vector<TableReference> tables;
};

enum class JoinType { Inner, Left, Right, Full };

struct JoinClause {
  JoinType type = JoinType::Inner;
  TableReference table;
  Expr condition;
};

enum class SortDirection { Asc, Desc };

struct OrderByItem {
  Expr expr;
  SortDirection direction = SortDirection::Asc;
};

/// Parsed SELECT statement.
/// MUST have a non-empty column list and joins in source order when produced by the parser.
/// Inputs are parser productions; the tree is immutable once returned.
struct SelectStatement {
  bool distinct = false;
  std::optional<TopClause> top;
  std::vector<Expr> columns;
  std::optional<FromClause> from;
  std::vector<std::unique_ptr<JoinClause>> joins;
  std::optional<Expr> where;
  std::vector<Expr> group_by;
  std::optional<Expr> having;
  std::vector<OrderByItem> order_by;
  size_t line = 0;
  size_t column = 0;
};

// Statement bodies the grammar does not parse yet; the target table is all they carry.
struct InsertStatement {
  TableReference table;
};

struct UpdateStatement {
  TableReference table;
};

struct DeleteStatement {
  TableReference table;
};

using Statement = std::variant<std::unique_ptr<SelectStatement>,
                               InsertStatement,
                               UpdateStatement,
                               DeleteStatement>;

/// Collects the binary nodes along the left spine of `expr`, outermost first, and
/// returns the leftmost operand. A non-binary `expr` yields an empty spine and itself.
/// Throws std::invalid_argument on a null node.
const Expr& left_spine(const Expr& expr, std::vector<const BinaryExpr*>& spine);

const char* join_type_name(JoinType type);
const char* sort_direction_name(SortDirection direction);

}  // namespace sqlscope
