#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sqlscope/parser.h"
#include "lexer.h"

namespace sqlscope {

/// Recursive-descent parser with one token of lookahead.
/// MUST record errors instead of throwing and MUST return pooled nodes on every failure path.
/// Inputs are lexer tokens; outputs are ParseResult.
class Parser {
 public:
  /// Parentheses and function calls recurse; chains of infix operators do not.
  static constexpr size_t kMaxNestingDepth = 256;

  /// Reads two tokens so current_ and peek_ are both populated.
  Parser(const std::string& input, const ParseOptions& options);
  ParseResult parse();

 private:
  bool parse_statement(Statement& out);
  bool finish_statement();
  bool parse_select(std::unique_ptr<SelectStatement>& out);
  bool parse_top(TopClause& top);
  bool parse_select_list(std::vector<Expr>& columns);
  bool parse_expr_list(std::vector<Expr>& out);
  bool parse_order_by(std::vector<OrderByItem>& items);

  bool parse_from(FromClause& from);
  bool parse_table_reference(TableReference& table);
  bool parse_join(std::unique_ptr<JoinClause>& out);

  bool parse_expr(Expr& out);
  bool parse_primary(Expr& out);
  bool parse_identifier_expr(Expr& out);
  bool parse_function_call(const std::string& name, Expr& out);
  bool parse_number(Expr& out, bool negative);
  bool parse_grouped(Expr& out);
  /// Records an error when one more parenthesis or call would exceed kMaxNestingDepth.
  bool nesting_allowed();

  /// Skips to the next statement boundary after a failed statement.
  /// MUST advance at least one token so recovery always makes progress.
  void synchronize();
  bool discard(std::unique_ptr<SelectStatement> stmt);
  bool discard(std::unique_ptr<JoinClause> join);

  void advance();
  bool current_is(TokenType type) const { return current_.type == type; }
  bool peek_is(TokenType type) const { return peek_.type == type; }
  bool current_is_word(const char* word) const;
  bool peek_is_word(const char* word) const;
  /// Advances when peek_ matches, otherwise records a Syntax error without advancing.
  bool expect_peek(TokenType type);

  bool peek_error(TokenType expected);
  bool no_prefix_error();
  bool unexpected_token(const std::string& expected);
  bool set_error(ParseErrorKind kind, const std::string& message);
  ParseMetrics metrics() const;

  static bool is_infix_operator(TokenType type);
  static bool is_statement_start(TokenType type);
  static bool is_join_start(TokenType type);

  Lexer lexer_;
  const CancellationToken* cancel_ = nullptr;
  std::unique_ptr<NodePool> owned_pool_;
  NodePool* pool_ = nullptr;
  Token current_{};
  Token peek_{};
  std::vector<ParseError> errors_;
  bool cancelled_ = false;
  size_t depth_ = 0;
  size_t token_count_ = 0;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace sqlscope
