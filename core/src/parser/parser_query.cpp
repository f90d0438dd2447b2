#include "parser_internal.h"

#include <stdexcept>

namespace sqlscope {

/// Parses a SELECT statement and its optional clauses in grammar order.
/// MUST hand the pooled statement back to the pool on any failure.
/// Inputs are token streams positioned at SELECT; outputs are SelectStatement or errors.
bool Parser::parse_select(std::unique_ptr<SelectStatement>& out) {
  auto stmt = pool_->acquire_select();
  stmt->line = current_.line;
  stmt->column = current_.column;
  advance();

  if (current_is(TokenType::KeywordDistinct)) {
    stmt->distinct = true;
    advance();
  }

  if (current_is(TokenType::KeywordTop)) {
    TopClause top;
    if (!parse_top(top)) return discard(std::move(stmt));
    stmt->top = top;
  }

  if (!parse_select_list(stmt->columns)) return discard(std::move(stmt));

  if (current_is(TokenType::KeywordFrom)) {
    FromClause from;
    if (!parse_from(from)) return discard(std::move(stmt));
    stmt->from = std::move(from);
  }

  while (is_join_start(current_.type)) {
    std::unique_ptr<JoinClause> join;
    if (!parse_join(join)) return discard(std::move(stmt));
    stmt->joins.push_back(std::move(join));
  }

  if (current_is(TokenType::KeywordWhere)) {
    advance();
    Expr where;
    if (!parse_expr(where)) return discard(std::move(stmt));
    stmt->where = std::move(where);
  }

  if (current_is(TokenType::KeywordGroup)) {
    if (!expect_peek(TokenType::KeywordBy)) return discard(std::move(stmt));
    advance();
    if (!parse_expr_list(stmt->group_by)) return discard(std::move(stmt));
  }

  if (current_is(TokenType::KeywordHaving)) {
    advance();
    Expr having;
    if (!parse_expr(having)) return discard(std::move(stmt));
    stmt->having = std::move(having);
  }

  if (current_is(TokenType::KeywordOrder)) {
    if (!expect_peek(TokenType::KeywordBy)) return discard(std::move(stmt));
    advance();
    if (!parse_order_by(stmt->order_by)) return discard(std::move(stmt));
  }

  out = std::move(stmt);
  return true;
}

/// Parses `TOP n [PERCENT]`, accepting the parenthesized `TOP (n)` form.
bool Parser::parse_top(TopClause& top) {
  advance();
  bool parenthesized = false;
  if (current_is(TokenType::LParen)) {
    parenthesized = true;
    advance();
  }
  if (!current_is(TokenType::Number) || current_.text.find('.') != std::string::npos) {
    return unexpected_token("integer after TOP");
  }
  try {
    top.count = std::stoll(current_.text);
  } catch (const std::out_of_range&) {
    return unexpected_token("integer in range after TOP");
  }
  advance();
  if (parenthesized) {
    if (!current_is(TokenType::RParen)) return unexpected_token("')' after TOP count");
    advance();
  }
  if (current_is_word("PERCENT")) {
    top.percent = true;
    advance();
  }
  return true;
}

/// Parses the projection list; `*` is accepted anywhere in the list.
/// MUST leave columns non-empty on success.
bool Parser::parse_select_list(std::vector<Expr>& columns) {
  while (true) {
    if (current_is(TokenType::Star)) {
      columns.emplace_back(StarExpr{});
      advance();
    } else {
      Expr column;
      if (!parse_expr(column)) return false;
      columns.push_back(std::move(column));
    }
    if (!current_is(TokenType::Comma)) break;
    advance();
  }
  return true;
}

bool Parser::parse_expr_list(std::vector<Expr>& out) {
  while (true) {
    Expr expr;
    if (!parse_expr(expr)) return false;
    out.push_back(std::move(expr));
    if (!current_is(TokenType::Comma)) break;
    advance();
  }
  return true;
}

/// Parses ORDER BY items; direction defaults to ASC.
bool Parser::parse_order_by(std::vector<OrderByItem>& items) {
  while (true) {
    OrderByItem item;
    if (!parse_expr(item.expr)) return false;
    if (current_is_word("ASC")) {
      advance();
    } else if (current_is_word("DESC")) {
      item.direction = SortDirection::Desc;
      advance();
    }
    items.push_back(std::move(item));
    if (!current_is(TokenType::Comma)) break;
    advance();
  }
  return true;
}

}  // namespace sqlscope
