#include "parser_internal.h"

namespace sqlscope {

/// Parses FROM followed by one or more comma-separated table references.
bool Parser::parse_from(FromClause& from) {
  advance();
  while (true) {
    TableReference table;
    if (!parse_table_reference(table)) return false;
    from.tables.push_back(std::move(table));
    if (!current_is(TokenType::Comma)) break;
    advance();
  }
  return true;
}

/// Parses `[schema.]name [[AS] alias]`.
/// MUST treat the first identifier as the schema only when a dot follows it.
bool Parser::parse_table_reference(TableReference& table) {
  if (!current_is(TokenType::Identifier)) {
    return unexpected_token("table name");
  }
  std::string first = current_.text;
  advance();

  if (current_is(TokenType::Dot)) {
    advance();
    if (!current_is(TokenType::Identifier)) {
      return unexpected_token("table name after '.'");
    }
    table.schema = first;
    table.name = current_.text;
    advance();
  } else {
    table.name = first;
  }

  if (current_is(TokenType::KeywordAs)) {
    advance();
    if (!current_is(TokenType::Identifier)) {
      return unexpected_token("alias after AS");
    }
    table.alias = current_.text;
    advance();
  } else if (current_is(TokenType::Identifier)) {
    table.alias = current_.text;
    advance();
  }
  return true;
}

/// Parses `[INNER|LEFT|RIGHT|FULL [OUTER]] JOIN table ON condition`.
/// MUST default a bare JOIN to INNER and MUST release the pooled clause on failure.
bool Parser::parse_join(std::unique_ptr<JoinClause>& out) {
  auto join = pool_->acquire_join();
  if (current_is(TokenType::KeywordJoin)) {
    join->type = JoinType::Inner;
  } else {
    switch (current_.type) {
      case TokenType::KeywordLeft:
        join->type = JoinType::Left;
        break;
      case TokenType::KeywordRight:
        join->type = JoinType::Right;
        break;
      case TokenType::KeywordFull:
        join->type = JoinType::Full;
        break;
      default:
        join->type = JoinType::Inner;
        break;
    }
    if (join->type != JoinType::Inner && peek_is_word("OUTER")) {
      advance();
    }
    if (!expect_peek(TokenType::KeywordJoin)) return discard(std::move(join));
  }
  advance();

  if (!parse_table_reference(join->table)) return discard(std::move(join));

  if (!current_is(TokenType::KeywordOn)) {
    unexpected_token("ON after JOIN table");
    return discard(std::move(join));
  }
  advance();

  if (!parse_expr(join->condition)) return discard(std::move(join));
  out = std::move(join);
  return true;
}

}  // namespace sqlscope
