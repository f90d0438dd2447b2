#include "parser_internal.h"

#include <stdexcept>

namespace sqlscope {

namespace {

struct DepthGuard {
  explicit DepthGuard(size_t& depth) : depth_(depth) { ++depth_; }
  ~DepthGuard() { --depth_; }
  size_t& depth_;
};

}  // namespace

/// Parses `primary (op primary)*`, chaining strictly left to right.
/// MUST build BinaryExpr nodes in left-associative order without precedence.
/// Inputs are tokens; outputs are Expr or errors with partial nodes returned to the pool.
bool Parser::parse_expr(Expr& out) {
  Expr left;
  if (!parse_primary(left)) return false;
  while (is_infix_operator(current_.type)) {
    std::string op = current_.text;
    if (current_.type == TokenType::KeywordAnd || current_.type == TokenType::KeywordOr ||
        current_.type == TokenType::KeywordLike || current_.type == TokenType::KeywordIn) {
      op = token_type_name(current_.type);
    }
    advance();
    Expr right;
    if (!parse_primary(right)) {
      pool_->reclaim(std::move(left));
      return false;
    }
    auto node = pool_->acquire_binary();
    node->left = std::move(left);
    node->op = std::move(op);
    node->right = std::move(right);
    left = std::move(node);
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_primary(Expr& out) {
  switch (current_.type) {
    case TokenType::Identifier:
      return parse_identifier_expr(out);
    case TokenType::Number:
      return parse_number(out, false);
    case TokenType::String:
      out = Literal{current_.text};
      advance();
      return true;
    case TokenType::Star:
      out = StarExpr{};
      advance();
      return true;
    case TokenType::LParen:
      return parse_grouped(out);
    case TokenType::Minus:
      if (peek_is(TokenType::Number)) {
        advance();
        return parse_number(out, true);
      }
      return no_prefix_error();
    default:
      return no_prefix_error();
  }
}

/// Parses a column, `table.column`, `table.*`, or a function call.
/// MUST set ColumnRef::table only when a qualifying dot was consumed.
bool Parser::parse_identifier_expr(Expr& out) {
  std::string first = current_.text;
  advance();

  if (current_is(TokenType::Dot)) {
    advance();
    if (current_is(TokenType::Star)) {
      out = StarExpr{first};
      advance();
      return true;
    }
    if (!current_is(TokenType::Identifier)) {
      return unexpected_token("column name after '.'");
    }
    auto column = pool_->acquire_column();
    column->table = first;
    column->column = current_.text;
    advance();
    out = std::move(column);
    return true;
  }

  if (current_is(TokenType::LParen)) {
    return parse_function_call(first, out);
  }

  auto column = pool_->acquire_column();
  column->column = first;
  out = std::move(column);
  return true;
}

bool Parser::parse_function_call(const std::string& name, Expr& out) {
  if (!nesting_allowed()) return false;
  DepthGuard guard(depth_);
  advance();
  auto call = std::make_unique<FunctionCall>();
  call->name = name;
  if (!current_is(TokenType::RParen)) {
    while (true) {
      Expr arg;
      if (!parse_expr(arg)) {
        pool_->release(std::move(call));
        return false;
      }
      call->args.push_back(std::move(arg));
      if (!current_is(TokenType::Comma)) break;
      advance();
    }
  }
  if (!current_is(TokenType::RParen)) {
    unexpected_token("')' to close function call");
    pool_->release(std::move(call));
    return false;
  }
  advance();
  out = std::move(call);
  return true;
}

/// Converts the unparsed number text; a dot selects a floating value.
bool Parser::parse_number(Expr& out, bool negative) {
  const std::string& text = current_.text;
  Literal literal;
  try {
    if (text.find('.') != std::string::npos) {
      double value = std::stod(text);
      literal.value = negative ? -value : value;
    } else {
      int64_t value = std::stoll(text);
      literal.value = negative ? -value : value;
    }
  } catch (const std::out_of_range&) {
    return set_error(ParseErrorKind::UnexpectedToken,
                     "could not parse \"" + text + "\" as a number at line " +
                         std::to_string(current_.line) + ", column " +
                         std::to_string(current_.column));
  }
  out = std::move(literal);
  advance();
  return true;
}

bool Parser::parse_grouped(Expr& out) {
  if (!nesting_allowed()) return false;
  DepthGuard guard(depth_);
  advance();
  Expr inner;
  if (!parse_expr(inner)) return false;
  if (!current_is(TokenType::RParen)) {
    unexpected_token("')' to close expression");
    pool_->reclaim(std::move(inner));
    return false;
  }
  advance();
  out = std::move(inner);
  return true;
}

bool Parser::nesting_allowed() {
  if (depth_ < kMaxNestingDepth) return true;
  if (cancelled_) return false;
  std::string expected = "at most " + std::to_string(kMaxNestingDepth) + " nested levels";
  set_error(ParseErrorKind::UnexpectedToken,
            "expression nested too deeply at line " + std::to_string(current_.line) +
                ", column " + std::to_string(current_.column) + ". Expected: " + expected);
  errors_.back().expected = expected;
  errors_.back().actual = token_type_name(current_.type);
  return false;
}

}  // namespace sqlscope
