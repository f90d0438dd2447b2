#include "parser_internal.h"

#include <sstream>

#include "../util/string_util.h"

namespace sqlscope {

namespace {

std::string describe(const Token& token) {
  if (token.type == TokenType::End) return token_type_name(token.type);
  return token.text;
}

std::string position_suffix(const Token& token) {
  std::ostringstream oss;
  oss << " at line " << token.line << ", column " << token.column;
  return oss.str();
}

}  // namespace

/// Shifts peek_ into current_ and pulls a fresh lookahead token.
/// MUST check cancellation first; once cancelled the stream parks on End for good.
void Parser::advance() {
  if (cancelled_) return;
  if (cancel_ != nullptr && cancel_->is_cancelled()) {
    ParseError error;
    error.kind = ParseErrorKind::Cancelled;
    error.message = "parsing cancelled" + position_suffix(current_);
    error.line = current_.line;
    error.column = current_.column;
    errors_.push_back(error);
    cancelled_ = true;
    Token end;
    end.type = TokenType::End;
    end.line = current_.line;
    end.column = current_.column;
    current_ = end;
    peek_ = end;
    return;
  }
  current_ = std::move(peek_);
  peek_ = lexer_.next();
  ++token_count_;
}

bool Parser::current_is_word(const char* word) const {
  return current_.type == TokenType::Identifier && util::iequals(current_.text, word);
}

bool Parser::peek_is_word(const char* word) const {
  return peek_.type == TokenType::Identifier && util::iequals(peek_.text, word);
}

bool Parser::expect_peek(TokenType type) {
  if (peek_is(type)) {
    advance();
    return true;
  }
  return peek_error(type);
}

bool Parser::peek_error(TokenType expected) {
  if (cancelled_) return false;
  ParseError error;
  error.kind = ParseErrorKind::Syntax;
  error.expected = token_type_name(expected);
  error.actual = token_type_name(peek_.type);
  error.message = "syntax error: expected " + error.expected + ", got " + error.actual +
                  position_suffix(peek_);
  error.line = peek_.line;
  error.column = peek_.column;
  errors_.push_back(error);
  return false;
}

bool Parser::no_prefix_error() {
  return set_error(ParseErrorKind::NoPrefixParse,
                   std::string("no prefix parse function for ") +
                       token_type_name(current_.type) + " found" + position_suffix(current_));
}

bool Parser::unexpected_token(const std::string& expected) {
  if (cancelled_) return false;
  bool ok = set_error(ParseErrorKind::UnexpectedToken,
                      "unexpected token '" + describe(current_) + "'" +
                          position_suffix(current_) + ". Expected: " + expected);
  errors_.back().expected = expected;
  errors_.back().actual = token_type_name(current_.type);
  return ok;
}

/// Records a diagnostic at the current token.
/// MUST stay silent after cancellation so the cancellation error is the last word.
bool Parser::set_error(ParseErrorKind kind, const std::string& message) {
  if (cancelled_) return false;
  ParseError error;
  error.kind = kind;
  error.message = message;
  error.line = current_.line;
  error.column = current_.column;
  errors_.push_back(error);
  return false;
}

ParseMetrics Parser::metrics() const {
  ParseMetrics out;
  out.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - start_);
  out.tokens_processed = token_count_;
  double seconds = std::chrono::duration<double>(out.duration).count();
  out.tokens_per_second = seconds > 0.0 ? static_cast<double>(token_count_) / seconds : 0.0;
  out.error_count = errors_.size();
  return out;
}

bool Parser::is_infix_operator(TokenType type) {
  switch (type) {
    case TokenType::Equal:
    case TokenType::NotEqual:
    case TokenType::Less:
    case TokenType::Greater:
    case TokenType::LessEqual:
    case TokenType::GreaterEqual:
    case TokenType::KeywordAnd:
    case TokenType::KeywordOr:
    case TokenType::Plus:
    case TokenType::Minus:
    case TokenType::Star:
    case TokenType::Slash:
    case TokenType::KeywordLike:
    case TokenType::KeywordIn:
      return true;
    default:
      return false;
  }
}

bool Parser::is_statement_start(TokenType type) {
  switch (type) {
    case TokenType::KeywordSelect:
    case TokenType::KeywordInsert:
    case TokenType::KeywordUpdate:
    case TokenType::KeywordDelete:
    case TokenType::KeywordCreate:
    case TokenType::KeywordDrop:
    case TokenType::KeywordAlter:
      return true;
    default:
      return false;
  }
}

bool Parser::is_join_start(TokenType type) {
  return type == TokenType::KeywordJoin || type == TokenType::KeywordInner ||
         type == TokenType::KeywordLeft || type == TokenType::KeywordRight ||
         type == TokenType::KeywordFull;
}

}  // namespace sqlscope
