#include "parser_internal.h"

#include <ostream>

namespace sqlscope {

bool CancellationToken::is_cancelled() const {
  if (cancelled_.load(std::memory_order_relaxed)) return true;
  return deadline_.has_value() && Clock::now() >= *deadline_;
}

Parser::Parser(const std::string& input, const ParseOptions& options)
    : lexer_(input), cancel_(options.cancel), pool_(options.pool),
      start_(std::chrono::steady_clock::now()) {
  if (pool_ == nullptr) {
    owned_pool_ = std::make_unique<NodePool>();
    pool_ = owned_pool_.get();
  }
  advance();
  advance();
}

/// Parses every statement in the input, recovering at statement boundaries.
/// MUST keep parsing after a failed statement and MUST stop once cancelled.
ParseResult Parser::parse() {
  ParseResult result;
  while (!cancelled_ && !current_is(TokenType::End)) {
    if (current_is(TokenType::Semicolon)) {
      advance();
      continue;
    }
    Statement stmt;
    if (!parse_statement(stmt)) {
      synchronize();
      continue;
    }
    if (cancelled_) {
      // The statement was cut short; the tokens it stopped at are not its real end.
      pool_->reclaim(std::move(stmt));
      break;
    }
    if (!finish_statement()) {
      pool_->reclaim(std::move(stmt));
      synchronize();
      continue;
    }
    result.statements.push_back(std::move(stmt));
  }
  result.metrics = metrics();
  result.errors = std::move(errors_);
  errors_.clear();
  return result;
}

bool Parser::parse_statement(Statement& out) {
  switch (current_.type) {
    case TokenType::KeywordSelect: {
      std::unique_ptr<SelectStatement> select;
      if (!parse_select(select)) return false;
      out = std::move(select);
      return true;
    }
    case TokenType::KeywordInsert:
      return set_error(ParseErrorKind::UnsupportedStatement,
                       "INSERT statement parsing not implemented");
    case TokenType::KeywordUpdate:
      return set_error(ParseErrorKind::UnsupportedStatement,
                       "UPDATE statement parsing not implemented");
    case TokenType::KeywordDelete:
      return set_error(ParseErrorKind::UnsupportedStatement,
                       "DELETE statement parsing not implemented");
    default:
      return set_error(ParseErrorKind::UnsupportedStatement,
                       "unsupported statement type: " + current_.text);
  }
}

/// Accepts the token that may legally follow a statement.
bool Parser::finish_statement() {
  if (current_is(TokenType::Semicolon)) {
    advance();
    return true;
  }
  if (current_is(TokenType::End) || is_statement_start(current_.type)) {
    return true;
  }
  return unexpected_token("; or end of statement");
}

void Parser::synchronize() {
  advance();
  while (!current_is(TokenType::End)) {
    if (current_is(TokenType::Semicolon)) {
      advance();
      return;
    }
    if (is_statement_start(current_.type)) {
      return;
    }
    advance();
  }
}

bool Parser::discard(std::unique_ptr<SelectStatement> stmt) {
  pool_->release(std::move(stmt));
  return false;
}

bool Parser::discard(std::unique_ptr<JoinClause> join) {
  pool_->release(std::move(join));
  return false;
}

ParseResult parse_sql(const std::string& input, const ParseOptions& options) {
  Parser parser(input, options);
  return parser.parse();
}

const char* parse_error_kind_name(ParseErrorKind kind) {
  switch (kind) {
    case ParseErrorKind::Syntax: return "syntax";
    case ParseErrorKind::NoPrefixParse: return "no-prefix-parse";
    case ParseErrorKind::UnexpectedToken: return "unexpected-token";
    case ParseErrorKind::UnsupportedStatement: return "unsupported-statement";
    case ParseErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

std::string format_diagnostic(const ParseError& error) {
  return std::string(parse_error_kind_name(error.kind)) + ": " + error.message;
}

void print_diagnostics(std::ostream& os, const std::vector<ParseError>& errors) {
  for (const auto& error : errors) {
    os << format_diagnostic(error) << "\n";
  }
}

}  // namespace sqlscope
