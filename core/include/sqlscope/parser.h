#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "sqlscope/ast.h"
#include "sqlscope/node_pool.h"

namespace sqlscope {

/// Cooperative cancellation signal polled by the parser before each token advance.
/// MUST be safe to cancel from another thread while a parse is running.
/// Inputs are cancel()/deadline; outputs are is_cancelled() with no other side effects.
class CancellationToken {
 public:
  using Clock = std::chrono::steady_clock;

  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
  /// Sets a deadline once before the token is shared with a parser.
  void set_deadline(Clock::time_point deadline) { deadline_ = deadline; }
  bool is_cancelled() const;

 private:
  std::atomic<bool> cancelled_{false};
  std::optional<Clock::time_point> deadline_;
};

/// Caller-supplied context for one parse.
/// A null pool means the parser allocates from a private pool of its own.
struct ParseOptions {
  const CancellationToken* cancel = nullptr;
  NodePool* pool = nullptr;
};

enum class ParseErrorKind { Syntax, NoPrefixParse, UnexpectedToken, UnsupportedStatement, Cancelled };

/// Describes a parse failure with a message and 1-based position.
/// `expected` and `actual` are filled for Syntax errors; `expected` also for UnexpectedToken.
struct ParseError {
  ParseErrorKind kind = ParseErrorKind::Syntax;
  std::string message;
  size_t line = 0;
  size_t column = 0;
  std::string expected;
  std::string actual;
};

/// Observability counters; never used for control flow.
struct ParseMetrics {
  std::chrono::nanoseconds duration{0};
  size_t tokens_processed = 0;
  double tokens_per_second = 0.0;
  size_t error_count = 0;
};

/// Statements that parsed cleanly plus every diagnostic, in source order.
/// A statement that failed contributes diagnostics but no AST.
struct ParseResult {
  std::vector<Statement> statements;
  std::vector<ParseError> errors;
  ParseMetrics metrics;

  bool ok() const { return errors.empty() && !statements.empty(); }
};

/// Parses a statement or a semicolon-separated batch.
/// MUST NOT throw on invalid syntax; diagnostics are returned in ParseResult::errors.
/// Inputs are query text and options; side effects are limited to the supplied pool.
ParseResult parse_sql(const std::string& input, const ParseOptions& options = {});

const char* parse_error_kind_name(ParseErrorKind kind);
/// Formats a diagnostic as `kind: message`; messages already carry their position.
std::string format_diagnostic(const ParseError& error);
void print_diagnostics(std::ostream& os, const std::vector<ParseError>& errors);

}  // namespace sqlscope
