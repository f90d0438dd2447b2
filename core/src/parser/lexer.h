#pragma once

#include <string>

#include "tokens.h"

namespace sqlscope {

/// Tokenizes SQL Server query text into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with line/column metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST keep returning End at input exhaustion.
  Token next();

 private:
  Token lex_string(size_t line, size_t column);
  Token lex_quoted_identifier(char close, size_t line, size_t column);
  Token lex_identifier_or_keyword(size_t line, size_t column);
  Token lex_number(size_t line, size_t column);
  /// Skips whitespace and both comment forms between tokens.
  /// MUST keep line/column in sync with every consumed character.
  void skip_ws_and_comments();
  /// Consumes one character and updates the line/column cursor.
  char bump();
  char peek_char(size_t offset = 0) const;
  Token make(TokenType type, std::string text, size_t line, size_t column) const;

  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;
};

}  // namespace sqlscope
