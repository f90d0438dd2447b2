#pragma once

#include <cstddef>
#include <string>

namespace sqlscope {

/// Enumerates lexical tokens produced by the query lexer.
/// MUST remain consistent with parser expectations and keyword mapping.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Identifier,
  String,
  Number,
  Comma,
  Dot,
  LParen,
  RParen,
  Semicolon,
  Star,
  Plus,
  Minus,
  Slash,
  Equal,
  NotEqual,
  Less,
  Greater,
  LessEqual,
  GreaterEqual,
  Illegal,
  End,
  KeywordSelect,
  KeywordFrom,
  KeywordWhere,
  KeywordJoin,
  KeywordInner,
  KeywordLeft,
  KeywordRight,
  KeywordFull,
  KeywordOn,
  KeywordGroup,
  KeywordBy,
  KeywordHaving,
  KeywordOrder,
  KeywordTop,
  KeywordDistinct,
  KeywordAs,
  KeywordAnd,
  KeywordOr,
  KeywordLike,
  KeywordIn,
  KeywordInsert,
  KeywordUpdate,
  KeywordDelete,
  KeywordCreate,
  KeywordDrop,
  KeywordAlter
};

/// Represents a single token with source text and position metadata.
/// MUST carry 1-based line/column of the first character for diagnostics.
/// Inputs are lexer output; outputs are consumed by the parser.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t line = 1;
  size_t column = 1;
};

/// Returns the display name of a token type used in diagnostics.
const char* token_type_name(TokenType type);

/// Maps an identifier spelling to its keyword type, case-insensitively.
/// Returns Identifier when the word is not reserved.
TokenType lookup_keyword(const std::string& word);

}  // namespace sqlscope
