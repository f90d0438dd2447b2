#include "lexer.h"

#include <cctype>

namespace sqlscope {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws_and_comments();
  size_t line = line_;
  size_t column = column_;
  if (pos_ >= input_.size()) {
    return make(TokenType::End, "", line, column);
  }

  char c = peek_char();
  switch (c) {
    case ',':
      bump();
      return make(TokenType::Comma, ",", line, column);
    case '.':
      bump();
      return make(TokenType::Dot, ".", line, column);
    case '(':
      bump();
      return make(TokenType::LParen, "(", line, column);
    case ')':
      bump();
      return make(TokenType::RParen, ")", line, column);
    case ';':
      bump();
      return make(TokenType::Semicolon, ";", line, column);
    case '*':
      bump();
      return make(TokenType::Star, "*", line, column);
    case '+':
      bump();
      return make(TokenType::Plus, "+", line, column);
    case '-':
      bump();
      return make(TokenType::Minus, "-", line, column);
    case '/':
      bump();
      return make(TokenType::Slash, "/", line, column);
    case '=':
      bump();
      return make(TokenType::Equal, "=", line, column);
    case '<':
      bump();
      if (peek_char() == '>') {
        bump();
        return make(TokenType::NotEqual, "<>", line, column);
      }
      if (peek_char() == '=') {
        bump();
        return make(TokenType::LessEqual, "<=", line, column);
      }
      return make(TokenType::Less, "<", line, column);
    case '>':
      bump();
      if (peek_char() == '=') {
        bump();
        return make(TokenType::GreaterEqual, ">=", line, column);
      }
      return make(TokenType::Greater, ">", line, column);
    case '!':
      if (peek_char(1) == '=') {
        bump();
        bump();
        return make(TokenType::NotEqual, "!=", line, column);
      }
      break;
    case '\'':
      return lex_string(line, column);
    case '[':
      return lex_quoted_identifier(']', line, column);
    case '"':
      return lex_quoted_identifier('"', line, column);
    default:
      break;
  }

  // N'...' is a Unicode string literal in T-SQL.
  if ((c == 'N' || c == 'n') && peek_char(1) == '\'') {
    bump();
    return lex_string(line, column);
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number(line, column);
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword(line, column);
  }

  // WHY: advance on unknown input to avoid infinite loops on malformed queries.
  bump();
  return make(TokenType::Illegal, std::string(1, c), line, column);
}

Token Lexer::lex_string(size_t line, size_t column) {
  bump();
  std::string out;
  while (pos_ < input_.size()) {
    char c = bump();
    if (c == '\'') {
      if (peek_char() == '\'') {
        bump();
        out.push_back('\'');
        continue;
      }
      return make(TokenType::String, std::move(out), line, column);
    }
    out.push_back(c);
  }
  return make(TokenType::Illegal, std::move(out), line, column);
}

Token Lexer::lex_quoted_identifier(char close, size_t line, size_t column) {
  bump();
  std::string out;
  while (pos_ < input_.size()) {
    char c = bump();
    if (c == close) {
      if (peek_char() == close) {
        bump();
        out.push_back(close);
        continue;
      }
      return make(TokenType::Identifier, std::move(out), line, column);
    }
    out.push_back(c);
  }
  return make(TokenType::Illegal, std::move(out), line, column);
}

Token Lexer::lex_identifier_or_keyword(size_t line, size_t column) {
  std::string out;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    out.push_back(bump());
  }
  TokenType type = lookup_keyword(out);
  return make(type, std::move(out), line, column);
}

Token Lexer::lex_number(size_t line, size_t column) {
  std::string out;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    out.push_back(bump());
  }
  if (peek_char() == '.' && std::isdigit(static_cast<unsigned char>(peek_char(1)))) {
    out.push_back(bump());
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      out.push_back(bump());
    }
  }
  return make(TokenType::Number, std::move(out), line, column);
}

void Lexer::skip_ws_and_comments() {
  while (pos_ < input_.size()) {
    char c = input_[pos_];
    if (std::isspace(static_cast<unsigned char>(c))) {
      bump();
      continue;
    }
    if (c == '-' && peek_char(1) == '-') {
      while (pos_ < input_.size() && input_[pos_] != '\n') {
        bump();
      }
      continue;
    }
    if (c == '/' && peek_char(1) == '*') {
      bump();
      bump();
      while (pos_ < input_.size() && !(input_[pos_] == '*' && peek_char(1) == '/')) {
        bump();
      }
      if (pos_ < input_.size()) {
        bump();
        bump();
      }
      continue;
    }
    return;
  }
}

char Lexer::bump() {
  char c = input_[pos_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

char Lexer::peek_char(size_t offset) const {
  size_t at = pos_ + offset;
  return at < input_.size() ? input_[at] : '\0';
}

Token Lexer::make(TokenType type, std::string text, size_t line, size_t column) const {
  Token token;
  token.type = type;
  token.text = std::move(text);
  token.line = line;
  token.column = column;
  return token;
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '@' || c == '#';
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '@' || c == '#' ||
         c == '$';
}

}  // namespace sqlscope
