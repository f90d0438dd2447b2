#include "tokens.h"

#include <unordered_map>

#include "../util/string_util.h"

namespace sqlscope {

const char* token_type_name(TokenType type) {
  switch (type) {
    case TokenType::Identifier: return "IDENT";
    case TokenType::String: return "STRING";
    case TokenType::Number: return "NUMBER";
    case TokenType::Comma: return ",";
    case TokenType::Dot: return ".";
    case TokenType::LParen: return "(";
    case TokenType::RParen: return ")";
    case TokenType::Semicolon: return ";";
    case TokenType::Star: return "*";
    case TokenType::Plus: return "+";
    case TokenType::Minus: return "-";
    case TokenType::Slash: return "/";
    case TokenType::Equal: return "=";
    case TokenType::NotEqual: return "<>";
    case TokenType::Less: return "<";
    case TokenType::Greater: return ">";
    case TokenType::LessEqual: return "<=";
    case TokenType::GreaterEqual: return ">=";
    case TokenType::Illegal: return "ILLEGAL";
    case TokenType::End: return "EOF";
    case TokenType::KeywordSelect: return "SELECT";
    case TokenType::KeywordFrom: return "FROM";
    case TokenType::KeywordWhere: return "WHERE";
    case TokenType::KeywordJoin: return "JOIN";
    case TokenType::KeywordInner: return "INNER";
    case TokenType::KeywordLeft: return "LEFT";
    case TokenType::KeywordRight: return "RIGHT";
    case TokenType::KeywordFull: return "FULL";
    case TokenType::KeywordOn: return "ON";
    case TokenType::KeywordGroup: return "GROUP";
    case TokenType::KeywordBy: return "BY";
    case TokenType::KeywordHaving: return "HAVING";
    case TokenType::KeywordOrder: return "ORDER";
    case TokenType::KeywordTop: return "TOP";
    case TokenType::KeywordDistinct: return "DISTINCT";
    case TokenType::KeywordAs: return "AS";
    case TokenType::KeywordAnd: return "AND";
    case TokenType::KeywordOr: return "OR";
    case TokenType::KeywordLike: return "LIKE";
    case TokenType::KeywordIn: return "IN";
    case TokenType::KeywordInsert: return "INSERT";
    case TokenType::KeywordUpdate: return "UPDATE";
    case TokenType::KeywordDelete: return "DELETE";
    case TokenType::KeywordCreate: return "CREATE";
    case TokenType::KeywordDrop: return "DROP";
    case TokenType::KeywordAlter: return "ALTER";
  }
  return "UNKNOWN";
}

TokenType lookup_keyword(const std::string& word) {
  static const std::unordered_map<std::string, TokenType> kKeywords = {
      {"SELECT", TokenType::KeywordSelect},   {"FROM", TokenType::KeywordFrom},
      {"WHERE", TokenType::KeywordWhere},     {"JOIN", TokenType::KeywordJoin},
      {"INNER", TokenType::KeywordInner},     {"LEFT", TokenType::KeywordLeft},
      {"RIGHT", TokenType::KeywordRight},     {"FULL", TokenType::KeywordFull},
      {"ON", TokenType::KeywordOn},           {"GROUP", TokenType::KeywordGroup},
      {"BY", TokenType::KeywordBy},           {"HAVING", TokenType::KeywordHaving},
      {"ORDER", TokenType::KeywordOrder},     {"TOP", TokenType::KeywordTop},
      {"DISTINCT", TokenType::KeywordDistinct}, {"AS", TokenType::KeywordAs},
      {"AND", TokenType::KeywordAnd},         {"OR", TokenType::KeywordOr},
      {"LIKE", TokenType::KeywordLike},       {"IN", TokenType::KeywordIn},
      {"INSERT", TokenType::KeywordInsert},   {"UPDATE", TokenType::KeywordUpdate},
      {"DELETE", TokenType::KeywordDelete},   {"CREATE", TokenType::KeywordCreate},
      {"DROP", TokenType::KeywordDrop},       {"ALTER", TokenType::KeywordAlter},
  };
  auto it = kKeywords.find(util::to_upper(word));
  if (it == kKeywords.end()) return TokenType::Identifier;
  return it->second;
}

}  // namespace sqlscope
