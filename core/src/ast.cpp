#include "sqlscope/ast.h"

#include <stdexcept>
#include <utility>

namespace sqlscope {

BinaryExpr::~BinaryExpr() {
  // Detach one left child at a time; each detached node dies with an empty left side.
  while (auto* child = std::get_if<std::unique_ptr<BinaryExpr>>(&left)) {
    if (!*child) break;
    std::unique_ptr<BinaryExpr> node = std::move(*child);
    left = std::move(node->left);
  }
}

const Expr& left_spine(const Expr& expr, std::vector<const BinaryExpr*>& spine) {
  const Expr* current = &expr;
  while (const auto* binary = std::get_if<std::unique_ptr<BinaryExpr>>(current)) {
    if (!*binary) throw std::invalid_argument("null binary expression");
    spine.push_back(binary->get());
    current = &(*binary)->left;
  }
  return *current;
}

const char* join_type_name(JoinType type) {
  switch (type) {
    case JoinType::Inner: return "INNER";
    case JoinType::Left: return "LEFT";
    case JoinType::Right: return "RIGHT";
    case JoinType::Full: return "FULL";
  }
  return "INNER";
}

const char* sort_direction_name(SortDirection direction) {
  return direction == SortDirection::Desc ? "DESC" : "ASC";
}

}  // namespace sqlscope
