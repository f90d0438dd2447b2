#include "sqlscope/node_pool.h"

#include "sqlscope/parser.h"

namespace sqlscope {

NodePool::NodePool(size_t max_free_per_shape) : max_free_(max_free_per_shape) {}

template <typename T>
std::unique_ptr<T> NodePool::take(std::vector<std::unique_ptr<T>>& free_list) {
  ++stats_.acquired;
  if (free_list.empty()) {
    return std::make_unique<T>();
  }
  std::unique_ptr<T> node = std::move(free_list.back());
  free_list.pop_back();
  ++stats_.reused;
  return node;
}

template <typename T>
void NodePool::keep(std::vector<std::unique_ptr<T>>& free_list, std::unique_ptr<T> node) {
  ++stats_.released;
  *node = T{};
  if (free_list.size() < max_free_) {
    free_list.push_back(std::move(node));
  }
}

std::unique_ptr<SelectStatement> NodePool::acquire_select() { return take(free_selects_); }

std::unique_ptr<JoinClause> NodePool::acquire_join() { return take(free_joins_); }

std::unique_ptr<BinaryExpr> NodePool::acquire_binary() { return take(free_binaries_); }

std::unique_ptr<ColumnRef> NodePool::acquire_column() { return take(free_columns_); }

void NodePool::release(std::unique_ptr<SelectStatement> node) {
  if (!node) return;
  for (auto& column : node->columns) {
    reclaim(std::move(column));
  }
  for (auto& join : node->joins) {
    release(std::move(join));
  }
  if (node->where.has_value()) {
    reclaim(std::move(*node->where));
  }
  for (auto& key : node->group_by) {
    reclaim(std::move(key));
  }
  if (node->having.has_value()) {
    reclaim(std::move(*node->having));
  }
  for (auto& item : node->order_by) {
    reclaim(std::move(item.expr));
  }
  keep(free_selects_, std::move(node));
}

void NodePool::release(std::unique_ptr<JoinClause> node) {
  if (!node) return;
  reclaim(std::move(node->condition));
  keep(free_joins_, std::move(node));
}

void NodePool::release(std::unique_ptr<BinaryExpr> node) {
  // Follows the left spine in a loop; a chain is as deep as it has operators.
  while (node) {
    reclaim(std::move(node->right));
    Expr left = std::move(node->left);
    node->left = Literal{};
    keep(free_binaries_, std::move(node));
    auto* next = std::get_if<std::unique_ptr<BinaryExpr>>(&left);
    if (next == nullptr) {
      reclaim(std::move(left));
      return;
    }
    node = std::move(*next);
  }
}

void NodePool::release(std::unique_ptr<ColumnRef> node) {
  if (!node) return;
  keep(free_columns_, std::move(node));
}

void NodePool::release(std::unique_ptr<FunctionCall> node) {
  if (!node) return;
  for (auto& arg : node->args) {
    reclaim(std::move(arg));
  }
}

void NodePool::reclaim(Expr&& expr) {
  if (auto* column = std::get_if<std::unique_ptr<ColumnRef>>(&expr)) {
    release(std::move(*column));
  } else if (auto* binary = std::get_if<std::unique_ptr<BinaryExpr>>(&expr)) {
    release(std::move(*binary));
  } else if (auto* call = std::get_if<std::unique_ptr<FunctionCall>>(&expr)) {
    release(std::move(*call));
  }
  expr = Literal{};
}

void NodePool::reclaim(Statement&& statement) {
  if (auto* select = std::get_if<std::unique_ptr<SelectStatement>>(&statement)) {
    release(std::move(*select));
  }
}

void NodePool::reclaim(ParseResult&& result) {
  for (auto& statement : result.statements) {
    reclaim(std::move(statement));
  }
  result.statements.clear();
}

size_t NodePool::free_count(PooledShape shape) const {
  switch (shape) {
    case PooledShape::Select: return free_selects_.size();
    case PooledShape::Join: return free_joins_.size();
    case PooledShape::Binary: return free_binaries_.size();
    case PooledShape::Column: return free_columns_.size();
  }
  return 0;
}

}  // namespace sqlscope
