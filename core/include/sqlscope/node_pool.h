#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "sqlscope/ast.h"

namespace sqlscope {

struct ParseResult;

enum class PooledShape { Select, Join, Binary, Column };

/// Free lists for the AST shapes the parser allocates most often.
/// MUST only receive nodes that are no longer reachable from a live tree.
/// Not thread-safe; scope one pool to one parsing thread.
class NodePool {
 public:
  struct Stats {
    size_t acquired = 0;
    size_t reused = 0;
    size_t released = 0;
  };

  /// Caps each free list so an unusually large tree does not pin memory forever.
  explicit NodePool(size_t max_free_per_shape = 64);
  NodePool(const NodePool&) = delete;
  NodePool& operator=(const NodePool&) = delete;

  std::unique_ptr<SelectStatement> acquire_select();
  std::unique_ptr<JoinClause> acquire_join();
  std::unique_ptr<BinaryExpr> acquire_binary();
  std::unique_ptr<ColumnRef> acquire_column();

  /// Returns a node and every pooled node beneath it.
  /// MUST reset the node before it is handed out again.
  void release(std::unique_ptr<SelectStatement> node);
  void release(std::unique_ptr<JoinClause> node);
  void release(std::unique_ptr<BinaryExpr> node);
  void release(std::unique_ptr<ColumnRef> node);
  /// Function calls are not pooled; their pooled arguments are.
  void release(std::unique_ptr<FunctionCall> node);

  /// Hands a whole tree back once the caller has finished with it.
  void reclaim(Expr&& expr);
  void reclaim(Statement&& statement);
  void reclaim(ParseResult&& result);

  size_t free_count(PooledShape shape) const;
  const Stats& stats() const { return stats_; }

 private:
  template <typename T>
  std::unique_ptr<T> take(std::vector<std::unique_ptr<T>>& free_list);
  template <typename T>
  void keep(std::vector<std::unique_ptr<T>>& free_list, std::unique_ptr<T> node);

  size_t max_free_;
  std::vector<std::unique_ptr<SelectStatement>> free_selects_;
  std::vector<std::unique_ptr<JoinClause>> free_joins_;
  std::vector<std::unique_ptr<BinaryExpr>> free_binaries_;
  std::vector<std::unique_ptr<ColumnRef>> free_columns_;
  Stats stats_;
};

}  // namespace sqlscope
