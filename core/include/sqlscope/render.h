#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sqlscope/ast.h"

namespace sqlscope {

/// Renders an expression back to SQL text, e.g. `u.id = o.user_id`.
/// MUST parenthesize a BinaryExpr on the right so the text re-parses to the same tree.
/// Throws std::invalid_argument on a null node.
std::string render_expr(const Expr& expr);
/// Renders `[schema.]name[ AS alias]`, bracket-quoting names that are not plain identifiers.
std::string render_table_reference(const TableReference& table);

nlohmann::json expr_to_json(const Expr& expr);
/// Canonical document for a statement; source positions are left out.
nlohmann::json statement_to_json(const Statement& statement);
/// Cache key for a statement: equal trees give equal keys and distinct trees never collide.
std::string fingerprint(const Statement& statement);

}  // namespace sqlscope
