#include "sqlscope/render.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "parser/tokens.h"

namespace sqlscope {

namespace {

using nlohmann::json;

bool is_plain_identifier(const std::string& name) {
  if (name.empty()) return false;
  unsigned char first = static_cast<unsigned char>(name[0]);
  if (!std::isalpha(first) && name[0] != '_' && name[0] != '@' && name[0] != '#') return false;
  for (char c : name) {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != '_' && c != '@' && c != '#' && c != '$') return false;
  }
  return lookup_keyword(name) == TokenType::Identifier;
}

std::string render_identifier(const std::string& name) {
  if (is_plain_identifier(name)) return name;
  std::string out = "[";
  for (char c : name) {
    out.push_back(c);
    if (c == ']') out.push_back(']');
  }
  out.push_back(']');
  return out;
}

std::string render_literal(const Literal& literal) {
  if (const auto* i = std::get_if<int64_t>(&literal.value)) {
    return std::to_string(*i);
  }
  if (const auto* d = std::get_if<double>(&literal.value)) {
    std::ostringstream oss;
    oss << std::setprecision(15) << *d;
    std::string out = oss.str();
    // Keep a dot so the text lexes back as a floating value.
    if (out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
  }
  std::string out = "'";
  for (char c : std::get<std::string>(literal.value)) {
    out.push_back(c);
    if (c == '\'') out.push_back('\'');
  }
  out.push_back('\'');
  return out;
}

json optional_string(const std::optional<std::string>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

json table_to_json(const TableReference& table) {
  json out = json::object();
  out["schema"] = optional_string(table.schema);
  out["name"] = table.name;
  out["alias"] = optional_string(table.alias);
  return out;
}

json select_to_json(const SelectStatement& select) {
  json out = json::object();
  out["type"] = "SELECT";
  out["distinct"] = select.distinct;
  if (select.top.has_value()) {
    out["top"] = json{{"count", select.top->count}, {"percent", select.top->percent}};
  } else {
    out["top"] = nullptr;
  }
  json columns = json::array();
  for (const auto& column : select.columns) {
    columns.push_back(expr_to_json(column));
  }
  out["columns"] = columns;
  if (select.from.has_value()) {
    json tables = json::array();
    for (const auto& table : select.from->tables) {
      tables.push_back(table_to_json(table));
    }
    out["from"] = tables;
  } else {
    out["from"] = nullptr;
  }
  json joins = json::array();
  for (const auto& join : select.joins) {
    if (!join) throw std::invalid_argument("null join clause");
    joins.push_back(json{{"type", join_type_name(join->type)},
                         {"table", table_to_json(join->table)},
                         {"condition", expr_to_json(join->condition)}});
  }
  out["joins"] = joins;
  out["where"] = select.where.has_value() ? expr_to_json(*select.where) : json(nullptr);
  json group_by = json::array();
  for (const auto& key : select.group_by) {
    group_by.push_back(expr_to_json(key));
  }
  out["group_by"] = group_by;
  out["having"] = select.having.has_value() ? expr_to_json(*select.having) : json(nullptr);
  json order_by = json::array();
  for (const auto& item : select.order_by) {
    order_by.push_back(
        json{{"expr", expr_to_json(item.expr)}, {"direction", sort_direction_name(item.direction)}});
  }
  out["order_by"] = order_by;
  return out;
}

}  // namespace

std::string render_expr(const Expr& expr) {
  if (const auto* literal = std::get_if<Literal>(&expr)) {
    return render_literal(*literal);
  }
  if (const auto* star = std::get_if<StarExpr>(&expr)) {
    return star->table.has_value() ? render_identifier(*star->table) + ".*" : "*";
  }
  if (const auto* column = std::get_if<std::unique_ptr<ColumnRef>>(&expr)) {
    if (!*column) throw std::invalid_argument("null column reference");
    const ColumnRef& ref = **column;
    std::string name = render_identifier(ref.column);
    return ref.table.has_value() ? render_identifier(*ref.table) + "." + name : name;
  }
  if (std::holds_alternative<std::unique_ptr<BinaryExpr>>(expr)) {
    std::vector<const BinaryExpr*> spine;
    std::string out = render_expr(left_spine(expr, spine));
    for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
      std::string right = render_expr((*it)->right);
      if (std::holds_alternative<std::unique_ptr<BinaryExpr>>((*it)->right)) {
        right = "(" + right + ")";
      }
      out += " " + (*it)->op + " " + right;
    }
    return out;
  }
  const auto& call = std::get<std::unique_ptr<FunctionCall>>(expr);
  if (!call) throw std::invalid_argument("null function call");
  std::string out = call->name + "(";
  for (size_t i = 0; i < call->args.size(); ++i) {
    if (i > 0) out += ", ";
    out += render_expr(call->args[i]);
  }
  out += ")";
  return out;
}

std::string render_table_reference(const TableReference& table) {
  std::string out;
  if (table.schema.has_value()) {
    out = render_identifier(*table.schema) + ".";
  }
  out += render_identifier(table.name);
  if (table.alias.has_value()) {
    out += " AS " + render_identifier(*table.alias);
  }
  return out;
}

nlohmann::json expr_to_json(const Expr& expr) {
  if (const auto* literal = std::get_if<Literal>(&expr)) {
    if (const auto* i = std::get_if<int64_t>(&literal->value)) return json{{"literal", *i}};
    if (const auto* d = std::get_if<double>(&literal->value)) return json{{"literal", *d}};
    return json{{"literal", std::get<std::string>(literal->value)}};
  }
  if (const auto* star = std::get_if<StarExpr>(&expr)) {
    return json{{"star", optional_string(star->table)}};
  }
  if (const auto* column = std::get_if<std::unique_ptr<ColumnRef>>(&expr)) {
    if (!*column) throw std::invalid_argument("null column reference");
    return json{{"column", (*column)->column}, {"table", optional_string((*column)->table)}};
  }
  if (std::holds_alternative<std::unique_ptr<BinaryExpr>>(expr)) {
    // A chain is emitted flat: its leftmost operand, then each operator with its right side.
    std::vector<const BinaryExpr*> spine;
    json first = expr_to_json(left_spine(expr, spine));
    json ops = json::array();
    for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
      ops.push_back(json{{"op", (*it)->op}, {"right", expr_to_json((*it)->right)}});
    }
    return json{{"first", first}, {"ops", ops}};
  }
  const auto& call = std::get<std::unique_ptr<FunctionCall>>(expr);
  if (!call) throw std::invalid_argument("null function call");
  json args = json::array();
  for (const auto& arg : call->args) {
    args.push_back(expr_to_json(arg));
  }
  return json{{"function", call->name}, {"args", args}};
}

nlohmann::json statement_to_json(const Statement& statement) {
  if (const auto* select = std::get_if<std::unique_ptr<SelectStatement>>(&statement)) {
    if (!*select) throw std::invalid_argument("null select statement");
    return select_to_json(**select);
  }
  if (const auto* insert = std::get_if<InsertStatement>(&statement)) {
    return json{{"type", "INSERT"}, {"table", table_to_json(insert->table)}};
  }
  if (const auto* update = std::get_if<UpdateStatement>(&statement)) {
    return json{{"type", "UPDATE"}, {"table", table_to_json(update->table)}};
  }
  return json{{"type", "DELETE"},
              {"table", table_to_json(std::get<DeleteStatement>(statement).table)}};
}

std::string fingerprint(const Statement& statement) {
  return statement_to_json(statement).dump();
}

}  // namespace sqlscope
