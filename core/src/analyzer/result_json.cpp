#include "sqlscope/analyzer.h"

namespace sqlscope {

namespace {

using nlohmann::json;

json optional_string(const std::optional<std::string>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

}  // namespace

nlohmann::json analysis_to_json(const AnalysisResult& result) {
  json out = json::object();
  out["query_type"] = query_type_name(result.query_type);

  json tables = json::array();
  for (const auto& table : result.tables) {
    tables.push_back(json{{"name", table.name},
                          {"schema", optional_string(table.schema)},
                          {"alias", optional_string(table.alias)},
                          {"usage", table.usage}});
  }
  out["tables"] = tables;

  json columns = json::array();
  for (const auto& column : result.columns) {
    columns.push_back(json{{"table", optional_string(column.table)},
                           {"name", column.name},
                           {"usage", column.usage}});
  }
  out["columns"] = columns;

  json joins = json::array();
  for (const auto& join : result.joins) {
    joins.push_back(json{{"type", join_type_name(join.type)},
                         {"left_table", optional_string(join.left_table)},
                         {"right_table", join.right_table},
                         {"condition", join.condition}});
  }
  out["joins"] = joins;

  out["complexity_score"] = result.complexity_score;

  json suggestions = json::array();
  for (const auto& suggestion : result.suggestions) {
    suggestions.push_back(json{{"type", suggestion.kind},
                               {"description", suggestion.description},
                               {"severity", severity_name(suggestion.severity)}});
  }
  out["suggestions"] = suggestions;
  return out;
}

}  // namespace sqlscope
