//===----------------------------------------------------------------------===//
//                         PeerSync
//
// schema/table_schema.cpp
//
//===----------------------------------------------------------------------===//

#include "schema/table_schema.hpp"
#include <algorithm>
#include <stdexcept>

namespace peersync {

const ColumnDef* TableSchema::FindColumn(const std::string& name) const {
    for (const auto& column : columns) {
        if (column.name == name) {
            return &column;
        }
    }
    return nullptr;
}

bool TableSchema::IsPrimaryKey(const std::string& column) const {
    return std::find(primary_key.begin(), primary_key.end(), column) != primary_key.end();
}

nlohmann::json TableSchema::ToJson() const {
    nlohmann::json cols = nlohmann::json::array();
    for (const auto& column : columns) {
        nlohmann::json c = {
            {"name", column.name},
            {"type", column.type},
            {"nullable", column.nullable},
        };
        c["default"] = column.default_value ? nlohmann::json(*column.default_value) : nlohmann::json();
        cols.push_back(std::move(c));
    }
    return {
        {"table", table},
        {"columns", cols},
        {"primary_key", primary_key},
    };
}

TableSchema TableSchema::FromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("table") || !j["table"].is_string() ||
        !j.contains("columns") || !j["columns"].is_array()) {
        throw std::runtime_error("Malformed table schema");
    }

    TableSchema schema;
    schema.table = j["table"].get<std::string>();

    for (const auto& c : j["columns"]) {
        if (!c.is_object() || !c.contains("name") || !c["name"].is_string() ||
            !c.contains("type") || !c["type"].is_string()) {
            throw std::runtime_error("Malformed column in schema of " + schema.table);
        }
        ColumnDef column;
        column.name = c["name"].get<std::string>();
        column.type = c["type"].get<std::string>();
        if (c.contains("nullable") && c["nullable"].is_boolean()) {
            column.nullable = c["nullable"].get<bool>();
        }
        if (c.contains("default") && c["default"].is_string()) {
            column.default_value = c["default"].get<std::string>();
        }
        schema.columns.push_back(std::move(column));
    }

    if (j.contains("primary_key") && j["primary_key"].is_array()) {
        for (const auto& pk : j["primary_key"]) {
            if (!pk.is_string()) {
                throw std::runtime_error("Malformed primary key in schema of " + schema.table);
            }
            schema.primary_key.push_back(pk.get<std::string>());
        }
    }
    return schema;
}

} // namespace peersync
