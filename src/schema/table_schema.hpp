//===----------------------------------------------------------------------===//
//                         PeerSync
//
// schema/table_schema.hpp
//
// Structural description of a table, enough to recreate it elsewhere
//===----------------------------------------------------------------------===//

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peersync {

struct ColumnDef {
    std::string name;
    std::string type;
    bool nullable = true;
    std::optional<std::string> default_value;
};

struct TableSchema {
    std::string table;
    std::vector<ColumnDef> columns;
    std::vector<std::string> primary_key;

    const ColumnDef* FindColumn(const std::string& name) const;
    bool IsPrimaryKey(const std::string& column) const;

    nlohmann::json ToJson() const;
    // Throws std::runtime_error on a malformed descriptor
    static TableSchema FromJson(const nlohmann::json& j);
};

struct TableInfo {
    std::string name;
    int64_t estimated_count = 0;
};

} // namespace peersync
