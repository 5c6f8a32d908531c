//===----------------------------------------------------------------------===//
//                         PeerSync
//
// schema/schema_inspector.cpp
//
// Catalog queries against duckdb_tables(), duckdb_columns() and
// duckdb_constraints()
//===----------------------------------------------------------------------===//

#include "schema/schema_inspector.hpp"
#include "storage/sql_util.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace peersync {

namespace {

const std::regex& IdentifierPattern() {
    static const std::regex pattern("^[a-zA-Z_][a-zA-Z0-9_]*$");
    return pattern;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

SchemaInspector::SchemaInspector(ConnectionPool& pool_p, const Config& config_p)
    : pool(pool_p)
    , config(config_p) {
    ValidateIdentifier(config.schema_name, "schema");
}

bool SchemaInspector::IsValidIdentifier(const std::string& name) {
    return !name.empty() && std::regex_match(name, IdentifierPattern());
}

void SchemaInspector::ValidateIdentifier(const std::string& name, const std::string& what) {
    if (!IsValidIdentifier(name)) {
        throw SyncException(ErrorCode::INVALID_IDENTIFIER, "Invalid " + what + " name '" + name + "'", name);
    }
}

// Catalog names are case-insensitive, so the deny-list is too
bool SchemaInspector::IsExcluded(const std::string& table) const {
    std::string lower = ToLower(table);
    for (const auto& name : config.excluded_tables) {
        if (lower == ToLower(name)) {
            return true;
        }
    }
    for (const auto& prefix : config.excluded_prefixes) {
        if (StartsWith(lower, ToLower(prefix))) {
            return true;
        }
    }
    return false;
}

void SchemaInspector::CheckTransferable(const std::string& table) const {
    ValidateIdentifier(table, "table");
    if (IsExcluded(table)) {
        throw SyncException(ErrorCode::ACCESS_DENIED, "Table '" + table + "' is not transferable", table);
    }
}

std::string SchemaInspector::QualifiedName(const std::string& table) const {
    return QuoteIdentifier(config.schema_name) + "." + QuoteIdentifier(table);
}

PooledConnection SchemaInspector::AcquireConnection() {
    auto conn = pool.Acquire();
    if (!conn) {
        throw SyncException(ErrorCode::INTERNAL_ERROR, "No database connection available");
    }
    return conn;
}

std::vector<TableInfo> SchemaInspector::ListTables() {
    auto conn = AcquireConnection();

    duckdb::vector<duckdb::Value> params;
    params.push_back(duckdb::Value(config.schema_name));
    QueryRows rows = RunQuery(*conn,
        "SELECT table_name, estimated_size FROM duckdb_tables() "
        "WHERE database_name = current_database() AND schema_name = $1 "
        "AND NOT internal AND NOT temporary ORDER BY table_name",
        std::move(params));

    std::vector<TableInfo> tables;
    for (const auto& row : rows.rows) {
        TableInfo info;
        info.name = row[0].GetValue<std::string>();
        if (!IsValidIdentifier(info.name) || IsExcluded(info.name)) {
            continue;
        }
        if (config.exact_counts) {
            info.estimated_count = CountRows(*conn, info.name, true);
        } else {
            info.estimated_count = row[1].IsNull() ? 0 : std::max<int64_t>(0, row[1].GetValue<int64_t>());
        }
        tables.push_back(std::move(info));
    }

    LOG_DEBUG("schema", "Listed " + std::to_string(tables.size()) + " transferable tables");
    return tables;
}

bool SchemaInspector::TableExists(const std::string& table) {
    ValidateIdentifier(table, "table");
    auto conn = AcquireConnection();
    return TableExists(*conn, table);
}

bool SchemaInspector::TableExists(duckdb::Connection& conn, const std::string& table) const {
    ValidateIdentifier(table, "table");

    duckdb::vector<duckdb::Value> params;
    params.push_back(duckdb::Value(config.schema_name));
    params.push_back(duckdb::Value(table));
    QueryRows rows = RunQuery(conn,
        "SELECT COUNT(*) FROM duckdb_tables() "
        "WHERE database_name = current_database() AND schema_name = $1 AND table_name = $2",
        std::move(params));
    return !rows.Empty() && rows.rows[0][0].GetValue<int64_t>() > 0;
}

TableSchema SchemaInspector::GetSchema(const std::string& table) {
    CheckTransferable(table);
    auto conn = AcquireConnection();
    return LoadSchema(*conn, table);
}

TableSchema SchemaInspector::LoadSchema(duckdb::Connection& conn, const std::string& table) const {
    ValidateIdentifier(table, "table");

    duckdb::vector<duckdb::Value> params;
    params.push_back(duckdb::Value(config.schema_name));
    params.push_back(duckdb::Value(table));
    QueryRows columns = RunQuery(conn,
        "SELECT column_name, data_type, is_nullable, column_default FROM duckdb_columns() "
        "WHERE database_name = current_database() AND schema_name = $1 AND table_name = $2 "
        "ORDER BY column_index",
        params);

    if (columns.Empty()) {
        throw SyncException(ErrorCode::TABLE_NOT_FOUND, "Table '" + table + "' not found", table);
    }

    TableSchema schema;
    schema.table = table;
    for (const auto& row : columns.rows) {
        ColumnDef column;
        column.name = row[0].GetValue<std::string>();
        column.type = row[1].GetValue<std::string>();
        column.nullable = row[2].IsNull() ? true : row[2].GetValue<bool>();
        if (!row[3].IsNull()) {
            column.default_value = row[3].GetValue<std::string>();
        }
        schema.columns.push_back(std::move(column));
    }

    QueryRows keys = RunQuery(conn,
        "SELECT constraint_column_names FROM duckdb_constraints() "
        "WHERE database_name = current_database() AND schema_name = $1 AND table_name = $2 "
        "AND constraint_type = 'PRIMARY KEY'",
        std::move(params));

    if (!keys.Empty() && !keys.rows[0][0].IsNull()) {
        for (const auto& child : duckdb::ListValue::GetChildren(keys.rows[0][0])) {
            schema.primary_key.push_back(child.GetValue<std::string>());
        }
    }

    return schema;
}

int64_t SchemaInspector::GetCount(const std::string& table) {
    CheckTransferable(table);
    auto conn = AcquireConnection();
    if (!TableExists(*conn, table)) {
        throw SyncException(ErrorCode::TABLE_NOT_FOUND, "Table '" + table + "' not found", table);
    }
    return CountRows(*conn, table, config.exact_counts);
}

int64_t SchemaInspector::CountRows(duckdb::Connection& conn, const std::string& table, bool exact) const {
    ValidateIdentifier(table, "table");

    QueryRows rows;
    if (exact) {
        rows = RunQuery(conn, "SELECT COUNT(*) FROM " + QualifiedName(table));
    } else {
        duckdb::vector<duckdb::Value> params;
        params.push_back(duckdb::Value(config.schema_name));
        params.push_back(duckdb::Value(table));
        rows = RunQuery(conn,
            "SELECT estimated_size FROM duckdb_tables() "
            "WHERE database_name = current_database() AND schema_name = $1 AND table_name = $2",
            std::move(params));
    }

    if (rows.Empty() || rows.rows[0][0].IsNull()) {
        return 0;
    }
    return std::max<int64_t>(0, rows.rows[0][0].GetValue<int64_t>());
}

//===----------------------------------------------------------------------===//
// Table creation
//===----------------------------------------------------------------------===//

std::string SchemaInspector::NormalizeType(const std::string& type) {
    std::string trimmed = Trim(type);
    if (trimmed.empty()) {
        return "";
    }

    if (StartsWith(ToLower(trimmed), "enum(")) {
        return "VARCHAR";
    }

    // Type text is spliced into DDL, so only plain type syntax gets through
    static const std::regex safe_type("^[A-Za-z0-9_ ,()\\[\\]\"]+$");
    if (!std::regex_match(trimmed, safe_type)) {
        return "";
    }

    std::string lower = ToLower(trimmed);
    std::string base = lower.substr(0, lower.find('('));
    base = Trim(base);

    if (base == "character varying" || base == "varchar" || base == "text" ||
        base == "character" || base == "char" || base == "bpchar" || base == "citext" ||
        base == "string" || base == "json" || base == "jsonb" || base == "inet" ||
        base == "cidr" || base == "array" || base == "user-defined") {
        return "VARCHAR";
    }
    if (base == "timestamp without time zone" || base == "timestamp") return "TIMESTAMP";
    if (base == "timestamp with time zone" || base == "timestamptz") return "TIMESTAMP WITH TIME ZONE";
    if (base == "time without time zone") return "TIME";
    if (base == "time with time zone" || base == "timetz") return "TIME WITH TIME ZONE";
    if (base == "bigserial" || base == "serial8") return "BIGINT";
    if (base == "serial" || base == "serial4") return "INTEGER";
    if (base == "smallserial" || base == "serial2") return "SMALLINT";
    if (base == "double precision" || base == "float8") return "DOUBLE";
    if (base == "real" || base == "float4") return "FLOAT";
    if (base == "bytea") return "BLOB";
    if (base == "bool") return "BOOLEAN";

    return trimmed;
}

std::optional<std::string> SchemaInspector::PortableDefault(const std::string& expr) {
    std::string trimmed = Trim(expr);
    std::string lower = ToLower(trimmed);

    static const std::regex numeric("^-?[0-9]+(\\.[0-9]+)?$");
    static const std::regex quoted("^'[^';\\\\]*'$");

    if (std::regex_match(trimmed, numeric) || std::regex_match(trimmed, quoted)) {
        return trimmed;
    }
    if (lower == "true" || lower == "false" || lower == "null") {
        return lower;
    }
    if (lower == "current_timestamp" || lower == "now()") {
        return std::string("CURRENT_TIMESTAMP");
    }
    if (lower == "uuid()" || lower == "gen_random_uuid()") {
        return std::string("uuid()");
    }
    return std::nullopt;
}

std::string SchemaInspector::BuildCreateTableSql(const std::string& table, const TableSchema& schema) const {
    ValidateIdentifier(table, "table");
    if (schema.columns.empty()) {
        throw SyncException(ErrorCode::TABLE_NOT_FOUND, "Schema for '" + table + "' has no columns", table);
    }

    std::string sql = "CREATE TABLE IF NOT EXISTS " + QualifiedName(table) + " (";
    bool first = true;
    for (const auto& column : schema.columns) {
        ValidateIdentifier(column.name, "column");
        std::string type = NormalizeType(column.type);
        if (type.empty()) {
            throw SyncException(ErrorCode::INVALID_IDENTIFIER,
                                "Unsupported type '" + column.type + "' for column " + column.name, table);
        }

        if (!first) sql += ", ";
        first = false;
        sql += QuoteIdentifier(column.name) + " " + type;

        if (column.default_value) {
            auto portable = PortableDefault(*column.default_value);
            if (portable) {
                sql += " DEFAULT " + *portable;
            }
        }
        if (!column.nullable && !schema.IsPrimaryKey(column.name)) {
            sql += " NOT NULL";
        }
    }

    if (!schema.primary_key.empty()) {
        sql += ", PRIMARY KEY (";
        for (size_t i = 0; i < schema.primary_key.size(); i++) {
            const auto& pk = schema.primary_key[i];
            if (!schema.FindColumn(pk)) {
                throw SyncException(ErrorCode::INVALID_IDENTIFIER,
                                    "Primary key column '" + pk + "' is not in the schema", table);
            }
            if (i > 0) sql += ", ";
            sql += QuoteIdentifier(pk);
        }
        sql += ")";
    }
    sql += ")";
    return sql;
}

} // namespace peersync
