//===----------------------------------------------------------------------===//
//                         PeerSync
//
// importer/data_importer.cpp
//
// Data importer implementation
//===----------------------------------------------------------------------===//

#include "importer/data_importer.hpp"
#include "storage/sql_util.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"
#include <limits>

namespace peersync {

struct DataImporter::RowContext {
    duckdb::Connection& conn;
    std::string table;
    std::string qualified;
    TableSchema schema;
};

namespace {

duckdb::LogicalTypeId ColumnTypeId(const ColumnDef& column) {
    try {
        return duckdb::TransformStringToLogicalType(column.type).id();
    } catch (const std::exception&) {
        return duckdb::LogicalTypeId::INVALID;
    }
}

bool IsIntegerType(duckdb::LogicalTypeId id) {
    switch (id) {
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::HUGEINT:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::UINTEGER:
        case duckdb::LogicalTypeId::UBIGINT:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

DataImporter::DataImporter(SchemaInspector& inspector_p)
    : inspector(inspector_p) {}

duckdb::Value DataImporter::JsonToValue(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return duckdb::Value();
        case nlohmann::json::value_t::boolean:
            return duckdb::Value::BOOLEAN(value.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return duckdb::Value::BIGINT(value.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            uint64_t u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return duckdb::Value::BIGINT(static_cast<int64_t>(u));
            }
            return duckdb::Value::UBIGINT(u);
        }
        case nlohmann::json::value_t::number_float:
            return duckdb::Value::DOUBLE(value.get<double>());
        case nlohmann::json::value_t::string:
            return duckdb::Value(value.get<std::string>());
        default:
            return duckdb::Value(value.dump());
    }
}

bool DataImporter::TableExists(const std::string& table) {
    auto conn = inspector.AcquireConnection();
    return inspector.TableExists(*conn, table);
}

bool DataImporter::CreateTable(const std::string& table, const TableSchema& schema) {
    std::string sql = inspector.BuildCreateTableSql(table, schema);

    auto conn = inspector.AcquireConnection();
    if (inspector.TableExists(*conn, table)) {
        LOG_DEBUG("importer", "Table " + table + " already exists, leaving it unchanged");
        return false;
    }

    try {
        RunStatement(*conn, sql);
    } catch (const StorageError& e) {
        throw SyncException(ErrorCode::INTERNAL_ERROR,
                            "failed to create table: " + std::string(e.what()), table);
    }
    LOG_INFO("importer", "Created table " + table + " (" + std::to_string(schema.columns.size()) +
             " columns)");
    return true;
}

TransferResult DataImporter::ImportRecords(const std::string& table,
                                           const nlohmann::json& records,
                                           ConflictStrategy strategy) {
    if (!SchemaInspector::IsValidIdentifier(table)) {
        throw SyncException(ErrorCode::INVALID_IDENTIFIER, "invalid table name: " + table, table);
    }
    if (!records.is_array()) {
        throw SyncException(ErrorCode::PROTOCOL_ERROR, "records must be an array", table);
    }

    auto conn = inspector.AcquireConnection();
    RowContext ctx{*conn, table, inspector.QualifiedName(table), inspector.LoadSchema(*conn, table)};

    TransferResult result;
    for (const auto& record : records) {
        try {
            ImportRecord(ctx, record, strategy, result);
        } catch (const std::exception& e) {
            LOG_WARN("importer", "Record rejected for " + table + ": " + e.what());
            result.errors.push_back({record, e.what()});
        }
    }

    LOG_DEBUG("importer", "Imported batch of " + std::to_string(records.size()) + " into " + table +
              " [" + ConflictStrategyToString(strategy) + "]: " + result.Summary());
    return result;
}

void DataImporter::ImportRecord(RowContext& ctx, const nlohmann::json& record,
                                ConflictStrategy strategy, TransferResult& result) {
    if (!record.is_object()) {
        throw std::invalid_argument("record is not an object");
    }
    for (auto it = record.begin(); it != record.end(); ++it) {
        if (!ctx.schema.FindColumn(it.key())) {
            throw std::invalid_argument("unknown column '" + it.key() + "'");
        }
    }

    bool exists = strategy != ConflictStrategy::APPEND && RowExists(ctx, record);
    ConflictResolution resolution = ResolveConflict(strategy, exists, record, ctx.schema.primary_key);

    switch (resolution.action) {
        case WriteAction::INSERT:
            InsertRow(ctx, resolution.values);
            result.created++;
            break;
        case WriteAction::INSERT_FRESH_KEY:
            InsertWithFreshKey(ctx, std::move(resolution.values));
            result.created++;
            break;
        case WriteAction::UPDATE:
            if (!resolution.values.empty()) {
                UpdateRow(ctx, record, resolution.values);
            }
            result.updated++;
            break;
        case WriteAction::SKIP:
            result.skipped++;
            break;
    }
}

bool DataImporter::RowExists(RowContext& ctx, const nlohmann::json& record) {
    // Without a complete key there is nothing to match against
    if (ctx.schema.primary_key.empty()) {
        return false;
    }

    std::string where;
    duckdb::vector<duckdb::Value> params;
    for (const auto& pk : ctx.schema.primary_key) {
        auto it = record.find(pk);
        if (it == record.end() || it->is_null()) {
            return false;
        }
        if (!where.empty()) where += " AND ";
        params.push_back(JsonToValue(*it));
        where += QuoteIdentifier(pk) + " = " + Placeholder(ctx, pk, params.size());
    }

    QueryRows rows = RunQuery(ctx.conn, "SELECT 1 FROM " + ctx.qualified + " WHERE " + where + " LIMIT 1",
                              std::move(params));
    return !rows.Empty();
}

std::string DataImporter::Placeholder(RowContext& ctx, const std::string& column, size_t index) const {
    std::string placeholder = "$" + std::to_string(index);
    const ColumnDef* def = ctx.schema.FindColumn(column);
    // Blobs travel as base64 text
    if (def && ColumnTypeId(*def) == duckdb::LogicalTypeId::BLOB) {
        return "from_base64(" + placeholder + ")";
    }
    return placeholder;
}

void DataImporter::InsertRow(RowContext& ctx, const nlohmann::json& values) {
    if (values.empty()) {
        RunStatement(ctx.conn, "INSERT INTO " + ctx.qualified + " DEFAULT VALUES");
        return;
    }

    std::string columns;
    std::string placeholders;
    duckdb::vector<duckdb::Value> params;
    for (auto it = values.begin(); it != values.end(); ++it) {
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        params.push_back(JsonToValue(it.value()));
        columns += QuoteIdentifier(it.key());
        placeholders += Placeholder(ctx, it.key(), params.size());
    }

    RunStatement(ctx.conn, "INSERT INTO " + ctx.qualified + " (" + columns + ") VALUES (" +
                 placeholders + ")", std::move(params));
}

void DataImporter::InsertWithFreshKey(RowContext& ctx, nlohmann::json values) {
    const auto& primary_key = ctx.schema.primary_key;
    if (primary_key.empty()) {
        InsertRow(ctx, values);
        return;
    }
    if (primary_key.size() > 1) {
        throw std::invalid_argument("cannot generate a composite primary key");
    }

    const std::string& pk = primary_key.front();
    const ColumnDef* column = ctx.schema.FindColumn(pk);
    if (!column) {
        throw std::invalid_argument("primary key column '" + pk + "' not found");
    }

    auto type_id = ColumnTypeId(*column);
    if (column->default_value) {
        // The local default (sequence, uuid(), ...) fills it in
    } else if (IsIntegerType(type_id)) {
        QueryRows next = RunQuery(ctx.conn, "SELECT COALESCE(MAX(" + QuoteIdentifier(pk) + "), 0) + 1 FROM " +
                                  ctx.qualified);
        values[pk] = next.rows[0][0].GetValue<int64_t>();
    } else if (type_id == duckdb::LogicalTypeId::UUID || type_id == duckdb::LogicalTypeId::VARCHAR) {
        QueryRows fresh = RunQuery(ctx.conn, "SELECT uuid()::VARCHAR");
        values[pk] = duckdb::StringValue::Get(fresh.rows[0][0]);
    } else {
        throw std::invalid_argument("cannot generate a value for primary key '" + pk + "' of type " +
                                    column->type);
    }

    InsertRow(ctx, values);
}

void DataImporter::UpdateRow(RowContext& ctx, const nlohmann::json& key_source, const nlohmann::json& values) {
    std::string set_clause;
    duckdb::vector<duckdb::Value> params;
    for (auto it = values.begin(); it != values.end(); ++it) {
        if (!set_clause.empty()) set_clause += ", ";
        params.push_back(JsonToValue(it.value()));
        set_clause += QuoteIdentifier(it.key()) + " = " + Placeholder(ctx, it.key(), params.size());
    }

    std::string where;
    for (const auto& pk : ctx.schema.primary_key) {
        if (!where.empty()) where += " AND ";
        params.push_back(JsonToValue(key_source.at(pk)));
        where += QuoteIdentifier(pk) + " = " + Placeholder(ctx, pk, params.size());
    }

    RunStatement(ctx.conn, "UPDATE " + ctx.qualified + " SET " + set_clause + " WHERE " + where,
                 std::move(params));
}

} // namespace peersync
