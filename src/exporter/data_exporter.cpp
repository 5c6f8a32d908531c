//===----------------------------------------------------------------------===//
//                         PeerSync
//
// exporter/data_exporter.cpp
//
// Data exporter implementation
//===----------------------------------------------------------------------===//

#include "exporter/data_exporter.hpp"
#include "storage/sql_util.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"
#include "duckdb/common/types/blob.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include <cmath>

namespace peersync {

namespace {

// "2024-01-02 03:04:05.123" -> "2024-01-02T03:04:05.123"
std::string IsoFromSqlTimestamp(std::string text) {
    auto space = text.find(' ');
    if (space != std::string::npos) {
        text[space] = 'T';
    }
    return text;
}

} // anonymous namespace

DataExporter::DataExporter(SchemaInspector& inspector_p, const Config& config_p)
    : inspector(inspector_p)
    , config(config_p) {}

uint32_t DataExporter::EffectiveLimit(int64_t requested) const {
    if (requested <= 0) {
        return config.default_limit;
    }
    if (requested > static_cast<int64_t>(config.max_limit)) {
        return config.max_limit;
    }
    return static_cast<uint32_t>(requested);
}

RecordBatch DataExporter::ExportRecords(const std::string& table, int64_t limit, int64_t offset) {
    inspector.CheckTransferable(table);

    uint32_t effective_limit = EffectiveLimit(limit);
    if (offset < 0) {
        offset = 0;
    }

    auto conn = inspector.AcquireConnection();
    TableSchema schema = inspector.LoadSchema(*conn, table);

    std::string order_by;
    if (schema.primary_key.empty()) {
        order_by = "ALL";
    } else {
        for (const auto& pk : schema.primary_key) {
            if (!order_by.empty()) order_by += ", ";
            order_by += QuoteIdentifier(pk) + " ASC";
        }
    }

    std::string sql = "SELECT * FROM " + inspector.QualifiedName(table) +
                      " ORDER BY " + order_by +
                      " LIMIT " + std::to_string(effective_limit) +
                      " OFFSET " + std::to_string(offset);

    QueryRows rows = RunQuery(*conn, sql);

    RecordBatch batch;
    batch.offset = offset;
    for (const auto& row : rows.rows) {
        nlohmann::json record = nlohmann::json::object();
        for (size_t col = 0; col < row.size(); col++) {
            record[rows.names[col]] = ValueToJson(row[col]);
        }
        batch.records.push_back(std::move(record));
    }
    batch.has_more = batch.records.size() == effective_limit;

    rows_exported += batch.records.size();
    LOG_DEBUG("exporter", "Exported " + std::to_string(batch.records.size()) + " rows from " + table +
              " (offset=" + std::to_string(offset) + ", limit=" + std::to_string(effective_limit) + ")");
    return batch;
}

nlohmann::json DataExporter::ValueToJson(const duckdb::Value& value) {
    using duckdb::LogicalTypeId;

    if (value.IsNull()) {
        return nullptr;
    }

    const auto& type = value.type();
    switch (type.id()) {
        case LogicalTypeId::BOOLEAN:
            return value.GetValue<bool>();

        case LogicalTypeId::TINYINT:
        case LogicalTypeId::SMALLINT:
        case LogicalTypeId::INTEGER:
        case LogicalTypeId::BIGINT:
            return value.GetValue<int64_t>();

        case LogicalTypeId::UTINYINT:
        case LogicalTypeId::USMALLINT:
        case LogicalTypeId::UINTEGER:
        case LogicalTypeId::UBIGINT:
            return value.GetValue<uint64_t>();

        case LogicalTypeId::FLOAT:
        case LogicalTypeId::DOUBLE: {
            double d = value.GetValue<double>();
            if (!std::isfinite(d)) {
                return value.ToString();
            }
            return d;
        }

        // Exact text so no precision is lost in transit
        case LogicalTypeId::HUGEINT:
        case LogicalTypeId::DECIMAL:
            return value.ToString();

        case LogicalTypeId::VARCHAR:
            return duckdb::StringValue::Get(value);

        case LogicalTypeId::TIMESTAMP:
        case LogicalTypeId::TIMESTAMP_SEC:
        case LogicalTypeId::TIMESTAMP_MS:
        case LogicalTypeId::TIMESTAMP_NS:
            return IsoFromSqlTimestamp(value.ToString());

        case LogicalTypeId::TIMESTAMP_TZ: {
            // Stored as UTC micros; render without the session time zone
            auto ts = value.GetValueUnsafe<duckdb::timestamp_t>();
            if (!duckdb::Timestamp::IsFinite(ts)) {
                return value.ToString();
            }
            return IsoFromSqlTimestamp(duckdb::Timestamp::ToString(ts)) + "Z";
        }

        case LogicalTypeId::BLOB: {
            const auto& bytes = duckdb::StringValue::Get(value);
            return duckdb::Blob::ToBase64(duckdb::string_t(bytes.data(), static_cast<uint32_t>(bytes.size())));
        }

        case LogicalTypeId::LIST: {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& child : duckdb::ListValue::GetChildren(value)) {
                list.push_back(ValueToJson(child));
            }
            return list;
        }

        case LogicalTypeId::ARRAY: {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& child : duckdb::ArrayValue::GetChildren(value)) {
                list.push_back(ValueToJson(child));
            }
            return list;
        }

        case LogicalTypeId::STRUCT: {
            nlohmann::json object = nlohmann::json::object();
            const auto& children = duckdb::StructValue::GetChildren(value);
            for (size_t i = 0; i < children.size(); i++) {
                object[duckdb::StructType::GetChildName(type, i)] = ValueToJson(children[i]);
            }
            return object;
        }

        case LogicalTypeId::MAP: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& entry : duckdb::MapValue::GetChildren(value)) {
                const auto& kv = duckdb::StructValue::GetChildren(entry);
                object[kv[0].ToString()] = ValueToJson(kv[1]);
            }
            return object;
        }

        // DATE, TIME, UUID, INTERVAL, ENUM and the rest already print canonically
        default:
            return value.ToString();
    }
}

} // namespace peersync
