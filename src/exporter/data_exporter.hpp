//===----------------------------------------------------------------------===//
//                         PeerSync
//
// exporter/data_exporter.hpp
//
// Paginated, key-ordered row export with transport-safe values
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "exporter/record_batch.hpp"
#include "schema/schema_inspector.hpp"
#include "duckdb.hpp"

namespace peersync {

class DataExporter {
public:
    struct Config {
        uint32_t default_limit;
        uint32_t max_limit;

        Config()
            : default_limit(DEFAULT_PAGE_SIZE)
            , max_limit(MAX_PAGE_SIZE) {}
    };

    DataExporter(SchemaInspector& inspector_p, const Config& config_p = Config{});

    // Rows ordered by primary key (all columns when there is none).
    // limit <= 0 uses the default; larger than max_limit is clamped.
    // has_more is set exactly when the page came back full.
    RecordBatch ExportRecords(const std::string& table, int64_t limit, int64_t offset);

    uint32_t EffectiveLimit(int64_t requested) const;

    // Storage value to JSON: ISO-8601 temporals, canonical UUID text,
    // base64 blobs, decimals as strings, nested types as arrays/objects
    static nlohmann::json ValueToJson(const duckdb::Value& value);

    uint64_t GetRowsExported() const { return rows_exported; }

private:
    SchemaInspector& inspector;
    Config config;
    std::atomic<uint64_t> rows_exported{0};
};

} // namespace peersync
