//===----------------------------------------------------------------------===//
//                         PeerSync
//
// importer/data_importer.hpp
//
// Applies received record batches to local tables under a conflict strategy
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "importer/conflict_strategy.hpp"
#include "importer/transfer_result.hpp"
#include "schema/schema_inspector.hpp"
#include "duckdb.hpp"

namespace peersync {

class DataImporter {
public:
    explicit DataImporter(SchemaInspector& inspector_p);

    // Every record is accounted for exactly once: created, updated, skipped
    // or listed in errors. A record failure never aborts the batch.
    // Throws SyncException when the table itself is unusable.
    TransferResult ImportRecords(const std::string& table,
                                 const nlohmann::json& records,
                                 ConflictStrategy strategy);

    // Returns false when the table already existed. Never alters an
    // existing table. Throws SyncException on an unusable descriptor.
    bool CreateTable(const std::string& table, const TableSchema& schema);

    bool TableExists(const std::string& table);

    // JSON scalar to a bindable value; arrays and objects travel as text
    static duckdb::Value JsonToValue(const nlohmann::json& value);

private:
    struct RowContext;

    void ImportRecord(RowContext& ctx, const nlohmann::json& record,
                      ConflictStrategy strategy, TransferResult& result);

    bool RowExists(RowContext& ctx, const nlohmann::json& record);

    void InsertRow(RowContext& ctx, const nlohmann::json& values);
    void InsertWithFreshKey(RowContext& ctx, nlohmann::json values);
    void UpdateRow(RowContext& ctx, const nlohmann::json& key_source, const nlohmann::json& values);

    std::string Placeholder(RowContext& ctx, const std::string& column, size_t index) const;

private:
    SchemaInspector& inspector;
};

} // namespace peersync
