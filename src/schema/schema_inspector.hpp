//===----------------------------------------------------------------------===//
//                         PeerSync
//
// schema/schema_inspector.hpp
//
// Catalog introspection: transferable tables, columns, keys and counts
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "schema/table_schema.hpp"
#include "storage/connection_pool.hpp"
#include "duckdb.hpp"

namespace peersync {

class SchemaInspector {
public:
    struct Config {
        std::string schema_name;
        // Never listed, described, counted or exported
        std::vector<std::string> excluded_tables;
        std::vector<std::string> excluded_prefixes;
        bool exact_counts;

        Config()
            : schema_name("main")
            , excluded_tables({"schema_migrations", "oban_jobs", "oban_peers",
                               "oban_producers", "user_tokens"})
            , excluded_prefixes({"pg_", "oban_", "duckdb_", "sqlite_"})
            , exact_counts(false) {}
    };

    SchemaInspector(ConnectionPool& pool_p, const Config& config_p = Config{});

    static bool IsValidIdentifier(const std::string& name);

    bool IsExcluded(const std::string& table) const;

    // Sorted by name, deny-listed tables removed
    std::vector<TableInfo> ListTables();

    // Throws SyncException: INVALID_IDENTIFIER, ACCESS_DENIED, TABLE_NOT_FOUND
    TableSchema GetSchema(const std::string& table);

    // Estimate unless exact_counts is set; never negative
    int64_t GetCount(const std::string& table);

    bool TableExists(const std::string& table);

    // Connection-scoped variants used inside importer/exporter batches.
    // These validate the identifier but do not apply the deny-list.
    bool TableExists(duckdb::Connection& conn, const std::string& table) const;
    TableSchema LoadSchema(duckdb::Connection& conn, const std::string& table) const;
    int64_t CountRows(duckdb::Connection& conn, const std::string& table, bool exact) const;

    // Identifier and deny-list check; throws SyncException
    void CheckTransferable(const std::string& table) const;

    // "schema"."table"
    std::string QualifiedName(const std::string& table) const;

    // Throws SyncException(INTERNAL_ERROR) when the pool stays exhausted
    PooledConnection AcquireConnection();

    const Config& GetConfig() const { return config; }

    //===------------------------------------------------------------------===//
    // Table creation from a schema descriptor
    //===------------------------------------------------------------------===//

    // Map a column type to a local DuckDB type; empty when rejected
    static std::string NormalizeType(const std::string& type);

    // Default expression safe to reproduce, or nullopt
    static std::optional<std::string> PortableDefault(const std::string& expr);

    // CREATE TABLE IF NOT EXISTS for the descriptor; throws SyncException
    std::string BuildCreateTableSql(const std::string& table, const TableSchema& schema) const;

private:
    static void ValidateIdentifier(const std::string& name, const std::string& what);

private:
    ConnectionPool& pool;
    Config config;
};

} // namespace peersync
