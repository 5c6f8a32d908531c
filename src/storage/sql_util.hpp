//===----------------------------------------------------------------------===//
//                         PeerSync
//
// storage/sql_util.hpp
//
// Helpers for running parameterized DuckDB statements
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace peersync {

// A statement the store rejected (prepare or execute), with its message
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

struct QueryRows {
    std::vector<std::string> names;
    std::vector<duckdb::LogicalType> types;
    std::vector<std::vector<duckdb::Value>> rows;

    size_t Size() const { return rows.size(); }
    bool Empty() const { return rows.empty(); }
};

// Identifiers must already be validated; quoting only guards reserved words
std::string QuoteIdentifier(const std::string& identifier);

std::string QuoteLiteral(const std::string& literal);

// Fully materialized result. Throws StorageError on failure.
QueryRows RunQuery(duckdb::Connection& conn, const std::string& sql,
                   duckdb::vector<duckdb::Value> params = {});

// Statement without a result set; returns the affected row count when reported
int64_t RunStatement(duckdb::Connection& conn, const std::string& sql,
                     duckdb::vector<duckdb::Value> params = {});

} // namespace peersync
