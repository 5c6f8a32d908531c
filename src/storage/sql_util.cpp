//===----------------------------------------------------------------------===//
//                         PeerSync
//
// storage/sql_util.cpp
//
//===----------------------------------------------------------------------===//

#include "storage/sql_util.hpp"

namespace peersync {

std::string QuoteIdentifier(const std::string& identifier) {
    std::string quoted = "\"";
    for (char c : identifier) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string QuoteLiteral(const std::string& literal) {
    std::string quoted = "'";
    for (char c : literal) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

namespace {

std::unique_ptr<duckdb::QueryResult> Execute(duckdb::Connection& conn, const std::string& sql,
                                             duckdb::vector<duckdb::Value>& params) {
    if (params.empty()) {
        // DDL and multi-statement scripts go through the plain query path
        std::unique_ptr<duckdb::QueryResult> result = conn.Query(sql);
        if (result->HasError()) {
            throw StorageError(result->GetError());
        }
        return result;
    }

    auto prepared = conn.Prepare(sql);
    if (prepared->HasError()) {
        throw StorageError(prepared->GetError());
    }

    auto result = prepared->Execute(params, false);
    if (result->HasError()) {
        throw StorageError(result->GetError());
    }
    return result;
}

} // anonymous namespace

QueryRows RunQuery(duckdb::Connection& conn, const std::string& sql,
                   duckdb::vector<duckdb::Value> params) {
    auto result = Execute(conn, sql, params);

    QueryRows rows;
    duckdb::idx_t col_count = result->ColumnCount();
    for (duckdb::idx_t i = 0; i < col_count; i++) {
        rows.names.push_back(result->names[i]);
        rows.types.push_back(result->types[i]);
    }

    while (true) {
        auto chunk = result->Fetch();
        if (!chunk || chunk->size() == 0) break;

        for (duckdb::idx_t row = 0; row < chunk->size(); row++) {
            std::vector<duckdb::Value> values;
            values.reserve(col_count);
            for (duckdb::idx_t col = 0; col < col_count; col++) {
                values.push_back(chunk->GetValue(col, row));
            }
            rows.rows.push_back(std::move(values));
        }
    }
    return rows;
}

int64_t RunStatement(duckdb::Connection& conn, const std::string& sql,
                     duckdb::vector<duckdb::Value> params) {
    QueryRows rows = RunQuery(conn, sql, std::move(params));
    // DML reports a single "Count" column
    if (rows.Size() == 1 && rows.rows[0].size() == 1 && !rows.rows[0][0].IsNull() &&
        rows.types[0].IsIntegral()) {
        return rows.rows[0][0].GetValue<int64_t>();
    }
    return 0;
}

} // namespace peersync
