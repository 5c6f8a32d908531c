//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/exporter/test_data_exporter.cpp
//
// Unit tests for DataExporter
//===----------------------------------------------------------------------===//

#include "exporter/data_exporter.hpp"
#include "storage/sql_util.hpp"
#include "sync_exception.hpp"
#include <cassert>
#include <iostream>

using namespace peersync;

namespace {

struct Fixture {
    std::shared_ptr<duckdb::DuckDB> db;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<SchemaInspector> inspector;
    std::unique_ptr<DataExporter> exporter;

    Fixture() {
        db = std::make_shared<duckdb::DuckDB>(nullptr);
        pool = std::make_unique<ConnectionPool>(db);
        inspector = std::make_unique<SchemaInspector>(*pool);

        DataExporter::Config config;
        config.default_limit = 4;
        config.max_limit = 6;
        exporter = std::make_unique<DataExporter>(*inspector, config);

        auto conn = pool->Acquire();
        RunStatement(*conn, "CREATE TABLE items (id INTEGER PRIMARY KEY, name VARCHAR)");
        // Inserted out of key order
        RunStatement(*conn,
            "INSERT INTO items SELECT i, 'item' || i FROM range(10, 0, -1) t(i)");
        RunStatement(*conn, "CREATE TABLE tags (label VARCHAR, weight INTEGER)");
        RunStatement(*conn, "INSERT INTO tags VALUES ('b', 2), ('a', 1), ('c', 3)");
        RunStatement(*conn, "CREATE TABLE schema_migrations (version BIGINT PRIMARY KEY)");
    }
};

} // namespace

//===----------------------------------------------------------------------===//
// Pagination Tests
//===----------------------------------------------------------------------===//

void TestEffectiveLimit() {
    std::cout << "  Testing page size clamping..." << std::endl;

    Fixture f;
    assert(f.exporter->EffectiveLimit(0) == 4);
    assert(f.exporter->EffectiveLimit(-5) == 4);
    assert(f.exporter->EffectiveLimit(3) == 3);
    assert(f.exporter->EffectiveLimit(100) == 6);

    std::cout << "    PASSED" << std::endl;
}

void TestPagesInKeyOrder() {
    std::cout << "  Testing pages are disjoint and key ordered..." << std::endl;

    Fixture f;
    std::vector<int64_t> seen;
    int64_t offset = 0;
    int pages = 0;
    while (true) {
        RecordBatch batch = f.exporter->ExportRecords("items", 3, offset);
        assert(batch.offset == offset);
        for (const auto& record : batch.records) {
            seen.push_back(record["id"].get<int64_t>());
        }
        pages++;
        offset += static_cast<int64_t>(batch.Size());
        if (!batch.has_more) break;
    }

    // 10 rows in pages of 3: 3, 3, 3, 1
    assert(pages == 4);
    assert(seen.size() == 10);
    for (size_t i = 0; i < seen.size(); i++) {
        assert(seen[i] == static_cast<int64_t>(i + 1));
    }
    assert(f.exporter->GetRowsExported() == 10);

    std::cout << "    PASSED" << std::endl;
}

void TestFullLastPage() {
    std::cout << "  Testing an exactly full last page reports has_more..." << std::endl;

    Fixture f;
    RecordBatch full = f.exporter->ExportRecords("items", 5, 5);
    assert(full.Size() == 5);
    assert(full.has_more);

    RecordBatch past = f.exporter->ExportRecords("items", 5, 10);
    assert(past.Size() == 0);
    assert(!past.has_more);

    RecordBatch negative = f.exporter->ExportRecords("items", 2, -3);
    assert(negative.offset == 0);
    assert(negative.records[0]["id"] == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestTableWithoutKey() {
    std::cout << "  Testing table without primary key is fully ordered..." << std::endl;

    Fixture f;
    RecordBatch batch = f.exporter->ExportRecords("tags", 0, 0);
    assert(batch.Size() == 3);
    assert(!batch.has_more);
    assert(batch.records[0]["label"] == "a");
    assert(batch.records[2]["weight"] == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestExportRejections() {
    std::cout << "  Testing export rejections..." << std::endl;

    Fixture f;
    auto code_of = [&](const std::string& table) {
        try {
            f.exporter->ExportRecords(table, 10, 0);
        } catch (const SyncException& e) {
            return e.Code();
        }
        return ErrorCode::OK;
    };

    assert(code_of("schema_migrations") == ErrorCode::ACCESS_DENIED);
    assert(code_of("items; DELETE FROM items") == ErrorCode::INVALID_IDENTIFIER);
    assert(code_of("missing") == ErrorCode::TABLE_NOT_FOUND);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Value Encoding Tests
//===----------------------------------------------------------------------===//

void TestValueEncoding() {
    std::cout << "  Testing transport encoding of column values..." << std::endl;

    Fixture f;
    {
        auto conn = f.pool->Acquire();
        RunStatement(*conn,
            "CREATE TABLE samples (id INTEGER PRIMARY KEY, flag BOOLEAN, ratio DOUBLE, "
            "price DECIMAL(10,2), born DATE, seen TIMESTAMP, ref UUID, raw BLOB, "
            "scores INTEGER[], missing VARCHAR)");
        RunStatement(*conn,
            "INSERT INTO samples VALUES (1, true, 0.5, 12.50, DATE '2024-02-29', "
            "TIMESTAMP '2024-01-02 03:04:05', '6f1c2a9e-3b4d-4c5e-8f90-123456789abc', "
            "'\\x01\\x02'::BLOB, [1, 2, 3], NULL)");
    }

    RecordBatch batch = f.exporter->ExportRecords("samples", 10, 0);
    assert(batch.Size() == 1);
    const auto& r = batch.records[0];

    assert(r["id"] == 1);
    assert(r["flag"] == true);
    assert(r["ratio"] == 0.5);
    assert(r["price"] == "12.50");
    assert(r["born"] == "2024-02-29");
    assert(r["seen"] == "2024-01-02T03:04:05");
    assert(r["ref"] == "6f1c2a9e-3b4d-4c5e-8f90-123456789abc");
    assert(r["raw"] == "AQI=");
    assert(r["scores"].is_array());
    assert(r["scores"].size() == 3);
    assert(r["scores"][2] == 3);
    assert(r["missing"].is_null());

    assert(DataExporter::ValueToJson(duckdb::Value()).is_null());
    assert(DataExporter::ValueToJson(duckdb::Value::BIGINT(-7)) == -7);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== DataExporter Unit Tests ===" << std::endl;

    std::cout << "\n1. Pagination:" << std::endl;
    TestEffectiveLimit();
    TestPagesInKeyOrder();
    TestFullLastPage();
    TestTableWithoutKey();
    TestExportRejections();

    std::cout << "\n2. Value Encoding:" << std::endl;
    TestValueEncoding();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
