//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/importer/test_data_importer.cpp
//
// Unit tests for DataImporter against an in-memory database
//===----------------------------------------------------------------------===//

#include "importer/data_importer.hpp"
#include "storage/sql_util.hpp"
#include "sync_exception.hpp"
#include <cassert>
#include <iostream>

using namespace peersync;
using nlohmann::json;

namespace {

struct Fixture {
    std::shared_ptr<duckdb::DuckDB> db;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<SchemaInspector> inspector;
    std::unique_ptr<DataImporter> importer;

    Fixture() {
        db = std::make_shared<duckdb::DuckDB>(nullptr);
        pool = std::make_unique<ConnectionPool>(db);

        // Receiving side: nothing is deny-listed locally
        SchemaInspector::Config config;
        config.excluded_tables.clear();
        config.excluded_prefixes.clear();
        config.exact_counts = true;
        inspector = std::make_unique<SchemaInspector>(*pool, config);
        importer = std::make_unique<DataImporter>(*inspector);

        Exec("CREATE TABLE users (id INTEGER PRIMARY KEY, name VARCHAR, note VARCHAR)");
        Exec("INSERT INTO users VALUES (1, 'old', 'keep')");
    }

    void Exec(const std::string& sql) {
        auto conn = pool->Acquire();
        RunStatement(*conn, sql);
    }

    QueryRows Query(const std::string& sql) {
        auto conn = pool->Acquire();
        return RunQuery(*conn, sql);
    }

    int64_t Count(const std::string& table) {
        return Query("SELECT COUNT(*) FROM " + table).rows[0][0].GetValue<int64_t>();
    }

    std::string Text(const std::string& sql) {
        auto rows = Query(sql);
        return rows.rows[0][0].IsNull() ? "<null>" : rows.rows[0][0].ToString();
    }
};

template <typename Fn>
ErrorCode CaptureError(Fn&& fn) {
    try {
        fn();
    } catch (const SyncException& e) {
        return e.Code();
    }
    return ErrorCode::OK;
}

} // namespace

//===----------------------------------------------------------------------===//
// Conflict Strategy Tests
//===----------------------------------------------------------------------===//

void TestSkip() {
    std::cout << "  Testing skip keeps the existing row..." << std::endl;

    Fixture f;
    json records = json::array({
        {{"id", 1}, {"name", "new"}, {"note", nullptr}},
        {{"id", 2}, {"name", "second"}, {"note", "n2"}}
    });

    TransferResult result = f.importer->ImportRecords("users", records, ConflictStrategy::SKIP);
    assert(result.created == 1);
    assert(result.skipped == 1);
    assert(result.updated == 0);
    assert(result.errors.empty());
    assert(f.Text("SELECT name FROM users WHERE id = 1") == "old");
    assert(f.Count("users") == 2);

    // Running the same batch again changes nothing
    TransferResult again = f.importer->ImportRecords("users", records, ConflictStrategy::SKIP);
    assert(again.created == 0);
    assert(again.skipped == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestOverwrite() {
    std::cout << "  Testing overwrite replaces supplied columns..." << std::endl;

    Fixture f;
    json records = json::array({{{"id", 1}, {"name", "new"}, {"note", nullptr}}});

    TransferResult result = f.importer->ImportRecords("users", records, ConflictStrategy::OVERWRITE);
    assert(result.updated == 1);
    assert(f.Text("SELECT name FROM users WHERE id = 1") == "new");
    assert(f.Text("SELECT note FROM users WHERE id = 1") == "<null>");

    // Columns absent from the record are left alone
    f.Exec("UPDATE users SET note = 'again' WHERE id = 1");
    json partial = json::array({{{"id", 1}, {"name", "newer"}}});
    f.importer->ImportRecords("users", partial, ConflictStrategy::OVERWRITE);
    assert(f.Text("SELECT note FROM users WHERE id = 1") == "again");

    std::cout << "    PASSED" << std::endl;
}

void TestMerge() {
    std::cout << "  Testing merge keeps existing values under nulls..." << std::endl;

    Fixture f;
    json records = json::array({
        {{"id", 1}, {"name", "new"}, {"note", nullptr}},
        {{"id", 3}, {"name", "third"}, {"note", nullptr}}
    });

    TransferResult result = f.importer->ImportRecords("users", records, ConflictStrategy::MERGE);
    assert(result.updated == 1);
    assert(result.created == 1);
    assert(f.Text("SELECT name FROM users WHERE id = 1") == "new");
    assert(f.Text("SELECT note FROM users WHERE id = 1") == "keep");
    assert(f.Text("SELECT note FROM users WHERE id = 3") == "<null>");

    // An existing row still counts as updated when every incoming value is null
    json nothing_new = json::array({{{"id", 1}, {"name", nullptr}, {"note", nullptr}}});
    TransferResult unchanged = f.importer->ImportRecords("users", nothing_new, ConflictStrategy::MERGE);
    assert(unchanged.updated == 1);
    assert(unchanged.skipped == 0);
    assert(unchanged.errors.empty());
    assert(f.Text("SELECT name FROM users WHERE id = 1") == "new");
    assert(f.Text("SELECT note FROM users WHERE id = 1") == "keep");

    json key_only = json::array({{{"id", 1}}});
    TransferResult bare = f.importer->ImportRecords("users", key_only, ConflictStrategy::OVERWRITE);
    assert(bare.updated == 1);
    assert(bare.skipped == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestAppendIntegerKey() {
    std::cout << "  Testing append generates integer keys..." << std::endl;

    Fixture f;
    f.Exec("INSERT INTO users VALUES (5, 'five', NULL)");
    json records = json::array({
        {{"id", 1}, {"name", "copy"}, {"note", nullptr}},
        {{"id", 1}, {"name", "copy2"}, {"note", nullptr}}
    });

    TransferResult result = f.importer->ImportRecords("users", records, ConflictStrategy::APPEND);
    assert(result.created == 2);
    assert(result.errors.empty());
    assert(f.Count("users") == 4);
    assert(f.Text("SELECT name FROM users WHERE id = 1") == "old");
    assert(f.Text("SELECT name FROM users WHERE id = 6") == "copy");
    assert(f.Text("SELECT name FROM users WHERE id = 7") == "copy2");

    std::cout << "    PASSED" << std::endl;
}

void TestAppendSequenceKey() {
    std::cout << "  Testing append leaves sequence keys to the column default..." << std::endl;

    Fixture f;
    f.Exec("CREATE SEQUENCE ticket_seq START 1");
    f.Exec("CREATE TABLE tickets (id INTEGER PRIMARY KEY DEFAULT nextval('ticket_seq'), title VARCHAR)");
    f.Exec("INSERT INTO tickets (title) VALUES ('a'), ('b')");
    // A row above the sequence must not pull generated keys past it
    f.Exec("INSERT INTO tickets VALUES (40, 'manual')");

    TransferResult result = f.importer->ImportRecords("tickets",
        json::array({{{"id", 1}, {"title", "copy"}}}), ConflictStrategy::APPEND);
    assert(result.created == 1);
    assert(result.errors.empty());
    assert(f.Text("SELECT id FROM tickets WHERE title = 'copy'") == "3");

    // The local application keeps inserting through the sequence
    f.Exec("INSERT INTO tickets (title) VALUES ('local')");
    assert(f.Text("SELECT id FROM tickets WHERE title = 'local'") == "4");
    assert(f.Count("tickets") == 5);

    std::cout << "    PASSED" << std::endl;
}

void TestAppendOtherKeys() {
    std::cout << "  Testing append for text, keyless and composite tables..." << std::endl;

    Fixture f;
    f.Exec("CREATE TABLE docs (slug VARCHAR PRIMARY KEY, title VARCHAR)");
    f.Exec("INSERT INTO docs VALUES ('intro', 'Intro')");
    f.Exec("CREATE TABLE events (name VARCHAR, at INTEGER)");
    f.Exec("CREATE TABLE memberships (user_id INTEGER, team_id INTEGER, role VARCHAR, "
           "PRIMARY KEY (user_id, team_id))");

    TransferResult docs = f.importer->ImportRecords("docs",
        json::array({{{"slug", "intro"}, {"title", "Copy"}}}), ConflictStrategy::APPEND);
    assert(docs.created == 1);
    assert(f.Count("docs") == 2);
    assert(f.Text("SELECT COUNT(*) FROM docs WHERE slug <> 'intro' AND title = 'Copy'") == "1");

    json event = {{"name", "login"}, {"at", 10}};
    TransferResult events = f.importer->ImportRecords("events", json::array({event, event}),
                                                      ConflictStrategy::APPEND);
    assert(events.created == 2);
    assert(f.Count("events") == 2);

    TransferResult memberships = f.importer->ImportRecords("memberships",
        json::array({{{"user_id", 1}, {"team_id", 1}, {"role", "admin"}}}), ConflictStrategy::APPEND);
    assert(memberships.created == 0);
    assert(memberships.errors.size() == 1);
    assert(memberships.errors[0].reason.find("composite") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Record Error Tests
//===----------------------------------------------------------------------===//

void TestRecordErrorsDoNotAbortBatch() {
    std::cout << "  Testing a failing record does not abort the batch..." << std::endl;

    Fixture f;
    f.Exec("CREATE TABLE accounts (id INTEGER PRIMARY KEY, email VARCHAR UNIQUE)");

    json records = json::array();
    for (int i = 1; i <= 9; i++) {
        records.push_back({{"id", i}, {"email", "user" + std::to_string(i) + "@example.com"}});
    }
    // Same email as id 4
    records.push_back({{"id", 10}, {"email", "user4@example.com"}});

    TransferResult result = f.importer->ImportRecords("accounts", records, ConflictStrategy::SKIP);
    assert(result.created == 9);
    assert(result.errors.size() == 1);
    assert(result.errors[0].record["id"] == 10);
    assert(!result.errors[0].reason.empty());
    assert(result.Processed() == 10);
    assert(f.Count("accounts") == 9);

    std::cout << "    PASSED" << std::endl;
}

void TestMalformedRecords() {
    std::cout << "  Testing malformed records are reported..." << std::endl;

    Fixture f;
    json records = json::array({
        "not an object",
        {{"id", 8}, {"nickname", "x"}},
        {{"id", "not a number"}, {"name", "bad"}},
        {{"id", 9}, {"name", "fine"}}
    });

    TransferResult result = f.importer->ImportRecords("users", records, ConflictStrategy::SKIP);
    assert(result.created == 1);
    assert(result.errors.size() == 3);
    assert(result.errors[1].reason.find("nickname") != std::string::npos);
    assert(result.Processed() == 4);

    auto json_result = result.ToJson();
    assert(json_result["errors"].size() == 3);
    assert(json_result["created"] == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestTableLevelFailures() {
    std::cout << "  Testing unusable tables raise..." << std::endl;

    Fixture f;
    json records = json::array({{{"id", 1}}});
    assert(CaptureError([&]() { f.importer->ImportRecords("missing", records, ConflictStrategy::SKIP); }) ==
           ErrorCode::TABLE_NOT_FOUND);
    assert(CaptureError([&]() { f.importer->ImportRecords("users;--", records, ConflictStrategy::SKIP); }) ==
           ErrorCode::INVALID_IDENTIFIER);
    assert(CaptureError([&]() { f.importer->ImportRecords("users", json::object(), ConflictStrategy::SKIP); }) ==
           ErrorCode::PROTOCOL_ERROR);

    TransferResult empty = f.importer->ImportRecords("users", json::array(), ConflictStrategy::MERGE);
    assert(empty.Processed() == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Value and Table Creation Tests
//===----------------------------------------------------------------------===//

void TestTypedValues() {
    std::cout << "  Testing transport values bind to column types..." << std::endl;

    Fixture f;
    f.Exec("CREATE TABLE samples (id INTEGER PRIMARY KEY, seen TIMESTAMP, price DECIMAL(10,2), "
           "ref UUID, raw BLOB, tags VARCHAR)");

    json records = json::array({{
        {"id", 1},
        {"seen", "2024-01-02T03:04:05"},
        {"price", "12.50"},
        {"ref", "6f1c2a9e-3b4d-4c5e-8f90-123456789abc"},
        {"raw", "AQI="},
        {"tags", json::array({"a", "b"})}
    }});

    TransferResult result = f.importer->ImportRecords("samples", records, ConflictStrategy::SKIP);
    assert(result.created == 1);
    assert(result.errors.empty());
    assert(f.Text("SELECT seen FROM samples") == "2024-01-02 03:04:05");
    assert(f.Text("SELECT price FROM samples") == "12.50");
    assert(f.Text("SELECT octet_length(raw) FROM samples") == "2");
    assert(f.Text("SELECT tags FROM samples") == "[\"a\",\"b\"]");

    assert(DataImporter::JsonToValue(json(nullptr)).IsNull());
    assert(DataImporter::JsonToValue(json(true)).GetValue<bool>());
    assert(DataImporter::JsonToValue(json(42)).GetValue<int64_t>() == 42);

    std::cout << "    PASSED" << std::endl;
}

void TestCreateTable() {
    std::cout << "  Testing CreateTable is idempotent..." << std::endl;

    Fixture f;
    TableSchema schema;
    schema.table = "projects";
    schema.columns.push_back({"id", "bigint", false, std::nullopt});
    schema.columns.push_back({"title", "text", true, std::nullopt});
    schema.primary_key = {"id"};

    assert(!f.importer->TableExists("projects"));
    assert(f.importer->CreateTable("projects", schema));
    assert(f.importer->TableExists("projects"));
    assert(!f.importer->CreateTable("projects", schema));

    // Existing tables are never altered
    TableSchema wider = schema;
    wider.columns.push_back({"extra", "text", true, std::nullopt});
    assert(!f.importer->CreateTable("projects", wider));
    assert(f.inspector->GetSchema("projects").columns.size() == 2);

    TransferResult result = f.importer->ImportRecords("projects",
        json::array({{{"id", 1}, {"title", "alpha"}}}), ConflictStrategy::SKIP);
    assert(result.created == 1);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== DataImporter Unit Tests ===" << std::endl;

    std::cout << "\n1. Conflict Strategies:" << std::endl;
    TestSkip();
    TestOverwrite();
    TestMerge();
    TestAppendIntegerKey();
    TestAppendSequenceKey();
    TestAppendOtherKeys();

    std::cout << "\n2. Record Errors:" << std::endl;
    TestRecordErrorsDoNotAbortBatch();
    TestMalformedRecords();
    TestTableLevelFailures();

    std::cout << "\n3. Values and Tables:" << std::endl;
    TestTypedValues();
    TestCreateTable();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
