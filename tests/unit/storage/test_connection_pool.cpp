//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/storage/test_connection_pool.cpp
//
// Unit tests for ConnectionPool and the statement helpers
//===----------------------------------------------------------------------===//

#include "storage/connection_pool.hpp"
#include "storage/sql_util.hpp"
#include "duckdb.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <atomic>
#include <vector>

using namespace peersync;

static std::shared_ptr<duckdb::DuckDB> CreateDB() {
    return std::make_shared<duckdb::DuckDB>(nullptr);
}

//===----------------------------------------------------------------------===//
// Pool Tests
//===----------------------------------------------------------------------===//

void TestPoolWarmup() {
    std::cout << "  Testing min connections are created up front..." << std::endl;

    ConnectionPool::Config config;
    config.min_connections = 3;
    config.max_connections = 6;
    ConnectionPool pool(CreateDB(), config);

    auto stats = pool.GetStats();
    assert(stats.total_created == 3);
    assert(stats.available == 3);
    assert(stats.in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestAcquireRelease() {
    std::cout << "  Testing Acquire/Release..." << std::endl;

    ConnectionPool pool(CreateDB());
    {
        auto conn = pool.Acquire();
        assert(conn);
        assert(pool.GetStats().in_use == 1);

        auto moved = std::move(conn);
        assert(!conn);
        assert(moved);
        assert(pool.GetStats().in_use == 1);
    }
    assert(pool.GetStats().in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestAcquireTimeout() {
    std::cout << "  Testing exhausted pool times out..." << std::endl;

    ConnectionPool::Config config;
    config.min_connections = 0;
    config.max_connections = 2;
    ConnectionPool pool(CreateDB(), config);

    auto a = pool.Acquire();
    auto b = pool.Acquire();
    assert(a && b);

    auto c = pool.Acquire(std::chrono::milliseconds(20));
    assert(!c);
    assert(pool.GetStats().acquire_timeout_count == 1);

    // A waiter is woken by a release
    std::thread releaser([&a]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        a.Release();
    });
    auto d = pool.Acquire(std::chrono::seconds(5));
    assert(d);
    releaser.join();

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentAcquire() {
    std::cout << "  Testing concurrent Acquire/Release..." << std::endl;

    ConnectionPool::Config config;
    config.min_connections = 1;
    config.max_connections = 4;
    ConnectionPool pool(CreateDB(), config);

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 20; ++j) {
                auto conn = pool.Acquire(std::chrono::seconds(5));
                if (conn) {
                    RunQuery(*conn, "SELECT 1");
                    ok.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(ok.load() == 160);
    auto stats = pool.GetStats();
    assert(stats.in_use == 0);
    assert(stats.total_created <= 4);

    std::cout << "    PASSED" << std::endl;
}

void TestShutdown() {
    std::cout << "  Testing Acquire after Shutdown..." << std::endl;

    ConnectionPool pool(CreateDB());
    pool.Shutdown();
    assert(!pool.Acquire(std::chrono::milliseconds(10)));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Statement Helper Tests
//===----------------------------------------------------------------------===//

void TestQuoting() {
    std::cout << "  Testing identifier and literal quoting..." << std::endl;

    assert(QuoteIdentifier("users") == "\"users\"");
    assert(QuoteIdentifier("order") == "\"order\"");
    assert(QuoteIdentifier("a\"b") == "\"a\"\"b\"");
    assert(QuoteLiteral("it's") == "'it''s'");

    std::cout << "    PASSED" << std::endl;
}

void TestRunStatementAndQuery() {
    std::cout << "  Testing RunStatement/RunQuery..." << std::endl;

    ConnectionPool pool(CreateDB());
    auto conn = pool.Acquire();

    RunStatement(*conn, "CREATE TABLE items (id INTEGER PRIMARY KEY, name VARCHAR)");
    int64_t inserted = RunStatement(*conn, "INSERT INTO items VALUES ($1, $2)",
                                    {duckdb::Value::INTEGER(1), duckdb::Value("apple")});
    assert(inserted == 1);
    RunStatement(*conn, "INSERT INTO items VALUES ($1, $2)",
                 {duckdb::Value::INTEGER(2), duckdb::Value("pear")});

    QueryRows rows = RunQuery(*conn, "SELECT id, name FROM items WHERE id >= $1 ORDER BY id",
                              {duckdb::Value::INTEGER(1)});
    assert(rows.Size() == 2);
    assert(rows.names.size() == 2);
    assert(rows.names[1] == "name");
    assert(rows.rows[1][1].ToString() == "pear");

    bool threw = false;
    try {
        RunStatement(*conn, "INSERT INTO items VALUES ($1, $2)",
                     {duckdb::Value::INTEGER(1), duckdb::Value("duplicate")});
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        RunQuery(*conn, "SELECT * FROM missing_table");
    } catch (const StorageError& e) {
        threw = std::string(e.what()).find("missing_table") != std::string::npos;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ConnectionPool Unit Tests ===" << std::endl;

    std::cout << "\n1. Pool:" << std::endl;
    TestPoolWarmup();
    TestAcquireRelease();
    TestAcquireTimeout();
    TestConcurrentAcquire();
    TestShutdown();

    std::cout << "\n2. Statement Helpers:" << std::endl;
    TestQuoting();
    TestRunStatementAndQuery();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
