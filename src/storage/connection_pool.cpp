//===----------------------------------------------------------------------===//
//                         PeerSync
//
// storage/connection_pool.cpp
//
// DuckDB connection pool implementation
//===----------------------------------------------------------------------===//

#include "storage/connection_pool.hpp"
#include "logging/logger.hpp"

namespace peersync {

//===----------------------------------------------------------------------===//
// PooledConnection
//===----------------------------------------------------------------------===//

PooledConnection::PooledConnection(ConnectionPool* pool_p, duckdb::Connection* conn)
    : pool(pool_p), connection(conn) {}

PooledConnection::~PooledConnection() {
    Release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool(other.pool), connection(other.connection) {
    other.pool = nullptr;
    other.connection = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        Release();
        pool = other.pool;
        connection = other.connection;
        other.pool = nullptr;
        other.connection = nullptr;
    }
    return *this;
}

void PooledConnection::Release() {
    if (pool && connection) {
        pool->Release(connection);
    }
    pool = nullptr;
    connection = nullptr;
}

//===----------------------------------------------------------------------===//
// ConnectionPool
//===----------------------------------------------------------------------===//

ConnectionPool::ConnectionPool(std::shared_ptr<duckdb::DuckDB> db_p, const Config& config_p)
    : db(std::move(db_p))
    , config(config_p) {

    std::lock_guard<std::mutex> lock(mutex);
    while (available.size() < config.min_connections) {
        available.push_back(std::make_unique<duckdb::Connection>(*db));
        total_created++;
    }

    LOG_DEBUG("conn_pool", "Connection pool created (min=" + std::to_string(config.min_connections) +
              ", max=" + std::to_string(config.max_connections) + ")");
}

ConnectionPool::~ConnectionPool() {
    Shutdown();
}

void ConnectionPool::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!running) {
        return;
    }
    running = false;
    available.clear();
    available_cv.notify_all();
}

PooledConnection ConnectionPool::Acquire() {
    return Acquire(config.acquire_timeout);
}

PooledConnection ConnectionPool::Acquire(std::chrono::milliseconds timeout) {
    acquire_count++;
    auto deadline = Clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex);
    while (running) {
        if (!available.empty()) {
            auto conn = std::move(available.back());
            available.pop_back();
            duckdb::Connection* raw = conn.get();
            in_use[raw] = std::move(conn);
            return PooledConnection(this, raw);
        }

        if (in_use.size() < config.max_connections) {
            auto conn = std::make_unique<duckdb::Connection>(*db);
            total_created++;
            duckdb::Connection* raw = conn.get();
            in_use[raw] = std::move(conn);
            return PooledConnection(this, raw);
        }

        if (available_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
            break;
        }
    }

    acquire_timeout_count++;
    LOG_WARN("conn_pool", "Timed out acquiring connection (in_use=" +
             std::to_string(in_use.size()) + ")");
    return PooledConnection();
}

void ConnectionPool::Release(duckdb::Connection* conn) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = in_use.find(conn);
    if (it == in_use.end()) {
        return;
    }
    auto owned = std::move(it->second);
    in_use.erase(it);

    if (running && available.size() < config.max_connections) {
        available.push_back(std::move(owned));
    }
    available_cv.notify_one();
}

ConnectionPool::Stats ConnectionPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex);
    Stats stats;
    stats.total_created = total_created;
    stats.available = available.size();
    stats.in_use = in_use.size();
    stats.acquire_count = acquire_count;
    stats.acquire_timeout_count = acquire_timeout_count;
    return stats;
}

} // namespace peersync
