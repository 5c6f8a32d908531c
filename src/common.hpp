//===----------------------------------------------------------------------===//
//                         PeerSync
//
// common.hpp
//
// Common definitions shared by the sender and receiver sides
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>

namespace peersync {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using WallClock = std::chrono::system_clock;

// Forward declarations
class TcpServer;
class TcpConnection;
class SessionRegistry;
class SchemaInspector;
class DataExporter;
class DataImporter;
class ExecutorPool;
class ConnectionPool;
struct SyncConfig;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Constants
constexpr size_t DEFAULT_MAX_RECEIVERS = 64;
constexpr size_t DEFAULT_IO_THREADS = 0;          // 0 = auto
constexpr size_t DEFAULT_EXECUTOR_THREADS = 0;    // 0 = auto
constexpr size_t SESSION_CODE_LENGTH = 8;
constexpr uint32_t DEFAULT_PAGE_SIZE = 100;
constexpr uint32_t MAX_PAGE_SIZE = 1000;
constexpr uint32_t DEFAULT_BATCH_SIZE = 500;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_MS = 30000;
constexpr uint32_t DEFAULT_HEARTBEAT_INTERVAL_MS = 30000;
constexpr uint32_t DEFAULT_SESSION_MAX_AGE_HOURS = 24;
constexpr uint32_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;

// Format a wall-clock time point as ISO-8601 UTC (seconds precision)
std::string FormatIso8601(WallClock::time_point tp);

} // namespace peersync
