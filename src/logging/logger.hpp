//===----------------------------------------------------------------------===//
//                         PeerSync
//
// logging/logger.hpp
//
// Process-wide logging based on spdlog, tagged with the session and
// receiver a thread is working for
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace peersync {

// Who the current thread is serving. Empty fields are left out of the tag.
struct LogContext {
    std::string session_code;
    uint64_t receiver_id = 0;

    bool Empty() const { return session_code.empty() && receiver_id == 0; }

    // "[ABCD2345 r7] ", or "" when empty
    std::string Tag() const;
};

class Logger {
public:
    // Install console (and optional rotating file) sinks. Later calls are
    // ignored until Shutdown().
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "info");

    static void Shutdown();

    // Auto-initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    // Accepts the names ToSpdlogLevel does; reload keeps the sinks
    static void SetLevel(const std::string& level);

    static void Flush();

    static bool IsInitialized() { return initialized_; }

    // Case-insensitive; unknown names give info
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

    // Context of the calling thread
    static const LogContext& CurrentContext();
    static const std::string& ContextTag();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

// Tags every log line of this thread until destroyed, then restores the
// previous context. Nests.
class ScopedLogContext {
public:
    explicit ScopedLogContext(LogContext context);
    ScopedLogContext(const std::string& session_code, uint64_t receiver_id);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    LogContext previous_;
    std::string previous_tag_;
};

} // namespace peersync

// LOG_INFO("component", "message " + std::to_string(x))
// Inside a ScopedLogContext: "[component] [ABCD2345 r7] message"

#define PEERSYNC_LOG(level, fn, component, message) \
    do { \
        if (peersync::Logger::Get()->should_log(level)) \
            peersync::Logger::Get()->fn("[{}] {}{}", component, peersync::Logger::ContextTag(), message); \
    } while(0)

#define LOG_TRACE(component, message) PEERSYNC_LOG(spdlog::level::trace, trace, component, message)
#define LOG_DEBUG(component, message) PEERSYNC_LOG(spdlog::level::debug, debug, component, message)
#define LOG_INFO(component, message)  PEERSYNC_LOG(spdlog::level::info, info, component, message)
#define LOG_WARN(component, message)  PEERSYNC_LOG(spdlog::level::warn, warn, component, message)
#define LOG_ERROR(component, message) PEERSYNC_LOG(spdlog::level::err, error, component, message)
#define LOG_FATAL(component, message) PEERSYNC_LOG(spdlog::level::critical, critical, component, message)
