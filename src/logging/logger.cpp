//===----------------------------------------------------------------------===//
//                         PeerSync
//
// logging/logger.cpp
//
// Logger implementation using spdlog
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace peersync {

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;

namespace {

constexpr size_t LOG_FILE_MAX_BYTES = 50 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 5;

// Tag is cached next to the context so log calls do not rebuild it
thread_local LogContext current_context;
thread_local std::string current_tag;

} // anonymous namespace

std::string LogContext::Tag() const {
    if (Empty()) {
        return "";
    }
    std::string tag = "[";
    tag += session_code.empty() ? "-" : session_code;
    if (receiver_id != 0) {
        tag += " r" + std::to_string(receiver_id);
    }
    tag += "] ";
    return tag;
}

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
    sinks.push_back(console_sink);

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("peersync", sinks.begin(), sinks.end());
    logger_->set_level(ToSpdlogLevel(log_level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);

    initialized_ = true;
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    logger_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::SetLevel(const std::string& level) {
    if (logger_) {
        logger_->set_level(ToSpdlogLevel(level));
    }
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info")  return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "fatal" || lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;

    return spdlog::level::info;
}

const LogContext& Logger::CurrentContext() {
    return current_context;
}

const std::string& Logger::ContextTag() {
    return current_tag;
}

ScopedLogContext::ScopedLogContext(LogContext context)
    : previous_(std::move(current_context))
    , previous_tag_(std::move(current_tag)) {
    current_context = std::move(context);
    current_tag = current_context.Tag();
}

ScopedLogContext::ScopedLogContext(const std::string& session_code, uint64_t receiver_id)
    : ScopedLogContext(LogContext{session_code, receiver_id}) {
}

ScopedLogContext::~ScopedLogContext() {
    current_context = std::move(previous_);
    current_tag = std::move(previous_tag_);
}

} // namespace peersync
