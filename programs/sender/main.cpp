//===----------------------------------------------------------------------===//
//                         PeerSync
//
// main.cpp
//
// Sender entry point: exposes the local database to one send session
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/sync_config.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "session/session_registry.hpp"
#include "storage/connection_pool.hpp"
#include "schema/schema_inspector.hpp"
#include "exporter/data_exporter.hpp"
#include "executor/executor_pool.hpp"
#include "http/http_server.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <execinfo.h>
#include <cxxabi.h>

using namespace peersync;

static SyncConfig g_config;

//===----------------------------------------------------------------------===//
// Version Info
//===----------------------------------------------------------------------===//
void PrintVersion() {
    std::cout << "PeerSync Sender " << PEERSYNC_VERSION << "\n"
              << "Git commit: " << PEERSYNC_GIT_COMMIT << "\n"
              << "Build type: " << PEERSYNC_BUILD_TYPE << "\n"
              << "Build time: " << PEERSYNC_BUILD_TIME << "\n";
}

//===----------------------------------------------------------------------===//
// Crash Handler
//===----------------------------------------------------------------------===//
void PrintStackTrace() {
    void* array[50];
    int size = backtrace(array, 50);
    char** symbols = backtrace_symbols(array, size);

    std::cerr << "\n=== Stack Trace ===\n";
    for (int i = 0; i < size; i++) {
        std::string symbol(symbols[i]);
        size_t start = symbol.find('_');
        size_t end = symbol.find('+');

        if (start != std::string::npos && end != std::string::npos && end > start) {
            std::string mangled = symbol.substr(start, end - start);
            int status;
            char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
            if (status == 0 && demangled) {
                std::cerr << "  " << i << ": " << demangled << "\n";
                free(demangled);
                continue;
            }
        }
        std::cerr << "  " << i << ": " << symbols[i] << "\n";
    }
    std::cerr << "===================\n";

    free(symbols);
}

void CrashHandler(int signal) {
    const char* signal_name = signal == SIGSEGV ? "SIGSEGV" :
                              signal == SIGABRT ? "SIGABRT" :
                              signal == SIGFPE ? "SIGFPE" :
                              signal == SIGBUS ? "SIGBUS" : "UNKNOWN";

    std::cerr << "\n!!! CRASH: Received signal " << signal_name << " (" << signal << ") !!!\n";

    PrintStackTrace();

    std::signal(signal, SIG_DFL);
    raise(signal);
}

void ReloadConfig() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "No config file specified, cannot reload");
        return;
    }

    LOG_INFO("main", "Reloading configuration from: " + g_config.config_file);

    SyncConfig new_config;
    std::string error;
    if (!new_config.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Failed to reload config: " + error);
        return;
    }

    // Only the log level applies without a restart
    if (new_config.log_level != g_config.log_level) {
        Logger::SetLevel(new_config.log_level);
        g_config.log_level = new_config.log_level;
        LOG_INFO("main", "Log level changed to: " + new_config.log_level);
    }
}

std::string PoolMetrics(const ConnectionPool& pool, const ProtocolHandler& handler,
                        const DataExporter& exporter) {
    auto stats = pool.GetStats();
    std::ostringstream metrics;
    metrics << "\n"
            << "# HELP peersync_pool_connections_total Connections created by the pool\n"
            << "# TYPE peersync_pool_connections_total counter\n"
            << "peersync_pool_connections_total " << stats.total_created << "\n"
            << "\n"
            << "# HELP peersync_pool_connections_in_use Connections currently in use\n"
            << "# TYPE peersync_pool_connections_in_use gauge\n"
            << "peersync_pool_connections_in_use " << stats.in_use << "\n"
            << "\n"
            << "# HELP peersync_pool_acquire_timeout_total Acquire requests that timed out\n"
            << "# TYPE peersync_pool_acquire_timeout_total counter\n"
            << "peersync_pool_acquire_timeout_total " << stats.acquire_timeout_count << "\n"
            << "\n"
            << "# HELP peersync_requests_total Requests answered\n"
            << "# TYPE peersync_requests_total counter\n"
            << "peersync_requests_total " << handler.GetRequestsServed() << "\n"
            << "\n"
            << "# HELP peersync_request_errors_total Requests answered with an error\n"
            << "# TYPE peersync_request_errors_total counter\n"
            << "peersync_request_errors_total " << handler.GetRequestsFailed() << "\n"
            << "\n"
            << "# HELP peersync_rows_exported_total Rows exported\n"
            << "# TYPE peersync_rows_exported_total counter\n"
            << "peersync_rows_exported_total " << exporter.GetRowsExported() << "\n";
    return metrics.str();
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        bool show_version;
        g_config = ParseCommandLine(argc, argv, show_version);

        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!g_config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        Logger::Initialize(g_config.log_file, g_config.log_level);

        // Handle SIGINT/SIGTERM/SIGHUP synchronously via sigwait(); threads
        // created after this inherit the mask.
        sigset_t shutdown_mask;
        sigemptyset(&shutdown_mask);
        sigaddset(&shutdown_mask, SIGINT);
        sigaddset(&shutdown_mask, SIGTERM);
        sigaddset(&shutdown_mask, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &shutdown_mask, nullptr);

        std::signal(SIGPIPE, SIG_IGN);

        std::signal(SIGSEGV, CrashHandler);
        std::signal(SIGABRT, CrashHandler);
        std::signal(SIGFPE, CrashHandler);
        std::signal(SIGBUS, CrashHandler);

        LOG_INFO("main", "Starting PeerSync Sender " + std::string(PEERSYNC_VERSION));
        LOG_INFO("main", "  Listen: " + g_config.host + ":" + std::to_string(g_config.port));
        LOG_INFO("main", "  Database: " + g_config.database_path + " (schema " + g_config.schema_name + ")");
        LOG_INFO("main", "  Max receivers: " + std::to_string(g_config.max_receivers));

        auto db = std::make_shared<duckdb::DuckDB>(g_config.database_path);

        ConnectionPool::Config pool_config;
        pool_config.min_connections = g_config.pool_min_connections;
        pool_config.max_connections = g_config.pool_max_connections;
        pool_config.acquire_timeout = std::chrono::milliseconds(g_config.pool_acquire_timeout_ms);
        ConnectionPool pool(db, pool_config);

        SchemaInspector::Config inspector_config;
        inspector_config.schema_name = g_config.schema_name;
        inspector_config.excluded_tables = g_config.excluded_tables;
        inspector_config.excluded_prefixes = g_config.excluded_prefixes;
        inspector_config.exact_counts = g_config.exact_counts;
        SchemaInspector inspector(pool, inspector_config);

        DataExporter::Config exporter_config;
        exporter_config.default_limit = g_config.default_page_size;
        exporter_config.max_limit = g_config.max_page_size;
        DataExporter exporter(inspector, exporter_config);

        SessionRegistry::Config registry_config;
        registry_config.max_age = std::chrono::hours(g_config.session_max_age_hours);
        auto registry = std::make_shared<SessionRegistry>(registry_config);

        auto executor_pool = std::make_shared<ExecutorPool>("catalog", g_config.GetExecutorThreadCount());
        executor_pool->Start();

        auto handler = std::make_shared<ProtocolHandler>(registry, executor_pool, inspector, exporter,
                                                         PEERSYNC_VERSION);
        auto server = std::make_shared<TcpServer>(g_config, handler);

        // Receivers of an ended session lose their connection
        TcpServer* server_ptr = server.get();
        registry->SetListener([server_ptr](const SessionEvent& event) {
            switch (event.type) {
                case SessionEventType::RECEIVER_ATTACHED:
                    LOG_INFO("main", "Receiver attached to " + event.code + ": " +
                             (event.receiver.name.empty() ? event.receiver.remote_ip : event.receiver.name));
                    break;
                case SessionEventType::RECEIVER_DETACHED:
                    LOG_INFO("main", "Receiver detached from " + event.code);
                    break;
                case SessionEventType::SESSION_CLOSED:
                case SessionEventType::SESSION_ENDED:
                    server_ptr->DisconnectSession(event.code);
                    break;
            }
        });

        server->Start();

        std::shared_ptr<HttpServer> http_server;
        if (g_config.http_port > 0) {
            http_server = std::make_shared<HttpServer>(g_config.http_port, server.get(), registry);
            http_server->AddExecutorPool(executor_pool);
            http_server->SetMetricsCallback([&pool, handler, &exporter]() {
                return PoolMetrics(pool, *handler, exporter);
            });
            http_server->Start();
        }

        auto lease = registry->OpenSession(SessionDirection::SEND);

        std::cout << "Connection code: " << lease->Code() << "\n"
                  << "Share it with the receiver; it stays valid until this process exits." << std::endl;
        LOG_INFO("main", "Send session " + lease->Code() + " is open");

        int sig;
        while (sigwait(&shutdown_mask, &sig) == 0) {
            if (sig == SIGHUP) {
                LOG_INFO("main", "Reload signal received");
                ReloadConfig();
            } else {
                LOG_INFO("main", "Shutdown signal received");
                break;
            }
        }

        LOG_INFO("main", "Shutting down...");

        // Ending the lease deletes the session and drops its receivers
        lease.reset();
        registry->EndAll();
        registry->SetListener(nullptr);

        if (http_server) {
            http_server->Stop();
        }
        server->Stop();
        executor_pool->Stop();
        pool.Shutdown();

        LOG_INFO("main", "PeerSync Sender stopped");
        Logger::Shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
