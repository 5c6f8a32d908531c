//===----------------------------------------------------------------------===//
//                         PeerSync
//
// main.cpp
//
// Receiver entry point: joins a send session and imports tables
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/sync_config.hpp"
#include "client/sync_client.hpp"
#include "history/transfer_history.hpp"
#include "importer/data_importer.hpp"
#include "schema/schema_inspector.hpp"
#include "storage/connection_pool.hpp"
#include "worker/import_worker.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace peersync;

struct ReceiverOptions {
    SyncConfig config;
    std::string url;
    std::string code;
    std::vector<std::string> tables;
    std::map<std::string, ConflictStrategy> strategies;
    ConflictStrategy default_strategy = ConflictStrategy::SKIP;
    std::string receiver_name;
    std::string history_file;
    bool list_only = false;
    bool background = false;
    bool show_version = false;
};

void PrintReceiverUsage(const char* program) {
    std::cout << "Usage: " << program << " --url <host:port> --code <code> [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>       Config file path (.yaml/.yml or key = value)\n"
              << "  -u, --url <host:port>     Sender address (tcp://host:port also accepted)\n"
              << "  -k, --code <code>         Connection code shown by the sender\n"
              << "  -d, --database <path>     Local database path (default: :memory:)\n"
              << "  --schema <name>           Local schema (default: main)\n"
              << "  -t, --tables <a,b,...>    Tables to import (default: all listed)\n"
              << "  -s, --strategy <list>     skip|overwrite|merge|append, or table=strategy,...\n"
              << "  --batch-size <n>          Records per fetched page (default: 500)\n"
              << "  --no-create               Fail instead of creating missing tables\n"
              << "  --timeout-ms <n>          Request timeout (default: 30000)\n"
              << "  --name <name>             Name shown to the sender\n"
              << "  --list                    List the sender's tables and exit\n"
              << "  --background              Run each table as a background job\n"
              << "  --history-file <path>     Write the transfer history as JSON\n"
              << "  --log-file <path>         Log file path\n"
              << "  --log-level <level>       Log level (trace, debug, info, warn, error)\n"
              << "  --version                 Show version info\n"
              << "  --help                    Show this help\n";
}

// "merge" sets the default; "users=merge,posts=append" sets per-table strategies
bool ParseStrategyList(const std::string& list, ReceiverOptions& options, std::string& error) {
    std::vector<std::string> items;
    detail::AppendCsv(items, list);
    for (const auto& item : items) {
        auto eq = item.find('=');
        ConflictStrategy strategy;
        if (eq == std::string::npos) {
            if (!ParseConflictStrategy(item, strategy)) {
                error = "unknown strategy: " + item;
                return false;
            }
            options.default_strategy = strategy;
        } else {
            std::string table = item.substr(0, eq);
            if (!ParseConflictStrategy(item.substr(eq + 1), strategy)) {
                error = "unknown strategy for " + table + ": " + item.substr(eq + 1);
                return false;
            }
            options.strategies[table] = strategy;
        }
    }
    return true;
}

bool ParseReceiverCommandLine(int argc, char* argv[], ReceiverOptions& options, std::string& error) {
    // First pass: config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config.config_file = argv[++i];
            if (!options.config.LoadFromFile(options.config.config_file, error)) {
                error = "error loading config file: " + error;
                return false;
            }
        }
    }

    if (!ParseConflictStrategy(options.config.default_strategy, options.default_strategy)) {
        error = "unknown strategy in config: " + options.config.default_strategy;
        return false;
    }

    // Second pass: flags override the file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help") {
            PrintReceiverUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            options.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && has_value) {
            ++i;
        } else if ((arg == "-u" || arg == "--url") && has_value) {
            options.url = argv[++i];
        } else if ((arg == "-k" || arg == "--code") && has_value) {
            options.code = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && has_value) {
            options.config.database_path = argv[++i];
        } else if (arg == "--schema" && has_value) {
            options.config.schema_name = argv[++i];
        } else if ((arg == "-t" || arg == "--tables") && has_value) {
            detail::AppendCsv(options.tables, argv[++i]);
        } else if ((arg == "-s" || arg == "--strategy") && has_value) {
            if (!ParseStrategyList(argv[++i], options, error)) {
                return false;
            }
        } else if (arg == "--batch-size" && has_value) {
            options.config.batch_size = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--no-create") {
            options.config.create_missing_tables = false;
        } else if (arg == "--timeout-ms" && has_value) {
            options.config.request_timeout_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--name" && has_value) {
            options.receiver_name = argv[++i];
        } else if (arg == "--list") {
            options.list_only = true;
        } else if (arg == "--background") {
            options.background = true;
        } else if (arg == "--history-file" && has_value) {
            options.history_file = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            options.config.log_file = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            options.config.log_level = argv[++i];
        } else {
            error = "unknown or incomplete option: " + arg;
            return false;
        }
    }

    if (!options.show_version && (options.url.empty() || options.code.empty())) {
        error = "--url and --code are required";
        return false;
    }
    return options.config.Validate(error);
}

void PrintResult(const std::string& table, const TransferResult& result) {
    std::cout << std::left << std::setw(32) << table
              << " created=" << result.created
              << " updated=" << result.updated
              << " skipped=" << result.skipped
              << " errors=" << result.errors.size() << "\n";
    for (const auto& error : result.errors) {
        std::cout << "    " << error.reason << ": " << error.record.dump() << "\n";
    }
}

void ReportHistory(const TransferHistory& history, const std::string& path) {
    for (const auto& stats : history.TableStats()) {
        LOG_INFO("main", stats.table + ": " + std::to_string(stats.transfers) + " completed transfer(s), " +
                 std::to_string(stats.created + stats.updated) + " rows written");
    }
    if (path.empty()) {
        return;
    }

    nlohmann::json transfers = nlohmann::json::array();
    for (const auto& record : history.Recent(history.Size())) {
        transfers.push_back(record.ToJson());
    }
    nlohmann::json tables = nlohmann::json::array();
    for (const auto& stats : history.TableStats()) {
        nlohmann::json t = {
            {"table", stats.table},
            {"transfers", stats.transfers},
            {"created", stats.created},
            {"updated", stats.updated},
            {"skipped", stats.skipped},
            {"failed", stats.failed}
        };
        if (stats.last_completed_at) {
            t["last_completed_at"] = FormatIso8601(*stats.last_completed_at);
        }
        tables.push_back(std::move(t));
    }

    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("main", "Cannot write transfer history to " + path);
        return;
    }
    out << nlohmann::json{{"transfers", transfers}, {"tables", tables}}.dump(2) << "\n";
}

int RunBackground(const ReceiverOptions& options, const ConnectOptions& connect_options,
                  DataImporter& importer, SyncClient& client, TransferHistory& history) {
    std::vector<std::string> tables = options.tables;
    if (tables.empty()) {
        for (const auto& info : client.ListTables()) {
            tables.push_back(info.name);
        }
    }

    ImportWorker::Config worker_config;
    worker_config.max_attempts = options.config.job_max_attempts;
    ImportWorker worker([&options, connect_options]() {
        return SyncClient::Connect(options.url, options.code, connect_options);
    }, importer, worker_config, &history);

    std::vector<uint64_t> jobs;
    for (const auto& table : tables) {
        ImportJob job;
        job.table = table;
        auto strategy = options.strategies.find(table);
        job.strategy = strategy != options.strategies.end() ? strategy->second : options.default_strategy;
        job.batch_size = options.config.batch_size;
        job.create_missing_tables = options.config.create_missing_tables;
        job.session_code = client.GetSessionCode();
        jobs.push_back(worker.Submit(job));
        std::cout << "Queued job " << jobs.back() << " for " << table << "\n";
    }

    int failures = 0;
    for (uint64_t id : jobs) {
        auto status = worker.WaitFor(id, std::chrono::hours(24));
        if (!status) {
            continue;
        }
        if (status->state == JobState::COMPLETED) {
            PrintResult(status->job.table, status->result);
        } else {
            failures++;
            std::cout << std::left << std::setw(32) << status->job.table << " "
                      << JobStateToString(status->state) << " after " << status->attempts
                      << " attempt(s): " << ErrorCodeToString(status->error) << " " << status->error_message << "\n";
        }
    }
    worker.Shutdown();
    return failures == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    try {
        ReceiverOptions options;
        std::string error;
        if (!ParseReceiverCommandLine(argc, argv, options, error)) {
            std::cerr << "Error: " << error << "\n\n";
            PrintReceiverUsage(argv[0]);
            return 1;
        }

        if (options.show_version) {
            std::cout << "PeerSync Receiver " << PEERSYNC_VERSION << " (" << PEERSYNC_GIT_COMMIT << ")\n";
            return 0;
        }

        std::signal(SIGPIPE, SIG_IGN);
        Logger::Initialize(options.config.log_file, options.config.log_level);

        auto db = std::make_shared<duckdb::DuckDB>(options.config.database_path);

        ConnectionPool::Config pool_config;
        pool_config.min_connections = 1;
        pool_config.max_connections = options.config.pool_max_connections;
        pool_config.acquire_timeout = std::chrono::milliseconds(options.config.pool_acquire_timeout_ms);
        ConnectionPool pool(db, pool_config);

        // The local side imports anything it is asked to
        SchemaInspector::Config inspector_config;
        inspector_config.schema_name = options.config.schema_name;
        inspector_config.excluded_tables.clear();
        inspector_config.excluded_prefixes.clear();
        SchemaInspector inspector(pool, inspector_config);
        DataImporter importer(inspector);

        ConnectOptions connect_options;
        connect_options.timeout_ms = options.config.request_timeout_ms;
        connect_options.heartbeat_interval_ms = options.config.heartbeat_interval_ms;
        connect_options.receiver.name = options.receiver_name;
        connect_options.receiver.user_agent = std::string("peersync-receiver/") + PEERSYNC_VERSION;

        auto client = SyncClient::Connect(options.url, options.code, connect_options);
        std::cout << "Joined session " << client->GetSessionCode() << "\n";

        TransferHistory history;

        int rc = 0;
        if (options.list_only) {
            for (const auto& info : client->ListTables()) {
                std::cout << std::left << std::setw(32) << info.name << " ~" << info.estimated_count << " rows\n";
            }
        } else if (options.background) {
            rc = RunBackground(options, connect_options, importer, *client, history);
        } else {
            TransferAllOptions transfer;
            transfer.tables = options.tables;
            transfer.default_strategy = options.default_strategy;
            transfer.strategies = options.strategies;
            transfer.batch_size = options.config.batch_size;
            transfer.create_missing_tables = options.config.create_missing_tables;
            transfer.history = &history;
            transfer.on_progress = [](const TransferProgress& progress) {
                LOG_INFO("main", progress.table + ": page " + std::to_string(progress.page) + ", " +
                         std::to_string(progress.offset + static_cast<int64_t>(progress.records_in_page)) +
                         " records so far");
            };

            for (const auto& entry : client->TransferAll(importer, transfer)) {
                if (entry.second.ok) {
                    PrintResult(entry.first, entry.second.result);
                } else {
                    rc = 1;
                    std::cout << std::left << std::setw(32) << entry.first << " FAILED "
                              << ErrorCodeToString(entry.second.error) << ": " << entry.second.message << "\n";
                }
            }
        }

        ReportHistory(history, options.history_file);

        client->Disconnect();
        pool.Shutdown();
        Logger::Shutdown();
        return rc;

    } catch (const SyncException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
