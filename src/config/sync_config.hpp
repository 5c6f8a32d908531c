//===----------------------------------------------------------------------===//
//                         PeerSync
//
// config/sync_config.hpp
//
// Configuration shared by the sender and receiver programs
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include <string>
#include <vector>
#include <thread>
#include <iostream>
#include <cstdlib>
#include <algorithm>

namespace peersync {

struct SyncConfig {
    // Network (sender)
    std::string host = "0.0.0.0";
    uint16_t port = 7878;
    uint16_t http_port = 0;  // 0 = disabled, for health/metrics

    // Database
    std::string database_path = ":memory:";
    std::string schema_name = "main";

    // Logging
    std::string log_file;
    std::string log_level = "info";

    std::string config_file;

    // Threading
    uint32_t io_threads = 0;        // 0 = auto
    uint32_t executor_threads = 0;  // 0 = auto
    uint32_t max_receivers = DEFAULT_MAX_RECEIVERS;

    // Connection pool
    uint32_t pool_min_connections = 2;
    uint32_t pool_max_connections = 16;
    uint32_t pool_acquire_timeout_ms = 5000;

    // Protocol
    uint32_t request_timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;
    uint32_t heartbeat_interval_ms = DEFAULT_HEARTBEAT_INTERVAL_MS;
    uint32_t default_page_size = DEFAULT_PAGE_SIZE;
    uint32_t max_page_size = MAX_PAGE_SIZE;

    // Catalog
    bool exact_counts = false;
    std::vector<std::string> excluded_tables = {
        "schema_migrations", "oban_jobs", "oban_peers", "oban_producers", "user_tokens"};
    std::vector<std::string> excluded_prefixes = {"pg_", "oban_", "duckdb_", "sqlite_"};

    // Sessions
    uint32_t session_max_age_hours = DEFAULT_SESSION_MAX_AGE_HOURS;

    // Receiver defaults
    uint32_t batch_size = DEFAULT_BATCH_SIZE;
    bool create_missing_tables = true;
    std::string default_strategy = "skip";
    uint32_t job_max_attempts = 3;

    uint32_t GetIoThreadCount() const {
        if (io_threads == 0) {
            return std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        return io_threads;
    }

    uint32_t GetExecutorThreadCount() const {
        if (executor_threads == 0) {
            return std::max(2u, std::thread::hardware_concurrency());
        }
        return executor_threads;
    }

    bool Validate(std::string& error) const {
        if (max_receivers == 0) {
            error = "Max receivers must be greater than 0";
            return false;
        }
        if (default_page_size == 0 || max_page_size == 0) {
            error = "Page sizes must be greater than 0";
            return false;
        }
        if (default_page_size > max_page_size) {
            error = "Default page size exceeds max page size";
            return false;
        }
        if (batch_size == 0) {
            error = "Batch size must be greater than 0";
            return false;
        }
        if (pool_max_connections == 0 || pool_min_connections > pool_max_connections) {
            error = "Invalid connection pool bounds";
            return false;
        }
        if (request_timeout_ms == 0) {
            error = "Request timeout must be greater than 0";
            return false;
        }
        return true;
    }

    // Format is chosen by extension: .yaml/.yml, anything else is key = value
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        }
        return LoadFromIni(path, error);
    }

    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        if (cfg.Has("host")) host = cfg.GetString("host");
        if (cfg.Has("port")) port = static_cast<uint16_t>(cfg.GetInt("port"));
        if (cfg.Has("http_port")) http_port = static_cast<uint16_t>(cfg.GetInt("http_port"));
        if (cfg.Has("database")) database_path = cfg.GetString("database");
        if (cfg.Has("schema")) schema_name = cfg.GetString("schema");
        if (cfg.Has("log_file")) log_file = cfg.GetString("log_file");
        if (cfg.Has("log_level")) log_level = cfg.GetString("log_level");
        if (cfg.Has("io_threads")) io_threads = static_cast<uint32_t>(cfg.GetInt("io_threads"));
        if (cfg.Has("executor_threads")) executor_threads = static_cast<uint32_t>(cfg.GetInt("executor_threads"));
        if (cfg.Has("max_receivers")) max_receivers = static_cast<uint32_t>(cfg.GetInt("max_receivers"));
        if (cfg.Has("pool_min_connections")) pool_min_connections = static_cast<uint32_t>(cfg.GetInt("pool_min_connections"));
        if (cfg.Has("pool_max_connections")) pool_max_connections = static_cast<uint32_t>(cfg.GetInt("pool_max_connections"));
        if (cfg.Has("pool_acquire_timeout")) pool_acquire_timeout_ms = static_cast<uint32_t>(cfg.GetInt("pool_acquire_timeout"));
        if (cfg.Has("request_timeout_ms")) request_timeout_ms = static_cast<uint32_t>(cfg.GetInt("request_timeout_ms"));
        if (cfg.Has("heartbeat_interval_ms")) heartbeat_interval_ms = static_cast<uint32_t>(cfg.GetInt("heartbeat_interval_ms"));
        if (cfg.Has("default_page_size")) default_page_size = static_cast<uint32_t>(cfg.GetInt("default_page_size"));
        if (cfg.Has("max_page_size")) max_page_size = static_cast<uint32_t>(cfg.GetInt("max_page_size"));
        if (cfg.Has("exact_counts")) exact_counts = cfg.GetBool("exact_counts");
        if (cfg.Has("excluded_tables")) excluded_tables = cfg.GetStringList("excluded_tables");
        if (cfg.Has("excluded_prefixes")) excluded_prefixes = cfg.GetStringList("excluded_prefixes");
        if (cfg.Has("session_max_age_hours")) session_max_age_hours = static_cast<uint32_t>(cfg.GetInt("session_max_age_hours"));
        if (cfg.Has("batch_size")) batch_size = static_cast<uint32_t>(cfg.GetInt("batch_size"));
        if (cfg.Has("create_missing_tables")) create_missing_tables = cfg.GetBool("create_missing_tables");
        if (cfg.Has("strategy")) default_strategy = cfg.GetString("strategy");
        if (cfg.Has("job_max_attempts")) job_max_attempts = static_cast<uint32_t>(cfg.GetInt("job_max_attempts"));

        return true;
    }

    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        // Sender section
        if (cfg.Has("sender.host")) host = cfg.GetString("sender.host");
        if (cfg.Has("sender.port")) port = static_cast<uint16_t>(cfg.GetInt("sender.port"));
        if (cfg.Has("sender.http_port")) http_port = static_cast<uint16_t>(cfg.GetInt("sender.http_port"));
        if (cfg.Has("sender.max_receivers")) max_receivers = static_cast<uint32_t>(cfg.GetInt("sender.max_receivers"));
        if (cfg.Has("sender.default_page_size")) default_page_size = static_cast<uint32_t>(cfg.GetInt("sender.default_page_size"));
        if (cfg.Has("sender.max_page_size")) max_page_size = static_cast<uint32_t>(cfg.GetInt("sender.max_page_size"));
        if (cfg.Has("sender.session_max_age_hours")) session_max_age_hours = static_cast<uint32_t>(cfg.GetInt("sender.session_max_age_hours"));

        // Database section
        if (cfg.Has("database.path")) database_path = cfg.GetString("database.path");
        if (cfg.Has("database.schema")) schema_name = cfg.GetString("database.schema");
        if (cfg.Has("database.exact_counts")) exact_counts = cfg.GetBool("database.exact_counts");
        if (cfg.Has("database.excluded_tables")) excluded_tables = cfg.GetStringList("database.excluded_tables");
        if (cfg.Has("database.excluded_prefixes")) excluded_prefixes = cfg.GetStringList("database.excluded_prefixes");

        // Logging section
        if (cfg.Has("logging.file")) log_file = cfg.GetString("logging.file");
        if (cfg.Has("logging.level")) log_level = cfg.GetString("logging.level");

        // Threads section
        if (cfg.Has("threads.io")) io_threads = static_cast<uint32_t>(cfg.GetInt("threads.io"));
        if (cfg.Has("threads.executor")) executor_threads = static_cast<uint32_t>(cfg.GetInt("threads.executor"));

        // Pool section
        if (cfg.Has("pool.min")) pool_min_connections = static_cast<uint32_t>(cfg.GetInt("pool.min"));
        if (cfg.Has("pool.max")) pool_max_connections = static_cast<uint32_t>(cfg.GetInt("pool.max"));
        if (cfg.Has("pool.acquire_timeout_ms")) pool_acquire_timeout_ms = static_cast<uint32_t>(cfg.GetInt("pool.acquire_timeout_ms"));

        // Protocol section
        if (cfg.Has("protocol.request_timeout_ms")) request_timeout_ms = static_cast<uint32_t>(cfg.GetInt("protocol.request_timeout_ms"));
        if (cfg.Has("protocol.heartbeat_interval_ms")) heartbeat_interval_ms = static_cast<uint32_t>(cfg.GetInt("protocol.heartbeat_interval_ms"));

        // Receiver section
        if (cfg.Has("receiver.batch_size")) batch_size = static_cast<uint32_t>(cfg.GetInt("receiver.batch_size"));
        if (cfg.Has("receiver.create_missing_tables")) create_missing_tables = cfg.GetBool("receiver.create_missing_tables");
        if (cfg.Has("receiver.strategy")) default_strategy = cfg.GetString("receiver.strategy");
        if (cfg.Has("receiver.job_max_attempts")) job_max_attempts = static_cast<uint32_t>(cfg.GetInt("receiver.job_max_attempts"));

        return true;
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>       Config file path (.yaml/.yml or key = value)\n"
              << "  -h, --host <host>         Host to bind (default: 0.0.0.0)\n"
              << "  -p, --port <port>         Port to bind (default: 7878)\n"
              << "  -d, --database <path>     Database path (default: :memory:)\n"
              << "  --schema <name>           Schema to expose (default: main)\n"
              << "  --log-file <path>         Log file path\n"
              << "  --log-level <level>       Log level (trace, debug, info, warn, error)\n"
              << "  --io-threads <n>          IO thread count (default: auto)\n"
              << "  --executor-threads <n>    Executor thread count (default: auto)\n"
              << "  --max-receivers <n>       Max concurrently attached receivers (default: 64)\n"
              << "  --http-port <port>        HTTP port for health/metrics (default: disabled)\n"
              << "  --max-page-size <n>       Largest page served per fetch (default: 1000)\n"
              << "  --exact-counts            Use COUNT(*) instead of catalog estimates\n"
              << "  --exclude <a,b,...>       Additional excluded table names\n"
              << "  --exclude-prefix <a,...>  Additional excluded table prefixes\n"
              << "  --version                 Show version info\n"
              << "  --help                    Show this help\n";
}

namespace detail {

inline void AppendCsv(std::vector<std::string>& out, const std::string& csv) {
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        std::string item = csv.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
}

} // namespace detail

inline SyncConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    SyncConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            config.database_path = argv[++i];
        } else if (arg == "--schema" && i + 1 < argc) {
            config.schema_name = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--io-threads" && i + 1 < argc) {
            config.io_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--executor-threads" && i + 1 < argc) {
            config.executor_threads = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-receivers" && i + 1 < argc) {
            config.max_receivers = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--http-port" && i + 1 < argc) {
            config.http_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--max-page-size" && i + 1 < argc) {
            config.max_page_size = static_cast<uint32_t>(std::stoi(argv[++i]));
        } else if (arg == "--exact-counts") {
            config.exact_counts = true;
        } else if (arg == "--exclude" && i + 1 < argc) {
            detail::AppendCsv(config.excluded_tables, argv[++i]);
        } else if (arg == "--exclude-prefix" && i + 1 < argc) {
            detail::AppendCsv(config.excluded_prefixes, argv[++i]);
        }
    }

    return config;
}

} // namespace peersync
