//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/config/test_sync_config.cpp
//
// Unit tests for SyncConfig
//===----------------------------------------------------------------------===//

#include "config/sync_config.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <cstdio>

using namespace peersync;

//===----------------------------------------------------------------------===//
// Helper: write temp config file
//===----------------------------------------------------------------------===//

static std::string WriteTempFile(const std::string& content, const std::string& suffix) {
    std::string path = "/tmp/peersync_test_config" + suffix;
    std::ofstream f(path);
    f << content;
    f.close();
    return path;
}

static void CleanupFile(const std::string& path) {
    std::remove(path.c_str());
}

//===----------------------------------------------------------------------===//
// Defaults and Validation
//===----------------------------------------------------------------------===//

void TestDefaultValues() {
    std::cout << "  Testing default values..." << std::endl;

    SyncConfig config;
    assert(config.host == "0.0.0.0");
    assert(config.port == 7878);
    assert(config.http_port == 0);
    assert(config.database_path == ":memory:");
    assert(config.schema_name == "main");
    assert(config.default_page_size == 100);
    assert(config.max_page_size == 1000);
    assert(config.batch_size == 500);
    assert(config.create_missing_tables);
    assert(config.default_strategy == "skip");
    assert(config.job_max_attempts == 3);
    assert(config.request_timeout_ms == 30000);
    assert(config.excluded_tables.size() == 5);
    assert(config.excluded_prefixes.size() == 4);

    std::cout << "    PASSED" << std::endl;
}

void TestValidation() {
    std::cout << "  Testing Validate..." << std::endl;

    std::string error;
    SyncConfig config;
    assert(config.Validate(error));

    SyncConfig pages;
    pages.default_page_size = 2000;
    assert(!pages.Validate(error));
    assert(error.find("page size") != std::string::npos);

    SyncConfig batch;
    batch.batch_size = 0;
    assert(!batch.Validate(error));

    SyncConfig pool;
    pool.pool_min_connections = 8;
    pool.pool_max_connections = 4;
    assert(!pool.Validate(error));

    SyncConfig receivers;
    receivers.max_receivers = 0;
    assert(!receivers.Validate(error));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// File Loading
//===----------------------------------------------------------------------===//

void TestLoadIni() {
    std::cout << "  Testing key = value file..." << std::endl;

    std::string path = WriteTempFile(
        "# sender\n"
        "port = 9000\n"
        "database = \"/var/lib/app.duckdb\"\n"
        "excluded_tables = audit_log, sessions\n"
        "exact_counts = true\n"
        "batch_size = 250\n"
        "strategy = merge\n", ".conf");

    SyncConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.port == 9000);
    assert(config.database_path == "/var/lib/app.duckdb");
    assert(config.excluded_tables.size() == 2);
    assert(config.excluded_tables[1] == "sessions");
    assert(config.exact_counts);
    assert(config.batch_size == 250);
    assert(config.default_strategy == "merge");

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadYaml() {
    std::cout << "  Testing YAML file..." << std::endl;

    std::string path = WriteTempFile(
        "sender:\n"
        "  port: 9100\n"
        "  max_page_size: 500\n"
        "database:\n"
        "  schema: app\n"
        "  excluded_prefixes: [tmp_, bak_]\n"
        "logging:\n"
        "  level: debug\n"
        "receiver:\n"
        "  create_missing_tables: false\n"
        "  strategy: overwrite\n", ".yaml");

    SyncConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.port == 9100);
    assert(config.max_page_size == 500);
    assert(config.schema_name == "app");
    assert(config.excluded_prefixes.size() == 2);
    assert(config.excluded_prefixes[0] == "tmp_");
    assert(config.log_level == "debug");
    assert(!config.create_missing_tables);
    assert(config.default_strategy == "overwrite");

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadMissingFile() {
    std::cout << "  Testing missing file reports an error..." << std::endl;

    SyncConfig config;
    std::string error;
    assert(!config.LoadFromFile("/tmp/peersync_no_such_config.conf", error));
    assert(!error.empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Command Line
//===----------------------------------------------------------------------===//

void TestCommandLineOverridesFile() {
    std::cout << "  Testing command line overrides config file..." << std::endl;

    std::string path = WriteTempFile("port = 9000\nlog_level = warn\n", ".conf");

    std::string config_arg = path;
    char prog[] = "peersync-sender";
    char c_flag[] = "-c";
    char port_flag[] = "--port";
    char port_value[] = "9200";
    char exclude_flag[] = "--exclude";
    char exclude_value[] = "audit_log,,events";
    char exact_flag[] = "--exact-counts";
    std::vector<char> config_value(config_arg.begin(), config_arg.end());
    config_value.push_back('\0');

    char* argv[] = {prog, c_flag, config_value.data(), port_flag, port_value,
                    exclude_flag, exclude_value, exact_flag};
    int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

    bool show_version = true;
    SyncConfig config = ParseCommandLine(argc, argv, show_version);
    assert(!show_version);
    assert(config.port == 9200);
    assert(config.log_level == "warn");
    assert(config.config_file == path);
    assert(config.exact_counts);
    // Appended to the defaults, empty items dropped
    assert(config.excluded_tables.size() == 7);
    assert(config.excluded_tables.back() == "events");

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== SyncConfig Unit Tests ===" << std::endl;

    std::cout << "\n1. Defaults and Validation:" << std::endl;
    TestDefaultValues();
    TestValidation();

    std::cout << "\n2. File Loading:" << std::endl;
    TestLoadIni();
    TestLoadYaml();
    TestLoadMissingFile();

    std::cout << "\n3. Command Line:" << std::endl;
    TestCommandLineOverridesFile();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
