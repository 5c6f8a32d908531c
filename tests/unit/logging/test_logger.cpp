//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for Logger
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <thread>

using namespace peersync;

//===----------------------------------------------------------------------===//
// Level Conversion Tests
//===----------------------------------------------------------------------===//

void TestLevelFromString() {
    std::cout << "  Testing level names from config and command line..." << std::endl;

    assert(Logger::ToSpdlogLevel("debug") == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel("WARN") == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel("Warning") == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel("critical") == spdlog::level::critical);
    assert(Logger::ToSpdlogLevel("off") == spdlog::level::off);

    // Unknown names fall back to info
    assert(Logger::ToSpdlogLevel("verbose") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("") == spdlog::level::info);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Initialization Tests
//===----------------------------------------------------------------------===//

void TestAutoInitialize() {
    std::cout << "  Testing first use initializes defaults..." << std::endl;

    Logger::Shutdown();
    assert(!Logger::IsInitialized());

    auto& logger = Logger::Get();
    assert(logger != nullptr);
    assert(Logger::IsInitialized());
    assert(logger->level() == spdlog::level::info);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestSecondInitializeIgnored() {
    std::cout << "  Testing second Initialize is ignored..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "debug");
    Logger::Initialize("", "error");
    assert(Logger::Get()->level() == spdlog::level::debug);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestReloadLevel() {
    std::cout << "  Testing level change at runtime..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "info");

    Logger::SetLevel("trace");
    assert(Logger::Get()->level() == spdlog::level::trace);

    Logger::SetLevel("ERROR");
    assert(Logger::Get()->level() == spdlog::level::err);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Output Tests
//===----------------------------------------------------------------------===//

void TestFileOutputAndFiltering() {
    std::cout << "  Testing file sink with component tags..." << std::endl;

    auto path = (std::filesystem::temp_directory_path() / "peersync_test_logger.log").string();
    std::filesystem::remove(path);

    Logger::Shutdown();
    Logger::Initialize(path, "warn");

    LOG_INFO("importer", "dropped below threshold");
    LOG_WARN("importer", "record rejected: unknown column");
    LOG_ERROR("client", "session closed by sender");
    Logger::Flush();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();

    assert(text.find("dropped below threshold") == std::string::npos);
    assert(text.find("[importer] record rejected: unknown column") != std::string::npos);
    assert(text.find("[client] session closed by sender") != std::string::npos);

    Logger::Shutdown();
    std::filesystem::remove(path);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Context Tests
//===----------------------------------------------------------------------===//

void TestContextTag() {
    std::cout << "  Testing context tag format..." << std::endl;

    assert(LogContext{}.Tag().empty());
    assert((LogContext{"ABCD2345", 7}.Tag() == "[ABCD2345 r7] "));
    assert((LogContext{"ABCD2345", 0}.Tag() == "[ABCD2345] "));
    assert((LogContext{"", 3}.Tag() == "[- r3] "));

    std::cout << "    PASSED" << std::endl;
}

void TestScopedContextNests() {
    std::cout << "  Testing scoped contexts nest and restore..." << std::endl;

    assert(Logger::CurrentContext().Empty());
    {
        ScopedLogContext outer("ABCD2345", 0);
        assert(Logger::ContextTag() == "[ABCD2345] ");
        {
            ScopedLogContext inner("ABCD2345", 9);
            assert(Logger::CurrentContext().receiver_id == 9);
            assert(Logger::ContextTag() == "[ABCD2345 r9] ");
        }
        assert(Logger::CurrentContext().receiver_id == 0);
        assert(Logger::ContextTag() == "[ABCD2345] ");
    }
    assert(Logger::CurrentContext().Empty());
    assert(Logger::ContextTag().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestContextIsPerThread() {
    std::cout << "  Testing log lines carry their own thread's context..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "info");
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%v");
    Logger::Get()->sinks().push_back(sink);

    ScopedLogContext main_context("MAINCODE", 1);
    std::thread other([]() {
        ScopedLogContext log_context("WORKCODE", 2);
        LOG_INFO("worker", "page imported");
    });
    other.join();
    LOG_INFO("client", "table listed");
    LOG_DEBUG("client", "below level");
    Logger::Flush();

    std::string text = captured.str();
    assert(text.find("[worker] [WORKCODE r2] page imported") != std::string::npos);
    assert(text.find("[client] [MAINCODE r1] table listed") != std::string::npos);
    assert(text.find("below level") == std::string::npos);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    std::cout << "\n1. Level Conversion:" << std::endl;
    TestLevelFromString();

    std::cout << "\n2. Initialization:" << std::endl;
    TestAutoInitialize();
    TestSecondInitializeIgnored();
    TestReloadLevel();

    std::cout << "\n3. Output:" << std::endl;
    TestFileOutputAndFiltering();

    std::cout << "\n4. Context:" << std::endl;
    TestContextTag();
    TestScopedContextNests();
    TestContextIsPerThread();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
