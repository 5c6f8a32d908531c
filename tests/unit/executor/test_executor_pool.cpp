//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/executor/test_executor_pool.cpp
//
// Unit tests for ExecutorPool
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include <cassert>
#include <iostream>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace peersync;

namespace {

void WaitUntil(const std::function<bool()>& done, std::chrono::seconds limit = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        assert(std::chrono::steady_clock::now() < deadline);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Lifecycle Tests
//===----------------------------------------------------------------------===//

void TestThreadCount() {
    std::cout << "  Testing thread count..." << std::endl;

    ExecutorPool automatic("catalog");
    assert(automatic.Size() > 0);
    assert(!automatic.IsRunning());

    ExecutorPool fixed("catalog", 3);
    assert(fixed.Size() == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestStartStopIdempotent() {
    std::cout << "  Testing repeated Start/Stop..." << std::endl;

    ExecutorPool pool("catalog", 2);
    pool.Start();
    pool.Start();
    assert(pool.IsRunning());

    pool.Stop();
    pool.Stop();
    assert(!pool.IsRunning());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Submission Tests
//===----------------------------------------------------------------------===//

void TestRequestsRunConcurrently() {
    std::cout << "  Testing export requests overlap across workers..." << std::endl;

    ExecutorPool pool("catalog", 4);
    pool.Start();

    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    std::atomic<int> completed{0};
    const int requests = 16;

    for (int i = 0; i < requests; ++i) {
        bool accepted = pool.Submit([&]() {
            int now = current.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            current.fetch_sub(1);
            completed.fetch_add(1);
        });
        assert(accepted);
    }

    WaitUntil([&]() { return completed.load() == requests; }, std::chrono::seconds(10));
    assert(peak.load() > 1);
    pool.Stop();

    std::cout << "    PASSED (peak " << peak.load() << ")" << std::endl;
}

void TestStatsCountTasks() {
    std::cout << "  Testing pool stats..." << std::endl;

    ExecutorPool pool("import", 1);
    assert(pool.Name() == "import");
    pool.Start();

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool open = false;
    std::atomic<bool> entered{false};

    pool.Submit([&]() {
        entered.store(true);
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate_cv.wait(lock, [&]() { return open; });
    });
    pool.Submit([]() {});
    pool.Submit([]() { throw std::runtime_error("export failed"); });

    WaitUntil([&]() { return entered.load(); });
    auto busy = pool.GetStats();
    assert(busy.name == "import");
    assert(busy.threads == 1);
    assert(busy.busy == 1);
    assert(busy.queued == 2);
    assert(busy.completed == 0);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        open = true;
    }
    gate_cv.notify_all();
    WaitUntil([&]() { return pool.GetStats().completed == 3; });

    auto idle = pool.GetStats();
    assert(idle.busy == 0);
    assert(idle.queued == 0);
    assert(idle.failed == 1);

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestTaskExceptionKeepsWorker() {
    std::cout << "  Testing a throwing task does not kill its worker..." << std::endl;

    ExecutorPool pool("catalog", 1);
    pool.Start();

    pool.Submit([]() { throw std::runtime_error("bad request"); });

    std::atomic<bool> executed{false};
    pool.Submit([&executed]() { executed.store(true); });

    WaitUntil([&]() { return executed.load(); });
    pool.Stop();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Shutdown Tests
//===----------------------------------------------------------------------===//

void TestStopDrainsQueue() {
    std::cout << "  Testing Stop runs already queued tasks..." << std::endl;

    ExecutorPool pool("catalog", 1);
    pool.Start();

    std::atomic<int> completed{0};
    pool.Submit([]() { std::this_thread::sleep_for(std::chrono::milliseconds(20)); });
    for (int i = 0; i < 10; ++i) {
        pool.Submit([&completed]() { completed.fetch_add(1); });
    }

    pool.Stop();
    assert(completed.load() == 10);
    assert(pool.GetStats().queued == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestSubmitAfterStopRejected() {
    std::cout << "  Testing Submit after Stop is rejected..." << std::endl;

    ExecutorPool pool("catalog", 2);
    pool.Start();
    pool.Stop();

    std::atomic<bool> executed{false};
    bool accepted = pool.Submit([&executed]() { executed.store(true); });
    assert(!accepted);
    assert(pool.GetStats().queued == 0);
    assert(!executed.load());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ExecutorPool Unit Tests ===" << std::endl;

    std::cout << "\n1. Lifecycle:" << std::endl;
    TestThreadCount();
    TestStartStopIdempotent();

    std::cout << "\n2. Submission:" << std::endl;
    TestRequestsRunConcurrently();
    TestStatsCountTasks();
    TestTaskExceptionKeepsWorker();

    std::cout << "\n3. Shutdown:" << std::endl;
    TestStopDrainsQueue();
    TestSubmitAfterStopRejected();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
