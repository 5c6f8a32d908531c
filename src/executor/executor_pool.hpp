//===----------------------------------------------------------------------===//
//                         PeerSync
//
// executor/executor_pool.hpp
//
// Named worker thread pool. The sender runs catalog and export requests
// on one, the receiver runs background imports on another.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <queue>

namespace peersync {

class ExecutorPool {
public:
    using Task = std::function<void()>;

    struct Stats {
        std::string name;
        size_t threads = 0;
        size_t queued = 0;
        size_t busy = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;  // tasks that threw
    };

    // thread_count 0 picks the hardware concurrency
    explicit ExecutorPool(std::string name, size_t thread_count = 0);
    ~ExecutorPool();

    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    void Start();

    // Runs what is already queued, then joins the workers
    void Stop();

    // Returns false once Stop() has been requested
    bool Submit(Task task);

    const std::string& Name() const { return name_; }
    size_t Size() const { return thread_count_; }
    bool IsRunning() const { return running_; }

    Stats GetStats() const;

private:
    void Worker();

private:
    std::string name_;
    size_t thread_count_;
    std::vector<std::thread> workers_;

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;

    std::atomic<size_t> busy_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace peersync
