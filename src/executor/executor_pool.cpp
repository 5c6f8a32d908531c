//===----------------------------------------------------------------------===//
//                         PeerSync
//
// executor/executor_pool.cpp
//
// Worker thread pool implementation
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"

namespace peersync {

ExecutorPool::ExecutorPool(std::string name, size_t thread_count)
    : name_(std::move(name))
    , thread_count_(thread_count)
    , running_(false)
    , stop_requested_(false) {

    if (thread_count_ == 0) {
        thread_count_ = std::thread::hardware_concurrency();
        if (thread_count_ == 0) {
            thread_count_ = 4;
        }
    }
}

ExecutorPool::~ExecutorPool() {
    Stop();
}

void ExecutorPool::Start() {
    if (running_) {
        return;
    }

    running_ = true;
    stop_requested_ = false;

    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back([this]() {
            Worker();
        });
    }

    LOG_INFO("executor", "Pool '" + name_ + "' started with " + std::to_string(thread_count_) + " threads");
}

void ExecutorPool::Stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
    running_ = false;

    LOG_INFO("executor", "Pool '" + name_ + "' stopped after " + std::to_string(completed_.load()) +
             " tasks (" + std::to_string(failed_.load()) + " failed)");
}

bool ExecutorPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_requested_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

ExecutorPool::Stats ExecutorPool::GetStats() const {
    Stats stats;
    stats.name = name_;
    stats.threads = thread_count_;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats.queued = tasks_.size();
    }
    stats.busy = busy_.load();
    stats.completed = completed_.load();
    stats.failed = failed_.load();
    return stats;
}

void ExecutorPool::Worker() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this]() {
                return stop_requested_.load() || !tasks_.empty();
            });

            if (tasks_.empty()) {
                return;  // stop requested and drained
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            busy_++;
        }

        try {
            task();
        } catch (const std::exception& e) {
            failed_++;
            LOG_ERROR("executor", "Task in pool '" + name_ + "' threw: " + std::string(e.what()));
        }
        busy_--;
        completed_++;
    }
}

} // namespace peersync
