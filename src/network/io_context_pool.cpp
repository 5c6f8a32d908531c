//===----------------------------------------------------------------------===//
//                         PeerSync
//
// network/io_context_pool.cpp
//
// IO context pool implementation
//===----------------------------------------------------------------------===//

#include "network/io_context_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace peersync {

IoContextPool::IoContextPool(size_t pool_size)
    : running_(false) {

    if (pool_size == 0) {
        pool_size = std::thread::hardware_concurrency();
        if (pool_size == 0) {
            pool_size = 2;
        }
    }

    for (size_t i = 0; i < pool_size; ++i) {
        io_contexts_.push_back(std::make_unique<asio::io_context>());
    }
    load_.assign(pool_size, 0);
}

IoContextPool::~IoContextPool() {
    Stop();
}

void IoContextPool::Start() {
    if (running_) {
        return;
    }
    running_ = true;

    for (auto& io_context : io_contexts_) {
        io_context->restart();
        work_guards_.push_back(asio::make_work_guard(*io_context));
        asio::io_context* context = io_context.get();
        threads_.emplace_back([context]() { context->run(); });
    }

    LOG_DEBUG("io_pool", std::to_string(threads_.size()) + " IO threads started");
}

void IoContextPool::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    work_guards_.clear();
    for (auto& io_context : io_contexts_) {
        io_context->stop();
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    {
        std::lock_guard<std::mutex> lock(load_mutex_);
        std::fill(load_.begin(), load_.end(), 0);
    }

    LOG_DEBUG("io_pool", "IO threads stopped");
}

IoContextPool::Slot IoContextPool::Acquire() {
    std::lock_guard<std::mutex> lock(load_mutex_);
    size_t index = static_cast<size_t>(std::min_element(load_.begin(), load_.end()) - load_.begin());
    load_[index]++;
    return Slot{*io_contexts_[index], index};
}

void IoContextPool::Release(size_t index) {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (index < load_.size() && load_[index] > 0) {
        load_[index]--;
    }
}

std::vector<size_t> IoContextPool::GetLoad() const {
    std::lock_guard<std::mutex> lock(load_mutex_);
    return load_;
}

} // namespace peersync
