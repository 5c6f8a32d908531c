//===----------------------------------------------------------------------===//
//                         PeerSync
//
// network/io_context_pool.hpp
//
// Asio IO contexts, one thread each, shared by receiver connections.
// A new connection goes to the context serving the fewest.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>
#include <thread>

namespace peersync {

class IoContextPool {
public:
    // A context handed to one connection; give the index back on close
    struct Slot {
        asio::io_context& context;
        size_t index;
    };

    explicit IoContextPool(size_t pool_size = 0);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void Start();
    void Stop();

    // Least connections first, lowest index on ties
    Slot Acquire();
    void Release(size_t index);

    size_t Size() const { return io_contexts_.size(); }

    // Connections bound to each context
    std::vector<size_t> GetLoad() const;

private:
    std::vector<std::unique_ptr<asio::io_context>> io_contexts_;

    // Keep io_contexts running while idle
    std::vector<asio::executor_work_guard<asio::io_context::executor_type>> work_guards_;

    std::vector<std::thread> threads_;
    bool running_;

    mutable std::mutex load_mutex_;
    std::vector<size_t> load_;
};

} // namespace peersync
