//===----------------------------------------------------------------------===//
//                         PeerSync
//
// http/http_server.hpp
//
// Health, metrics and session listing over plain HTTP
//===----------------------------------------------------------------------===//

#pragma once

#include <asio.hpp>
#include <string>
#include <memory>
#include <functional>
#include <thread>
#include <atomic>
#include <vector>

namespace peersync {

class TcpServer;
class SessionRegistry;
class ExecutorPool;

class HttpServer {
public:
    using MetricsCallback = std::function<std::string()>;

    HttpServer(uint16_t port, TcpServer* server, std::shared_ptr<SessionRegistry> registry);
    ~HttpServer();

    void Start();
    void Stop();

    uint16_t GetPort() const { return port_; }

    // Queue and task counters of the pool appear in /metrics, labelled by pool name
    void AddExecutorPool(std::shared_ptr<const ExecutorPool> pool) { executor_pools_.push_back(std::move(pool)); }

    // Extra Prometheus lines appended to /metrics
    void SetMetricsCallback(MetricsCallback callback) { metrics_callback_ = std::move(callback); }

    // Full HTTP response for a raw request
    std::string HandleRequest(const std::string& request);

private:
    void DoAccept();
    void HandleConnection(asio::ip::tcp::socket socket);
    std::string BuildResponse(int status_code, const std::string& status_text,
                              const std::string& content_type, const std::string& body);

    std::string GetHealthResponse();
    std::string GetMetricsResponse();
    std::string GetSessionsResponse();

private:
    uint16_t port_;
    TcpServer* server_;
    std::shared_ptr<SessionRegistry> registry_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    MetricsCallback metrics_callback_;
    std::vector<std::shared_ptr<const ExecutorPool>> executor_pools_;
};

} // namespace peersync
