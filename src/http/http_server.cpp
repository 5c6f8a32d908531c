//===----------------------------------------------------------------------===//
//                         PeerSync
//
// http/http_server.cpp
//
// Health, metrics and session listing over plain HTTP
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "executor/executor_pool.hpp"
#include "network/tcp_server.hpp"
#include "session/session_registry.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <sstream>

namespace peersync {

HttpServer::HttpServer(uint16_t port, TcpServer* server, std::shared_ptr<SessionRegistry> registry)
    : port_(port)
    , server_(server)
    , registry_(std::move(registry))
    , acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    port_ = acceptor_.local_endpoint().port();
}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_) return;
    running_ = true;

    DoAccept();

    thread_ = std::thread([this]() {
        io_context_.run();
    });

    LOG_INFO("http", "HTTP server started on port " + std::to_string(port_));
}

void HttpServer::Stop() {
    if (!running_) return;
    running_ = false;

    asio::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_INFO("http", "HTTP server stopped");
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        if (!ec && running_) {
            HandleConnection(std::move(socket));
        }
        if (running_ && acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void HttpServer::HandleConnection(asio::ip::tcp::socket socket) {
    auto sock = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
    auto buf = std::make_shared<std::array<char, 4096>>();

    sock->async_read_some(asio::buffer(*buf),
        [this, sock, buf](std::error_code ec, size_t bytes_read) {
            if (ec) return;

            std::string request(buf->data(), bytes_read);
            auto resp = std::make_shared<std::string>(HandleRequest(request));
            asio::async_write(*sock, asio::buffer(*resp),
                [sock, resp](std::error_code, size_t) {
                    asio::error_code shutdown_ec;
                    sock->shutdown(asio::ip::tcp::socket::shutdown_both, shutdown_ec);
                    sock->close(shutdown_ec);
                });
        });
}

std::string HttpServer::HandleRequest(const std::string& request) {
    std::istringstream iss(request);
    std::string method, path, version;
    iss >> method >> path >> version;

    if (method != "GET") {
        return BuildResponse(405, "Method Not Allowed", "text/plain", "Method Not Allowed");
    }

    if (path == "/health" || path == "/healthz") {
        return GetHealthResponse();
    } else if (path == "/metrics") {
        return GetMetricsResponse();
    } else if (path == "/sessions") {
        return GetSessionsResponse();
    } else if (path == "/") {
        return BuildResponse(200, "OK", "text/plain", "PeerSync Sender");
    }

    return BuildResponse(404, "Not Found", "text/plain", "Not Found");
}

std::string HttpServer::BuildResponse(int status_code, const std::string& status_text,
                                      const std::string& content_type, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code << " " << status_text << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

std::string HttpServer::GetHealthResponse() {
    nlohmann::json body = {
        {"status", "healthy"},
        {"connections", server_ ? server_->GetConnectionCount() : 0},
        {"active_sessions", registry_ ? registry_->CountActive() : 0}
    };
    return BuildResponse(200, "OK", "application/json", body.dump(2));
}

std::string HttpServer::GetSessionsResponse() {
    nlohmann::json sessions = nlohmann::json::array();
    if (registry_) {
        for (const auto& session : registry_->ListActive()) {
            sessions.push_back(session.ToJson());
        }
    }
    return BuildResponse(200, "OK", "application/json", nlohmann::json({{"sessions", sessions}}).dump(2));
}

std::string HttpServer::GetMetricsResponse() {
    std::ostringstream metrics;

    if (server_) {
        metrics << "# HELP peersync_connections_total Total number of receiver connections\n"
                << "# TYPE peersync_connections_total counter\n"
                << "peersync_connections_total " << server_->GetTotalConnections() << "\n"
                << "\n"
                << "# HELP peersync_connections_active Current receiver connections\n"
                << "# TYPE peersync_connections_active gauge\n"
                << "peersync_connections_active " << server_->GetConnectionCount() << "\n"
                << "\n"
                << "# HELP peersync_bytes_received_total Total bytes received\n"
                << "# TYPE peersync_bytes_received_total counter\n"
                << "peersync_bytes_received_total " << server_->GetTotalBytesReceived() << "\n"
                << "\n"
                << "# HELP peersync_bytes_sent_total Total bytes sent\n"
                << "# TYPE peersync_bytes_sent_total counter\n"
                << "peersync_bytes_sent_total " << server_->GetTotalBytesSent() << "\n"
                << "\n";

        metrics << "# HELP peersync_io_thread_connections Receiver connections served by each IO thread\n"
                << "# TYPE peersync_io_thread_connections gauge\n";
        std::vector<size_t> load = server_->GetIoLoad();
        for (size_t i = 0; i < load.size(); i++) {
            metrics << "peersync_io_thread_connections{thread=\"" << i << "\"} " << load[i] << "\n";
        }
        metrics << "\n";
    }

    if (!executor_pools_.empty()) {
        std::vector<ExecutorPool::Stats> pools;
        for (const auto& pool : executor_pools_) {
            pools.push_back(pool->GetStats());
        }
        auto family = [&metrics, &pools](const char* name, const char* type, const char* help,
                                         const std::function<uint64_t(const ExecutorPool::Stats&)>& value) {
            metrics << "# HELP " << name << " " << help << "\n"
                    << "# TYPE " << name << " " << type << "\n";
            for (const auto& stats : pools) {
                metrics << name << "{pool=\"" << stats.name << "\"} " << value(stats) << "\n";
            }
            metrics << "\n";
        };
        family("peersync_executor_threads", "gauge", "Worker threads",
               [](const ExecutorPool::Stats& s) { return static_cast<uint64_t>(s.threads); });
        family("peersync_executor_queued", "gauge", "Tasks waiting for a worker",
               [](const ExecutorPool::Stats& s) { return static_cast<uint64_t>(s.queued); });
        family("peersync_executor_busy", "gauge", "Workers running a task",
               [](const ExecutorPool::Stats& s) { return static_cast<uint64_t>(s.busy); });
        family("peersync_executor_tasks_total", "counter", "Tasks run",
               [](const ExecutorPool::Stats& s) { return s.completed; });
        family("peersync_executor_task_failures_total", "counter", "Tasks that threw",
               [](const ExecutorPool::Stats& s) { return s.failed; });
    }

    if (registry_) {
        metrics << "# HELP peersync_sessions_active Live sender sessions\n"
                << "# TYPE peersync_sessions_active gauge\n"
                << "peersync_sessions_active " << registry_->CountActive() << "\n"
                << "\n"
                << "# HELP peersync_sessions_created_total Sessions created\n"
                << "# TYPE peersync_sessions_created_total counter\n"
                << "peersync_sessions_created_total " << registry_->GetTotalSessionsCreated() << "\n"
                << "\n"
                << "# HELP peersync_receiver_attaches_total Receivers attached\n"
                << "# TYPE peersync_receiver_attaches_total counter\n"
                << "peersync_receiver_attaches_total " << registry_->GetTotalAttaches() << "\n";
    }

    if (metrics_callback_) {
        metrics << metrics_callback_();
    }

    return BuildResponse(200, "OK", "text/plain; version=0.0.4", metrics.str());
}

} // namespace peersync
