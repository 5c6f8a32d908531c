//===----------------------------------------------------------------------===//
//                         PeerSync
//
// network/tcp_server.hpp
//
// Sender-side listener accepting receiver connections
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include "network/tcp_connection.hpp"
#include <asio.hpp>
#include <map>

namespace peersync {

class ProtocolHandler;

class TcpServer {
public:
    TcpServer(const SyncConfig& config, std::shared_ptr<ProtocolHandler> handler);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Binds and starts accepting. Throws asio::system_error when the
    // address cannot be bound.
    void Start();
    void Stop();

    bool IsRunning() const { return running_; }

    // Bound port; differs from the configured one when that was 0
    uint16_t GetPort() const { return bound_port_; }

    // io_index is the IO context slot the connection runs on
    void AddConnection(TcpConnectionPtr conn, size_t io_index);
    void RemoveConnection(TcpConnectionPtr conn);
    size_t GetConnectionCount() const;

    // Connections per IO thread
    std::vector<size_t> GetIoLoad() const { return io_pool_.GetLoad(); }

    // Drop every connection joined to the session
    size_t DisconnectSession(const std::string& session_code);

    uint64_t GetTotalConnections() const { return total_connections_; }
    uint64_t GetTotalBytesReceived() const { return total_bytes_received_; }
    uint64_t GetTotalBytesSent() const { return total_bytes_sent_; }

    void AddBytesReceived(uint64_t bytes) { total_bytes_received_ += bytes; }
    void AddBytesSent(uint64_t bytes) { total_bytes_sent_ += bytes; }

private:
    void DoAccept();

private:
    const SyncConfig& config_;
    std::shared_ptr<ProtocolHandler> handler_;

    IoContextPool io_pool_;

    // Acceptor runs on its own context, separate from the worker pool
    asio::io_context acceptor_io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread acceptor_thread_;
    uint16_t bound_port_;

    std::map<TcpConnectionPtr, size_t> connections_;
    mutable std::mutex connections_mutex_;

    std::atomic<bool> running_;

    std::atomic<uint64_t> total_connections_;
    std::atomic<uint64_t> total_bytes_received_;
    std::atomic<uint64_t> total_bytes_sent_;
};

} // namespace peersync
