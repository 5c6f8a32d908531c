//===----------------------------------------------------------------------===//
//                         PeerSync
//
// network/tcp_connection.hpp
//
// One receiver connection on the sender side
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include <asio.hpp>
#include <array>
#include <queue>

namespace peersync {

class TcpServer;
class ProtocolHandler;

class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    using Ptr = std::shared_ptr<TcpConnection>;

    TcpConnection(asio::io_context& io_context,
                  TcpServer& server,
                  std::shared_ptr<ProtocolHandler> handler);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    asio::ip::tcp::socket& GetSocket() { return socket_; }

    void Start();
    void Close();

    // Thread-safe; the write itself runs on the socket's executor
    void Send(const Message& message);

    // Synchronous error reply followed by close, for connections
    // refused before Start()
    void Reject(const Message& message);

    std::string GetRemoteAddress() const;
    uint16_t GetRemotePort() const;

    uint64_t GetConnectionId() const { return connection_id_; }
    bool IsConnected() const { return connected_; }

    // Session membership, set once HELLO is accepted
    void SetMembership(const std::string& session_code, uint64_t receiver_id);
    std::string GetSessionCode() const;
    uint64_t GetReceiverId() const;
    bool IsJoined() const;

private:
    void DoReadHeader();
    void DoReadPayload();
    void ProcessMessage();
    void DoWrite();
    void HandleError(const std::string& operation, const asio::error_code& ec);

private:
    asio::ip::tcp::socket socket_;
    TcpServer& server_;
    std::shared_ptr<ProtocolHandler> handler_;

    uint64_t connection_id_;
    std::atomic<bool> connected_;

    mutable std::mutex membership_mutex_;
    std::string session_code_;
    uint64_t receiver_id_;

    std::array<uint8_t, MessageHeader::SIZE> header_buffer_;
    Message current_message_;

    std::queue<std::vector<uint8_t>> write_queue_;
    std::mutex write_mutex_;
    bool writing_;

    std::atomic<uint64_t> bytes_received_;
    std::atomic<uint64_t> bytes_sent_;
    std::atomic<uint64_t> messages_received_;
    std::atomic<uint64_t> messages_sent_;

    static std::atomic<uint64_t> next_connection_id_;
};

} // namespace peersync
