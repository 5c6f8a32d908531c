//===----------------------------------------------------------------------===//
//                         PeerSync
//
// network/tcp_server.cpp
//
// TCP server implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "config/sync_config.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"

namespace peersync {

TcpServer::TcpServer(const SyncConfig& config, std::shared_ptr<ProtocolHandler> handler)
    : config_(config)
    , handler_(std::move(handler))
    , io_pool_(config.GetIoThreadCount())
    , acceptor_(acceptor_io_context_)
    , bound_port_(0)
    , running_(false)
    , total_connections_(0)
    , total_bytes_received_(0)
    , total_bytes_sent_(0) {
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::Start() {
    if (running_) {
        return;
    }

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;

    io_pool_.Start();

    DoAccept();

    acceptor_thread_ = std::thread([this]() {
        acceptor_io_context_.run();
    });

    LOG_INFO("server", "PeerSync sender listening on " + config_.host + ":" + std::to_string(bound_port_));
}

void TcpServer::Stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    asio::error_code ec;
    acceptor_.close(ec);
    acceptor_io_context_.stop();

    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }

    std::map<TcpConnectionPtr, size_t> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& entry : connections) {
        entry.first->Close();
        io_pool_.Release(entry.second);
    }

    io_pool_.Stop();

    LOG_INFO("server", "PeerSync sender stopped");
}

void TcpServer::AddConnection(TcpConnectionPtr conn, size_t io_index) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.emplace(std::move(conn), io_index);
    total_connections_++;
}

void TcpServer::RemoveConnection(TcpConnectionPtr conn) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(conn);
    if (it == connections_.end()) {
        return;
    }
    io_pool_.Release(it->second);
    connections_.erase(it);
}

size_t TcpServer::GetConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

size_t TcpServer::DisconnectSession(const std::string& session_code) {
    std::vector<TcpConnectionPtr> members;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& entry : connections_) {
            if (entry.first->GetSessionCode() == session_code) {
                members.push_back(entry.first);
            }
        }
    }

    for (auto& conn : members) {
        asio::post(conn->GetSocket().get_executor(), [conn]() { conn->Close(); });
    }

    if (!members.empty()) {
        LOG_INFO("server", "Disconnecting " + std::to_string(members.size()) +
                 " receiver(s) from session " + session_code);
    }
    return members.size();
}

void TcpServer::DoAccept() {
    if (!running_) {
        return;
    }

    IoContextPool::Slot slot = io_pool_.Acquire();
    auto conn = std::make_shared<TcpConnection>(slot.context, *this, handler_);
    size_t io_index = slot.index;

    acceptor_.async_accept(conn->GetSocket(),
        [this, conn, io_index](const asio::error_code& ec) {
            if (ec) {
                io_pool_.Release(io_index);
                if (running_) {
                    LOG_WARN("server", "Accept error: " + ec.message());
                    DoAccept();
                }
                return;
            }

            if (GetConnectionCount() >= config_.max_receivers) {
                LOG_WARN("server", "Max receivers reached, rejecting connection from " +
                         conn->GetRemoteAddress());
                ErrorPayload error(0, ErrorCode::MAX_CONNECTIONS, "too many receivers");
                conn->Reject(Message::FromJson(MessageType::ERROR, error.ToJson()));
                io_pool_.Release(io_index);
            } else {
                AddConnection(conn, io_index);
                conn->Start();
            }

            DoAccept();
        });
}

} // namespace peersync
