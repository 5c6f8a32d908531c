//===----------------------------------------------------------------------===//
//                         PeerSync
//
// network/tcp_connection.cpp
//
// TCP connection implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_connection.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"

namespace peersync {

std::atomic<uint64_t> TcpConnection::next_connection_id_{1};

TcpConnection::TcpConnection(asio::io_context& io_context,
                             TcpServer& server,
                             std::shared_ptr<ProtocolHandler> handler)
    : socket_(io_context)
    , server_(server)
    , handler_(std::move(handler))
    , connection_id_(next_connection_id_.fetch_add(1))
    , connected_(false)
    , receiver_id_(0)
    , writing_(false)
    , bytes_received_(0)
    , bytes_sent_(0)
    , messages_received_(0)
    , messages_sent_(0) {
}

TcpConnection::~TcpConnection() {
    asio::error_code ec;
    socket_.close(ec);
}

void TcpConnection::Start() {
    connected_ = true;

    LOG_DEBUG("connection", "Connection " + std::to_string(connection_id_) +
              " started from " + GetRemoteAddress() + ":" + std::to_string(GetRemotePort()));

    DoReadHeader();
}

void TcpConnection::Close() {
    if (!connected_.exchange(false)) {
        return;
    }

    LOG_DEBUG("connection", "Connection " + std::to_string(connection_id_) + " closing");

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    auto self = shared_from_this();
    if (handler_) {
        handler_->OnDisconnect(self);
    }
    server_.RemoveConnection(self);
}

void TcpConnection::Send(const Message& message) {
    if (!connected_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(message.Serialize());
    }

    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self]() {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (writing_) {
                return;
            }
            writing_ = true;
        }
        DoWrite();
    });
}

void TcpConnection::Reject(const Message& message) {
    asio::error_code ec;
    auto data = message.Serialize();
    asio::write(socket_, asio::buffer(data), ec);
    if (ec) {
        HandleError("reject", ec);
    }
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

std::string TcpConnection::GetRemoteAddress() const {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

uint16_t TcpConnection::GetRemotePort() const {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return 0;
    }
    return endpoint.port();
}

void TcpConnection::SetMembership(const std::string& session_code, uint64_t receiver_id) {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    session_code_ = session_code;
    receiver_id_ = receiver_id;
}

std::string TcpConnection::GetSessionCode() const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    return session_code_;
}

uint64_t TcpConnection::GetReceiverId() const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    return receiver_id_;
}

bool TcpConnection::IsJoined() const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    return !session_code_.empty();
}

void TcpConnection::DoReadHeader() {
    if (!connected_) {
        return;
    }

    auto self = shared_from_this();

    asio::async_read(socket_,
        asio::buffer(header_buffer_),
        [this, self](const asio::error_code& ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    HandleError("read_header", ec);
                }
                Close();
                return;
            }

            bytes_received_ += bytes_transferred;
            server_.AddBytesReceived(bytes_transferred);

            std::memcpy(&current_message_.GetHeader(), header_buffer_.data(), MessageHeader::SIZE);

            if (!current_message_.IsValid()) {
                LOG_WARN("connection", "Invalid message header from connection " +
                         std::to_string(connection_id_));
                Close();
                return;
            }

            if (current_message_.GetPayloadLength() > 0) {
                current_message_.GetPayload().resize(current_message_.GetPayloadLength());
                DoReadPayload();
            } else {
                ProcessMessage();
            }
        });
}

void TcpConnection::DoReadPayload() {
    if (!connected_) {
        return;
    }

    auto self = shared_from_this();

    asio::async_read(socket_,
        asio::buffer(current_message_.GetPayload()),
        [this, self](const asio::error_code& ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    HandleError("read_payload", ec);
                }
                Close();
                return;
            }

            bytes_received_ += bytes_transferred;
            server_.AddBytesReceived(bytes_transferred);

            ProcessMessage();
        });
}

void TcpConnection::ProcessMessage() {
    messages_received_++;

    LOG_TRACE("connection", "Received " + std::string(MessageTypeToString(current_message_.GetType())) +
              " on connection " + std::to_string(connection_id_));

    if (handler_) {
        handler_->HandleMessage(current_message_, shared_from_this());
    }

    current_message_ = Message();
    DoReadHeader();
}

void TcpConnection::DoWrite() {
    if (!connected_) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writing_ = false;
        return;
    }

    auto data = std::make_shared<std::vector<uint8_t>>();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_queue_.empty()) {
            writing_ = false;
            return;
        }
        *data = std::move(write_queue_.front());
        write_queue_.pop();
    }

    auto self = shared_from_this();

    asio::async_write(socket_,
        asio::buffer(*data),
        [this, self, data](const asio::error_code& ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    HandleError("write", ec);
                }
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    writing_ = false;
                }
                Close();
                return;
            }

            bytes_sent_ += bytes_transferred;
            server_.AddBytesSent(bytes_transferred);
            messages_sent_++;

            DoWrite();
        });
}

void TcpConnection::HandleError(const std::string& operation, const asio::error_code& ec) {
    LOG_WARN("connection", "Error on connection " + std::to_string(connection_id_) +
             " during " + operation + ": " + ec.message());
}

} // namespace peersync
