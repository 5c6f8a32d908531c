//===----------------------------------------------------------------------===//
//                         PeerSync
//
// protocol/protocol_handler.hpp
//
// Sender-side request dispatch for joined receivers
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace peersync {

class ProtocolHandler : public std::enable_shared_from_this<ProtocolHandler> {
public:
    ProtocolHandler(std::shared_ptr<SessionRegistry> registry,
                    std::shared_ptr<ExecutorPool> executor_pool,
                    SchemaInspector& inspector,
                    DataExporter& exporter,
                    std::string server_version);
    ~ProtocolHandler() = default;

    // Called on the connection's IO thread
    void HandleMessage(const Message& message, TcpConnectionPtr connection);

    // Connection gone: detach its receiver, if any
    void OnDisconnect(TcpConnectionPtr connection);

    // Synchronous request evaluation; throws SyncException or StorageError
    Message Evaluate(MessageType type, const RequestPayload& request);

    uint64_t GetRequestsServed() const { return requests_served_; }
    uint64_t GetRequestsFailed() const { return requests_failed_; }

private:
    void HandleHello(const Message& message, TcpConnectionPtr connection);
    void HandlePing(const Message& message, TcpConnectionPtr connection);
    void HandleClose(TcpConnectionPtr connection);
    void HandleRequest(const Message& message, TcpConnectionPtr connection);

    void SendError(const ErrorPayload& error, TcpConnectionPtr connection);

private:
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<ExecutorPool> executor_pool_;
    SchemaInspector& inspector_;
    DataExporter& exporter_;
    std::string server_version_;

    std::atomic<uint64_t> requests_served_{0};
    std::atomic<uint64_t> requests_failed_{0};
};

} // namespace peersync
