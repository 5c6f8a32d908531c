//===----------------------------------------------------------------------===//
//                         PeerSync
//
// protocol/protocol_handler.cpp
//
// Protocol message handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/protocol_handler.hpp"
#include "network/tcp_connection.hpp"
#include "session/session_registry.hpp"
#include "schema/schema_inspector.hpp"
#include "exporter/data_exporter.hpp"
#include "executor/executor_pool.hpp"
#include "storage/sql_util.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"

namespace peersync {

namespace {

bool IsDataRequest(MessageType type) {
    switch (type) {
        case MessageType::GET_CAPABILITIES:
        case MessageType::LIST_TABLES:
        case MessageType::GET_SCHEMA:
        case MessageType::GET_COUNT:
        case MessageType::FETCH_RECORDS:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

ProtocolHandler::ProtocolHandler(std::shared_ptr<SessionRegistry> registry,
                                 std::shared_ptr<ExecutorPool> executor_pool,
                                 SchemaInspector& inspector,
                                 DataExporter& exporter,
                                 std::string server_version)
    : registry_(std::move(registry))
    , executor_pool_(std::move(executor_pool))
    , inspector_(inspector)
    , exporter_(exporter)
    , server_version_(std::move(server_version)) {
}

void ProtocolHandler::HandleMessage(const Message& message, TcpConnectionPtr connection) {
    MessageType type = message.GetType();
    switch (type) {
        case MessageType::HELLO:
            HandleHello(message, connection);
            break;
        case MessageType::PING:
            HandlePing(message, connection);
            break;
        case MessageType::CLOSE:
            HandleClose(connection);
            break;
        default:
            if (IsDataRequest(type)) {
                HandleRequest(message, connection);
            } else {
                LOG_WARN("protocol", "Unknown message type: " + std::to_string(static_cast<int>(type)));
                SendError(ErrorPayload(0, ErrorCode::PROTOCOL_ERROR, "unknown message type"), connection);
            }
            break;
    }
}

void ProtocolHandler::HandleHello(const Message& message, TcpConnectionPtr connection) {
    HelloPayload hello;
    try {
        hello = HelloPayload::FromJson(message.PayloadJson());
    } catch (const SyncException& e) {
        SendError(ErrorPayload(0, e.Code(), e.Detail()), connection);
        return;
    }

    if (hello.protocol_version != PROTOCOL_VERSION) {
        SendError(ErrorPayload(0, ErrorCode::VERSION_MISMATCH,
                               "protocol version mismatch, sender speaks " +
                               std::to_string(PROTOCOL_VERSION)), connection);
        return;
    }

    if (connection->IsJoined()) {
        SendError(ErrorPayload(0, ErrorCode::PROTOCOL_ERROR, "already joined"), connection);
        return;
    }

    ReceiverInfo receiver = hello.receiver;
    receiver.remote_ip = connection->GetRemoteAddress();

    AttachResult attached = registry_->ValidateAndAttach(hello.session_code, receiver);
    if (!attached.Ok()) {
        LOG_INFO("protocol", "Rejected join from " + receiver.remote_ip + ": " +
                 ErrorCodeToString(attached.error));
        SendError(ErrorPayload(0, attached.error,
                               attached.error == ErrorCode::SESSION_CLOSED ? "session is closed"
                                                                           : "invalid connection code"),
                  connection);
        return;
    }

    connection->SetMembership(attached.session.code, attached.receiver_id);

    HelloResponsePayload response;
    response.session_code = attached.session.code;
    response.receiver_id = attached.receiver_id;
    response.server_info = {{"name", "peersync"}, {"version", server_version_}};
    connection->Send(Message::FromJson(MessageType::HELLO_RESPONSE, response.ToJson()));

    LOG_INFO("protocol", "Receiver " + std::to_string(attached.receiver_id) + " (" +
             (receiver.name.empty() ? receiver.remote_ip : receiver.name) +
             ") joined session " + attached.session.code);
}

void ProtocolHandler::HandlePing(const Message& message, TcpConnectionPtr connection) {
    uint64_t ref = 0;
    try {
        ref = RequestPayload::FromJson(message.PayloadJson()).ref;
    } catch (const SyncException& e) {
        LOG_DEBUG("protocol", "PING with unreadable payload: " + e.Detail());
    }
    connection->Send(Message::FromJson(MessageType::PONG, {{"ref", ref}}));
}

void ProtocolHandler::HandleClose(TcpConnectionPtr connection) {
    connection->Close();
}

void ProtocolHandler::OnDisconnect(TcpConnectionPtr connection) {
    if (!connection->IsJoined()) {
        return;
    }
    std::string code = connection->GetSessionCode();
    uint64_t receiver_id = connection->GetReceiverId();
    if (registry_->DetachReceiver(code, receiver_id)) {
        LOG_INFO("protocol", "Receiver " + std::to_string(receiver_id) + " left session " + code);
    }
}

void ProtocolHandler::HandleRequest(const Message& message, TcpConnectionPtr connection) {
    RequestPayload request;
    try {
        request = RequestPayload::FromJson(message.PayloadJson());
    } catch (const SyncException& e) {
        SendError(ErrorPayload(0, e.Code(), e.Detail()), connection);
        return;
    }

    if (!connection->IsJoined()) {
        SendError(ErrorPayload(request.ref, ErrorCode::NOT_JOINED, "join a session first"), connection);
        return;
    }

    MessageType type = message.GetType();
    auto self = shared_from_this();
    bool queued = executor_pool_->Submit([self, type, request, connection]() {
        ScopedLogContext log_context(connection->GetSessionCode(), connection->GetReceiverId());
        if (!self->registry_->IsLive(connection->GetSessionCode())) {
            self->SendError(ErrorPayload(request.ref, ErrorCode::SESSION_CLOSED, "session is closed"),
                            connection);
            return;
        }

        try {
            connection->Send(self->Evaluate(type, request));
            self->requests_served_++;
            LOG_TRACE("protocol", std::string(MessageTypeToString(type)) + " ref " + std::to_string(request.ref) +
                      (request.table.empty() ? "" : " on " + request.table));
        } catch (const SyncException& e) {
            self->SendError(ErrorPayload(request.ref, e.Code(), e.Detail(),
                                         e.Table().empty() ? request.table : e.Table()), connection);
        } catch (const std::exception& e) {
            LOG_ERROR("protocol", std::string(MessageTypeToString(type)) + " failed: " + e.what());
            self->SendError(ErrorPayload(request.ref, ErrorCode::INTERNAL_ERROR, e.what(), request.table),
                            connection);
        }
    });

    if (!queued) {
        SendError(ErrorPayload(request.ref, ErrorCode::DISCONNECTED, "sender is shutting down"), connection);
    }
}

Message ProtocolHandler::Evaluate(MessageType type, const RequestPayload& request) {
    switch (type) {
        case MessageType::GET_CAPABILITIES: {
            nlohmann::json body = BuildCapabilities(server_version_);
            body["ref"] = request.ref;
            return Message::FromJson(MessageType::CAPABILITIES, body);
        }

        case MessageType::LIST_TABLES: {
            nlohmann::json tables = nlohmann::json::array();
            for (const auto& info : inspector_.ListTables()) {
                tables.push_back({{"name", info.name}, {"estimated_count", info.estimated_count}});
            }
            return Message::FromJson(MessageType::TABLES, {{"ref", request.ref}, {"tables", tables}});
        }

        case MessageType::GET_SCHEMA: {
            TableSchema schema = inspector_.GetSchema(request.table);
            return Message::FromJson(MessageType::SCHEMA, {{"ref", request.ref}, {"schema", schema.ToJson()}});
        }

        case MessageType::GET_COUNT: {
            int64_t count = inspector_.GetCount(request.table);
            return Message::FromJson(MessageType::COUNT,
                                     {{"ref", request.ref}, {"table", request.table}, {"count", count}});
        }

        case MessageType::FETCH_RECORDS: {
            RecordBatch batch = exporter_.ExportRecords(request.table, request.limit, request.offset);
            nlohmann::json body = batch.ToJson();
            body["ref"] = request.ref;
            body["table"] = request.table;
            return Message::FromJson(MessageType::RECORDS, body);
        }

        default:
            throw SyncException(ErrorCode::PROTOCOL_ERROR,
                                std::string("not a request: ") + MessageTypeToString(type));
    }
}

void ProtocolHandler::SendError(const ErrorPayload& error, TcpConnectionPtr connection) {
    requests_failed_++;
    connection->Send(Message::FromJson(MessageType::ERROR, error.ToJson()));
}

} // namespace peersync
