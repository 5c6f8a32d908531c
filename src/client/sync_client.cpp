//===----------------------------------------------------------------------===//
//                         PeerSync
//
// client/sync_client.cpp
//
// Sync client implementation
//===----------------------------------------------------------------------===//

#include "client/sync_client.hpp"
#include "importer/data_importer.hpp"
#include "schema/schema_inspector.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"

namespace peersync {

using asio::ip::tcp;

namespace {

// Malformed reply bodies become protocol errors
template <typename F>
auto ParseReply(MessageType type, F&& parse) -> decltype(parse()) {
    try {
        return parse();
    } catch (const nlohmann::json::exception& e) {
        throw SyncException(ErrorCode::PROTOCOL_ERROR,
                            std::string("malformed ") + MessageTypeToString(type) + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw SyncException(ErrorCode::PROTOCOL_ERROR,
                            std::string("malformed ") + MessageTypeToString(type) + ": " + e.what());
    }
}

// Marks the client as transferring for the duration of one table
class TransferScope {
public:
    explicit TransferScope(std::atomic<ClientState>& state) : state(state) {
        ClientState expected = ClientState::CONNECTED;
        state.compare_exchange_strong(expected, ClientState::TRANSFERRING);
    }
    ~TransferScope() {
        ClientState expected = ClientState::TRANSFERRING;
        state.compare_exchange_strong(expected, ClientState::CONNECTED);
    }

private:
    std::atomic<ClientState>& state;
};

} // anonymous namespace

const char* ClientStateToString(ClientState state) {
    switch (state) {
        case ClientState::DISCONNECTED: return "disconnected";
        case ClientState::CONNECTING:   return "connecting";
        case ClientState::CONNECTED:    return "connected";
        case ClientState::TRANSFERRING: return "transferring";
    }
    return "unknown";
}

bool SyncClient::ParseUrl(const std::string& url, std::string& host, uint16_t& port) {
    std::string rest = url;
    const std::string scheme = "tcp://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) {
        return false;
    }

    std::string port_text = rest.substr(colon + 1);
    if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
        return false;
    }
    unsigned long value = std::stoul(port_text);
    if (value == 0 || value > 65535) {
        return false;
    }

    host = rest.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

std::unique_ptr<SyncClient> SyncClient::Connect(const std::string& url,
                                                const std::string& code,
                                                const ConnectOptions& options) {
    std::string host;
    uint16_t port = 0;
    if (!ParseUrl(url, host, port)) {
        throw SyncException(ErrorCode::DISCONNECTED, "invalid sender url: " + url);
    }

    std::unique_ptr<SyncClient> client(new SyncClient(options));
    client->Open(host, port, code);
    return client;
}

SyncClient::SyncClient(const ConnectOptions& options)
    : options_(options)
    , work_guard_(asio::make_work_guard(io_context_))
    , socket_(io_context_)
    , heartbeat_timer_(io_context_)
    , state_(ClientState::DISCONNECTED)
    , channel_open_(false)
    , next_ref_(1)
    , receiver_id_(0)
    , server_info_(nlohmann::json::object()) {
}

SyncClient::~SyncClient() {
    Disconnect();
}

bool SyncClient::IsConnected() const {
    ClientState state = state_;
    return channel_open_ && (state == ClientState::CONNECTED || state == ClientState::TRANSFERRING);
}

void SyncClient::Open(const std::string& host, uint16_t port, const std::string& code) {
    state_ = ClientState::CONNECTING;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        closed_reason_.clear();
    }

    io_thread_ = std::thread([this]() {
        io_context_.run();
    });

    tcp::resolver::results_type endpoints;
    try {
        tcp::resolver resolver(io_context_);
        endpoints = resolver.resolve(host, std::to_string(port));
    } catch (const asio::system_error& e) {
        state_ = ClientState::DISCONNECTED;
        throw SyncException(ErrorCode::DISCONNECTED, "cannot resolve " + host + ": " + e.what());
    }

    auto connected = std::make_shared<std::promise<asio::error_code>>();
    auto connect_result = connected->get_future();
    asio::async_connect(socket_, endpoints,
        [connected](const asio::error_code& ec, const tcp::endpoint&) {
            connected->set_value(ec);
        });

    std::string where = host + ":" + std::to_string(port);
    if (connect_result.wait_for(std::chrono::milliseconds(options_.timeout_ms)) != std::future_status::ready) {
        asio::post(io_context_, [this]() {
            asio::error_code ignored;
            socket_.close(ignored);
        });
        state_ = ClientState::DISCONNECTED;
        throw SyncException(ErrorCode::CONNECTION_TIMEOUT, "timed out connecting to " + where);
    }
    asio::error_code ec = connect_result.get();
    if (ec) {
        state_ = ClientState::DISCONNECTED;
        throw SyncException(ErrorCode::DISCONNECTED, "cannot connect to " + where + ": " + ec.message());
    }

    channel_open_ = true;
    asio::post(io_context_, [this]() { DoReadHeader(); });

    HelloPayload hello;
    hello.session_code = code;
    hello.receiver = options_.receiver;

    Message reply;
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        reply = Exchange(MessageType::HELLO, hello.ToJson(), 0);
    }

    if (reply.GetType() == MessageType::ERROR) {
        ErrorPayload error = ParseReply(MessageType::ERROR, [&]() {
            return ErrorPayload::FromJson(reply.PayloadJson());
        });
        state_ = ClientState::DISCONNECTED;
        throw SyncException(error.code, error.message);
    }
    if (reply.GetType() != MessageType::HELLO_RESPONSE) {
        state_ = ClientState::DISCONNECTED;
        throw SyncException(ErrorCode::PROTOCOL_ERROR,
                            std::string("unexpected reply to HELLO: ") + MessageTypeToString(reply.GetType()));
    }

    HelloResponsePayload response = ParseReply(MessageType::HELLO_RESPONSE, [&]() {
        return HelloResponsePayload::FromJson(reply.PayloadJson());
    });
    session_code_ = response.session_code;
    receiver_id_ = response.receiver_id;
    server_info_ = response.server_info;
    state_ = ClientState::CONNECTED;

    asio::post(io_context_, [this]() { ScheduleHeartbeat(); });

    LOG_INFO("client", "Joined session " + session_code_ + " on " + where +
             " as receiver " + std::to_string(receiver_id_));
}

void SyncClient::Disconnect() {
    bool was_open = channel_open_;
    if (io_thread_.joinable()) {
        if (was_open) {
            // Best effort; the peer may already be gone
            Write(Message(MessageType::CLOSE));
        }
        asio::post(io_context_, [this]() {
            channel_open_ = false;
            heartbeat_timer_.cancel();
            asio::error_code ignored;
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        });
        work_guard_.reset();
        io_thread_.join();
    }

    channel_open_ = false;
    FailPending(ErrorCode::DISCONNECTED, "client disconnected");
    state_ = ClientState::DISCONNECTED;
    if (was_open) {
        LOG_INFO("client", "Disconnected from session " + session_code_);
    }
}

//===----------------------------------------------------------------------===//
// Request/response
//===----------------------------------------------------------------------===//

Message SyncClient::Exchange(MessageType type, const nlohmann::json& body, uint64_t ref) {
    auto promise = std::make_shared<std::promise<Message>>();
    auto reply = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!channel_open_) {
            throw SyncException(ErrorCode::DISCONNECTED,
                                closed_reason_.empty() ? "not connected" : closed_reason_);
        }
        pending_[ref] = promise;
    }

    Write(Message::FromJson(type, body));

    if (reply.wait_for(std::chrono::milliseconds(options_.timeout_ms)) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(ref);
        }
        throw SyncException(ErrorCode::CONNECTION_TIMEOUT,
                            std::string(MessageTypeToString(type)) + " got no reply within " +
                            std::to_string(options_.timeout_ms) + " ms");
    }
    return reply.get();
}

nlohmann::json SyncClient::Request(MessageType type, RequestPayload request, MessageType expected) {
    std::lock_guard<std::mutex> lock(request_mutex_);

    request.ref = NextRef();
    Message reply = Exchange(type, request.ToJson(), request.ref);

    if (reply.GetType() == MessageType::ERROR) {
        ErrorPayload error = ParseReply(MessageType::ERROR, [&]() {
            return ErrorPayload::FromJson(reply.PayloadJson());
        });
        throw SyncException(error.code, error.message, error.table.empty() ? request.table : error.table);
    }
    if (reply.GetType() != expected) {
        throw SyncException(ErrorCode::PROTOCOL_ERROR,
                            std::string("expected ") + MessageTypeToString(expected) + ", got " +
                            MessageTypeToString(reply.GetType()));
    }
    return reply.PayloadJson();
}

nlohmann::json SyncClient::GetCapabilities() {
    nlohmann::json body = Request(MessageType::GET_CAPABILITIES, RequestPayload{}, MessageType::CAPABILITIES);
    body.erase("ref");
    return body;
}

std::vector<TableInfo> SyncClient::ListTables() {
    nlohmann::json body = Request(MessageType::LIST_TABLES, RequestPayload{}, MessageType::TABLES);
    return ParseReply(MessageType::TABLES, [&]() {
        std::vector<TableInfo> tables;
        for (const auto& entry : body.at("tables")) {
            TableInfo info;
            info.name = entry.at("name").get<std::string>();
            info.estimated_count = entry.value("estimated_count", int64_t(0));
            tables.push_back(std::move(info));
        }
        return tables;
    });
}

TableSchema SyncClient::GetSchema(const std::string& table) {
    RequestPayload request;
    request.table = table;
    nlohmann::json body = Request(MessageType::GET_SCHEMA, request, MessageType::SCHEMA);
    return ParseReply(MessageType::SCHEMA, [&]() {
        return TableSchema::FromJson(body.at("schema"));
    });
}

int64_t SyncClient::GetCount(const std::string& table) {
    RequestPayload request;
    request.table = table;
    nlohmann::json body = Request(MessageType::GET_COUNT, request, MessageType::COUNT);
    return ParseReply(MessageType::COUNT, [&]() {
        return body.at("count").get<int64_t>();
    });
}

RecordBatch SyncClient::FetchRecords(const std::string& table, int64_t limit, int64_t offset) {
    RequestPayload request;
    request.table = table;
    request.limit = limit;
    request.offset = offset;
    nlohmann::json body = Request(MessageType::FETCH_RECORDS, request, MessageType::RECORDS);
    return ParseReply(MessageType::RECORDS, [&]() {
        return RecordBatch::FromJson(body);
    });
}

//===----------------------------------------------------------------------===//
// Transfers
//===----------------------------------------------------------------------===//

TransferResult SyncClient::Transfer(DataImporter& importer, const std::string& table,
                                    const TransferOptions& options) {
    if (!SchemaInspector::IsValidIdentifier(table)) {
        throw SyncException(ErrorCode::INVALID_IDENTIFIER, "invalid table name: " + table, table);
    }

    ScopedLogContext log_context(session_code_, receiver_id_);

    TransferHistory* history = options.history;
    uint64_t history_id = options.history_id;
    if (history && history_id == 0) {
        history_id = history->Create(table, session_code_, options.strategy);
    }
    if (history) {
        history->Start(history_id);
    }

    try {
        return RunTransfer(importer, table, options, history_id);
    } catch (const SyncException& e) {
        if (history) {
            history->Fail(history_id, e.Code(), e.Detail());
        }
        throw;
    } catch (const std::exception& e) {
        if (history) {
            history->Fail(history_id, ErrorCode::INTERNAL_ERROR, e.what());
        }
        throw;
    }
}

TransferResult SyncClient::RunTransfer(DataImporter& importer, const std::string& table,
                                       const TransferOptions& options, uint64_t history_id) {
    TransferScope scope(state_);

    if (!importer.TableExists(table)) {
        if (!options.create_missing_tables) {
            throw SyncException(ErrorCode::TABLE_NOT_FOUND, "table " + table + " does not exist locally", table);
        }
        TableSchema schema = GetSchema(table);
        importer.CreateTable(table, schema);
    }

    uint32_t batch_size = options.batch_size == 0 ? DEFAULT_BATCH_SIZE : options.batch_size;

    TransferResult total;
    int64_t offset = 0;
    uint64_t page = 0;
    while (true) {
        RecordBatch batch = FetchRecords(table, batch_size, offset);
        if (batch.records.empty()) {
            break;
        }

        total.Merge(importer.ImportRecords(table, batch.records, options.strategy));
        page++;
        offset += static_cast<int64_t>(batch.Size());

        if (options.history) {
            options.history->UpdateProgress(history_id, page, offset, total);
        }
        if (options.on_progress) {
            TransferProgress progress;
            progress.table = table;
            progress.page = page;
            progress.offset = offset - static_cast<int64_t>(batch.Size());
            progress.records_in_page = batch.Size();
            progress.result = total;
            options.on_progress(progress);
        }

        if (!batch.has_more) {
            break;
        }
    }

    if (options.history) {
        options.history->Complete(history_id, page, total);
    }
    LOG_INFO("client", "Transferred " + table + " [" + ConflictStrategyToString(options.strategy) + "] in " +
             std::to_string(page) + " page(s): " + total.Summary());
    return total;
}

std::map<std::string, TableOutcome> SyncClient::TransferAll(DataImporter& importer,
                                                            const TransferAllOptions& options) {
    std::vector<std::string> tables = options.tables;
    if (tables.empty()) {
        for (const auto& info : ListTables()) {
            tables.push_back(info.name);
        }
    }

    std::map<std::string, TableOutcome> outcomes;
    for (const auto& table : tables) {
        TransferOptions per_table;
        auto strategy = options.strategies.find(table);
        per_table.strategy = strategy != options.strategies.end() ? strategy->second : options.default_strategy;
        per_table.batch_size = options.batch_size;
        per_table.create_missing_tables = options.create_missing_tables;
        per_table.on_progress = options.on_progress;
        per_table.history = options.history;

        TableOutcome outcome;
        try {
            outcome.result = Transfer(importer, table, per_table);
            outcome.ok = true;
        } catch (const SyncException& e) {
            outcome.error = e.Code();
            outcome.message = e.Detail();
            LOG_WARN("client", "Transfer of " + table + " failed: " + e.what());
        } catch (const std::exception& e) {
            outcome.error = ErrorCode::INTERNAL_ERROR;
            outcome.message = e.what();
            LOG_WARN("client", "Transfer of " + table + " failed: " + e.what());
        }
        outcomes[table] = std::move(outcome);
    }
    return outcomes;
}

//===----------------------------------------------------------------------===//
// Channel (runs on the IO thread)
//===----------------------------------------------------------------------===//

void SyncClient::Write(const Message& message) {
    auto data = std::make_shared<std::vector<uint8_t>>(message.Serialize());
    asio::post(io_context_, [this, data]() {
        if (!channel_open_) {
            return;
        }
        asio::error_code ec;
        asio::write(socket_, asio::buffer(*data), ec);
        if (ec) {
            OnChannelClosed("write failed: " + ec.message());
        }
    });
}

void SyncClient::DoReadHeader() {
    asio::async_read(socket_, asio::buffer(header_buffer_),
        [this](const asio::error_code& ec, size_t) {
            if (ec) {
                OnChannelClosed(ec == asio::error::eof ? "sender closed the connection" : ec.message());
                return;
            }

            std::memcpy(&current_message_.GetHeader(), header_buffer_.data(), MessageHeader::SIZE);
            if (!current_message_.IsValid()) {
                OnChannelClosed("invalid frame header");
                return;
            }

            if (current_message_.GetPayloadLength() > 0) {
                current_message_.GetPayload().resize(current_message_.GetPayloadLength());
                DoReadPayload();
            } else {
                Dispatch(std::move(current_message_));
                current_message_ = Message();
                DoReadHeader();
            }
        });
}

void SyncClient::DoReadPayload() {
    asio::async_read(socket_, asio::buffer(current_message_.GetPayload()),
        [this](const asio::error_code& ec, size_t) {
            if (ec) {
                OnChannelClosed(ec == asio::error::eof ? "sender closed the connection" : ec.message());
                return;
            }
            Dispatch(std::move(current_message_));
            current_message_ = Message();
            DoReadHeader();
        });
}

void SyncClient::Dispatch(Message message) {
    uint64_t ref = 0;
    if (message.GetPayloadLength() > 0) {
        try {
            ref = RequestPayload::FromJson(message.PayloadJson()).ref;
        } catch (const SyncException& e) {
            LOG_WARN("client", "Dropping unreadable " + std::string(MessageTypeToString(message.GetType())) +
                     ": " + e.Detail());
            return;
        }
    }

    if (message.GetType() == MessageType::PONG) {
        return;
    }

    std::shared_ptr<std::promise<Message>> waiter;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(ref);
        if (it != pending_.end()) {
            waiter = it->second;
            pending_.erase(it);
        }
    }

    if (!waiter) {
        // Reply to a request that already timed out
        LOG_DEBUG("client", "Discarding late " + std::string(MessageTypeToString(message.GetType())) +
                  " for ref " + std::to_string(ref));
        return;
    }
    waiter->set_value(std::move(message));
}

void SyncClient::FailPending(ErrorCode code, const std::string& reason) {
    std::map<uint64_t, std::shared_ptr<std::promise<Message>>> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_reason_.empty()) {
            closed_reason_ = reason;
        }
        failed.swap(pending_);
    }
    for (auto& entry : failed) {
        entry.second->set_exception(std::make_exception_ptr(SyncException(code, reason)));
    }
}

void SyncClient::OnChannelClosed(const std::string& reason) {
    if (!channel_open_.exchange(false)) {
        return;
    }

    LOG_WARN("client", "Connection to sender lost: " + reason);

    heartbeat_timer_.cancel();
    asio::error_code ignored;
    socket_.close(ignored);

    state_ = ClientState::DISCONNECTED;
    FailPending(ErrorCode::DISCONNECTED, reason);
}

void SyncClient::ScheduleHeartbeat() {
    if (options_.heartbeat_interval_ms == 0 || !channel_open_) {
        return;
    }

    heartbeat_timer_.expires_after(std::chrono::milliseconds(options_.heartbeat_interval_ms));
    heartbeat_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || !channel_open_) {
            return;
        }

        RequestPayload ping;
        ping.ref = NextRef();
        auto data = Message::FromJson(MessageType::PING, ping.ToJson()).Serialize();
        asio::error_code write_ec;
        asio::write(socket_, asio::buffer(data), write_ec);
        if (write_ec) {
            OnChannelClosed("heartbeat failed: " + write_ec.message());
            return;
        }
        ScheduleHeartbeat();
    });
}

} // namespace peersync
