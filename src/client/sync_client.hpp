//===----------------------------------------------------------------------===//
//                         PeerSync
//
// client/sync_client.hpp
//
// Receiver-side client: joins a sender session and drives table transfers
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include "exporter/record_batch.hpp"
#include "importer/conflict_strategy.hpp"
#include "importer/transfer_result.hpp"
#include "history/transfer_history.hpp"
#include "schema/table_schema.hpp"
#include <asio.hpp>
#include <array>
#include <future>
#include <map>

namespace peersync {

enum class ClientState : uint8_t {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    TRANSFERRING
};

const char* ClientStateToString(ClientState state);

struct ConnectOptions {
    uint32_t timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;
    uint32_t heartbeat_interval_ms = DEFAULT_HEARTBEAT_INTERVAL_MS;  // 0 disables
    ReceiverInfo receiver;
};

struct TransferProgress {
    std::string table;
    uint64_t page = 0;
    int64_t offset = 0;
    size_t records_in_page = 0;
    TransferResult result;  // running totals
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct TransferOptions {
    ConflictStrategy strategy = ConflictStrategy::SKIP;
    uint32_t batch_size = DEFAULT_BATCH_SIZE;
    bool create_missing_tables = true;
    ProgressCallback on_progress;

    // When set, the transfer is recorded there. A nonzero history_id continues
    // that record instead of opening a new one.
    TransferHistory* history = nullptr;
    uint64_t history_id = 0;
};

struct TransferAllOptions {
    // Empty means every table the sender lists
    std::vector<std::string> tables;
    ConflictStrategy default_strategy = ConflictStrategy::SKIP;
    std::map<std::string, ConflictStrategy> strategies;
    uint32_t batch_size = DEFAULT_BATCH_SIZE;
    bool create_missing_tables = true;
    ProgressCallback on_progress;
    TransferHistory* history = nullptr;
};

struct TableOutcome {
    bool ok = false;
    TransferResult result;
    ErrorCode error = ErrorCode::OK;
    std::string message;
};

class SyncClient {
public:
    // url is "host:port" or "tcp://host:port". Throws SyncException:
    // INVALID_CODE, SESSION_CLOSED, CONNECTION_TIMEOUT or DISCONNECTED.
    static std::unique_ptr<SyncClient> Connect(const std::string& url,
                                               const std::string& code,
                                               const ConnectOptions& options = ConnectOptions{});

    ~SyncClient();

    SyncClient(const SyncClient&) = delete;
    SyncClient& operator=(const SyncClient&) = delete;

    //===------------------------------------------------------------------===//
    // Requests. One at a time; each waits up to the configured timeout.
    //===------------------------------------------------------------------===//
    nlohmann::json GetCapabilities();
    std::vector<TableInfo> ListTables();
    TableSchema GetSchema(const std::string& table);
    int64_t GetCount(const std::string& table);
    RecordBatch FetchRecords(const std::string& table, int64_t limit, int64_t offset);

    //===------------------------------------------------------------------===//
    // Transfers
    //===------------------------------------------------------------------===//

    // Pages through the remote table into the local one. Throws
    // SyncException; pages imported before the failure stay applied.
    TransferResult Transfer(DataImporter& importer, const std::string& table,
                            const TransferOptions& options = TransferOptions{});

    // Sequential per table; a failing table is recorded and the rest still run
    std::map<std::string, TableOutcome> TransferAll(DataImporter& importer,
                                                    const TransferAllOptions& options = TransferAllOptions{});

    // Best effort; always succeeds locally
    void Disconnect();

    ClientState GetState() const { return state_; }
    bool IsConnected() const;
    const std::string& GetSessionCode() const { return session_code_; }
    uint64_t GetReceiverId() const { return receiver_id_; }
    const nlohmann::json& GetServerInfo() const { return server_info_; }

    static bool ParseUrl(const std::string& url, std::string& host, uint16_t& port);

private:
    explicit SyncClient(const ConnectOptions& options);

    void Open(const std::string& host, uint16_t port, const std::string& code);

    // Sends and waits for the reply carrying the same ref
    nlohmann::json Request(MessageType type, RequestPayload request, MessageType expected);
    Message Exchange(MessageType type, const nlohmann::json& body, uint64_t ref);

    void Write(const Message& message);
    void DoReadHeader();
    void DoReadPayload();
    void Dispatch(Message message);
    void FailPending(ErrorCode code, const std::string& reason);
    void OnChannelClosed(const std::string& reason);
    void ScheduleHeartbeat();
    TransferResult RunTransfer(DataImporter& importer, const std::string& table,
                               const TransferOptions& options, uint64_t history_id);

    uint64_t NextRef() { return next_ref_.fetch_add(1); }

private:
    ConnectOptions options_;

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer heartbeat_timer_;
    std::thread io_thread_;

    std::array<uint8_t, MessageHeader::SIZE> header_buffer_;
    Message current_message_;

    std::mutex pending_mutex_;
    std::map<uint64_t, std::shared_ptr<std::promise<Message>>> pending_;
    std::string closed_reason_;

    std::mutex request_mutex_;
    std::atomic<ClientState> state_;
    std::atomic<bool> channel_open_;
    std::atomic<uint64_t> next_ref_;

    std::string session_code_;
    uint64_t receiver_id_;
    nlohmann::json server_info_;
};

} // namespace peersync
