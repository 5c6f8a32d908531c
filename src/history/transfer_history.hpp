//===----------------------------------------------------------------------===//
//                         PeerSync
//
// history/transfer_history.hpp
//
// Receiver-side record of table transfers, foreground and background
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "importer/conflict_strategy.hpp"
#include "importer/transfer_result.hpp"
#include "protocol/message_types.hpp"
#include <deque>
#include <optional>

namespace peersync {

enum class TransferState : uint8_t {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

const char* TransferStateToString(TransferState state);

struct TransferRecord {
    uint64_t id = 0;
    std::string table;
    std::string session_code;
    ConflictStrategy strategy = ConflictStrategy::SKIP;
    TransferState state = TransferState::PENDING;

    uint32_t attempts = 0;
    uint64_t pages = 0;
    int64_t records_transferred = 0;
    int64_t created = 0;
    int64_t updated = 0;
    int64_t skipped = 0;
    int64_t failed = 0;

    ErrorCode error = ErrorCode::OK;
    std::string error_message;

    WallClock::time_point created_at;
    std::optional<WallClock::time_point> started_at;
    std::optional<WallClock::time_point> completed_at;

    bool IsFinished() const {
        return state == TransferState::COMPLETED || state == TransferState::FAILED;
    }

    nlohmann::json ToJson() const;
};

// Completed transfers of one table, summed
struct TableTransferStats {
    std::string table;
    uint64_t transfers = 0;
    int64_t created = 0;
    int64_t updated = 0;
    int64_t skipped = 0;
    int64_t failed = 0;
    std::optional<WallClock::time_point> last_completed_at;
};

class TransferHistory {
public:
    struct Config {
        // Oldest finished records are dropped past this many
        size_t max_records;

        Config() : max_records(1000) {}
    };

    explicit TransferHistory(const Config& config_p = Config{});

    TransferHistory(const TransferHistory&) = delete;
    TransferHistory& operator=(const TransferHistory&) = delete;

    uint64_t Create(const std::string& table, const std::string& session_code, ConflictStrategy strategy);

    // Counters restart with each attempt, since a transfer re-reads from the first page.
    // Unknown ids are ignored.
    void Start(uint64_t id);
    void UpdateProgress(uint64_t id, uint64_t pages, int64_t records_transferred, const TransferResult& totals);
    void Complete(uint64_t id, uint64_t pages, const TransferResult& totals);
    void Fail(uint64_t id, ErrorCode error, const std::string& message);

    std::optional<TransferRecord> Get(uint64_t id) const;

    // Newest first
    std::vector<TransferRecord> Recent(size_t limit = 10) const;
    std::vector<TransferRecord> Active() const;

    // Most transferred table first
    std::vector<TableTransferStats> TableStats() const;

    size_t Size() const;

private:
    void Prune();

private:
    Config config;

    mutable std::mutex mutex;
    std::deque<TransferRecord> records;  // ascending id
    uint64_t next_id = 1;
};

} // namespace peersync
