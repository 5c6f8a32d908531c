//===----------------------------------------------------------------------===//
//                         PeerSync
//
// history/transfer_history.cpp
//
// Transfer history implementation
//===----------------------------------------------------------------------===//

#include "history/transfer_history.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <map>

namespace peersync {

namespace {

// Records are kept in ascending id order
template <typename Records>
auto FindRecord(Records& records, uint64_t id) -> decltype(&records.front()) {
    auto it = std::lower_bound(records.begin(), records.end(), id,
        [](const TransferRecord& record, uint64_t value) { return record.id < value; });
    if (it == records.end() || it->id != id) {
        return nullptr;
    }
    return &*it;
}

} // anonymous namespace

const char* TransferStateToString(TransferState state) {
    switch (state) {
        case TransferState::PENDING:     return "pending";
        case TransferState::IN_PROGRESS: return "in_progress";
        case TransferState::COMPLETED:   return "completed";
        case TransferState::FAILED:      return "failed";
    }
    return "unknown";
}

nlohmann::json TransferRecord::ToJson() const {
    nlohmann::json j = {
        {"id", id},
        {"table", table},
        {"session_code", session_code},
        {"strategy", ConflictStrategyToString(strategy)},
        {"state", TransferStateToString(state)},
        {"attempts", attempts},
        {"pages", pages},
        {"records_transferred", records_transferred},
        {"created", created},
        {"updated", updated},
        {"skipped", skipped},
        {"failed", failed},
        {"created_at", FormatIso8601(created_at)}
    };
    if (started_at) {
        j["started_at"] = FormatIso8601(*started_at);
    }
    if (completed_at) {
        j["completed_at"] = FormatIso8601(*completed_at);
    }
    if (error != ErrorCode::OK) {
        j["error"] = ErrorCodeToString(error);
        j["error_message"] = error_message;
    }
    return j;
}

TransferHistory::TransferHistory(const Config& config_p)
    : config(config_p) {
}

uint64_t TransferHistory::Create(const std::string& table, const std::string& session_code,
                                 ConflictStrategy strategy) {
    std::lock_guard<std::mutex> lock(mutex);

    TransferRecord record;
    record.id = next_id++;
    record.table = table;
    record.session_code = session_code;
    record.strategy = strategy;
    record.created_at = WallClock::now();
    records.push_back(std::move(record));

    Prune();
    return records.back().id;
}

void TransferHistory::Start(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex);
    TransferRecord* record = FindRecord(records, id);
    if (!record) {
        return;
    }
    record->state = TransferState::IN_PROGRESS;
    record->attempts++;
    record->pages = 0;
    record->records_transferred = 0;
    record->created = record->updated = record->skipped = record->failed = 0;
    record->error = ErrorCode::OK;
    record->error_message.clear();
    record->completed_at.reset();
    if (!record->started_at) {
        record->started_at = WallClock::now();
    }
}

void TransferHistory::UpdateProgress(uint64_t id, uint64_t pages, int64_t records_transferred,
                                     const TransferResult& totals) {
    std::lock_guard<std::mutex> lock(mutex);
    TransferRecord* record = FindRecord(records, id);
    if (!record) {
        return;
    }
    record->pages = pages;
    record->records_transferred = records_transferred;
    record->created = totals.created;
    record->updated = totals.updated;
    record->skipped = totals.skipped;
    record->failed = static_cast<int64_t>(totals.errors.size());
}

void TransferHistory::Complete(uint64_t id, uint64_t pages, const TransferResult& totals) {
    std::lock_guard<std::mutex> lock(mutex);
    TransferRecord* record = FindRecord(records, id);
    if (!record) {
        return;
    }
    record->state = TransferState::COMPLETED;
    record->pages = pages;
    record->records_transferred = totals.Processed();
    record->created = totals.created;
    record->updated = totals.updated;
    record->skipped = totals.skipped;
    record->failed = static_cast<int64_t>(totals.errors.size());
    record->completed_at = WallClock::now();
}

void TransferHistory::Fail(uint64_t id, ErrorCode error, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    TransferRecord* record = FindRecord(records, id);
    if (!record) {
        return;
    }
    record->state = TransferState::FAILED;
    record->error = error;
    record->error_message = message;
    record->completed_at = WallClock::now();
}

std::optional<TransferRecord> TransferHistory::Get(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const TransferRecord* record = FindRecord(records, id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::vector<TransferRecord> TransferHistory::Recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<TransferRecord> result;
    for (auto it = records.rbegin(); it != records.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::vector<TransferRecord> TransferHistory::Active() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<TransferRecord> result;
    for (const auto& record : records) {
        if (record.state == TransferState::IN_PROGRESS) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<TableTransferStats> TransferHistory::TableStats() const {
    std::map<std::string, TableTransferStats> by_table;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& record : records) {
            if (record.state != TransferState::COMPLETED) {
                continue;
            }
            TableTransferStats& stats = by_table[record.table];
            stats.table = record.table;
            stats.transfers++;
            stats.created += record.created;
            stats.updated += record.updated;
            stats.skipped += record.skipped;
            stats.failed += record.failed;
            if (!stats.last_completed_at || *record.completed_at > *stats.last_completed_at) {
                stats.last_completed_at = record.completed_at;
            }
        }
    }

    std::vector<TableTransferStats> result;
    for (auto& entry : by_table) {
        result.push_back(std::move(entry.second));
    }
    std::stable_sort(result.begin(), result.end(),
        [](const TableTransferStats& a, const TableTransferStats& b) { return a.transfers > b.transfers; });
    return result;
}

size_t TransferHistory::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return records.size();
}

// Unfinished records are kept whatever their age
void TransferHistory::Prune() {
    size_t dropped = 0;
    auto it = records.begin();
    while (records.size() > config.max_records && it != records.end()) {
        if (it->IsFinished()) {
            it = records.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    if (dropped > 0) {
        LOG_DEBUG("history", "Dropped " + std::to_string(dropped) + " old transfer record(s)");
    }
}

} // namespace peersync
