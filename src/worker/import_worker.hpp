//===----------------------------------------------------------------------===//
//                         PeerSync
//
// worker/import_worker.hpp
//
// Background table transfers with retry on transport failures
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "client/sync_client.hpp"
#include "executor/executor_pool.hpp"
#include "history/transfer_history.hpp"
#include <parallel_hashmap/phmap.h>
#include <optional>

namespace peersync {

struct ImportJob {
    std::string table;
    ConflictStrategy strategy = ConflictStrategy::SKIP;
    bool create_missing_tables = true;
    uint32_t batch_size = DEFAULT_BATCH_SIZE;
    std::string session_code;  // originating session, for logs and status
};

enum class JobState : uint8_t {
    QUEUED,
    RUNNING,
    COMPLETED,
    FAILED
};

const char* JobStateToString(JobState state);

struct JobStatus {
    uint64_t id = 0;
    ImportJob job;
    JobState state = JobState::QUEUED;
    uint32_t attempts = 0;
    TransferResult result;
    ErrorCode error = ErrorCode::OK;
    std::string error_message;
    uint64_t history_id = 0;  // 0 when no history is kept
    TimePoint finished_at{};
};

// Opens a fresh client for each attempt
using ClientFactory = std::function<std::unique_ptr<SyncClient>()>;

class ImportWorker {
public:
    struct Config {
        uint32_t max_attempts;
        std::chrono::milliseconds retry_backoff;
        size_t threads;  // 1 keeps background transfers sequential
        // Finished jobs are forgotten this long after they end
        std::chrono::milliseconds job_retention;

        Config()
            : max_attempts(3)
            , retry_backoff(1000)
            , threads(1)
            , job_retention(std::chrono::hours(1)) {}
    };

    ImportWorker(ClientFactory factory, DataImporter& importer, const Config& config_p = Config{},
                 TransferHistory* history = nullptr);
    ~ImportWorker();

    ImportWorker(const ImportWorker&) = delete;
    ImportWorker& operator=(const ImportWorker&) = delete;

    // Returns the job id at once; the transfer runs in the background
    uint64_t Submit(const ImportJob& job);

    std::optional<JobStatus> GetStatus(uint64_t id) const;

    // Blocks until the job completes or fails, or the timeout passes
    std::optional<JobStatus> WaitFor(uint64_t id, std::chrono::milliseconds timeout) const;

    // Finishes queued jobs, then stops
    void Shutdown();

    // Drops finished jobs older than the retention; returns how many
    size_t PruneFinished();
    size_t JobCount() const { return jobs_.size(); }

private:
    void Run(uint64_t id);
    void Update(uint64_t id, const std::function<void(JobStatus&)>& fn);
    void Finish(uint64_t id, const std::function<void(JobStatus&)>& fn);

private:
    ClientFactory factory_;
    DataImporter& importer_;
    Config config_;
    TransferHistory* history_;
    ExecutorPool pool_;

    phmap::parallel_flat_hash_map<
        uint64_t,
        JobStatus,
        phmap::priv::hash_default_hash<uint64_t>,
        phmap::priv::hash_default_eq<uint64_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const uint64_t, JobStatus>>,
        4,
        std::mutex
    > jobs_;

    mutable std::mutex done_mutex_;
    mutable std::condition_variable done_cv_;

    std::atomic<uint64_t> next_job_id_{1};
};

} // namespace peersync
