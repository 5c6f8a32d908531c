//===----------------------------------------------------------------------===//
//                         PeerSync
//
// worker/import_worker.cpp
//
// Import worker implementation
//===----------------------------------------------------------------------===//

#include "worker/import_worker.hpp"
#include "importer/data_importer.hpp"
#include "sync_exception.hpp"
#include "logging/logger.hpp"

namespace peersync {

const char* JobStateToString(JobState state) {
    switch (state) {
        case JobState::QUEUED:    return "queued";
        case JobState::RUNNING:   return "running";
        case JobState::COMPLETED: return "completed";
        case JobState::FAILED:    return "failed";
    }
    return "unknown";
}

ImportWorker::ImportWorker(ClientFactory factory, DataImporter& importer, const Config& config_p,
                           TransferHistory* history)
    : factory_(std::move(factory))
    , importer_(importer)
    , config_(config_p)
    , history_(history)
    , pool_("import", config_p.threads) {
    pool_.Start();
}

ImportWorker::~ImportWorker() {
    Shutdown();
}

void ImportWorker::Shutdown() {
    pool_.Stop();
}

uint64_t ImportWorker::Submit(const ImportJob& job) {
    PruneFinished();

    uint64_t id = next_job_id_.fetch_add(1);

    JobStatus status;
    status.id = id;
    status.job = job;
    if (history_) {
        status.history_id = history_->Create(job.table, job.session_code, job.strategy);
    }
    uint64_t history_id = status.history_id;
    jobs_.emplace(id, std::move(status));

    if (!pool_.Submit([this, id]() { Run(id); })) {
        Finish(id, [](JobStatus& s) {
            s.state = JobState::FAILED;
            s.error = ErrorCode::INTERNAL_ERROR;
            s.error_message = "worker is shut down";
        });
        if (history_) {
            history_->Fail(history_id, ErrorCode::INTERNAL_ERROR, "worker is shut down");
        }
        return id;
    }

    LOG_INFO("worker", "Queued job " + std::to_string(id) + " for table " + job.table +
             " [" + ConflictStrategyToString(job.strategy) + "]");
    return id;
}

std::optional<JobStatus> ImportWorker::GetStatus(uint64_t id) const {
    std::optional<JobStatus> status;
    jobs_.if_contains(id, [&](const auto& entry) { status = entry.second; });
    return status;
}

std::optional<JobStatus> ImportWorker::WaitFor(uint64_t id, std::chrono::milliseconds timeout) const {
    auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lock(done_mutex_);
    while (true) {
        auto status = GetStatus(id);
        if (!status || status->state == JobState::COMPLETED || status->state == JobState::FAILED) {
            return status;
        }
        if (done_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            return GetStatus(id);
        }
    }
}

void ImportWorker::Update(uint64_t id, const std::function<void(JobStatus&)>& fn) {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        jobs_.modify_if(id, [&](auto& entry) { fn(entry.second); });
    }
    done_cv_.notify_all();
}

void ImportWorker::Finish(uint64_t id, const std::function<void(JobStatus&)>& fn) {
    Update(id, [&fn](JobStatus& s) {
        fn(s);
        s.finished_at = Clock::now();
    });
}

size_t ImportWorker::PruneFinished() {
    auto cutoff = Clock::now() - config_.job_retention;
    std::vector<uint64_t> expired;
    jobs_.for_each([&](const auto& entry) {
        const JobStatus& s = entry.second;
        bool finished = s.state == JobState::COMPLETED || s.state == JobState::FAILED;
        if (finished && s.finished_at <= cutoff) {
            expired.push_back(entry.first);
        }
    });

    // Finished jobs never change again, so erasing by id is safe
    for (uint64_t id : expired) {
        jobs_.erase(id);
    }
    if (!expired.empty()) {
        LOG_DEBUG("worker", "Pruned " + std::to_string(expired.size()) + " finished job(s)");
    }
    return expired.size();
}

void ImportWorker::Run(uint64_t id) {
    auto status = GetStatus(id);
    if (!status) {
        return;
    }
    const ImportJob job = status->job;
    ScopedLogContext log_context(job.session_code, 0);

    TransferOptions options;
    options.strategy = job.strategy;
    options.batch_size = job.batch_size;
    options.create_missing_tables = job.create_missing_tables;
    options.history = history_;
    options.history_id = status->history_id;

    for (uint32_t attempt = 1; attempt <= config_.max_attempts; attempt++) {
        Update(id, [attempt](JobStatus& s) {
            s.state = JobState::RUNNING;
            s.attempts = attempt;
        });

        try {
            auto client = factory_();
            TransferResult result = client->Transfer(importer_, job.table, options);
            client->Disconnect();

            for (const auto& error : result.errors) {
                LOG_WARN("worker", "Job " + std::to_string(id) + " row error in " + job.table + ": " +
                         error.reason + " " + error.record.dump());
            }

            Finish(id, [&result](JobStatus& s) {
                s.state = JobState::COMPLETED;
                s.result = result;
                s.error = ErrorCode::OK;
                s.error_message.clear();
            });
            LOG_INFO("worker", "Job " + std::to_string(id) + " completed: " + result.Summary());
            return;

        } catch (const SyncException& e) {
            bool retry = IsTransportError(e.Code()) && attempt < config_.max_attempts;
            auto record = [&e](JobStatus& s) {
                s.error = e.Code();
                s.error_message = e.Detail();
            };
            if (retry) {
                Update(id, record);
            } else {
                Finish(id, [&record](JobStatus& s) {
                    record(s);
                    s.state = JobState::FAILED;
                });
            }
            // Connect failures never reach the transfer, so record them here too
            if (history_) {
                history_->Fail(options.history_id, e.Code(), e.Detail());
            }

            if (!retry) {
                LOG_ERROR("worker", "Job " + std::to_string(id) + " failed after " + std::to_string(attempt) +
                          " attempt(s): " + e.what());
                return;
            }
            // Restarts from the first page; the conflict strategy absorbs rows already imported
            LOG_WARN("worker", "Job " + std::to_string(id) + " attempt " + std::to_string(attempt) +
                     " failed, retrying: " + e.what());
            std::this_thread::sleep_for(config_.retry_backoff * attempt);

        } catch (const std::exception& e) {
            Finish(id, [&e](JobStatus& s) {
                s.state = JobState::FAILED;
                s.error = ErrorCode::INTERNAL_ERROR;
                s.error_message = e.what();
            });
            if (history_) {
                history_->Fail(options.history_id, ErrorCode::INTERNAL_ERROR, e.what());
            }
            LOG_ERROR("worker", "Job " + std::to_string(id) + " failed: " + e.what());
            return;
        }
    }
}

} // namespace peersync
