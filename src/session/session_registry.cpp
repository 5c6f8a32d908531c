//===----------------------------------------------------------------------===//
//                         PeerSync
//
// session/session_registry.cpp
//
// Session registry implementation
//===----------------------------------------------------------------------===//

#include "session/session_registry.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstring>
#include <random>

namespace peersync {

// No 0/O, 1/I/L
const char SessionRegistry::CODE_ALPHABET[] = "23456789ABCDEFGHJKMNPQRSTUVWXYZ";

//===----------------------------------------------------------------------===//
// SessionLease
//===----------------------------------------------------------------------===//

SessionLease::SessionLease(std::weak_ptr<SessionRegistry> registry, std::string code)
    : registry_(std::move(registry))
    , code_(std::move(code)) {}

SessionLease::~SessionLease() {
    if (auto registry = registry_.lock()) {
        registry->DeleteSession(code_);
    }
}

//===----------------------------------------------------------------------===//
// SessionRegistry
//===----------------------------------------------------------------------===//

SessionRegistry::SessionRegistry(const Config& config_p)
    : config_(config_p) {
    if (config_.start_sweeper) {
        StartSweeper();
    }
}

SessionRegistry::~SessionRegistry() {
    sweeper_running_ = false;
    sweeper_cv_.notify_all();
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

bool SessionRegistry::IsWellFormedCode(const std::string& code) {
    if (code.size() != SESSION_CODE_LENGTH) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](char c) {
        return c != '\0' && std::strchr(CODE_ALPHABET, c) != nullptr;
    });
}

std::string SessionRegistry::GenerateCode() {
    static thread_local std::random_device rd;
    std::uniform_int_distribution<size_t> dist(0, sizeof(CODE_ALPHABET) - 2);

    std::string code(SESSION_CODE_LENGTH, ' ');
    for (auto& c : code) {
        c = CODE_ALPHABET[dist(rd)];
    }
    return code;
}

Session SessionRegistry::NewSession(SessionDirection direction, bool owned) {
    Session session;
    session.direction = direction;
    session.status = SessionStatus::PENDING;
    session.created_at = WallClock::now();
    session.created_mono = Clock::now();
    session.owned = owned;

    // 31^8 codes; a collision with a live or retired code just draws again
    while (true) {
        session.code = GenerateCode();
        if (retired_.contains(session.code)) {
            continue;
        }
        if (sessions_.emplace(session.code, session).second) {
            break;
        }
    }

    total_sessions_created_++;
    LOG_INFO("session_registry", "Created " + std::string(SessionDirectionToString(direction)) +
             " session " + session.code + " (active: " + std::to_string(sessions_.size()) + ")");
    return session;
}

Session SessionRegistry::CreateSession(SessionDirection direction) {
    return NewSession(direction, false);
}

std::unique_ptr<SessionLease> SessionRegistry::OpenSession(SessionDirection direction) {
    Session session = NewSession(direction, true);
    return std::unique_ptr<SessionLease>(new SessionLease(weak_from_this(), session.code));
}

std::optional<Session> SessionRegistry::GetSession(const std::string& code) const {
    std::optional<Session> result;
    sessions_.if_contains(code, [&result](const auto& item) {
        result = item.second;
    });
    return result;
}

AttachResult SessionRegistry::ValidateAndAttach(const std::string& code, ReceiverInfo receiver) {
    AttachResult result;

    if (!IsWellFormedCode(code)) {
        result.error = ErrorCode::INVALID_CODE;
        return result;
    }

    receiver.receiver_id = next_receiver_id_.fetch_add(1);
    receiver.attached_at = WallClock::now();

    bool found = sessions_.modify_if(code, [&](auto& item) {
        Session& session = item.second;
        if (session.status == SessionStatus::CLOSED) {
            result.error = ErrorCode::SESSION_CLOSED;
            return;
        }
        session.status = SessionStatus::CONNECTED;
        session.receivers.push_back(receiver);
        result.session = session;
        result.receiver_id = receiver.receiver_id;
    });

    if (!found) {
        result.error = retired_.contains(code) ? ErrorCode::SESSION_CLOSED : ErrorCode::INVALID_CODE;
        LOG_DEBUG("session_registry", "Rejected attach to " + code + ": " + ErrorCodeToString(result.error));
        return result;
    }
    if (!result.Ok()) {
        LOG_DEBUG("session_registry", "Rejected attach to closed session " + code);
        return result;
    }

    total_attaches_++;
    LOG_INFO("session_registry", "Receiver " + std::to_string(receiver.receiver_id) +
             " (" + (receiver.name.empty() ? receiver.remote_ip : receiver.name) +
             ") attached to session " + code);
    Emit({SessionEventType::RECEIVER_ATTACHED, code, receiver});
    return result;
}

bool SessionRegistry::DetachReceiver(const std::string& code, uint64_t receiver_id) {
    ReceiverInfo detached;
    bool removed = false;

    sessions_.modify_if(code, [&](auto& item) {
        auto& receivers = item.second.receivers;
        auto it = std::find_if(receivers.begin(), receivers.end(),
                               [receiver_id](const ReceiverInfo& r) { return r.receiver_id == receiver_id; });
        if (it != receivers.end()) {
            detached = *it;
            receivers.erase(it);
            removed = true;
        }
    });

    if (removed) {
        LOG_INFO("session_registry", "Receiver " + std::to_string(receiver_id) +
                 " detached from session " + code);
        Emit({SessionEventType::RECEIVER_DETACHED, code, detached});
    }
    return removed;
}

bool SessionRegistry::CloseSession(const std::string& code) {
    bool changed = false;
    sessions_.modify_if(code, [&changed](auto& item) {
        if (item.second.status != SessionStatus::CLOSED) {
            item.second.status = SessionStatus::CLOSED;
            changed = true;
        }
    });

    if (changed) {
        LOG_INFO("session_registry", "Closed session " + code);
        Emit({SessionEventType::SESSION_CLOSED, code, {}});
    }
    return changed;
}

bool SessionRegistry::DeleteSession(const std::string& code) {
    retired_.insert(code);
    if (sessions_.erase(code) == 0) {
        return false;
    }

    LOG_INFO("session_registry", "Ended session " + code +
             " (active: " + std::to_string(sessions_.size()) + ")");
    Emit({SessionEventType::SESSION_ENDED, code, {}});
    return true;
}

size_t SessionRegistry::EndAll() {
    std::vector<std::string> codes;
    sessions_.for_each([&codes](const auto& item) {
        codes.push_back(item.first);
    });

    size_t ended = 0;
    for (const auto& code : codes) {
        if (DeleteSession(code)) {
            ended++;
        }
    }

    if (ended > 0) {
        LOG_INFO("session_registry", "Ended all sessions (" + std::to_string(ended) + ")");
    }
    return ended;
}

bool SessionRegistry::IsLive(const std::string& code) const {
    bool live = false;
    sessions_.if_contains(code, [&live](const auto& item) {
        live = item.second.IsLive();
    });
    return live;
}

std::vector<Session> SessionRegistry::ListActive() const {
    std::vector<Session> result;
    sessions_.for_each([&result](const auto& item) {
        if (item.second.IsLive()) {
            result.push_back(item.second);
        }
    });
    std::sort(result.begin(), result.end(), [](const Session& a, const Session& b) {
        return a.created_mono < b.created_mono;
    });
    return result;
}

size_t SessionRegistry::CountActive() const {
    size_t count = 0;
    sessions_.for_each([&count](const auto& item) {
        if (item.second.IsLive()) {
            count++;
        }
    });
    return count;
}

size_t SessionRegistry::CleanupExpired(std::chrono::hours max_age) {
    auto cutoff = Clock::now() - max_age;
    std::vector<std::string> expired;

    sessions_.for_each([&](const auto& item) {
        if (!item.second.owned && item.second.created_mono <= cutoff) {
            expired.push_back(item.first);
        }
    });

    for (const auto& code : expired) {
        DeleteSession(code);
    }

    if (!expired.empty()) {
        LOG_INFO("session_registry", "Swept " + std::to_string(expired.size()) + " expired sessions");
    }
    return expired.size();
}

void SessionRegistry::SetListener(SessionListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void SessionRegistry::Emit(const SessionEvent& event) {
    SessionListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(event);
    }
}

void SessionRegistry::StartSweeper() {
    sweeper_running_ = true;

    sweeper_thread_ = std::thread([this]() {
        while (sweeper_running_) {
            {
                std::unique_lock<std::mutex> lock(sweeper_mutex_);
                sweeper_cv_.wait_for(lock, config_.sweep_interval,
                                     [this] { return !sweeper_running_.load(); });
            }
            if (!sweeper_running_) break;

            CleanupExpired(config_.max_age);
        }
    });
}

} // namespace peersync
