//===----------------------------------------------------------------------===//
//                         PeerSync
//
// session/session_registry.hpp
//
// In-memory registry of sender sessions keyed by one-time connection code
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/session.hpp"
#include "protocol/message_types.hpp"
#include <parallel_hashmap/phmap.h>
#include <optional>

namespace peersync {

class SessionRegistry;

//===----------------------------------------------------------------------===//
// SessionLease - owner handle; the session is deleted when the lease dies
//===----------------------------------------------------------------------===//
class SessionLease {
public:
    ~SessionLease();

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    const std::string& Code() const { return code_; }

private:
    friend class SessionRegistry;
    SessionLease(std::weak_ptr<SessionRegistry> registry, std::string code);

    std::weak_ptr<SessionRegistry> registry_;
    std::string code_;
};

//===----------------------------------------------------------------------===//
// Session events, delivered outside of any registry lock
//===----------------------------------------------------------------------===//
enum class SessionEventType : uint8_t {
    RECEIVER_ATTACHED,
    RECEIVER_DETACHED,
    SESSION_CLOSED,
    SESSION_ENDED
};

struct SessionEvent {
    SessionEventType type;
    std::string code;
    ReceiverInfo receiver;  // set for attach/detach
};

using SessionListener = std::function<void(const SessionEvent&)>;

struct AttachResult {
    ErrorCode error = ErrorCode::OK;
    Session session;
    uint64_t receiver_id = 0;

    bool Ok() const { return error == ErrorCode::OK; }
};

class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
public:
    struct Config {
        // Ownerless sessions older than this are swept
        std::chrono::hours max_age;
        std::chrono::seconds sweep_interval;
        bool start_sweeper;

        Config()
            : max_age(DEFAULT_SESSION_MAX_AGE_HOURS)
            , sweep_interval(60)
            , start_sweeper(true) {}
    };

    static const char CODE_ALPHABET[];

    explicit SessionRegistry(const Config& config_p = Config{});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Ownerless session; lives until deleted, ended or swept
    Session CreateSession(SessionDirection direction);

    // Session bound to the returned lease. Requires shared_ptr ownership.
    std::unique_ptr<SessionLease> OpenSession(SessionDirection direction);

    std::optional<Session> GetSession(const std::string& code) const;

    // INVALID_CODE for unknown codes, SESSION_CLOSED for closed or retired ones
    AttachResult ValidateAndAttach(const std::string& code, ReceiverInfo receiver);

    bool DetachReceiver(const std::string& code, uint64_t receiver_id);

    // Mark closed; the code is kept so late joins get SESSION_CLOSED
    bool CloseSession(const std::string& code);

    // Remove and retire the code
    bool DeleteSession(const std::string& code);

    // Delete every session
    size_t EndAll();

    // True when the session exists and is not closed
    bool IsLive(const std::string& code) const;

    std::vector<Session> ListActive() const;
    size_t CountActive() const;

    size_t CleanupExpired(std::chrono::hours max_age);

    void SetListener(SessionListener listener);

    uint64_t GetTotalSessionsCreated() const { return total_sessions_created_; }
    uint64_t GetTotalAttaches() const { return total_attaches_; }

    static bool IsWellFormedCode(const std::string& code);

private:
    std::string GenerateCode();
    Session NewSession(SessionDirection direction, bool owned);
    void Emit(const SessionEvent& event);
    void StartSweeper();

private:
    Config config_;

    // Sharded map; each submap has its own mutex, giving one writer per code
    phmap::parallel_flat_hash_map<
        std::string,
        Session,
        phmap::priv::hash_default_hash<std::string>,
        phmap::priv::hash_default_eq<std::string>,
        phmap::priv::Allocator<phmap::priv::Pair<const std::string, Session>>,
        4,
        std::mutex
    > sessions_;

    // Deleted codes are never handed out again, so this set only grows.
    // One 8-character string per session ever created in this process.
    phmap::parallel_flat_hash_set<
        std::string,
        phmap::priv::hash_default_hash<std::string>,
        phmap::priv::hash_default_eq<std::string>,
        phmap::priv::Allocator<std::string>,
        4,
        std::mutex
    > retired_;

    std::mutex listener_mutex_;
    SessionListener listener_;

    std::atomic<uint64_t> next_receiver_id_{1};
    std::atomic<uint64_t> total_sessions_created_{0};
    std::atomic<uint64_t> total_attaches_{0};

    std::atomic<bool> sweeper_running_{false};
    std::thread sweeper_thread_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
};

} // namespace peersync
