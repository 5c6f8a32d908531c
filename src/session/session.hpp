//===----------------------------------------------------------------------===//
//                         PeerSync
//
// session/session.hpp
//
// Sender-side transfer session and attached receiver identities
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace peersync {

enum class SessionDirection : uint8_t {
    SEND = 0,
    RECEIVE = 1
};

enum class SessionStatus : uint8_t {
    PENDING = 0,    // code issued, nobody attached yet
    CONNECTED = 1,  // at least one receiver has attached
    CLOSED = 2      // no further attaches accepted
};

const char* SessionDirectionToString(SessionDirection direction);
const char* SessionStatusToString(SessionStatus status);
bool ParseSessionDirection(const std::string& text, SessionDirection& out);

//===----------------------------------------------------------------------===//
// ReceiverInfo - identity recorded on attach, for display and audit
//===----------------------------------------------------------------------===//
struct ReceiverInfo {
    uint64_t receiver_id = 0;  // assigned by the registry on attach
    std::string name;
    std::string email;
    std::string project;
    std::string site_url;
    std::string remote_ip;
    std::string user_agent;
    WallClock::time_point attached_at{};

    nlohmann::json ToJson() const;
    static ReceiverInfo FromJson(const nlohmann::json& j);
};

//===----------------------------------------------------------------------===//
// Session - value snapshot handed out by SessionRegistry
//===----------------------------------------------------------------------===//
struct Session {
    std::string code;
    SessionDirection direction = SessionDirection::SEND;
    SessionStatus status = SessionStatus::PENDING;
    WallClock::time_point created_at{};
    TimePoint created_mono{};
    std::vector<ReceiverInfo> receivers;
    bool owned = false;  // bound to a SessionLease

    bool IsLive() const { return status != SessionStatus::CLOSED; }

    nlohmann::json ToJson() const;
};

} // namespace peersync
