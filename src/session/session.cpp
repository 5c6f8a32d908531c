//===----------------------------------------------------------------------===//
//                         PeerSync
//
// session/session.cpp
//
//===----------------------------------------------------------------------===//

#include "session/session.hpp"

namespace peersync {

namespace {

std::string StringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // anonymous namespace

const char* SessionDirectionToString(SessionDirection direction) {
    switch (direction) {
        case SessionDirection::SEND:    return "send";
        case SessionDirection::RECEIVE: return "receive";
    }
    return "unknown";
}

const char* SessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING:   return "pending";
        case SessionStatus::CONNECTED: return "connected";
        case SessionStatus::CLOSED:    return "closed";
    }
    return "unknown";
}

bool ParseSessionDirection(const std::string& text, SessionDirection& out) {
    if (text == "send") {
        out = SessionDirection::SEND;
        return true;
    }
    if (text == "receive") {
        out = SessionDirection::RECEIVE;
        return true;
    }
    return false;
}

nlohmann::json ReceiverInfo::ToJson() const {
    nlohmann::json j = {
        {"name", name},
        {"email", email},
        {"project", project},
        {"site_url", site_url},
        {"user_agent", user_agent},
    };
    if (receiver_id != 0) {
        j["receiver_id"] = receiver_id;
    }
    if (!remote_ip.empty()) {
        j["remote_ip"] = remote_ip;
    }
    if (attached_at.time_since_epoch().count() != 0) {
        j["attached_at"] = FormatIso8601(attached_at);
    }
    return j;
}

ReceiverInfo ReceiverInfo::FromJson(const nlohmann::json& j) {
    ReceiverInfo info;
    if (!j.is_object()) {
        return info;
    }
    info.name = StringField(j, "name");
    info.email = StringField(j, "email");
    info.project = StringField(j, "project");
    info.site_url = StringField(j, "site_url");
    info.user_agent = StringField(j, "user_agent");
    return info;
}

nlohmann::json Session::ToJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& receiver : receivers) {
        list.push_back(receiver.ToJson());
    }
    return {
        {"code", code},
        {"direction", SessionDirectionToString(direction)},
        {"status", SessionStatusToString(status)},
        {"created_at", FormatIso8601(created_at)},
        {"receivers", list},
    };
}

} // namespace peersync
