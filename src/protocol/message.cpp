//===----------------------------------------------------------------------===//
//                         PeerSync
//
// protocol/message.cpp
//
// Protocol message implementation
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "sync_exception.hpp"

namespace peersync {

namespace {

uint64_t RefOf(const nlohmann::json& j) {
    auto it = j.find("ref");
    if (it == j.end() || !it->is_number_unsigned()) {
        return 0;
    }
    return it->get<uint64_t>();
}

std::string StringOf(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Message
//===----------------------------------------------------------------------===//
Message Message::FromJson(MessageType type, const nlohmann::json& body) {
    std::string text = body.dump();
    return Message(type, std::vector<uint8_t>(text.begin(), text.end()), MessageFlags::JSON);
}

nlohmann::json Message::PayloadJson() const {
    if (payload_.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(payload_.begin(), payload_.end(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw SyncException(ErrorCode::PROTOCOL_ERROR,
                            std::string("malformed ") + MessageTypeToString(GetType()) + " payload");
    }
    return parsed;
}

//===----------------------------------------------------------------------===//
// HelloPayload
//===----------------------------------------------------------------------===//
nlohmann::json HelloPayload::ToJson() const {
    return {
        {"protocol_version", protocol_version},
        {"session_code", session_code},
        {"receiver", receiver.ToJson()}
    };
}

HelloPayload HelloPayload::FromJson(const nlohmann::json& j) {
    HelloPayload payload;
    auto version = j.find("protocol_version");
    if (version != j.end()) {
        // Read wide so an out-of-range value cannot wrap onto a valid version
        if (!version->is_number_unsigned() || version->get<uint64_t>() > 0xFF) {
            throw SyncException(ErrorCode::VERSION_MISMATCH,
                                "unsupported protocol version " + version->dump());
        }
        payload.protocol_version = static_cast<uint8_t>(version->get<uint64_t>());
    }
    payload.session_code = StringOf(j, "session_code");
    auto receiver = j.find("receiver");
    if (receiver != j.end() && receiver->is_object()) {
        payload.receiver = ReceiverInfo::FromJson(*receiver);
    }
    return payload;
}

//===----------------------------------------------------------------------===//
// HelloResponsePayload
//===----------------------------------------------------------------------===//
nlohmann::json HelloResponsePayload::ToJson() const {
    return {
        {"status", status},
        {"session_code", session_code},
        {"receiver_id", receiver_id},
        {"server_info", server_info}
    };
}

HelloResponsePayload HelloResponsePayload::FromJson(const nlohmann::json& j) {
    HelloResponsePayload payload;
    payload.status = StringOf(j, "status");
    payload.session_code = StringOf(j, "session_code");
    auto receiver_id = j.find("receiver_id");
    if (receiver_id != j.end() && receiver_id->is_number_unsigned()) {
        payload.receiver_id = receiver_id->get<uint64_t>();
    }
    auto info = j.find("server_info");
    if (info != j.end() && info->is_object()) {
        payload.server_info = *info;
    }
    return payload;
}

//===----------------------------------------------------------------------===//
// RequestPayload
//===----------------------------------------------------------------------===//
nlohmann::json RequestPayload::ToJson() const {
    nlohmann::json j = {{"ref", ref}};
    if (!table.empty()) j["table"] = table;
    if (limit != 0) j["limit"] = limit;
    if (offset != 0) j["offset"] = offset;
    return j;
}

RequestPayload RequestPayload::FromJson(const nlohmann::json& j) {
    RequestPayload payload;
    payload.ref = RefOf(j);
    payload.table = StringOf(j, "table");
    auto limit = j.find("limit");
    if (limit != j.end() && limit->is_number_integer()) {
        payload.limit = limit->get<int64_t>();
    }
    auto offset = j.find("offset");
    if (offset != j.end() && offset->is_number_integer()) {
        payload.offset = offset->get<int64_t>();
    }
    return payload;
}

//===----------------------------------------------------------------------===//
// ErrorPayload
//===----------------------------------------------------------------------===//
nlohmann::json ErrorPayload::ToJson() const {
    nlohmann::json j = {
        {"ref", ref},
        {"code", ErrorCodeToString(code)},
        {"code_value", static_cast<uint32_t>(code)},
        {"message", message}
    };
    if (!table.empty()) j["table"] = table;
    return j;
}

ErrorPayload ErrorPayload::FromJson(const nlohmann::json& j) {
    ErrorPayload payload;
    payload.ref = RefOf(j);
    auto value = j.find("code_value");
    if (value != j.end() && value->is_number_unsigned()) {
        payload.code = static_cast<ErrorCode>(value->get<uint32_t>());
    }
    payload.message = StringOf(j, "message");
    payload.table = StringOf(j, "table");
    return payload;
}

nlohmann::json BuildCapabilities(const std::string& server_version) {
    return {
        {"version", "1.0.0"},
        {"server_version", server_version},
        {"features", {"list_tables", "get_schema", "get_count", "fetch_records"}}
    };
}

} // namespace peersync
