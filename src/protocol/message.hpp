//===----------------------------------------------------------------------===//
//                         PeerSync
//
// protocol/message.hpp
//
// Frame header, message container and request/response payloads
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message_types.hpp"
#include "session/session.hpp"
#include <nlohmann/json.hpp>
#include <cstring>

namespace peersync {

//===----------------------------------------------------------------------===//
// Message Header
//===----------------------------------------------------------------------===//
#pragma pack(push, 1)
struct MessageHeader {
    uint32_t magic;      // Protocol magic: "PSYN"
    uint8_t  version;    // Protocol version
    uint8_t  type;       // Message type
    uint8_t  flags;      // Payload encoding
    uint8_t  reserved;   // Reserved for future use
    uint32_t length;     // Payload length

    static constexpr size_t SIZE = 12;

    MessageHeader()
        : magic(PROTOCOL_MAGIC)
        , version(PROTOCOL_VERSION)
        , type(static_cast<uint8_t>(MessageType::UNKNOWN))
        , flags(MessageFlags::NONE)
        , reserved(0)
        , length(0) {}

    MessageHeader(MessageType msg_type, uint32_t payload_length, uint8_t msg_flags = MessageFlags::NONE)
        : magic(PROTOCOL_MAGIC)
        , version(PROTOCOL_VERSION)
        , type(static_cast<uint8_t>(msg_type))
        , flags(msg_flags)
        , reserved(0)
        , length(payload_length) {}

    bool IsValid() const {
        return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && length <= MAX_MESSAGE_SIZE;
    }

    MessageType GetType() const {
        return static_cast<MessageType>(type);
    }
};
#pragma pack(pop)

static_assert(sizeof(MessageHeader) == MessageHeader::SIZE, "MessageHeader size mismatch");

//===----------------------------------------------------------------------===//
// Message Class
//===----------------------------------------------------------------------===//
class Message {
public:
    Message() = default;

    explicit Message(MessageType type)
        : header_(type, 0) {}

    Message(MessageType type, std::vector<uint8_t>&& payload, uint8_t flags = MessageFlags::NONE)
        : header_(type, static_cast<uint32_t>(payload.size()), flags)
        , payload_(std::move(payload)) {}

    // JSON-encoded payload
    static Message FromJson(MessageType type, const nlohmann::json& body);

    // Getters
    const MessageHeader& GetHeader() const { return header_; }
    MessageHeader& GetHeader() { return header_; }
    MessageType GetType() const { return header_.GetType(); }
    uint8_t GetFlags() const { return header_.flags; }
    uint32_t GetPayloadLength() const { return header_.length; }
    const std::vector<uint8_t>& GetPayload() const { return payload_; }
    std::vector<uint8_t>& GetPayload() { return payload_; }

    // Parsed payload; empty object when there is none.
    // Throws SyncException(PROTOCOL_ERROR) on malformed JSON.
    nlohmann::json PayloadJson() const;

    // Validation
    bool IsValid() const { return header_.IsValid(); }

    // Serialization
    std::vector<uint8_t> Serialize() const {
        std::vector<uint8_t> buffer(MessageHeader::SIZE + payload_.size());
        std::memcpy(buffer.data(), &header_, MessageHeader::SIZE);
        if (!payload_.empty()) {
            std::memcpy(buffer.data() + MessageHeader::SIZE, payload_.data(), payload_.size());
        }
        return buffer;
    }

    size_t TotalSize() const {
        return MessageHeader::SIZE + payload_.size();
    }

private:
    MessageHeader header_;
    std::vector<uint8_t> payload_;
};

//===----------------------------------------------------------------------===//
// Hello Payload
//===----------------------------------------------------------------------===//
struct HelloPayload {
    uint8_t protocol_version = PROTOCOL_VERSION;
    std::string session_code;
    ReceiverInfo receiver;

    nlohmann::json ToJson() const;
    static HelloPayload FromJson(const nlohmann::json& j);
};

//===----------------------------------------------------------------------===//
// Hello Response Payload
//===----------------------------------------------------------------------===//
struct HelloResponsePayload {
    std::string status = "connected";
    std::string session_code;
    uint64_t receiver_id = 0;
    nlohmann::json server_info = nlohmann::json::object();

    nlohmann::json ToJson() const;
    static HelloResponsePayload FromJson(const nlohmann::json& j);
};

//===----------------------------------------------------------------------===//
// Request Payload
//===----------------------------------------------------------------------===//

// Every request carries a ref echoed in its reply. Fields a request type
// does not use stay at their defaults.
struct RequestPayload {
    uint64_t ref = 0;
    std::string table;
    int64_t limit = 0;
    int64_t offset = 0;

    nlohmann::json ToJson() const;
    static RequestPayload FromJson(const nlohmann::json& j);
};

//===----------------------------------------------------------------------===//
// Error Payload
//===----------------------------------------------------------------------===//
struct ErrorPayload {
    uint64_t ref = 0;
    ErrorCode code = ErrorCode::INTERNAL_ERROR;
    std::string message;
    std::string table;

    ErrorPayload() = default;
    ErrorPayload(uint64_t ref_p, ErrorCode code_p, std::string message_p, std::string table_p = "")
        : ref(ref_p), code(code_p), message(std::move(message_p)), table(std::move(table_p)) {}

    nlohmann::json ToJson() const;
    static ErrorPayload FromJson(const nlohmann::json& j);
};

// Capability advertisement returned for GET_CAPABILITIES
nlohmann::json BuildCapabilities(const std::string& server_version);

} // namespace peersync
