//===----------------------------------------------------------------------===//
//                         PeerSync
//
// protocol/message_types.hpp
//
// Transfer protocol message types and error codes
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace peersync {

// Protocol constants
constexpr uint32_t PROTOCOL_MAGIC = 0x4E595350;  // "PSYN" little-endian
constexpr uint8_t PROTOCOL_VERSION = 0x01;

//===----------------------------------------------------------------------===//
// Message Types
//===----------------------------------------------------------------------===//
enum class MessageType : uint8_t {
    // ===== Session Negotiation (0x01-0x0F) =====
    HELLO               = 0x01,  // Receiver joins a session with its code
    HELLO_RESPONSE      = 0x02,  // Sender accepts the receiver
    PING                = 0x03,  // Heartbeat request
    PONG                = 0x04,  // Heartbeat response
    CLOSE               = 0x05,  // Receiver leaves
    ERROR               = 0x06,  // Typed error reply to any request

    // ===== Catalog Requests (0x10-0x1F) =====
    GET_CAPABILITIES    = 0x10,
    CAPABILITIES        = 0x11,
    LIST_TABLES         = 0x12,
    TABLES              = 0x13,
    GET_SCHEMA          = 0x14,
    SCHEMA              = 0x15,
    GET_COUNT           = 0x16,
    COUNT               = 0x17,

    // ===== Data Requests (0x20-0x2F) =====
    FETCH_RECORDS       = 0x20,
    RECORDS             = 0x21,

    // ===== Unknown =====
    UNKNOWN             = 0xFF
};

//===----------------------------------------------------------------------===//
// Message Flags
//===----------------------------------------------------------------------===//
namespace MessageFlags {
    constexpr uint8_t NONE = 0x00;
    constexpr uint8_t JSON = 0x01;  // payload is UTF-8 JSON text
}

//===----------------------------------------------------------------------===//
// Error Codes
//===----------------------------------------------------------------------===//
enum class ErrorCode : uint32_t {
    OK                      = 0x00000000,

    // ===== 0x0001xxxx: Negotiation Errors =====
    INVALID_CODE            = 0x00010001,  // Unknown connection code
    SESSION_CLOSED          = 0x00010002,  // Session closed or ended
    NOT_JOINED              = 0x00010003,  // Request before HELLO
    VERSION_MISMATCH        = 0x00010004,
    MAX_CONNECTIONS         = 0x00010005,

    // ===== 0x0002xxxx: Transport Errors =====
    CONNECTION_TIMEOUT      = 0x00020001,
    DISCONNECTED            = 0x00020002,
    PROTOCOL_ERROR          = 0x00020003,

    // ===== 0x0003xxxx: Schema Errors =====
    TABLE_NOT_FOUND         = 0x00030001,
    INVALID_IDENTIFIER      = 0x00030002,
    ACCESS_DENIED           = 0x00030003,  // Table is on the deny-list

    // ===== 0x0004xxxx: Internal Errors =====
    INTERNAL_ERROR          = 0x00040001,
};

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//
inline const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::HELLO:            return "HELLO";
        case MessageType::HELLO_RESPONSE:   return "HELLO_RESPONSE";
        case MessageType::PING:             return "PING";
        case MessageType::PONG:             return "PONG";
        case MessageType::CLOSE:            return "CLOSE";
        case MessageType::ERROR:            return "ERROR";
        case MessageType::GET_CAPABILITIES: return "GET_CAPABILITIES";
        case MessageType::CAPABILITIES:     return "CAPABILITIES";
        case MessageType::LIST_TABLES:      return "LIST_TABLES";
        case MessageType::TABLES:           return "TABLES";
        case MessageType::GET_SCHEMA:       return "GET_SCHEMA";
        case MessageType::SCHEMA:           return "SCHEMA";
        case MessageType::GET_COUNT:        return "GET_COUNT";
        case MessageType::COUNT:            return "COUNT";
        case MessageType::FETCH_RECORDS:    return "FETCH_RECORDS";
        case MessageType::RECORDS:          return "RECORDS";
        default:                            return "UNKNOWN";
    }
}

inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                 return "OK";
        case ErrorCode::INVALID_CODE:       return "INVALID_CODE";
        case ErrorCode::SESSION_CLOSED:     return "SESSION_CLOSED";
        case ErrorCode::NOT_JOINED:         return "NOT_JOINED";
        case ErrorCode::VERSION_MISMATCH:   return "VERSION_MISMATCH";
        case ErrorCode::MAX_CONNECTIONS:    return "MAX_CONNECTIONS";
        case ErrorCode::CONNECTION_TIMEOUT: return "CONNECTION_TIMEOUT";
        case ErrorCode::DISCONNECTED:       return "DISCONNECTED";
        case ErrorCode::PROTOCOL_ERROR:     return "PROTOCOL_ERROR";
        case ErrorCode::TABLE_NOT_FOUND:    return "TABLE_NOT_FOUND";
        case ErrorCode::INVALID_IDENTIFIER: return "INVALID_IDENTIFIER";
        case ErrorCode::ACCESS_DENIED:      return "ACCESS_DENIED";
        case ErrorCode::INTERNAL_ERROR:     return "INTERNAL_ERROR";
        default:                            return "UNKNOWN_ERROR";
    }
}

// Error families. Only transport errors are retried by background jobs.
inline bool IsNegotiationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFFFF0000u) == 0x00010000u;
}

inline bool IsTransportError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFFFF0000u) == 0x00020000u;
}

inline bool IsSchemaError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFFFF0000u) == 0x00030000u;
}

} // namespace peersync
