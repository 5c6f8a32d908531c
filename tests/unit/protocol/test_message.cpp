//===----------------------------------------------------------------------===//
//                         PeerSync - Unit Tests
//
// tests/unit/protocol/test_message.cpp
//
// Unit tests for frame headers, messages and payloads
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "sync_exception.hpp"
#include <cassert>
#include <iostream>

using namespace peersync;

//===----------------------------------------------------------------------===//
// Header Tests
//===----------------------------------------------------------------------===//

void TestHeaderLayout() {
    std::cout << "  Testing header layout..." << std::endl;

    MessageHeader header(MessageType::FETCH_RECORDS, 17, MessageFlags::JSON);
    assert(header.IsValid());
    assert(header.GetType() == MessageType::FETCH_RECORDS);

    Message msg = Message::FromJson(MessageType::PING, {{"ref", 3}});
    std::vector<uint8_t> wire = msg.Serialize();
    assert(wire.size() == MessageHeader::SIZE + msg.GetPayloadLength());

    // magic (LE), version, type, flags, reserved
    assert(wire[0] == 0x50 && wire[1] == 0x53 && wire[2] == 0x59 && wire[3] == 0x4E);
    assert(wire[4] == PROTOCOL_VERSION);
    assert(wire[5] == static_cast<uint8_t>(MessageType::PING));
    assert(wire[6] == MessageFlags::JSON);
    assert(wire[7] == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestHeaderValidation() {
    std::cout << "  Testing header validation..." << std::endl;

    MessageHeader bad_magic;
    bad_magic.magic = 0xDEADBEEF;
    assert(!bad_magic.IsValid());

    MessageHeader bad_version;
    bad_version.version = 9;
    assert(!bad_version.IsValid());

    MessageHeader oversized(MessageType::RECORDS, static_cast<uint32_t>(MAX_MESSAGE_SIZE) + 1);
    assert(!oversized.IsValid());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Payload Tests
//===----------------------------------------------------------------------===//

void TestPayloadJson() {
    std::cout << "  Testing JSON payloads..." << std::endl;

    Message empty(MessageType::PONG);
    assert(empty.PayloadJson().is_object());
    assert(empty.PayloadJson().empty());

    std::string garbage = "{not json";
    Message broken(MessageType::HELLO, std::vector<uint8_t>(garbage.begin(), garbage.end()), MessageFlags::JSON);
    bool threw = false;
    try {
        broken.PayloadJson();
    } catch (const SyncException& e) {
        threw = e.Code() == ErrorCode::PROTOCOL_ERROR;
    }
    assert(threw);

    std::string array = "[1,2]";
    Message not_object(MessageType::HELLO, std::vector<uint8_t>(array.begin(), array.end()), MessageFlags::JSON);
    threw = false;
    try {
        not_object.PayloadJson();
    } catch (const SyncException& e) {
        threw = e.Code() == ErrorCode::PROTOCOL_ERROR;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestHelloPayloads() {
    std::cout << "  Testing HELLO and HELLO_RESPONSE..." << std::endl;

    HelloPayload hello;
    hello.session_code = "ABCD2345";
    hello.receiver.name = "Ada";
    hello.receiver.project = "warehouse";

    Message msg = Message::FromJson(MessageType::HELLO, hello.ToJson());
    HelloPayload parsed = HelloPayload::FromJson(msg.PayloadJson());
    assert(parsed.protocol_version == PROTOCOL_VERSION);
    assert(parsed.session_code == "ABCD2345");
    assert(parsed.receiver.name == "Ada");
    assert(parsed.receiver.project == "warehouse");

    HelloResponsePayload response;
    response.session_code = "ABCD2345";
    response.receiver_id = 42;
    response.server_info = BuildCapabilities("0.1.0");

    HelloResponsePayload echoed = HelloResponsePayload::FromJson(response.ToJson());
    assert(echoed.status == "connected");
    assert(echoed.receiver_id == 42);
    assert(echoed.server_info["server_version"] == "0.1.0");
    assert(echoed.server_info["features"].size() == 4);

    // Missing fields fall back to defaults
    HelloPayload sparse = HelloPayload::FromJson(nlohmann::json::object());
    assert(sparse.session_code.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestHelloVersionRange() {
    std::cout << "  Testing HELLO rejects versions outside one byte..." << std::endl;

    auto code_of = [](const nlohmann::json& j) {
        try {
            HelloPayload::FromJson(j);
        } catch (const SyncException& e) {
            return e.Code();
        }
        return ErrorCode::OK;
    };

    // 257 would wrap to 1 if narrowed
    assert(code_of({{"protocol_version", 257}}) == ErrorCode::VERSION_MISMATCH);
    assert(code_of({{"protocol_version", -1}}) == ErrorCode::VERSION_MISMATCH);
    assert(code_of({{"protocol_version", "1"}}) == ErrorCode::VERSION_MISMATCH);
    assert(code_of({{"protocol_version", 2}}) == ErrorCode::OK);
    assert(HelloPayload::FromJson({{"protocol_version", 2}}).protocol_version == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestRequestPayload() {
    std::cout << "  Testing request payloads..." << std::endl;

    RequestPayload fetch;
    fetch.ref = 12;
    fetch.table = "users";
    fetch.limit = 500;
    fetch.offset = 1000;

    auto j = fetch.ToJson();
    assert(j["ref"] == 12);
    RequestPayload parsed = RequestPayload::FromJson(j);
    assert(parsed.ref == 12);
    assert(parsed.table == "users");
    assert(parsed.limit == 500);
    assert(parsed.offset == 1000);

    RequestPayload list;
    list.ref = 2;
    auto list_json = list.ToJson();
    assert(!list_json.contains("table"));
    assert(!list_json.contains("limit"));

    // Wrong types are ignored rather than trusted
    RequestPayload loose = RequestPayload::FromJson({{"ref", -1}, {"table", 5}, {"limit", "ten"}});
    assert(loose.ref == 0);
    assert(loose.table.empty());
    assert(loose.limit == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestErrorPayload() {
    std::cout << "  Testing ERROR payload..." << std::endl;

    ErrorPayload error(7, ErrorCode::TABLE_NOT_FOUND, "Table 'ghosts' not found", "ghosts");
    auto j = error.ToJson();
    assert(j["code"] == "TABLE_NOT_FOUND");
    assert(j["code_value"] == static_cast<uint32_t>(ErrorCode::TABLE_NOT_FOUND));
    assert(j["table"] == "ghosts");

    ErrorPayload parsed = ErrorPayload::FromJson(j);
    assert(parsed.ref == 7);
    assert(parsed.code == ErrorCode::TABLE_NOT_FOUND);
    assert(parsed.message == "Table 'ghosts' not found");

    assert(!ErrorPayload(1, ErrorCode::NOT_JOINED, "join first").ToJson().contains("table"));

    std::cout << "    PASSED" << std::endl;
}

void TestErrorFamilies() {
    std::cout << "  Testing error families..." << std::endl;

    assert(IsNegotiationError(ErrorCode::INVALID_CODE));
    assert(IsNegotiationError(ErrorCode::SESSION_CLOSED));
    assert(IsTransportError(ErrorCode::CONNECTION_TIMEOUT));
    assert(IsTransportError(ErrorCode::DISCONNECTED));
    assert(!IsTransportError(ErrorCode::TABLE_NOT_FOUND));
    assert(IsSchemaError(ErrorCode::ACCESS_DENIED));

    SyncException e(ErrorCode::SESSION_CLOSED, "sender ended the session");
    assert(std::string(e.what()) == "SESSION_CLOSED: sender ended the session");
    assert(e.Detail() == "sender ended the session");
    assert(e.Table().empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Message Unit Tests ===" << std::endl;

    std::cout << "\n1. Header:" << std::endl;
    TestHeaderLayout();
    TestHeaderValidation();

    std::cout << "\n2. Payloads:" << std::endl;
    TestPayloadJson();
    TestHelloPayloads();
    TestHelloVersionRange();
    TestRequestPayload();
    TestErrorPayload();
    TestErrorFamilies();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
