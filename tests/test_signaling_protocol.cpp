#include <catch2/catch.hpp>
#include "signaling/signaling_protocol.hpp"
#include "test_support.hpp"

using namespace rendezvous;
using rendezvous::test::errorCodeOf;
namespace proto = rendezvous::SignalingProtocol;

TEST_CASE("type names map both ways", "[protocol]") {
    for (auto type : {MessageType::Offer, MessageType::IceCandidate, MessageType::FileTransferChunk,
                      MessageType::Heartbeat, MessageType::Leave, MessageType::RoomState}) {
        auto parsed = proto::typeFromName(proto::typeName(type));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK(std::string(proto::typeName(MessageType::IceCandidate)) == "ice-candidate");
    CHECK_FALSE(proto::typeFromName("renegotiate").has_value());
}

TEST_CASE("categories and client origin", "[protocol]") {
    CHECK(proto::categoryOf(MessageType::Answer) == MessageCategory::Signaling);
    CHECK(proto::categoryOf(MessageType::UserLeft) == MessageCategory::Presence);
    CHECK(proto::categoryOf(MessageType::FileTransferAccept) == MessageCategory::FileTransfer);
    CHECK(proto::categoryOf(MessageType::Heartbeat) == MessageCategory::Control);

    CHECK(proto::isClientOriginated(MessageType::Offer));
    CHECK(proto::isClientOriginated(MessageType::Leave));
    CHECK_FALSE(proto::isClientOriginated(MessageType::UserJoined));
    CHECK_FALSE(proto::isClientOriginated(MessageType::FileTransferComplete));
}

TEST_CASE("parse keeps the payload verbatim", "[protocol]") {
    const std::string payload = R"({"sdp":"v=0\r\no=- 46117 2 IN IP4 127.0.0.1","type":"offer"})";
    auto message = proto::parse(R"({"type":"offer","room_id":"room-1","target_user_id":"bob","payload":)" +
                                payload + "}");

    CHECK(message.type == MessageType::Offer);
    CHECK(message.payload == payload);
    CHECK(message.room_id == "room-1");
    CHECK(message.target_user_id == "bob");
    CHECK(message.sender_id.empty());
    CHECK(message.sequence_number == 0);

    const std::string wire = proto::serialize(message);
    CHECK(wire.find(payload) != std::string::npos);
    CHECK(wire.find("\"sender_id\":null") != std::string::npos);

    auto again = proto::parse(wire);
    CHECK(again.payload == payload);
    CHECK(again.target_user_id == "bob");
}

TEST_CASE("parse rejects bad envelopes", "[protocol]") {
    CHECK(errorCodeOf([] { proto::parse("not json"); }) == "invalid_payload");
    CHECK(errorCodeOf([] { proto::parse(R"({"payload":{}})"); }) == "invalid_message_type");
    CHECK(errorCodeOf([] { proto::parse(R"({"type":"renegotiate"})"); }) == "invalid_message_type");
    CHECK(errorCodeOf([] { proto::parse(R"({"type":"offer","payload":[1]})"); }) == "invalid_payload");
    CHECK(errorCodeOf([] { proto::parse(R"({"type":"offer","sequence_number":-4})"); }) == "invalid_payload");
    CHECK(errorCodeOf([] { proto::parse(R"({"type":"offer","room_id":7})"); }) == "invalid_payload");
}

TEST_CASE("validate checks the fields each type needs", "[protocol]") {
    SignalingMessage message;
    message.room_id = "room-1";

    SECTION("offer needs sdp") {
        message.type = MessageType::Offer;
        message.payload = R"({"type":"offer"})";
        CHECK(errorCodeOf([&] { proto::validate(message); }) == "invalid_payload");
        message.payload = R"({"sdp":"v=0"})";
        CHECK_NOTHROW(proto::validate(message));
    }

    SECTION("ice candidate needs candidate") {
        message.type = MessageType::IceCandidate;
        message.payload = R"({"candidate":"candidate:1 1 UDP 2122252543 10.0.0.2 50000 typ host","sdpMid":"0"})";
        CHECK_NOTHROW(proto::validate(message));
    }

    SECTION("chunk needs index and data") {
        message.type = MessageType::FileTransferChunk;
        message.payload = R"({"transfer_id":"t1","data":"AAAA"})";
        CHECK(errorCodeOf([&] { proto::validate(message); }) == "invalid_payload");
        message.payload = R"({"transfer_id":"t1","chunk_index":0,"data":"AAAA"})";
        CHECK_NOTHROW(proto::validate(message));
    }

    SECTION("room is required") {
        message.type = MessageType::Heartbeat;
        message.room_id.clear();
        CHECK(errorCodeOf([&] { proto::validate(message); }) == "invalid_payload");
    }
}

TEST_CASE("delivery rule", "[protocol]") {
    SignalingMessage broadcast;
    broadcast.sender_id = "alice";
    CHECK_FALSE(proto::shouldDeliver(broadcast, "alice"));
    CHECK(proto::shouldDeliver(broadcast, "bob"));

    SignalingMessage addressed = broadcast;
    addressed.target_user_id = "bob";
    CHECK(proto::shouldDeliver(addressed, "bob"));
    CHECK_FALSE(proto::shouldDeliver(addressed, "carol"));
    CHECK_FALSE(proto::shouldDeliver(addressed, "alice"));
}

TEST_CASE("server message builders produce valid envelopes", "[protocol]") {
    auto joined = proto::createUserJoined("room-1", "alice", "Alice", "2024-01-01T00:00:00.000Z");
    CHECK(joined.sender_id == "alice");
    CHECK_NOTHROW(proto::validate(joined));

    auto state = proto::createRoomState("room-1", "bob", R"([{"user_id":"alice"}])", 1,
                                        R"({"is_reconnect":true})");
    CHECK(state.target_user_id == "bob");
    CHECK(state.payload.find("\"reconnect\":{\"is_reconnect\":true}") != std::string::npos);
    CHECK_NOTHROW(proto::validate(state));

    auto fresh = proto::createRoomState("room-1", "bob", "", 0);
    CHECK(fresh.payload.find("reconnect") == std::string::npos);

    auto error = proto::createError("room-1", "room_full", "Room is full", "bob");
    CHECK(error.target_user_id == "bob");
    CHECK_NOTHROW(proto::validate(error));
}
