#include <catch2/catch.hpp>
#include "store/store_keys.hpp"
#include "test_support.hpp"

using namespace rendezvous;
using rendezvous::test::SignalingHarness;
using rendezvous::test::errorCodeOf;

TEST_CASE("join announces new members to the room", "[relay]") {
    SignalingHarness h;
    auto alice = h.connect("room-1", "alice");
    h.relay->join("room-1", "alice", "Alice");

    auto bob = h.connect("room-1", "bob");
    h.relay->join("room-1", "bob", "Bob");

    auto joined = alice->ofType(MessageType::UserJoined);
    REQUIRE(joined.size() == 1);
    CHECK(joined[0].sender_id == "bob");
    CHECK(joined[0].payload.find("\"display_name\":\"Bob\"") != std::string::npos);
    CHECK(bob->ofType(MessageType::UserJoined).empty());

    alice->clear();
    h.relay->join("room-1", "bob", "Bob");
    CHECK(alice->messages().empty());
}

TEST_CASE("published messages are numbered consecutively", "[relay]") {
    SignalingHarness h;
    auto bob = h.connect("room-1", "bob");
    h.relay->join("room-1", "alice", "");
    h.relay->join("room-1", "bob", "");

    int64_t last = h.reconnection->currentSequence("room-1");
    for (int i = 0; i < 20; ++i) {
        auto sent = h.offer("room-1", i % 2 == 0 ? "alice" : "bob");
        CHECK(sent.sequence_number == last + 1);
        CHECK_FALSE(sent.timestamp.empty());
        last = sent.sequence_number;
    }

    // bob sees only alice's offers, in order
    auto offers = bob->ofType(MessageType::Offer);
    REQUIRE(offers.size() == 10);
    for (size_t i = 1; i < offers.size(); ++i) {
        CHECK(offers[i].sequence_number > offers[i - 1].sequence_number);
        CHECK(offers[i].sender_id == "alice");
    }
}

TEST_CASE("addressed messages reach only their target", "[relay]") {
    SignalingHarness h;
    auto bob = h.connect("room-1", "bob");
    auto carol = h.connect("room-1", "carol");
    for (const char* user : {"alice", "bob", "carol"}) {
        h.relay->join("room-1", user, "");
    }
    bob->clear();
    carol->clear();

    h.offer("room-1", "alice", "bob");
    CHECK(bob->ofType(MessageType::Offer).size() == 1);
    CHECK(carol->ofType(MessageType::Offer).empty());
}

TEST_CASE("control and malformed messages are not relayed", "[relay]") {
    SignalingHarness h;
    SignalingMessage heartbeat;
    heartbeat.type = MessageType::Heartbeat;
    heartbeat.room_id = "room-1";
    heartbeat.sender_id = "alice";
    CHECK(errorCodeOf([&] { h.relay->publish(heartbeat); }) == "invalid_message_type");

    SignalingMessage answer;
    answer.type = MessageType::Answer;
    answer.room_id = "room-1";
    answer.payload = R"({"type":"answer"})";
    CHECK(errorCodeOf([&] { h.relay->publish(answer); }) == "invalid_payload");
    CHECK_FALSE(h.store->exists(keys::roomSequence("room-1")));
}

TEST_CASE("store outage degrades to local delivery", "[relay]") {
    SignalingHarness h;
    auto bob = h.connect("room-1", "bob");
    h.relay->join("room-1", "alice", "");
    h.relay->join("room-1", "bob", "");
    bob->clear();

    h.store->setAvailable(false);
    auto sent = h.offer("room-1", "alice");
    CHECK(sent.sequence_number == 0);
    auto offers = bob->ofType(MessageType::Offer);
    REQUIRE(offers.size() == 1);
    CHECK(offers[0].sequence_number == 0);

    h.store->setAvailable(true);
    CHECK(h.offer("room-1", "alice").sequence_number > 0);
}

TEST_CASE("leave and presence expiry announce departures", "[relay]") {
    SignalingHarness h;
    auto alice = h.connect("room-1", "alice");
    h.relay->join("room-1", "alice", "");
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "carol", "");

    h.relay->leave("room-1", "bob");
    auto left = alice->ofType(MessageType::UserLeft);
    REQUIRE(left.size() == 1);
    CHECK(left[0].payload.find("\"reason\":\"left\"") != std::string::npos);

    alice->clear();
    h.clock.advanceSeconds(h.settings.presence_ttl_seconds - 5);
    h.relay->heartbeat("room-1", "alice", "");
    h.clock.advanceSeconds(10);

    CHECK(h.relay->sweepPresence() == 1);
    left = alice->ofType(MessageType::UserLeft);
    REQUIRE(left.size() == 1);
    CHECK(left[0].sender_id == "carol");
    CHECK(left[0].payload.find("\"reason\":\"timeout\"") != std::string::npos);

    SECTION("a late heartbeat re-announces the user") {
        alice->clear();
        h.relay->heartbeat("room-1", "carol", "Carol");
        CHECK(alice->ofType(MessageType::UserJoined).size() == 1);
    }
}
