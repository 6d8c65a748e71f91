#include <catch2/catch.hpp>
#include "store/store_keys.hpp"
#include "test_support.hpp"

using namespace rendezvous;
using rendezvous::test::SignalingHarness;

namespace {

// Publishes offers from `from` until the room counter reaches `target`
int64_t publishUntil(SignalingHarness& h, const std::string& room_id, const std::string& from, int64_t target) {
    int64_t last = h.reconnection->currentSequence(room_id);
    while (last < target) {
        last = h.offer(room_id, from).sequence_number;
    }
    return last;
}

} // namespace

TEST_CASE("a first connect is not a reconnect", "[reconnection]") {
    SignalingHarness h;
    h.relay->join("room-1", "alice", "");
    auto decision = h.reconnection->onConnect("room-1", "alice");

    CHECK_FALSE(decision.is_reconnect);
    CHECK(decision.messages.empty());
    CHECK(decision.current_sequence == 1);
    auto state = h.reconnection->connectionState("room-1", "alice");
    REQUIRE(state.has_value());
    CHECK(state->status == ConnectionStatus::Connected);
    CHECK(state->last_sequence_seen == 1);
}

TEST_CASE("reconnect within the grace window replays exactly the missed messages", "[reconnection]") {
    SignalingHarness h;
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "alice", "");
    h.reconnection->onConnect("room-1", "alice");

    REQUIRE(publishUntil(h, "room-1", "bob", 42) == 42);
    h.reconnection->onDisconnect("room-1", "alice", 42);
    CHECK(h.reconnection->connectionState("room-1", "alice")->status == ConnectionStatus::Disconnected);

    h.clock.advanceSeconds(5);
    REQUIRE(publishUntil(h, "room-1", "bob", 52) == 52);

    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK(decision.is_reconnect);
    CHECK(decision.last_sequence_seen == 42);
    CHECK(decision.current_sequence == 52);
    CHECK(decision.missed_message_count == 10);
    CHECK(decision.lost_message_count == 0);
    CHECK(decision.gap_fully_recoverable);
    CHECK(decision.highestReplayedSequence() == 52);

    REQUIRE(decision.messages.size() == 10);
    for (size_t i = 0; i < decision.messages.size(); ++i) {
        CHECK(decision.messages[i].sequence_number == static_cast<int64_t>(43 + i));
        CHECK(decision.messages[i].type == MessageType::Offer);
    }

    const std::string json = decision.toJson();
    CHECK(json.find("\"is_reconnect\":true") != std::string::npos);
    CHECK(json.find("\"replayed_message_count\":10") != std::string::npos);
    CHECK(json.find("\"gap_fully_recoverable\":true") != std::string::npos);
    CHECK(json.find("\"room_recycled\":false") != std::string::npos);

    auto state = h.reconnection->connectionState("room-1", "alice");
    CHECK(state->status == ConnectionStatus::Connected);
    CHECK(state->last_sequence_seen == 52);
}

TEST_CASE("replay skips messages addressed to someone else", "[reconnection]") {
    SignalingHarness h;
    for (const char* user : {"alice", "bob", "carol"}) {
        h.relay->join("room-1", user, "");
    }
    const int64_t seen = h.reconnection->currentSequence("room-1");
    h.reconnection->onDisconnect("room-1", "alice", seen);

    h.offer("room-1", "bob", "carol");
    h.offer("room-1", "bob", "alice");
    h.offer("room-1", "alice");

    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK(decision.missed_message_count == 3);
    CHECK(decision.gap_fully_recoverable);
    REQUIRE(decision.messages.size() == 1);
    CHECK(decision.messages[0].target_user_id == "alice");
}

TEST_CASE("an evicted gap is reported as partially recoverable", "[reconnection]") {
    SignalingSettings settings;
    settings.buffer_size = 5;
    SignalingHarness h(settings);
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "alice", "");

    publishUntil(h, "room-1", "bob", 10);
    h.reconnection->onDisconnect("room-1", "alice", 10);
    publishUntil(h, "room-1", "bob", 20);

    CHECK(h.reconnection->bufferedMessages("room-1").size() == 5);

    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK(decision.is_reconnect);
    CHECK(decision.missed_message_count == 10);
    CHECK(decision.lost_message_count == 5);
    CHECK_FALSE(decision.gap_fully_recoverable);
    REQUIRE(decision.messages.size() == 5);
    CHECK(decision.messages.front().sequence_number == 16);
    CHECK(decision.messages.back().sequence_number == 20);
}

TEST_CASE("a reconnect into a recycled room is flagged and replays the new incarnation", "[reconnection]") {
    SignalingHarness h;
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "alice", "");
    h.reconnection->onConnect("room-1", "alice");
    publishUntil(h, "room-1", "bob", 42);
    const std::string old_epoch = h.registry->roomEpoch("room-1");
    REQUIRE_FALSE(old_epoch.empty());
    h.reconnection->onDisconnect("room-1", "alice", 42);

    h.relay->leave("room-1", "alice");
    h.relay->leave("room-1", "bob");
    CHECK(h.reconnection->currentSequence("room-1") == 0);
    CHECK(h.registry->roomEpoch("room-1").empty());

    h.relay->join("room-1", "bob", "");
    h.offer("room-1", "bob");
    CHECK(h.registry->roomEpoch("room-1") != old_epoch);

    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK(decision.is_reconnect);
    CHECK(decision.room_recycled);
    CHECK_FALSE(decision.gap_fully_recoverable);
    CHECK(decision.last_sequence_seen == 42);
    CHECK(decision.current_sequence == 2);
    CHECK(decision.missed_message_count == 2);
    CHECK(decision.lost_message_count == 0);
    REQUIRE(decision.messages.size() == 2);
    CHECK(decision.messages[0].type == MessageType::UserJoined);
    CHECK(decision.messages[0].sequence_number == 1);
    CHECK(decision.messages[1].type == MessageType::Offer);
    CHECK(decision.messages[1].sequence_number == 2);

    const std::string json = decision.toJson();
    CHECK(json.find("\"room_recycled\":true") != std::string::npos);
    CHECK(json.find("\"gap_fully_recoverable\":false") != std::string::npos);

    auto state = h.reconnection->connectionState("room-1", "alice");
    CHECK(state->last_sequence_seen == 2);
    CHECK(state->room_epoch == h.registry->roomEpoch("room-1"));
}

TEST_CASE("a recycled room is detected even when the new counter has passed the old one", "[reconnection]") {
    SignalingHarness h;
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "alice", "");
    publishUntil(h, "room-1", "bob", 3);
    h.reconnection->onDisconnect("room-1", "alice", 3);

    h.relay->leave("room-1", "alice");
    h.relay->leave("room-1", "bob");
    h.relay->join("room-1", "bob", "");
    publishUntil(h, "room-1", "bob", 8);

    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK(decision.is_reconnect);
    CHECK(decision.room_recycled);
    CHECK_FALSE(decision.gap_fully_recoverable);
    CHECK(decision.missed_message_count == 8);
    CHECK(decision.messages.front().sequence_number == 1);
}

TEST_CASE("the room counter survives an idle stretch longer than the buffer ttl", "[reconnection]") {
    SignalingHarness h;
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "alice", "");
    h.reconnection->onConnect("room-1", "alice");
    REQUIRE(publishUntil(h, "room-1", "bob", 42) == 42);

    h.clock.advanceSeconds(240);
    h.reconnection->onDisconnect("room-1", "alice", 42);
    h.clock.advanceSeconds(120);

    // Buffer is gone by now, the counter must not be
    CHECK(h.reconnection->bufferedMessages("room-1").empty());
    CHECK(h.reconnection->currentSequence("room-1") == 42);

    h.relay->heartbeat("room-1", "bob", "");
    CHECK(h.offer("room-1", "bob").sequence_number == 43);

    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK(decision.is_reconnect);
    CHECK_FALSE(decision.room_recycled);
    CHECK(decision.missed_message_count == 1);
    CHECK(decision.lost_message_count == 0);
    CHECK(decision.gap_fully_recoverable);
    REQUIRE(decision.messages.size() == 1);
    CHECK(decision.messages[0].sequence_number == 43);
}

TEST_CASE("a reconnect after the grace window is a fresh join", "[reconnection]") {
    SignalingSettings settings;
    settings.grace_window_seconds = 60;
    settings.buffer_ttl_seconds = 600;
    SignalingHarness h(settings);
    h.relay->join("room-1", "bob", "");
    h.relay->join("room-1", "alice", "");
    publishUntil(h, "room-1", "bob", 5);
    h.reconnection->onDisconnect("room-1", "alice", 5);
    publishUntil(h, "room-1", "bob", 8);

    h.clock.advanceSeconds(61);
    auto decision = h.reconnection->onConnect("room-1", "alice");
    CHECK_FALSE(decision.is_reconnect);
    CHECK(decision.messages.empty());
    CHECK(decision.current_sequence == 8);
}

TEST_CASE("the buffer is bounded and expires", "[reconnection]") {
    SignalingSettings settings;
    settings.buffer_size = 3;
    settings.buffer_ttl_seconds = 30;
    SignalingHarness h(settings);
    h.relay->join("room-1", "bob", "");
    publishUntil(h, "room-1", "bob", 6);

    auto buffered = h.reconnection->bufferedMessages("room-1");
    REQUIRE(buffered.size() == 3);
    CHECK(buffered[0].sequence_number == 4);

    h.clock.advanceSeconds(31);
    CHECK(h.reconnection->bufferedMessages("room-1").empty());
}
