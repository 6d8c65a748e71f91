#include <catch2/catch.hpp>
#include "signaling/room_registry.hpp"
#include "store/in_memory_coordination_store.hpp"
#include "store/store_keys.hpp"
#include "test_support.hpp"
#include <functional>

using namespace rendezvous;
using rendezvous::test::ManualClock;
using rendezvous::test::errorCodeOf;

namespace {

// Runs a callback just before the room index loses a room, like a join on another instance would
class InterleavingStore : public InMemoryCoordinationStore {
public:
    using InMemoryCoordinationStore::InMemoryCoordinationStore;

    bool srem(const std::string& key, const std::string& member) override {
        if (key == keys::rooms() && before_index_removal) {
            auto callback = std::move(before_index_removal);
            before_index_removal = nullptr;
            callback();
        }
        return InMemoryCoordinationStore::srem(key, member);
    }

    std::function<void()> before_index_removal;
};

struct RegistryFixture {
    RegistryFixture() {
        settings.max_participants = 3;
        settings.presence_ttl_seconds = 30;
        store = std::make_shared<InMemoryCoordinationStore>(clock.clock());
        registry = std::make_shared<RoomRegistry>(store, settings, clock.clock());
    }

    ManualClock clock;
    SignalingSettings settings;
    std::shared_ptr<InMemoryCoordinationStore> store;
    std::shared_ptr<RoomRegistry> registry;
};

} // namespace

TEST_CASE("room ids are validated", "[registry]") {
    CHECK_NOTHROW(RoomRegistry::validateRoomId("abc"));
    CHECK_NOTHROW(RoomRegistry::validateRoomId("Team_Standup-42"));
    CHECK(errorCodeOf([] { RoomRegistry::validateRoomId("ab"); }) == "invalid_room_id");
    CHECK(errorCodeOf([] { RoomRegistry::validateRoomId(std::string(65, 'a')); }) == "invalid_room_id");
    CHECK(errorCodeOf([] { RoomRegistry::validateRoomId("room/1"); }) == "invalid_room_id");
    CHECK(errorCodeOf([] { RoomRegistry::validateRoomId("room 1"); }) == "invalid_room_id");
}

TEST_CASE_METHOD(RegistryFixture, "join registers membership and presence", "[registry]") {
    auto first = registry->join("room-1", "alice", "Alice");
    CHECK(first.newly_joined);
    REQUIRE(first.participants.size() == 1);
    CHECK(first.participants[0].display_name == "Alice");

    clock.advanceMillis(5);
    auto second = registry->join("room-1", "bob", "");
    CHECK(second.newly_joined);
    REQUIRE(second.participants.size() == 2);
    CHECK(second.participants[0].user_id == "alice");
    CHECK(second.participants[1].display_name == "bob");

    SECTION("rejoining keeps the original join time") {
        const std::string joined_at = second.participants[0].joined_at;
        clock.advanceSeconds(3);
        auto again = registry->join("room-1", "alice", "Alice");
        CHECK_FALSE(again.newly_joined);
        CHECK(registry->participant("room-1", "alice")->joined_at == joined_at);
    }

    CHECK(registry->isMember("room-1", "bob"));
    CHECK(registry->activeRooms() == std::vector<std::string>{"room-1"});
    CHECK(store->ttlMillis(keys::participant("room-1", "alice")) > 0);
}

TEST_CASE_METHOD(RegistryFixture, "a full room rejects new members", "[registry]") {
    registry->join("room-1", "a", "");
    registry->join("room-1", "b", "");
    registry->join("room-1", "c", "");

    CHECK(errorCodeOf([&] { registry->join("room-1", "d", ""); }) == "room_full");
    CHECK_FALSE(registry->isMember("room-1", "d"));
    CHECK(registry->participants("room-1").size() == 3);

    // Existing members may reconnect while the room is full
    CHECK_NOTHROW(registry->join("room-1", "c", ""));
}

TEST_CASE_METHOD(RegistryFixture, "the last leave removes room metadata", "[registry]") {
    registry->join("room-1", "alice", "");
    registry->join("room-1", "bob", "");
    store->incr(keys::roomSequence("room-1"));
    store->rpush(keys::roomBuffer("room-1"), "{}");

    CHECK(registry->leave("room-1", "alice"));
    CHECK_FALSE(registry->leave("room-1", "alice"));
    CHECK(store->exists(keys::roomSequence("room-1")));

    CHECK(registry->leave("room-1", "bob"));
    CHECK_FALSE(store->exists(keys::roomSequence("room-1")));
    CHECK_FALSE(store->exists(keys::roomBuffer("room-1")));
    CHECK(registry->activeRooms().empty());
}

TEST_CASE_METHOD(RegistryFixture, "lapsed presence is swept once", "[registry]") {
    registry->join("room-1", "alice", "");
    registry->join("room-1", "bob", "");

    clock.advanceSeconds(20);
    CHECK_FALSE(registry->heartbeat("room-1", "bob", ""));
    clock.advanceSeconds(15);

    auto expired = registry->sweepExpiredPresence();
    REQUIRE(expired.size() == 1);
    CHECK(expired[0].user_id == "alice");
    CHECK(expired[0].room_id == "room-1");
    CHECK(registry->sweepExpiredPresence().empty());

    SECTION("a heartbeat after the sweep re-adds the member") {
        CHECK(registry->heartbeat("room-1", "alice", "Alice"));
        CHECK(registry->isMember("room-1", "alice"));
    }

    SECTION("the room disappears once everyone lapsed") {
        clock.advanceSeconds(31);
        CHECK(registry->sweepExpiredPresence().size() == 1);
        CHECK(registry->activeRooms().empty());
    }
}

TEST_CASE_METHOD(RegistryFixture, "member counts follow joins and leaves", "[registry]") {
    CHECK(registry->memberCount("room-1") == 0);
    registry->join("room-1", "alice", "");
    registry->join("room-1", "bob", "");
    CHECK(registry->memberCount("room-1") == 2);
    registry->leave("room-1", "bob");
    CHECK(registry->memberCount("room-1") == 1);
}

TEST_CASE_METHOD(RegistryFixture, "a room with members keeps its counter", "[registry]") {
    registry->join("room-1", "alice", "");
    const std::string epoch = registry->roomEpoch("room-1");
    store->incr(keys::roomSequence("room-1"));

    // A join that lands between the last leave's SREM and the cleanup keeps the room alive
    store->srem(keys::roomMembers("room-1"), "alice");
    store->sadd(keys::roomMembers("room-1"), "bob");
    CHECK_FALSE(registry->leave("room-1", "alice"));
    CHECK(store->exists(keys::roomSequence("room-1")));
    CHECK(registry->roomEpoch("room-1") == epoch);
}

TEST_CASE("a join racing the last leave keeps the room indexed", "[registry]") {
    ManualClock clock;
    SignalingSettings settings;
    auto store = std::make_shared<InterleavingStore>(clock.clock());
    auto registry = std::make_shared<RoomRegistry>(store, settings, clock.clock());

    registry->join("room-1", "alice", "");
    store->before_index_removal = [&registry]() { registry->join("room-1", "bob", ""); };
    CHECK(registry->leave("room-1", "alice"));

    CHECK(registry->isMember("room-1", "bob"));
    auto rooms = registry->activeRooms();
    REQUIRE(rooms.size() == 1);
    CHECK(rooms[0] == "room-1");
    CHECK_FALSE(registry->roomEpoch("room-1").empty());
}
