#include <catch2/catch.hpp>
#include "common/errors.hpp"
#include "store/in_memory_coordination_store.hpp"
#include "test_support.hpp"

using namespace rendezvous;
using rendezvous::test::ManualClock;

TEST_CASE("counters and ttl expiry", "[store]") {
    ManualClock clock;
    InMemoryCoordinationStore store(clock.clock());

    CHECK(store.incr("seq") == 1);
    CHECK(store.incr("seq") == 2);
    CHECK(store.decr("seq") == 1);
    CHECK_FALSE(store.expire("missing", 10));

    REQUIRE(store.expire("seq", 10));
    CHECK(store.ttlMillis("seq") == 10000);
    CHECK(store.incr("seq") == 2);
    CHECK(store.ttlMillis("seq") == 10000);

    clock.advanceSeconds(10);
    CHECK_FALSE(store.exists("seq"));
    CHECK(store.ttlMillis("seq") == -2);
    CHECK(store.incr("seq") == 1);
    CHECK(store.ttlMillis("seq") == -1);
}

TEST_CASE("strings and compare-and-swap", "[store]") {
    ManualClock clock;
    InMemoryCoordinationStore store(clock.clock());

    CHECK_FALSE(store.get("k").has_value());
    CHECK(store.compareAndSwap("k", "", "v1", 0));
    CHECK_FALSE(store.compareAndSwap("k", "", "v2", 0));
    CHECK_FALSE(store.compareAndSwap("k", "stale", "v2", 0));
    CHECK(store.compareAndSwap("k", "v1", "v2", 5));
    CHECK(store.get("k") == std::optional<std::string>("v2"));
    CHECK(store.ttlMillis("k") == 5000);

    store.setex("lease", "x", 2);
    clock.advanceSeconds(3);
    CHECK_FALSE(store.get("lease").has_value());

    store.set("text", "abc");
    CHECK_THROWS_AS(store.incr("text"), CoordinationStoreError);
}

TEST_CASE("sets report membership changes and vanish when empty", "[store]") {
    InMemoryCoordinationStore store;

    CHECK(store.sadd("members", "alice"));
    CHECK_FALSE(store.sadd("members", "alice"));
    CHECK(store.sadd("members", "bob"));
    CHECK(store.scard("members") == 2);
    CHECK(store.sismember("members", "bob"));
    CHECK(store.smembers("members") == std::vector<std::string>{"alice", "bob"});

    CHECK(store.srem("members", "alice"));
    CHECK_FALSE(store.srem("members", "alice"));
    CHECK(store.srem("members", "bob"));
    CHECK_FALSE(store.exists("members"));
}

TEST_CASE("a set and its dependents are deleted only while the set is empty", "[store]") {
    ManualClock clock;
    InMemoryCoordinationStore store(clock.clock());

    store.sadd("room:members", "alice");
    store.set("room:seq", "7");
    store.rpush("room:buffer", "{}");

    CHECK_FALSE(store.deleteIfSetEmpty("room:members", {"room:seq", "room:buffer"}));
    CHECK(store.exists("room:seq"));
    CHECK(store.exists("room:buffer"));

    store.srem("room:members", "alice");
    CHECK(store.deleteIfSetEmpty("room:members", {"room:seq", "room:buffer"}));
    CHECK_FALSE(store.exists("room:seq"));
    CHECK_FALSE(store.exists("room:buffer"));

    // A missing set counts as empty
    store.set("other:seq", "1");
    CHECK(store.deleteIfSetEmpty("other:members", {"other:seq"}));
    CHECK_FALSE(store.exists("other:seq"));

    store.set("not-a-set", "x");
    CHECK_THROWS_AS(store.deleteIfSetEmpty("not-a-set", {}), CoordinationStoreError);
}

TEST_CASE("lists trim like redis", "[store]") {
    InMemoryCoordinationStore store;
    for (int i = 1; i <= 6; ++i) {
        store.rpush("buf", std::to_string(i));
    }

    store.ltrim("buf", -4, -1);
    CHECK(store.lrange("buf", 0, -1) == std::vector<std::string>{"3", "4", "5", "6"});
    CHECK(store.lrange("buf", 1, 2) == std::vector<std::string>{"4", "5"});
    CHECK(store.lrange("buf", 10, 20).empty());

    store.ltrim("buf", 5, 1);
    CHECK_FALSE(store.exists("buf"));
}

TEST_CASE("type mismatches raise store errors", "[store]") {
    InMemoryCoordinationStore store;
    store.rpush("list", "a");
    CHECK_THROWS_AS(store.sadd("list", "a"), CoordinationStoreError);
    CHECK_THROWS_AS(store.get("list"), CoordinationStoreError);
}

TEST_CASE("pattern subscribers receive matching publishes", "[store]") {
    InMemoryCoordinationStore store;
    std::vector<std::string> received;
    store.psubscribe("rendezvous:room:*", [&](const std::string& channel, const std::string& message) {
        received.push_back(channel + "=" + message);
    });

    CHECK(store.publish("rendezvous:room:abc", "hello") == 1);
    CHECK(store.publish("rendezvous:transfer:abc", "ignored") == 0);
    REQUIRE(received.size() == 1);
    CHECK(received[0] == "rendezvous:room:abc=hello");

    CHECK(InMemoryCoordinationStore::globMatch("a?c*", "abcdef"));
    CHECK_FALSE(InMemoryCoordinationStore::globMatch("a?c", "abcd"));
}

TEST_CASE("an unavailable store fails every operation", "[store]") {
    InMemoryCoordinationStore store;
    store.setAvailable(false);
    CHECK_FALSE(store.ping());
    CHECK_THROWS_AS(store.incr("x"), CoordinationStoreError);
    CHECK_THROWS_AS(store.publish("c", "m"), CoordinationStoreError);

    store.setAvailable(true);
    CHECK(store.ping());
    CHECK(store.incr("x") == 1);
}
