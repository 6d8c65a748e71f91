#ifndef IN_MEMORY_COORDINATION_STORE_HPP
#define IN_MEMORY_COORDINATION_STORE_HPP

#include "coordination_store.hpp"
#include "../utils/time_utils.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <set>
#include <unordered_map>

namespace rendezvous {

/**
 * Process-local CoordinationStore with Redis semantics: lazy TTL expiry on
 * the supplied clock, empty sets and lists vanish, and publish dispatches
 * synchronously to matching pattern subscribers.
 *
 * Used by the test suite and by single-instance deployments (RENDEZVOUS_STORE=memory).
 */
class InMemoryCoordinationStore : public CoordinationStore {
public:
    explicit InMemoryCoordinationStore(Clock clock = systemClock());

    int64_t incr(const std::string& key) override;
    int64_t decr(const std::string& key) override;

    bool expire(const std::string& key, int ttl_seconds) override;
    bool del(const std::string& key) override;
    bool exists(const std::string& key) override;

    void set(const std::string& key, const std::string& value) override;
    void setex(const std::string& key, const std::string& value, int ttl_seconds) override;
    std::optional<std::string> get(const std::string& key) override;
    bool compareAndSwap(const std::string& key, const std::string& expected,
                        const std::string& desired, int ttl_seconds) override;

    bool sadd(const std::string& key, const std::string& member) override;
    bool srem(const std::string& key, const std::string& member) override;
    bool sismember(const std::string& key, const std::string& member) override;
    std::vector<std::string> smembers(const std::string& key) override;
    int64_t scard(const std::string& key) override;
    bool deleteIfSetEmpty(const std::string& set_key, const std::vector<std::string>& dependents) override;

    int64_t rpush(const std::string& key, const std::string& value) override;
    void ltrim(const std::string& key, int64_t start, int64_t stop) override;
    std::vector<std::string> lrange(const std::string& key, int64_t start, int64_t stop) override;

    int64_t publish(const std::string& channel, const std::string& message) override;
    void psubscribe(const std::string& pattern, MessageHandler handler) override;

    bool ping() override;
    void close() override;

    // Simulates an outage: every operation throws CoordinationStoreError while unavailable
    void setAvailable(bool available) { available_ = available; }

    // Remaining TTL in milliseconds, -1 without expiry, -2 if missing
    int64_t ttlMillis(const std::string& key);

    static bool globMatch(const std::string& pattern, const std::string& text);

private:
    enum class Kind { String, Set, List };

    struct Entry {
        Kind kind = Kind::String;
        std::string str;
        std::set<std::string> members;
        std::deque<std::string> items;
        int64_t expires_at = 0;  // 0 = no expiry
    };

    void checkAvailable() const;
    // Returns the live entry for key or nullptr, dropping it if expired. Caller holds mutex_.
    Entry* find(const std::string& key);
    Entry& findOrCreate(const std::string& key, Kind kind);
    void requireKind(const Entry& entry, Kind kind, const std::string& key) const;
    int64_t addToCounter(const std::string& key, int64_t delta);

    Clock clock_;
    std::atomic<bool> available_{true};
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> data_;

    std::mutex subscribers_mutex_;
    std::vector<std::pair<std::string, MessageHandler>> subscribers_;
};

} // namespace rendezvous

#endif // IN_MEMORY_COORDINATION_STORE_HPP
