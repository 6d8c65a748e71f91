#ifndef COORDINATION_STORE_HPP
#define COORDINATION_STORE_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

namespace rendezvous {

/**
 * Shared state and pub/sub used by every server instance.
 *
 * All mutations are single atomic store operations (INCR, SADD/SREM,
 * RPUSH+LTRIM, compare-and-swap). Implementations throw
 * CoordinationStoreError when the backing store cannot be reached.
 */
class CoordinationStore {
public:
    // (channel, message)
    using MessageHandler = std::function<void(const std::string&, const std::string&)>;

    virtual ~CoordinationStore() = default;

    // Counters
    virtual int64_t incr(const std::string& key) = 0;
    virtual int64_t decr(const std::string& key) = 0;

    // Key lifecycle
    virtual bool expire(const std::string& key, int ttl_seconds) = 0;
    virtual bool del(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;

    // Strings
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void setex(const std::string& key, const std::string& value, int ttl_seconds) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Atomically replace the value at key if it currently equals expected.
     * An empty expected value matches a missing key. A positive ttl is applied
     * on success.
     * @return true if the value was replaced
     */
    virtual bool compareAndSwap(const std::string& key, const std::string& expected,
                                const std::string& desired, int ttl_seconds) = 0;

    // Sets; sadd/srem report whether membership actually changed
    virtual bool sadd(const std::string& key, const std::string& member) = 0;
    virtual bool srem(const std::string& key, const std::string& member) = 0;
    virtual bool sismember(const std::string& key, const std::string& member) = 0;
    virtual std::vector<std::string> smembers(const std::string& key) = 0;
    virtual int64_t scard(const std::string& key) = 0;

    /**
     * Atomically delete set_key and every key in dependents, but only while
     * the set is empty. A concurrent SADD either lands before the check (and
     * nothing is deleted) or after the deletion.
     * @return true if the keys were deleted
     */
    virtual bool deleteIfSetEmpty(const std::string& set_key, const std::vector<std::string>& dependents) = 0;

    // Lists
    virtual int64_t rpush(const std::string& key, const std::string& value) = 0;
    virtual void ltrim(const std::string& key, int64_t start, int64_t stop) = 0;
    virtual std::vector<std::string> lrange(const std::string& key, int64_t start, int64_t stop) = 0;

    // Pub/sub
    virtual int64_t publish(const std::string& channel, const std::string& message) = 0;

    /**
     * Subscribe to every channel matching a glob pattern (e.g. "rendezvous:room:*").
     * The handler may run on a store-owned thread.
     */
    virtual void psubscribe(const std::string& pattern, MessageHandler handler) = 0;

    virtual bool ping() = 0;
    virtual void close() = 0;
};

} // namespace rendezvous

#endif // COORDINATION_STORE_HPP
