#ifndef REDIS_COORDINATION_STORE_HPP
#define REDIS_COORDINATION_STORE_HPP

#include "coordination_store.hpp"
#include "../utils/config.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct redisContext;
struct redisReply;

namespace rendezvous {

/**
 * CoordinationStore backed by Redis through the synchronous hiredis API.
 *
 * Commands run on a small pool of blocking connections. Pub/sub uses one
 * dedicated connection owned by a subscriber thread:
 *   Instance A -> PUBLISH rendezvous:room:{id} -> Redis -> PSUBSCRIBE on every instance
 * Lost connections are re-established on the next command; the subscriber
 * reconnects with backoff and re-issues its PSUBSCRIBE.
 */
class RedisCoordinationStore : public CoordinationStore {
public:
    explicit RedisCoordinationStore(const RedisSettings& settings);
    ~RedisCoordinationStore() override;

    RedisCoordinationStore(const RedisCoordinationStore&) = delete;
    RedisCoordinationStore& operator=(const RedisCoordinationStore&) = delete;

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

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    struct ContextDeleter {
        void operator()(redisContext* context) const;
    };
    using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

    // Borrowed pool connection, returned on destruction
    class Lease {
    public:
        Lease(RedisCoordinationStore& store, ContextPtr context);
        ~Lease();
        redisContext* get() const { return context_.get(); }
        void invalidate() { context_.reset(); }

    private:
        RedisCoordinationStore& store_;
        ContextPtr context_;
    };

    ContextPtr connect();
    Lease acquire();
    void release(ContextPtr context);

    ReplyPtr command(const std::vector<std::string>& args);
    int64_t integerCommand(const std::vector<std::string>& args);
    void statusCommand(const std::vector<std::string>& args);
    std::vector<std::string> arrayCommand(const std::vector<std::string>& args);

    void subscriberLoop();
    void handleSubscriptionReply(redisReply* reply);

    RedisSettings settings_;

    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<ContextPtr> idle_;
    size_t open_connections_ = 0;
    std::atomic<bool> closed_{false};

    std::mutex subscribers_mutex_;
    std::vector<std::pair<std::string, MessageHandler>> subscribers_;
    std::thread subscriber_thread_;
    std::atomic<bool> subscriber_running_{false};
    std::mutex subscriber_context_mutex_;
    redisContext* subscriber_context_ = nullptr;
};

} // namespace rendezvous

#endif // REDIS_COORDINATION_STORE_HPP
