#include "../../include/store/redis_coordination_store.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/utils/logger.hpp"
#include <hiredis/hiredis.h>
#include <sys/socket.h>
#include <algorithm>
#include <chrono>

namespace rendezvous {

namespace {

// KEYS[1] = record key, ARGV = expected, desired, ttl seconds
const char* kCompareAndSwapScript =
    "local cur = redis.call('GET', KEYS[1])\n"
    "if (cur == false and ARGV[1] == '') or cur == ARGV[1] then\n"
    "  if tonumber(ARGV[3]) > 0 then\n"
    "    redis.call('SET', KEYS[1], ARGV[2], 'EX', ARGV[3])\n"
    "  else\n"
    "    redis.call('SET', KEYS[1], ARGV[2])\n"
    "  end\n"
    "  return 1\n"
    "end\n"
    "return 0\n";

// KEYS[1] = set key, KEYS[2..] = keys removed with it
const char* kDeleteIfSetEmptyScript =
    "if redis.call('SCARD', KEYS[1]) > 0 then\n"
    "  return 0\n"
    "end\n"
    "redis.call('DEL', unpack(KEYS))\n"
    "return 1\n";

const int kConnectTimeoutSeconds = 2;
const int kCommandTimeoutSeconds = 5;

std::string describe(const std::vector<std::string>& args) {
    return args.empty() ? std::string("<empty>") : args.front();
}

} // namespace

void RedisCoordinationStore::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) freeReplyObject(reply);
}

void RedisCoordinationStore::ContextDeleter::operator()(redisContext* context) const {
    if (context) redisFree(context);
}

RedisCoordinationStore::Lease::Lease(RedisCoordinationStore& store, ContextPtr context)
    : store_(store), context_(std::move(context)) {
}

RedisCoordinationStore::Lease::~Lease() {
    store_.release(std::move(context_));
}

RedisCoordinationStore::RedisCoordinationStore(const RedisSettings& settings)
    : settings_(settings) {
    if (settings_.pool_size == 0) {
        settings_.pool_size = 1;
    }
    // Fail fast at startup if Redis is unreachable
    release(connect());
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        open_connections_ = idle_.size();
    }
    Logger::getInstance().info("Redis coordination store connected to " + settings_.host + ":" +
                               std::to_string(settings_.port) + " (pool " +
                               std::to_string(settings_.pool_size) + ")");
}

RedisCoordinationStore::~RedisCoordinationStore() {
    close();
}

RedisCoordinationStore::ContextPtr RedisCoordinationStore::connect() {
    struct timeval connect_timeout = {kConnectTimeoutSeconds, 0};
    ContextPtr context(redisConnectWithTimeout(settings_.host.c_str(), settings_.port, connect_timeout));
    if (!context) {
        throw CoordinationStoreError("Cannot allocate Redis context");
    }
    if (context->err) {
        throw CoordinationStoreError("Redis connection failed: " + std::string(context->errstr));
    }

    struct timeval command_timeout = {kCommandTimeoutSeconds, 0};
    redisSetTimeout(context.get(), command_timeout);

    if (!settings_.password.empty()) {
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommand(context.get(), "AUTH %b", settings_.password.data(), settings_.password.size())));
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            throw CoordinationStoreError("Redis AUTH failed");
        }
    }
    if (settings_.db != 0) {
        ReplyPtr reply(static_cast<redisReply*>(redisCommand(context.get(), "SELECT %d", settings_.db)));
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            throw CoordinationStoreError("Redis SELECT " + std::to_string(settings_.db) + " failed");
        }
    }
    return context;
}

RedisCoordinationStore::Lease RedisCoordinationStore::acquire() {
    std::unique_lock<std::mutex> lock(pool_mutex_);
    pool_cv_.wait(lock, [this]() {
        return closed_ || !idle_.empty() || open_connections_ < settings_.pool_size;
    });
    if (closed_) {
        throw CoordinationStoreError("Redis coordination store is closed");
    }
    if (!idle_.empty()) {
        ContextPtr context = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(context));
    }

    open_connections_++;
    lock.unlock();
    try {
        return Lease(*this, connect());
    } catch (...) {
        std::lock_guard<std::mutex> relock(pool_mutex_);
        open_connections_--;
        pool_cv_.notify_one();
        throw;
    }
}

void RedisCoordinationStore::release(ContextPtr context) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (context && !context->err && !closed_) {
        idle_.push_back(std::move(context));
    } else if (open_connections_ > 0) {
        open_connections_--;
    }
    pool_cv_.notify_one();
}

RedisCoordinationStore::ReplyPtr RedisCoordinationStore::command(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    Lease lease = acquire();
    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(lease.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        std::string reason = lease.get()->errstr;
        lease.invalidate();
        throw CoordinationStoreError("Redis " + describe(args) + " failed: " + reason);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw CoordinationStoreError("Redis " + describe(args) + " error: " +
                                     std::string(reply->str, reply->len));
    }
    return reply;
}

int64_t RedisCoordinationStore::integerCommand(const std::vector<std::string>& args) {
    ReplyPtr reply = command(args);
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw CoordinationStoreError("Redis " + describe(args) + " returned a non-integer reply");
    }
    return static_cast<int64_t>(reply->integer);
}

void RedisCoordinationStore::statusCommand(const std::vector<std::string>& args) {
    ReplyPtr reply = command(args);
    if (reply->type != REDIS_REPLY_STATUS) {
        throw CoordinationStoreError("Redis " + describe(args) + " returned an unexpected reply");
    }
}

std::vector<std::string> RedisCoordinationStore::arrayCommand(const std::vector<std::string>& args) {
    ReplyPtr reply = command(args);
    if (reply->type != REDIS_REPLY_ARRAY) {
        throw CoordinationStoreError("Redis " + describe(args) + " returned a non-array reply");
    }
    std::vector<std::string> values;
    values.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        const redisReply* element = reply->element[i];
        if (element->type == REDIS_REPLY_STRING) {
            values.emplace_back(element->str, element->len);
        }
    }
    return values;
}

int64_t RedisCoordinationStore::incr(const std::string& key) {
    return integerCommand({"INCR", key});
}

int64_t RedisCoordinationStore::decr(const std::string& key) {
    return integerCommand({"DECR", key});
}

bool RedisCoordinationStore::expire(const std::string& key, int ttl_seconds) {
    return integerCommand({"EXPIRE", key, std::to_string(ttl_seconds)}) == 1;
}

bool RedisCoordinationStore::del(const std::string& key) {
    return integerCommand({"DEL", key}) > 0;
}

bool RedisCoordinationStore::exists(const std::string& key) {
    return integerCommand({"EXISTS", key}) > 0;
}

void RedisCoordinationStore::set(const std::string& key, const std::string& value) {
    statusCommand({"SET", key, value});
}

void RedisCoordinationStore::setex(const std::string& key, const std::string& value, int ttl_seconds) {
    statusCommand({"SETEX", key, std::to_string(ttl_seconds), value});
}

std::optional<std::string> RedisCoordinationStore::get(const std::string& key) {
    ReplyPtr reply = command({"GET", key});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        throw CoordinationStoreError("Redis GET returned a non-string reply");
    }
    return std::string(reply->str, reply->len);
}

bool RedisCoordinationStore::compareAndSwap(const std::string& key, const std::string& expected,
                                            const std::string& desired, int ttl_seconds) {
    return integerCommand({"EVAL", kCompareAndSwapScript, "1", key, expected, desired,
                           std::to_string(ttl_seconds > 0 ? ttl_seconds : 0)}) == 1;
}

bool RedisCoordinationStore::sadd(const std::string& key, const std::string& member) {
    return integerCommand({"SADD", key, member}) == 1;
}

bool RedisCoordinationStore::srem(const std::string& key, const std::string& member) {
    return integerCommand({"SREM", key, member}) == 1;
}

bool RedisCoordinationStore::sismember(const std::string& key, const std::string& member) {
    return integerCommand({"SISMEMBER", key, member}) == 1;
}

std::vector<std::string> RedisCoordinationStore::smembers(const std::string& key) {
    return arrayCommand({"SMEMBERS", key});
}

int64_t RedisCoordinationStore::scard(const std::string& key) {
    return integerCommand({"SCARD", key});
}

bool RedisCoordinationStore::deleteIfSetEmpty(const std::string& set_key,
                                              const std::vector<std::string>& dependents) {
    std::vector<std::string> args = {"EVAL", kDeleteIfSetEmptyScript, std::to_string(dependents.size() + 1), set_key};
    args.insert(args.end(), dependents.begin(), dependents.end());
    return integerCommand(args) == 1;
}

int64_t RedisCoordinationStore::rpush(const std::string& key, const std::string& value) {
    return integerCommand({"RPUSH", key, value});
}

void RedisCoordinationStore::ltrim(const std::string& key, int64_t start, int64_t stop) {
    statusCommand({"LTRIM", key, std::to_string(start), std::to_string(stop)});
}

std::vector<std::string> RedisCoordinationStore::lrange(const std::string& key, int64_t start, int64_t stop) {
    return arrayCommand({"LRANGE", key, std::to_string(start), std::to_string(stop)});
}

int64_t RedisCoordinationStore::publish(const std::string& channel, const std::string& message) {
    return integerCommand({"PUBLISH", channel, message});
}

void RedisCoordinationStore::psubscribe(const std::string& pattern, MessageHandler handler) {
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_.emplace_back(pattern, std::move(handler));
    }

    if (!subscriber_running_.exchange(true)) {
        subscriber_thread_ = std::thread(&RedisCoordinationStore::subscriberLoop, this);
        return;
    }

    // Already listening: drop the connection so the loop resubscribes with the new pattern
    std::lock_guard<std::mutex> lock(subscriber_context_mutex_);
    if (subscriber_context_) {
        ::shutdown(subscriber_context_->fd, SHUT_RDWR);
    }
}

void RedisCoordinationStore::subscriberLoop() {
    Logger::getInstance().info("Redis subscriber loop started");
    int backoff_ms = 100;

    while (subscriber_running_) {
        ContextPtr context;
        try {
            context = connect();
        } catch (const CoordinationStoreError& e) {
            Logger::getInstance().warning(std::string("Redis subscriber: ") + e.what());
        }

        if (context) {
            // Blocking reads on the subscriber connection have no timeout
            struct timeval no_timeout = {0, 0};
            redisSetTimeout(context.get(), no_timeout);

            std::vector<std::string> args = {"PSUBSCRIBE"};
            {
                std::lock_guard<std::mutex> lock(subscribers_mutex_);
                for (const auto& sub : subscribers_) {
                    args.push_back(sub.first);
                }
            }
            std::vector<const char*> argv;
            std::vector<size_t> argvlen;
            for (const auto& arg : args) {
                argv.push_back(arg.data());
                argvlen.push_back(arg.size());
            }
            redisAppendCommandArgv(context.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data());

            {
                std::lock_guard<std::mutex> lock(subscriber_context_mutex_);
                subscriber_context_ = context.get();
            }

            while (subscriber_running_) {
                void* raw = nullptr;
                if (redisGetReply(context.get(), &raw) != REDIS_OK) {
                    if (subscriber_running_) {
                        Logger::getInstance().warning("Redis subscriber connection lost: " +
                                                      std::string(context->errstr));
                    }
                    break;
                }
                ReplyPtr reply(static_cast<redisReply*>(raw));
                backoff_ms = 100;
                handleSubscriptionReply(reply.get());
            }

            {
                std::lock_guard<std::mutex> lock(subscriber_context_mutex_);
                subscriber_context_ = nullptr;
            }
        }

        for (int waited = 0; subscriber_running_ && waited < backoff_ms; waited += 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        backoff_ms = std::min(backoff_ms * 2, 5000);
    }

    Logger::getInstance().info("Redis subscriber loop stopped");
}

void RedisCoordinationStore::handleSubscriptionReply(redisReply* reply) {
    // pmessage <pattern> <channel> <payload>
    if (!reply || reply->type != REDIS_REPLY_ARRAY || reply->elements != 4) {
        return;
    }
    const std::string kind(reply->element[0]->str, reply->element[0]->len);
    if (kind != "pmessage") {
        return;
    }
    const std::string pattern(reply->element[1]->str, reply->element[1]->len);
    const std::string channel(reply->element[2]->str, reply->element[2]->len);
    const std::string message(reply->element[3]->str, reply->element[3]->len);

    std::vector<MessageHandler> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& sub : subscribers_) {
            if (sub.first == pattern) {
                targets.push_back(sub.second);
            }
        }
    }

    for (const auto& handler : targets) {
        try {
            handler(channel, message);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Subscriber handler failed on " + channel + ": " + e.what());
        } catch (...) {
            Logger::getInstance().error("Subscriber handler failed on " + channel + ": unknown exception");
        }
    }
}

bool RedisCoordinationStore::ping() {
    try {
        ReplyPtr reply = command({"PING"});
        return reply->type == REDIS_REPLY_STATUS;
    } catch (const CoordinationStoreError& e) {
        Logger::getInstance().debug(std::string("Redis ping failed: ") + e.what());
        return false;
    }
}

void RedisCoordinationStore::close() {
    if (closed_.exchange(true)) {
        return;
    }

    subscriber_running_ = false;
    {
        std::lock_guard<std::mutex> lock(subscriber_context_mutex_);
        if (subscriber_context_) {
            ::shutdown(subscriber_context_->fd, SHUT_RDWR);
        }
    }
    if (subscriber_thread_.joinable()) {
        subscriber_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_.clear();
        pool_cv_.notify_all();
    }
    Logger::getInstance().info("Redis coordination store closed");
}

} // namespace rendezvous
