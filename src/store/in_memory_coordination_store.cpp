#include "../../include/store/in_memory_coordination_store.hpp"
#include "../../include/common/errors.hpp"

namespace rendezvous {

namespace {

// Normalises a Redis-style inclusive range against a list of size len.
// Returns false if the range is empty.
bool normaliseRange(int64_t len, int64_t& start, int64_t& stop) {
    if (start < 0) start += len;
    if (stop < 0) stop += len;
    if (start < 0) start = 0;
    if (stop >= len) stop = len - 1;
    return len > 0 && start <= stop && start < len;
}

} // namespace

InMemoryCoordinationStore::InMemoryCoordinationStore(Clock clock)
    : clock_(std::move(clock)) {
}

void InMemoryCoordinationStore::checkAvailable() const {
    if (!available_) {
        throw CoordinationStoreError("In-memory store marked unavailable");
    }
}

InMemoryCoordinationStore::Entry* InMemoryCoordinationStore::find(const std::string& key) {
    auto it = data_.find(key);
    if (it == data_.end()) return nullptr;
    if (it->second.expires_at != 0 && it->second.expires_at <= clock_()) {
        data_.erase(it);
        return nullptr;
    }
    return &it->second;
}

InMemoryCoordinationStore::Entry& InMemoryCoordinationStore::findOrCreate(const std::string& key, Kind kind) {
    Entry* entry = find(key);
    if (entry) {
        requireKind(*entry, kind, key);
        return *entry;
    }
    Entry& created = data_[key];
    created.kind = kind;
    return created;
}

void InMemoryCoordinationStore::requireKind(const Entry& entry, Kind kind, const std::string& key) const {
    if (entry.kind != kind) {
        throw CoordinationStoreError("WRONGTYPE operation against key " + key);
    }
}

int64_t InMemoryCoordinationStore::addToCounter(const std::string& key, int64_t delta) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = findOrCreate(key, Kind::String);
    int64_t value = 0;
    if (!entry.str.empty()) {
        try {
            size_t consumed = 0;
            value = std::stoll(entry.str, &consumed);
            if (consumed != entry.str.size()) throw std::invalid_argument(entry.str);
        } catch (const std::exception&) {
            throw CoordinationStoreError("Value at " + key + " is not an integer");
        }
    }
    value += delta;
    entry.str = std::to_string(value);
    return value;
}

int64_t InMemoryCoordinationStore::incr(const std::string& key) {
    return addToCounter(key, 1);
}

int64_t InMemoryCoordinationStore::decr(const std::string& key) {
    return addToCounter(key, -1);
}

bool InMemoryCoordinationStore::expire(const std::string& key, int ttl_seconds) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return false;
    if (ttl_seconds <= 0) {
        data_.erase(key);
        return true;
    }
    entry->expires_at = clock_() + static_cast<int64_t>(ttl_seconds) * 1000;
    return true;
}

bool InMemoryCoordinationStore::del(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!find(key)) return false;
    data_.erase(key);
    return true;
}

bool InMemoryCoordinationStore::exists(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    return find(key) != nullptr;
}

void InMemoryCoordinationStore::set(const std::string& key, const std::string& value) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = data_[key];
    entry = Entry{};
    entry.str = value;
}

void InMemoryCoordinationStore::setex(const std::string& key, const std::string& value, int ttl_seconds) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = data_[key];
    entry = Entry{};
    entry.str = value;
    entry.expires_at = clock_() + static_cast<int64_t>(ttl_seconds) * 1000;
}

std::optional<std::string> InMemoryCoordinationStore::get(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return std::nullopt;
    requireKind(*entry, Kind::String, key);
    return entry->str;
}

bool InMemoryCoordinationStore::compareAndSwap(const std::string& key, const std::string& expected,
                                               const std::string& desired, int ttl_seconds) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (entry) {
        requireKind(*entry, Kind::String, key);
        if (entry->str != expected) return false;
    } else if (!expected.empty()) {
        return false;
    }
    Entry& target = data_[key];
    target = Entry{};
    target.str = desired;
    if (ttl_seconds > 0) {
        target.expires_at = clock_() + static_cast<int64_t>(ttl_seconds) * 1000;
    }
    return true;
}

bool InMemoryCoordinationStore::sadd(const std::string& key, const std::string& member) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    return findOrCreate(key, Kind::Set).members.insert(member).second;
}

bool InMemoryCoordinationStore::srem(const std::string& key, const std::string& member) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return false;
    requireKind(*entry, Kind::Set, key);
    bool removed = entry->members.erase(member) > 0;
    if (entry->members.empty()) {
        data_.erase(key);
    }
    return removed;
}

bool InMemoryCoordinationStore::sismember(const std::string& key, const std::string& member) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return false;
    requireKind(*entry, Kind::Set, key);
    return entry->members.count(member) > 0;
}

std::vector<std::string> InMemoryCoordinationStore::smembers(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return {};
    requireKind(*entry, Kind::Set, key);
    return std::vector<std::string>(entry->members.begin(), entry->members.end());
}

int64_t InMemoryCoordinationStore::scard(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return 0;
    requireKind(*entry, Kind::Set, key);
    return static_cast<int64_t>(entry->members.size());
}

bool InMemoryCoordinationStore::deleteIfSetEmpty(const std::string& set_key,
                                                 const std::vector<std::string>& dependents) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(set_key);
    if (entry) {
        requireKind(*entry, Kind::Set, set_key);
        if (!entry->members.empty()) return false;
        data_.erase(set_key);
    }
    for (const auto& key : dependents) {
        data_.erase(key);
    }
    return true;
}

int64_t InMemoryCoordinationStore::rpush(const std::string& key, const std::string& value) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = findOrCreate(key, Kind::List);
    entry.items.push_back(value);
    return static_cast<int64_t>(entry.items.size());
}

void InMemoryCoordinationStore::ltrim(const std::string& key, int64_t start, int64_t stop) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return;
    requireKind(*entry, Kind::List, key);
    const int64_t len = static_cast<int64_t>(entry->items.size());
    if (!normaliseRange(len, start, stop)) {
        data_.erase(key);
        return;
    }
    std::deque<std::string> kept(entry->items.begin() + start, entry->items.begin() + stop + 1);
    entry->items.swap(kept);
}

std::vector<std::string> InMemoryCoordinationStore::lrange(const std::string& key, int64_t start, int64_t stop) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return {};
    requireKind(*entry, Kind::List, key);
    const int64_t len = static_cast<int64_t>(entry->items.size());
    if (!normaliseRange(len, start, stop)) return {};
    return std::vector<std::string>(entry->items.begin() + start, entry->items.begin() + stop + 1);
}

int64_t InMemoryCoordinationStore::publish(const std::string& channel, const std::string& message) {
    checkAvailable();
    std::vector<MessageHandler> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& sub : subscribers_) {
            if (globMatch(sub.first, channel)) {
                targets.push_back(sub.second);
            }
        }
    }
    // Handlers run outside the lock so they can call back into the store
    for (const auto& handler : targets) {
        handler(channel, message);
    }
    return static_cast<int64_t>(targets.size());
}

void InMemoryCoordinationStore::psubscribe(const std::string& pattern, MessageHandler handler) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.emplace_back(pattern, std::move(handler));
}

bool InMemoryCoordinationStore::ping() {
    return available_;
}

void InMemoryCoordinationStore::close() {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.clear();
}

int64_t InMemoryCoordinationStore::ttlMillis(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(key);
    if (!entry) return -2;
    if (entry->expires_at == 0) return -1;
    return entry->expires_at - clock_();
}

bool InMemoryCoordinationStore::globMatch(const std::string& pattern, const std::string& text) {
    // '*' and '?' only; enough for channel patterns
    size_t p = 0, t = 0;
    size_t star = std::string::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace rendezvous
