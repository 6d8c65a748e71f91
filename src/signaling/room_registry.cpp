#include "../../include/signaling/room_registry.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/crypto/digest.hpp"
#include "../../include/store/store_keys.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <sstream>

namespace rendezvous {

namespace {

const size_t kMinRoomIdLength = 3;
const size_t kMaxRoomIdLength = 64;

} // namespace

std::string Participant::toJson() const {
    std::ostringstream oss;
    oss << "{"
        << "\"user_id\":" << JsonParser::quote(user_id) << ","
        << "\"display_name\":" << JsonParser::quote(display_name) << ","
        << "\"joined_at\":" << JsonParser::quote(joined_at) << ","
        << "\"last_seen_at\":" << JsonParser::quote(last_seen_at)
        << "}";
    return oss.str();
}

Participant Participant::fromJson(const std::string& json) {
    auto fields = JsonParser::parseObject(json);
    Participant participant;
    participant.user_id = JsonParser::getString(fields, "user_id");
    participant.display_name = JsonParser::getString(fields, "display_name", participant.user_id);
    participant.joined_at = JsonParser::getString(fields, "joined_at");
    participant.last_seen_at = JsonParser::getString(fields, "last_seen_at");
    if (participant.user_id.empty()) {
        throw std::invalid_argument("participant record has no user_id");
    }
    return participant;
}

std::string RoomMembership::participantsJson() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < participants.size(); ++i) {
        if (i > 0) oss << ",";
        oss << participants[i].toJson();
    }
    oss << "]";
    return oss.str();
}

RoomRegistry::RoomRegistry(std::shared_ptr<CoordinationStore> store,
                           const SignalingSettings& settings,
                           Clock clock)
    : store_(std::move(store))
    , settings_(settings)
    , clock_(std::move(clock)) {
}

void RoomRegistry::validateRoomId(const std::string& room_id) {
    if (room_id.size() < kMinRoomIdLength || room_id.size() > kMaxRoomIdLength) {
        throw ValidationError("Room id must be 3-64 characters", ErrorCode::INVALID_ROOM_ID);
    }
    for (char c : room_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-';
        if (!ok) {
            throw ValidationError("Room id may only contain letters, digits, '_' and '-'",
                                  ErrorCode::INVALID_ROOM_ID);
        }
    }
}

void RoomRegistry::writePresence(const std::string& room_id, const Participant& participant) {
    store_->setex(keys::participant(room_id, participant.user_id), participant.toJson(),
                  settings_.presence_ttl_seconds);
}

RoomMembership RoomRegistry::join(const std::string& room_id, const std::string& user_id,
                                  const std::string& display_name) {
    validateRoomId(room_id);

    const std::string now = formatIsoTimestamp(clock_());
    Participant self;
    self.user_id = user_id;
    self.display_name = display_name.empty() ? user_id : display_name;
    self.joined_at = now;
    self.last_seen_at = now;

    std::optional<Participant> existing = participant(room_id, user_id);
    if (existing) {
        self.joined_at = existing->joined_at;
    }

    RoomMembership membership;
    membership.room_id = room_id;
    membership.newly_joined = store_->sadd(keys::roomMembers(room_id), user_id);

    if (membership.newly_joined &&
        static_cast<size_t>(store_->scard(keys::roomMembers(room_id))) > settings_.max_participants) {
        store_->srem(keys::roomMembers(room_id), user_id);
        removeRoomIfEmpty(room_id);
        Logger::getInstance().warning("Room " + room_id + " is full, rejected " + user_id);
        throw CapacityError(ErrorCode::ROOM_FULL,
                            "Room is full (" + std::to_string(settings_.max_participants) + " participants)");
    }

    writePresence(room_id, self);
    ensureEpoch(room_id);
    store_->sadd(keys::rooms(), room_id);

    membership.participants = participants(room_id);
    Logger::getInstance().info("User " + user_id + (membership.newly_joined ? " joined" : " resumed") +
                               " room " + room_id + " (" + std::to_string(membership.participants.size()) +
                               " participants)");
    return membership;
}

bool RoomRegistry::heartbeat(const std::string& room_id, const std::string& user_id,
                             const std::string& display_name) {
    const std::string now = formatIsoTimestamp(clock_());
    Participant record;
    std::optional<Participant> existing = participant(room_id, user_id);
    if (existing) {
        record = *existing;
    } else {
        record.user_id = user_id;
        record.display_name = display_name.empty() ? user_id : display_name;
        record.joined_at = now;
    }
    record.last_seen_at = now;

    bool readded = store_->sadd(keys::roomMembers(room_id), user_id);
    writePresence(room_id, record);
    if (readded) {
        ensureEpoch(room_id);
        store_->sadd(keys::rooms(), room_id);
        Logger::getInstance().info("Presence of " + user_id + " in room " + room_id + " restored by heartbeat");
    }
    return readded;
}

bool RoomRegistry::leave(const std::string& room_id, const std::string& user_id) {
    bool removed = store_->srem(keys::roomMembers(room_id), user_id);
    store_->del(keys::participant(room_id, user_id));
    removeRoomIfEmpty(room_id);
    if (removed) {
        Logger::getInstance().info("User " + user_id + " left room " + room_id);
    }
    return removed;
}

std::vector<Participant> RoomRegistry::participants(const std::string& room_id) {
    std::vector<Participant> result;
    for (const auto& user_id : store_->smembers(keys::roomMembers(room_id))) {
        std::optional<Participant> record = participant(room_id, user_id);
        if (record) {
            result.push_back(*record);
        }
    }
    std::sort(result.begin(), result.end(), [](const Participant& a, const Participant& b) {
        return a.joined_at < b.joined_at || (a.joined_at == b.joined_at && a.user_id < b.user_id);
    });
    return result;
}

std::optional<Participant> RoomRegistry::participant(const std::string& room_id, const std::string& user_id) {
    std::optional<std::string> raw = store_->get(keys::participant(room_id, user_id));
    if (!raw) {
        return std::nullopt;
    }
    try {
        return Participant::fromJson(*raw);
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().warning("Corrupt participant record for " + user_id + " in " + room_id + ": " +
                                      e.what());
        return std::nullopt;
    }
}

bool RoomRegistry::isMember(const std::string& room_id, const std::string& user_id) {
    return store_->sismember(keys::roomMembers(room_id), user_id);
}

int64_t RoomRegistry::memberCount(const std::string& room_id) {
    return store_->scard(keys::roomMembers(room_id));
}

std::vector<std::string> RoomRegistry::activeRooms() {
    return store_->smembers(keys::rooms());
}

std::vector<ExpiredPresence> RoomRegistry::sweepExpiredPresence() {
    std::vector<ExpiredPresence> expired;
    for (const auto& room_id : store_->smembers(keys::rooms())) {
        for (const auto& user_id : store_->smembers(keys::roomMembers(room_id))) {
            if (store_->exists(keys::participant(room_id, user_id))) {
                continue;
            }
            if (store_->srem(keys::roomMembers(room_id), user_id)) {
                expired.push_back(ExpiredPresence{room_id, user_id});
                Logger::getInstance().info("Presence of " + user_id + " in room " + room_id + " expired");
            }
        }
        removeRoomIfEmpty(room_id);
    }
    return expired;
}

void RoomRegistry::ensureEpoch(const std::string& room_id) {
    // Empty expected value: only the first writer of a new incarnation wins
    store_->compareAndSwap(keys::roomEpoch(room_id), "", crypto::randomHex(8), 0);
}

std::string RoomRegistry::roomEpoch(const std::string& room_id) {
    return store_->get(keys::roomEpoch(room_id)).value_or("");
}

void RoomRegistry::removeRoomIfEmpty(const std::string& room_id) {
    if (!store_->deleteIfSetEmpty(keys::roomMembers(room_id),
                                  {keys::roomSequence(room_id), keys::roomBuffer(room_id),
                                   keys::roomEpoch(room_id)})) {
        return;
    }
    if (store_->srem(keys::rooms(), room_id)) {
        Logger::getInstance().info("Room " + room_id + " is empty, metadata removed");
    }
    // A join that raced the removal may have indexed the room before the SREM
    if (store_->scard(keys::roomMembers(room_id)) > 0) {
        store_->sadd(keys::rooms(), room_id);
    }
}

} // namespace rendezvous
