#ifndef ROOM_REGISTRY_HPP
#define ROOM_REGISTRY_HPP

#include "../store/coordination_store.hpp"
#include "../utils/config.hpp"
#include "../utils/time_utils.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rendezvous {

struct Participant {
    std::string user_id;
    std::string display_name;
    std::string joined_at;
    std::string last_seen_at;

    std::string toJson() const;
    // Throws std::invalid_argument on malformed records
    static Participant fromJson(const std::string& json);
};

struct RoomMembership {
    std::string room_id;
    std::vector<Participant> participants;
    bool newly_joined = false;

    std::string participantsJson() const;
};

struct ExpiredPresence {
    std::string room_id;
    std::string user_id;
};

/**
 * Room membership and presence, kept entirely in the coordination store.
 *
 * The participant record doubles as the presence key: it carries the
 * presence TTL and is rewritten on every heartbeat. Membership is the
 * room's members set; a room disappears with its last member.
 */
class RoomRegistry {
public:
    RoomRegistry(std::shared_ptr<CoordinationStore> store,
                 const SignalingSettings& settings,
                 Clock clock = systemClock());

    // Throws ValidationError(invalid_room_id)
    static void validateRoomId(const std::string& room_id);

    /**
     * Register presence and membership.
     * Throws CapacityError(room_full) when the room is at capacity.
     */
    RoomMembership join(const std::string& room_id, const std::string& user_id, const std::string& display_name);

    /**
     * Renew the presence TTL.
     * @return true if the participant had already been swept and was re-added
     */
    bool heartbeat(const std::string& room_id, const std::string& user_id, const std::string& display_name);

    /**
     * Explicit removal. Deletes room metadata when the last member leaves.
     * @return true if the user was a member
     */
    bool leave(const std::string& room_id, const std::string& user_id);

    std::vector<Participant> participants(const std::string& room_id);
    std::optional<Participant> participant(const std::string& room_id, const std::string& user_id);
    bool isMember(const std::string& room_id, const std::string& user_id);
    int64_t memberCount(const std::string& room_id);
    std::vector<std::string> activeRooms();
    // Incarnation id of the room, empty if the room does not exist
    std::string roomEpoch(const std::string& room_id);

    /**
     * Remove members whose presence record expired. Only the instance whose
     * SREM actually removed the member reports it, so each lapse is reported once.
     */
    std::vector<ExpiredPresence> sweepExpiredPresence();

private:
    void writePresence(const std::string& room_id, const Participant& participant);
    void ensureEpoch(const std::string& room_id);
    void removeRoomIfEmpty(const std::string& room_id);

    std::shared_ptr<CoordinationStore> store_;
    SignalingSettings settings_;
    Clock clock_;
};

} // namespace rendezvous

#endif // ROOM_REGISTRY_HPP
