#ifndef STORE_KEYS_HPP
#define STORE_KEYS_HPP

#include <string>

namespace rendezvous {
namespace keys {

// Key layout shared by every instance. Changing any of these breaks
// mixed-version deployments.

inline const std::string kPrefix = "rendezvous:";
inline const std::string kRoomChannelPattern = "rendezvous:room:*";

inline std::string rooms() { return kPrefix + "rooms"; }
inline std::string roomChannel(const std::string& room_id) { return kPrefix + "room:" + room_id; }
inline std::string roomMembers(const std::string& room_id) { return roomChannel(room_id) + ":members"; }
inline std::string roomSequence(const std::string& room_id) { return roomChannel(room_id) + ":seq"; }
inline std::string roomBuffer(const std::string& room_id) { return roomChannel(room_id) + ":buffer"; }
// Random id of the room's current incarnation, regenerated after the room empties
inline std::string roomEpoch(const std::string& room_id) { return roomChannel(room_id) + ":epoch"; }

inline std::string participant(const std::string& room_id, const std::string& user_id) {
    return roomChannel(room_id) + ":participant:" + user_id;
}

inline std::string connectionState(const std::string& room_id, const std::string& user_id) {
    return roomChannel(room_id) + ":conn:" + user_id;
}

inline std::string transfer(const std::string& transfer_id) { return kPrefix + "transfer:" + transfer_id; }
inline std::string transferChunks(const std::string& transfer_id) { return transfer(transfer_id) + ":chunks"; }
inline std::string transferFinalizeLock(const std::string& transfer_id) { return transfer(transfer_id) + ":finalize"; }
inline std::string userTransfers(const std::string& user_id) { return kPrefix + "transfers:user:" + user_id; }
inline std::string transferIndex() { return kPrefix + "transfers:index"; }
inline std::string activeTransfers(const std::string& sender_id) { return kPrefix + "transfers:active:" + sender_id; }

// Room id carried by a pub/sub channel name, or empty if the channel is not a room channel
inline std::string roomFromChannel(const std::string& channel) {
    const std::string prefix = kPrefix + "room:";
    if (channel.compare(0, prefix.size(), prefix) != 0) return "";
    std::string rest = channel.substr(prefix.size());
    if (rest.find(':') != std::string::npos) return "";
    return rest;
}

} // namespace keys
} // namespace rendezvous

#endif // STORE_KEYS_HPP
