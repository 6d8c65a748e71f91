#ifndef RECONNECTION_MANAGER_HPP
#define RECONNECTION_MANAGER_HPP

#include "signaling_protocol.hpp"
#include "../store/coordination_store.hpp"
#include "../utils/config.hpp"
#include "../utils/time_utils.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rendezvous {

enum class ConnectionStatus {
    Connected,
    Disconnected,
    Reconnecting
};

const char* connectionStatusName(ConnectionStatus status);

struct ConnectionState {
    ConnectionStatus status = ConnectionStatus::Connected;
    int64_t last_sequence_seen = 0;
    int64_t disconnected_at = 0;  // epoch ms, 0 while connected
    std::string room_epoch;       // incarnation the sequence number belongs to

    std::string toJson() const;
    // Throws std::invalid_argument on malformed records
    static ConnectionState fromJson(const std::string& json);
};

/**
 * Outcome of a (re)connect. For a reconnect, messages holds the buffered
 * messages this user missed, in sequence order. When part of the gap has
 * already been evicted from the buffer, gap_fully_recoverable is false and
 * lost_message_count says how many sequence numbers cannot be replayed.
 * If the room emptied and was recreated while the user was away, the
 * numbering restarted: room_recycled is set, the new incarnation is replayed
 * from its start and the gap is never fully recoverable.
 */
struct ReplayDecision {
    bool is_reconnect = false;
    bool room_recycled = false;
    std::vector<SignalingMessage> messages;
    int64_t last_sequence_seen = 0;
    int64_t current_sequence = 0;
    int64_t missed_message_count = 0;
    int64_t lost_message_count = 0;
    bool gap_fully_recoverable = true;

    int64_t highestReplayedSequence() const;
    std::string toJson() const;
};

/**
 * Per-room replay buffer and per-participant connection state.
 *
 * onPublish runs synchronously inside every relay publish and appends to a
 * bounded list (RPUSH + LTRIM). onConnect compares the participant's last
 * seen sequence number with the room counter and returns the gap.
 */
class ReconnectionManager {
public:
    ReconnectionManager(std::shared_ptr<CoordinationStore> store,
                        const SignalingSettings& settings,
                        Clock clock = systemClock());

    ReplayDecision onConnect(const std::string& room_id, const std::string& user_id);
    void onDisconnect(const std::string& room_id, const std::string& user_id, int64_t last_sequence_seen);
    void onPublish(const SignalingMessage& message, const std::string& serialized);

    std::optional<ConnectionState> connectionState(const std::string& room_id, const std::string& user_id);
    std::vector<SignalingMessage> bufferedMessages(const std::string& room_id);
    int64_t currentSequence(const std::string& room_id);
    std::string currentEpoch(const std::string& room_id);

private:
    void writeState(const std::string& room_id, const std::string& user_id, const ConnectionState& state);

    std::shared_ptr<CoordinationStore> store_;
    SignalingSettings settings_;
    Clock clock_;
};

} // namespace rendezvous

#endif // RECONNECTION_MANAGER_HPP
