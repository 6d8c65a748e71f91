#ifndef ROOM_CONNECTION_HPP
#define ROOM_CONNECTION_HPP

#include "reconnection_manager.hpp"
#include "room_registry.hpp"
#include "signaling_relay.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rendezvous {

// A serialized frame and the room sequence the client has seen once it is written
struct OutboundFrame {
    std::string text;
    int64_t sequence_mark = 0;  // 0 = carries no room sequence
};

struct RoomOpening {
    RoomMembership membership;
    ReplayDecision decision;
    // RoomState first, then the replayed messages in sequence order
    std::vector<OutboundFrame> frames;
};

/**
 * Sequence bookkeeping of one participant's live connection to a room.
 *
 * The owner registers its bridge endpoint before open(), so no message is
 * published unseen between the two. admit() filters live messages against
 * the replay horizon. The last seen sequence only advances through
 * written(), so frames that never reached the socket are replayed on the
 * next reconnect.
 *
 * Not thread-safe; the owning session calls it from its strand.
 */
class RoomConnection {
public:
    RoomConnection(std::shared_ptr<SignalingRelay> relay,
                   std::shared_ptr<ReconnectionManager> reconnection,
                   const std::string& room_id,
                   const std::string& user_id,
                   const std::string& display_name,
                   Clock clock = systemClock());

    // Throws ValidationError / CapacityError / CoordinationStoreError
    RoomOpening open();

    // Frame for a live message, or nullopt if it was already replayed or predates the join
    std::optional<OutboundFrame> admit(const SignalingMessage& message, const std::string& serialized) const;

    void written(const OutboundFrame& frame);

    // Explicit leave; no reconnection state is kept afterwards
    void leave();
    // Connection lost; records the last written sequence for a later resume
    void disconnect();

    int64_t lastSequenceSeen() const { return last_sequence_seen_; }
    int64_t replayHorizon() const { return replay_horizon_; }
    const std::string& roomId() const { return room_id_; }

private:
    std::shared_ptr<SignalingRelay> relay_;
    std::shared_ptr<ReconnectionManager> reconnection_;
    std::string room_id_;
    std::string user_id_;
    std::string display_name_;
    Clock clock_;

    int64_t replay_horizon_ = 0;
    int64_t last_sequence_seen_ = 0;
    bool left_ = false;
};

} // namespace rendezvous

#endif // ROOM_CONNECTION_HPP
