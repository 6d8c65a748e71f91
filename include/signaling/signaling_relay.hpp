#ifndef SIGNALING_RELAY_HPP
#define SIGNALING_RELAY_HPP

#include "room_registry.hpp"
#include "signaling_bridge.hpp"
#include "signaling_protocol.hpp"
#include "../store/coordination_store.hpp"
#include "../utils/time_utils.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace rendezvous {

/**
 * Room-level entry point for signaling: membership changes, sequenced
 * publish and presence upkeep.
 *
 * publish() assigns the room's next sequence number (INCR), runs the
 * registered publish hooks synchronously, then publishes to the room
 * channel. If the store is unreachable the message is delivered to this
 * instance's sockets only, with sequence number 0.
 */
class SignalingRelay {
public:
    using PublishHook = std::function<void(const SignalingMessage& message, const std::string& serialized)>;

    SignalingRelay(std::shared_ptr<CoordinationStore> store,
                   std::shared_ptr<RoomRegistry> registry,
                   std::shared_ptr<SignalingBridge> bridge,
                   const SignalingSettings& settings,
                   Clock clock = systemClock());

    void addPublishHook(PublishHook hook);

    /**
     * Join a room and announce the user to existing members when they were
     * not already present. Throws ValidationError / CapacityError.
     */
    RoomMembership join(const std::string& room_id, const std::string& user_id, const std::string& display_name);

    /**
     * Validate, sequence and fan out a message.
     * @return the message as delivered (sequence number and timestamp set)
     */
    SignalingMessage publish(SignalingMessage message);

    void heartbeat(const std::string& room_id, const std::string& user_id, const std::string& display_name);
    void leave(const std::string& room_id, const std::string& user_id);

    /**
     * Remove lapsed participants and broadcast UserLeft for each one this
     * instance removed.
     * @return number of participants removed
     */
    size_t sweepPresence();

    std::shared_ptr<RoomRegistry> registry() const { return registry_; }
    std::shared_ptr<SignalingBridge> bridge() const { return bridge_; }

private:
    std::shared_ptr<CoordinationStore> store_;
    std::shared_ptr<RoomRegistry> registry_;
    std::shared_ptr<SignalingBridge> bridge_;
    SignalingSettings settings_;
    Clock clock_;

    std::mutex hooks_mutex_;
    std::vector<PublishHook> hooks_;
};

} // namespace rendezvous

#endif // SIGNALING_RELAY_HPP
