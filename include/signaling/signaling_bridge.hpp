#ifndef SIGNALING_BRIDGE_HPP
#define SIGNALING_BRIDGE_HPP

#include "signaling_protocol.hpp"
#include "../store/coordination_store.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rendezvous {

/**
 * Cross-instance fan-out over the coordination store's pub/sub.
 *
 * Every instance pattern-subscribes to all room channels and forwards each
 * message to the sockets connected to it:
 *   Instance A (sender) -> rendezvous:room:{id} -> Instance B (room members)
 * Which local endpoints receive a message is decided by
 * SignalingProtocol::shouldDeliver.
 */
class SignalingBridge {
public:
    using DeliveryHandler = std::function<void(const SignalingMessage& message, const std::string& serialized)>;
    using EndpointId = uint64_t;

    SignalingBridge(std::shared_ptr<CoordinationStore> store, const std::string& instance_id);
    ~SignalingBridge();

    /**
     * Subscribe to the room channel pattern. Safe to call more than once.
     */
    void start();
    void stop();

    /**
     * Register a locally connected socket for a room.
     * @return id used to unregister exactly this endpoint
     */
    EndpointId registerEndpoint(const std::string& room_id, const std::string& user_id, DeliveryHandler handler);
    void unregisterEndpoint(const std::string& room_id, EndpointId id);

    /**
     * Deliver to matching local endpoints of the message's room.
     * @return number of endpoints the message was handed to
     */
    size_t deliverLocal(const SignalingMessage& message);

    bool isUserLocal(const std::string& room_id, const std::string& user_id) const;
    size_t localEndpointCount() const;

    const std::string& getInstanceId() const { return instance_id_; }

private:
    struct Endpoint {
        std::string user_id;
        DeliveryHandler handler;
    };

    void handleStoreMessage(const std::string& channel, const std::string& message);

    std::shared_ptr<CoordinationStore> store_;
    std::string instance_id_;
    std::atomic<bool> running_{false};
    std::atomic<EndpointId> next_id_{1};

    // room_id -> (endpoint id -> endpoint)
    std::map<std::string, std::map<EndpointId, Endpoint>> endpoints_;
    mutable std::mutex endpoints_mutex_;
};

} // namespace rendezvous

#endif // SIGNALING_BRIDGE_HPP
