#include "../../include/signaling/signaling_bridge.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/store/store_keys.hpp"
#include "../../include/utils/logger.hpp"
#include <vector>

namespace rendezvous {

SignalingBridge::SignalingBridge(std::shared_ptr<CoordinationStore> store, const std::string& instance_id)
    : store_(std::move(store))
    , instance_id_(instance_id) {
    Logger::getInstance().info("Signaling bridge initialized: " + instance_id_);
}

SignalingBridge::~SignalingBridge() {
    stop();
}

void SignalingBridge::start() {
    if (running_.exchange(true)) {
        return;
    }
    store_->psubscribe(keys::kRoomChannelPattern,
                       [this](const std::string& channel, const std::string& message) {
                           handleStoreMessage(channel, message);
                       });
    Logger::getInstance().info("Signaling bridge subscribed to " + keys::kRoomChannelPattern);
}

void SignalingBridge::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    endpoints_.clear();
    Logger::getInstance().info("Signaling bridge stopped");
}

SignalingBridge::EndpointId SignalingBridge::registerEndpoint(const std::string& room_id,
                                                              const std::string& user_id,
                                                              DeliveryHandler handler) {
    EndpointId id = next_id_++;
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    endpoints_[room_id][id] = Endpoint{user_id, std::move(handler)};
    Logger::getInstance().debug("Registered local endpoint " + std::to_string(id) + " for " + user_id +
                                " in room " + room_id);
    return id;
}

void SignalingBridge::unregisterEndpoint(const std::string& room_id, EndpointId id) {
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    auto room_it = endpoints_.find(room_id);
    if (room_it == endpoints_.end()) {
        return;
    }
    room_it->second.erase(id);
    if (room_it->second.empty()) {
        endpoints_.erase(room_it);
    }
    Logger::getInstance().debug("Unregistered local endpoint " + std::to_string(id) + " in room " + room_id);
}

size_t SignalingBridge::deliverLocal(const SignalingMessage& message) {
    std::vector<DeliveryHandler> targets;
    {
        std::lock_guard<std::mutex> lock(endpoints_mutex_);
        auto room_it = endpoints_.find(message.room_id);
        if (room_it == endpoints_.end()) {
            return 0;
        }
        for (const auto& entry : room_it->second) {
            if (SignalingProtocol::shouldDeliver(message, entry.second.user_id)) {
                targets.push_back(entry.second.handler);
            }
        }
    }

    if (targets.empty()) {
        return 0;
    }

    const std::string serialized = SignalingProtocol::serialize(message);
    for (const auto& handler : targets) {
        try {
            handler(message, serialized);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Local delivery failed in room " + message.room_id + ": " + e.what());
        }
    }
    return targets.size();
}

bool SignalingBridge::isUserLocal(const std::string& room_id, const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    auto room_it = endpoints_.find(room_id);
    if (room_it == endpoints_.end()) {
        return false;
    }
    for (const auto& entry : room_it->second) {
        if (entry.second.user_id == user_id) {
            return true;
        }
    }
    return false;
}

size_t SignalingBridge::localEndpointCount() const {
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    size_t count = 0;
    for (const auto& room : endpoints_) {
        count += room.second.size();
    }
    return count;
}

void SignalingBridge::handleStoreMessage(const std::string& channel, const std::string& message) {
    if (!running_) {
        return;
    }
    const std::string room_id = keys::roomFromChannel(channel);
    if (room_id.empty()) {
        Logger::getInstance().warning("Ignoring message on unexpected channel: " + channel);
        return;
    }

    SignalingMessage parsed;
    try {
        parsed = SignalingProtocol::parse(message);
    } catch (const ValidationError& e) {
        Logger::getInstance().warning("Dropping malformed message on " + channel + ": " + e.what());
        return;
    }
    if (parsed.room_id != room_id) {
        Logger::getInstance().warning("Room mismatch on " + channel + " (envelope says " + parsed.room_id + ")");
        return;
    }

    deliverLocal(parsed);
}

} // namespace rendezvous
