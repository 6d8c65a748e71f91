#include "../../include/signaling/signaling_relay.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/store/store_keys.hpp"
#include "../../include/utils/logger.hpp"

namespace rendezvous {

SignalingRelay::SignalingRelay(std::shared_ptr<CoordinationStore> store,
                               std::shared_ptr<RoomRegistry> registry,
                               std::shared_ptr<SignalingBridge> bridge,
                               const SignalingSettings& settings,
                               Clock clock)
    : store_(std::move(store))
    , registry_(std::move(registry))
    , bridge_(std::move(bridge))
    , settings_(settings)
    , clock_(std::move(clock)) {
}

void SignalingRelay::addPublishHook(PublishHook hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.push_back(std::move(hook));
}

RoomMembership SignalingRelay::join(const std::string& room_id, const std::string& user_id,
                                    const std::string& display_name) {
    RoomMembership membership = registry_->join(room_id, user_id, display_name);
    if (membership.newly_joined) {
        std::string joined_at = formatIsoTimestamp(clock_());
        for (const auto& participant : membership.participants) {
            if (participant.user_id == user_id) {
                joined_at = participant.joined_at;
                break;
            }
        }
        publish(SignalingProtocol::createUserJoined(room_id, user_id,
                                                    display_name.empty() ? user_id : display_name,
                                                    joined_at));
    }
    return membership;
}

SignalingMessage SignalingRelay::publish(SignalingMessage message) {
    SignalingProtocol::validate(message);

    switch (SignalingProtocol::categoryOf(message.type)) {
        case MessageCategory::Control:
            throw ValidationError(std::string("'") + SignalingProtocol::typeName(message.type) +
                                  "' is a control message and is never relayed",
                                  ErrorCode::INVALID_MESSAGE_TYPE);
        case MessageCategory::Signaling:
        case MessageCategory::Presence:
        case MessageCategory::FileTransfer:
            break;
    }

    message.timestamp = formatIsoTimestamp(clock_());

    try {
        const std::string seq_key = keys::roomSequence(message.room_id);
        // No TTL: the counter lives as long as the room and is deleted with it
        message.sequence_number = store_->incr(seq_key);

        const std::string serialized = SignalingProtocol::serialize(message);

        std::vector<PublishHook> hooks;
        {
            std::lock_guard<std::mutex> lock(hooks_mutex_);
            hooks = hooks_;
        }
        for (const auto& hook : hooks) {
            hook(message, serialized);
        }

        store_->publish(keys::roomChannel(message.room_id), serialized);
        return message;
    } catch (const CoordinationStoreError& e) {
        Logger::getInstance().warning("Store unavailable, local-only delivery in room " + message.room_id +
                                      ": " + e.what());
        message.sequence_number = 0;
        bridge_->deliverLocal(message);
        return message;
    }
}

void SignalingRelay::heartbeat(const std::string& room_id, const std::string& user_id,
                               const std::string& display_name) {
    if (registry_->heartbeat(room_id, user_id, display_name)) {
        // Presence had lapsed and was swept; announce the user again
        std::optional<Participant> self = registry_->participant(room_id, user_id);
        publish(SignalingProtocol::createUserJoined(room_id, user_id,
                                                    self ? self->display_name : user_id,
                                                    self ? self->joined_at : formatIsoTimestamp(clock_())));
    }
}

void SignalingRelay::leave(const std::string& room_id, const std::string& user_id) {
    if (registry_->leave(room_id, user_id) && !registry_->participants(room_id).empty()) {
        publish(SignalingProtocol::createUserLeft(room_id, user_id, "left"));
    }
}

size_t SignalingRelay::sweepPresence() {
    std::vector<ExpiredPresence> expired = registry_->sweepExpiredPresence();
    for (const auto& entry : expired) {
        if (!registry_->isMember(entry.room_id, entry.user_id) && !registry_->participants(entry.room_id).empty()) {
            publish(SignalingProtocol::createUserLeft(entry.room_id, entry.user_id, "timeout"));
        }
    }
    return expired.size();
}

} // namespace rendezvous
