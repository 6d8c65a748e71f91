#include "../../include/signaling/room_connection.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>

namespace rendezvous {

RoomConnection::RoomConnection(std::shared_ptr<SignalingRelay> relay,
                               std::shared_ptr<ReconnectionManager> reconnection,
                               const std::string& room_id,
                               const std::string& user_id,
                               const std::string& display_name,
                               Clock clock)
    : relay_(std::move(relay))
    , reconnection_(std::move(reconnection))
    , room_id_(room_id)
    , user_id_(user_id)
    , display_name_(display_name)
    , clock_(std::move(clock)) {
}

RoomOpening RoomConnection::open() {
    // Anything sequenced after this read reaches the already registered endpoint
    const int64_t before_join = reconnection_->currentSequence(room_id_);

    RoomOpening opening;
    opening.membership = relay_->join(room_id_, user_id_, display_name_);
    opening.decision = reconnection_->onConnect(room_id_, user_id_);
    const ReplayDecision& decision = opening.decision;

    if (decision.is_reconnect) {
        replay_horizon_ = decision.current_sequence;
        last_sequence_seen_ = decision.room_recycled ? 0 : decision.last_sequence_seen;
    } else {
        replay_horizon_ = std::min(before_join, decision.current_sequence);
        last_sequence_seen_ = replay_horizon_;
    }

    SignalingMessage state = SignalingProtocol::createRoomState(
        room_id_, user_id_, opening.membership.participantsJson(), opening.membership.participants.size(),
        decision.is_reconnect ? decision.toJson() : "");
    state.timestamp = formatIsoTimestamp(clock_());

    OutboundFrame state_frame;
    state_frame.text = SignalingProtocol::serialize(state);
    state_frame.sequence_mark = decision.is_reconnect ? last_sequence_seen_ : replay_horizon_;
    opening.frames.push_back(std::move(state_frame));

    for (const auto& missed : decision.messages) {
        OutboundFrame frame;
        frame.text = SignalingProtocol::serialize(missed);
        frame.sequence_mark = missed.sequence_number;
        opening.frames.push_back(std::move(frame));
    }

    // The rest of the gap was either not addressed to this user or reported as lost
    if (decision.is_reconnect) {
        opening.frames.back().sequence_mark = decision.current_sequence;
    }
    return opening;
}

std::optional<OutboundFrame> RoomConnection::admit(const SignalingMessage& message,
                                                   const std::string& serialized) const {
    if (message.sequence_number != 0 && message.sequence_number <= replay_horizon_) {
        return std::nullopt;
    }
    OutboundFrame frame;
    frame.text = serialized;
    frame.sequence_mark = message.sequence_number;
    return frame;
}

void RoomConnection::written(const OutboundFrame& frame) {
    last_sequence_seen_ = std::max(last_sequence_seen_, frame.sequence_mark);
}

void RoomConnection::leave() {
    left_ = true;
    relay_->leave(room_id_, user_id_);
}

void RoomConnection::disconnect() {
    if (left_) {
        return;
    }
    try {
        reconnection_->onDisconnect(room_id_, user_id_, last_sequence_seen_);
    } catch (const RendezvousError& e) {
        Logger::getInstance().warning("Could not record disconnect of " + user_id_ + " from room " + room_id_ +
                                      ": " + e.what());
    }
}

} // namespace rendezvous
