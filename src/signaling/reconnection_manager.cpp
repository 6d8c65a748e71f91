#include "../../include/signaling/reconnection_manager.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/store/store_keys.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace rendezvous {

const char* connectionStatusName(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Reconnecting: return "reconnecting";
    }
    return "connected";
}

namespace {

ConnectionStatus connectionStatusFromName(const std::string& name) {
    if (name == "connected") return ConnectionStatus::Connected;
    if (name == "disconnected") return ConnectionStatus::Disconnected;
    if (name == "reconnecting") return ConnectionStatus::Reconnecting;
    throw std::invalid_argument("unknown connection status '" + name + "'");
}

} // namespace

std::string ConnectionState::toJson() const {
    std::ostringstream oss;
    oss << "{"
        << "\"status\":\"" << connectionStatusName(status) << "\","
        << "\"last_sequence_seen\":" << last_sequence_seen << ","
        << "\"disconnected_at\":" << disconnected_at << ","
        << "\"room_epoch\":" << JsonParser::quote(room_epoch)
        << "}";
    return oss.str();
}

ConnectionState ConnectionState::fromJson(const std::string& json) {
    auto fields = JsonParser::parseObject(json);
    ConnectionState state;
    state.status = connectionStatusFromName(JsonParser::getString(fields, "status"));
    state.last_sequence_seen = JsonParser::getInt(fields, "last_sequence_seen");
    state.disconnected_at = JsonParser::getInt(fields, "disconnected_at");
    state.room_epoch = JsonParser::getString(fields, "room_epoch");
    return state;
}

int64_t ReplayDecision::highestReplayedSequence() const {
    return messages.empty() ? 0 : messages.back().sequence_number;
}

std::string ReplayDecision::toJson() const {
    std::ostringstream oss;
    oss << "{"
        << "\"is_reconnect\":" << (is_reconnect ? "true" : "false") << ","
        << "\"room_recycled\":" << (room_recycled ? "true" : "false") << ","
        << "\"last_sequence_seen\":" << last_sequence_seen << ","
        << "\"current_sequence\":" << current_sequence << ","
        << "\"replayed_message_count\":" << messages.size() << ","
        << "\"missed_message_count\":" << missed_message_count << ","
        << "\"lost_message_count\":" << lost_message_count << ","
        << "\"gap_fully_recoverable\":" << (gap_fully_recoverable ? "true" : "false")
        << "}";
    return oss.str();
}

ReconnectionManager::ReconnectionManager(std::shared_ptr<CoordinationStore> store,
                                         const SignalingSettings& settings,
                                         Clock clock)
    : store_(std::move(store))
    , settings_(settings)
    , clock_(std::move(clock)) {
}

void ReconnectionManager::writeState(const std::string& room_id, const std::string& user_id,
                                     const ConnectionState& state) {
    store_->setex(keys::connectionState(room_id, user_id), state.toJson(), settings_.grace_window_seconds);
}

std::optional<ConnectionState> ReconnectionManager::connectionState(const std::string& room_id,
                                                                    const std::string& user_id) {
    std::optional<std::string> raw = store_->get(keys::connectionState(room_id, user_id));
    if (!raw) {
        return std::nullopt;
    }
    try {
        return ConnectionState::fromJson(*raw);
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().warning("Corrupt connection state for " + user_id + " in " + room_id + ": " +
                                      e.what());
        return std::nullopt;
    }
}

int64_t ReconnectionManager::currentSequence(const std::string& room_id) {
    std::optional<std::string> raw = store_->get(keys::roomSequence(room_id));
    if (!raw) {
        return 0;
    }
    try {
        return std::stoll(*raw);
    } catch (const std::exception&) {
        Logger::getInstance().warning("Sequence counter of room " + room_id + " is not a number");
        return 0;
    }
}

std::vector<SignalingMessage> ReconnectionManager::bufferedMessages(const std::string& room_id) {
    std::vector<SignalingMessage> messages;
    for (const auto& entry : store_->lrange(keys::roomBuffer(room_id), 0, -1)) {
        try {
            messages.push_back(SignalingProtocol::parse(entry));
        } catch (const ValidationError& e) {
            Logger::getInstance().warning("Skipping unreadable buffer entry in room " + room_id + ": " + e.what());
        }
    }
    std::stable_sort(messages.begin(), messages.end(), [](const SignalingMessage& a, const SignalingMessage& b) {
        return a.sequence_number < b.sequence_number;
    });
    return messages;
}

std::string ReconnectionManager::currentEpoch(const std::string& room_id) {
    return store_->get(keys::roomEpoch(room_id)).value_or("");
}

ReplayDecision ReconnectionManager::onConnect(const std::string& room_id, const std::string& user_id) {
    ReplayDecision decision;
    decision.current_sequence = currentSequence(room_id);
    const std::string epoch = currentEpoch(room_id);

    std::optional<ConnectionState> previous = connectionState(room_id, user_id);
    const int64_t now = clock_();
    const int64_t grace_ms = static_cast<int64_t>(settings_.grace_window_seconds) * 1000;

    bool resumable = previous &&
                     previous->status == ConnectionStatus::Disconnected &&
                     now - previous->disconnected_at <= grace_ms;

    if (!resumable) {
        ConnectionState fresh;
        fresh.status = ConnectionStatus::Connected;
        fresh.last_sequence_seen = decision.current_sequence;
        fresh.room_epoch = epoch;
        writeState(room_id, user_id, fresh);
        return decision;
    }

    ConnectionState reconnecting = *previous;
    reconnecting.status = ConnectionStatus::Reconnecting;
    writeState(room_id, user_id, reconnecting);

    decision.is_reconnect = true;
    decision.last_sequence_seen = previous->last_sequence_seen;
    decision.room_recycled = (!previous->room_epoch.empty() && previous->room_epoch != epoch) ||
                             decision.current_sequence < previous->last_sequence_seen;

    // After a recycle the old numbering is gone; replay the new incarnation from its start
    const int64_t resume_after = decision.room_recycled ? 0 : previous->last_sequence_seen;
    decision.missed_message_count = decision.current_sequence - resume_after;

    std::set<int64_t> retained;
    for (auto& message : bufferedMessages(room_id)) {
        if (message.sequence_number <= resume_after ||
            message.sequence_number > decision.current_sequence) {
            continue;
        }
        if (!retained.insert(message.sequence_number).second) {
            continue;
        }
        if (SignalingProtocol::shouldDeliver(message, user_id)) {
            decision.messages.push_back(std::move(message));
        }
    }

    decision.lost_message_count = decision.missed_message_count - static_cast<int64_t>(retained.size());
    decision.gap_fully_recoverable = !decision.room_recycled && decision.lost_message_count == 0;

    ConnectionState connected;
    connected.status = ConnectionStatus::Connected;
    connected.last_sequence_seen = decision.current_sequence;
    connected.room_epoch = epoch;
    writeState(room_id, user_id, connected);

    if (decision.room_recycled) {
        Logger::getInstance().warning("Room " + room_id + " was recycled since " + user_id +
                                      " disconnected; messages of the previous incarnation are lost");
    } else if (decision.gap_fully_recoverable) {
        Logger::getInstance().info("Replaying " + std::to_string(decision.messages.size()) + " messages to " +
                                   user_id + " in room " + room_id);
    } else {
        Logger::getInstance().warning("Partial replay for " + user_id + " in room " + room_id + ": " +
                                      std::to_string(decision.lost_message_count) + " of " +
                                      std::to_string(decision.missed_message_count) +
                                      " missed messages no longer buffered");
    }
    return decision;
}

void ReconnectionManager::onDisconnect(const std::string& room_id, const std::string& user_id,
                                       int64_t last_sequence_seen) {
    ConnectionState state;
    state.status = ConnectionStatus::Disconnected;
    state.last_sequence_seen = last_sequence_seen;
    state.disconnected_at = clock_();
    state.room_epoch = currentEpoch(room_id);
    writeState(room_id, user_id, state);
    Logger::getInstance().debug("User " + user_id + " disconnected from " + room_id + " at sequence " +
                                std::to_string(last_sequence_seen));
}

void ReconnectionManager::onPublish(const SignalingMessage& message, const std::string& serialized) {
    if (message.sequence_number <= 0) {
        return;
    }
    const std::string key = keys::roomBuffer(message.room_id);
    store_->rpush(key, serialized);
    store_->ltrim(key, -static_cast<int64_t>(settings_.buffer_size), -1);
    store_->expire(key, settings_.buffer_ttl_seconds);
}

} // namespace rendezvous
