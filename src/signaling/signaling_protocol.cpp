#include "../../include/signaling/signaling_protocol.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <initializer_list>

namespace rendezvous {
namespace SignalingProtocol {

namespace {

void requireString(const std::map<std::string, JsonField>& fields, const std::string& key, MessageType type) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->second.is_string || it->second.value.empty()) {
        throw ValidationError(std::string(typeName(type)) + " payload requires string field '" + key + "'",
                              ErrorCode::INVALID_PAYLOAD);
    }
}

void requireInt(const std::map<std::string, JsonField>& fields, const std::string& key, MessageType type) {
    auto it = fields.find(key);
    if (it == fields.end() || it->second.is_string || it->second.isNull()) {
        throw ValidationError(std::string(typeName(type)) + " payload requires integer field '" + key + "'",
                              ErrorCode::INVALID_PAYLOAD);
    }
    try {
        JsonParser::getInt(fields, key);
    } catch (const std::invalid_argument&) {
        throw ValidationError(std::string(typeName(type)) + " field '" + key + "' is not an integer",
                              ErrorCode::INVALID_PAYLOAD);
    }
}

std::string optionalString(const std::string& value) {
    return value.empty() ? std::string("null") : JsonParser::quote(value);
}

SignalingMessage makeServerMessage(MessageType type, const std::string& room_id, const std::string& payload) {
    SignalingMessage message;
    message.type = type;
    message.room_id = room_id;
    message.payload = payload;
    return message;
}

} // namespace

const char* typeName(MessageType type) {
    switch (type) {
        case MessageType::Offer: return OFFER;
        case MessageType::Answer: return ANSWER;
        case MessageType::IceCandidate: return ICE_CANDIDATE;
        case MessageType::UserJoined: return USER_JOINED;
        case MessageType::UserLeft: return USER_LEFT;
        case MessageType::RoomState: return ROOM_STATE;
        case MessageType::Error: return ERROR;
        case MessageType::FileTransferOffer: return FILE_TRANSFER_OFFER;
        case MessageType::FileTransferAccept: return FILE_TRANSFER_ACCEPT;
        case MessageType::FileTransferReject: return FILE_TRANSFER_REJECT;
        case MessageType::FileTransferChunk: return FILE_TRANSFER_CHUNK;
        case MessageType::FileTransferProgress: return FILE_TRANSFER_PROGRESS;
        case MessageType::FileTransferComplete: return FILE_TRANSFER_COMPLETE;
        case MessageType::Heartbeat: return HEARTBEAT;
        case MessageType::Leave: return LEAVE;
    }
    return ERROR;
}

std::optional<MessageType> typeFromName(const std::string& name) {
    static const std::initializer_list<MessageType> all = {
        MessageType::Offer, MessageType::Answer, MessageType::IceCandidate,
        MessageType::UserJoined, MessageType::UserLeft, MessageType::RoomState, MessageType::Error,
        MessageType::FileTransferOffer, MessageType::FileTransferAccept, MessageType::FileTransferReject,
        MessageType::FileTransferChunk, MessageType::FileTransferProgress, MessageType::FileTransferComplete,
        MessageType::Heartbeat, MessageType::Leave
    };
    for (MessageType type : all) {
        if (name == typeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

MessageCategory categoryOf(MessageType type) {
    switch (type) {
        case MessageType::Offer:
        case MessageType::Answer:
        case MessageType::IceCandidate:
            return MessageCategory::Signaling;
        case MessageType::UserJoined:
        case MessageType::UserLeft:
        case MessageType::RoomState:
        case MessageType::Error:
            return MessageCategory::Presence;
        case MessageType::FileTransferOffer:
        case MessageType::FileTransferAccept:
        case MessageType::FileTransferReject:
        case MessageType::FileTransferChunk:
        case MessageType::FileTransferProgress:
        case MessageType::FileTransferComplete:
            return MessageCategory::FileTransfer;
        case MessageType::Heartbeat:
        case MessageType::Leave:
            return MessageCategory::Control;
    }
    return MessageCategory::Control;
}

bool isClientOriginated(MessageType type) {
    switch (type) {
        case MessageType::Offer:
        case MessageType::Answer:
        case MessageType::IceCandidate:
        case MessageType::FileTransferOffer:
        case MessageType::FileTransferAccept:
        case MessageType::FileTransferReject:
        case MessageType::FileTransferChunk:
        case MessageType::FileTransferProgress:
        case MessageType::Heartbeat:
        case MessageType::Leave:
            return true;
        case MessageType::UserJoined:
        case MessageType::UserLeft:
        case MessageType::RoomState:
        case MessageType::Error:
        case MessageType::FileTransferComplete:
            return false;
    }
    return false;
}

SignalingMessage parse(const std::string& json) {
    std::map<std::string, JsonField> fields;
    try {
        fields = JsonParser::parseObject(json);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Malformed message: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
    }

    auto type_it = fields.find("type");
    if (type_it == fields.end() || !type_it->second.is_string) {
        throw ValidationError("Message is missing a string 'type'", ErrorCode::INVALID_MESSAGE_TYPE);
    }
    std::optional<MessageType> type = typeFromName(type_it->second.value);
    if (!type) {
        throw ValidationError("Unknown message type '" + type_it->second.value + "'",
                              ErrorCode::INVALID_MESSAGE_TYPE);
    }

    SignalingMessage message;
    message.type = *type;

    try {
        auto payload_it = fields.find("payload");
        if (payload_it == fields.end() || payload_it->second.isNull()) {
            message.payload = "{}";
        } else if (payload_it->second.isObject()) {
            message.payload = payload_it->second.value;
        } else {
            throw ValidationError("'payload' must be a JSON object", ErrorCode::INVALID_PAYLOAD);
        }

        message.sender_id = JsonParser::getString(fields, "sender_id");
        message.target_user_id = JsonParser::getString(fields, "target_user_id");
        message.room_id = JsonParser::getString(fields, "room_id");
        message.timestamp = JsonParser::getString(fields, "timestamp");
        message.sequence_number = JsonParser::getInt(fields, "sequence_number", 0);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Malformed envelope field: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
    }

    if (message.sequence_number < 0) {
        throw ValidationError("'sequence_number' must not be negative", ErrorCode::INVALID_PAYLOAD);
    }
    return message;
}

std::string serialize(const SignalingMessage& message) {
    std::ostringstream oss;
    oss << "{"
        << "\"type\":\"" << typeName(message.type) << "\","
        << "\"payload\":" << (message.payload.empty() ? "{}" : message.payload) << ","
        << "\"sender_id\":" << optionalString(message.sender_id) << ","
        << "\"target_user_id\":" << optionalString(message.target_user_id) << ","
        << "\"room_id\":" << JsonParser::quote(message.room_id) << ","
        << "\"timestamp\":" << JsonParser::quote(message.timestamp) << ","
        << "\"sequence_number\":" << message.sequence_number
        << "}";
    return oss.str();
}

void validate(const SignalingMessage& message) {
    if (message.room_id.empty()) {
        throw ValidationError("Message has no room_id", ErrorCode::INVALID_PAYLOAD);
    }

    std::map<std::string, JsonField> fields;
    try {
        fields = JsonParser::parseObject(message.payload);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Payload is not a JSON object: ") + e.what(),
                              ErrorCode::INVALID_PAYLOAD);
    }

    switch (message.type) {
        case MessageType::Offer:
        case MessageType::Answer:
            requireString(fields, "sdp", message.type);
            break;
        case MessageType::IceCandidate:
            requireString(fields, "candidate", message.type);
            break;
        case MessageType::UserJoined:
        case MessageType::UserLeft:
            requireString(fields, "user_id", message.type);
            break;
        case MessageType::RoomState:
            if (fields.find("participants") == fields.end() || !fields.at("participants").isArray()) {
                throw ValidationError("room-state payload requires a 'participants' array",
                                      ErrorCode::INVALID_PAYLOAD);
            }
            break;
        case MessageType::Error:
            requireString(fields, "code", message.type);
            requireString(fields, "message", message.type);
            break;
        case MessageType::FileTransferOffer:
            requireString(fields, "filename", message.type);
            requireInt(fields, "size_bytes", message.type);
            break;
        case MessageType::FileTransferAccept:
        case MessageType::FileTransferReject:
        case MessageType::FileTransferProgress:
        case MessageType::FileTransferComplete:
            requireString(fields, "transfer_id", message.type);
            break;
        case MessageType::FileTransferChunk:
            requireString(fields, "transfer_id", message.type);
            requireInt(fields, "chunk_index", message.type);
            requireString(fields, "data", message.type);
            break;
        case MessageType::Heartbeat:
        case MessageType::Leave:
            break;
    }
}

bool shouldDeliver(const SignalingMessage& message, const std::string& user_id) {
    if (!message.target_user_id.empty()) {
        return message.target_user_id == user_id;
    }
    return message.sender_id != user_id;
}

SignalingMessage createUserJoined(const std::string& room_id,
                                  const std::string& user_id,
                                  const std::string& display_name,
                                  const std::string& joined_at) {
    std::ostringstream oss;
    oss << "{"
        << "\"user_id\":" << JsonParser::quote(user_id) << ","
        << "\"display_name\":" << JsonParser::quote(display_name) << ","
        << "\"joined_at\":" << JsonParser::quote(joined_at)
        << "}";
    SignalingMessage message = makeServerMessage(MessageType::UserJoined, room_id, oss.str());
    message.sender_id = user_id;
    return message;
}

SignalingMessage createUserLeft(const std::string& room_id,
                                const std::string& user_id,
                                const std::string& reason) {
    std::ostringstream oss;
    oss << "{"
        << "\"user_id\":" << JsonParser::quote(user_id) << ","
        << "\"reason\":" << JsonParser::quote(reason)
        << "}";
    SignalingMessage message = makeServerMessage(MessageType::UserLeft, room_id, oss.str());
    message.sender_id = user_id;
    return message;
}

SignalingMessage createRoomState(const std::string& room_id,
                                 const std::string& user_id,
                                 const std::string& participants_json,
                                 size_t participant_count,
                                 const std::string& reconnect_json) {
    std::ostringstream oss;
    oss << "{"
        << "\"room_id\":" << JsonParser::quote(room_id) << ","
        << "\"user_id\":" << JsonParser::quote(user_id) << ","
        << "\"participants\":" << (participants_json.empty() ? "[]" : participants_json) << ","
        << "\"participant_count\":" << participant_count;
    if (!reconnect_json.empty()) {
        oss << ",\"reconnect\":" << reconnect_json;
    }
    oss << "}";
    SignalingMessage message = makeServerMessage(MessageType::RoomState, room_id, oss.str());
    message.target_user_id = user_id;
    return message;
}

SignalingMessage createError(const std::string& room_id,
                             const std::string& code,
                             const std::string& message_text,
                             const std::string& target_user_id) {
    std::ostringstream oss;
    oss << "{"
        << "\"code\":" << JsonParser::quote(code) << ","
        << "\"message\":" << JsonParser::quote(message_text)
        << "}";
    SignalingMessage message = makeServerMessage(MessageType::Error, room_id, oss.str());
    message.target_user_id = target_user_id;
    return message;
}

} // namespace SignalingProtocol
} // namespace rendezvous
