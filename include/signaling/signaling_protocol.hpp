#ifndef SIGNALING_PROTOCOL_HPP
#define SIGNALING_PROTOCOL_HPP

#include <string>
#include <optional>
#include <cstdint>

namespace rendezvous {

enum class MessageType {
    Offer,
    Answer,
    IceCandidate,
    UserJoined,
    UserLeft,
    RoomState,
    Error,
    FileTransferOffer,
    FileTransferAccept,
    FileTransferReject,
    FileTransferChunk,
    FileTransferProgress,
    FileTransferComplete,
    Heartbeat,
    Leave
};

// How the relay routes a message type
enum class MessageCategory {
    Signaling,      // relayed verbatim between peers
    Presence,       // server-originated room events
    FileTransfer,   // routed through the file transfer manager
    Control         // consumed by the relay, never fanned out
};

/**
 * Common envelope for every message on the signaling channel.
 * The payload is kept as raw JSON text and re-emitted verbatim; SDP and
 * ICE payloads are never interpreted.
 */
struct SignalingMessage {
    MessageType type = MessageType::Error;
    std::string payload = "{}";
    std::string sender_id;          // empty when server-originated
    std::string target_user_id;     // empty = broadcast
    std::string room_id;
    std::string timestamp;          // ISO-8601 UTC, set by the relay
    int64_t sequence_number = 0;    // 0 = direct, never published
};

/**
 * Wire schema for the signaling channel.
 *
 * JSON envelope:
 *   {"type":..., "payload":{...}, "sender_id":..., "target_user_id":...,
 *    "room_id":..., "timestamp":..., "sequence_number":N}
 */
namespace SignalingProtocol {

    // Wire type strings
    constexpr const char* OFFER = "offer";
    constexpr const char* ANSWER = "answer";
    constexpr const char* ICE_CANDIDATE = "ice-candidate";
    constexpr const char* USER_JOINED = "user-joined";
    constexpr const char* USER_LEFT = "user-left";
    constexpr const char* ROOM_STATE = "room-state";
    constexpr const char* ERROR = "error";
    constexpr const char* FILE_TRANSFER_OFFER = "file-transfer-offer";
    constexpr const char* FILE_TRANSFER_ACCEPT = "file-transfer-accept";
    constexpr const char* FILE_TRANSFER_REJECT = "file-transfer-reject";
    constexpr const char* FILE_TRANSFER_CHUNK = "file-transfer-chunk";
    constexpr const char* FILE_TRANSFER_PROGRESS = "file-transfer-progress";
    constexpr const char* FILE_TRANSFER_COMPLETE = "file-transfer-complete";
    constexpr const char* HEARTBEAT = "heartbeat";
    constexpr const char* LEAVE = "leave";

    const char* typeName(MessageType type);
    std::optional<MessageType> typeFromName(const std::string& name);
    MessageCategory categoryOf(MessageType type);

    /**
     * Whether a client may put this type on the socket. Presence events,
     * RoomState, Error and FileTransferComplete are server-originated only.
     */
    bool isClientOriginated(MessageType type);

    /**
     * Parse an envelope received from a client or the store.
     * Throws ValidationError (invalid_payload, invalid_message_type).
     */
    SignalingMessage parse(const std::string& json);

    std::string serialize(const SignalingMessage& message);

    /**
     * Structural checks on the envelope and the minimal payload fields each
     * type needs. Throws ValidationError.
     */
    void validate(const SignalingMessage& message);

    /**
     * Delivery rule shared by live fan-out and replay: addressed messages go
     * only to their target, broadcasts to everyone except the sender.
     */
    bool shouldDeliver(const SignalingMessage& message, const std::string& user_id);

    SignalingMessage createUserJoined(const std::string& room_id,
                                      const std::string& user_id,
                                      const std::string& display_name,
                                      const std::string& joined_at);

    SignalingMessage createUserLeft(const std::string& room_id,
                                    const std::string& user_id,
                                    const std::string& reason);

    /**
     * @param participants_json JSON array of participant objects
     * @param reconnect_json JSON object describing replay, or empty for a fresh join
     */
    SignalingMessage createRoomState(const std::string& room_id,
                                     const std::string& user_id,
                                     const std::string& participants_json,
                                     size_t participant_count,
                                     const std::string& reconnect_json = "");

    SignalingMessage createError(const std::string& room_id,
                                 const std::string& code,
                                 const std::string& message,
                                 const std::string& target_user_id = "");

} // namespace SignalingProtocol

} // namespace rendezvous

#endif // SIGNALING_PROTOCOL_HPP
