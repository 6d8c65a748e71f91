#include "../../include/server/signaling_session.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/crypto/digest.hpp"
#include "../../include/signaling/room_registry.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace rendezvous {

namespace {

std::map<std::string, JsonField> payloadFields(const SignalingMessage& message) {
    try {
        return JsonParser::parseObject(message.payload);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Payload is not a JSON object: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
    }
}

} // namespace

SignalingSession::SignalingSession(tcp::socket&& socket, std::shared_ptr<const SessionContext> context)
    : ws_(std::move(socket))
    , heartbeat_timer_(ws_.get_executor())
    , context_(std::move(context)) {
}

void SignalingSession::run(http::request<http::string_body> req, const std::string& room_id,
                           const std::string& token) {
    room_id_ = room_id;
    token_ = token;
    upgrade_request_ = std::move(req);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "rendezvous-signaling");
    }));
    ws_.read_message_max(context_->settings.max_message_bytes);

    ws_.async_accept(upgrade_request_,
        beast::bind_front_handler(&SignalingSession::onAccept, shared_from_this()));
}

void SignalingSession::onAccept(beast::error_code ec) {
    if (ec) {
        Logger::getInstance().error("WebSocket accept error: " + ec.message());
        return;
    }

    try {
        user_ = context_->verifier->verify(token_);
    } catch (const AuthError& e) {
        Logger::getInstance().warning("Signaling connection to room " + room_id_ + " refused: " + e.what());
        closeWith(websocket::close_code::policy_error, e.codeName());
        return;
    }

    try {
        RoomRegistry::validateRoomId(room_id_);
    } catch (const ValidationError& e) {
        Logger::getInstance().warning("Signaling connection refused: " + std::string(e.what()));
        closeWith(websocket::close_code::policy_error, e.codeName());
        return;
    }

    start();
}

void SignalingSession::start() {
    std::weak_ptr<SignalingSession> weak = shared_from_this();
    endpoint_id_ = context_->relay->bridge()->registerEndpoint(room_id_, user_.user_id,
        [weak](const SignalingMessage& message, const std::string& serialized) {
            if (auto self = weak.lock()) {
                net::post(self->ws_.get_executor(), [self, message, serialized]() {
                    self->onBroadcast(message, serialized);
                });
            }
        });
    registered_ = true;

    auto connection = std::make_unique<RoomConnection>(context_->relay, context_->reconnection, room_id_,
                                                       user_.user_id, user_.display_name);
    try {
        RoomOpening opening = connection->open();
        const ReplayDecision& decision = opening.decision;
        connection_ = std::move(connection);
        last_presence_refresh_ = nowMillis();

        for (auto& frame : opening.frames) {
            send(std::move(frame));
        }

        if (decision.is_reconnect) {
            Logger::getInstance().info(user_.user_id + " resumed room " + room_id_ + ", replayed " +
                                       std::to_string(decision.messages.size()) + " of " +
                                       std::to_string(decision.missed_message_count) + " missed messages");
        } else {
            Logger::getInstance().info(user_.user_id + " connected to room " + room_id_);
        }
    } catch (const CapacityError& e) {
        Logger::getInstance().info(user_.user_id + " could not join room " + room_id_ + ": " + e.what());
        sendError(e.codeName(), e.what());
        closeWith(websocket::close_code::try_again_later, e.codeName());
        return;
    } catch (const RendezvousError& e) {
        Logger::getInstance().error("Failed to join " + user_.user_id + " to room " + room_id_ + ": " + e.what());
        sendError(e.codeName(), e.what());
        closeWith(websocket::close_code::try_again_later, e.codeName());
        return;
    }

    scheduleHeartbeat();
    doRead();
}

void SignalingSession::doRead() {
    ws_.async_read(buffer_, beast::bind_front_handler(&SignalingSession::onRead, shared_from_this()));
}

void SignalingSession::onRead(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
        Logger::getInstance().info("WebSocket closed by " + user_.user_id + " in room " + room_id_);
        teardown();
        return;
    }
    if (ec) {
        if (ec != net::error::operation_aborted) {
            Logger::getInstance().warning("WebSocket read error for " + user_.user_id + ": " + ec.message());
        }
        teardown();
        return;
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    handleMessage(text);

    if (!closing_) {
        doRead();
    }
}

void SignalingSession::handleMessage(const std::string& text) {
    try {
        SignalingMessage message = SignalingProtocol::parse(text);
        if (message.room_id.empty()) {
            message.room_id = room_id_;
        } else if (message.room_id != room_id_) {
            throw ValidationError("Message addressed to room " + message.room_id + " on a socket for " + room_id_,
                                  ErrorCode::INVALID_ROOM_ID);
        }
        message.sender_id = user_.user_id;
        message.sequence_number = 0;

        if (!SignalingProtocol::isClientOriginated(message.type)) {
            throw ValidationError(std::string("Clients may not send ") + SignalingProtocol::typeName(message.type),
                                  ErrorCode::INVALID_MESSAGE_TYPE);
        }
        SignalingProtocol::validate(message);

        // Any traffic counts as liveness
        if (message.type != MessageType::Heartbeat) {
            const int64_t now = nowMillis();
            const int64_t interval_ms = static_cast<int64_t>(context_->settings.presence_ttl_seconds) * 1000 / 3;
            if (now - last_presence_refresh_ >= interval_ms) {
                refreshPresence();
            }
        }

        dispatch(message);
    } catch (const CoordinationStoreError& e) {
        Logger::getInstance().error("Store error handling message from " + user_.user_id + ": " + e.what());
        sendError(e.codeName(), e.what());
    } catch (const RendezvousError& e) {
        Logger::getInstance().info("Message from " + user_.user_id + " in room " + room_id_ + " rejected: " +
                                   e.codeName() + ": " + e.what());
        sendError(e.codeName(), e.what());
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().info("Malformed payload from " + user_.user_id + ": " + e.what());
        sendError(errorCodeName(ErrorCode::INVALID_PAYLOAD), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unhandled exception handling message from " + user_.user_id + ": " + e.what());
        sendError("internal_error", "Internal server error");
    }
}

void SignalingSession::dispatch(SignalingMessage& message) {
    switch (message.type) {
        case MessageType::Offer:
        case MessageType::Answer:
        case MessageType::IceCandidate:
            context_->relay->publish(message);
            return;

        case MessageType::Heartbeat:
            refreshPresence();
            return;

        case MessageType::Leave:
            connection_->leave();
            closeWith(websocket::close_code::normal, "left");
            return;

        case MessageType::FileTransferOffer:
            handleTransferOffer(message);
            return;

        case MessageType::FileTransferAccept: {
            auto fields = payloadFields(message);
            context_->transfers->accept(JsonParser::getString(fields, "transfer_id"), user_.user_id);
            return;
        }

        case MessageType::FileTransferReject: {
            auto fields = payloadFields(message);
            context_->transfers->reject(JsonParser::getString(fields, "transfer_id"), user_.user_id,
                                        JsonParser::getString(fields, "reason", "declined"));
            return;
        }

        case MessageType::FileTransferChunk:
            handleTransferChunk(message);
            return;

        case MessageType::FileTransferProgress:
            handleTransferProgress(message);
            return;

        case MessageType::UserJoined:
        case MessageType::UserLeft:
        case MessageType::RoomState:
        case MessageType::Error:
        case MessageType::FileTransferComplete:
            throw ValidationError(std::string("Clients may not send ") + SignalingProtocol::typeName(message.type),
                                  ErrorCode::INVALID_MESSAGE_TYPE);
    }
}

void SignalingSession::handleTransferOffer(const SignalingMessage& message) {
    auto fields = payloadFields(message);

    TransferOffer offer;
    offer.room_id = room_id_;
    offer.sender_id = user_.user_id;
    try {
        offer.receiver_id = JsonParser::getString(fields, "receiver_id", message.target_user_id);
        offer.filename = JsonParser::getString(fields, "filename");
        offer.size_bytes = JsonParser::getInt(fields, "size_bytes", -1);
        offer.mime_type = JsonParser::getString(fields, "mime_type", "application/octet-stream");
        offer.checksum_expected = JsonParser::getString(fields, "checksum");
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Malformed transfer offer: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
    }

    FileTransfer transfer = context_->transfers->offer(offer);
    // The receiver is notified by the manager; the sender learns the id here
    sendDirect(MessageType::FileTransferOffer, transfer.toViewJson());
}

void SignalingSession::handleTransferChunk(const SignalingMessage& message) {
    auto fields = payloadFields(message);

    std::string transfer_id;
    int64_t index = -1;
    std::string encoded;
    std::string checksum;
    try {
        transfer_id = JsonParser::getString(fields, "transfer_id");
        index = JsonParser::getInt(fields, "chunk_index", -1);
        encoded = JsonParser::getString(fields, "data");
        checksum = JsonParser::getString(fields, "checksum");
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Malformed chunk: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
    }

    std::string data;
    try {
        data = crypto::base64Decode(encoded);
    } catch (const std::invalid_argument&) {
        throw ValidationError("Chunk data is not valid base64", ErrorCode::INVALID_PAYLOAD);
    }

    ChunkReceipt receipt = context_->transfers->submitChunk(transfer_id, user_.user_id, index, data, checksum);

    std::ostringstream ack;
    ack << "{\"transfer_id\":" << JsonParser::quote(transfer_id)
        << ",\"chunk_index\":" << index
        << ",\"duplicate\":" << (receipt.accepted_new ? "false" : "true")
        << ",\"progress\":" << receipt.progress.toJson(transfer_id)
        << "}";
    sendDirect(MessageType::FileTransferProgress, ack.str());
}

void SignalingSession::handleTransferProgress(const SignalingMessage& message) {
    auto fields = payloadFields(message);
    const std::string transfer_id = JsonParser::getString(fields, "transfer_id");
    const std::string action = JsonParser::getString(fields, "action");

    if (action == "pause") {
        context_->transfers->pause(transfer_id, user_.user_id);
    } else if (action == "resume") {
        context_->transfers->resume(transfer_id, user_.user_id);
    } else if (action == "cancel") {
        context_->transfers->cancel(transfer_id, user_.user_id);
    } else if (action.empty()) {
        TransferProgress progress = context_->transfers->progress(transfer_id, user_.user_id);
        sendDirect(MessageType::FileTransferProgress, progress.toJson(transfer_id));
    } else {
        throw ValidationError("Unknown transfer action " + action, ErrorCode::INVALID_PAYLOAD);
    }
}

void SignalingSession::onBroadcast(const SignalingMessage& message, const std::string& serialized) {
    if (closing_ || !connection_) {
        return;
    }
    std::optional<OutboundFrame> frame = connection_->admit(message, serialized);
    if (frame) {
        send(std::move(*frame));
    }
}

void SignalingSession::sendDirect(MessageType type, const std::string& payload) {
    SignalingMessage message;
    message.type = type;
    message.payload = payload;
    message.room_id = room_id_;
    message.sender_id = user_.user_id;
    message.target_user_id = user_.user_id;
    message.timestamp = formatIsoTimestamp(nowMillis());
    send(SignalingProtocol::serialize(message));
}

void SignalingSession::sendError(const std::string& code, const std::string& message) {
    SignalingMessage error = SignalingProtocol::createError(room_id_, code, message, user_.user_id);
    error.timestamp = formatIsoTimestamp(nowMillis());
    send(SignalingProtocol::serialize(error));
}

void SignalingSession::send(std::string text) {
    OutboundFrame frame;
    frame.text = std::move(text);
    send(std::move(frame));
}

void SignalingSession::send(OutboundFrame frame) {
    if (torn_down_) {
        return;
    }
    write_queue_.push_back(std::move(frame));
    if (write_queue_.size() > 1) {
        return;
    }
    doWrite();
}

void SignalingSession::doWrite() {
    ws_.text(true);
    ws_.async_write(net::buffer(write_queue_.front().text),
        beast::bind_front_handler(&SignalingSession::onWrite, shared_from_this()));
}

void SignalingSession::onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
        Logger::getInstance().warning("WebSocket write error for " + user_.user_id + ": " + ec.message());
        // Unwritten frames stay unseen and are replayed on reconnect
        write_queue_.clear();
        teardown();
        return;
    }
    if (connection_) {
        connection_->written(write_queue_.front());
    }
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        doWrite();
    } else if (close_pending_) {
        doClose();
    }
}

void SignalingSession::scheduleHeartbeat() {
    const int interval = std::max(1, context_->settings.presence_ttl_seconds / 3);
    heartbeat_timer_.expires_after(std::chrono::seconds(interval));
    std::weak_ptr<SignalingSession> weak = shared_from_this();
    heartbeat_timer_.async_wait([weak](beast::error_code ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            if (self->closing_ || self->torn_down_) {
                return;
            }
            self->refreshPresence();
            self->scheduleHeartbeat();
        }
    });
}

void SignalingSession::refreshPresence() {
    try {
        context_->relay->heartbeat(room_id_, user_.user_id, user_.display_name);
        last_presence_refresh_ = nowMillis();
    } catch (const RendezvousError& e) {
        Logger::getInstance().warning("Presence refresh failed for " + user_.user_id + " in room " + room_id_ +
                                      ": " + e.what());
    }
}

void SignalingSession::closeWith(websocket::close_code code, const std::string& reason) {
    if (closing_) {
        return;
    }
    closing_ = true;
    heartbeat_timer_.cancel();
    close_reason_ = websocket::close_reason(code, reason);

    // Queued frames, such as an error message, go out before the close frame
    if (write_queue_.empty()) {
        doClose();
    } else {
        close_pending_ = true;
    }
}

void SignalingSession::doClose() {
    close_pending_ = false;
    ws_.async_close(close_reason_, [self = shared_from_this()](beast::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            Logger::getInstance().debug("WebSocket close error: " + ec.message());
        }
        self->teardown();
    });
}

void SignalingSession::teardown() {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;
    closing_ = true;
    heartbeat_timer_.cancel();

    if (!registered_) {
        return;
    }
    context_->relay->bridge()->unregisterEndpoint(room_id_, endpoint_id_);

    if (connection_) {
        connection_->disconnect();
    }
}

} // namespace rendezvous
