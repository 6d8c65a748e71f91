#ifndef SIGNALING_SESSION_HPP
#define SIGNALING_SESSION_HPP

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <memory>
#include <string>
#include "../auth/token_verifier.hpp"
#include "../signaling/reconnection_manager.hpp"
#include "../signaling/room_connection.hpp"
#include "../signaling/signaling_relay.hpp"
#include "../transfer/file_transfer_manager.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace rendezvous {

// Services shared by every signaling socket of this instance
struct SessionContext {
    std::shared_ptr<SignalingRelay> relay;
    std::shared_ptr<ReconnectionManager> reconnection;
    std::shared_ptr<FileTransferManager> transfers;
    std::shared_ptr<TokenVerifier> verifier;
    SignalingSettings settings;
};

/**
 * One WebSocket connection to /signal/{room_id}.
 *
 * All handlers run on the socket's strand. Messages fanned out by the
 * bridge are posted onto that strand and written through a queue, so at
 * most one async_write is in flight.
 */
class SignalingSession : public std::enable_shared_from_this<SignalingSession> {
public:
    SignalingSession(tcp::socket&& socket, std::shared_ptr<const SessionContext> context);

    /**
     * Complete the WebSocket handshake, then authenticate. An unusable
     * token closes the socket with 1008 right after the handshake.
     */
    void run(http::request<http::string_body> req, const std::string& room_id, const std::string& token);

private:
    void onAccept(beast::error_code ec);
    void start();
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void handleMessage(const std::string& text);
    void dispatch(SignalingMessage& message);

    void handleTransferOffer(const SignalingMessage& message);
    void handleTransferChunk(const SignalingMessage& message);
    void handleTransferProgress(const SignalingMessage& message);

    void onBroadcast(const SignalingMessage& message, const std::string& serialized);
    void sendDirect(MessageType type, const std::string& payload);
    void sendError(const std::string& code, const std::string& message);
    void send(std::string text);
    void send(OutboundFrame frame);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes);

    void scheduleHeartbeat();
    void refreshPresence();
    void closeWith(websocket::close_code code, const std::string& reason);
    void doClose();
    void teardown();

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<OutboundFrame> write_queue_;
    net::steady_timer heartbeat_timer_;
    std::shared_ptr<const SessionContext> context_;

    std::string room_id_;
    std::string token_;
    http::request<http::string_body> upgrade_request_;
    AuthenticatedUser user_;
    SignalingBridge::EndpointId endpoint_id_ = 0;
    bool registered_ = false;
    bool closing_ = false;
    bool torn_down_ = false;
    bool close_pending_ = false;
    websocket::close_reason close_reason_;

    // Set once the room was joined
    std::unique_ptr<RoomConnection> connection_;
    int64_t last_presence_refresh_ = 0;
};

} // namespace rendezvous

#endif // SIGNALING_SESSION_HPP
