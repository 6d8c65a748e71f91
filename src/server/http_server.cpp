#include "../../include/server/http_server.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/json_parser.hpp"
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <algorithm>
#include <map>

namespace rendezvous {

namespace {

constexpr const char* kSignalPrefix = "/signal/";
constexpr auto kMaxRequestBodySize = 4ULL * 1024 * 1024;

void applyCommonHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "rendezvous");
    res.set(http::field::access_control_allow_origin, "*");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
}

http::response<http::string_body> jsonResponse(int status, const std::string& body, unsigned version) {
    http::response<http::string_body> res;
    res.version(version);
    res.result(static_cast<http::status>(status));
    applyCommonHeaders(res);
    if (status == 204) {
        res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Authorization, Content-Type");
    } else {
        res.set(http::field::content_type, "application/json");
        res.body() = body;
    }
    res.prepare_payload();
    return res;
}

} // namespace

HttpServer::HttpServer(const std::string& address,
                       unsigned short port,
                       size_t io_threads,
                       std::shared_ptr<RequestHandler> request_handler,
                       std::shared_ptr<const SessionContext> session_context)
    : address_(address)
    , port_(port)
    , io_threads_(std::max<size_t>(1, io_threads))
    , ioc_(static_cast<int>(std::max<size_t>(1, io_threads)))
    , request_handler_(std::move(request_handler))
    , session_context_(std::move(session_context)) {
}

HttpServer::~HttpServer() {
    stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool HttpServer::start() {
    try {
        tcp::endpoint endpoint(net::ip::make_address(address_), port_);
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Cannot listen on " + address_ + ":" + std::to_string(port_) + ": " + e.what());
        return false;
    }

    running_ = true;
    Logger::getInstance().info("HTTP Server started on " + address_ + ":" + std::to_string(port_) +
                               " with " + std::to_string(io_threads_) + " I/O threads");

    acceptConnections();

    for (size_t i = 1; i < io_threads_; ++i) {
        threads_.emplace_back([this]() { ioc_.run(); });
    }
    ioc_.run();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    return true;
}

void HttpServer::stop() {
    if (running_.exchange(false)) {
        beast::error_code ec;
        if (acceptor_) {
            acceptor_->close(ec);
        }
        ioc_.stop();
        Logger::getInstance().info("HTTP Server stopped");
    }
}

void HttpServer::acceptConnections() {
    if (!running_) return;

    // Each connection gets its own strand
    auto socket = std::make_shared<tcp::socket>(net::make_strand(ioc_));

    acceptor_->async_accept(*socket,
        [this, socket](beast::error_code ec) {
            if (!ec) {
                handleConnection(socket);
            } else if (ec != net::error::operation_aborted) {
                Logger::getInstance().error("Accept error: " + ec.message());
            }
            acceptConnections();
        });
}

void HttpServer::handleConnection(std::shared_ptr<tcp::socket> socket) {
    auto buffer = std::make_shared<beast::flat_buffer>();
    auto parser = std::make_shared<http::request_parser<http::string_body>>();
    parser->body_limit(kMaxRequestBodySize);

    http::async_read(*socket, *buffer, *parser,
        [this, socket, buffer, parser](beast::error_code ec, std::size_t) {
            if (!ec) {
                try {
                    processRequest(socket, parser->release());
                } catch (const std::exception& e) {
                    Logger::getInstance().error("Unhandled exception in handleConnection: " + std::string(e.what()));
                }
                return;
            }
            if (ec == http::error::body_limit) {
                Logger::getInstance().warning("Request body too large");
                sendResponse(socket, jsonResponse(413,
                    JsonParser::createErrorResponse("validation_error", "Request body too large"), 11));
                return;
            }
            if (ec != http::error::end_of_stream) {
                Logger::getInstance().error("Read error: " + ec.message());
            }
        });
}

void HttpServer::processRequest(std::shared_ptr<tcp::socket> socket,
                                http::request<http::string_body> req) {
    const std::string target = std::string(req.target());
    std::string path = target;
    size_t qpos = path.find('?');
    if (qpos != std::string::npos) {
        path = path.substr(0, qpos);
    }

    // GET /signal/{room_id}, upgraded to WebSocket
    const std::string prefix = kSignalPrefix;
    if (path.compare(0, prefix.size(), prefix) == 0 && path != "/signal/config") {
        const std::string room_id = RequestHandler::urlDecode(path.substr(prefix.size()));
        if (websocket::is_upgrade(req)) {
            handleWebSocketUpgrade(socket, std::move(req), room_id);
            return;
        }
        sendResponse(socket, jsonResponse(426,
            JsonParser::createErrorResponse("validation_error", "WebSocket upgrade required"), req.version()));
        return;
    }

    // Extract headers
    std::map<std::string, std::string> headers;
    for (const auto& header : req) {
        headers[std::string(header.name_string())] = std::string(header.value());
    }

    const std::string method = std::string(http::to_string(req.method()));
    ApiResponse response = request_handler_->handleRequest(method, target, headers, req.body());

    Logger::getInstance().debug(method + " " + path + " -> " + std::to_string(response.status));
    sendResponse(socket, jsonResponse(response.status, response.body, req.version()));
}

void HttpServer::sendResponse(std::shared_ptr<tcp::socket> socket,
                              http::response<http::string_body> res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    http::async_write(*socket, *sp,
        [socket, sp](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::getInstance().error("Write error: " + ec.message());
            }
            socket->shutdown(tcp::socket::shutdown_send, ec);
        });
}

void HttpServer::handleWebSocketUpgrade(std::shared_ptr<tcp::socket> socket,
                                        http::request<http::string_body> req,
                                        const std::string& room_id) {
    std::string token;
    const std::string target = std::string(req.target());
    size_t qpos = target.find('?');
    if (qpos != std::string::npos) {
        auto query = RequestHandler::parseQuery(target.substr(qpos + 1));
        auto it = query.find("token");
        if (it != query.end()) {
            token = it->second;
        }
    }
    if (token.empty()) {
        auto auth_it = req.find(http::field::authorization);
        if (auth_it != req.end()) {
            token = bearerToken(std::string(auth_it->value()));
        }
    }

    auto session = std::make_shared<SignalingSession>(std::move(*socket), session_context_);
    session->run(std::move(req), room_id, token);
}

} // namespace rendezvous
