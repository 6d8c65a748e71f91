#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "request_handler.hpp"
#include "signaling_session.hpp"

namespace rendezvous {

class HttpServer {
public:
    HttpServer(const std::string& address,
               unsigned short port,
               size_t io_threads,
               std::shared_ptr<RequestHandler> request_handler,
               std::shared_ptr<const SessionContext> session_context);
    ~HttpServer();

    // Blocks until stop() is called. Returns false if the listener could not be set up.
    bool start();
    void stop();

private:
    std::string address_;
    unsigned short port_;
    size_t io_threads_;
    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::shared_ptr<RequestHandler> request_handler_;
    std::shared_ptr<const SessionContext> session_context_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};

    void acceptConnections();
    void handleConnection(std::shared_ptr<tcp::socket> socket);
    void processRequest(std::shared_ptr<tcp::socket> socket,
                        http::request<http::string_body> req);
    void sendResponse(std::shared_ptr<tcp::socket> socket,
                      http::response<http::string_body> res);
    void handleWebSocketUpgrade(std::shared_ptr<tcp::socket> socket,
                                http::request<http::string_body> req,
                                const std::string& room_id);
};

} // namespace rendezvous

#endif // HTTP_SERVER_HPP
