#ifndef TICKLER_EVENT_SERVER_HPP
#define TICKLER_EVENT_SERVER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "../bots/command_handler.hpp"
#include "../notifications/chat_platform.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace tickler {

// Inbound side of the chat platform. A gateway forwards every message as
//   POST /events {"author_id","channel_id","content"[,"author_is_bot"]}
// optionally signed with X-Tickler-Signature (hex HMAC-SHA256 of the body).
class EventServer {
public:
    static constexpr const char* kSignatureHeader = "X-Tickler-Signature";

    EventServer(const std::string& address, unsigned short port,
                CommandHandler& handler, ChatPlatform& platform,
                std::string event_secret = "", unsigned int io_threads = 2);
    ~EventServer();

    // Runs the I/O threads until stop(). Returns false if the listener
    // could not be opened.
    bool start();
    void stop();

    http::response<http::string_body> handleRequest(const http::request<http::string_body>& req);

    static std::string signBody(const std::string& secret, const std::string& body);

private:
    void acceptConnections();
    void handleConnection(std::shared_ptr<tcp::socket> socket);
    void sendResponse(std::shared_ptr<tcp::socket> socket, http::response<http::string_body> res);

    http::response<http::string_body> handleEvent(const http::request<http::string_body>& req);
    bool verifySignature(const http::request<http::string_body>& req) const;

    std::string address_;
    unsigned short port_;
    CommandHandler& handler_;
    ChatPlatform& platform_;
    std::string event_secret_;
    unsigned int io_threads_;

    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

} // namespace tickler

#endif // TICKLER_EVENT_SERVER_HPP
