#include "../../include/server/event_server.hpp"
#include "../../include/commands/command_parser.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace tickler {

namespace {

// Chat messages are small; anything larger is not a chat event.
constexpr auto kMaxRequestBodySize = 64ULL * 1024;

std::string hmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(),
         reinterpret_cast<const unsigned char*>(key.data()),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()),
         message.size(),
         digest,
         &len);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

bool timingSafeEqual(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

http::response<http::string_body> jsonResponse(http::status status, const std::string& body, unsigned version) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, "tickler");
    res.set(http::field::content_type, "application/json");
    res.body() = body;
    res.prepare_payload();
    return res;
}

} // namespace

EventServer::EventServer(const std::string& address, unsigned short port,
                         CommandHandler& handler, ChatPlatform& platform,
                         std::string event_secret, unsigned int io_threads)
    : address_(address),
      port_(port),
      handler_(handler),
      platform_(platform),
      event_secret_(std::move(event_secret)),
      io_threads_(io_threads == 0 ? 1 : io_threads) {}

EventServer::~EventServer() {
    stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) thread.join();
    }
}

bool EventServer::start() {
    try {
        tcp::endpoint endpoint(net::ip::make_address(address_), port_);
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_, endpoint);

        running_ = true;
        Logger::getInstance().info("Event server listening on " + address_ + ":" + std::to_string(port_));
        if (event_secret_.empty()) {
            Logger::getInstance().warning("TICKLER_EVENT_SECRET not set, inbound events are not authenticated");
        }

        acceptConnections();

        for (unsigned int i = 1; i < io_threads_; ++i) {
            threads_.emplace_back([this]() { ioc_.run(); });
        }
        ioc_.run();

        for (auto& thread : threads_) {
            if (thread.joinable()) thread.join();
        }
        threads_.clear();
        Logger::getInstance().info("Event server stopped");
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Event server error: " + std::string(e.what()));
        running_ = false;
        return false;
    }
}

void EventServer::stop() {
    if (running_.exchange(false)) {
        ioc_.stop();
    }
}

void EventServer::acceptConnections() {
    if (!running_) return;

    auto socket = std::make_shared<tcp::socket>(ioc_);

    acceptor_->async_accept(*socket,
        [this, socket](beast::error_code ec) {
            if (!ec) {
                handleConnection(socket);
            } else if (running_) {
                Logger::getInstance().error("Accept error: " + ec.message());
            }
            acceptConnections();
        });
}

void EventServer::handleConnection(std::shared_ptr<tcp::socket> socket) {
    auto buffer = std::make_shared<beast::flat_buffer>();
    auto parser = std::make_shared<http::request_parser<http::string_body>>();
    parser->body_limit(kMaxRequestBodySize);

    http::async_read(*socket, *buffer, *parser,
        [this, socket, buffer, parser](beast::error_code ec, std::size_t) {
            if (!ec) {
                try {
                    sendResponse(socket, handleRequest(parser->get()));
                } catch (const std::exception& e) {
                    Logger::getInstance().error("Unhandled exception in handleConnection: " + std::string(e.what()));
                    sendResponse(socket, jsonResponse(http::status::internal_server_error,
                                                      JsonParser::createErrorResponse("Internal server error"), 11));
                }
                return;
            }
            if (ec == http::error::body_limit) {
                Logger::getInstance().warning("Request body too large");
                sendResponse(socket, jsonResponse(http::status::payload_too_large,
                                                  JsonParser::createErrorResponse("Request body too large"), 11));
                return;
            }
            if (ec != http::error::end_of_stream) {
                Logger::getInstance().error("Read error: " + ec.message());
            }
        });
}

void EventServer::sendResponse(std::shared_ptr<tcp::socket> socket, http::response<http::string_body> res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    sp->keep_alive(false);

    http::async_write(*socket, *sp,
        [socket, sp](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::getInstance().error("Write error: " + ec.message());
            }
            socket->shutdown(tcp::socket::shutdown_send, ec);
        });
}

http::response<http::string_body> EventServer::handleRequest(const http::request<http::string_body>& req) {
    const std::string target(req.target());

    if (target == "/health") {
        if (req.method() != http::verb::get) {
            return jsonResponse(http::status::method_not_allowed,
                                JsonParser::createErrorResponse("Method not allowed"), req.version());
        }
        return jsonResponse(http::status::ok, JsonParser::createSuccessResponse("ok"), req.version());
    }

    if (target == "/events") {
        if (req.method() != http::verb::post) {
            return jsonResponse(http::status::method_not_allowed,
                                JsonParser::createErrorResponse("Method not allowed"), req.version());
        }
        return handleEvent(req);
    }

    return jsonResponse(http::status::not_found, JsonParser::createErrorResponse("Not found"), req.version());
}

http::response<http::string_body> EventServer::handleEvent(const http::request<http::string_body>& req) {
    if (!verifySignature(req)) {
        Logger::getInstance().warning("Rejected event with a bad signature");
        return jsonResponse(http::status::unauthorized,
                            JsonParser::createErrorResponse("Invalid signature"), req.version());
    }

    JsonParser::Object event;
    if (!JsonParser::parseObject(req.body(), event)) {
        return jsonResponse(http::status::bad_request,
                            JsonParser::createErrorResponse("Event body must be a flat JSON object"), req.version());
    }
    const std::string author_id = event["author_id"];
    const std::string channel_id = event["channel_id"];
    const std::string content = event["content"];

    if (author_id.empty() || channel_id.empty()) {
        return jsonResponse(http::status::bad_request,
                            JsonParser::createErrorResponse("Missing author_id or channel_id"), req.version());
    }

    if (toLowerCopy(event["author_is_bot"]) == "true" || !CommandParser::isCommand(content)) {
        return jsonResponse(http::status::ok, JsonParser::createSuccessResponse("ignored"), req.version());
    }

    Logger::getInstance().debug("Command from " + author_id + ": " + content);
    const std::string reply = handler_.handleText(author_id, content);

    if (!platform_.replyInChannel(channel_id, reply)) {
        Logger::getInstance().warning("Failed to reply in channel " + channel_id);
    }
    return jsonResponse(http::status::ok, JsonParser::createSuccessResponse(reply), req.version());
}

bool EventServer::verifySignature(const http::request<http::string_body>& req) const {
    if (event_secret_.empty()) return true;

    auto it = req.find(kSignatureHeader);
    if (it == req.end()) return false;

    const std::string provided = toLowerCopy(std::string(it->value()));
    return timingSafeEqual(provided, signBody(event_secret_, req.body()));
}

std::string EventServer::signBody(const std::string& secret, const std::string& body) {
    return hmacSha256Hex(secret, body);
}

} // namespace tickler
