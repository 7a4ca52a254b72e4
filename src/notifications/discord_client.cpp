#include "../../include/notifications/discord_client.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <curl/curl.h>

#include <cctype>

namespace tickler {

namespace {

// Discord rejects message content longer than this.
constexpr size_t kMaxMessageLength = 2000;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total);
    return total;
}

std::string truncateContent(const std::string& text) {
    if (text.size() <= kMaxMessageLength) return text;
    return text.substr(0, kMaxMessageLength - 3) + "...";
}

// Discord objects nest ("recipients":[{"id":...}]), so only keys at the
// outermost level are considered.
std::string topLevelString(const std::string& body, const std::string& wanted) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    size_t string_start = 0;
    std::string last_string;
    bool expect_value = false;

    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
                const std::string raw = body.substr(string_start, i - string_start);
                if (expect_value) {
                    return JsonParser::unescapeJson(raw);
                }
                last_string = raw;
            }
            continue;
        }
        switch (c) {
            case '"':
                in_string = true;
                string_start = i + 1;
                break;
            case '{':
            case '[':
                depth++;
                expect_value = false;
                break;
            case '}':
            case ']':
                depth--;
                break;
            case ':':
                expect_value = depth == 1 && JsonParser::unescapeJson(last_string) == wanted;
                if (expect_value) {
                    size_t next = i + 1;
                    while (next < body.size() && std::isspace(static_cast<unsigned char>(body[next]))) next++;
                    if (next >= body.size() || body[next] != '"') return "";
                }
                break;
            case ',':
                expect_value = false;
                last_string.clear();
                break;
            default:
                break;
        }
    }
    return "";
}

std::string extractDiscordError(const std::string& body) {
    return topLevelString(body, "message");
}

} // namespace

DiscordClient::DiscordClient(const std::string& bot_token, const std::string& api_base)
    : bot_token_(bot_token), api_base_(api_base) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!api_base_.empty() && api_base_.back() == '/') {
        api_base_.pop_back();
    }
    ready_ = !bot_token_.empty() && !api_base_.empty();
    if (!ready_) {
        Logger::getInstance().warning("Discord delivery disabled: bot token not configured");
    }
}

DiscordClient::~DiscordClient() {
    curl_global_cleanup();
}

bool DiscordClient::post(const std::string& path, const std::string& payload, std::string& response, long& http_code) {
    CURL* curl = curl_easy_init();
    if (!curl) return false;

    const std::string url = api_base_ + path;
    const std::string auth_header = "Authorization: Bot " + bot_token_;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json; charset=utf-8");
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "User-Agent: DiscordBot (tickler, 1.0)");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);

    CURLcode res = curl_easy_perform(curl);
    http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::getInstance().warning(std::string("Discord request failed: ") + curl_easy_strerror(res));
        return false;
    }
    return http_code >= 200 && http_code < 300;
}

std::string DiscordClient::getDirectChannel(const std::string& user_id) {
    {
        std::lock_guard<std::mutex> lock(dm_channels_mutex_);
        auto it = dm_channels_.find(user_id);
        if (it != dm_channels_.end()) {
            return it->second;
        }
    }

    const std::string payload = "{\"recipient_id\":\"" + JsonParser::escapeJson(user_id) + "\"}";
    std::string response;
    long code = 0;
    if (!post("/users/@me/channels", payload, response, code)) {
        const std::string detail = extractDiscordError(response);
        Logger::getInstance().warning("Discord DM channel for " + user_id + " failed: HTTP " +
                                      std::to_string(code) + (detail.empty() ? "" : " (" + detail + ")"));
        return "";
    }

    const std::string channel_id = topLevelString(response, "id");
    if (channel_id.empty()) {
        Logger::getInstance().warning("Discord DM channel response without id for " + user_id);
        return "";
    }

    std::lock_guard<std::mutex> lock(dm_channels_mutex_);
    dm_channels_[user_id] = channel_id;
    return channel_id;
}

bool DiscordClient::sendDirectMessage(const std::string& user_id, const std::string& text) {
    if (!ready_ || user_id.empty()) return false;

    const std::string channel_id = getDirectChannel(user_id);
    if (channel_id.empty()) {
        Logger::getInstance().warning("Failed to send reminder message to " + user_id);
        return false;
    }
    return replyInChannel(channel_id, text);
}

bool DiscordClient::replyInChannel(const std::string& channel_id, const std::string& text) {
    if (!ready_ || channel_id.empty()) return false;

    const std::string payload = "{\"content\":\"" + JsonParser::escapeJson(truncateContent(text)) + "\"}";
    std::string response;
    long code = 0;
    if (!post("/channels/" + channel_id + "/messages", payload, response, code)) {
        const std::string detail = extractDiscordError(response);
        Logger::getInstance().warning("Discord send to channel " + channel_id + " failed: HTTP " +
                                      std::to_string(code) + (detail.empty() ? "" : " (" + detail + ")"));
        return false;
    }
    return true;
}

} // namespace tickler
