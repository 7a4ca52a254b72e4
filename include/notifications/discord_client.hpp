#ifndef TICKLER_DISCORD_CLIENT_HPP
#define TICKLER_DISCORD_CLIENT_HPP

#include <map>
#include <mutex>
#include <string>

#include "chat_platform.hpp"

namespace tickler {

// Discord REST (API v10) sender authenticated with a bot token.
class DiscordClient : public ChatPlatform {
public:
    DiscordClient(const std::string& bot_token, const std::string& api_base);
    ~DiscordClient() override;

    bool sendDirectMessage(const std::string& user_id, const std::string& text) override;
    bool replyInChannel(const std::string& channel_id, const std::string& text) override;

private:
    // Opens (or reuses) the DM channel with a user.
    std::string getDirectChannel(const std::string& user_id);
    bool post(const std::string& path, const std::string& payload, std::string& response, long& http_code);

    std::string bot_token_;
    std::string api_base_;
    bool ready_{false};

    std::map<std::string, std::string> dm_channels_;
    std::mutex dm_channels_mutex_;
};

} // namespace tickler

#endif // TICKLER_DISCORD_CLIENT_HPP
