#ifndef TICKLER_CHAT_PLATFORM_HPP
#define TICKLER_CHAT_PLATFORM_HPP

#include <string>

namespace tickler {

// Outbound side of the chat platform. Both calls are best effort: failures
// are logged by the implementation and reported through the return value,
// never retried.
class ChatPlatform {
public:
    virtual ~ChatPlatform() = default;

    virtual bool sendDirectMessage(const std::string& user_id, const std::string& text) = 0;
    virtual bool replyInChannel(const std::string& channel_id, const std::string& text) = 0;
};

} // namespace tickler

#endif // TICKLER_CHAT_PLATFORM_HPP
