#ifndef TICKLER_REMINDER_SCHEDULER_HPP
#define TICKLER_REMINDER_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include "../notifications/chat_platform.hpp"
#include "../storage/reminder_store.hpp"

namespace tickler {

// Background loop that delivers due reminders and reschedules recurring ones.
class ReminderScheduler {
public:
    using SaveCallback = std::function<void()>;

    ReminderScheduler(ReminderStore& reminders, ChatPlatform& platform,
                      std::chrono::milliseconds tick_interval = std::chrono::milliseconds(1000),
                      SaveCallback on_fired = {});
    ~ReminderScheduler();

    void start();
    void stop();

    // One scan against `now`. Returns the number of reminders fired.
    size_t tick(const ZonedTime& now);

private:
    ReminderStore& reminders_;
    ChatPlatform& platform_;
    std::chrono::milliseconds tick_interval_;
    SaveCallback on_fired_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace tickler

#endif // TICKLER_REMINDER_SCHEDULER_HPP
