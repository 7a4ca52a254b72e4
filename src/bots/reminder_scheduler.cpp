#include "../../include/bots/reminder_scheduler.hpp"
#include "../../include/utils/logger.hpp"

namespace tickler {

ReminderScheduler::ReminderScheduler(ReminderStore& reminders, ChatPlatform& platform,
                                     std::chrono::milliseconds tick_interval, SaveCallback on_fired)
    : reminders_(reminders),
      platform_(platform),
      tick_interval_(tick_interval),
      on_fired_(std::move(on_fired)) {}

ReminderScheduler::~ReminderScheduler() {
    stop();
}

void ReminderScheduler::start() {
    if (running_.exchange(true)) return;

    worker_ = std::thread([this]() {
        Logger::getInstance().info("ReminderScheduler started (tick " +
                                   std::to_string(tick_interval_.count()) + " ms)");

        while (running_) {
            try {
                tick(ZonedTime::now(TimeZone::utc()));
            } catch (const std::exception& e) {
                Logger::getInstance().warning(std::string("ReminderScheduler loop error: ") + e.what());
            }

            // Sleep in short slices so stop() does not wait a whole tick.
            auto remaining = tick_interval_;
            const auto slice = std::chrono::milliseconds(100);
            while (running_ && remaining.count() > 0) {
                const auto step = remaining < slice ? remaining : slice;
                std::this_thread::sleep_for(step);
                remaining -= step;
            }
        }

        Logger::getInstance().info("ReminderScheduler stopped");
    });
}

void ReminderScheduler::stop() {
    if (!running_.exchange(false)) return;
    if (worker_.joinable()) worker_.join();
}

size_t ReminderScheduler::tick(const ZonedTime& now) {
    const std::vector<FiredReminder> fired = reminders_.takeDue(now);
    if (fired.empty()) return 0;

    for (const auto& item : fired) {
        if (item.reminder.interval && !item.rescheduled) {
            Logger::getInstance().warning("Dropping recurrence of reminder '" + item.reminder.message +
                                          "' for " + item.user_id + ": " + item.reschedule_error);
        }
        if (!platform_.sendDirectMessage(item.user_id, "Reminder: " + item.reminder.message)) {
            Logger::getInstance().warning("Failed to deliver reminder to " + item.user_id);
        }
    }

    if (on_fired_) {
        on_fired_();
    }
    return fired.size();
}

} // namespace tickler
