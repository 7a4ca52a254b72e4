#ifndef TICKLER_REMINDER_STORE_HPP
#define TICKLER_REMINDER_STORE_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../time/time_modifier.hpp"
#include "../time/zoned_time.hpp"

namespace tickler {

struct Reminder {
    ZonedTime trigger_time;
    std::string message;
    std::optional<std::vector<TimeModifier>> interval;
};

struct UserReminder {
    std::string user_id;
    Reminder reminder;
};

// A reminder drained by takeDue(). `rescheduled` is false when the reminder
// carried an interval whose next occurrence could not be computed.
struct FiredReminder {
    std::string user_id;
    Reminder reminder;
    bool rescheduled = false;
    std::string reschedule_error;
};

// Per-user reminder lists, each kept sorted ascending by trigger time.
// A reminder's id is its current index in that list, so ids shift when
// earlier reminders are added or removed.
class ReminderStore {
public:
    ReminderStore() = default;
    ReminderStore(const ReminderStore&) = delete;
    ReminderStore& operator=(const ReminderStore&) = delete;

    // Ties keep insertion order. Returns the position of the new reminder.
    size_t add(const std::string& user_id, const Reminder& reminder);

    // Inserts all reminders in one critical section and returns the final
    // position of each, in input order.
    std::vector<size_t> addAll(const std::string& user_id, const std::vector<Reminder>& reminders);

    std::vector<Reminder> list(const std::string& user_id) const;

    bool removeAt(const std::string& user_id, size_t index, Reminder& out);
    bool setInterval(const std::string& user_id, size_t index,
                     const std::vector<TimeModifier>& modifiers, Reminder& out);
    bool clearInterval(const std::string& user_id, size_t index, Reminder& out);

    // Pops every reminder with trigger_time <= now. Recurring reminders get
    // their successor inserted before the next due check.
    std::vector<FiredReminder> takeDue(const ZonedTime& now);

    std::vector<UserReminder> snapshot() const;
    // Replaces the whole content; lists are re-sorted.
    void replaceAll(const std::vector<UserReminder>& reminders);

    size_t userCount() const;

private:
    using ReminderList = std::vector<Reminder>;

    static size_t insertSorted(ReminderList& list, const Reminder& reminder);

    mutable std::mutex mutex_;
    std::map<std::string, ReminderList> reminders_;
};

} // namespace tickler

#endif // TICKLER_REMINDER_STORE_HPP
