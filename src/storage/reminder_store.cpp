#include "../../include/storage/reminder_store.hpp"

#include <algorithm>
#include <numeric>

namespace tickler {

size_t ReminderStore::insertSorted(ReminderList& list, const Reminder& reminder) {
    auto it = std::upper_bound(list.begin(), list.end(), reminder,
        [](const Reminder& a, const Reminder& b) { return a.trigger_time < b.trigger_time; });
    const size_t position = static_cast<size_t>(it - list.begin());
    list.insert(it, reminder);
    return position;
}

size_t ReminderStore::add(const std::string& user_id, const Reminder& reminder) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertSorted(reminders_[user_id], reminder);
}

std::vector<size_t> ReminderStore::addAll(const std::string& user_id, const std::vector<Reminder>& reminders) {
    // Sort the new reminders outside the lock, then merge them in one pass.
    std::vector<size_t> order(reminders.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(), [&reminders](size_t a, size_t b) {
        return reminders[a].trigger_time < reminders[b].trigger_time;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = reminders_[user_id];

    ReminderList merged;
    merged.reserve(list.size() + reminders.size());
    std::vector<size_t> positions(reminders.size());
    size_t existing = 0;
    for (size_t index : order) {
        const Reminder& reminder = reminders[index];
        // Existing reminders with an equal trigger time stay first.
        while (existing < list.size() && !(reminder.trigger_time < list[existing].trigger_time)) {
            merged.push_back(std::move(list[existing++]));
        }
        positions[index] = merged.size();
        merged.push_back(reminder);
    }
    while (existing < list.size()) {
        merged.push_back(std::move(list[existing++]));
    }
    list = std::move(merged);
    return positions;
}

std::vector<Reminder> ReminderStore::list(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reminders_.find(user_id);
    if (it == reminders_.end()) return {};
    return it->second;
}

bool ReminderStore::removeAt(const std::string& user_id, size_t index, Reminder& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reminders_.find(user_id);
    if (it == reminders_.end() || index >= it->second.size()) return false;

    out = it->second[index];
    it->second.erase(it->second.begin() + static_cast<std::ptrdiff_t>(index));
    if (it->second.empty()) {
        reminders_.erase(it);
    }
    return true;
}

bool ReminderStore::setInterval(const std::string& user_id, size_t index,
                                const std::vector<TimeModifier>& modifiers, Reminder& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reminders_.find(user_id);
    if (it == reminders_.end() || index >= it->second.size()) return false;

    it->second[index].interval = modifiers;
    out = it->second[index];
    return true;
}

bool ReminderStore::clearInterval(const std::string& user_id, size_t index, Reminder& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reminders_.find(user_id);
    if (it == reminders_.end() || index >= it->second.size()) return false;

    it->second[index].interval.reset();
    out = it->second[index];
    return true;
}

std::vector<FiredReminder> ReminderStore::takeDue(const ZonedTime& now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FiredReminder> fired;

    for (auto it = reminders_.begin(); it != reminders_.end();) {
        auto& list = it->second;
        while (!list.empty() && list.front().trigger_time <= now) {
            FiredReminder entry;
            entry.user_id = it->first;
            entry.reminder = list.front();
            list.erase(list.begin());

            if (entry.reminder.interval) {
                Reminder successor;
                successor.message = entry.reminder.message;
                successor.interval = entry.reminder.interval;
                bool advanced = applyAll(*entry.reminder.interval, entry.reminder.trigger_time,
                                         successor.trigger_time, &entry.reschedule_error);
                // A successor that does not move forward would be popped again in this loop.
                if (advanced && successor.trigger_time <= entry.reminder.trigger_time) {
                    entry.reschedule_error = "Interval does not move the reminder forward";
                    advanced = false;
                }
                if (advanced) {
                    insertSorted(list, successor);
                    entry.rescheduled = true;
                }
            }
            fired.push_back(std::move(entry));
        }

        if (list.empty()) {
            it = reminders_.erase(it);
        } else {
            ++it;
        }
    }
    return fired;
}

std::vector<UserReminder> ReminderStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UserReminder> out;
    for (const auto& entry : reminders_) {
        for (const auto& reminder : entry.second) {
            out.push_back(UserReminder{entry.first, reminder});
        }
    }
    return out;
}

void ReminderStore::replaceAll(const std::vector<UserReminder>& reminders) {
    std::map<std::string, ReminderList> fresh;
    for (const auto& entry : reminders) {
        fresh[entry.user_id].push_back(entry.reminder);
    }
    for (auto& entry : fresh) {
        std::stable_sort(entry.second.begin(), entry.second.end(),
            [](const Reminder& a, const Reminder& b) { return a.trigger_time < b.trigger_time; });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reminders_ = std::move(fresh);
}

size_t ReminderStore::userCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reminders_.size();
}

} // namespace tickler
