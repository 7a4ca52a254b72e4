#include "../../include/storage/preference_store.hpp"
#include "../../include/utils/logger.hpp"

#include <mutex>

namespace tickler {

PreferenceStore::PreferenceStore(std::string default_timezone)
    : default_timezone_(std::move(default_timezone)) {
}

Preferences PreferenceStore::defaults() const {
    Preferences prefs;
    prefs.timezone = default_timezone_;
    prefs.display_format = TimeFormat::H12;
    return prefs;
}

Preferences PreferenceStore::get(const std::string& user_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = preferences_.find(user_id);
    if (it == preferences_.end()) {
        return defaults();
    }
    return it->second;
}

void PreferenceStore::update(const std::string& user_id, const std::function<void(Preferences&)>& mutator) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = preferences_.find(user_id);
    if (it == preferences_.end()) {
        it = preferences_.emplace(user_id, defaults()).first;
    }
    mutator(it->second);
}

TimeZone PreferenceStore::resolveTimeZone(const std::string& user_id) const {
    const Preferences prefs = get(user_id);
    if (auto zone = TimeZone::locate(prefs.timezone)) {
        return *zone;
    }
    if (prefs.timezone != default_timezone_) {
        Logger::getInstance().warning("Unknown timezone '" + prefs.timezone + "' for user " + user_id +
                                      ", using " + default_timezone_);
        if (auto zone = TimeZone::locate(default_timezone_)) {
            return *zone;
        }
    }
    return TimeZone::utc();
}

std::map<std::string, Preferences> PreferenceStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return preferences_;
}

void PreferenceStore::replaceAll(std::map<std::string, Preferences> preferences) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    preferences_ = std::move(preferences);
}

} // namespace tickler
