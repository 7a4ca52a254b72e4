#ifndef TICKLER_PREFERENCE_STORE_HPP
#define TICKLER_PREFERENCE_STORE_HPP

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>

#include "../time/zoned_time.hpp"

namespace tickler {

struct Preferences {
    std::string timezone;
    TimeFormat display_format = TimeFormat::H12;
};

// Per-user display settings. Records are created on first update and never
// deleted; reads of unknown users return the defaults.
class PreferenceStore {
public:
    explicit PreferenceStore(std::string default_timezone);
    PreferenceStore(const PreferenceStore&) = delete;
    PreferenceStore& operator=(const PreferenceStore&) = delete;

    Preferences get(const std::string& user_id) const;
    void update(const std::string& user_id, const std::function<void(Preferences&)>& mutator);

    // Zone from the user's preferences; falls back to the default zone, then UTC.
    TimeZone resolveTimeZone(const std::string& user_id) const;

    Preferences defaults() const;

    std::map<std::string, Preferences> snapshot() const;
    void replaceAll(std::map<std::string, Preferences> preferences);

private:
    std::string default_timezone_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Preferences> preferences_;
};

} // namespace tickler

#endif // TICKLER_PREFERENCE_STORE_HPP
