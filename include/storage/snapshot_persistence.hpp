#ifndef TICKLER_SNAPSHOT_PERSISTENCE_HPP
#define TICKLER_SNAPSHOT_PERSISTENCE_HPP

#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "preference_store.hpp"
#include "reminder_store.hpp"

namespace tickler {

// Raised for records that exist on disk but cannot be decoded.
class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Full-snapshot persistence of both stores as JSON files in one directory:
//   reminders.json    [{"user","time_ms","timezone","message"[,"interval"]}, ...]
//   preferences.json  [{"user","timezone","time_format"}, ...]
//   timezones.json    legacy {"<user>":"<zone>"}, migrated once then removed
class SnapshotPersistence {
public:
    static constexpr const char* kRemindersFile = "reminders.json";
    static constexpr const char* kPreferencesFile = "preferences.json";
    static constexpr const char* kLegacyTimezonesFile = "timezones.json";

    explicit SnapshotPersistence(std::string data_dir);

    // Missing files mean "start empty". Throws SnapshotError on malformed
    // content or when the legacy migration cannot be completed.
    void load(ReminderStore& reminders, PreferenceStore& preferences);

    // Returns true if a legacy file was found and folded in.
    bool migrateLegacyTimezones(PreferenceStore& preferences);

    bool save(const ReminderStore& reminders, const PreferenceStore& preferences,
              std::string* out_error = nullptr);
    bool savePreferences(const PreferenceStore& preferences, std::string* out_error = nullptr);

    static std::string encodeReminders(const std::vector<UserReminder>& reminders);
    static std::vector<UserReminder> decodeReminders(const std::string& json);
    static std::string encodePreferences(const std::map<std::string, Preferences>& preferences);
    static std::map<std::string, Preferences> decodePreferences(const std::string& json);

    std::string pathFor(const char* file_name) const;

private:
    bool writeFile(const std::string& path, const std::string& content, std::string* out_error);

    std::string data_dir_;
    std::mutex write_mutex_;
};

// Background writer: requestSave() marks the state dirty and returns
// immediately; the worker coalesces requests so at most one write is in
// flight and at most one more is pending.
class SnapshotWriter {
public:
    SnapshotWriter(SnapshotPersistence& persistence,
                   const ReminderStore& reminders,
                   const PreferenceStore& preferences);
    ~SnapshotWriter();

    SnapshotWriter(const SnapshotWriter&) = delete;
    SnapshotWriter& operator=(const SnapshotWriter&) = delete;

    void start();
    // Writes any pending snapshot before returning.
    void stop();

    void requestSave();

    size_t completedWrites() const;

private:
    void run();

    SnapshotPersistence& persistence_;
    const ReminderStore& reminders_;
    const PreferenceStore& preferences_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_ = false;
    bool running_ = false;
    size_t completed_writes_ = 0;
    std::thread worker_;
};

} // namespace tickler

#endif // TICKLER_SNAPSHOT_PERSISTENCE_HPP
