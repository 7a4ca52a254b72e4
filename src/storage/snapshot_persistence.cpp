#include "../../include/storage/snapshot_persistence.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <boost/filesystem.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = boost::filesystem;

namespace tickler {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SnapshotError("Cannot open " + path);
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    if (file.bad()) {
        throw SnapshotError("Cannot read " + path);
    }
    return buf.str();
}

const std::string& requireField(const JsonParser::Object& record, const std::string& key, size_t index) {
    auto it = record.find(key);
    if (it == record.end()) {
        throw SnapshotError("Record " + std::to_string(index) + " is missing \"" + key + "\"");
    }
    return it->second;
}

int64_t parseEpochMillis(const std::string& text, size_t index) {
    if (text.empty()) {
        throw SnapshotError("Record " + std::to_string(index) + " has an empty time_ms");
    }
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        throw SnapshotError("Record " + std::to_string(index) + " has an invalid time_ms: " + text);
    }
    return static_cast<int64_t>(value);
}

TimeZone requireZone(const std::string& name, size_t index) {
    auto zone = TimeZone::locate(name);
    if (!zone) {
        throw SnapshotError("Record " + std::to_string(index) + " has an unknown timezone: " + name);
    }
    return *zone;
}

} // namespace

SnapshotPersistence::SnapshotPersistence(std::string data_dir)
    : data_dir_(std::move(data_dir)) {
    if (data_dir_.empty()) {
        data_dir_ = ".";
    }
}

std::string SnapshotPersistence::pathFor(const char* file_name) const {
    return (fs::path(data_dir_) / file_name).string();
}

void SnapshotPersistence::load(ReminderStore& reminders, PreferenceStore& preferences) {
    const std::string reminders_path = pathFor(kRemindersFile);
    if (fs::exists(reminders_path)) {
        const auto loaded = decodeReminders(readFile(reminders_path));
        reminders.replaceAll(loaded);
        Logger::getInstance().info("Loaded " + std::to_string(loaded.size()) + " reminders from " + reminders_path);
    } else {
        Logger::getInstance().info("No reminder snapshot at " + reminders_path + ", starting empty");
    }

    const std::string preferences_path = pathFor(kPreferencesFile);
    if (fs::exists(preferences_path)) {
        auto loaded = decodePreferences(readFile(preferences_path));
        const size_t count = loaded.size();
        preferences.replaceAll(std::move(loaded));
        Logger::getInstance().info("Loaded preferences for " + std::to_string(count) + " users");
    }

    migrateLegacyTimezones(preferences);
}

bool SnapshotPersistence::migrateLegacyTimezones(PreferenceStore& preferences) {
    const std::string legacy_path = pathFor(kLegacyTimezonesFile);
    if (!fs::exists(legacy_path)) {
        return false;
    }

    JsonParser::Object legacy;
    if (!JsonParser::parseObject(readFile(legacy_path), legacy)) {
        throw SnapshotError("Malformed legacy timezone file " + legacy_path);
    }

    for (const auto& entry : legacy) {
        const std::string zone = entry.second;
        preferences.update(entry.first, [&zone](Preferences& prefs) { prefs.timezone = zone; });
    }

    std::string error;
    if (!savePreferences(preferences, &error)) {
        throw SnapshotError("Could not persist migrated preferences: " + error);
    }

    boost::system::error_code ec;
    fs::remove(legacy_path, ec);
    if (ec) {
        throw SnapshotError("Could not remove legacy timezone file: " + ec.message());
    }

    Logger::getInstance().info("Migrated " + std::to_string(legacy.size()) + " legacy timezone entries");
    return true;
}

bool SnapshotPersistence::save(const ReminderStore& reminders, const PreferenceStore& preferences,
                               std::string* out_error) {
    const std::string reminders_json = encodeReminders(reminders.snapshot());
    if (!writeFile(pathFor(kRemindersFile), reminders_json, out_error)) {
        return false;
    }
    return savePreferences(preferences, out_error);
}

bool SnapshotPersistence::savePreferences(const PreferenceStore& preferences, std::string* out_error) {
    return writeFile(pathFor(kPreferencesFile), encodePreferences(preferences.snapshot()), out_error);
}

bool SnapshotPersistence::writeFile(const std::string& path, const std::string& content, std::string* out_error) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    boost::system::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        if (out_error) *out_error = "Cannot create " + data_dir_ + ": " + ec.message();
        return false;
    }

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            if (out_error) *out_error = "Cannot open " + tmp_path;
            return false;
        }
        file << content;
        file.flush();
        if (!file.good()) {
            if (out_error) *out_error = "Cannot write " + tmp_path;
            return false;
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        if (out_error) *out_error = "Cannot replace " + path + ": " + ec.message();
        return false;
    }
    return true;
}

std::string SnapshotPersistence::encodeReminders(const std::vector<UserReminder>& reminders) {
    std::vector<JsonParser::Object> records;
    records.reserve(reminders.size());
    for (const auto& entry : reminders) {
        JsonParser::Object record;
        record["user"] = entry.user_id;
        record["time_ms"] = std::to_string(entry.reminder.trigger_time.epochMillis());
        record["timezone"] = entry.reminder.trigger_time.zone().name();
        record["message"] = entry.reminder.message;
        if (entry.reminder.interval) {
            record["interval"] = encodeModifiers(*entry.reminder.interval);
        }
        records.push_back(std::move(record));
    }
    return JsonParser::stringifyArray(records);
}

std::vector<UserReminder> SnapshotPersistence::decodeReminders(const std::string& json) {
    std::vector<JsonParser::Object> records;
    if (!JsonParser::parseObjectArray(json, records)) {
        throw SnapshotError("Reminder snapshot is not an array of flat objects");
    }

    std::vector<UserReminder> out;
    out.reserve(records.size());
    for (size_t i = 0; i < records.size(); i++) {
        const auto& record = records[i];
        UserReminder entry;
        entry.user_id = requireField(record, "user", i);
        const int64_t epoch_ms = parseEpochMillis(requireField(record, "time_ms", i), i);
        entry.reminder.trigger_time = ZonedTime(epoch_ms, requireZone(requireField(record, "timezone", i), i));
        entry.reminder.message = requireField(record, "message", i);

        auto interval = record.find("interval");
        if (interval != record.end()) {
            std::vector<TimeModifier> modifiers;
            if (!decodeModifiers(interval->second, modifiers) || modifiers.empty()) {
                throw SnapshotError("Record " + std::to_string(i) + " has an invalid interval: " + interval->second);
            }
            entry.reminder.interval = std::move(modifiers);
        }
        out.push_back(std::move(entry));
    }
    return out;
}

std::string SnapshotPersistence::encodePreferences(const std::map<std::string, Preferences>& preferences) {
    std::vector<JsonParser::Object> records;
    records.reserve(preferences.size());
    for (const auto& entry : preferences) {
        JsonParser::Object record;
        record["user"] = entry.first;
        record["timezone"] = entry.second.timezone;
        record["time_format"] = timeFormatToString(entry.second.display_format);
        records.push_back(std::move(record));
    }
    return JsonParser::stringifyArray(records);
}

std::map<std::string, Preferences> SnapshotPersistence::decodePreferences(const std::string& json) {
    std::vector<JsonParser::Object> records;
    if (!JsonParser::parseObjectArray(json, records)) {
        throw SnapshotError("Preference snapshot is not an array of flat objects");
    }

    std::map<std::string, Preferences> out;
    for (size_t i = 0; i < records.size(); i++) {
        const auto& record = records[i];
        Preferences prefs;
        prefs.timezone = requireField(record, "timezone", i);
        const std::string& format = requireField(record, "time_format", i);
        if (!timeFormatFromString(format, prefs.display_format)) {
            throw SnapshotError("Record " + std::to_string(i) + " has an invalid time_format: " + format);
        }
        out[requireField(record, "user", i)] = prefs;
    }
    return out;
}

SnapshotWriter::SnapshotWriter(SnapshotPersistence& persistence,
                               const ReminderStore& reminders,
                               const PreferenceStore& preferences)
    : persistence_(persistence), reminders_(reminders), preferences_(preferences) {
}

SnapshotWriter::~SnapshotWriter() {
    stop();
}

void SnapshotWriter::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

void SnapshotWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void SnapshotWriter::requestSave() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = true;
    }
    cv_.notify_one();
}

size_t SnapshotWriter::completedWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_writes_;
}

void SnapshotWriter::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return pending_ || !running_; });
            if (!pending_) break;
            pending_ = false;
        }

        std::string error;
        bool ok = false;
        try {
            ok = persistence_.save(reminders_, preferences_, &error);
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (ok) {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_writes_++;
        } else {
            Logger::getInstance().error("Snapshot write failed: " + error);
        }
    }
}

} // namespace tickler
