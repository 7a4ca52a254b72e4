#include "../../include/time/zoned_time.hpp"

#include <boost/filesystem.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>

namespace fs = boost::filesystem;

namespace tickler {

namespace {

constexpr const char* kUtcZone = "UTC";
constexpr const char* kFormat12h = "%A, %B %d, %Y at %-I:%M%P %Z";
constexpr const char* kFormat24h = "%A, %B %d, %Y at %H:%M %Z";

std::mutex& zoneMutex() {
    static std::mutex mutex;
    return mutex;
}

// Value TZ currently holds. Guarded by zoneMutex().
std::string& activeZone() {
    static std::string active;
    return active;
}

const char* tzValue(const std::string& name) {
    return name == kUtcZone ? "UTC0" : name.c_str();
}

// Caller holds zoneMutex(). TZ stays set for the life of the process and is
// only rewritten when the zone changes, so tzset() rereads zoneinfo on switch.
void activateZone(const std::string& name) {
    std::string& active = activeZone();
    if (active == name) return;
    setenv("TZ", tzValue(name), 1);
    tzset();
    active = name;
}

std::string zoneinfoRoot() {
    const char* env_dir = std::getenv("TZDIR");
    if (env_dir && *env_dir) {
        return env_dir;
    }
    return "/usr/share/zoneinfo";
}

// Holds the zone lock with the C library pointed at one zone.
class ScopedZone {
public:
    explicit ScopedZone(const std::string& name) : lock_(zoneMutex()) {
        activateZone(name);
    }

    ScopedZone(const ScopedZone&) = delete;
    ScopedZone& operator=(const ScopedZone&) = delete;

private:
    std::lock_guard<std::mutex> lock_;
};

void splitMillis(int64_t epoch_ms, time_t& seconds, int& millis) {
    int64_t secs = epoch_ms / 1000;
    int64_t rem = epoch_ms % 1000;
    if (rem < 0) {
        rem += 1000;
        secs -= 1;
    }
    seconds = static_cast<time_t>(secs);
    millis = static_cast<int>(rem);
}

} // namespace

std::string timeFormatToString(TimeFormat format) {
    return format == TimeFormat::H24 ? "24h" : "12h";
}

bool timeFormatFromString(const std::string& text, TimeFormat& out) {
    if (text == "12h") {
        out = TimeFormat::H12;
        return true;
    }
    if (text == "24h") {
        out = TimeFormat::H24;
        return true;
    }
    return false;
}

namespace calendar {

bool isLeapYear(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int64_t year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && isLeapYear(year)) return 29;
    return kDays[month - 1];
}

bool isValidDate(int64_t year, int64_t month, int64_t day) {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= daysInMonth(year, static_cast<int>(month));
}

int64_t daysFromCivil(int64_t year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;
    const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(int64_t days, int64_t& year, int& month, int& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

int weekdayFromDays(int64_t days) {
    // 1970-01-01 was a Thursday (3 when Monday is 0).
    int64_t wd = (days + 3) % 7;
    if (wd < 0) wd += 7;
    return static_cast<int>(wd);
}

} // namespace calendar

std::optional<TimeZone> TimeZone::locate(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name == kUtcZone) return utc();
    if (name[0] == '/' || name.find("..") != std::string::npos) return std::nullopt;

    const fs::path path = fs::path(zoneinfoRoot()) / name;
    boost::system::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }

    std::ifstream file(path.string(), std::ios::binary);
    char magic[4] = {0, 0, 0, 0};
    if (!file.read(magic, sizeof(magic))) {
        return std::nullopt;
    }
    if (std::string(magic, sizeof(magic)) != "TZif") {
        return std::nullopt;
    }
    return TimeZone(name);
}

TimeZone TimeZone::utc() {
    return TimeZone(kUtcZone);
}

void TimeZone::pinProcessZone() {
    std::lock_guard<std::mutex> lock(zoneMutex());
    setenv("TZ", tzValue(kUtcZone), 1);
    tzset();
    activeZone() = kUtcZone;
}

CivilDateTime TimeZone::toCivil(int64_t epoch_ms) const {
    time_t seconds = 0;
    int millis = 0;
    splitMillis(epoch_ms, seconds, millis);

    std::tm tm{};
    {
        ScopedZone zone(name_);
        localtime_r(&seconds, &tm);
    }

    CivilDateTime civil;
    civil.year = tm.tm_year + 1900;
    civil.month = tm.tm_mon + 1;
    civil.day = tm.tm_mday;
    civil.hour = tm.tm_hour;
    civil.minute = tm.tm_min;
    civil.second = tm.tm_sec;
    civil.millisecond = millis;
    return civil;
}

bool TimeZone::fromCivil(const CivilDateTime& civil, int64_t& epoch_ms) const {
    if (!calendar::isValidDate(civil.year, civil.month, civil.day)) return false;

    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = civil.month - 1;
    tm.tm_mday = civil.day;
    tm.tm_hour = civil.hour;
    tm.tm_min = civil.minute;
    tm.tm_sec = civil.second;
    tm.tm_isdst = -1;

    time_t seconds = 0;
    {
        ScopedZone zone(name_);
        errno = 0;
        seconds = mktime(&tm);
    }
    if (seconds == static_cast<time_t>(-1) && errno != 0) {
        return false;
    }
    epoch_ms = static_cast<int64_t>(seconds) * 1000 + civil.millisecond;
    return true;
}

std::string TimeZone::format(int64_t epoch_ms, const char* pattern) const {
    time_t seconds = 0;
    int millis = 0;
    splitMillis(epoch_ms, seconds, millis);

    char buffer[128];
    size_t written = 0;
    {
        ScopedZone zone(name_);
        std::tm tm{};
        localtime_r(&seconds, &tm);
        written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    }
    return std::string(buffer, written);
}

ZonedTime ZonedTime::now(const TimeZone& zone) {
    const int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    return ZonedTime(ms, zone);
}

int ZonedTime::weekday() const {
    const CivilDateTime c = civil();
    return calendar::weekdayFromDays(calendar::daysFromCivil(c.year, c.month, c.day));
}

std::string ZonedTime::format(TimeFormat format) const {
    return zone_.format(epoch_ms_, format == TimeFormat::H24 ? kFormat24h : kFormat12h);
}

} // namespace tickler
