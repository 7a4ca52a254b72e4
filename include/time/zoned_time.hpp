#ifndef TICKLER_ZONED_TIME_HPP
#define TICKLER_ZONED_TIME_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace tickler {

enum class TimeFormat {
    H12,
    H24
};

std::string timeFormatToString(TimeFormat format);
bool timeFormatFromString(const std::string& text, TimeFormat& out);

struct CivilDateTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
};

namespace calendar {

bool isLeapYear(int64_t year);
int daysInMonth(int64_t year, int month);
bool isValidDate(int64_t year, int64_t month, int64_t day);

// Days since 1970-01-01 for a proleptic Gregorian date, and back.
int64_t daysFromCivil(int64_t year, int month, int day);
void civilFromDays(int64_t days, int64_t& year, int& month, int& day);

// 0 = Monday .. 6 = Sunday
int weekdayFromDays(int64_t days);

} // namespace calendar

// IANA zone handle. Conversions go through the C library with TZ switched
// under a single process-wide lock, so keep them off hot paths. TZ is never
// unset once a conversion has run; it is only rewritten on a zone change.
class TimeZone {
public:
    static std::optional<TimeZone> locate(const std::string& name);
    static TimeZone utc();

    // Sets TZ to UTC. Call before any thread starts so later switches only
    // overwrite an existing environment entry.
    static void pinProcessZone();

    const std::string& name() const { return name_; }

    CivilDateTime toCivil(int64_t epoch_ms) const;

    // Local times inside a DST gap resolve to the instant mktime normalizes
    // them to. Returns false if the civil time is out of range.
    bool fromCivil(const CivilDateTime& civil, int64_t& epoch_ms) const;

    std::string format(int64_t epoch_ms, const char* pattern) const;

    bool operator==(const TimeZone& other) const { return name_ == other.name_; }
    bool operator!=(const TimeZone& other) const { return name_ != other.name_; }

private:
    explicit TimeZone(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

// An instant (millisecond precision) plus the zone it is interpreted in.
class ZonedTime {
public:
    ZonedTime() : epoch_ms_(0), zone_(TimeZone::utc()) {}
    ZonedTime(int64_t epoch_ms, TimeZone zone) : epoch_ms_(epoch_ms), zone_(std::move(zone)) {}

    static ZonedTime now(const TimeZone& zone);

    int64_t epochMillis() const { return epoch_ms_; }
    const TimeZone& zone() const { return zone_; }

    CivilDateTime civil() const { return zone_.toCivil(epoch_ms_); }
    int weekday() const;

    ZonedTime plusMillis(int64_t ms) const { return ZonedTime(epoch_ms_ + ms, zone_); }

    std::string format(TimeFormat format) const;

    bool operator<(const ZonedTime& other) const { return epoch_ms_ < other.epoch_ms_; }
    bool operator<=(const ZonedTime& other) const { return epoch_ms_ <= other.epoch_ms_; }
    bool operator>(const ZonedTime& other) const { return epoch_ms_ > other.epoch_ms_; }
    bool operator==(const ZonedTime& other) const {
        return epoch_ms_ == other.epoch_ms_ && zone_ == other.zone_;
    }
    bool operator!=(const ZonedTime& other) const { return !(*this == other); }

private:
    int64_t epoch_ms_;
    TimeZone zone_;
};

} // namespace tickler

#endif // TICKLER_ZONED_TIME_HPP
