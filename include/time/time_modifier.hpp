#ifndef TICKLER_TIME_MODIFIER_HPP
#define TICKLER_TIME_MODIFIER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zoned_time.hpp"

namespace tickler {

// One step of a time expression. Values are immutable once built; use the
// named constructors.
class TimeModifier {
public:
    enum class Kind {
        Delay,
        Weekday,
        TimeOfDay,
        Date,
        Months
    };

    static TimeModifier delay(uint64_t milliseconds);
    static TimeModifier weekday(int ordinal);                 // 0 = Monday
    static TimeModifier timeOfDay(int hour, int minute);
    static TimeModifier date(std::optional<int64_t> year, std::optional<int64_t> month, int64_t day);
    static TimeModifier months(uint64_t count);

    Kind kind() const { return kind_; }
    uint64_t delayMillis() const { return amount_; }
    uint64_t monthCount() const { return amount_; }
    int weekdayOrdinal() const { return weekday_; }
    int hour() const { return hour_; }
    int minute() const { return minute_; }
    const std::optional<int64_t>& year() const { return year_; }
    const std::optional<int64_t>& month() const { return month_; }
    int64_t day() const { return day_; }

    bool apply(const ZonedTime& base, ZonedTime& out, std::string* out_error = nullptr) const;

    // Command-grammar rendering, e.g. "1d", "tuesday", "15:00", "2001-03-06".
    std::string describe() const;

    // Persistence form: delay:<ms> | weekday:<n> | time:<h>:<m> |
    // date:<y|*>-<m|*>-<d> | months:<n>
    std::string encode() const;
    static bool decode(const std::string& text, TimeModifier& out);

    bool operator==(const TimeModifier& other) const;
    bool operator!=(const TimeModifier& other) const { return !(*this == other); }

private:
    TimeModifier() = default;

    Kind kind_ = Kind::Delay;
    uint64_t amount_ = 0;
    int weekday_ = 0;
    int hour_ = 0;
    int minute_ = 0;
    std::optional<int64_t> year_;
    std::optional<int64_t> month_;
    int64_t day_ = 1;
};

// Applies modifiers strictly left to right; each sees the previous result.
bool applyAll(const std::vector<TimeModifier>& modifiers,
              const ZonedTime& base,
              ZonedTime& out,
              std::string* out_error = nullptr);

std::string encodeModifiers(const std::vector<TimeModifier>& modifiers);
bool decodeModifiers(const std::string& text, std::vector<TimeModifier>& out);
std::string describeModifiers(const std::vector<TimeModifier>& modifiers);

} // namespace tickler

#endif // TICKLER_TIME_MODIFIER_HPP
