#include "../../include/time/time_modifier.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <limits>
#include <sstream>
#include <utility>

namespace tickler {

namespace {

constexpr uint64_t kMillisPerSecond = 1000;
constexpr uint64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr uint64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr uint64_t kMillisPerDay = 24 * kMillisPerHour;
constexpr uint64_t kMillisPerWeek = 7 * kMillisPerDay;

// 9999-12-31T23:59:59.999Z
constexpr int64_t kMaxEpochMillis = 253402300799999LL;
constexpr int64_t kMaxYear = 9999;

const char* const kWeekdayNames[] = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

void setError(std::string* out_error, const std::string& message) {
    if (out_error) {
        *out_error = message;
    }
}

bool parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty()) return false;
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

bool parseOptionalPart(const std::string& text, std::optional<int64_t>& out) {
    if (text == "*") {
        out.reset();
        return true;
    }
    uint64_t value = 0;
    if (!parseUnsigned(text, value) || value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

bool toZoned(const CivilDateTime& civil, const TimeZone& zone, ZonedTime& out, std::string* out_error) {
    int64_t epoch_ms = 0;
    if (!zone.fromCivil(civil, epoch_ms)) {
        setError(out_error, "Could not resolve " + std::to_string(civil.year) + "-" +
                 std::to_string(civil.month) + "-" + std::to_string(civil.day) +
                 " in " + zone.name());
        return false;
    }
    out = ZonedTime(epoch_ms, zone);
    return true;
}

} // namespace

TimeModifier TimeModifier::delay(uint64_t milliseconds) {
    TimeModifier m;
    m.kind_ = Kind::Delay;
    m.amount_ = milliseconds;
    return m;
}

TimeModifier TimeModifier::weekday(int ordinal) {
    TimeModifier m;
    m.kind_ = Kind::Weekday;
    m.weekday_ = ordinal;
    return m;
}

TimeModifier TimeModifier::timeOfDay(int hour, int minute) {
    TimeModifier m;
    m.kind_ = Kind::TimeOfDay;
    m.hour_ = hour;
    m.minute_ = minute;
    return m;
}

TimeModifier TimeModifier::date(std::optional<int64_t> year, std::optional<int64_t> month, int64_t day) {
    TimeModifier m;
    m.kind_ = Kind::Date;
    m.year_ = year;
    m.month_ = month;
    m.day_ = day;
    return m;
}

TimeModifier TimeModifier::months(uint64_t count) {
    TimeModifier m;
    m.kind_ = Kind::Months;
    m.amount_ = count;
    return m;
}

bool TimeModifier::apply(const ZonedTime& base, ZonedTime& out, std::string* out_error) const {
    switch (kind_) {
        case Kind::Delay: {
            const int64_t start = base.epochMillis();
            if (amount_ > static_cast<uint64_t>(kMaxEpochMillis) ||
                start > kMaxEpochMillis - static_cast<int64_t>(amount_)) {
                setError(out_error, "Time is out of range");
                return false;
            }
            out = base.plusMillis(static_cast<int64_t>(amount_));
            return true;
        }
        case Kind::TimeOfDay: {
            if (hour_ < 0 || hour_ > 23 || minute_ < 0 || minute_ > 59) {
                setError(out_error, "Invalid time of day");
                return false;
            }
            CivilDateTime civil = base.civil();
            civil.hour = hour_;
            civil.minute = minute_;
            civil.second = 0;
            civil.millisecond = 0;
            return toZoned(civil, base.zone(), out, out_error);
        }
        case Kind::Date: {
            CivilDateTime civil = base.civil();
            const int64_t year = year_ ? *year_ : civil.year;
            const int64_t month = month_ ? *month_ : civil.month;
            if (!calendar::isValidDate(year, month, day_)) {
                setError(out_error, "Invalid date: " + std::to_string(year) + "-" +
                         std::to_string(month) + "-" + std::to_string(day_));
                return false;
            }
            civil.year = static_cast<int>(year);
            civil.month = static_cast<int>(month);
            civil.day = static_cast<int>(day_);
            civil.millisecond = 0;
            return toZoned(civil, base.zone(), out, out_error);
        }
        case Kind::Weekday: {
            if (weekday_ < 0 || weekday_ > 6) {
                setError(out_error, "Invalid weekday");
                return false;
            }
            CivilDateTime civil = base.civil();
            const int64_t days = calendar::daysFromCivil(civil.year, civil.month, civil.day);
            int delta = (weekday_ - calendar::weekdayFromDays(days) + 7) % 7;
            if (delta == 0) {
                delta = 7;
            }
            int64_t year = 0;
            calendar::civilFromDays(days + delta, year, civil.month, civil.day);
            if (year > kMaxYear) {
                setError(out_error, "Time is out of range");
                return false;
            }
            civil.year = static_cast<int>(year);
            return toZoned(civil, base.zone(), out, out_error);
        }
        case Kind::Months: {
            CivilDateTime civil = base.civil();
            const uint64_t current = static_cast<uint64_t>(civil.year) * 12 + static_cast<uint64_t>(civil.month - 1);
            if (amount_ > static_cast<uint64_t>(kMaxYear + 1) * 12) {
                setError(out_error, "Time is out of range");
                return false;
            }
            const uint64_t total = current + amount_;
            const int64_t year = static_cast<int64_t>(total / 12);
            if (year > kMaxYear) {
                setError(out_error, "Time is out of range");
                return false;
            }
            civil.year = static_cast<int>(year);
            civil.month = static_cast<int>(total % 12) + 1;
            // End-of-month clamping: Jan 31 + 1mo lands on the last day of February.
            civil.day = std::min(civil.day, calendar::daysInMonth(civil.year, civil.month));
            return toZoned(civil, base.zone(), out, out_error);
        }
    }
    setError(out_error, "Unknown time modifier");
    return false;
}

std::string TimeModifier::describe() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::Delay: {
            uint64_t rest = amount_;
            const std::pair<uint64_t, char> units[] = {
                {kMillisPerWeek, 'w'}, {kMillisPerDay, 'd'}, {kMillisPerHour, 'h'},
                {kMillisPerMinute, 'm'}, {kMillisPerSecond, 's'}
            };
            for (const auto& unit : units) {
                if (rest >= unit.first) {
                    oss << rest / unit.first << unit.second;
                    rest %= unit.first;
                }
            }
            if (oss.tellp() == 0) {
                oss << "0s";
            }
            break;
        }
        case Kind::Weekday:
            oss << (weekday_ >= 0 && weekday_ <= 6 ? kWeekdayNames[weekday_] : "?");
            break;
        case Kind::TimeOfDay: {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%d:%02d", hour_, minute_);
            oss << buffer;
            break;
        }
        case Kind::Date: {
            if (year_) oss << *year_;
            oss << "-";
            if (month_) {
                char buffer[24];
                std::snprintf(buffer, sizeof(buffer), "%02lld", static_cast<long long>(*month_));
                oss << buffer;
            }
            char buffer[24];
            std::snprintf(buffer, sizeof(buffer), "-%02lld", static_cast<long long>(day_));
            oss << buffer;
            break;
        }
        case Kind::Months:
            oss << amount_ << "mo";
            break;
    }
    return oss.str();
}

std::string TimeModifier::encode() const {
    switch (kind_) {
        case Kind::Delay:
            return "delay:" + std::to_string(amount_);
        case Kind::Weekday:
            return "weekday:" + std::to_string(weekday_);
        case Kind::TimeOfDay:
            return "time:" + std::to_string(hour_) + ":" + std::to_string(minute_);
        case Kind::Date:
            return "date:" + (year_ ? std::to_string(*year_) : std::string("*")) + "-" +
                   (month_ ? std::to_string(*month_) : std::string("*")) + "-" +
                   std::to_string(day_);
        case Kind::Months:
            return "months:" + std::to_string(amount_);
    }
    return "";
}

bool TimeModifier::decode(const std::string& text, TimeModifier& out) {
    const size_t colon = text.find(':');
    if (colon == std::string::npos) return false;
    const std::string tag = text.substr(0, colon);
    const std::string body = text.substr(colon + 1);

    if (tag == "delay" || tag == "months") {
        uint64_t value = 0;
        if (!parseUnsigned(body, value)) return false;
        out = tag == "delay" ? delay(value) : months(value);
        return true;
    }
    if (tag == "weekday") {
        uint64_t value = 0;
        if (!parseUnsigned(body, value) || value > 6) return false;
        out = weekday(static_cast<int>(value));
        return true;
    }
    if (tag == "time") {
        const size_t sep = body.find(':');
        if (sep == std::string::npos) return false;
        uint64_t hour = 0;
        uint64_t minute = 0;
        if (!parseUnsigned(body.substr(0, sep), hour) || !parseUnsigned(body.substr(sep + 1), minute)) {
            return false;
        }
        if (hour > 23 || minute > 59) return false;
        out = timeOfDay(static_cast<int>(hour), static_cast<int>(minute));
        return true;
    }
    if (tag == "date") {
        const size_t first = body.find('-');
        const size_t second = first == std::string::npos ? std::string::npos : body.find('-', first + 1);
        if (second == std::string::npos) return false;
        std::optional<int64_t> year;
        std::optional<int64_t> month;
        std::optional<int64_t> day;
        if (!parseOptionalPart(body.substr(0, first), year) ||
            !parseOptionalPart(body.substr(first + 1, second - first - 1), month) ||
            !parseOptionalPart(body.substr(second + 1), day) || !day) {
            return false;
        }
        out = date(year, month, *day);
        return true;
    }
    return false;
}

bool TimeModifier::operator==(const TimeModifier& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::Delay:
        case Kind::Months:
            return amount_ == other.amount_;
        case Kind::Weekday:
            return weekday_ == other.weekday_;
        case Kind::TimeOfDay:
            return hour_ == other.hour_ && minute_ == other.minute_;
        case Kind::Date:
            return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
    }
    return false;
}

bool applyAll(const std::vector<TimeModifier>& modifiers,
              const ZonedTime& base,
              ZonedTime& out,
              std::string* out_error) {
    ZonedTime current = base;
    for (const auto& modifier : modifiers) {
        ZonedTime next;
        if (!modifier.apply(current, next, out_error)) {
            return false;
        }
        current = next;
    }
    out = current;
    return true;
}

std::string encodeModifiers(const std::vector<TimeModifier>& modifiers) {
    std::string out;
    for (size_t i = 0; i < modifiers.size(); i++) {
        if (i > 0) out += ';';
        out += modifiers[i].encode();
    }
    return out;
}

bool decodeModifiers(const std::string& text, std::vector<TimeModifier>& out) {
    out.clear();
    if (text.empty()) return true;

    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ';')) {
        TimeModifier modifier = TimeModifier::delay(0);
        if (!TimeModifier::decode(item, modifier)) {
            return false;
        }
        out.push_back(modifier);
    }
    return true;
}

std::string describeModifiers(const std::vector<TimeModifier>& modifiers) {
    std::string out;
    for (size_t i = 0; i < modifiers.size(); i++) {
        if (i > 0) out += ' ';
        out += modifiers[i].describe();
    }
    return out;
}

} // namespace tickler
