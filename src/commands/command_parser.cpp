#include "../../include/commands/command_parser.hpp"

#include <cctype>
#include <limits>
#include <string>

namespace tickler {

namespace {

const char* const kWeekdayNames[] = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

bool isTokenBoundary(char c) {
    return c == ' ' || c == ';' || c == ',' || c == '(' || c == ')';
}

// Matches "tuesday" or "Tuesday" only.
int weekdayOrdinal(const std::string& word) {
    for (int i = 0; i < 7; i++) {
        const std::string name = kWeekdayNames[i];
        if (word == name) return i;
        std::string capitalized = name;
        capitalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(capitalized[0])));
        if (word == capitalized) return i;
    }
    return -1;
}

uint64_t durationMultiplier(char unit) {
    switch (unit) {
        case 'w': return 7ULL * 24 * 60 * 60 * 1000;
        case 'd': return 24ULL * 60 * 60 * 1000;
        case 'h': return 60ULL * 60 * 1000;
        case 'm': return 60ULL * 1000;
        case 's': return 1000ULL;
        default: return 0;
    }
}

class Reader {
public:
    Reader(const std::string& text, ParseError& error) : text_(text), error_(error) {}

    bool atEnd() const { return pos_ >= text_.size(); }
    size_t position() const { return pos_; }

    char peek(size_t ahead = 0) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    bool consume(char c) {
        if (peek() != c) return false;
        pos_++;
        return true;
    }

    bool consumeLiteral(const std::string& literal) {
        if (text_.compare(pos_, literal.size(), literal) != 0) return false;
        pos_ += literal.size();
        return true;
    }

    std::string rest() {
        std::string out = text_.substr(pos_);
        pos_ = text_.size();
        return out;
    }

    std::string readWord() {
        const size_t start = pos_;
        while (!atEnd() && peek() != ' ') pos_++;
        return text_.substr(start, pos_ - start);
    }

    bool fail(const std::string& message) { return failAt(pos_, message); }

    bool failAt(size_t position, const std::string& message) {
        error_.kind = ParseError::Kind::Syntax;
        error_.position = position;
        error_.token = tokenAt(position);
        error_.message = message;
        return false;
    }

    bool expectSpace() {
        if (consume(' ')) return true;
        return fail("Expected a space");
    }

    bool expectEnd() {
        if (atEnd()) return true;
        return fail("Unexpected input");
    }

    bool readNumber(uint64_t& out) {
        const size_t start = pos_;
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return fail("Expected a number");
        }
        uint64_t value = 0;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            const uint64_t digit = static_cast<uint64_t>(peek() - '0');
            if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                return failAt(start, "Number is too large");
            }
            value = value * 10 + digit;
            pos_++;
        }
        out = value;
        return true;
    }

    bool readTimeExpression(std::vector<Modifier>& out, bool allow_branches) {
        out.clear();
        size_t candidates = 1;
        while (true) {
            if (!allow_branches && peek() == '(') {
                return fail("Branches are not allowed in an interval");
            }
            const size_t start = pos_;
            Modifier modifier;
            if (!readModifier(modifier)) return false;
            candidates *= modifier.alternatives.size();
            if (candidates > CommandParser::kMaxCandidates) {
                failAt(start, "Too many reminder times, at most " +
                              std::to_string(CommandParser::kMaxCandidates) + " are allowed");
                error_.token = text_.substr(start, pos_ - start);
                return false;
            }
            out.push_back(std::move(modifier));

            if (peek() != ' ') break;
            pos_++;
        }
        return true;
    }

private:
    std::string tokenAt(size_t position) const {
        if (position >= text_.size()) return "end of input";
        size_t end = position;
        while (end < text_.size() && !isTokenBoundary(text_[end])) end++;
        if (end == position) end = position + 1;
        return text_.substr(position, end - position);
    }

    bool readModifier(Modifier& out) {
        out.alternatives.clear();
        if (!consume('(')) {
            TimeModifier modifier = TimeModifier::delay(0);
            if (!readPlainModifier(modifier)) return false;
            if (!atEnd() && peek() != ' ' && peek() != ';') {
                return fail("Unexpected character in time expression");
            }
            out.alternatives.push_back(modifier);
            out.is_branch = false;
            return true;
        }

        out.is_branch = true;
        while (true) {
            while (consume(' ')) {}
            TimeModifier modifier = TimeModifier::delay(0);
            if (!readPlainModifier(modifier)) return false;
            out.alternatives.push_back(modifier);
            while (consume(' ')) {}
            if (consume(',')) continue;
            if (consume(')')) return true;
            return fail("Expected ',' or ')'");
        }
    }

    bool readPlainModifier(TimeModifier& out) {
        const size_t start = pos_;

        if (std::isalpha(static_cast<unsigned char>(peek()))) {
            while (std::isalpha(static_cast<unsigned char>(peek()))) pos_++;
            const std::string word = text_.substr(start, pos_ - start);
            const int ordinal = weekdayOrdinal(word);
            if (ordinal < 0) {
                return failAt(start, "Invalid weekday: " + word);
            }
            out = TimeModifier::weekday(ordinal);
            return true;
        }

        if (peek() == '-') {
            return readDate(std::nullopt, out);
        }

        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return fail("Expected a time modifier");
        }

        uint64_t number = 0;
        if (!readNumber(number)) return false;

        if (peek() == 'm' && peek(1) == 'o') {
            pos_ += 2;
            out = TimeModifier::months(number);
            return true;
        }
        if (durationMultiplier(peek()) != 0) {
            return readDelays(start, number, out);
        }
        if (peek() == '-') {
            if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return failAt(start, "Number is too large");
            }
            return readDate(static_cast<int64_t>(number), out);
        }
        return readTimeOfDay(number, out);
    }

    // <n><unit> runs such as "1w2d3h" are summed into one delay.
    bool readDelays(size_t start, uint64_t first, TimeModifier& out) {
        uint64_t total = 0;
        uint64_t amount = first;
        size_t token_start = start;
        while (true) {
            if (peek() == 'm' && peek(1) == 'o') {
                return failAt(token_start, "Months cannot be combined with a duration");
            }
            const uint64_t multiplier = durationMultiplier(peek());
            if (multiplier == 0) {
                return fail("Expected a duration unit (w, d, h, m, s)");
            }
            if (amount > std::numeric_limits<uint64_t>::max() / multiplier ||
                total > std::numeric_limits<uint64_t>::max() - amount * multiplier) {
                return failAt(token_start, "Duration is too large");
            }
            total += amount * multiplier;
            pos_++;

            if (!std::isdigit(static_cast<unsigned char>(peek()))) break;
            token_start = pos_;
            if (!readNumber(amount)) return false;
        }
        out = TimeModifier::delay(total);
        return true;
    }

    // [<year>]-[<month>]-<day>; the reader sits on the first '-'.
    bool readDate(std::optional<int64_t> year, TimeModifier& out) {
        if (!consume('-')) return fail("Expected '-' in date");

        std::optional<int64_t> month;
        if (std::isdigit(static_cast<unsigned char>(peek()))) {
            const size_t month_start = pos_;
            uint64_t value = 0;
            if (!readNumber(value)) return false;
            if (value > 99) return failAt(month_start, "Invalid month");
            month = static_cast<int64_t>(value);
        }
        if (!consume('-')) return fail("Expected '-' in date");

        const size_t day_start = pos_;
        uint64_t day = 0;
        if (!readNumber(day)) return false;
        if (day > 99) return failAt(day_start, "Invalid day");

        out = TimeModifier::date(year, month, static_cast<int64_t>(day));
        return true;
    }

    // <hour>[:<minute>][am|pm]; without a suffix the hour is on a 24h clock.
    bool readTimeOfDay(uint64_t hour, TimeModifier& out) {
        uint64_t minute = 0;
        if (consume(':')) {
            const size_t minute_start = pos_;
            if (!readNumber(minute)) return false;
            if (minute > 59) return failAt(minute_start, "Invalid minute");
        }

        if (consumeLiteral("am")) {
            hour %= 12;
        } else if (consumeLiteral("pm")) {
            hour = hour % 12 + 12;
        } else {
            hour %= 24;
        }
        out = TimeModifier::timeOfDay(static_cast<int>(hour), static_cast<int>(minute));
        return true;
    }

    const std::string& text_;
    ParseError& error_;
    size_t pos_ = 0;
};

bool readId(Reader& reader, uint64_t& id) {
    return reader.expectSpace() && reader.readNumber(id);
}

} // namespace

std::string ParseError::describe() const {
    if (kind == Kind::Calendar) {
        return message;
    }
    return message + " (at position " + std::to_string(position + 1) + ", near '" + token + "')";
}

bool CommandParser::isCommand(const std::string& text) {
    return !text.empty() && text[0] == kPrefix;
}

bool CommandParser::parse(const std::string& text, const TimeZone& zone, Command& out, ParseError& error) {
    return parse(text, ZonedTime::now(zone), out, error);
}

bool CommandParser::parse(const std::string& text, const ZonedTime& now, Command& out, ParseError& error) {
    Reader reader(text, error);
    out = Command();

    if (!reader.consume(kPrefix)) {
        return reader.fail(std::string("Commands start with '") + kPrefix + "'");
    }

    const size_t keyword_start = reader.position();
    const std::string keyword = reader.readWord();

    if (keyword == "r" || keyword == "remindme" || keyword == "reminder") {
        out.type = Command::Type::ScheduleReminder;
        std::vector<Modifier> modifiers;
        if (!reader.expectSpace() || !reader.readTimeExpression(modifiers, true)) return false;
        if (!reader.consume(';')) return reader.fail("Expected ';' before the reminder message");
        reader.consume(' ');
        if (reader.atEnd()) return reader.fail("Expected a reminder message");
        out.message = reader.rest();

        for (const auto& sequence : expandPermutations(modifiers)) {
            ZonedTime time;
            std::string calendar_error;
            if (!applyAll(sequence, now, time, &calendar_error)) {
                error.kind = ParseError::Kind::Calendar;
                error.position = keyword_start;
                error.token = describeModifiers(sequence);
                error.message = calendar_error;
                return false;
            }
            out.times.push_back(time);
        }
        return true;
    }

    if (keyword == "cr" || keyword == "cancelreminder") {
        out.type = Command::Type::CancelReminder;
        return readId(reader, out.id) && reader.expectEnd();
    }

    if (keyword == "si" || keyword == "setinterval") {
        out.type = Command::Type::SetInterval;
        std::vector<Modifier> modifiers;
        if (!readId(reader, out.id) || !reader.expectSpace()) return false;
        if (!reader.readTimeExpression(modifiers, false) || !reader.expectEnd()) return false;
        for (const auto& modifier : modifiers) {
            out.modifiers.push_back(modifier.alternatives.front());
        }
        return true;
    }

    if (keyword == "ci" || keyword == "clearinterval") {
        out.type = Command::Type::ClearInterval;
        return readId(reader, out.id) && reader.expectEnd();
    }

    if (keyword == "rs" || keyword == "reminders") {
        out.type = Command::Type::ListReminders;
        return reader.expectEnd();
    }

    if (keyword == "tz" || keyword == "timezone") {
        out.type = Command::Type::SetTimezone;
        if (!reader.expectSpace()) return false;
        if (reader.atEnd()) return reader.fail("Expected a timezone name");
        out.timezone = reader.rest();
        return true;
    }

    if (keyword == "tf" || keyword == "timeformat") {
        out.type = Command::Type::SetTimeFormat;
        if (!reader.expectSpace()) return false;
        const size_t value_start = reader.position();
        if (!timeFormatFromString(reader.rest(), out.format)) {
            return reader.failAt(value_start, "Expected 12h or 24h");
        }
        return true;
    }

    if (keyword == "h" || keyword == "help") {
        out.type = Command::Type::Help;
        return reader.expectEnd();
    }

    return reader.failAt(keyword_start, "Unknown command: " + keyword);
}

bool CommandParser::parseTimeExpression(const std::string& text, std::vector<Modifier>& out, ParseError& error) {
    Reader reader(text, error);
    return reader.readTimeExpression(out, true) && reader.expectEnd();
}

std::vector<std::vector<TimeModifier>> CommandParser::expandPermutations(const std::vector<Modifier>& modifiers) {
    std::vector<std::vector<TimeModifier>> candidates(1);
    for (const auto& modifier : modifiers) {
        if (!modifier.is_branch) {
            for (auto& candidate : candidates) {
                candidate.push_back(modifier.alternatives.front());
            }
            continue;
        }

        std::vector<std::vector<TimeModifier>> next;
        next.reserve(candidates.size() * modifier.alternatives.size());
        for (const auto& candidate : candidates) {
            for (const auto& alternative : modifier.alternatives) {
                std::vector<TimeModifier> extended = candidate;
                extended.push_back(alternative);
                next.push_back(std::move(extended));
            }
        }
        candidates = std::move(next);
    }
    return candidates;
}

} // namespace tickler
