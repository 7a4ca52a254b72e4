#ifndef TICKLER_COMMAND_HPP
#define TICKLER_COMMAND_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "../time/time_modifier.hpp"
#include "../time/zoned_time.hpp"

namespace tickler {

// Parsed chat command. Only the fields relevant to `type` are populated.
struct Command {
    enum class Type {
        ScheduleReminder,   // times, message
        CancelReminder,     // id
        SetInterval,        // id, modifiers
        ClearInterval,      // id
        SetTimezone,        // timezone
        SetTimeFormat,      // format
        ListReminders,
        Help
    };

    Type type = Type::Help;
    std::vector<ZonedTime> times;   // one per permutation candidate, discovery order
    std::string message;
    uint64_t id = 0;
    std::vector<TimeModifier> modifiers;
    std::string timezone;
    TimeFormat format = TimeFormat::H12;
};

// A time-expression position: one modifier, or a branch of alternatives.
struct Modifier {
    std::vector<TimeModifier> alternatives;
    bool is_branch = false;
};

} // namespace tickler

#endif // TICKLER_COMMAND_HPP
