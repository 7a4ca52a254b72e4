#include "../../include/bots/command_handler.hpp"
#include "../../include/commands/command_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <sstream>

namespace tickler {

namespace {

std::string invalidId(uint64_t id) {
    return "Invalid reminder ID: " + std::to_string(id);
}

std::string timeParsingError(const std::string& detail) {
    return "Time parsing error: " + detail;
}

} // namespace

CommandHandler::CommandHandler(ReminderStore& reminders, PreferenceStore& preferences, SaveCallback on_mutation)
    : reminders_(reminders), preferences_(preferences), on_mutation_(std::move(on_mutation)) {}

std::string CommandHandler::handleText(const std::string& user_id, const std::string& text) {
    const TimeZone zone = preferences_.resolveTimeZone(user_id);

    Command command;
    ParseError error;
    if (!CommandParser::parse(text, zone, command, error)) {
        if (error.kind == ParseError::Kind::Calendar) {
            return timeParsingError(error.describe());
        }
        return "Invalid command: " + error.describe();
    }
    return handle(user_id, command);
}

std::string CommandHandler::handle(const std::string& user_id, const Command& command) {
    const TimeFormat format = preferences_.get(user_id).display_format;

    switch (command.type) {
        case Command::Type::ScheduleReminder:
            return scheduleReminders(user_id, command, format);

        case Command::Type::CancelReminder: {
            Reminder removed;
            if (!reminders_.removeAt(user_id, command.id, removed)) {
                return invalidId(command.id);
            }
            notifyMutation();
            return "Removed reminder '" + removed.message + "'";
        }

        case Command::Type::SetInterval: {
            Reminder updated;
            if (!reminders_.setInterval(user_id, command.id, command.modifiers, updated)) {
                return invalidId(command.id);
            }
            notifyMutation();
            return "Set interval for reminder '" + updated.message + "' (#" + std::to_string(command.id) + ")";
        }

        case Command::Type::ClearInterval: {
            Reminder updated;
            if (!reminders_.clearInterval(user_id, command.id, updated)) {
                return invalidId(command.id);
            }
            notifyMutation();
            return "Cleared interval for reminder '" + updated.message + "' (#" + std::to_string(command.id) + ")";
        }

        case Command::Type::ListReminders:
            return listReminders(user_id, format);

        case Command::Type::SetTimezone: {
            if (!TimeZone::locate(command.timezone)) {
                return "Unknown timezone: " + command.timezone;
            }
            const std::string zone = command.timezone;
            preferences_.update(user_id, [&zone](Preferences& prefs) { prefs.timezone = zone; });
            notifyMutation();
            return "Timezone set to " + zone;
        }

        case Command::Type::SetTimeFormat: {
            const TimeFormat selected = command.format;
            preferences_.update(user_id, [selected](Preferences& prefs) { prefs.display_format = selected; });
            notifyMutation();
            return "Time format set to " + timeFormatToString(selected);
        }

        case Command::Type::Help:
            return helpText();
    }
    return helpText();
}

std::string CommandHandler::scheduleReminders(const std::string& user_id, const Command& command, TimeFormat format) {
    std::vector<Reminder> batch;
    batch.reserve(command.times.size());
    for (const auto& time : command.times) {
        Reminder reminder;
        reminder.trigger_time = time;
        reminder.message = command.message;
        batch.push_back(std::move(reminder));
    }

    const std::vector<size_t> positions = reminders_.addAll(user_id, batch);
    notifyMutation();

    std::ostringstream out;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i > 0) out << "\n";
        out << "Scheduled reminder for " << batch[i].trigger_time.format(format)
            << " (#" << positions[i] << ")";
    }
    return out.str();
}

std::string CommandHandler::listReminders(const std::string& user_id, TimeFormat format) {
    const std::vector<Reminder> list = reminders_.list(user_id);
    if (list.empty()) {
        return "No reminders";
    }

    std::ostringstream out;
    for (size_t id = 0; id < list.size(); ++id) {
        const Reminder& reminder = list[id];
        if (id > 0) out << "\n";
        out << id << ": " << reminder.trigger_time.format(format) << " - " << reminder.message;
        if (reminder.interval) {
            ZonedTime next;
            std::string error;
            if (!applyAll(*reminder.interval, reminder.trigger_time, next, &error)) {
                return timeParsingError(error);
            }
            out << " (Repeats at " << next.format(format) << ")";
        }
    }
    return out.str();
}

void CommandHandler::notifyMutation() {
    if (on_mutation_) {
        on_mutation_();
    }
}

std::string CommandHandler::helpText() {
    return "Time modifier examples:\n"
           "1d - 1 day from now\n"
           "1w1h5m3s - 1 week, 1 hour, 5 minutes, 3 seconds from now\n"
           "3pm - 3:00 PM\n"
           "3:30pm - 3:30 PM\n"
           "15:30 - 3:30 PM\n"
           "2001-03-06 - March 6th, 2001\n"
           "--15 - the 15th of this month\n"
           "1mo - 1 month\n"
           "tuesday - Tuesday\n"
           "1w tuesday - The next Tuesday in 1 week\n"
           "(1d, 2d) 3pm - 3:00 PM tomorrow and the day after\n"
           "\n"
           "Commands:\n"
           "`$r|remindme|reminder <modifiers>; message` - Schedule a reminder\n"
           "`$cr|cancelreminder <id>` - Cancel a reminder\n"
           "`$rs|reminders` - List reminders\n"
           "`$si|setinterval <id> <modifiers>` - Set a reminder to be repeated on an interval\n"
           "`$ci|clearinterval <id>` - Clear the interval of a reminder\n"
           "`$tz|timezone <timezone>` - Set your timezone\n"
           "`$tf|timeformat 12h|24h` - Set how times are displayed\n"
           "`$h|help` - Show help";
}

} // namespace tickler
