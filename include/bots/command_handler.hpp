#ifndef TICKLER_COMMAND_HANDLER_HPP
#define TICKLER_COMMAND_HANDLER_HPP

#include <functional>
#include <string>

#include "../commands/command.hpp"
#include "../storage/preference_store.hpp"
#include "../storage/reminder_store.hpp"

namespace tickler {

// Executes chat commands against the stores and produces the reply text.
class CommandHandler {
public:
    using SaveCallback = std::function<void()>;

    // `on_mutation` is invoked after every change to either store.
    CommandHandler(ReminderStore& reminders, PreferenceStore& preferences, SaveCallback on_mutation = {});

    // Parses `text` in the user's zone and executes it. Parse failures are
    // turned into reply text as well.
    std::string handleText(const std::string& user_id, const std::string& text);

    std::string handle(const std::string& user_id, const Command& command);

    static std::string helpText();

private:
    std::string scheduleReminders(const std::string& user_id, const Command& command, TimeFormat format);
    std::string listReminders(const std::string& user_id, TimeFormat format);
    void notifyMutation();

    ReminderStore& reminders_;
    PreferenceStore& preferences_;
    SaveCallback on_mutation_;
};

} // namespace tickler

#endif // TICKLER_COMMAND_HANDLER_HPP
