#pragma once

#include <QString>
#include <optional>

namespace reminders {
namespace core {

enum class ActionVerb
{
    Complete,
    Snooze,
    Confirm,
    Decline,
};

enum class ActionTarget
{
    Reminder,
    Cancellation,
};

// A user response to an interactive prompt, carried as an option id such as
// "completed_reminder_<id>" or "confirm_cancellation_all".
struct ReminderAction
{
    ActionVerb verb = ActionVerb::Complete;
    ActionTarget target = ActionTarget::Reminder;
    QString identifier;

    static ReminderAction complete(const QString &reminderId);
    static ReminderAction snooze(const QString &reminderId);
    static ReminderAction confirmCancelAll();
    static ReminderAction declineCancelAll();

    QString toPayload() const;
    static std::optional<ReminderAction> fromPayload(const QString &payload);

    bool operator==(const ReminderAction &other) const;
};

} // namespace core
} // namespace reminders
