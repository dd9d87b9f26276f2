#include "reminders/core/Notifier.hpp"

#include "reminders/core/Logging.hpp"
#include "reminders/core/ReminderAction.hpp"

namespace reminders {
namespace core {

bool deliverChoice(Notifier &notifier, const QString &owner, const QString &text,
                   const std::vector<ChoiceOption> &options)
{
    if (notifier.sendChoice(owner, text, options)) {
        return true;
    }
    qCWarning(lcApp) << "Interactive message to" << owner << "failed, falling back to text";
    if (notifier.sendText(owner, choiceFallbackText(text, options))) {
        return true;
    }
    qCWarning(lcApp) << "Text fallback to" << owner << "failed as well";
    return false;
}

QString choiceFallbackText(const QString &text, const std::vector<ChoiceOption> &options)
{
    QString message = text;
    for (const ChoiceOption &option : options) {
        message += QStringLiteral("\n- %1 (Option ID: %2)").arg(option.label, option.id);
    }
    message += QStringLiteral("\n(Could not display buttons, reply with an option ID instead)");
    return message;
}

QString formatDateForDisplay(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QStringLiteral("Invalid Date");
    }
    return dt.toLocalTime().toString(QStringLiteral("MMM d, yyyy, h:mm AP"));
}

QString reminderAlertText(const data::Reminder &reminder)
{
    return QStringLiteral("REMINDER ALERT!\n\n%1\n\nWas scheduled for: %2\n\nDid you complete this task?")
        .arg(reminder.message, formatDateForDisplay(reminder.triggerTime));
}

std::vector<ChoiceOption> reminderAlertOptions(const data::Reminder &reminder, int snoozeMinutes)
{
    return {
        {ReminderAction::complete(reminder.id).toPayload(), QStringLiteral("Yes, Done!")},
        {ReminderAction::snooze(reminder.id).toPayload(), QStringLiteral("Snooze %1min").arg(snoozeMinutes)},
    };
}

} // namespace core
} // namespace reminders
