#pragma once

#include <QDateTime>
#include <QString>
#include <vector>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

struct ChoiceOption
{
    QString id;
    QString label;
};

// Outbound delivery channel. Implementations bound their own network time.
class Notifier
{
public:
    virtual ~Notifier() = default;
    virtual bool sendText(const QString &owner, const QString &text) = 0;
    virtual bool sendChoice(const QString &owner, const QString &text, const std::vector<ChoiceOption> &options) = 0;
};

// Sends an interactive prompt and degrades to plain text carrying the option
// ids when the channel cannot show it.
bool deliverChoice(Notifier &notifier, const QString &owner, const QString &text,
                   const std::vector<ChoiceOption> &options);
QString choiceFallbackText(const QString &text, const std::vector<ChoiceOption> &options);

QString formatDateForDisplay(const QDateTime &dt);
QString reminderAlertText(const data::Reminder &reminder);
std::vector<ChoiceOption> reminderAlertOptions(const data::Reminder &reminder, int snoozeMinutes);

} // namespace core
} // namespace reminders
