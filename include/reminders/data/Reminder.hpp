#pragma once

#include <QDateTime>
#include <QString>

#include "reminders/data/RecurrencePattern.hpp"

namespace reminders {
namespace data {

QString createReminderId();

struct Reminder
{
    QString id = createReminderId();
    QString owner;
    QString message;
    QString originalText;
    QDateTime triggerTime;
    bool recurring = false;
    RecurrencePattern pattern;
    bool active = true;
    bool completed = false;
    bool snoozed = false;
    QDateTime created;
};

bool operator==(const Reminder &lhs, const Reminder &rhs);
inline bool operator!=(const Reminder &lhs, const Reminder &rhs) { return !(lhs == rhs); }

} // namespace data
} // namespace reminders
