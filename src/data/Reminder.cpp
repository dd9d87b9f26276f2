#include "reminders/data/Reminder.hpp"

#include <QRandomGenerator>

namespace reminders {
namespace data {

QString createReminderId()
{
    static const char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    QString suffix;
    suffix.reserve(7);
    for (int i = 0; i < 7; ++i) {
        suffix.append(QLatin1Char(ALPHABET[QRandomGenerator::global()->bounded(36)]));
    }
    return QStringLiteral("%1-%2").arg(QDateTime::currentMSecsSinceEpoch()).arg(suffix);
}

bool operator==(const Reminder &lhs, const Reminder &rhs)
{
    return lhs.id == rhs.id && lhs.owner == rhs.owner && lhs.message == rhs.message
        && lhs.originalText == rhs.originalText && lhs.triggerTime == rhs.triggerTime
        && lhs.recurring == rhs.recurring && lhs.pattern == rhs.pattern && lhs.active == rhs.active
        && lhs.completed == rhs.completed && lhs.snoozed == rhs.snoozed && lhs.created == rhs.created;
}

} // namespace data
} // namespace reminders
