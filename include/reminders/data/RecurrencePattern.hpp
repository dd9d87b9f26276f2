#pragma once

#include <QString>

namespace reminders {
namespace data {

enum class RecurrenceKind
{
    None,
    Daily,
    Weekly,
    Monthly,
    Unknown,
};

struct RecurrencePattern
{
    RecurrenceKind kind = RecurrenceKind::None;
    int weekday = 0;    // Qt::DayOfWeek, 0 follows the current trigger's weekday
    int dayOfMonth = 0; // 0 follows the current trigger's day
    QString rawTag;     // preserved for Unknown patterns

    static RecurrencePattern daily();
    static RecurrencePattern weekly(int weekday);
    static RecurrencePattern monthly(int dayOfMonth = 0);

    bool isNone() const { return kind == RecurrenceKind::None; }

    QString toTag() const;
    static RecurrencePattern fromTag(const QString &tag);

    bool operator==(const RecurrencePattern &other) const;
    bool operator!=(const RecurrencePattern &other) const { return !(*this == other); }
};

QString weekdayName(int weekday);
int weekdayFromName(const QString &name);

} // namespace data
} // namespace reminders
