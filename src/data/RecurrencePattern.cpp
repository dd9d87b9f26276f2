#include "reminders/data/RecurrencePattern.hpp"

#include <array>

namespace reminders {
namespace data {

namespace {
const std::array<const char *, 7> WEEKDAY_NAMES = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
};
} // namespace

QString weekdayName(int weekday)
{
    if (weekday < 1 || weekday > 7) {
        return {};
    }
    return QString::fromLatin1(WEEKDAY_NAMES[static_cast<size_t>(weekday - 1)]);
}

int weekdayFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    for (size_t i = 0; i < WEEKDAY_NAMES.size(); ++i) {
        if (normalized == QLatin1String(WEEKDAY_NAMES[i])) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

RecurrencePattern RecurrencePattern::daily()
{
    RecurrencePattern pattern;
    pattern.kind = RecurrenceKind::Daily;
    return pattern;
}

RecurrencePattern RecurrencePattern::weekly(int weekday)
{
    RecurrencePattern pattern;
    pattern.kind = RecurrenceKind::Weekly;
    pattern.weekday = weekday;
    return pattern;
}

RecurrencePattern RecurrencePattern::monthly(int dayOfMonth)
{
    RecurrencePattern pattern;
    pattern.kind = RecurrenceKind::Monthly;
    pattern.dayOfMonth = dayOfMonth;
    return pattern;
}

QString RecurrencePattern::toTag() const
{
    switch (kind) {
    case RecurrenceKind::Daily:
        return QStringLiteral("daily");
    case RecurrenceKind::Weekly:
        if (weekday > 0) {
            return QStringLiteral("weekly_%1").arg(weekdayName(weekday));
        }
        return QStringLiteral("weekly");
    case RecurrenceKind::Monthly:
        if (dayOfMonth > 0) {
            return QStringLiteral("monthly_%1").arg(dayOfMonth);
        }
        return QStringLiteral("monthly");
    case RecurrenceKind::Unknown:
        return rawTag;
    case RecurrenceKind::None:
    default:
        return {};
    }
}

RecurrencePattern RecurrencePattern::fromTag(const QString &tag)
{
    const QString normalized = tag.trimmed().toLower();
    if (normalized.isEmpty()) {
        return {};
    }

    const QString base = normalized.section('_', 0, 0);
    const QString argument = normalized.section('_', 1);

    if (base == QLatin1String("daily") && argument.isEmpty()) {
        return daily();
    }
    if (base == QLatin1String("weekly")) {
        if (argument.isEmpty()) {
            return weekly(0);
        }
        const int weekday = weekdayFromName(argument);
        if (weekday > 0) {
            return weekly(weekday);
        }
    }
    if (base == QLatin1String("monthly")) {
        if (argument.isEmpty()) {
            return monthly();
        }
        bool ok = false;
        const int day = argument.toInt(&ok);
        if (ok && day >= 1 && day <= 31) {
            return monthly(day);
        }
    }

    RecurrencePattern unknown;
    unknown.kind = RecurrenceKind::Unknown;
    unknown.rawTag = tag;
    return unknown;
}

bool RecurrencePattern::operator==(const RecurrencePattern &other) const
{
    return kind == other.kind && weekday == other.weekday && dayOfMonth == other.dayOfMonth
        && rawTag == other.rawTag;
}

} // namespace data
} // namespace reminders
