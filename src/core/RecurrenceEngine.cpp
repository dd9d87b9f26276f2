#include "reminders/core/RecurrenceEngine.hpp"

#include <QDate>
#include <QtGlobal>

#include "reminders/core/Logging.hpp"

namespace reminders {
namespace core {

namespace {
constexpr qint64 SECONDS_PER_DAY = 24 * 60 * 60;

qint64 shortestCadenceSeconds(data::RecurrenceKind kind)
{
    switch (kind) {
    case data::RecurrenceKind::Daily:
        return SECONDS_PER_DAY;
    case data::RecurrenceKind::Weekly:
        return 7 * SECONDS_PER_DAY;
    case data::RecurrenceKind::Monthly:
        return 28 * SECONDS_PER_DAY;
    default:
        return 0;
    }
}
} // namespace

std::optional<QDateTime> RecurrenceEngine::step(const data::RecurrencePattern &pattern, const QDateTime &current)
{
    if (!current.isValid()) {
        return std::nullopt;
    }
    switch (pattern.kind) {
    case data::RecurrenceKind::Daily:
        return current.addDays(1);
    case data::RecurrenceKind::Weekly:
        return current.addDays(7);
    case data::RecurrenceKind::Monthly:
        return shiftMonths(current, 1, pattern.dayOfMonth);
    case data::RecurrenceKind::None:
    case data::RecurrenceKind::Unknown:
        break;
    }
    return std::nullopt;
}

std::optional<QDateTime> RecurrenceEngine::advance(const data::RecurrencePattern &pattern,
                                                   const QDateTime &current,
                                                   const QDateTime &now)
{
    std::optional<QDateTime> next = step(pattern, current);
    if (!next) {
        qCWarning(lcRecurrence) << "Unknown recurring pattern" << pattern.toTag();
        return std::nullopt;
    }

    const qint64 cadence = shortestCadenceSeconds(pattern.kind);
    const qint64 elapsed = qMax<qint64>(0, current.secsTo(now));
    const qint64 limit = elapsed / cadence + 2;

    qint64 steps = 0;
    while (*next <= now) {
        if (++steps > limit) {
            qCWarning(lcRecurrence) << "Catch-up for pattern" << pattern.toTag() << "exceeded" << limit
                                    << "steps from" << current;
            return std::nullopt;
        }
        next = step(pattern, *next);
        if (!next) {
            return std::nullopt;
        }
    }
    return next;
}

QDateTime RecurrenceEngine::shiftMonths(const QDateTime &current, int months, int targetDay)
{
    const QDate date = current.date();
    const QDate firstOfTarget = QDate(date.year(), date.month(), 1).addMonths(months);
    const int wantedDay = targetDay > 0 ? targetDay : date.day();
    const int day = qMin(wantedDay, firstOfTarget.daysInMonth());

    QDateTime result = current;
    result.setDate(QDate(firstOfTarget.year(), firstOfTarget.month(), day));
    return result;
}

} // namespace core
} // namespace reminders
