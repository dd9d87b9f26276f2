#pragma once

#include <QDateTime>
#include <optional>

#include "reminders/data/RecurrencePattern.hpp"

namespace reminders {
namespace core {

// Calendar arithmetic for recurring reminders. An empty result means the
// pattern cannot be advanced and the reminder has to be deactivated.
class RecurrenceEngine
{
public:
    static std::optional<QDateTime> step(const data::RecurrencePattern &pattern, const QDateTime &current);

    // Next occurrence strictly after now, catching up over missed periods.
    static std::optional<QDateTime> advance(const data::RecurrencePattern &pattern,
                                            const QDateTime &current,
                                            const QDateTime &now);

    static QDateTime shiftMonths(const QDateTime &current, int months, int targetDay);
};

} // namespace core
} // namespace reminders
