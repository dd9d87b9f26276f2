#pragma once

#include <QDateTime>
#include <QString>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

class ReminderStore;

enum class LifecycleStatus
{
    Ok,
    NotFound,
    Rejected,
};

enum class FireOutcome
{
    Skipped,     // cancelled or deactivated since the snapshot was taken
    Fired,       // one-shot, now waiting for an acknowledgement
    Rescheduled, // recurring, moved to its next occurrence
    Deactivated, // recurring, pattern could not be advanced
};

// State transitions of a single reminder. Every operation re-reads the live
// record by id before writing so stale snapshots are never written back.
class ReminderLifecycle
{
public:
    explicit ReminderLifecycle(ReminderStore &store);

    // Does not persist; the scheduler saves once per tick.
    FireOutcome fire(const data::Reminder &reminder, const QDateTime &now);

    LifecycleStatus complete(const QString &id);
    LifecycleStatus snooze(const QString &id, int minutes, const QDateTime &now);
    int cancelAll(const QString &owner);
    LifecycleStatus cancelOne(const QString &id);

private:
    ReminderStore &m_store;
};

} // namespace core
} // namespace reminders
