#include "reminders/core/ReminderLifecycle.hpp"

#include "reminders/core/Logging.hpp"
#include "reminders/core/RecurrenceEngine.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/data/ReminderRepository.hpp"

namespace reminders {
namespace core {

ReminderLifecycle::ReminderLifecycle(ReminderStore &store)
    : m_store(store)
{
}

FireOutcome ReminderLifecycle::fire(const data::Reminder &reminder, const QDateTime &now)
{
    data::ReminderRepository &repository = m_store.repository();
    std::optional<data::Reminder> live = repository.findById(reminder.id);
    if (!live || !live->active) {
        qCDebug(lcLifecycle) << "Reminder" << reminder.id << "no longer active or found, skipping";
        return FireOutcome::Skipped;
    }

    if (!live->recurring) {
        live->active = false;
        repository.updateReminder(*live);
        m_store.adjustActiveCount(live->owner, -1);
        return FireOutcome::Fired;
    }

    const std::optional<QDateTime> next = RecurrenceEngine::advance(live->pattern, live->triggerTime, now);
    if (!next) {
        qCWarning(lcLifecycle) << "Deactivating recurring reminder" << live->id << "with pattern"
                               << live->pattern.toTag();
        live->active = false;
        repository.updateReminder(*live);
        m_store.adjustActiveCount(live->owner, -1);
        return FireOutcome::Deactivated;
    }

    live->triggerTime = *next;
    live->snoozed = false;
    repository.updateReminder(*live);
    return FireOutcome::Rescheduled;
}

LifecycleStatus ReminderLifecycle::complete(const QString &id)
{
    data::ReminderRepository &repository = m_store.repository();
    std::optional<data::Reminder> live = repository.findById(id);
    if (!live) {
        return LifecycleStatus::NotFound;
    }

    // Completing a recurring reminder acknowledges the fired instance only;
    // future occurrences stay scheduled.
    if (live->recurring) {
        m_store.incrementCompletedCount(live->owner);
        m_store.save();
        return LifecycleStatus::Ok;
    }

    if (live->completed) {
        return LifecycleStatus::Ok;
    }

    const bool wasActive = live->active;
    live->completed = true;
    live->active = false;
    repository.updateReminder(*live);
    m_store.incrementCompletedCount(live->owner);
    if (wasActive) {
        m_store.adjustActiveCount(live->owner, -1);
    }
    qCInfo(lcLifecycle) << "Reminder" << id << "completed";
    m_store.save();
    return LifecycleStatus::Ok;
}

LifecycleStatus ReminderLifecycle::snooze(const QString &id, int minutes, const QDateTime &now)
{
    data::ReminderRepository &repository = m_store.repository();
    std::optional<data::Reminder> live = repository.findById(id);
    if (!live) {
        return LifecycleStatus::NotFound;
    }
    if (live->completed || minutes <= 0) {
        return LifecycleStatus::Rejected;
    }

    const bool wasActive = live->active;
    live->triggerTime = now.addSecs(static_cast<qint64>(minutes) * 60);
    live->snoozed = true;
    live->active = true;
    repository.updateReminder(*live);
    if (!wasActive) {
        m_store.adjustActiveCount(live->owner, 1);
    }
    qCInfo(lcLifecycle) << "Reminder" << id << "snoozed until" << live->triggerTime;
    m_store.save();
    return LifecycleStatus::Ok;
}

int ReminderLifecycle::cancelAll(const QString &owner)
{
    return m_store.cancelAllByOwner(owner);
}

LifecycleStatus ReminderLifecycle::cancelOne(const QString &id)
{
    return m_store.cancelById(id) ? LifecycleStatus::Ok : LifecycleStatus::NotFound;
}

} // namespace core
} // namespace reminders
