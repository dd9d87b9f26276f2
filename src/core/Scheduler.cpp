#include "reminders/core/Scheduler.hpp"

#include "reminders/core/Clock.hpp"
#include "reminders/core/Logging.hpp"
#include "reminders/core/Notifier.hpp"
#include "reminders/core/ReminderLifecycle.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/data/ReminderRepository.hpp"

namespace reminders {
namespace core {

Scheduler::Scheduler(ReminderStore &store,
                     ReminderLifecycle &lifecycle,
                     Notifier &notifier,
                     const Clock &clock,
                     int snoozeMinutes)
    : m_store(store)
    , m_lifecycle(lifecycle)
    , m_notifier(notifier)
    , m_clock(clock)
    , m_snoozeMinutes(snoozeMinutes)
{
    QObject::connect(&m_timer, &QTimer::timeout, [this]() {
        tick(m_clock.now());
    });
}

Scheduler::~Scheduler() = default;

void Scheduler::start(std::chrono::milliseconds interval)
{
    m_timer.start(interval);
    qCInfo(lcScheduler) << "Scheduler ticking every" << interval.count() << "ms";
}

void Scheduler::stop()
{
    m_timer.stop();
}

bool Scheduler::isRunning() const
{
    return m_timer.isActive();
}

TickReport Scheduler::tick(const QDateTime &now)
{
    TickReport report;
    bool changed = false;

    const std::vector<data::Reminder> snapshot = m_store.repository().fetchReminders();
    for (const data::Reminder &reminder : snapshot) {
        if (!reminder.active || !reminder.triggerTime.isValid() || reminder.triggerTime > now) {
            continue;
        }
        ++report.due;

        // The snapshot may be stale by now; only the live record counts.
        const std::optional<data::Reminder> live = m_store.findById(reminder.id);
        if (!live || !live->active || live->triggerTime > now) {
            qCDebug(lcScheduler) << "Reminder" << reminder.id << "no longer due, skipping";
            ++report.skipped;
            continue;
        }

        qCInfo(lcScheduler) << "Triggering reminder" << live->id << "for" << live->owner << "scheduled"
                            << live->triggerTime;
        if (!deliverChoice(m_notifier, live->owner, reminderAlertText(*live),
                           reminderAlertOptions(*live, m_snoozeMinutes))) {
            qCWarning(lcScheduler) << "Notification for reminder" << live->id << "could not be delivered";
            ++report.deliveryFailures;
        }

        switch (m_lifecycle.fire(*live, now)) {
        case FireOutcome::Skipped:
            ++report.skipped;
            break;
        case FireOutcome::Fired:
            ++report.fired;
            changed = true;
            break;
        case FireOutcome::Rescheduled:
            ++report.fired;
            ++report.rescheduled;
            changed = true;
            break;
        case FireOutcome::Deactivated:
            ++report.fired;
            ++report.deactivated;
            changed = true;
            break;
        }
    }

    if (changed) {
        report.saved = m_store.save();
    }
    return report;
}

} // namespace core
} // namespace reminders
