#pragma once

#include <QDateTime>
#include <QTimer>
#include <chrono>

namespace reminders {
namespace core {

class Clock;
class Notifier;
class ReminderLifecycle;
class ReminderStore;

struct TickReport
{
    int due = 0;
    int fired = 0;
    int rescheduled = 0;
    int deactivated = 0;
    int skipped = 0;
    int deliveryFailures = 0;
    bool saved = false;
};

// Periodically scans the store for due reminders, notifies their owners and
// moves them through the lifecycle. tick() can be driven directly in tests.
class Scheduler
{
public:
    Scheduler(ReminderStore &store,
              ReminderLifecycle &lifecycle,
              Notifier &notifier,
              const Clock &clock,
              int snoozeMinutes);
    ~Scheduler();

    void start(std::chrono::milliseconds interval);
    void stop();
    bool isRunning() const;

    TickReport tick(const QDateTime &now);

private:
    ReminderStore &m_store;
    ReminderLifecycle &m_lifecycle;
    Notifier &m_notifier;
    const Clock &m_clock;
    int m_snoozeMinutes = 10;
    QTimer m_timer;
};

} // namespace core
} // namespace reminders
