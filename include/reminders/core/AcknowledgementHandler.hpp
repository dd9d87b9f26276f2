#pragma once

#include <QDateTime>
#include <QString>

#include "reminders/core/ReminderAction.hpp"
#include "reminders/core/ReminderLifecycle.hpp"

namespace reminders {
namespace data {
class SessionRegistry;
}

namespace core {

class Notifier;
class ReminderStore;

// Applies a user's answer to an interactive prompt and replies to the owner.
class AcknowledgementHandler
{
public:
    AcknowledgementHandler(ReminderLifecycle &lifecycle,
                           ReminderStore &store,
                           data::SessionRegistry &sessions,
                           Notifier &notifier,
                           int snoozeMinutes);

    LifecycleStatus handle(const QString &owner, const ReminderAction &action, const QDateTime &now);

    // Asks the owner to confirm cancelling every active reminder. Returns false
    // when there is nothing to cancel.
    bool promptCancelAll(const QString &owner, const QDateTime &now);

private:
    LifecycleStatus handleReminderAction(const QString &owner, const ReminderAction &action, const QDateTime &now);
    LifecycleStatus handleCancellation(const QString &owner, const ReminderAction &action);
    void reply(const QString &owner, const QString &text);

    ReminderLifecycle &m_lifecycle;
    ReminderStore &m_store;
    data::SessionRegistry &m_sessions;
    Notifier &m_notifier;
    int m_snoozeMinutes = 10;
};

} // namespace core
} // namespace reminders
