#include "reminders/core/AcknowledgementHandler.hpp"

#include "reminders/core/Logging.hpp"
#include "reminders/core/Notifier.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/data/SessionRegistry.hpp"

namespace reminders {
namespace core {

namespace {
const auto NOT_FOUND_TEXT = QStringLiteral("Hmm, I couldn't find that reminder. It might have been processed or removed.");
} // namespace

AcknowledgementHandler::AcknowledgementHandler(ReminderLifecycle &lifecycle,
                                               ReminderStore &store,
                                               data::SessionRegistry &sessions,
                                               Notifier &notifier,
                                               int snoozeMinutes)
    : m_lifecycle(lifecycle)
    , m_store(store)
    , m_sessions(sessions)
    , m_notifier(notifier)
    , m_snoozeMinutes(snoozeMinutes)
{
}

LifecycleStatus AcknowledgementHandler::handle(const QString &owner, const ReminderAction &action, const QDateTime &now)
{
    m_sessions.touch(owner, now);
    switch (action.target) {
    case ActionTarget::Reminder:
        return handleReminderAction(owner, action, now);
    case ActionTarget::Cancellation:
        return handleCancellation(owner, action);
    }
    return LifecycleStatus::Rejected;
}

LifecycleStatus AcknowledgementHandler::handleReminderAction(const QString &owner,
                                                             const ReminderAction &action,
                                                             const QDateTime &now)
{
    const std::optional<data::Reminder> reminder = m_store.findById(action.identifier);
    if (!reminder || reminder->owner != owner) {
        reply(owner, NOT_FOUND_TEXT);
        return LifecycleStatus::NotFound;
    }

    LifecycleStatus status = LifecycleStatus::Rejected;
    switch (action.verb) {
    case ActionVerb::Complete:
        status = m_lifecycle.complete(reminder->id);
        if (status == LifecycleStatus::Ok) {
            reply(owner, QStringLiteral("Great job! Marked \"%1\" as completed.").arg(reminder->message));
        }
        break;
    case ActionVerb::Snooze:
        status = m_lifecycle.snooze(reminder->id, m_snoozeMinutes, now);
        if (status == LifecycleStatus::Ok) {
            const QDateTime until = now.addSecs(static_cast<qint64>(m_snoozeMinutes) * 60);
            reply(owner, QStringLiteral("Snoozed \"%1\" for %2 minutes. I'll remind you again around %3.")
                             .arg(reminder->message)
                             .arg(m_snoozeMinutes)
                             .arg(formatDateForDisplay(until)));
        } else if (status == LifecycleStatus::Rejected) {
            reply(owner, QStringLiteral("\"%1\" is already completed.").arg(reminder->message));
        }
        break;
    case ActionVerb::Confirm:
    case ActionVerb::Decline:
        qCWarning(lcLifecycle) << "Unhandled action" << action.toPayload() << "from" << owner;
        reply(owner, QStringLiteral("I'm sorry, I didn't understand that action."));
        return LifecycleStatus::Rejected;
    }

    if (status == LifecycleStatus::NotFound) {
        reply(owner, NOT_FOUND_TEXT);
    }
    return status;
}

LifecycleStatus AcknowledgementHandler::handleCancellation(const QString &owner, const ReminderAction &action)
{
    LifecycleStatus status = LifecycleStatus::Ok;
    switch (action.verb) {
    case ActionVerb::Confirm: {
        const std::optional<data::Session> session = m_sessions.find(owner);
        if (!session || session->state != data::SessionState::AwaitingCancelConfirmation) {
            qCWarning(lcLifecycle) << "Cancel-all confirmation from" << owner << "without a pending prompt";
            reply(owner, QStringLiteral("There is no pending cancellation to confirm."));
            status = LifecycleStatus::Rejected;
            break;
        }
        const int cancelled = m_lifecycle.cancelAll(owner);
        if (cancelled > 0) {
            reply(owner, QStringLiteral("All %1 active reminders have been cancelled.").arg(cancelled));
        } else {
            reply(owner, QStringLiteral("No active reminders to cancel."));
        }
        break;
    }
    case ActionVerb::Decline:
        reply(owner, QStringLiteral("Okay, your reminders are safe."));
        break;
    case ActionVerb::Complete:
    case ActionVerb::Snooze:
        qCWarning(lcLifecycle) << "Unhandled action" << action.toPayload() << "from" << owner;
        reply(owner, QStringLiteral("I'm sorry, I didn't understand that action."));
        status = LifecycleStatus::Rejected;
        break;
    }
    m_sessions.setState(owner, data::SessionState::Idle);
    return status;
}

bool AcknowledgementHandler::promptCancelAll(const QString &owner, const QDateTime &now)
{
    m_sessions.touch(owner, now);
    const int activeCount = static_cast<int>(m_store.listActiveByOwner(owner).size());
    if (activeCount == 0) {
        reply(owner, QStringLiteral("You have no active reminders to cancel."));
        return false;
    }

    m_sessions.setState(owner, data::SessionState::AwaitingCancelConfirmation);
    const QString question =
        QStringLiteral("You have %1 active reminder(s). Are you sure you want to cancel ALL of them?").arg(activeCount);
    const bool delivered = deliverChoice(m_notifier, owner, question,
                                         {
                                             {ReminderAction::confirmCancelAll().toPayload(), QStringLiteral("Yes, Cancel All")},
                                             {ReminderAction::declineCancelAll().toPayload(), QStringLiteral("No, Keep Them")},
                                         });
    if (!delivered) {
        qCWarning(lcLifecycle) << "Cancel confirmation prompt could not be delivered to" << owner;
    }
    return true;
}

void AcknowledgementHandler::reply(const QString &owner, const QString &text)
{
    if (!m_notifier.sendText(owner, text)) {
        qCWarning(lcLifecycle) << "Reply to" << owner << "could not be delivered";
    }
}

} // namespace core
} // namespace reminders
