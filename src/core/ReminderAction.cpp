#include "reminders/core/ReminderAction.hpp"

namespace reminders {
namespace core {

namespace {
const auto ALL_IDENTIFIER = QStringLiteral("all");

QString verbToken(ActionVerb verb)
{
    switch (verb) {
    case ActionVerb::Complete:
        return QStringLiteral("completed");
    case ActionVerb::Snooze:
        return QStringLiteral("snooze");
    case ActionVerb::Confirm:
        return QStringLiteral("confirm");
    case ActionVerb::Decline:
        return QStringLiteral("decline");
    }
    return {};
}

QString targetToken(ActionTarget target)
{
    switch (target) {
    case ActionTarget::Reminder:
        return QStringLiteral("reminder");
    case ActionTarget::Cancellation:
        return QStringLiteral("cancellation");
    }
    return {};
}

std::optional<ActionVerb> verbFromToken(const QString &token)
{
    for (ActionVerb verb : {ActionVerb::Complete, ActionVerb::Snooze, ActionVerb::Confirm, ActionVerb::Decline}) {
        if (token == verbToken(verb)) {
            return verb;
        }
    }
    return std::nullopt;
}

std::optional<ActionTarget> targetFromToken(const QString &token)
{
    for (ActionTarget target : {ActionTarget::Reminder, ActionTarget::Cancellation}) {
        if (token == targetToken(target)) {
            return target;
        }
    }
    return std::nullopt;
}
} // namespace

ReminderAction ReminderAction::complete(const QString &reminderId)
{
    return {ActionVerb::Complete, ActionTarget::Reminder, reminderId};
}

ReminderAction ReminderAction::snooze(const QString &reminderId)
{
    return {ActionVerb::Snooze, ActionTarget::Reminder, reminderId};
}

ReminderAction ReminderAction::confirmCancelAll()
{
    return {ActionVerb::Confirm, ActionTarget::Cancellation, ALL_IDENTIFIER};
}

ReminderAction ReminderAction::declineCancelAll()
{
    return {ActionVerb::Decline, ActionTarget::Cancellation, ALL_IDENTIFIER};
}

QString ReminderAction::toPayload() const
{
    return QStringLiteral("%1_%2_%3").arg(verbToken(verb), targetToken(target), identifier);
}

std::optional<ReminderAction> ReminderAction::fromPayload(const QString &payload)
{
    const QString trimmed = payload.trimmed();
    const std::optional<ActionVerb> verb = verbFromToken(trimmed.section('_', 0, 0));
    const std::optional<ActionTarget> target = targetFromToken(trimmed.section('_', 1, 1));
    const QString identifier = trimmed.section('_', 2);
    if (!verb || !target || identifier.isEmpty()) {
        return std::nullopt;
    }

    switch (*target) {
    case ActionTarget::Reminder:
        if (*verb != ActionVerb::Complete && *verb != ActionVerb::Snooze) {
            return std::nullopt;
        }
        break;
    case ActionTarget::Cancellation:
        if ((*verb != ActionVerb::Confirm && *verb != ActionVerb::Decline) || identifier != ALL_IDENTIFIER) {
            return std::nullopt;
        }
        break;
    }
    return ReminderAction{*verb, *target, identifier};
}

bool ReminderAction::operator==(const ReminderAction &other) const
{
    return verb == other.verb && target == other.target && identifier == other.identifier;
}

} // namespace core
} // namespace reminders
