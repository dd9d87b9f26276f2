#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "reminders/core/TimeRules.hpp"
#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

// Turns free text like "remind me to call mom tomorrow at 6pm" into a reminder
// draft. The draft carries no owner; the store assigns it on creation.
class TimeExpressionParser
{
public:
    explicit TimeExpressionParser(ParseOptions options = ParseOptions());

    std::optional<data::Reminder> parse(const QString &text, const QDateTime &now) const;

    const ParseOptions &options() const;

    static QString stripCommandPrefix(const QString &text);
    static QString residualMessage(const QString &text, QStringList phrases);

private:
    ParseOptions m_options;
    std::vector<RuleGroup> m_groups;
};

} // namespace core
} // namespace reminders
