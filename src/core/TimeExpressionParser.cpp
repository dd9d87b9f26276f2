#include "reminders/core/TimeExpressionParser.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <algorithm>

#include "reminders/core/Logging.hpp"
#include "reminders/core/RecurrenceEngine.hpp"

namespace reminders {
namespace core {

namespace {
const auto UNTITLED_REMINDER = QStringLiteral("Untitled Reminder");
} // namespace

TimeExpressionParser::TimeExpressionParser(ParseOptions options)
    : m_options(std::move(options))
    , m_groups(createDefaultRuleGroups())
{
}

const ParseOptions &TimeExpressionParser::options() const
{
    return m_options;
}

QString TimeExpressionParser::stripCommandPrefix(const QString &text)
{
    static const QRegularExpression prefix(QStringLiteral("^\\s*(?:@remind\\s+|remind\\s+me\\s+(?:to\\s+)?)"),
                                           QRegularExpression::CaseInsensitiveOption);
    QString stripped = text;
    stripped.remove(prefix);
    return stripped.trimmed();
}

QString TimeExpressionParser::residualMessage(const QString &text, QStringList phrases)
{
    // Longer phrases first so "every monday" is not cut apart by "monday".
    std::stable_sort(phrases.begin(), phrases.end(), [](const QString &lhs, const QString &rhs) {
        return lhs.size() > rhs.size();
    });
    QString message = text;
    for (const QString &phrase : qAsConst(phrases)) {
        if (!phrase.isEmpty()) {
            message.remove(phrase, Qt::CaseInsensitive);
        }
    }
    message = message.simplified();
    return message.isEmpty() ? UNTITLED_REMINDER : message;
}

std::optional<data::Reminder> TimeExpressionParser::parse(const QString &text, const QDateTime &now) const
{
    const QString remaining = stripCommandPrefix(text);
    if (remaining.isEmpty() || !now.isValid()) {
        return std::nullopt;
    }

    ParseState state;
    state.now = now;
    state.working = now;

    QStringList phrases;
    for (const RuleGroup &group : m_groups) {
        for (const auto &rule : group) {
            std::optional<RuleMatch> match = rule->apply(remaining, state, m_options);
            if (!match) {
                continue;
            }
            qCDebug(lcParser) << "Rule" << rule->name() << "matched" << match->phrase;
            state = std::move(match->state);
            phrases << match->phrase;
        }
    }

    if (!state.recurring && !state.dateParts.any() && !state.timeParts.any()) {
        qCDebug(lcParser) << "No time expression found in" << text;
        return std::nullopt;
    }

    if (!state.recurring) {
        if (state.timeParts.any() && !state.dateParts.any() && state.working <= now) {
            state.working = state.working.addDays(1);
        }
        if (state.working.addSecs(m_options.pastToleranceSeconds) < now) {
            qCDebug(lcParser) << "Rejecting reminder in the past:" << state.working << "for" << text;
            return std::nullopt;
        }
    } else if (state.working <= now) {
        const std::optional<QDateTime> next = RecurrenceEngine::advance(state.pattern, state.working, now);
        if (!next) {
            return std::nullopt;
        }
        state.working = *next;
    }

    data::Reminder draft;
    draft.originalText = text;
    draft.message = residualMessage(remaining, phrases);
    draft.triggerTime = state.working;
    draft.recurring = state.recurring;
    draft.pattern = state.pattern;
    draft.active = true;
    draft.completed = false;
    draft.snoozed = false;
    draft.created = now;
    return draft;
}

} // namespace core
} // namespace reminders
