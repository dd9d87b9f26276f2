#include "reminders/core/TimeRules.hpp"

#include <QDate>
#include <QRegularExpression>
#include <QStringList>

#include "reminders/core/RecurrenceEngine.hpp"

namespace reminders {
namespace core {

namespace {

constexpr auto MONTH_PATTERN = "(jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|jun(?:e)?|jul(?:y)?|"
                               "aug(?:ust)?|sep(?:tember)?|oct(?:ober)?|nov(?:ember)?|dec(?:ember)?)";
constexpr int MAX_YEAR_ROLL = 8;
constexpr qint64 MAX_RELATIVE_VALUE = 10000000;

QRegularExpression caseInsensitive(const QString &pattern)
{
    return QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
}

QDateTime withTime(const QDateTime &dt, const QTime &time)
{
    QDateTime result = dt;
    result.setTime(time);
    return result;
}

QDateTime withDate(const QDateTime &dt, const QDate &date)
{
    QDateTime result = dt;
    result.setDate(date);
    return result;
}

RuleMatch matched(const QRegularExpressionMatch &match, const ParseState &state)
{
    RuleMatch result;
    result.phrase = match.captured(0);
    result.start = match.capturedStart(0);
    result.state = state;
    return result;
}

int monthFromName(const QString &name)
{
    static const QStringList months = {
        QStringLiteral("jan"), QStringLiteral("feb"), QStringLiteral("mar"), QStringLiteral("apr"),
        QStringLiteral("may"), QStringLiteral("jun"), QStringLiteral("jul"), QStringLiteral("aug"),
        QStringLiteral("sep"), QStringLiteral("oct"), QStringLiteral("nov"), QStringLiteral("dec"),
    };
    return months.indexOf(name.left(3).toLower()) + 1;
}

std::optional<ParseState> applyCalendarDate(const ParseState &state,
                                            const ParseOptions &options,
                                            int month,
                                            int day,
                                            const QString &yearText)
{
    ParseState next = state;
    const auto place = [&](const QDate &date) {
        next.working = withDate(next.working, date);
        if (!next.timeParts.hour) {
            next.working = withTime(next.working, options.morningTime);
        }
        next.dateParts.year = true;
        next.dateParts.month = true;
        next.dateParts.day = true;
    };

    if (!yearText.isEmpty()) {
        const QDate date(yearText.toInt(), month, day);
        if (!date.isValid()) {
            return std::nullopt;
        }
        place(date);
        return next;
    }

    // Without a year the next occurrence of that calendar day is meant.
    const int currentYear = state.now.date().year();
    for (int offset = 0; offset <= MAX_YEAR_ROLL; ++offset) {
        const QDate date(currentYear + offset, month, day);
        if (!date.isValid()) {
            continue;
        }
        if (offset == 0 && date < state.now.date()) {
            continue;
        }
        place(date);
        return next;
    }
    return std::nullopt;
}

} // namespace

std::optional<RuleMatch> DailyRule::apply(const QString &text, const ParseState &state,
                                          const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(QStringLiteral("\\b(every\\s+day|daily)\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ParseState next = state;
    next.recurring = true;
    next.pattern = data::RecurrencePattern::daily();
    if (!next.timeParts.hour) {
        next.working = withTime(next.working, options.morningTime);
    }
    if (next.working <= next.now) {
        next.working = next.working.addDays(1);
    }
    return matched(match, next);
}

std::optional<RuleMatch> WeeklyRule::apply(const QString &text, const ParseState &state,
                                           const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(
        QStringLiteral("\\b(every\\s+(monday|tuesday|wednesday|thursday|friday|saturday|sunday)|weekly)\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ParseState next = state;
    const QString dayName = match.captured(2);
    const int targetDay = dayName.isEmpty() ? next.working.date().dayOfWeek() : data::weekdayFromName(dayName);

    next.recurring = true;
    next.pattern = data::RecurrencePattern::weekly(targetDay);
    if (!next.timeParts.hour) {
        next.working = withTime(next.working, options.morningTime);
    }

    int daysToAdd = (targetDay - next.working.date().dayOfWeek() + 7) % 7;
    if (daysToAdd == 0 && next.working <= next.now) {
        daysToAdd = 7;
    }
    next.working = next.working.addDays(daysToAdd);
    next.dateParts.weekday = true;
    return matched(match, next);
}

std::optional<RuleMatch> MonthlyRule::apply(const QString &text, const ParseState &state,
                                            const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(
        QStringLiteral("\\b(?:every\\s+month|monthly)(?:\\s+on\\s+the\\s+(\\d{1,2})(?:st|nd|rd|th)?)?\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ParseState next = state;
    const int dayOfMonth = match.captured(1).isEmpty() ? next.working.date().day() : match.captured(1).toInt();
    if (dayOfMonth < 1 || dayOfMonth > 31) {
        return std::nullopt;
    }

    next.recurring = true;
    next.pattern = data::RecurrencePattern::monthly(dayOfMonth);
    if (!next.timeParts.hour) {
        next.working = withTime(next.working, options.morningTime);
    }
    next.working = RecurrenceEngine::shiftMonths(next.working, 0, dayOfMonth);
    if (next.working <= next.now) {
        next.working = RecurrenceEngine::shiftMonths(next.working, 1, dayOfMonth);
    }
    next.dateParts.day = true;
    return matched(match, next);
}

std::optional<RuleMatch> TomorrowRule::apply(const QString &text, const ParseState &state,
                                             const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(QStringLiteral("\\btomorrow\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ParseState next = state;
    next.working = withDate(next.working, next.now.date().addDays(1));
    if (!next.timeParts.hour) {
        next.working = withTime(next.working, options.morningTime);
    }
    next.dateParts.day = true;
    return matched(match, next);
}

std::optional<RuleMatch> TonightRule::apply(const QString &text, const ParseState &state,
                                            const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(QStringLiteral("\\btonight\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ParseState next = state;
    next.working = withDate(next.working, next.now.date());
    if (!next.timeParts.hour) {
        next.working = withTime(next.working, options.eveningTime);
    }
    if (next.working <= next.now) {
        next.working = next.working.addDays(1);
    }
    next.dateParts.day = true;
    return matched(match, next);
}

std::optional<RuleMatch> TodayRule::apply(const QString &text, const ParseState &state,
                                          const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(QStringLiteral("\\btoday\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ParseState next = state;
    next.working = withDate(next.working, next.now.date());
    if (!next.timeParts.hour) {
        QDateTime inAnHour = next.now.addSecs(60 * 60);
        inAnHour.setTime(QTime(inAnHour.time().hour(), inAnHour.time().minute()));
        const QDateTime morning = withTime(next.working, options.morningTime);
        next.working = inAnHour < morning ? morning : inAnHour;
    }
    next.dateParts.day = true;
    return matched(match, next);
}

std::optional<RuleMatch> MonthDayDateRule::apply(const QString &text, const ParseState &state,
                                                 const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(
        QStringLiteral("\\b(?:on\\s+)?%1\\s+(\\d{1,2})(?:st|nd|rd|th)?(?:(?:,\\s*|\\s+)(\\d{4}))?\\b")
            .arg(QLatin1String(MONTH_PATTERN)));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const auto next = applyCalendarDate(state, options, monthFromName(match.captured(1)),
                                        match.captured(2).toInt(), match.captured(3));
    if (!next) {
        return std::nullopt;
    }
    return matched(match, *next);
}

std::optional<RuleMatch> DayMonthDateRule::apply(const QString &text, const ParseState &state,
                                                 const ParseOptions &options) const
{
    static const QRegularExpression regex = caseInsensitive(
        QStringLiteral("\\b(?:on\\s+)?(\\d{1,2})(?:st|nd|rd|th)?\\s+(?:of\\s+)?%1(?:(?:,\\s*|\\s+)(\\d{4}))?\\b")
            .arg(QLatin1String(MONTH_PATTERN)));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const auto next = applyCalendarDate(state, options, monthFromName(match.captured(2)),
                                        match.captured(1).toInt(), match.captured(3));
    if (!next) {
        return std::nullopt;
    }
    return matched(match, *next);
}

std::optional<RuleMatch> RelativeOffsetRule::apply(const QString &text, const ParseState &state,
                                                   const ParseOptions &) const
{
    static const QRegularExpression regex = caseInsensitive(
        QStringLiteral("\\b(?:in|after)\\s+(\\d+)\\s+(minute|min|hour|hr|day|week)s?\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    bool ok = false;
    const qint64 value = match.captured(1).toLongLong(&ok);
    if (!ok || value > MAX_RELATIVE_VALUE) {
        return std::nullopt;
    }
    const QString unit = match.captured(2).toLower();

    ParseState next = state;
    if (unit.startsWith(QLatin1String("min"))) {
        next.working = next.working.addSecs(value * 60);
    } else if (unit.startsWith('h')) {
        next.working = next.working.addSecs(value * 60 * 60);
    } else if (unit == QLatin1String("day")) {
        next.working = next.working.addDays(value);
    } else {
        next.working = next.working.addDays(value * 7);
    }
    if (!next.working.isValid()) {
        return std::nullopt;
    }
    next.dateParts.day = true;
    next.timeParts.hour = true;
    next.timeParts.minute = true;
    return matched(match, next);
}

std::optional<RuleMatch> ClockTimeRule::apply(const QString &text, const ParseState &state,
                                              const ParseOptions &) const
{
    static const QRegularExpression regex = caseInsensitive(
        QStringLiteral("(?:\\bat|@)\\s*(\\d{1,2})(?:[:.](\\d{2}))?\\s*(am|pm)?\\b"));
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    int hours = match.captured(1).toInt();
    const int minutes = match.captured(2).isEmpty() ? 0 : match.captured(2).toInt();
    const QString meridiem = match.captured(3).toLower();
    if (meridiem == QLatin1String("pm") && hours >= 1 && hours <= 11) {
        hours += 12;
    } else if (meridiem == QLatin1String("am") && hours == 12) {
        hours = 0;
    }
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }

    ParseState next = state;
    next.working = withTime(next.working, QTime(hours, minutes));
    next.timeParts.hour = true;
    next.timeParts.minute = true;
    return matched(match, next);
}

std::vector<RuleGroup> createDefaultRuleGroups()
{
    std::vector<RuleGroup> groups(3);

    groups[0].push_back(std::make_unique<DailyRule>());
    groups[0].push_back(std::make_unique<WeeklyRule>());
    groups[0].push_back(std::make_unique<MonthlyRule>());

    groups[1].push_back(std::make_unique<TomorrowRule>());
    groups[1].push_back(std::make_unique<TonightRule>());
    groups[1].push_back(std::make_unique<TodayRule>());
    groups[1].push_back(std::make_unique<MonthDayDateRule>());
    groups[1].push_back(std::make_unique<DayMonthDateRule>());

    groups[2].push_back(std::make_unique<RelativeOffsetRule>());
    groups[2].push_back(std::make_unique<ClockTimeRule>());

    return groups;
}

} // namespace core
} // namespace reminders
