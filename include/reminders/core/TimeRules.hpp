#pragma once

#include <QDateTime>
#include <QString>
#include <QTime>
#include <memory>
#include <optional>
#include <vector>

#include "reminders/data/RecurrencePattern.hpp"

namespace reminders {
namespace core {

struct ParseOptions
{
    QTime morningTime = QTime(9, 0);
    QTime eveningTime = QTime(20, 0);
    int pastToleranceSeconds = 60;
};

struct DateParts
{
    bool year = false;
    bool month = false;
    bool day = false;
    bool weekday = false;

    bool any() const { return year || month || day || weekday; }
};

struct TimeParts
{
    bool hour = false;
    bool minute = false;

    bool any() const { return hour || minute; }
};

// Partially resolved trigger while the rules are applied.
struct ParseState
{
    QDateTime now;
    QDateTime working;
    DateParts dateParts;
    TimeParts timeParts;
    bool recurring = false;
    data::RecurrencePattern pattern;
};

struct RuleMatch
{
    QString phrase;
    int start = -1;
    ParseState state;
};

class TimeRule
{
public:
    virtual ~TimeRule() = default;
    virtual QString name() const = 0;
    virtual std::optional<RuleMatch> apply(const QString &text,
                                           const ParseState &state,
                                           const ParseOptions &options) const = 0;
};

using RuleGroup = std::vector<std::unique_ptr<TimeRule>>;

class DailyRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("daily"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class WeeklyRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("weekly"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class MonthlyRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("monthly"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class TomorrowRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("tomorrow"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class TonightRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("tonight"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class TodayRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("today"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

// "July 4th", "dec 25, 2027"
class MonthDayDateRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("monthDayDate"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

// "15th of December", "4 july 2027"
class DayMonthDateRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("dayMonthDate"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class RelativeOffsetRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("relativeOffset"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

class ClockTimeRule : public TimeRule
{
public:
    QString name() const override { return QStringLiteral("clockTime"); }
    std::optional<RuleMatch> apply(const QString &text, const ParseState &state,
                                   const ParseOptions &options) const override;
};

// Recurrence rules first, then calendar keywords, then times of day.
std::vector<RuleGroup> createDefaultRuleGroups();

} // namespace core
} // namespace reminders
