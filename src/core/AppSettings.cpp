#include "reminders/core/AppSettings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace reminders {
namespace core {

namespace {
QTime readTime(const QSettings &settings, const QString &key, const QTime &fallback)
{
    const QString value = settings.value(key).toString();
    if (value.isEmpty()) {
        return fallback;
    }
    const QTime time = QTime::fromString(value, QStringLiteral("HH:mm"));
    return time.isValid() ? time : fallback;
}
} // namespace

AppSettings AppSettings::load(const QSettings &settings)
{
    AppSettings result;
    result.dataDirectory = settings.value(QStringLiteral("storage/dataDirectory")).toString();

    const int tickSeconds = settings.value(QStringLiteral("scheduler/tickIntervalSeconds"), 60).toInt();
    result.tickInterval = std::chrono::seconds(qMax(1, tickSeconds));

    result.snoozeMinutes = qMax(1, settings.value(QStringLiteral("reminders/snoozeMinutes"), 10).toInt());

    const int idleMinutes = settings.value(QStringLiteral("sessions/idleTimeoutMinutes"), 60).toInt();
    result.sessionIdleTimeout = std::chrono::minutes(qMax(1, idleMinutes));
    const int sweepMinutes = settings.value(QStringLiteral("sessions/sweepIntervalMinutes"), 60).toInt();
    result.sessionSweepInterval = std::chrono::minutes(qMax(1, sweepMinutes));

    result.parseOptions.morningTime = readTime(settings, QStringLiteral("reminders/morningTime"),
                                               result.parseOptions.morningTime);
    result.parseOptions.eveningTime = readTime(settings, QStringLiteral("reminders/eveningTime"),
                                               result.parseOptions.eveningTime);
    result.parseOptions.pastToleranceSeconds =
        qMax(0, settings.value(QStringLiteral("reminders/pastToleranceSeconds"), 60).toInt());

    const QString owner = settings.value(QStringLiteral("console/owner")).toString().trimmed();
    if (!owner.isEmpty()) {
        result.consoleOwner = owner;
    }
    return result;
}

} // namespace core
} // namespace reminders
