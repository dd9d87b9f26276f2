#pragma once

#include <QString>
#include <chrono>

#include "reminders/core/TimeRules.hpp"

class QSettings;

namespace reminders {
namespace core {

struct AppSettings
{
    QString dataDirectory;
    std::chrono::seconds tickInterval{60};
    int snoozeMinutes = 10;
    std::chrono::minutes sessionIdleTimeout{60};
    std::chrono::minutes sessionSweepInterval{60};
    ParseOptions parseOptions;
    QString consoleOwner = QStringLiteral("console");

    static AppSettings load(const QSettings &settings);
};

} // namespace core
} // namespace reminders
