#include <QCoreApplication>
#include <QSettings>
#include <QSocketNotifier>
#include <QString>
#include <QStringList>
#include <cerrno>
#include <cstdio>
#include <unistd.h>

#include "version.h"

#include "reminders/core/AcknowledgementHandler.hpp"
#include "reminders/core/AppContext.hpp"
#include "reminders/core/Clock.hpp"
#include "reminders/core/ConsoleNotifier.hpp"
#include "reminders/core/InputLineBuffer.hpp"
#include "reminders/core/Logging.hpp"
#include "reminders/core/ReminderAction.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/core/TimeExpressionParser.hpp"
#include "reminders/data/SessionRegistry.hpp"

using namespace reminders;

namespace {

const auto USAGE_TEXT = QStringLiteral(
    "Oops! I couldn't understand that reminder. Can you try phrasing it clearly?\n\n"
    "Examples:\n"
    "- \"@remind drink water in 30 minutes\"\n"
    "- \"remind me to call mom tomorrow at 6 PM\"\n"
    "- \"@remind project update every friday at 10am\"");

void send(core::AppContext &context, const QString &owner, const QString &text)
{
    if (!context.notifier().sendText(owner, text)) {
        qCWarning(lcApp) << "Could not deliver message to" << owner;
    }
}

void listReminders(core::AppContext &context, const QString &owner)
{
    const auto active = context.store().listActiveByOwner(owner);
    if (active.empty()) {
        send(context, owner, QStringLiteral("You have no active reminders."));
        return;
    }
    QString text = QStringLiteral("Your Active Reminders (%1):\n").arg(active.size());
    int index = 1;
    for (const data::Reminder &reminder : active) {
        text += QStringLiteral("\n%1. %2\n   %3%4%5")
                    .arg(index++)
                    .arg(reminder.message, core::formatDateForDisplay(reminder.triggerTime),
                         reminder.recurring ? QStringLiteral(" (repeats %1)").arg(reminder.pattern.toTag()) : QString(),
                         reminder.snoozed ? QStringLiteral(" (snoozed)") : QString());
    }
    send(context, owner, text);
}

void showStats(core::AppContext &context, const QString &owner)
{
    const auto stats = context.store().stats(owner);
    if (!stats) {
        send(context, owner, QStringLiteral("I don't have any stats for you yet. Try setting a reminder!"));
        return;
    }
    QString text = QStringLiteral("Your Reminder Stats:\n\nMember since: %1\nTotal created: %2\n"
                                  "Currently active: %3\nCompleted: %4")
                       .arg(core::formatDateForDisplay(stats->memberSince))
                       .arg(stats->totalReminders)
                       .arg(stats->activeReminders)
                       .arg(stats->completedReminders);
    if (stats->totalReminders > 0) {
        text += QStringLiteral("\nCompletion rate: %1%").arg(stats->completionRate);
    }
    send(context, owner, text);
}

void createReminder(core::AppContext &context, const QString &owner, const QString &line)
{
    const QDateTime now = context.clock().now();
    const auto draft = context.parser().parse(line, now);
    if (!draft) {
        send(context, owner, USAGE_TEXT);
        return;
    }
    const data::Reminder stored = context.store().create(*draft, owner, now);
    QString text = QStringLiteral("Reminder set!\n\nTask: %1\nTime: %2")
                       .arg(stored.message, core::formatDateForDisplay(stored.triggerTime));
    if (stored.recurring) {
        text += QStringLiteral(" (repeats %1)").arg(stored.pattern.toTag());
    }
    send(context, owner, text);
}

void handleLine(core::AppContext &context, const QString &owner, const QString &line)
{
    const QDateTime now = context.clock().now();
    context.sessions().touch(owner, now);

    if (const auto action = core::ReminderAction::fromPayload(line)) {
        if (context.acknowledgements().handle(owner, *action, now) != core::LifecycleStatus::Ok) {
            qCDebug(lcApp) << "Action" << line << "was not applied";
        }
        return;
    }

    const QString command = line.toLower();
    if (command.startsWith(QLatin1String("@cancel"))) {
        if (!context.acknowledgements().promptCancelAll(owner, now)) {
            qCDebug(lcApp) << "Nothing to cancel for" << owner;
        }
    } else if (command.startsWith(QLatin1String("@list"))) {
        listReminders(context, owner);
    } else if (command.startsWith(QLatin1String("@stats"))) {
        showStats(context, owner);
    } else {
        createReminder(context, owner, line);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("ReminderPal"));
    QCoreApplication::setApplicationName(QStringLiteral("reminder-pal"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kReminderPalVersion));

    QCoreApplication app(argc, argv);

    QSettings settings;
    const core::AppSettings appSettings = core::AppSettings::load(settings);

    core::SystemClock clock;
    core::ConsoleNotifier notifier;
    core::AppContext context(appSettings, notifier, clock);

    const QString owner = appSettings.consoleOwner;
    core::InputLineBuffer input;
    QSocketNotifier stdinNotifier(fileno(stdin), QSocketNotifier::Read);
    QObject::connect(&stdinNotifier, &QSocketNotifier::activated, [&]() {
        // Unbuffered read so every line that arrived with this activation is handled now.
        char chunk[4096];
        const ssize_t count = ::read(fileno(stdin), chunk, sizeof(chunk));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return;
            }
            qCWarning(lcApp) << "Reading standard input failed:" << qt_error_string(errno);
            stdinNotifier.setEnabled(false);
            return;
        }
        if (count == 0) {
            const QString last = input.takeRemainder();
            if (!last.isEmpty()) {
                handleLine(context, owner, last);
            }
            qCInfo(lcApp) << "Standard input closed, still delivering scheduled reminders";
            stdinNotifier.setEnabled(false);
            return;
        }
        const QStringList lines = input.append(QByteArray(chunk, static_cast<int>(count)));
        for (const QString &line : lines) {
            handleLine(context, owner, line);
        }
    });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        context.stop();
        if (!context.store().save()) {
            qCWarning(lcApp) << "Final save failed";
        }
    });

    qCInfo(lcApp) << "reminder-pal" << kReminderPalVersion << "started for owner" << owner;
    context.start();
    return app.exec();
}
