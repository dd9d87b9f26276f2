#include <QtTest/QtTest>

#include "reminders/core/Clock.hpp"
#include "reminders/core/Notifier.hpp"
#include "reminders/core/ReminderAction.hpp"
#include "reminders/core/ReminderLifecycle.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/core/Scheduler.hpp"
#include "reminders/data/InMemoryReminderRepository.hpp"

using namespace reminders;
using namespace reminders::core;

namespace {

const QString OWNER = QStringLiteral("alice");

class ManualClock : public Clock
{
public:
    explicit ManualClock(QDateTime now)
        : m_now(std::move(now))
    {
    }

    QDateTime now() const override { return m_now; }
    void set(const QDateTime &now) { m_now = now; }

private:
    QDateTime m_now;
};

class RecordingNotifier : public Notifier
{
public:
    bool sendText(const QString &owner, const QString &text) override
    {
        texts.append(owner + QLatin1Char('|') + text);
        return textWorks;
    }

    bool sendChoice(const QString &owner, const QString &text, const std::vector<ChoiceOption> &options) override
    {
        if (!choiceWorks) {
            return false;
        }
        choices.append(owner + QLatin1Char('|') + text);
        lastOptions = options;
        return true;
    }

    bool choiceWorks = true;
    bool textWorks = true;
    QStringList texts;
    QStringList choices;
    std::vector<ChoiceOption> lastOptions;
};

QDateTime baseTime()
{
    return QDateTime(QDate(2026, 10, 19), QTime(14, 0), Qt::UTC);
}

data::Reminder draftAt(const QString &message, const QDateTime &trigger)
{
    data::Reminder draft;
    draft.message = message;
    draft.triggerTime = trigger;
    return draft;
}

} // namespace

class SchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void oneShotFiresOnce();
    void futureRemindersAreLeftAlone();
    void recurringIsRescheduled();
    void savesOncePerTick();
    void cancelledReminderDoesNotFire();
    void fallsBackToTextWhenChoiceFails();
    void deliveryFailureStillAdvances();
    void unknownPatternIsDeactivated();
    void timerStartsAndStops();
};

void SchedulerTest::oneShotFiresOnce()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Call mom"), baseTime().addSecs(-60)), OWNER,
                                               baseTime().addSecs(-3600));

    const TickReport first = scheduler.tick(baseTime());
    QCOMPARE(first.due, 1);
    QCOMPARE(first.fired, 1);
    QCOMPARE(first.rescheduled, 0);
    QVERIFY(first.saved);
    QCOMPARE(notifier.choices.size(), 1);
    QVERIFY(notifier.choices.front().startsWith(OWNER + QLatin1Char('|')));
    QVERIFY(notifier.choices.front().contains(QStringLiteral("Call mom")));
    QCOMPARE(notifier.lastOptions.size(), size_t(2));
    QCOMPARE(notifier.lastOptions[0].id, ReminderAction::complete(stored.id).toPayload());
    QCOMPARE(notifier.lastOptions[1].id, ReminderAction::snooze(stored.id).toPayload());
    QCOMPARE(notifier.lastOptions[1].label, QStringLiteral("Snooze 10min"));
    QVERIFY(!store.findById(stored.id)->active);

    const TickReport second = scheduler.tick(baseTime().addSecs(60));
    QCOMPARE(second.due, 0);
    QCOMPARE(second.fired, 0);
    QVERIFY(!second.saved);
    QCOMPARE(notifier.choices.size(), 1);
}

void SchedulerTest::futureRemindersAreLeftAlone()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Later"), baseTime().addSecs(60)), OWNER,
                                               baseTime());
    const int savesBefore = repo.saveCount();

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.due, 0);
    QVERIFY(!report.saved);
    QCOMPARE(repo.saveCount(), savesBefore);
    QVERIFY(notifier.choices.isEmpty());
    QCOMPARE(*store.findById(stored.id), stored);

    // Exactly at the trigger time counts as due.
    QCOMPARE(scheduler.tick(baseTime().addSecs(60)).fired, 1);
}

void SchedulerTest::recurringIsRescheduled()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    data::Reminder draft = draftAt(QStringLiteral("Pills"), baseTime().addSecs(-60));
    draft.recurring = true;
    draft.pattern = data::RecurrencePattern::daily();
    const data::Reminder stored = store.create(draft, OWNER, baseTime().addDays(-1));
    QCOMPARE(lifecycle.snooze(stored.id, 1, baseTime().addSecs(-120)), LifecycleStatus::Ok);
    QVERIFY(store.findById(stored.id)->snoozed);

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.fired, 1);
    QCOMPARE(report.rescheduled, 1);

    const auto live = store.findById(stored.id);
    QVERIFY(live->active);
    QVERIFY(!live->snoozed);
    QCOMPARE(live->triggerTime, baseTime().addSecs(-60).addDays(1));
    QCOMPARE(live->pattern, data::RecurrencePattern::daily());

    // Only fires again once the next occurrence comes due.
    QCOMPARE(scheduler.tick(baseTime().addSecs(3600)).fired, 0);
    QCOMPARE(scheduler.tick(baseTime().addDays(1)).fired, 1);
}

void SchedulerTest::savesOncePerTick()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    for (int i = 0; i < 3; ++i) {
        store.create(draftAt(QStringLiteral("Due %1").arg(i), baseTime().addSecs(-60 * (i + 1))), OWNER,
                     baseTime().addDays(-1));
    }
    const int savesBefore = repo.saveCount();

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.due, 3);
    QCOMPARE(report.fired, 3);
    QCOMPARE(repo.saveCount(), savesBefore + 1);
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);
}

void SchedulerTest::cancelledReminderDoesNotFire()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Nope"), baseTime().addSecs(-60)), OWNER,
                                               baseTime().addDays(-1));
    QCOMPARE(lifecycle.cancelOne(stored.id), LifecycleStatus::Ok);

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.fired, 0);
    QVERIFY(notifier.choices.isEmpty());
    QVERIFY(notifier.texts.isEmpty());
}

void SchedulerTest::fallsBackToTextWhenChoiceFails()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    notifier.choiceWorks = false;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Water plants"), baseTime().addSecs(-60)),
                                               OWNER, baseTime().addDays(-1));

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.fired, 1);
    QCOMPARE(report.deliveryFailures, 0);
    QCOMPARE(notifier.texts.size(), 1);
    const QString text = notifier.texts.front();
    QVERIFY(text.contains(QStringLiteral("Water plants")));
    QVERIFY(text.contains(QStringLiteral("(Option ID: %1)").arg(ReminderAction::complete(stored.id).toPayload())));
    QVERIFY(text.contains(QStringLiteral("(Option ID: %1)").arg(ReminderAction::snooze(stored.id).toPayload())));
}

void SchedulerTest::deliveryFailureStillAdvances()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    notifier.choiceWorks = false;
    notifier.textWorks = false;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Unreachable"), baseTime().addSecs(-60)),
                                               OWNER, baseTime().addDays(-1));

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.deliveryFailures, 1);
    QCOMPARE(report.fired, 1);
    QVERIFY(!store.findById(stored.id)->active);
    QCOMPARE(scheduler.tick(baseTime().addSecs(60)).due, 0);
}

void SchedulerTest::unknownPatternIsDeactivated()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    data::Reminder draft = draftAt(QStringLiteral("Odd"), baseTime().addSecs(-60));
    draft.recurring = true;
    draft.pattern = data::RecurrencePattern::fromTag(QStringLiteral("every_other_tuesday"));
    const data::Reminder stored = store.create(draft, OWNER, baseTime().addDays(-1));

    const TickReport report = scheduler.tick(baseTime());
    QCOMPARE(report.fired, 1);
    QCOMPARE(report.deactivated, 1);
    QVERIFY(!store.findById(stored.id)->active);
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);
}

void SchedulerTest::timerStartsAndStops()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);
    RecordingNotifier notifier;
    ManualClock clock(baseTime());
    Scheduler scheduler(store, lifecycle, notifier, clock, 10);

    store.create(draftAt(QStringLiteral("Soon"), baseTime().addSecs(-1)), OWNER, baseTime().addDays(-1));

    QVERIFY(!scheduler.isRunning());
    scheduler.start(std::chrono::milliseconds(10));
    QVERIFY(scheduler.isRunning());
    QTRY_COMPARE(notifier.choices.size(), 1);
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());
}

QTEST_MAIN(SchedulerTest)
#include "SchedulerTest.moc"
