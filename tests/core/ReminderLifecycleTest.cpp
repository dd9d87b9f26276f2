#include <QtTest/QtTest>

#include "reminders/core/ReminderLifecycle.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/data/InMemoryReminderRepository.hpp"

using namespace reminders;
using namespace reminders::core;

namespace {

const QString OWNER = QStringLiteral("alice");

QDateTime baseTime()
{
    return QDateTime(QDate(2026, 10, 19), QTime(14, 0), Qt::UTC);
}

data::Reminder draftAt(const QString &message, const QDateTime &trigger)
{
    data::Reminder draft;
    draft.message = message;
    draft.originalText = message;
    draft.triggerTime = trigger;
    return draft;
}

data::Reminder recurringDraft(const QString &message, const QDateTime &trigger, const data::RecurrencePattern &pattern)
{
    data::Reminder draft = draftAt(message, trigger);
    draft.recurring = true;
    draft.pattern = pattern;
    return draft;
}

} // namespace

class ReminderLifecycleTest : public QObject
{
    Q_OBJECT

private slots:
    void createUpdatesCounters();
    void completeIsTerminal();
    void completeRecurringOnlyCounts();
    void snoozeRearmsFiredReminder();
    void snoozeRejections();
    void fireOneShotAndRecurring();
    void fireDeactivatesUnknownPattern();
    void fireSkipsMissingReminder();
    void cancelAllKeepsCompleted();
    void cancelOne();
    void statsReflectLiveState();
};

void ReminderLifecycleTest::createUpdatesCounters()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Call mom"), baseTime().addSecs(3600)), OWNER,
                                               baseTime());
    QCOMPARE(stored.owner, OWNER);
    QVERIFY(stored.active);
    QVERIFY(store.findById(stored.id).has_value());
    QCOMPARE(repo.saveCount(), 1);

    const auto profile = store.profile(OWNER);
    QVERIFY(profile.has_value());
    QCOMPARE(profile->joinedAt, baseTime());
    QCOMPARE(profile->totalReminders, 1);
    QCOMPARE(profile->activeReminders, 1);
    QCOMPARE(profile->completedReminders, 0);

    // A reused id is replaced so nothing is overwritten.
    data::Reminder duplicate = draftAt(QStringLiteral("Again"), baseTime().addSecs(7200));
    duplicate.id = stored.id;
    const data::Reminder second = store.create(duplicate, OWNER, baseTime());
    QVERIFY(second.id != stored.id);
    QCOMPARE(store.findById(stored.id)->message, QStringLiteral("Call mom"));
    QCOMPARE(store.profile(OWNER)->totalReminders, 2);
}

void ReminderLifecycleTest::completeIsTerminal()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Pay rent"), baseTime().addSecs(600)), OWNER,
                                               baseTime());

    QCOMPARE(lifecycle.complete(stored.id), LifecycleStatus::Ok);
    auto live = store.findById(stored.id);
    QVERIFY(live.has_value());
    QVERIFY(live->completed);
    QVERIFY(!live->active);
    QCOMPARE(store.profile(OWNER)->completedReminders, 1);
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);

    QCOMPARE(lifecycle.complete(stored.id), LifecycleStatus::Ok);
    QCOMPARE(store.profile(OWNER)->completedReminders, 1);

    QCOMPARE(lifecycle.snooze(stored.id, 10, baseTime()), LifecycleStatus::Rejected);
    live = store.findById(stored.id);
    QVERIFY(live->completed);
    QVERIFY(!live->active);

    QCOMPARE(lifecycle.complete(QStringLiteral("missing")), LifecycleStatus::NotFound);
}

void ReminderLifecycleTest::completeRecurringOnlyCounts()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder stored = store.create(
        recurringDraft(QStringLiteral("Pills"), baseTime().addSecs(600), data::RecurrencePattern::daily()), OWNER,
        baseTime());

    QCOMPARE(lifecycle.complete(stored.id), LifecycleStatus::Ok);
    QCOMPARE(*store.findById(stored.id), stored);
    QCOMPARE(store.profile(OWNER)->completedReminders, 1);
    QCOMPARE(store.profile(OWNER)->activeReminders, 1);
}

void ReminderLifecycleTest::snoozeRearmsFiredReminder()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const QDateTime trigger = baseTime().addSecs(-60);
    const data::Reminder stored = store.create(draftAt(QStringLiteral("Stretch"), trigger), OWNER,
                                               baseTime().addSecs(-3600));

    QCOMPARE(lifecycle.fire(stored, baseTime()), FireOutcome::Fired);
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);

    QCOMPARE(lifecycle.snooze(stored.id, 10, baseTime()), LifecycleStatus::Ok);
    const auto live = store.findById(stored.id);
    QVERIFY(live->active);
    QVERIFY(live->snoozed);
    QVERIFY(!live->completed);
    QCOMPARE(live->triggerTime, baseTime().addSecs(10 * 60));
    QCOMPARE(store.profile(OWNER)->activeReminders, 1);

    // Snoozing an already active reminder leaves the counter alone.
    QCOMPARE(lifecycle.snooze(stored.id, 5, baseTime()), LifecycleStatus::Ok);
    QCOMPARE(store.findById(stored.id)->triggerTime, baseTime().addSecs(5 * 60));
    QCOMPARE(store.profile(OWNER)->activeReminders, 1);
}

void ReminderLifecycleTest::snoozeRejections()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("Stretch"), baseTime().addSecs(60)), OWNER,
                                               baseTime());

    QCOMPARE(lifecycle.snooze(stored.id, 0, baseTime()), LifecycleStatus::Rejected);
    QCOMPARE(lifecycle.snooze(stored.id, -5, baseTime()), LifecycleStatus::Rejected);
    QCOMPARE(lifecycle.snooze(QStringLiteral("missing"), 10, baseTime()), LifecycleStatus::NotFound);
    QCOMPARE(*store.findById(stored.id), stored);
}

void ReminderLifecycleTest::fireOneShotAndRecurring()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder oneShot = store.create(draftAt(QStringLiteral("Once"), baseTime().addSecs(-30)), OWNER,
                                                baseTime().addSecs(-3600));
    const data::Reminder daily = store.create(
        recurringDraft(QStringLiteral("Daily"), baseTime().addSecs(-30), data::RecurrencePattern::daily()), OWNER,
        baseTime().addSecs(-3600));

    QCOMPARE(lifecycle.fire(oneShot, baseTime()), FireOutcome::Fired);
    QVERIFY(!store.findById(oneShot.id)->active);
    QVERIFY(!store.findById(oneShot.id)->completed);

    QCOMPARE(lifecycle.fire(daily, baseTime()), FireOutcome::Rescheduled);
    const auto live = store.findById(daily.id);
    QVERIFY(live->active);
    QCOMPARE(live->triggerTime, baseTime().addSecs(-30).addDays(1));

    QCOMPARE(store.profile(OWNER)->activeReminders, 1);

    // A stale snapshot of the fired one-shot is not fired again.
    QCOMPARE(lifecycle.fire(oneShot, baseTime()), FireOutcome::Skipped);
    QCOMPARE(store.profile(OWNER)->activeReminders, 1);
}

void ReminderLifecycleTest::fireDeactivatesUnknownPattern()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder broken = store.create(
        recurringDraft(QStringLiteral("Broken"), baseTime().addSecs(-30),
                       data::RecurrencePattern::fromTag(QStringLiteral("biweekly"))),
        OWNER, baseTime().addSecs(-3600));

    QCOMPARE(lifecycle.fire(broken, baseTime()), FireOutcome::Deactivated);
    QVERIFY(!store.findById(broken.id)->active);
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);
}

void ReminderLifecycleTest::fireSkipsMissingReminder()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    QCOMPARE(lifecycle.fire(draftAt(QStringLiteral("Ghost"), baseTime()), baseTime()), FireOutcome::Skipped);
}

void ReminderLifecycleTest::cancelAllKeepsCompleted()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder first = store.create(draftAt(QStringLiteral("One"), baseTime().addSecs(60)), OWNER,
                                              baseTime());
    store.create(draftAt(QStringLiteral("Two"), baseTime().addSecs(120)), OWNER, baseTime());
    const data::Reminder done = store.create(draftAt(QStringLiteral("Done"), baseTime().addSecs(180)), OWNER,
                                             baseTime());
    const data::Reminder other = store.create(draftAt(QStringLiteral("Bob's"), baseTime().addSecs(60)),
                                              QStringLiteral("bob"), baseTime());
    QCOMPARE(lifecycle.complete(done.id), LifecycleStatus::Ok);

    QCOMPARE(lifecycle.cancelAll(OWNER), 2);
    QVERIFY(!store.findById(first.id).has_value());
    QVERIFY(store.findById(done.id).has_value());
    QVERIFY(store.findById(other.id).has_value());
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);
    QCOMPARE(store.profile(OWNER)->totalReminders, 3);

    QCOMPARE(lifecycle.cancelAll(OWNER), 0);
}

void ReminderLifecycleTest::cancelOne()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    const data::Reminder stored = store.create(draftAt(QStringLiteral("One"), baseTime().addSecs(60)), OWNER,
                                               baseTime());

    QCOMPARE(lifecycle.cancelOne(stored.id), LifecycleStatus::Ok);
    QVERIFY(!store.findById(stored.id).has_value());
    QCOMPARE(store.profile(OWNER)->activeReminders, 0);
    QCOMPARE(lifecycle.cancelOne(stored.id), LifecycleStatus::NotFound);
}

void ReminderLifecycleTest::statsReflectLiveState()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderLifecycle lifecycle(store);

    QVERIFY(!store.stats(OWNER).has_value());

    const data::Reminder first = store.create(draftAt(QStringLiteral("One"), baseTime().addSecs(60)), OWNER,
                                              baseTime());
    store.create(draftAt(QStringLiteral("Two"), baseTime().addSecs(120)), OWNER, baseTime());
    store.create(draftAt(QStringLiteral("Three"), baseTime().addSecs(180)), OWNER, baseTime());
    QCOMPARE(lifecycle.complete(first.id), LifecycleStatus::Ok);

    const auto stats = store.stats(OWNER);
    QVERIFY(stats.has_value());
    QCOMPARE(stats->totalReminders, 3);
    QCOMPARE(stats->activeReminders, 2);
    QCOMPARE(stats->completedReminders, 1);
    QCOMPARE(stats->completionRate, 33);
    QCOMPARE(stats->memberSince, baseTime());

    const std::vector<data::Reminder> active = store.listActiveByOwner(OWNER);
    QCOMPARE(active.size(), size_t(2));
    QCOMPARE(active.front().message, QStringLiteral("Two"));
}

QTEST_MAIN(ReminderLifecycleTest)
#include "ReminderLifecycleTest.moc"
