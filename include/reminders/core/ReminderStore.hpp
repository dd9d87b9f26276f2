#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "reminders/data/Reminder.hpp"
#include "reminders/data/UserProfile.hpp"

namespace reminders {
namespace data {
class ReminderRepository;
}

namespace core {

struct ReminderStats
{
    int totalReminders = 0;
    int activeReminders = 0;
    int completedReminders = 0;
    int completionRate = 0; // percent of total
    QDateTime memberSince;
};

// Aggregate operations over the repository that keep the owner counters in
// step with the reminder collection and persist after every mutation.
class ReminderStore
{
public:
    explicit ReminderStore(data::ReminderRepository &repository);

    data::Reminder create(data::Reminder draft, const QString &owner, const QDateTime &now);
    std::vector<data::Reminder> listActiveByOwner(const QString &owner) const;
    std::optional<data::Reminder> findById(const QString &id) const;
    int cancelAllByOwner(const QString &owner);
    bool cancelById(const QString &id);

    data::UserProfile ensureProfile(const QString &owner, const QDateTime &now);
    std::optional<data::UserProfile> profile(const QString &owner) const;
    std::optional<ReminderStats> stats(const QString &owner) const;

    // Adds delta to the owner's active counter, never going below zero.
    void adjustActiveCount(const QString &owner, int delta);
    void incrementCompletedCount(const QString &owner);

    bool save();

    data::ReminderRepository &repository();

private:
    data::ReminderRepository &m_repository;
};

} // namespace core
} // namespace reminders
