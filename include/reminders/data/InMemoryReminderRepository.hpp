#pragma once

#include <QHash>

#include "reminders/data/ReminderRepository.hpp"

namespace reminders {
namespace data {

class InMemoryReminderRepository : public ReminderRepository
{
public:
    InMemoryReminderRepository();
    ~InMemoryReminderRepository() override;

    std::vector<Reminder> fetchReminders() const override;
    std::optional<Reminder> findById(const QString &id) const override;
    Reminder addReminder(Reminder reminder) override;
    bool updateReminder(const Reminder &reminder) override;
    bool removeReminder(const QString &id) override;

    std::vector<UserProfile> fetchProfiles() const override;
    std::optional<UserProfile> findProfile(const QString &owner) const override;
    UserProfile ensureProfile(const QString &owner, const QDateTime &now) override;
    bool updateProfile(const UserProfile &profile) override;

    bool save() override;
    int saveCount() const;

private:
    QHash<QString, Reminder> m_reminders;
    QHash<QString, UserProfile> m_profiles;
    int m_saveCount = 0;
};

} // namespace data
} // namespace reminders
