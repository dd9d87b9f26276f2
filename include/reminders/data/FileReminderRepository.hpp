#pragma once

#include "reminders/data/ReminderRepository.hpp"
#include "reminders/data/FileReminderStorage.hpp"

#include <memory>

namespace reminders {
namespace data {

class FileReminderRepository : public ReminderRepository
{
public:
    explicit FileReminderRepository(std::shared_ptr<FileReminderStorage> storage);
    ~FileReminderRepository() override = default;

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

private:
    std::shared_ptr<FileReminderStorage> m_storage;
};

} // namespace data
} // namespace reminders
