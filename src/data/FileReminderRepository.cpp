#include "reminders/data/FileReminderRepository.hpp"

#include <algorithm>

namespace reminders {
namespace data {

FileReminderRepository::FileReminderRepository(std::shared_ptr<FileReminderStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Reminder> FileReminderRepository::fetchReminders() const
{
    const auto &reminders = m_storage->reminders();
    std::vector<Reminder> result(reminders.cbegin(), reminders.cend());
    std::sort(result.begin(), result.end(), [](const Reminder &lhs, const Reminder &rhs) {
        if (lhs.triggerTime == rhs.triggerTime) {
            return lhs.id < rhs.id;
        }
        return lhs.triggerTime < rhs.triggerTime;
    });
    return result;
}

std::optional<Reminder> FileReminderRepository::findById(const QString &id) const
{
    const auto it = m_storage->reminders().constFind(id);
    if (it == m_storage->reminders().constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

Reminder FileReminderRepository::addReminder(Reminder reminder)
{
    return m_storage->addOrUpdateReminder(std::move(reminder));
}

bool FileReminderRepository::updateReminder(const Reminder &reminder)
{
    if (!m_storage->reminders().contains(reminder.id)) {
        return false;
    }
    m_storage->addOrUpdateReminder(reminder);
    return true;
}

bool FileReminderRepository::removeReminder(const QString &id)
{
    return m_storage->removeReminder(id);
}

std::vector<UserProfile> FileReminderRepository::fetchProfiles() const
{
    const auto &profiles = m_storage->profiles();
    return std::vector<UserProfile>(profiles.cbegin(), profiles.cend());
}

std::optional<UserProfile> FileReminderRepository::findProfile(const QString &owner) const
{
    const auto it = m_storage->profiles().constFind(owner);
    if (it == m_storage->profiles().constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

UserProfile FileReminderRepository::ensureProfile(const QString &owner, const QDateTime &now)
{
    if (const auto existing = findProfile(owner)) {
        return *existing;
    }
    UserProfile profile;
    profile.owner = owner;
    profile.joinedAt = now;
    return m_storage->addOrUpdateProfile(std::move(profile));
}

bool FileReminderRepository::updateProfile(const UserProfile &profile)
{
    if (!m_storage->profiles().contains(profile.owner)) {
        return false;
    }
    m_storage->addOrUpdateProfile(profile);
    return true;
}

bool FileReminderRepository::save()
{
    return m_storage->save();
}

} // namespace data
} // namespace reminders
