#include "reminders/data/InMemoryReminderRepository.hpp"

namespace reminders {
namespace data {

InMemoryReminderRepository::InMemoryReminderRepository() = default;
InMemoryReminderRepository::~InMemoryReminderRepository() = default;

std::vector<Reminder> InMemoryReminderRepository::fetchReminders() const
{
    std::vector<Reminder> reminders;
    reminders.reserve(static_cast<size_t>(m_reminders.size()));
    for (const auto &reminder : m_reminders) {
        reminders.push_back(reminder);
    }
    return reminders;
}

std::optional<Reminder> InMemoryReminderRepository::findById(const QString &id) const
{
    if (m_reminders.contains(id)) {
        return m_reminders.value(id);
    }
    return std::nullopt;
}

Reminder InMemoryReminderRepository::addReminder(Reminder reminder)
{
    if (reminder.id.isEmpty()) {
        reminder.id = createReminderId();
    }
    m_reminders.insert(reminder.id, reminder);
    return reminder;
}

bool InMemoryReminderRepository::updateReminder(const Reminder &reminder)
{
    if (!m_reminders.contains(reminder.id)) {
        return false;
    }
    m_reminders.insert(reminder.id, reminder);
    return true;
}

bool InMemoryReminderRepository::removeReminder(const QString &id)
{
    return m_reminders.remove(id) > 0;
}

std::vector<UserProfile> InMemoryReminderRepository::fetchProfiles() const
{
    std::vector<UserProfile> profiles;
    profiles.reserve(static_cast<size_t>(m_profiles.size()));
    for (const auto &profile : m_profiles) {
        profiles.push_back(profile);
    }
    return profiles;
}

std::optional<UserProfile> InMemoryReminderRepository::findProfile(const QString &owner) const
{
    if (m_profiles.contains(owner)) {
        return m_profiles.value(owner);
    }
    return std::nullopt;
}

UserProfile InMemoryReminderRepository::ensureProfile(const QString &owner, const QDateTime &now)
{
    if (m_profiles.contains(owner)) {
        return m_profiles.value(owner);
    }
    UserProfile profile;
    profile.owner = owner;
    profile.joinedAt = now;
    m_profiles.insert(owner, profile);
    return profile;
}

bool InMemoryReminderRepository::updateProfile(const UserProfile &profile)
{
    if (!m_profiles.contains(profile.owner)) {
        return false;
    }
    m_profiles.insert(profile.owner, profile);
    return true;
}

bool InMemoryReminderRepository::save()
{
    ++m_saveCount;
    return true;
}

int InMemoryReminderRepository::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace reminders
