#pragma once

#include <optional>
#include <vector>

#include "reminders/data/Reminder.hpp"
#include "reminders/data/UserProfile.hpp"

namespace reminders {
namespace data {

class ReminderRepository
{
public:
    virtual ~ReminderRepository() = default;

    virtual std::vector<Reminder> fetchReminders() const = 0;
    virtual std::optional<Reminder> findById(const QString &id) const = 0;
    virtual Reminder addReminder(Reminder reminder) = 0;
    virtual bool updateReminder(const Reminder &reminder) = 0;
    virtual bool removeReminder(const QString &id) = 0;

    virtual std::vector<UserProfile> fetchProfiles() const = 0;
    virtual std::optional<UserProfile> findProfile(const QString &owner) const = 0;
    virtual UserProfile ensureProfile(const QString &owner, const QDateTime &now) = 0;
    virtual bool updateProfile(const UserProfile &profile) = 0;

    // Persists both collections. Returns false if any part could not be written.
    virtual bool save() = 0;
};

} // namespace data
} // namespace reminders
