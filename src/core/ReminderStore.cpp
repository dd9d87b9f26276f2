#include "reminders/core/ReminderStore.hpp"

#include <QtGlobal>
#include <algorithm>

#include "reminders/core/Logging.hpp"
#include "reminders/data/ReminderRepository.hpp"

namespace reminders {
namespace core {

ReminderStore::ReminderStore(data::ReminderRepository &repository)
    : m_repository(repository)
{
}

data::Reminder ReminderStore::create(data::Reminder draft, const QString &owner, const QDateTime &now)
{
    draft.owner = owner;
    draft.active = true;
    draft.completed = false;
    draft.snoozed = false;
    if (!draft.created.isValid()) {
        draft.created = now;
    }
    if (draft.id.isEmpty() || m_repository.findById(draft.id)) {
        draft.id = data::createReminderId();
    }

    data::UserProfile owningProfile = m_repository.ensureProfile(owner, now);
    const data::Reminder stored = m_repository.addReminder(std::move(draft));
    owningProfile.totalReminders += 1;
    owningProfile.activeReminders += 1;
    m_repository.updateProfile(owningProfile);

    qCInfo(lcStore) << "Created reminder" << stored.id << "for" << owner << "due" << stored.triggerTime;
    save();
    return stored;
}

std::vector<data::Reminder> ReminderStore::listActiveByOwner(const QString &owner) const
{
    std::vector<data::Reminder> result;
    for (const data::Reminder &reminder : m_repository.fetchReminders()) {
        if (reminder.owner == owner && reminder.active) {
            result.push_back(reminder);
        }
    }
    std::sort(result.begin(), result.end(), [](const data::Reminder &lhs, const data::Reminder &rhs) {
        return lhs.triggerTime < rhs.triggerTime;
    });
    return result;
}

std::optional<data::Reminder> ReminderStore::findById(const QString &id) const
{
    return m_repository.findById(id);
}

int ReminderStore::cancelAllByOwner(const QString &owner)
{
    int removed = 0;
    for (const data::Reminder &reminder : listActiveByOwner(owner)) {
        if (m_repository.removeReminder(reminder.id)) {
            ++removed;
        }
    }
    if (removed == 0) {
        return 0;
    }
    adjustActiveCount(owner, -removed);
    qCInfo(lcStore) << "Cancelled" << removed << "active reminders for" << owner;
    save();
    return removed;
}

bool ReminderStore::cancelById(const QString &id)
{
    const std::optional<data::Reminder> reminder = m_repository.findById(id);
    if (!reminder || !m_repository.removeReminder(id)) {
        return false;
    }
    if (reminder->active) {
        adjustActiveCount(reminder->owner, -1);
    }
    qCInfo(lcStore) << "Cancelled reminder" << id;
    save();
    return true;
}

data::UserProfile ReminderStore::ensureProfile(const QString &owner, const QDateTime &now)
{
    const bool existed = m_repository.findProfile(owner).has_value();
    const data::UserProfile result = m_repository.ensureProfile(owner, now);
    if (!existed) {
        save();
    }
    return result;
}

std::optional<data::UserProfile> ReminderStore::profile(const QString &owner) const
{
    return m_repository.findProfile(owner);
}

std::optional<ReminderStats> ReminderStore::stats(const QString &owner) const
{
    const std::optional<data::UserProfile> found = m_repository.findProfile(owner);
    if (!found) {
        return std::nullopt;
    }
    ReminderStats result;
    result.totalReminders = found->totalReminders;
    result.activeReminders = static_cast<int>(listActiveByOwner(owner).size());
    result.completedReminders = found->completedReminders;
    result.memberSince = found->joinedAt;
    if (result.totalReminders > 0 && result.completedReminders > 0) {
        result.completionRate = qRound(100.0 * result.completedReminders / result.totalReminders);
    }
    return result;
}

void ReminderStore::adjustActiveCount(const QString &owner, int delta)
{
    std::optional<data::UserProfile> found = m_repository.findProfile(owner);
    if (!found) {
        return;
    }
    found->activeReminders = qMax(0, found->activeReminders + delta);
    m_repository.updateProfile(*found);
}

void ReminderStore::incrementCompletedCount(const QString &owner)
{
    std::optional<data::UserProfile> found = m_repository.findProfile(owner);
    if (!found) {
        return;
    }
    found->completedReminders += 1;
    m_repository.updateProfile(*found);
}

bool ReminderStore::save()
{
    if (!m_repository.save()) {
        qCWarning(lcStore) << "Save failed, continuing from in-memory state";
        return false;
    }
    return true;
}

data::ReminderRepository &ReminderStore::repository()
{
    return m_repository;
}

} // namespace core
} // namespace reminders
