#pragma once

#include <QDateTime>
#include <QString>

namespace reminders {
namespace data {

struct UserProfile
{
    QString owner;
    QDateTime joinedAt;
    int totalReminders = 0;
    int activeReminders = 0;
    int completedReminders = 0;
};

inline bool operator==(const UserProfile &lhs, const UserProfile &rhs)
{
    return lhs.owner == rhs.owner && lhs.joinedAt == rhs.joinedAt && lhs.totalReminders == rhs.totalReminders
        && lhs.activeReminders == rhs.activeReminders && lhs.completedReminders == rhs.completedReminders;
}

inline bool operator!=(const UserProfile &lhs, const UserProfile &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace reminders
