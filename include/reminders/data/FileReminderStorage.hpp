#pragma once

#include <QHash>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

#include "reminders/data/Reminder.hpp"
#include "reminders/data/UserProfile.hpp"

namespace reminders {
namespace data {

// Keeps reminders and profiles in memory and mirrors them to two JSON files
// inside one directory. Nothing is written until save() is called.
class FileReminderStorage
{
public:
    explicit FileReminderStorage(QString directory);
    ~FileReminderStorage() = default;

    const QHash<QString, Reminder> &reminders() const;
    const QHash<QString, UserProfile> &profiles() const;

    Reminder addOrUpdateReminder(Reminder reminder);
    bool removeReminder(const QString &id);

    UserProfile addOrUpdateProfile(UserProfile profile);

    void load();
    bool save() const;

    QString remindersFilePath() const;
    QString profilesFilePath() const;

    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

private:
    enum class RootType {
        Array,
        Object
    };

    QJsonValue readDocument(const QString &filePath, RootType rootType) const;
    bool writeDocument(const QString &filePath, const QByteArray &content) const;
    QString quarantine(const QString &filePath) const;

    static QJsonObject reminderToJson(const Reminder &reminder);
    static std::optional<Reminder> reminderFromJson(const QJsonObject &object);
    static QJsonObject profileToJson(const UserProfile &profile);
    static UserProfile profileFromJson(const QString &key, const QJsonObject &object);

    QString m_directory;
    QHash<QString, Reminder> m_reminders;
    QHash<QString, UserProfile> m_profiles;
};

} // namespace data
} // namespace reminders
