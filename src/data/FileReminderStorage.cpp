#include "reminders/data/FileReminderStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <algorithm>
#include <vector>

#include "reminders/data/Logging.hpp"

namespace reminders {
namespace data {

namespace {
constexpr auto REMINDERS_FILE_NAME = "reminders.json";
constexpr auto PROFILES_FILE_NAME = "userProfiles.json";

const QJsonValue UNDEFINED_VALUE(QJsonValue::Undefined);
} // namespace

FileReminderStorage::FileReminderStorage(QString directory)
    : m_directory(std::move(directory))
{
    load();
}

const QHash<QString, Reminder> &FileReminderStorage::reminders() const
{
    return m_reminders;
}

const QHash<QString, UserProfile> &FileReminderStorage::profiles() const
{
    return m_profiles;
}

Reminder FileReminderStorage::addOrUpdateReminder(Reminder reminder)
{
    if (reminder.id.isEmpty()) {
        reminder.id = createReminderId();
    }
    m_reminders.insert(reminder.id, reminder);
    return reminder;
}

bool FileReminderStorage::removeReminder(const QString &id)
{
    return m_reminders.remove(id) > 0;
}

UserProfile FileReminderStorage::addOrUpdateProfile(UserProfile profile)
{
    m_profiles.insert(profile.owner, profile);
    return profile;
}

QString FileReminderStorage::remindersFilePath() const
{
    return QDir(m_directory).filePath(QLatin1String(REMINDERS_FILE_NAME));
}

QString FileReminderStorage::profilesFilePath() const
{
    return QDir(m_directory).filePath(QLatin1String(PROFILES_FILE_NAME));
}

void FileReminderStorage::load()
{
    m_reminders.clear();
    m_profiles.clear();

    if (m_directory.isEmpty()) {
        return;
    }

    const QJsonValue reminderValue = readDocument(remindersFilePath(), RootType::Array);
    if (reminderValue.isArray()) {
        const QJsonArray entries = reminderValue.toArray();
        for (const QJsonValue &entry : entries) {
            const std::optional<Reminder> reminder = reminderFromJson(entry.toObject());
            if (!reminder) {
                qCWarning(lcStore) << "Dropping malformed reminder record in" << remindersFilePath();
                continue;
            }
            m_reminders.insert(reminder->id, *reminder);
        }
    }

    const QJsonValue profileValue = readDocument(profilesFilePath(), RootType::Object);
    if (profileValue.isObject()) {
        const QJsonObject entries = profileValue.toObject();
        for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
            const UserProfile profile = profileFromJson(it.key(), it.value().toObject());
            if (profile.owner.isEmpty()) {
                continue;
            }
            m_profiles.insert(profile.owner, profile);
        }
    }

    qCInfo(lcStore) << "Loaded" << m_reminders.size() << "reminders and" << m_profiles.size()
                    << "user profiles from" << m_directory;
}

bool FileReminderStorage::save() const
{
    if (m_directory.isEmpty()) {
        qCWarning(lcStore) << "No storage directory configured, nothing saved";
        return false;
    }

    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStore) << "Could not create storage directory" << m_directory;
        return false;
    }

    std::vector<Reminder> reminders(m_reminders.cbegin(), m_reminders.cend());
    std::sort(reminders.begin(), reminders.end(), [](const Reminder &lhs, const Reminder &rhs) {
        if (lhs.created == rhs.created) {
            return lhs.id < rhs.id;
        }
        return lhs.created < rhs.created;
    });
    QJsonArray reminderArray;
    for (const Reminder &reminder : reminders) {
        reminderArray.append(reminderToJson(reminder));
    }

    QJsonObject profileObject;
    for (auto it = m_profiles.constBegin(); it != m_profiles.constEnd(); ++it) {
        profileObject.insert(it.key(), profileToJson(it.value()));
    }

    const bool remindersSaved = writeDocument(remindersFilePath(),
                                              QJsonDocument(reminderArray).toJson(QJsonDocument::Indented));
    const bool profilesSaved = writeDocument(profilesFilePath(),
                                             QJsonDocument(profileObject).toJson(QJsonDocument::Indented));
    return remindersSaved && profilesSaved;
}

QJsonValue FileReminderStorage::readDocument(const QString &filePath, RootType rootType) const
{
    QFile file(filePath);
    if (!file.exists()) {
        return UNDEFINED_VALUE;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore) << "Could not open" << filePath << ":" << file.errorString();
        return UNDEFINED_VALUE;
    }
    const QByteArray content = file.readAll();
    file.close();

    if (content.trimmed().isEmpty()) {
        return UNDEFINED_VALUE;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(content, &error);
    const bool rootMatches = rootType == RootType::Array ? document.isArray() : document.isObject();
    if (error.error != QJsonParseError::NoError || !rootMatches) {
        const QString reason = error.error != QJsonParseError::NoError ? error.errorString()
                                                                      : QStringLiteral("unexpected root type");
        qCWarning(lcStore) << "Error parsing" << filePath << ":" << reason << "- starting fresh for this file";
        const QString backup = quarantine(filePath);
        if (backup.isEmpty()) {
            qCWarning(lcStore) << "Failed to back up corrupted file" << filePath;
        } else {
            qCWarning(lcStore) << "Backed up corrupted file to" << backup;
        }
        return UNDEFINED_VALUE;
    }

    if (rootType == RootType::Array) {
        return document.array();
    }
    return document.object();
}

bool FileReminderStorage::writeDocument(const QString &filePath, const QByteArray &content) const
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcStore) << "Error saving data to" << filePath << ":" << file.errorString();
        return false;
    }
    if (file.write(content) != content.size()) {
        qCWarning(lcStore) << "Error saving data to" << filePath << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcStore) << "Error committing" << filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

QString FileReminderStorage::quarantine(const QString &filePath) const
{
    const QFileInfo info(filePath);
    QString stamp = formatDateTime(QDateTime::currentDateTimeUtc());
    stamp.replace(':', '-');
    const QString backupPath = info.dir().filePath(
        QStringLiteral("%1.corrupted.%2").arg(info.fileName(), stamp));
    if (!QFile::copy(filePath, backupPath)) {
        return {};
    }
    return backupPath;
}

QString FileReminderStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime FileReminderStorage::parseDateTime(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    // Loaded timestamps are local time, like everything the parser and clock produce.
    return dt.isValid() ? dt.toLocalTime() : dt;
}

QJsonObject FileReminderStorage::reminderToJson(const Reminder &reminder)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), reminder.id);
    object.insert(QStringLiteral("owner"), reminder.owner);
    object.insert(QStringLiteral("message"), reminder.message);
    object.insert(QStringLiteral("originalText"), reminder.originalText);
    object.insert(QStringLiteral("triggerTime"), formatDateTime(reminder.triggerTime));
    object.insert(QStringLiteral("created"), reminder.created.isValid()
                                                 ? QJsonValue(formatDateTime(reminder.created))
                                                 : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("recurring"), reminder.recurring);
    object.insert(QStringLiteral("pattern"), reminder.pattern.isNone() ? QJsonValue(QJsonValue::Null)
                                                                       : QJsonValue(reminder.pattern.toTag()));
    object.insert(QStringLiteral("active"), reminder.active);
    object.insert(QStringLiteral("completed"), reminder.completed);
    object.insert(QStringLiteral("snoozed"), reminder.snoozed);
    return object;
}

std::optional<Reminder> FileReminderStorage::reminderFromJson(const QJsonObject &object)
{
    Reminder reminder;
    reminder.id = object.value(QStringLiteral("id")).toString();
    reminder.triggerTime = parseDateTime(object.value(QStringLiteral("triggerTime")).toString());
    if (reminder.id.isEmpty() || !reminder.triggerTime.isValid()) {
        return std::nullopt;
    }
    reminder.owner = object.value(QStringLiteral("owner")).toString();
    reminder.message = object.value(QStringLiteral("message")).toString();
    reminder.originalText = object.value(QStringLiteral("originalText")).toString();
    reminder.created = parseDateTime(object.value(QStringLiteral("created")).toString());
    reminder.recurring = object.value(QStringLiteral("recurring")).toBool(false);
    reminder.pattern = RecurrencePattern::fromTag(object.value(QStringLiteral("pattern")).toString());
    reminder.active = object.value(QStringLiteral("active")).toBool(false);
    reminder.completed = object.value(QStringLiteral("completed")).toBool(false);
    reminder.snoozed = object.value(QStringLiteral("snoozed")).toBool(false);
    return reminder;
}

QJsonObject FileReminderStorage::profileToJson(const UserProfile &profile)
{
    QJsonObject object;
    object.insert(QStringLiteral("owner"), profile.owner);
    object.insert(QStringLiteral("joinedAt"), profile.joinedAt.isValid()
                                                  ? QJsonValue(formatDateTime(profile.joinedAt))
                                                  : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("totalReminders"), profile.totalReminders);
    object.insert(QStringLiteral("activeReminders"), profile.activeReminders);
    object.insert(QStringLiteral("completedReminders"), profile.completedReminders);
    return object;
}

UserProfile FileReminderStorage::profileFromJson(const QString &key, const QJsonObject &object)
{
    UserProfile profile;
    profile.owner = object.value(QStringLiteral("owner")).toString(key);
    profile.joinedAt = parseDateTime(object.value(QStringLiteral("joinedAt")).toString());
    profile.totalReminders = object.value(QStringLiteral("totalReminders")).toInt(0);
    profile.activeReminders = object.value(QStringLiteral("activeReminders")).toInt(0);
    profile.completedReminders = object.value(QStringLiteral("completedReminders")).toInt(0);
    return profile;
}

} // namespace data
} // namespace reminders
