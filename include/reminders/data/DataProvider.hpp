#pragma once

#include <memory>
#include <QString>

namespace reminders {
namespace data {

class ReminderRepository;
class FileReminderStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &storageFolder);
    ~DataProvider();

    ReminderRepository &reminderRepository();
    QString storageFolder() const;

    static QString defaultStorageFolder();

private:
    QString m_storageFolder;
    std::shared_ptr<FileReminderStorage> m_storage;
    std::unique_ptr<ReminderRepository> m_reminderRepository;
};

} // namespace data
} // namespace reminders
