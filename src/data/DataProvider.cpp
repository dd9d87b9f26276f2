#include "reminders/data/DataProvider.hpp"

#include "reminders/data/Logging.hpp"
#include "reminders/data/FileReminderRepository.hpp"
#include "reminders/data/FileReminderStorage.hpp"

#include <QDir>
#include <QStandardPaths>

namespace reminders {
namespace data {

DataProvider::DataProvider(const QString &storageFolder)
    : m_storageFolder(storageFolder.isEmpty() ? defaultStorageFolder() : storageFolder)
{
    QDir dir(m_storageFolder);
    if (!dir.exists()) {
        if (dir.mkpath(QStringLiteral("."))) {
            qCInfo(lcStore) << "Data directory created:" << m_storageFolder;
        } else {
            qCCritical(lcStore) << "Could not create data directory" << m_storageFolder;
        }
    }

    m_storage = std::make_shared<FileReminderStorage>(m_storageFolder);
    m_reminderRepository = std::make_unique<FileReminderRepository>(m_storage);
}

DataProvider::~DataProvider() = default;

ReminderRepository &DataProvider::reminderRepository()
{
    return *m_reminderRepository;
}

QString DataProvider::storageFolder() const
{
    return m_storageFolder;
}

QString DataProvider::defaultStorageFolder()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/reminder-pal");
    }
    return storageFolder;
}

} // namespace data
} // namespace reminders
