#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace reminders {
namespace core {

// Splits raw console input into trimmed, non-empty UTF-8 lines. Bytes after
// the last newline are held until the next chunk or takeRemainder().
class InputLineBuffer
{
public:
    QStringList append(const QByteArray &chunk);
    QString takeRemainder();

    bool hasPending() const { return !m_pending.isEmpty(); }

private:
    QByteArray m_pending;
};

} // namespace core
} // namespace reminders
