#include "reminders/core/InputLineBuffer.hpp"

namespace reminders {
namespace core {

QStringList InputLineBuffer::append(const QByteArray &chunk)
{
    m_pending.append(chunk);

    QStringList lines;
    int start = 0;
    int newline = m_pending.indexOf('\n', start);
    while (newline >= 0) {
        const QString line = QString::fromUtf8(m_pending.constData() + start, newline - start).trimmed();
        if (!line.isEmpty()) {
            lines.append(line);
        }
        start = newline + 1;
        newline = m_pending.indexOf('\n', start);
    }
    m_pending.remove(0, start);
    return lines;
}

QString InputLineBuffer::takeRemainder()
{
    const QString line = QString::fromUtf8(m_pending).trimmed();
    m_pending.clear();
    return line;
}

} // namespace core
} // namespace reminders
