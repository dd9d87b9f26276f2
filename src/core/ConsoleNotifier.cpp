#include "reminders/core/ConsoleNotifier.hpp"

#include <cstdio>

namespace reminders {
namespace core {

ConsoleNotifier::ConsoleNotifier()
    : m_out(stdout)
{
    m_out.setCodec("UTF-8");
}

bool ConsoleNotifier::sendText(const QString &owner, const QString &text)
{
    m_out << "[" << owner << "] " << text << '\n';
    m_out.flush();
    return m_out.status() == QTextStream::Ok;
}

bool ConsoleNotifier::sendChoice(const QString &owner, const QString &text, const std::vector<ChoiceOption> &options)
{
    m_out << "[" << owner << "] " << text << '\n';
    for (const ChoiceOption &option : options) {
        m_out << "    > " << option.id << "  (" << option.label << ")\n";
    }
    m_out.flush();
    return m_out.status() == QTextStream::Ok;
}

} // namespace core
} // namespace reminders
