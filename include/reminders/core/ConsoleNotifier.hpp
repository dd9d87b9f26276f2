#pragma once

#include <QTextStream>

#include "reminders/core/Notifier.hpp"

namespace reminders {
namespace core {

// Writes outgoing messages to standard output for the console front end.
class ConsoleNotifier : public Notifier
{
public:
    ConsoleNotifier();

    bool sendText(const QString &owner, const QString &text) override;
    bool sendChoice(const QString &owner, const QString &text, const std::vector<ChoiceOption> &options) override;

private:
    QTextStream m_out;
};

} // namespace core
} // namespace reminders
