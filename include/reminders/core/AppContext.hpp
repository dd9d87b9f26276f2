#pragma once

#include <QTimer>
#include <memory>

#include "reminders/core/AppSettings.hpp"

namespace reminders {
namespace data {
class DataProvider;
class SessionRegistry;
}

namespace core {

class AcknowledgementHandler;
class Clock;
class Notifier;
class ReminderLifecycle;
class ReminderStore;
class Scheduler;
class TimeExpressionParser;

class AppContext
{
public:
    AppContext(AppSettings settings, Notifier &notifier, const Clock &clock);
    ~AppContext();

    void start();
    void stop();

    const AppSettings &settings() const;
    const Clock &clock() const;
    Notifier &notifier();
    TimeExpressionParser &parser();
    ReminderStore &store();
    ReminderLifecycle &lifecycle();
    data::SessionRegistry &sessions();
    AcknowledgementHandler &acknowledgements();
    Scheduler &scheduler();

private:
    AppSettings m_settings;
    Notifier &m_notifier;
    const Clock &m_clock;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<TimeExpressionParser> m_parser;
    std::unique_ptr<ReminderStore> m_store;
    std::unique_ptr<ReminderLifecycle> m_lifecycle;
    std::unique_ptr<data::SessionRegistry> m_sessions;
    std::unique_ptr<AcknowledgementHandler> m_acknowledgements;
    std::unique_ptr<Scheduler> m_scheduler;
    QTimer m_sessionSweepTimer;
};

} // namespace core
} // namespace reminders
