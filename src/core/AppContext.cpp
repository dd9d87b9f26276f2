#include "reminders/core/AppContext.hpp"

#include "reminders/core/AcknowledgementHandler.hpp"
#include "reminders/core/Clock.hpp"
#include "reminders/core/ReminderLifecycle.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/core/Scheduler.hpp"
#include "reminders/core/TimeExpressionParser.hpp"
#include "reminders/data/DataProvider.hpp"
#include "reminders/data/SessionRegistry.hpp"

namespace reminders {
namespace core {

AppContext::AppContext(AppSettings settings, Notifier &notifier, const Clock &clock)
    : m_settings(std::move(settings))
    , m_notifier(notifier)
    , m_clock(clock)
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.dataDirectory))
    , m_parser(std::make_unique<TimeExpressionParser>(m_settings.parseOptions))
    , m_store(std::make_unique<ReminderStore>(m_dataProvider->reminderRepository()))
    , m_lifecycle(std::make_unique<ReminderLifecycle>(*m_store))
    , m_sessions(std::make_unique<data::SessionRegistry>())
    , m_acknowledgements(std::make_unique<AcknowledgementHandler>(*m_lifecycle, *m_store, *m_sessions, m_notifier,
                                                                  m_settings.snoozeMinutes))
    , m_scheduler(std::make_unique<Scheduler>(*m_store, *m_lifecycle, m_notifier, m_clock, m_settings.snoozeMinutes))
{
    QObject::connect(&m_sessionSweepTimer, &QTimer::timeout, [this]() {
        m_sessions->sweep(m_clock.now(), m_settings.sessionIdleTimeout);
    });
}

AppContext::~AppContext() = default;

void AppContext::start()
{
    m_scheduler->start(m_settings.tickInterval);
    m_sessionSweepTimer.start(m_settings.sessionSweepInterval);
}

void AppContext::stop()
{
    m_scheduler->stop();
    m_sessionSweepTimer.stop();
}

const AppSettings &AppContext::settings() const
{
    return m_settings;
}

const Clock &AppContext::clock() const
{
    return m_clock;
}

Notifier &AppContext::notifier()
{
    return m_notifier;
}

TimeExpressionParser &AppContext::parser()
{
    return *m_parser;
}

ReminderStore &AppContext::store()
{
    return *m_store;
}

ReminderLifecycle &AppContext::lifecycle()
{
    return *m_lifecycle;
}

data::SessionRegistry &AppContext::sessions()
{
    return *m_sessions;
}

AcknowledgementHandler &AppContext::acknowledgements()
{
    return *m_acknowledgements;
}

Scheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

} // namespace core
} // namespace reminders
