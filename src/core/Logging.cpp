#include "reminders/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcParser, "reminders.parser")
Q_LOGGING_CATEGORY(lcRecurrence, "reminders.recurrence")
Q_LOGGING_CATEGORY(lcLifecycle, "reminders.lifecycle")
Q_LOGGING_CATEGORY(lcScheduler, "reminders.scheduler")
Q_LOGGING_CATEGORY(lcApp, "reminders.app")
