#include "reminders/data/Logging.hpp"

Q_LOGGING_CATEGORY(lcStore, "reminders.store")
Q_LOGGING_CATEGORY(lcSession, "reminders.session")
