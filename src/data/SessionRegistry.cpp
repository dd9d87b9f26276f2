#include "reminders/data/SessionRegistry.hpp"

#include "reminders/data/Logging.hpp"

namespace reminders {
namespace data {

Session &SessionRegistry::touch(const QString &owner, const QDateTime &now)
{
    auto it = m_sessions.find(owner);
    if (it == m_sessions.end()) {
        Session session;
        session.owner = owner;
        it = m_sessions.insert(owner, session);
    }
    it->lastActivity = now;
    return it.value();
}

std::optional<Session> SessionRegistry::find(const QString &owner) const
{
    if (m_sessions.contains(owner)) {
        return m_sessions.value(owner);
    }
    return std::nullopt;
}

bool SessionRegistry::setState(const QString &owner, SessionState state)
{
    auto it = m_sessions.find(owner);
    if (it == m_sessions.end()) {
        return false;
    }
    it->state = state;
    return true;
}

int SessionRegistry::sweep(const QDateTime &now, std::chrono::minutes idleTimeout)
{
    const QDateTime cutoff = now.addSecs(-std::chrono::duration_cast<std::chrono::seconds>(idleTimeout).count());
    int removed = 0;
    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        if (it->lastActivity < cutoff) {
            it = m_sessions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        qCInfo(lcSession) << "Cleaned up" << removed << "stale user sessions. Active sessions:" << m_sessions.size();
    }
    return removed;
}

int SessionRegistry::count() const
{
    return m_sessions.size();
}

} // namespace data
} // namespace reminders
