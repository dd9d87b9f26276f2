#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <chrono>
#include <optional>

namespace reminders {
namespace data {

enum class SessionState
{
    Idle,
    AwaitingCancelConfirmation,
};

struct Session
{
    QString owner;
    SessionState state = SessionState::Idle;
    QDateTime lastActivity;
};

// Ephemeral per-owner interaction state. Lives only as long as the process.
class SessionRegistry
{
public:
    Session &touch(const QString &owner, const QDateTime &now);
    std::optional<Session> find(const QString &owner) const;
    bool setState(const QString &owner, SessionState state);
    int sweep(const QDateTime &now, std::chrono::minutes idleTimeout);
    int count() const;

private:
    QHash<QString, Session> m_sessions;
};

} // namespace data
} // namespace reminders
