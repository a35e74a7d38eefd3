#pragma once

#include <QObject>
#include <QString>
#include <QAtomicInt>

class PresenceUpdater
{
public:
    virtual ~PresenceUpdater() = default;
    // Best-effort; failures are logged by the implementation.
    virtual void markOffline(const QString &host, quint16 port, qint64 userId) = 0;
};

// POST /auth/status {"user_id": id, "is_online": false} against the chat server.
class PresenceClient : public QObject, public PresenceUpdater
{
    Q_OBJECT
public:
    explicit PresenceClient(int timeoutMs = 3000, QObject *parent = nullptr);

    void markOffline(const QString &host, quint16 port, qint64 userId) override;

    // Requests started but not yet finished; safe to read from any thread.
    int pendingRequests() const { return m_pending.load(); }

    static QByteArray buildStatusRequest(const QString &host, quint16 port, qint64 userId, bool online);
    static int parseStatusCode(const QByteArray &response);

signals:
    void finished(qint64 userId, bool ok);

private:
    int m_timeoutMs;
    QAtomicInt m_pending;
};
