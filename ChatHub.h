#pragma once

#include <QObject>
#include <QHash>
#include <QDateTime>
#include <QHostAddress>
#include <QTimer>
#include <QAtomicInt>
#include <QJsonObject>
#include "UserDirectory.h"

class QWebSocket;
class QWebSocketServer;

// Server end of the session protocol on /ws/{user_id}: auth ack, heartbeat,
// presence broadcasts and direct relay by recipient_id.
class ChatHub : public QObject, public UserDirectory
{
    Q_OBJECT
public:
    explicit ChatHub(QObject *parent = nullptr);
    ~ChatHub();

    bool listen(const QHostAddress &address, quint16 port);
    void stop();

    quint16 serverPort() const;
    QString errorString() const { return m_errorString; }

    quint32 onlineUsersCount() const override;
    bool isOnline(qint64 userId) const;

    void setInactivityTimeout(int secs) { m_inactivitySecs = secs; }

    static bool parseUserId(const QString &path, qint64 *userId);

signals:
    void serverStarted();
    void serverStopped();
    void userStatusChanged(qint64 userId, bool online);

private slots:
    void handleNewConnection();
    void handleTextMessage(const QString &message);
    void handleClientDisconnected();
    void cleanupInactiveClients();

private:
    struct Client
    {
        qint64 userId = 0;
        bool authenticated = false;
        QDateTime lastActivity;
    };

    void handleAuth(QWebSocket *socket, Client &client, const QJsonObject &request);
    void relay(QWebSocket *socket, const Client &client, const QJsonObject &message);
    void sendJson(QWebSocket *socket, const QJsonObject &obj);
    void setUserOnline(qint64 userId, bool online);
    void broadcastStatus(qint64 userId, bool online);
    int authenticatedConnections(qint64 userId) const;

    QWebSocketServer *m_server;
    QHash<QWebSocket *, Client> m_clients;
    QTimer m_cleanupTimer;
    QAtomicInt m_onlineCount;
    int m_inactivitySecs = 5 * 60;
    QString m_errorString;
};
