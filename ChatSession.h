#pragma once

#include <QObject>
#include <QTimer>
#include <QDateTime>
#include <QJsonObject>
#include <QAtomicInt>
#include <QUrl>
#include "Settings.h"

class SessionChannel;
class PresenceUpdater;

// One user's live connection to a chat server:
// Disconnected -> Connecting -> Authenticating -> Active <-> Reconnecting -> Disconnected.
// Delivery is at-most-once; nothing is buffered or replayed across reconnects.
class ChatSession : public QObject
{
    Q_OBJECT
public:
    enum class State { Disconnected, Connecting, Authenticating, Active, Reconnecting };
    Q_ENUM(State)

    // Takes ownership of channel; a WebSocketChannel is created when none is given.
    ChatSession(qint64 userId, const QString &host, quint16 port, const QString &token,
                const SessionSettings &settings = SessionSettings(),
                SessionChannel *channel = nullptr,
                PresenceUpdater *presence = nullptr,
                QObject *parent = nullptr);
    ~ChatSession();

    // Thread-safe; the work is posted to the thread the session lives in.
    void connectToServer();
    void disconnectFromServer();
    bool sendMessage(const QJsonObject &data);

    State state() const { return static_cast<State>(m_state.load()); }
    int reconnectAttempts() const { return m_attempts.load(); }
    // Invalid until the first frame is sent or received.
    QDateTime lastActivity() const;
    qint64 userId() const { return m_userId; }
    QUrl url() const;
    QJsonObject connectionStatus() const;

    static int backoffDelay(int attempt, int baseMs, int capMs);
    static QString stateName(State state);

signals:
    void stateChanged(ChatSession::State state);
    void connectionChanged(bool connected);
    void messageReceived(const QJsonObject &message);
    void statusUpdated(const QJsonObject &status);
    void authenticationFailed(const QString &reason);
    void reconnectAttemptsExhausted();
    // Emitted once the session is final, after any mark-offline call was started.
    void sessionEnded(bool exhausted, bool markingOffline);

private slots:
    void onChannelConnected();
    void onChannelDisconnected();
    void onChannelError(const QString &error);
    void onTextReceived(const QString &message);
    void onReadTimeout();
    void onHandshakeTimeout();
    void onReconnectTimer();

private:
    void doConnect();
    void doDisconnect();
    void openChannel();
    bool sendFrame(const QString &frame);
    void setState(State state);
    void handleConnectionFailure(const QString &reason);
    void finish(bool notifyPresence, bool exhausted = false);
    void touch();

    qint64 m_userId;
    QString m_host;
    quint16 m_port;
    QString m_token;
    SessionSettings m_settings;
    SessionChannel *m_channel;
    PresenceUpdater *m_presence;

    QAtomicInt m_state;
    QAtomicInt m_attempts;
    QAtomicInt m_running;
    bool m_wasActive = false;
    QAtomicInteger<qint64> m_lastActivityMs;

    QTimer m_readTimer;
    QTimer m_handshakeTimer;
    QTimer m_reconnectTimer;
};
