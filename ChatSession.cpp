#include "ChatSession.h"
#include "SessionChannel.h"
#include "PresenceClient.h"

#include <QThread>
#include <QJsonDocument>
#include <QMetaEnum>
#include <QDebug>

ChatSession::ChatSession(qint64 userId, const QString &host, quint16 port, const QString &token,
                         const SessionSettings &settings, SessionChannel *channel,
                         PresenceUpdater *presence, QObject *parent)
    : QObject(parent),
      m_userId(userId),
      m_host(host),
      m_port(port),
      m_token(token),
      m_settings(settings),
      m_channel(channel ? channel : new WebSocketChannel),
      m_presence(presence),
      m_state(static_cast<int>(State::Disconnected)),
      m_attempts(0),
      m_running(0),
      m_lastActivityMs(0),
      m_readTimer(this),
      m_handshakeTimer(this),
      m_reconnectTimer(this)
{
    qRegisterMetaType<ChatSession::State>("ChatSession::State");

    m_channel->setParent(this);
    connect(m_channel, &SessionChannel::connected, this, &ChatSession::onChannelConnected);
    connect(m_channel, &SessionChannel::disconnected, this, &ChatSession::onChannelDisconnected);
    connect(m_channel, &SessionChannel::errorOccurred, this, &ChatSession::onChannelError);
    connect(m_channel, &SessionChannel::textReceived, this, &ChatSession::onTextReceived);

    m_readTimer.setSingleShot(true);
    m_readTimer.setInterval(m_settings.readTimeoutMs);
    connect(&m_readTimer, &QTimer::timeout, this, &ChatSession::onReadTimeout);

    m_handshakeTimer.setSingleShot(true);
    m_handshakeTimer.setInterval(m_settings.connectTimeoutMs);
    connect(&m_handshakeTimer, &QTimer::timeout, this, &ChatSession::onHandshakeTimeout);

    m_reconnectTimer.setSingleShot(true);
    connect(&m_reconnectTimer, &QTimer::timeout, this, &ChatSession::onReconnectTimer);
}

ChatSession::~ChatSession()
{
    m_running.store(0);
    m_channel->disconnect(this);
}

QDateTime ChatSession::lastActivity() const
{
    const qint64 ms = m_lastActivityMs.load();
    return ms > 0 ? QDateTime::fromMSecsSinceEpoch(ms) : QDateTime();
}

QUrl ChatSession::url() const
{
    return QUrl(QStringLiteral("ws://%1:%2/ws/%3").arg(m_host).arg(m_port).arg(m_userId));
}

int ChatSession::backoffDelay(int attempt, int baseMs, int capMs)
{
    return qMin(baseMs * qMax(attempt, 1), capMs);
}

QString ChatSession::stateName(State state)
{
    const QMetaEnum metaEnum = QMetaEnum::fromType<ChatSession::State>();
    return QString::fromLatin1(metaEnum.valueToKey(static_cast<int>(state)));
}

QJsonObject ChatSession::connectionStatus() const
{
    QJsonObject obj;
    obj["is_connected"] = state() == State::Active;
    obj["state"] = stateName(state());
    obj["reconnect_attempts"] = reconnectAttempts();
    obj["max_reconnect_attempts"] = m_settings.maxReconnectAttempts;
    obj["server"] = QStringLiteral("%1:%2").arg(m_host).arg(m_port);
    obj["user_id"] = m_userId;
    return obj;
}

void ChatSession::connectToServer()
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() { doConnect(); }, Qt::QueuedConnection);
        return;
    }
    doConnect();
}

void ChatSession::disconnectFromServer()
{
    // Cleared right away so no reconnect can start before the queued call runs.
    m_running.store(0);
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() { doDisconnect(); }, Qt::QueuedConnection);
        return;
    }
    doDisconnect();
}

bool ChatSession::sendMessage(const QJsonObject &data)
{
    if (state() != State::Active) {
        qWarning() << "[SESSION] Not connected, cannot send" << data.value("type").toString();
        return false;
    }

    const QString frame = QString::fromUtf8(QJsonDocument(data).toJson(QJsonDocument::Compact));
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, frame]() {
            if (state() == State::Active && !sendFrame(frame))
                handleConnectionFailure(QStringLiteral("send failed"));
        }, Qt::QueuedConnection);
        return true;
    }

    if (!sendFrame(frame)) {
        handleConnectionFailure(QStringLiteral("send failed"));
        return false;
    }
    qDebug() << "[SESSION] Sent" << data.value("type").toString();
    return true;
}

void ChatSession::doConnect()
{
    if (state() != State::Disconnected) {
        qWarning() << "[SESSION] connect ignored in state" << stateName(state());
        return;
    }

    m_running.store(1);
    m_attempts.store(0);
    m_wasActive = false;
    openChannel();
}

void ChatSession::doDisconnect()
{
    m_running.store(0);
    m_reconnectTimer.stop();
    m_readTimer.stop();
    m_handshakeTimer.stop();

    if (state() == State::Disconnected) {
        // A failure may have finished the session after the running flag was cleared.
        m_channel->close();
        return;
    }

    qInfo() << "[SESSION] Disconnecting user" << m_userId;
    finish(m_wasActive);
    // Best-effort, the close outcome does not matter any more.
    m_channel->close();
}

void ChatSession::openChannel()
{
    setState(State::Connecting);
    qInfo() << "[SESSION] Connecting to" << url().toString();
    m_handshakeTimer.start();
    m_channel->open(url());
}

bool ChatSession::sendFrame(const QString &frame)
{
    if (!m_channel->sendText(frame))
        return false;
    touch();
    return true;
}

void ChatSession::setState(State state)
{
    const State previous = this->state();
    if (previous == state)
        return;
    m_state.store(static_cast<int>(state));
    qInfo() << "[SESSION]" << stateName(previous) << "->" << stateName(state);
    emit stateChanged(state);

    if (state == State::Active)
        emit connectionChanged(true);
    else if (previous == State::Active)
        emit connectionChanged(false);
}

void ChatSession::touch()
{
    m_lastActivityMs.store(QDateTime::currentMSecsSinceEpoch());
}

void ChatSession::onChannelConnected()
{
    if (state() != State::Connecting)
        return;

    setState(State::Authenticating);

    QJsonObject auth;
    auth["type"] = QStringLiteral("auth");
    auth["token"] = m_token;
    auth["user_id"] = m_userId;
    if (!sendFrame(QString::fromUtf8(QJsonDocument(auth).toJson(QJsonDocument::Compact))))
        handleConnectionFailure(QStringLiteral("could not send auth message"));
}

void ChatSession::onChannelDisconnected()
{
    handleConnectionFailure(QStringLiteral("connection closed"));
}

void ChatSession::onChannelError(const QString &error)
{
    handleConnectionFailure(error);
}

void ChatSession::onHandshakeTimeout()
{
    handleConnectionFailure(state() == State::Authenticating
                            ? QStringLiteral("authentication timed out")
                            : QStringLiteral("connect timed out"));
}

void ChatSession::onReadTimeout()
{
    if (state() != State::Active)
        return;

    qDebug() << "[SESSION] No data for" << m_settings.readTimeoutMs << "ms, sending ping";
    if (!sendFrame(QStringLiteral("ping"))) {
        qWarning() << "[SESSION] Failed to send ping";
        handleConnectionFailure(QStringLiteral("ping failed"));
        return;
    }
    m_readTimer.start();
}

void ChatSession::onTextReceived(const QString &message)
{
    const State current = state();
    if (current != State::Authenticating && current != State::Active)
        return;

    touch();
    if (current == State::Active)
        m_readTimer.start();

    if (message == QLatin1String("pong"))
        return;
    if (message == QLatin1String("ping")) {
        if (!sendFrame(QStringLiteral("pong")))
            handleConnectionFailure(QStringLiteral("pong failed"));
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[SESSION] Non-JSON message:" << message.left(200);
        return;
    }

    const QJsonObject data = doc.object();
    const QString type = data.value("type").toString(QStringLiteral("unknown"));
    qDebug() << "[SESSION] Received" << type;

    if (type == QLatin1String("auth_response")) {
        if (current != State::Authenticating) {
            qDebug() << "[SESSION] Late auth_response ignored";
            return;
        }
        if (data.value("status").toString() == QLatin1String("success")) {
            m_handshakeTimer.stop();
            m_attempts.store(0);
            m_wasActive = true;
            setState(State::Active);
            m_readTimer.start();
            qInfo() << "[SESSION] Authenticated as user" << m_userId;
        } else {
            const QString reason = data.value("message").toString(QStringLiteral("rejected"));
            qWarning() << "[SESSION] Authentication failed:" << reason;
            emit authenticationFailed(reason);
            handleConnectionFailure(QStringLiteral("authentication failed: ") + reason);
        }
        return;
    }

    if (current != State::Active) {
        qDebug() << "[SESSION] Dropping" << type << "received before authentication";
        return;
    }

    if (type == QLatin1String("user_status_update")) {
        emit statusUpdated(data);
    } else if (type == QLatin1String("ping")) {
        if (!sendFrame(QStringLiteral("pong")))
            handleConnectionFailure(QStringLiteral("pong failed"));
    } else {
        emit messageReceived(data);
    }
}

void ChatSession::handleConnectionFailure(const QString &reason)
{
    const State current = state();
    if (current != State::Connecting && current != State::Authenticating && current != State::Active)
        return;

    m_readTimer.stop();
    m_handshakeTimer.stop();

    if (!m_running.load()) {
        finish(m_wasActive);
        m_channel->close();
        return;
    }

    qWarning() << "[SESSION] Connection failure in state" << stateName(current) << ":" << reason;

    const int attempt = m_attempts.fetchAndAddOrdered(1) + 1;
    if (attempt >= m_settings.maxReconnectAttempts) {
        qWarning() << "[SESSION] Max reconnection attempts reached (" << attempt << ")";
        finish(true, true);
        m_channel->close();
        emit reconnectAttemptsExhausted();
        return;
    }

    setState(State::Reconnecting);
    m_channel->close();

    const int delay = backoffDelay(attempt, m_settings.backoffBaseMs, m_settings.backoffCapMs);
    qInfo() << "[SESSION] Reconnecting in" << delay << "ms (attempt" << attempt
            << "of" << m_settings.maxReconnectAttempts << ")";
    m_reconnectTimer.start(delay);
}

void ChatSession::onReconnectTimer()
{
    if (!m_running.load() || state() != State::Reconnecting)
        return;
    openChannel();
}

void ChatSession::finish(bool notifyPresence, bool exhausted)
{
    m_running.store(0);
    m_reconnectTimer.stop();
    setState(State::Disconnected);

    const bool markingOffline = notifyPresence && m_presence;
    if (markingOffline) {
        qInfo() << "[SESSION] Session for user" << m_userId << "ended";
        m_presence->markOffline(m_host, m_port, m_userId);
    }
    emit sessionEnded(exhausted, markingOffline);
}
