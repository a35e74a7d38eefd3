#include "ChatHub.h"

#include <QWebSocket>
#include <QWebSocketServer>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QDebug>

ChatHub::ChatHub(QObject *parent)
    : QObject(parent),
      m_server(new QWebSocketServer(QStringLiteral("LanChat"), QWebSocketServer::NonSecureMode, this)),
      m_cleanupTimer(this),
      m_onlineCount(0)
{
    connect(m_server, &QWebSocketServer::newConnection, this, &ChatHub::handleNewConnection);

    m_cleanupTimer.setInterval(60 * 1000); // once a minute
    connect(&m_cleanupTimer, &QTimer::timeout, this, &ChatHub::cleanupInactiveClients);
}

ChatHub::~ChatHub()
{
    stop();
}

bool ChatHub::listen(const QHostAddress &address, quint16 port)
{
    if (!m_server->listen(address, port)) {
        m_errorString = m_server->errorString();
        qWarning() << "[HUB] Failed to listen:" << m_errorString;
        return false;
    }

    m_cleanupTimer.start();
    qInfo() << "[HUB] Chat hub listening on" << m_server->serverAddress().toString()
            << ":" << m_server->serverPort();
    emit serverStarted();
    return true;
}

void ChatHub::stop()
{
    if (!m_server->isListening() && m_clients.isEmpty())
        return;

    m_cleanupTimer.stop();
    m_server->close();

    const QList<QWebSocket *> sockets = m_clients.keys();
    m_clients.clear();
    m_onlineCount.store(0);
    for (QWebSocket *socket : sockets) {
        socket->disconnect(this);
        socket->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("Server shutting down"));
        socket->deleteLater();
    }

    qInfo() << "[HUB] Chat hub stopped";
    emit serverStopped();
}

quint16 ChatHub::serverPort() const
{
    return m_server->serverPort();
}

quint32 ChatHub::onlineUsersCount() const
{
    return static_cast<quint32>(qMax(0, m_onlineCount.load()));
}

bool ChatHub::isOnline(qint64 userId) const
{
    return authenticatedConnections(userId) > 0;
}

bool ChatHub::parseUserId(const QString &path, qint64 *userId)
{
    static const QRegularExpression pattern(QStringLiteral("^/ws/(\\d+)/?$"));
    const QRegularExpressionMatch match = pattern.match(path);
    if (!match.hasMatch())
        return false;
    bool ok = false;
    const qint64 id = match.captured(1).toLongLong(&ok);
    if (!ok)
        return false;
    *userId = id;
    return true;
}

void ChatHub::handleNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QWebSocket *socket = m_server->nextPendingConnection();
        const QString path = socket->requestUrl().path();

        qint64 userId = 0;
        if (!parseUserId(path, &userId)) {
            qWarning() << "[HUB] Rejecting connection from" << socket->peerAddress().toString()
                       << "on path" << path;
            socket->close(QWebSocketProtocol::CloseCodePolicyViolated, QStringLiteral("Unknown path"));
            socket->deleteLater();
            continue;
        }

        qDebug() << "[HUB] New connection for user" << userId << "from" << socket->peerAddress().toString();

        Client client;
        client.userId = userId;
        client.lastActivity = QDateTime::currentDateTime();
        m_clients.insert(socket, client);

        connect(socket, &QWebSocket::textMessageReceived, this, &ChatHub::handleTextMessage);
        connect(socket, &QWebSocket::disconnected, this, &ChatHub::handleClientDisconnected);
    }
}

void ChatHub::handleTextMessage(const QString &message)
{
    QWebSocket *socket = qobject_cast<QWebSocket *>(sender());
    if (!socket || !m_clients.contains(socket))
        return;

    Client &client = m_clients[socket];
    client.lastActivity = QDateTime::currentDateTime();

    if (message == QLatin1String("ping")) {
        socket->sendTextMessage(QStringLiteral("pong"));
        return;
    }
    if (message == QLatin1String("pong"))
        return;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[HUB] Non-JSON frame from user" << client.userId;
        return;
    }

    const QJsonObject request = doc.object();
    const QString type = request.value("type").toString();

    if (type == QLatin1String("auth")) {
        handleAuth(socket, client, request);
    } else if (type == QLatin1String("ping")) {
        socket->sendTextMessage(QStringLiteral("pong"));
    } else if (!client.authenticated) {
        qWarning() << "[HUB] Dropping" << type << "from unauthenticated user" << client.userId;
    } else {
        relay(socket, client, request);
    }
}

void ChatHub::handleAuth(QWebSocket *socket, Client &client, const QJsonObject &request)
{
    const QString token = request.value("token").toString();
    const qint64 claimedId = static_cast<qint64>(request.value("user_id").toDouble(-1));

    QJsonObject response;
    response["type"] = QStringLiteral("auth_response");

    if (token.isEmpty() || claimedId != client.userId) {
        response["status"] = QStringLiteral("error");
        response["message"] = token.isEmpty() ? QStringLiteral("Missing token")
                                              : QStringLiteral("User id mismatch");
        qWarning() << "[HUB] Authentication failed for user" << client.userId
                   << ":" << response["message"].toString();
        sendJson(socket, response);
        return;
    }

    response["status"] = QStringLiteral("success");
    sendJson(socket, response);

    if (!client.authenticated) {
        client.authenticated = true;
        qInfo() << "[HUB] User" << client.userId << "authenticated";
        if (authenticatedConnections(client.userId) == 1)
            setUserOnline(client.userId, true);
    }
}

void ChatHub::relay(QWebSocket *socket, const Client &client, const QJsonObject &message)
{
    if (!message.contains("recipient_id")) {
        qDebug() << "[HUB] Message without recipient from user" << client.userId;
        return;
    }

    const qint64 recipient = static_cast<qint64>(message.value("recipient_id").toDouble(-1));
    QJsonObject forwarded = message;
    forwarded["sender_id"] = client.userId;

    int delivered = 0;
    for (auto it = m_clients.constBegin(); it != m_clients.constEnd(); ++it) {
        if (it.key() == socket || !it.value().authenticated || it.value().userId != recipient)
            continue;
        sendJson(it.key(), forwarded);
        ++delivered;
    }
    qDebug() << "[HUB] Relayed" << message.value("type").toString() << "from" << client.userId
             << "to" << recipient << "(" << delivered << "connections)";
}

void ChatHub::sendJson(QWebSocket *socket, const QJsonObject &obj)
{
    socket->sendTextMessage(QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)));
}

int ChatHub::authenticatedConnections(qint64 userId) const
{
    int count = 0;
    for (const Client &client : m_clients) {
        if (client.authenticated && client.userId == userId)
            ++count;
    }
    return count;
}

void ChatHub::setUserOnline(qint64 userId, bool online)
{
    if (online)
        m_onlineCount.ref();
    else
        m_onlineCount.deref();

    qInfo() << "[HUB] User" << userId << (online ? "online" : "offline")
            << "- online users:" << onlineUsersCount();
    broadcastStatus(userId, online);
    emit userStatusChanged(userId, online);
}

void ChatHub::broadcastStatus(qint64 userId, bool online)
{
    QJsonObject update;
    update["type"] = QStringLiteral("user_status_update");
    update["user_id"] = userId;
    update["is_online"] = online;

    for (auto it = m_clients.constBegin(); it != m_clients.constEnd(); ++it) {
        if (it.value().authenticated && it.value().userId != userId)
            sendJson(it.key(), update);
    }
}

void ChatHub::handleClientDisconnected()
{
    QWebSocket *socket = qobject_cast<QWebSocket *>(sender());
    if (!socket)
        return;

    auto it = m_clients.find(socket);
    if (it != m_clients.end()) {
        const Client client = it.value();
        m_clients.erase(it);
        qDebug() << "[HUB] User" << client.userId << "disconnected";
        if (client.authenticated && authenticatedConnections(client.userId) == 0)
            setUserOnline(client.userId, false);
    }
    socket->deleteLater();
}

void ChatHub::cleanupInactiveClients()
{
    const QDateTime now = QDateTime::currentDateTime();
    QList<QWebSocket *> stale;
    for (auto it = m_clients.constBegin(); it != m_clients.constEnd(); ++it) {
        if (it.value().lastActivity.secsTo(now) > m_inactivitySecs)
            stale.append(it.key());
    }

    for (QWebSocket *socket : stale) {
        qInfo() << "[HUB] Closing inactive connection of user" << m_clients.value(socket).userId;
        socket->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("Inactive"));
    }
}
