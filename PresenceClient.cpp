#include "PresenceClient.h"

#include <QTcpSocket>
#include <QTimer>
#include <QJsonObject>
#include <QJsonDocument>
#include <QSharedPointer>
#include <QDebug>

PresenceClient::PresenceClient(int timeoutMs, QObject *parent)
    : QObject(parent), m_timeoutMs(timeoutMs), m_pending(0)
{
}

QByteArray PresenceClient::buildStatusRequest(const QString &host, quint16 port, qint64 userId, bool online)
{
    QJsonObject obj;
    obj["user_id"] = userId;
    obj["is_online"] = online;
    const QByteArray body = QJsonDocument(obj).toJson(QJsonDocument::Compact);

    QByteArray request;
    request += "POST /auth/status HTTP/1.1\r\n";
    request += "Host: " + host.toUtf8() + ":" + QByteArray::number(port) + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += body;
    return request;
}

int PresenceClient::parseStatusCode(const QByteArray &response)
{
    const int lineEnd = response.indexOf("\r\n");
    const QByteArray statusLine = lineEnd >= 0 ? response.left(lineEnd) : response;
    const QList<QByteArray> parts = statusLine.split(' ');
    if (parts.size() < 2 || !parts[0].startsWith("HTTP/"))
        return -1;
    bool ok = false;
    const int code = parts[1].toInt(&ok);
    return ok ? code : -1;
}

void PresenceClient::markOffline(const QString &host, quint16 port, qint64 userId)
{
    auto socket = new QTcpSocket(this);
    auto timer = new QTimer(socket);
    auto response = QSharedPointer<QByteArray>::create();
    auto done = QSharedPointer<bool>::create(false);

    auto finish = [=](bool ok, const QString &reason) {
        if (*done)
            return;
        *done = true;
        timer->stop();
        if (ok)
            qInfo() << "[PRESENCE] Marked user" << userId << "as offline";
        else
            qWarning() << "[PRESENCE] Failed to mark user" << userId << "offline:" << reason;
        socket->abort();
        socket->deleteLater();
        m_pending.deref();
        emit finished(userId, ok);
    };

    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [=]() {
        finish(false, QStringLiteral("timeout"));
    });

    connect(socket, &QTcpSocket::connected, this, [=]() {
        socket->write(buildStatusRequest(host, port, userId, false));
    });
    connect(socket, &QTcpSocket::readyRead, this, [=]() {
        response->append(socket->readAll());
        if (!response->contains("\r\n"))
            return;
        const int code = parseStatusCode(*response);
        finish(code == 200, QStringLiteral("HTTP status %1").arg(code));
    });
    connect(socket, QOverload<QAbstractSocket::SocketError>::of(&QTcpSocket::error), this,
            [=](QAbstractSocket::SocketError err) {
        if (err == QAbstractSocket::RemoteHostClosedError && response->contains("\r\n"))
            return;
        finish(false, socket->errorString());
    });

    m_pending.ref();
    timer->start(m_timeoutMs);
    socket->connectToHost(host, port);
}
