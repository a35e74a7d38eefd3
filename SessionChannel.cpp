#include "SessionChannel.h"

#include <QWebSocket>
#include <QSignalBlocker>
#include <QDebug>

WebSocketChannel::WebSocketChannel(QObject *parent)
    : SessionChannel(parent),
      m_socket(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
{
    connect(m_socket, &QWebSocket::connected, this, &SessionChannel::connected);
    connect(m_socket, &QWebSocket::disconnected, this, &SessionChannel::disconnected);
    connect(m_socket, &QWebSocket::textMessageReceived, this, &SessionChannel::textReceived);
    connect(m_socket, QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error),
            this, [this](QAbstractSocket::SocketError err) {
        Q_UNUSED(err);
        emit errorOccurred(m_socket->errorString());
    });
}

WebSocketChannel::~WebSocketChannel()
{
    m_socket->disconnect(this);
    m_socket->abort();
}

void WebSocketChannel::open(const QUrl &url)
{
    if (m_socket->state() != QAbstractSocket::UnconnectedState) {
        // The old connection must not report a failure for the new attempt.
        QSignalBlocker blocker(m_socket);
        m_socket->abort();
    }
    m_socket->open(url);
}

void WebSocketChannel::close()
{
    if (m_socket->state() == QAbstractSocket::UnconnectedState)
        return;
    m_socket->close(QWebSocketProtocol::CloseCodeNormal, QStringLiteral("Client disconnect"));
}

bool WebSocketChannel::sendText(const QString &message)
{
    if (m_socket->state() != QAbstractSocket::ConnectedState)
        return false;
    return m_socket->sendTextMessage(message) > 0;
}

bool WebSocketChannel::isConnected() const
{
    return m_socket->state() == QAbstractSocket::ConnectedState;
}
