#include "DiscoveryClient.h"
#include "DiscoveryProtocol.h"

#include <QUdpSocket>
#include <QElapsedTimer>
#include <QThread>
#include <QDateTime>
#include <QDebug>

DiscoveryClient::DiscoveryClient(const DiscoverySettings &settings, QObject *parent)
    : QObject(parent), m_settings(settings), m_timeoutMs(settings.discoveryTimeoutMs)
{
}

void DiscoveryClient::setTarget(const QHostAddress &address, quint16 port)
{
    m_settings.broadcastAddress = address;
    m_settings.discoveryPort = port;
}

QList<ServerDescriptor> DiscoveryClient::discover()
{
    return discover(m_timeoutMs);
}

QList<ServerDescriptor> DiscoveryClient::quickDiscover()
{
    const int original = m_timeoutMs;
    m_timeoutMs = m_settings.quickDiscoveryTimeoutMs;
    QList<ServerDescriptor> servers = discover(m_timeoutMs);
    m_timeoutMs = original;
    return servers;
}

QList<ServerDescriptor> DiscoveryClient::discover(int timeoutMs)
{
    QList<ServerDescriptor> servers;
    m_lastError.clear();

    QUdpSocket socket;
    if (!socket.bind(QHostAddress::AnyIPv4, 0, QUdpSocket::ShareAddress)) {
        m_lastError = socket.errorString();
        qWarning() << "[DISCOVERY] Failed to open discovery socket:" << m_lastError;
        return servers;
    }

    DiscoveryRequest request;
    request.clientIp = DiscoveryProtocol::localIPv4Address();
    request.clientVersion = m_settings.clientVersion;
    request.timestamp = DiscoveryProtocol::currentTimestamp();

    const QByteArray message = request.encode();
    if (socket.writeDatagram(message, m_settings.broadcastAddress, m_settings.discoveryPort) != message.size()) {
        m_lastError = socket.errorString();
        qWarning() << "[DISCOVERY] Failed to send discovery request:" << m_lastError;
        return servers;
    }
    qDebug() << "[DISCOVERY] Broadcasted discovery request to"
             << m_settings.broadcastAddress.toString() << ":" << m_settings.discoveryPort;

    QElapsedTimer elapsed;
    elapsed.start();

    while (elapsed.elapsed() < timeoutMs) {
        const int remaining = timeoutMs - static_cast<int>(elapsed.elapsed());
        if (remaining <= 0)
            break;
        if (QThread::currentThread()->isInterruptionRequested()) {
            qDebug() << "[DISCOVERY] Discovery interrupted";
            break;
        }
        // Short slices keep the discovery round responsive to interruption.
        if (!socket.waitForReadyRead(qMin(remaining, 100))) {
            if (socket.error() == QAbstractSocket::SocketTimeoutError)
                continue;
            // ICMP unreachable from a silent host must not end the window for everyone else.
            qDebug() << "[DISCOVERY] Ignoring discovery socket error:" << socket.errorString();
            QThread::msleep(10);
            continue;
        }

        while (socket.hasPendingDatagrams()) {
            QByteArray buffer;
            buffer.resize(m_settings.bufferSize);

            QHostAddress sender;
            quint16 senderPort = 0;
            const qint64 size = socket.readDatagram(buffer.data(), buffer.size(), &sender, &senderPort);
            if (size < 0)
                break;
            buffer.resize(static_cast<int>(size));

            ServerDescriptor server;
            if (!parseResponse(buffer, sender, &server)) {
                qWarning() << "[DISCOVERY] Malformed response from" << sender.toString() << ":" << senderPort;
                continue;
            }

            qInfo() << "[DISCOVERY] Found server" << server.name << "(" << server.address() << ")";
            servers.append(server);
            emit serverDiscovered(server);
        }
    }

    qDebug() << "[DISCOVERY] Discovery finished after" << elapsed.elapsed() << "ms, servers:" << servers.size();
    return servers;
}

bool DiscoveryClient::parseResponse(const QByteArray &datagram, const QHostAddress &sender,
                                    ServerDescriptor *server) const
{
    DiscoveryResponse response;
    if (!DiscoveryResponse::decode(datagram, &response))
        return false;
    *server = response.toDescriptor(sender, QDateTime::currentDateTime());
    return true;
}
