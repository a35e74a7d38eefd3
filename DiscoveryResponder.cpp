#include "DiscoveryResponder.h"
#include "DiscoveryProtocol.h"
#include "UserDirectory.h"

#include <QUdpSocket>
#include <QFutureWatcher>
#include <QtConcurrent>
#include <QDebug>

namespace {
const int BufferSize = 1024;
const int StopTimeoutMs = 2000;
}

DiscoveryResponder::DiscoveryResponder(const ServerSettings &settings,
                                       const UserDirectory *directory,
                                       QObject *parent)
    : QObject(parent), m_settings(settings), m_directory(directory)
{
    m_workers.setMaxThreadCount(4);
}

DiscoveryResponder::~DiscoveryResponder()
{
    stop();
}

bool DiscoveryResponder::start()
{
    if (m_running) {
        qWarning() << "[RESPONDER] Already running on port" << boundPort();
        return false;
    }

    m_socket = new QUdpSocket(this);
    if (!m_socket->bind(QHostAddress::AnyIPv4, m_settings.broadcastPort,
                        QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        m_errorString = m_socket->errorString();
        qWarning() << "[RESPONDER] Failed to bind UDP socket on port"
                   << m_settings.broadcastPort << ":" << m_errorString;
        delete m_socket;
        m_socket = nullptr;
        return false;
    }
    connect(m_socket, &QUdpSocket::readyRead, this, &DiscoveryResponder::handleDatagram);

    m_errorString.clear();
    m_running = true;
    qInfo() << "[RESPONDER] Listening for discovery requests on port" << boundPort()
            << "as" << m_settings.name;
    emit started();
    return true;
}

void DiscoveryResponder::stop()
{
    if (!m_running)
        return;
    m_running = false;

    if (m_socket) {
        m_socket->close();
        m_socket->deleteLater();
        m_socket = nullptr;
    }

    if (!m_workers.waitForDone(StopTimeoutMs))
        qWarning() << "[RESPONDER] Pending requests still running after stop";

    qInfo() << "[RESPONDER] Stopped";
    emit stopped();
}

quint16 DiscoveryResponder::boundPort() const
{
    return m_socket ? m_socket->localPort() : 0;
}

void DiscoveryResponder::updateConfig(const QString &name, const QString &description,
                                      bool passwordRequired)
{
    if (!name.isEmpty())
        m_settings.name = name;
    m_settings.description = description;
    m_settings.passwordProtected = passwordRequired;
    qInfo() << "[RESPONDER] Configuration updated:" << m_settings.name;
}

QJsonObject DiscoveryResponder::status() const
{
    QJsonObject obj;
    obj["is_running"] = m_running;
    obj["server_name"] = m_settings.name;
    obj["server_port"] = m_settings.port;
    obj["broadcast_port"] = m_settings.broadcastPort;
    obj["description"] = m_settings.description;
    obj["password_required"] = m_settings.passwordProtected;
    obj["last_activity"] = m_lastActivity.isValid()
            ? m_lastActivity.toMSecsSinceEpoch() / 1000.0 : 0.0;
    return obj;
}

void DiscoveryResponder::handleDatagram()
{
    while (m_socket && m_socket->hasPendingDatagrams()) {
        QByteArray buffer;
        buffer.resize(static_cast<int>(qMax<qint64>(m_socket->pendingDatagramSize(), 0)));

        QHostAddress sender;
        quint16 senderPort = 0;

        const qint64 size = m_socket->readDatagram(buffer.data(), buffer.size(), &sender, &senderPort);
        if (size < 0) {
            qWarning() << "[RESPONDER] readDatagram failed:" << m_socket->errorString();
            continue;
        }
        buffer.resize(static_cast<int>(size));
        m_lastActivity = QDateTime::currentDateTime();

        if (buffer.size() > BufferSize) {
            qWarning() << "[RESPONDER] Oversized datagram from" << sender.toString() << "dropped";
            continue;
        }

        DiscoveryRequest request;
        if (!DiscoveryRequest::decode(buffer, &request)) {
            qWarning() << "[RESPONDER] Ignoring non-discovery datagram from"
                       << sender.toString() << ":" << senderPort;
            continue;
        }

        qDebug() << "[RESPONDER] Discovery request from" << sender.toString() << ":" << senderPort
                 << "client" << request.clientIp << request.clientVersion;
        answerRequest(sender, senderPort);
    }
}

void DiscoveryResponder::answerRequest(const QHostAddress &sender, quint16 senderPort)
{
    // The user count lookup may block, keep it off the receive path.
    auto watcher = new QFutureWatcher<quint32>(this);
    connect(watcher, &QFutureWatcher<quint32>::finished, this, [=]() {
        const quint32 count = watcher->result();
        watcher->deleteLater();
        sendServerInfo(sender, senderPort, count);
    });

    const UserDirectory *directory = m_directory;
    watcher->setFuture(QtConcurrent::run(&m_workers, [directory]() -> quint32 {
        return directory ? directory->onlineUsersCount() : 0;
    }));
}

void DiscoveryResponder::sendServerInfo(const QHostAddress &sender, quint16 senderPort,
                                        quint32 usersCount)
{
    if (!m_running || !m_socket)
        return;

    DiscoveryResponse response;
    response.name = m_settings.name;
    response.port = m_settings.port;
    response.usersCount = usersCount;
    response.passwordRequired = m_settings.passwordProtected;
    response.description = m_settings.description;
    response.version = m_settings.version;
    response.maxUsers = m_settings.maxUsers;
    response.timestamp = DiscoveryProtocol::currentTimestamp();

    const QByteArray data = response.encode(BufferSize);
    if (m_socket->writeDatagram(data, sender, senderPort) != data.size()) {
        qWarning() << "[RESPONDER] Failed to answer" << sender.toString() << ":" << senderPort
                   << m_socket->errorString();
        return;
    }

    qDebug() << "[RESPONDER] Sent server info to" << sender.toString() << ":" << senderPort;
    emit requestAnswered(sender, senderPort);
}
