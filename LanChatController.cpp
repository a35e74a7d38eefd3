#include "LanChatController.h"
#include "ChatHub.h"
#include "DiscoveryResponder.h"
#include "DiscoveryService.h"
#include "ChatSession.h"
#include "PresenceClient.h"

#include <QThread>
#include <QTimer>
#include <QElapsedTimer>
#include <QTextStream>
#include <QJsonDocument>
#include <QDebug>

LanChatController::LanChatController(QObject *parent)
    : QObject(parent)
{
}

LanChatController::~LanChatController()
{
    clearCurrentMode();
}

void LanChatController::clearCurrentMode()
{
    if (m_responder) {
        m_responder->stop();
        delete m_responder;
        m_responder = nullptr;
    }

    if (m_hub) {
        m_hub->stop();
        delete m_hub;
        m_hub = nullptr;
    }

    if (m_discovery) {
        m_discovery->stop();
        if (!m_cachePath.isEmpty())
            m_discovery->registry().saveToFile(m_cachePath);
        delete m_discovery;
        m_discovery = nullptr;
    }

    if (m_sessionThread) {
        if (m_session) {
            ChatSession *session = m_session;
            QMetaObject::invokeMethod(session, [session]() { session->disconnectFromServer(); },
                                      Qt::BlockingQueuedConnection);
        }
        waitForPresence();
        m_sessionThread->quit();
        if (!m_sessionThread->wait(3000))
            qWarning() << "Session thread did not stop in time";
        delete m_sessionThread;
        m_sessionThread = nullptr;
        m_session = nullptr;
        m_presence = nullptr;
    }

    m_cachePath.clear();
    m_mode = Mode::None;
}

void LanChatController::waitForPresence()
{
    if (!m_presence)
        return;
    // The session thread keeps running the request while we poll.
    QElapsedTimer elapsed;
    elapsed.start();
    while (m_presence->pendingRequests() > 0 && elapsed.elapsed() < m_presenceTimeoutMs + 500)
        QThread::msleep(10);
    if (m_presence->pendingRequests() > 0)
        qWarning() << "Mark-offline request still pending at shutdown";
}

LanChatController::Mode LanChatController::currentMode() const
{
    return m_mode;
}

void LanChatController::setMode(Mode mode)
{
    if (mode == m_mode)
        return;
    qDebug() << "Switching mode from" << static_cast<int>(m_mode) << "to" << static_cast<int>(mode);
    m_mode = mode;
    emit modeChanged(m_mode);
}

bool LanChatController::startServer(const ServerSettings &settings)
{
    clearCurrentMode();

    m_hub = new ChatHub(this);
    if (!m_hub->listen(QHostAddress(settings.host), settings.port)) {
        qCritical() << "Failed to listen on" << settings.host << ":" << settings.port
                    << "-" << m_hub->errorString();
        delete m_hub;
        m_hub = nullptr;
        return false;
    }

    m_responder = new DiscoveryResponder(settings, m_hub, this);
    if (!m_responder->start()) {
        // The chat server stays usable, it just cannot be discovered.
        qCritical() << "Failed to start discovery responder on port" << settings.broadcastPort
                    << "-" << m_responder->errorString();
    }

    qInfo().noquote() << QStringLiteral("Server %1 started on %2:%3 (users max %4, password %5)")
                         .arg(settings.name, settings.host)
                         .arg(settings.port)
                         .arg(settings.maxUsers)
                         .arg(settings.passwordProtected ? "yes" : "no");
    setMode(Mode::Server);
    return true;
}

void LanChatController::runDiscovery(const DiscoverySettings &settings, bool quick, const QString &cachePath)
{
    clearCurrentMode();
    m_discovery = new DiscoveryService(settings, this);
    m_cachePath = cachePath;
    if (!cachePath.isEmpty()) {
        QString error;
        if (!m_discovery->registry().loadFromFile(cachePath, &error))
            qDebug() << "No server cache loaded from" << cachePath << ":" << error;
    }
    setMode(Mode::Discover);

    QTimer::singleShot(0, this, [this, quick]() {
        const QList<ServerDescriptor> servers = quick ? m_discovery->quickDiscoverOnce()
                                                      : m_discovery->discoverOnce();
        printServers(servers);
        emit finished(0);
    });
}

void LanChatController::startWatch(const DiscoverySettings &settings, const QString &cachePath)
{
    clearCurrentMode();
    m_discovery = new DiscoveryService(settings, this);
    m_cachePath = cachePath;
    if (!cachePath.isEmpty()) {
        QString error;
        if (!m_discovery->registry().loadFromFile(cachePath, &error))
            qDebug() << "No server cache loaded from" << cachePath << ":" << error;
    }

    connect(m_discovery, &DiscoveryService::serversUpdated, this,
            [this](const QList<ServerDescriptor> &servers) {
        printServers(servers);
        if (!m_cachePath.isEmpty())
            m_discovery->registry().saveToFile(m_cachePath);
    });

    m_discovery->start();
    setMode(Mode::Watch);
}

bool LanChatController::startSession(const QString &host, quint16 port, qint64 userId,
                                     const QString &token, const SessionSettings &settings)
{
    clearCurrentMode();

    m_sessionThread = new QThread;
    m_sessionThread->setObjectName(QStringLiteral("ChatSessionThread"));

    m_sessionExitCode = 0;
    m_presenceTimeoutMs = settings.presenceTimeoutMs;
    m_presence = new PresenceClient(settings.presenceTimeoutMs);
    m_session = new ChatSession(userId, host, port, token, settings, nullptr, m_presence);
    m_presence->moveToThread(m_sessionThread);
    m_session->moveToThread(m_sessionThread);
    connect(m_sessionThread, &QThread::finished, m_session, &QObject::deleteLater);
    connect(m_sessionThread, &QThread::finished, m_presence, &QObject::deleteLater);

    connect(m_session, &ChatSession::messageReceived, this, [](const QJsonObject &message) {
        QTextStream(stdout) << "message: "
                            << QJsonDocument(message).toJson(QJsonDocument::Compact) << '\n';
    });
    connect(m_session, &ChatSession::statusUpdated, this, [](const QJsonObject &status) {
        QTextStream(stdout) << "user " << status.value("user_id").toVariant().toString()
                            << (status.value("is_online").toBool() ? " online" : " offline") << '\n';
    });
    connect(m_session, &ChatSession::stateChanged, this, [](ChatSession::State state) {
        qInfo() << "Session state:" << ChatSession::stateName(state);
    });
    // The process may only exit once the mark-offline request is done.
    connect(m_session, &ChatSession::sessionEnded, this, [this](bool exhausted, bool markingOffline) {
        m_sessionExitCode = exhausted ? 1 : 0;
        if (!markingOffline)
            emit finished(m_sessionExitCode);
    });
    connect(m_presence, &PresenceClient::finished, this, [this](qint64, bool) {
        emit finished(m_sessionExitCode);
    });

    m_sessionThread->start();
    m_session->connectToServer();
    setMode(Mode::Connect);
    return true;
}

void LanChatController::printServers(const QList<ServerDescriptor> &servers)
{
    QTextStream out(stdout);
    if (servers.isEmpty()) {
        out << "No servers found" << '\n';
        return;
    }

    out << "Servers: " << servers.size() << '\n';
    for (const ServerDescriptor &server : servers) {
        out << (server.isOnline ? "[online]  " : "[offline] ") << server.name
            << " - " << server.address()
            << " users " << server.usersCount << "/" << server.maxUsers
            << (server.passwordProtected ? " (password)" : "");
        if (!server.description.isEmpty())
            out << " - " << server.description;
        out << '\n';
    }
}
