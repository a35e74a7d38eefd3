#include "DiscoveryService.h"
#include "DiscoveryClient.h"

#include <QThread>
#include <QTimer>
#include <QTcpSocket>
#include <QMutexLocker>
#include <QDebug>
#include <exception>

DiscoveryService::DiscoveryService(const DiscoverySettings &settings, QObject *parent)
    : QObject(parent), m_settings(settings), m_iterations(0)
{
    qRegisterMetaType<ServerDescriptor>("ServerDescriptor");
    qRegisterMetaType<QList<ServerDescriptor>>("QList<ServerDescriptor>");
}

DiscoveryService::~DiscoveryService()
{
    stop();
    // A discovery round outlasting the bounded stop still has to finish before the
    // thread object can go away.
    if (m_thread) {
        m_thread->wait();
        delete m_thread;
        m_thread = nullptr;
    }
}

bool DiscoveryService::isRunning() const
{
    return m_thread && m_thread->isRunning() && !m_thread->isInterruptionRequested();
}

void DiscoveryService::start()
{
    if (isRunning()) {
        qWarning() << "[DISCOVERY] Continuous discovery already running";
        return;
    }

    if (m_thread) {
        // Left over from a stop() that timed out.
        m_thread->wait();
        delete m_thread;
        m_thread = nullptr;
    }

    m_thread = new QThread;
    m_thread->setObjectName(QStringLiteral("ServerDiscoveryThread"));

    auto timer = new QTimer;
    timer->setSingleShot(true);
    timer->moveToThread(m_thread);

    connect(timer, &QTimer::timeout, timer, [this, timer]() {
        if (QThread::currentThread()->isInterruptionRequested())
            return;
        const bool ok = runIteration();
        if (!QThread::currentThread()->isInterruptionRequested())
            timer->start(ok ? m_settings.intervalMs : m_settings.errorBackoffMs);
    });
    connect(m_thread, &QThread::started, timer, [timer]() {
        timer->start(0);
    });
    connect(m_thread, &QThread::finished, timer, &QObject::deleteLater);

    m_thread->start();
    qInfo() << "[DISCOVERY] Continuous discovery started, interval" << m_settings.intervalMs << "ms";
}

void DiscoveryService::stop()
{
    if (!m_thread || !m_thread->isRunning())
        return;

    m_thread->requestInterruption();
    m_thread->quit();
    if (!m_thread->wait(static_cast<unsigned long>(m_settings.stopTimeoutMs)))
        qWarning() << "[DISCOVERY] Discovery thread did not finish within"
                   << m_settings.stopTimeoutMs << "ms, continuing";
    qInfo() << "[DISCOVERY] Continuous discovery stopped";
}

QList<ServerDescriptor> DiscoveryService::discoverOnce()
{
    QString error;
    refresh(m_settings.discoveryTimeoutMs, &error);
    return m_registry.listAll();
}

QList<ServerDescriptor> DiscoveryService::quickDiscoverOnce()
{
    QString error;
    refresh(m_settings.quickDiscoveryTimeoutMs, &error);
    return m_registry.listAll();
}

bool DiscoveryService::refresh(int timeoutMs, QString *error)
{
    DiscoveryClient client(m_settings);
    const QList<ServerDescriptor> found = client.discover(timeoutMs);
    if (!client.lastError().isEmpty()) {
        *error = client.lastError();
        return false;
    }

    const int added = m_registry.merge(found);
    const int offline = m_registry.sweepOffline(m_settings.maxCacheAgeSecs);
    qInfo() << "[DISCOVERY] Discovery found" << found.size() << "servers," << added << "new,"
            << offline << "went offline";
    return true;
}

bool DiscoveryService::runIteration()
{
    m_iterations.ref();

    QString error;
    if (!refresh(m_settings.discoveryTimeoutMs, &error)) {
        qWarning() << "[DISCOVERY] Discovery iteration failed:" << error
                   << "- retrying in" << m_settings.errorBackoffMs << "ms";
        emit iterationFailed(error);
        return false;
    }

    const QList<ServerDescriptor> online = m_registry.listOnline();
    if (!online.isEmpty()) {
        notifySubscribers(online);
        emit serversUpdated(online);
    }
    return true;
}

void DiscoveryService::notifySubscribers(const QList<ServerDescriptor> &servers)
{
    QList<Callback> callbacks;
    {
        QMutexLocker locker(&m_callbacksMutex);
        callbacks = m_callbacks.values();
    }

    for (const Callback &callback : callbacks) {
        try {
            callback(servers);
        } catch (const std::exception &e) {
            qWarning() << "[DISCOVERY] Subscriber failed:" << e.what();
        } catch (...) {
            qWarning() << "[DISCOVERY] Subscriber failed with an unknown exception";
        }
    }
}

int DiscoveryService::addCallback(const Callback &callback)
{
    if (!callback)
        return 0;
    QMutexLocker locker(&m_callbacksMutex);
    const int id = m_nextCallbackId++;
    m_callbacks.insert(id, callback);
    return id;
}

void DiscoveryService::removeCallback(int id)
{
    QMutexLocker locker(&m_callbacksMutex);
    m_callbacks.remove(id);
}

bool DiscoveryService::checkServerAvailability(const QString &host, quint16 port, int timeoutMs)
{
    QTcpSocket socket;
    socket.connectToHost(host, port);
    const bool ok = socket.waitForConnected(timeoutMs);
    if (ok)
        socket.disconnectFromHost();
    else
        qDebug() << "[DISCOVERY]" << host << ":" << port << "unreachable:" << socket.errorString();
    return ok;
}
