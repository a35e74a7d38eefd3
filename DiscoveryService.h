#pragma once

#include <QObject>
#include <QMap>
#include <QMutex>
#include <QAtomicInt>
#include <functional>
#include "ServerRegistry.h"
#include "Settings.h"

class QThread;

// Keeps the registry fresh by probing on a background thread.
// Subscriber callbacks and serversUpdated() are invoked from that thread.
class DiscoveryService : public QObject
{
    Q_OBJECT
public:
    using Callback = std::function<void(const QList<ServerDescriptor> &)>;

    explicit DiscoveryService(const DiscoverySettings &settings = DiscoverySettings(),
                              QObject *parent = nullptr);
    ~DiscoveryService();

    void start();
    void stop();
    bool isRunning() const;

    // Synchronous discovery on the calling thread; returns the whole cache.
    QList<ServerDescriptor> discoverOnce();
    QList<ServerDescriptor> quickDiscoverOnce();

    ServerRegistry &registry() { return m_registry; }
    const ServerRegistry &registry() const { return m_registry; }

    int addCallback(const Callback &callback);
    void removeCallback(int id);

    int iterations() const { return m_iterations.load(); }

    static bool checkServerAvailability(const QString &host, quint16 port, int timeoutMs = 2000);

signals:
    void serversUpdated(const QList<ServerDescriptor> &servers);
    void iterationFailed(const QString &error);

private:
    bool runIteration();
    bool refresh(int timeoutMs, QString *error);
    void notifySubscribers(const QList<ServerDescriptor> &servers);

    DiscoverySettings m_settings;
    ServerRegistry m_registry;
    QThread *m_thread = nullptr;

    QMutex m_callbacksMutex;
    QMap<int, Callback> m_callbacks;
    int m_nextCallbackId = 1;
    QAtomicInt m_iterations;
};
