#pragma once

#include <QObject>
#include <QHostAddress>
#include <QList>
#include "ServerDescriptor.h"
#include "Settings.h"

// Performs one broadcast request and collects every answer that arrives
// within the timeout window. discover() blocks for the whole window.
class DiscoveryClient : public QObject
{
    Q_OBJECT
public:
    explicit DiscoveryClient(const DiscoverySettings &settings = DiscoverySettings(),
                             QObject *parent = nullptr);

    QList<ServerDescriptor> discover();
    QList<ServerDescriptor> quickDiscover();
    QList<ServerDescriptor> discover(int timeoutMs);

    int timeout() const { return m_timeoutMs; }
    void setTimeout(int timeoutMs) { m_timeoutMs = timeoutMs; }

    void setTarget(const QHostAddress &address, quint16 port);

    // Empty when the last discovery completed without a socket-level failure.
    QString lastError() const { return m_lastError; }

signals:
    void serverDiscovered(const ServerDescriptor &server);

private:
    bool parseResponse(const QByteArray &datagram, const QHostAddress &sender,
                       ServerDescriptor *server) const;

    DiscoverySettings m_settings;
    int m_timeoutMs;
    QString m_lastError;
};
