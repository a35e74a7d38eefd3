#pragma once

#include <QHostAddress>
#include <QString>

struct DiscoverySettings
{
    quint16 discoveryPort = 37020;
    // Explicit limited broadcast instead of the platform "<broadcast>" alias.
    QHostAddress broadcastAddress = QHostAddress(QHostAddress::Broadcast);
    int discoveryTimeoutMs = 3000;
    int quickDiscoveryTimeoutMs = 1500;
    int bufferSize = 1024;
    int intervalMs = 30 * 1000;
    int errorBackoffMs = 5 * 1000;
    int maxCacheAgeSecs = 300;
    int stopTimeoutMs = 2000;
    QString clientVersion = QStringLiteral("1.0");
};

struct SessionSettings
{
    int readTimeoutMs = 25 * 1000;
    int maxReconnectAttempts = 5;
    int backoffBaseMs = 2000;
    int backoffCapMs = 10 * 1000;
    int connectTimeoutMs = 10 * 1000;
    int presenceTimeoutMs = 3000;
};
