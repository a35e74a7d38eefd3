#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include "ServerDescriptor.h"

struct DiscoveryRequest
{
    QString clientIp;
    QString clientVersion = QStringLiteral("1.0");
    double timestamp = 0.0;   // seconds since epoch

    QByteArray encode() const;
    static bool decode(const QByteArray &datagram, DiscoveryRequest *out);
};

struct DiscoveryResponse
{
    QString name;
    quint16 port = 0;
    quint32 usersCount = 0;
    bool passwordRequired = false;
    QString description;
    QString version = QStringLiteral("1.0");
    quint32 maxUsers = 50;
    double timestamp = 0.0;

    // Shortens the description if needed so the datagram fits maxSize bytes.
    QByteArray encode(int maxSize = 1024) const;
    static bool decode(const QByteArray &datagram, DiscoveryResponse *out);

    ServerDescriptor toDescriptor(const QHostAddress &sender, const QDateTime &seenAt) const;
};

namespace DiscoveryProtocol
{
    const char RequestType[] = "discovery";
    const char ResponseType[] = "server_response";

    // Peeks at the "type" field; empty for anything that is not a JSON object.
    QString messageType(const QByteArray &datagram);

    double currentTimestamp();

    // First non-loopback IPv4 address of an interface that is up.
    QString localIPv4Address();

    // IPv4-mapped IPv6 senders are reported in plain dotted form.
    QString hostString(const QHostAddress &address);
}
