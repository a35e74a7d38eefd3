#include "DiscoveryProtocol.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkInterface>
#include <QDateTime>
#include <QDebug>

static bool parseObject(const QByteArray &datagram, QJsonObject *out)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(datagram, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        return false;
    *out = doc.object();
    return true;
}

QByteArray DiscoveryRequest::encode() const
{
    QJsonObject obj;
    obj["type"] = QLatin1String(DiscoveryProtocol::RequestType);
    obj["client_version"] = clientVersion;
    obj["client_ip"] = clientIp;
    obj["timestamp"] = timestamp;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

bool DiscoveryRequest::decode(const QByteArray &datagram, DiscoveryRequest *out)
{
    QJsonObject parsed;
    if (!parseObject(datagram, &parsed))
        return false;
    const QJsonObject &obj = parsed;
    if (obj["type"].toString() != QLatin1String(DiscoveryProtocol::RequestType))
        return false;

    out->clientIp = obj["client_ip"].toString();
    out->clientVersion = obj["client_version"].toString(QStringLiteral("1.0"));
    out->timestamp = obj["timestamp"].toDouble();
    return true;
}

QByteArray DiscoveryResponse::encode(int maxSize) const
{
    QJsonObject obj;
    obj["type"] = QLatin1String(DiscoveryProtocol::ResponseType);
    obj["name"] = name;
    obj["port"] = port;
    obj["users_count"] = static_cast<qint64>(usersCount);
    obj["password_required"] = passwordRequired;
    obj["description"] = description;
    obj["version"] = version;
    obj["max_users"] = static_cast<qint64>(maxUsers);
    obj["timestamp"] = timestamp;

    QByteArray data = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    if (data.size() <= maxSize)
        return data;

    QString shortened = description;
    while (data.size() > maxSize && !shortened.isEmpty()) {
        shortened.chop(qMax(1, (data.size() - maxSize) / 2));
        obj["description"] = shortened;
        data = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    }
    if (data.size() > maxSize)
        qWarning() << "[DISCOVERY] Response for" << name << "exceeds" << maxSize << "bytes";
    return data;
}

bool DiscoveryResponse::decode(const QByteArray &datagram, DiscoveryResponse *out)
{
    QJsonObject parsed;
    if (!parseObject(datagram, &parsed))
        return false;
    const QJsonObject &obj = parsed;
    if (obj["type"].toString() != QLatin1String(DiscoveryProtocol::ResponseType))
        return false;
    if (!obj.contains("name") || !obj.contains("port"))
        return false;

    const int p = obj["port"].toInt(-1);
    if (p <= 0 || p > 65535)
        return false;

    out->name = obj["name"].toString();
    out->port = static_cast<quint16>(p);
    out->usersCount = static_cast<quint32>(qMax(0, obj["users_count"].toInt(0)));
    out->passwordRequired = obj["password_required"].toBool(false);
    out->description = obj["description"].toString();
    out->version = obj["version"].toString(QStringLiteral("1.0"));
    out->maxUsers = static_cast<quint32>(qMax(0, obj["max_users"].toInt(50)));
    out->timestamp = obj["timestamp"].toDouble();
    return true;
}

ServerDescriptor DiscoveryResponse::toDescriptor(const QHostAddress &sender, const QDateTime &seenAt) const
{
    ServerDescriptor d(name, DiscoveryProtocol::hostString(sender), port);
    d.description = description;
    d.version = version;
    d.usersCount = usersCount;
    d.maxUsers = maxUsers;
    d.passwordProtected = passwordRequired;
    d.isOnline = true;
    d.lastSeen = seenAt;
    return d;
}

QString DiscoveryProtocol::messageType(const QByteArray &datagram)
{
    QJsonObject obj;
    if (!parseObject(datagram, &obj))
        return QString();
    return obj.value("type").toString();
}

double DiscoveryProtocol::currentTimestamp()
{
    return QDateTime::currentMSecsSinceEpoch() / 1000.0;
}

QString DiscoveryProtocol::localIPv4Address()
{
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        const auto flags = iface.flags();
        if (!(flags & QNetworkInterface::IsUp) || (flags & QNetworkInterface::IsLoopBack))
            continue;

        const auto entries = iface.addressEntries();
        for (const QNetworkAddressEntry &entry : entries) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() == QAbstractSocket::IPv4Protocol && !ip.isLoopback())
                return ip.toString();
        }
    }
    return QStringLiteral("127.0.0.1");
}

QString DiscoveryProtocol::hostString(const QHostAddress &address)
{
    bool isV4 = false;
    const quint32 v4 = address.toIPv4Address(&isV4);
    if (isV4)
        return QHostAddress(v4).toString();
    return address.toString();
}
