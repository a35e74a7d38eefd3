#pragma once

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>
#include <QList>

struct ServerDescriptor
{
    QString name;
    QString host;       // taken from the datagram sender, never from the payload
    quint16 port = 0;
    QString description;
    QString version = QStringLiteral("1.0");
    quint32 usersCount = 0;
    quint32 maxUsers = 50;
    bool passwordProtected = false;
    bool isOnline = true;
    QDateTime lastSeen;  // invalid when unknown

    ServerDescriptor() = default;
    ServerDescriptor(const QString &n, const QString &h, quint16 p)
        : name(n), host(h), port(p) {}

    static QString makeKey(const QString &host, quint16 port) {
        return host + QLatin1Char(':') + QString::number(port);
    }

    QString key() const { return makeKey(host, port); }
    QString address() const { return key(); }

    QString httpUrl() const {
        return QStringLiteral("http://%1:%2").arg(host).arg(port);
    }

    QString webSocketUrl(qint64 userId) const {
        return QStringLiteral("ws://%1:%2/ws/%3").arg(host).arg(port).arg(userId);
    }

    bool sameServer(const ServerDescriptor &other) const {
        return host == other.host && port == other.port;
    }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["name"] = name;
        obj["ip"] = host;
        obj["port"] = port;
        obj["users_count"] = static_cast<qint64>(usersCount);
        obj["is_password_protected"] = passwordProtected;
        obj["description"] = description;
        obj["version"] = version;
        obj["max_users"] = static_cast<qint64>(maxUsers);
        obj["is_online"] = isOnline;
        if (lastSeen.isValid())
            obj["last_seen"] = lastSeen.toMSecsSinceEpoch() / 1000.0;
        else
            obj["last_seen"] = QJsonValue(QJsonValue::Null);
        return obj;
    }

    // Returns false when name, ip or a usable port is missing.
    static bool fromJson(const QJsonObject &obj, ServerDescriptor *out) {
        const int p = obj["port"].toInt(-1);
        if (!obj["name"].isString() || !obj["ip"].isString() || p <= 0 || p > 65535)
            return false;

        ServerDescriptor d(obj["name"].toString(), obj["ip"].toString(), static_cast<quint16>(p));
        d.usersCount = static_cast<quint32>(qMax(0, obj["users_count"].toInt(0)));
        d.passwordProtected = obj["is_password_protected"].toBool(false);
        d.description = obj["description"].toString();
        d.version = obj["version"].toString(QStringLiteral("1.0"));
        d.maxUsers = static_cast<quint32>(qMax(0, obj["max_users"].toInt(50)));
        d.isOnline = obj["is_online"].toBool(true);
        if (obj["last_seen"].isDouble())
            d.lastSeen = QDateTime::fromMSecsSinceEpoch(
                qRound64(obj["last_seen"].toDouble() * 1000.0));
        *out = d;
        return true;
    }
};

inline bool operator==(const ServerDescriptor &a, const ServerDescriptor &b)
{
    return a.sameServer(b);
}

inline bool operator!=(const ServerDescriptor &a, const ServerDescriptor &b)
{
    return !a.sameServer(b);
}

Q_DECLARE_METATYPE(ServerDescriptor)
Q_DECLARE_METATYPE(QList<ServerDescriptor>)
