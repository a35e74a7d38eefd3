#include "ServerRegistry.h"

#include <QMutexLocker>
#include <QFile>
#include <QJsonDocument>
#include <QDebug>

int ServerRegistry::merge(const QList<ServerDescriptor> &servers, const QDateTime &now)
{
    QMutexLocker locker(&m_mutex);
    int added = 0;

    for (const ServerDescriptor &incoming : servers) {
        const QString key = incoming.key();
        auto it = m_servers.find(key);
        if (it == m_servers.end()) {
            ServerDescriptor entry = incoming;
            entry.isOnline = true;
            entry.lastSeen = now;
            m_servers.insert(key, entry);
            ++added;
            qDebug() << "[REGISTRY] New server" << entry.name << key;
            continue;
        }

        ServerDescriptor &entry = it.value();
        entry.name = incoming.name;
        entry.description = incoming.description;
        entry.version = incoming.version;
        entry.usersCount = incoming.usersCount;
        entry.maxUsers = incoming.maxUsers;
        entry.passwordProtected = incoming.passwordProtected;
        entry.isOnline = true;
        entry.lastSeen = now;
    }

    return added;
}

int ServerRegistry::sweepOffline(int maxAgeSecs, const QDateTime &now)
{
    QMutexLocker locker(&m_mutex);
    int markedOffline = 0;

    for (auto it = m_servers.begin(); it != m_servers.end(); ++it) {
        ServerDescriptor &entry = it.value();
        if (!entry.lastSeen.isValid() || !entry.isOnline)
            continue;
        if (entry.lastSeen.secsTo(now) > maxAgeSecs) {
            entry.isOnline = false;
            ++markedOffline;
            qDebug() << "[REGISTRY] Server" << entry.name << it.key() << "marked offline";
        }
    }

    return markedOffline;
}

void ServerRegistry::seed(const QList<ServerDescriptor> &servers)
{
    QMutexLocker locker(&m_mutex);
    for (const ServerDescriptor &server : servers)
        m_servers.insert(server.key(), server);
}

void ServerRegistry::clear()
{
    QMutexLocker locker(&m_mutex);
    m_servers.clear();
    qInfo() << "[REGISTRY] Server cache cleared";
}

QList<ServerDescriptor> ServerRegistry::listAll() const
{
    QMutexLocker locker(&m_mutex);
    return m_servers.values();
}

QList<ServerDescriptor> ServerRegistry::listOnline() const
{
    QMutexLocker locker(&m_mutex);
    QList<ServerDescriptor> online;
    for (const ServerDescriptor &server : m_servers) {
        if (server.isOnline)
            online.append(server);
    }
    return online;
}

bool ServerRegistry::serverByAddress(const QString &host, quint16 port, ServerDescriptor *out) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_servers.constFind(ServerDescriptor::makeKey(host, port));
    if (it == m_servers.constEnd())
        return false;
    if (out)
        *out = it.value();
    return true;
}

bool ServerRegistry::contains(const QString &host, quint16 port) const
{
    return serverByAddress(host, port, nullptr);
}

int ServerRegistry::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_servers.size();
}

QJsonArray ServerRegistry::toJson() const
{
    QJsonArray array;
    const QList<ServerDescriptor> servers = listAll();
    for (const ServerDescriptor &server : servers)
        array.append(server.toJson());
    return array;
}

int ServerRegistry::loadJson(const QJsonArray &array)
{
    QList<ServerDescriptor> servers;
    for (const QJsonValue &val : array) {
        ServerDescriptor server;
        if (!val.isObject() || !ServerDescriptor::fromJson(val.toObject(), &server)) {
            qWarning() << "[REGISTRY] Skipping invalid cached server entry";
            continue;
        }
        servers.append(server);
    }
    seed(servers);
    return servers.size();
}

bool ServerRegistry::saveToFile(const QString &path, QString *errorString) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorString)
            *errorString = file.errorString();
        qWarning() << "[REGISTRY] Cannot write" << path << ":" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    return true;
}

bool ServerRegistry::loadFromFile(const QString &path, QString *errorString)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString)
            *errorString = file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        if (errorString)
            *errorString = parseError.errorString();
        qWarning() << "[REGISTRY] Invalid server cache" << path << ":" << parseError.errorString();
        return false;
    }

    const int loaded = loadJson(doc.array());
    qInfo() << "[REGISTRY] Loaded" << loaded << "cached servers from" << path;
    return true;
}
