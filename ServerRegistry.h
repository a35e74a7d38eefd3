#pragma once

#include <QHash>
#include <QList>
#include <QMutex>
#include <QDateTime>
#include <QJsonArray>
#include "ServerDescriptor.h"

// Cache of every server seen so far, keyed by host:port.
// Entries are only marked offline by aging, never dropped; clear() is the
// one way to remove them. All queries return copies.
class ServerRegistry
{
public:
    ServerRegistry() = default;

    int merge(const QList<ServerDescriptor> &servers,
              const QDateTime &now = QDateTime::currentDateTime());
    int sweepOffline(int maxAgeSecs, const QDateTime &now = QDateTime::currentDateTime());
    void seed(const QList<ServerDescriptor> &servers);
    void clear();

    QList<ServerDescriptor> listAll() const;
    QList<ServerDescriptor> listOnline() const;
    bool serverByAddress(const QString &host, quint16 port, ServerDescriptor *out) const;
    bool contains(const QString &host, quint16 port) const;
    int size() const;

    QJsonArray toJson() const;
    int loadJson(const QJsonArray &array);
    bool saveToFile(const QString &path, QString *errorString = nullptr) const;
    bool loadFromFile(const QString &path, QString *errorString = nullptr);

private:
    Q_DISABLE_COPY(ServerRegistry)

    mutable QMutex m_mutex;
    QHash<QString, ServerDescriptor> m_servers;
};
