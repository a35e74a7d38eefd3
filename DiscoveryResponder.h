#pragma once

#include <QObject>
#include <QHostAddress>
#include <QDateTime>
#include <QJsonObject>
#include <QThreadPool>
#include "ServerSettings.h"

class QUdpSocket;
class UserDirectory;

class DiscoveryResponder : public QObject
{
    Q_OBJECT
public:
    DiscoveryResponder(const ServerSettings &settings, const UserDirectory *directory,
                       QObject *parent = nullptr);
    ~DiscoveryResponder();

    bool start();
    void stop();

    bool isRunning() const { return m_running; }
    quint16 boundPort() const;
    QString errorString() const { return m_errorString; }

    void updateConfig(const QString &name, const QString &description, bool passwordRequired);
    QJsonObject status() const;

signals:
    void started();
    void stopped();
    void requestAnswered(const QHostAddress &address, quint16 port);

private slots:
    void handleDatagram();

private:
    void answerRequest(const QHostAddress &sender, quint16 senderPort);
    void sendServerInfo(const QHostAddress &sender, quint16 senderPort, quint32 usersCount);

    ServerSettings m_settings;
    const UserDirectory *m_directory;
    QUdpSocket *m_socket = nullptr;
    QThreadPool m_workers;
    bool m_running = false;
    QString m_errorString;
    QDateTime m_lastActivity;
};
