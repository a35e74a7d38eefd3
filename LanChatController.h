#pragma once

#include <QObject>
#include <QString>
#include "Settings.h"
#include "ServerSettings.h"
#include "ServerDescriptor.h"

class ChatHub;
class DiscoveryResponder;
class DiscoveryService;
class ChatSession;
class PresenceClient;
class QThread;

class LanChatController : public QObject
{
    Q_OBJECT
public:
    explicit LanChatController(QObject *parent = nullptr);
    ~LanChatController();

    enum class Mode { None, Server, Discover, Watch, Connect };
    Q_ENUM(Mode)

    bool startServer(const ServerSettings &settings);
    void runDiscovery(const DiscoverySettings &settings, bool quick, const QString &cachePath);
    void startWatch(const DiscoverySettings &settings, const QString &cachePath);
    bool startSession(const QString &host, quint16 port, qint64 userId, const QString &token,
                      const SessionSettings &settings);

    Mode currentMode() const;

    static void printServers(const QList<ServerDescriptor> &servers);

signals:
    void modeChanged(Mode newMode);
    void finished(int exitCode);

private:
    void clearCurrentMode();
    void setMode(Mode mode);
    void waitForPresence();

private:
    Mode m_mode = Mode::None;
    ChatHub *m_hub = nullptr;
    DiscoveryResponder *m_responder = nullptr;
    DiscoveryService *m_discovery = nullptr;
    ChatSession *m_session = nullptr;
    PresenceClient *m_presence = nullptr;
    QThread *m_sessionThread = nullptr;
    QString m_cachePath;
    int m_sessionExitCode = 0;
    int m_presenceTimeoutMs = 3000;
};
