#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QHostAddress>
#include <QDebug>

#include "LanChatController.h"
#include "ServerSettings.h"
#include "Settings.h"

static bool parseServerAddress(const QString &text, QString *host, quint16 *port)
{
    const int colon = text.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0)
        return false;
    bool ok = false;
    const uint value = text.mid(colon + 1).toUInt(&ok);
    if (!ok || value == 0 || value > 65535)
        return false;
    *host = text.left(colon);
    *port = static_cast<quint16>(value);
    return true;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("lanchat");
    QCoreApplication::setApplicationVersion("1.0");

    qSetMessagePattern("%{time hh:mm:ss.zzz} %{if-debug}D%{endif}%{if-info}I%{endif}"
                       "%{if-warning}W%{endif}%{if-critical}C%{endif}%{if-fatal}F%{endif} %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("LAN chat server with UDP discovery");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption modeOption(QStringList() << "m" << "mode",
                                  "Mode to run: server, discover, watch or connect",
                                  "mode");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Enable debug output.");
    QCommandLineOption configOption("config", "Server config file (default server_config.json).", "file");
    QCommandLineOption quickOption("quick", "Use the short discovery timeout.");
    QCommandLineOption cacheOption("cache", "File to load and save discovered servers.", "file");
    QCommandLineOption serverOption("server", "Chat server to connect to.", "host:port");
    QCommandLineOption userOption("user", "User id for the session.", "id");
    QCommandLineOption tokenOption("token", "Auth token for the session.", "token");
    parser.addOption(modeOption);
    parser.addOption(verboseOption);
    parser.addOption(configOption);
    parser.addOption(quickOption);
    parser.addOption(cacheOption);
    parser.addOption(serverOption);
    parser.addOption(userOption);
    parser.addOption(tokenOption);
    ServerSettings::addCommandLineOptions(parser);
    parser.process(app);

    if (!parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules("*.debug=false");

    const QString mode = parser.value(modeOption).toLower();
    LanChatController controller;
    QObject::connect(&controller, &LanChatController::finished, &app, &QCoreApplication::exit,
                     Qt::QueuedConnection);

    if (mode == "server") {
        ServerSettings settings;
        QString error;
        const QString configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                              : QStringLiteral("server_config.json");
        if (!settings.load(configPath, &error)) {
            qCritical() << "Cannot load" << configPath << ":" << error;
            return 1;
        }
        if (!settings.applyCommandLine(parser, &error)) {
            qCritical().noquote() << error;
            return 1;
        }
        if (parser.isSet(configOption) && !settings.save(configPath, &error))
            qWarning() << "Cannot save" << configPath << ":" << error;

        if (!controller.startServer(settings))
            return 1;
    } else if (mode == "discover" || mode == "watch") {
        DiscoverySettings settings;
        if (parser.isSet("broadcast-port")
                && !ServerSettings::parsePort(parser.value("broadcast-port"), &settings.discoveryPort)) {
            qCritical().noquote() << "Invalid --broadcast-port value:" << parser.value("broadcast-port");
            return 1;
        }

        if (mode == "discover")
            controller.runDiscovery(settings, parser.isSet(quickOption), parser.value(cacheOption));
        else
            controller.startWatch(settings, parser.value(cacheOption));
    } else if (mode == "connect") {
        QString host;
        quint16 port = 0;
        if (!parseServerAddress(parser.value(serverOption), &host, &port)) {
            qCritical() << "Specify --server host:port";
            return 1;
        }
        bool ok = false;
        const qint64 userId = parser.value(userOption).toLongLong(&ok);
        if (!ok || parser.value(tokenOption).isEmpty()) {
            qCritical() << "Specify --user and --token";
            return 1;
        }
        controller.startSession(host, port, userId, parser.value(tokenOption), SessionSettings());
    } else {
        qCritical() << "Specify --mode server, discover, watch or connect";
        return 1;
    }

    return app.exec();
}
