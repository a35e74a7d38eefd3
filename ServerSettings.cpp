#include "ServerSettings.h"

#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QDebug>

QJsonObject ServerSettings::toJson() const
{
    QJsonObject obj;
    obj["server_name"] = name;
    obj["description"] = description;
    obj["host"] = host;
    obj["port"] = port;
    obj["broadcast_port"] = broadcastPort;
    obj["max_users"] = static_cast<qint64>(maxUsers);
    obj["password_protected"] = passwordProtected;
    obj["version"] = version;
    return obj;
}

void ServerSettings::applyJson(const QJsonObject &obj)
{
    if (obj.contains("server_name"))
        name = obj["server_name"].toString(name);
    if (obj.contains("description"))
        description = obj["description"].toString(description);
    if (obj.contains("host"))
        host = obj["host"].toString(host);
    if (obj.contains("port"))
        port = static_cast<quint16>(obj["port"].toInt(port));
    if (obj.contains("broadcast_port"))
        broadcastPort = static_cast<quint16>(obj["broadcast_port"].toInt(broadcastPort));
    if (obj.contains("max_users"))
        maxUsers = static_cast<quint32>(obj["max_users"].toInt(static_cast<int>(maxUsers)));
    if (obj.contains("password_protected"))
        passwordProtected = obj["password_protected"].toBool(passwordProtected);
    if (obj.contains("version"))
        version = obj["version"].toString(version);
}

bool ServerSettings::load(const QString &path, QString *errorString)
{
    if (!QFileInfo::exists(path)) {
        qInfo() << "[SETTINGS] No config file at" << path << "- using defaults";
        return true;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString)
            *errorString = file.errorString();
        qWarning() << "[SETTINGS] Cannot open" << path << ":" << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString)
            *errorString = parseError.errorString();
        qWarning() << "[SETTINGS] Invalid config JSON in" << path << ":" << parseError.errorString();
        return false;
    }

    applyJson(doc.object());
    qInfo() << "[SETTINGS] Loaded" << path;
    return true;
}

bool ServerSettings::save(const QString &path, QString *errorString) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorString)
            *errorString = file.errorString();
        qWarning() << "[SETTINGS] Cannot write" << path << ":" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    return true;
}

void ServerSettings::addCommandLineOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption("name", "Server name.", "name"));
    parser.addOption(QCommandLineOption("description", "Server description.", "text"));
    parser.addOption(QCommandLineOption("host", "Address to bind (default 0.0.0.0).", "host"));
    parser.addOption(QCommandLineOption("port", "Chat server port (default 8000).", "port"));
    parser.addOption(QCommandLineOption("broadcast-port", "Discovery UDP port (default 37020).", "port"));
    parser.addOption(QCommandLineOption("max-users", "Maximum number of users (default 50).", "count"));
    parser.addOption(QCommandLineOption("password-protected", "Announce the server as password protected."));
}

bool ServerSettings::parsePort(const QString &text, quint16 *out)
{
    bool ok = false;
    const uint value = text.toUInt(&ok);
    if (!ok || value == 0 || value > 65535)
        return false;
    *out = static_cast<quint16>(value);
    return true;
}

bool ServerSettings::applyCommandLine(const QCommandLineParser &parser, QString *errorString)
{
    if (parser.isSet("name"))
        name = parser.value("name");
    if (parser.isSet("description"))
        description = parser.value("description");
    if (parser.isSet("host"))
        host = parser.value("host");

    if (parser.isSet("port") && !parsePort(parser.value("port"), &port)) {
        if (errorString)
            *errorString = QStringLiteral("Invalid --port value: %1").arg(parser.value("port"));
        return false;
    }
    if (parser.isSet("broadcast-port") && !parsePort(parser.value("broadcast-port"), &broadcastPort)) {
        if (errorString)
            *errorString = QStringLiteral("Invalid --broadcast-port value: %1").arg(parser.value("broadcast-port"));
        return false;
    }
    if (parser.isSet("max-users")) {
        bool ok = false;
        const uint value = parser.value("max-users").toUInt(&ok);
        if (!ok || value == 0) {
            if (errorString)
                *errorString = QStringLiteral("Invalid --max-users value: %1").arg(parser.value("max-users"));
            return false;
        }
        maxUsers = value;
    }
    if (parser.isSet("password-protected"))
        passwordProtected = true;

    return true;
}
