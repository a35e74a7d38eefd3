#pragma once

#include <QJsonObject>
#include <QString>

class QCommandLineParser;

struct ServerSettings
{
    QString name = QStringLiteral("Local Messenger Server");
    QString description;
    QString host = QStringLiteral("0.0.0.0");
    quint16 port = 8000;
    quint16 broadcastPort = 37020;
    quint32 maxUsers = 50;
    bool passwordProtected = false;
    QString version = QStringLiteral("1.0");

    QJsonObject toJson() const;
    void applyJson(const QJsonObject &obj);

    // Missing file leaves the defaults in place and is not an error.
    bool load(const QString &path, QString *errorString = nullptr);
    bool save(const QString &path, QString *errorString = nullptr) const;

    static void addCommandLineOptions(QCommandLineParser &parser);
    // Only flags that were actually given override the current values.
    bool applyCommandLine(const QCommandLineParser &parser, QString *errorString = nullptr);

    // Accepts 1..65535 only.
    static bool parsePort(const QString &text, quint16 *out);
};
