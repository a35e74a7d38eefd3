#pragma once

#include <QObject>
#include <QUrl>
#include <QString>

class QWebSocket;

// Bidirectional text channel a ChatSession drives. The production
// implementation wraps QWebSocket; tests substitute a scripted fake.
class SessionChannel : public QObject
{
    Q_OBJECT
public:
    explicit SessionChannel(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~SessionChannel() = default;

    virtual void open(const QUrl &url) = 0;
    virtual void close() = 0;
    // Returns false when the frame could not be handed to the transport.
    virtual bool sendText(const QString &message) = 0;
    virtual bool isConnected() const = 0;

signals:
    void connected();
    void disconnected();
    void textReceived(const QString &message);
    void errorOccurred(const QString &error);
};

class WebSocketChannel : public SessionChannel
{
    Q_OBJECT
public:
    explicit WebSocketChannel(QObject *parent = nullptr);
    ~WebSocketChannel();

    void open(const QUrl &url) override;
    void close() override;
    bool sendText(const QString &message) override;
    bool isConnected() const override;

private:
    QWebSocket *m_socket;
};
