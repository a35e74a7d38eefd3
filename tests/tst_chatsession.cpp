#include <QtTest>
#include <QJsonDocument>
#include <QMutex>
#include <QSemaphore>
#include <QThread>

#include "ChatSession.h"
#include "SessionChannel.h"
#include "PresenceClient.h"

// Scripted transport: open() either connects, fails, or never answers.
class FakeChannel : public SessionChannel
{
    Q_OBJECT
public:
    enum class Mode { Accept, FailOpen, Silent };

    explicit FakeChannel(Mode mode = Mode::Accept) : m_mode(mode) {}

    void open(const QUrl &url) override
    {
        ++openCount;
        lastUrl = url;
        if (m_mode == Mode::Accept) {
            QTimer::singleShot(0, this, [this]() {
                m_connected = true;
                emit connected();
            });
        } else if (m_mode == Mode::FailOpen) {
            QTimer::singleShot(0, this, [this]() {
                emit errorOccurred(QStringLiteral("Connection refused"));
            });
        }
    }

    void close() override
    {
        ++closeCount;
        if (m_connected) {
            m_connected = false;
            emit disconnected();
        }
    }

    bool sendText(const QString &message) override
    {
        if (!sendOk)
            return false;
        QMutexLocker locker(&m_mutex);
        m_sent.append(message);
        return true;
    }

    bool isConnected() const override { return m_connected; }

    void deliver(const QString &message) { emit textReceived(message); }

    void fail(const QString &error) { emit errorOccurred(error); }

    void deliver(const QJsonObject &obj)
    {
        deliver(QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)));
    }

    QStringList sent() const
    {
        QMutexLocker locker(&m_mutex);
        return m_sent;
    }

    QString lastSent() const
    {
        const QStringList frames = sent();
        return frames.isEmpty() ? QString() : frames.last();
    }

    int openCount = 0;
    int closeCount = 0;
    bool sendOk = true;
    QUrl lastUrl;

private:
    Mode m_mode;
    bool m_connected = false;
    mutable QMutex m_mutex;
    QStringList m_sent;
};

class FakePresence : public PresenceUpdater
{
public:
    void markOffline(const QString &host, quint16 port, qint64 userId) override
    {
        ++calls;
        lastHost = host;
        lastPort = port;
        lastUserId = userId;
    }

    int calls = 0;
    QString lastHost;
    quint16 lastPort = 0;
    qint64 lastUserId = 0;
};

static QJsonObject authResponse(const QString &status, const QString &message = QString())
{
    QJsonObject obj;
    obj["type"] = QStringLiteral("auth_response");
    obj["status"] = status;
    if (!message.isEmpty())
        obj["message"] = message;
    return obj;
}

static SessionSettings fastSettings()
{
    SessionSettings settings;
    settings.readTimeoutMs = 10000;
    settings.maxReconnectAttempts = 5;
    settings.backoffBaseMs = 10;
    settings.backoffCapMs = 50;
    settings.connectTimeoutMs = 5000;
    return settings;
}

class TestChatSession : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void urlCarriesUserId();
    void authRequiresAcknowledgement();
    void framesBeforeAuthAreDropped();
    void rejectedAuthReconnects();
    void heartbeatFramesAreNotDelivered();
    void statusUpdatesAndMessagesAreDispatched();
    void sendFailsFastWhenNotActive();
    void sendFailureStartsReconnect();
    void quietConnectionIsPinged();
    void failedPingStartsReconnect();
    void successfulReconnectResetsAttempts();
    void reconnectAttemptsAreBounded();
    void handshakeTimeoutCountsAsFailure();
    void disconnectWhileReconnectingStopsRetrying();
    void disconnectFromActiveMarksOffline();
    void connectFromAnotherThread();
    void failureAfterCrossThreadDisconnectClosesChannel();
    void backoffDelay_data();
    void backoffDelay();

private:
    static void activate(ChatSession &session, FakeChannel *channel);
};

void TestChatSession::initTestCase()
{
    qRegisterMetaType<ChatSession::State>("ChatSession::State");
}

void TestChatSession::activate(ChatSession &session, FakeChannel *channel)
{
    session.connectToServer();
    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);
    channel->deliver(authResponse("success"));
    QCOMPARE(session.state(), ChatSession::State::Active);
}

void TestChatSession::urlCarriesUserId()
{
    ChatSession session(42, "192.168.1.10", 8000, "tok", fastSettings(), new FakeChannel);
    QCOMPARE(session.url(), QUrl("ws://192.168.1.10:8000/ws/42"));
    QCOMPARE(session.state(), ChatSession::State::Disconnected);
    QCOMPARE(session.connectionStatus().value("state").toString(), QString("Disconnected"));
    QVERIFY(!session.lastActivity().isValid());
}

void TestChatSession::authRequiresAcknowledgement()
{
    auto channel = new FakeChannel;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);
    QSignalSpy connection(&session, &ChatSession::connectionChanged);

    session.connectToServer();
    QCOMPARE(session.state(), ChatSession::State::Connecting);
    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);
    QCOMPARE(channel->lastUrl, QUrl("ws://127.0.0.1:8000/ws/7"));

    QCOMPARE(channel->sent().size(), 1);
    const QJsonObject auth = QJsonDocument::fromJson(channel->sent().first().toUtf8()).object();
    QCOMPARE(auth.value("type").toString(), QString("auth"));
    QCOMPARE(auth.value("token").toString(), QString("secret"));
    QCOMPARE(auth.value("user_id").toInt(), 7);

    // Transport being up is not enough.
    QTest::qWait(50);
    QCOMPARE(session.state(), ChatSession::State::Authenticating);
    QCOMPARE(connection.count(), 0);

    channel->deliver(authResponse("success"));
    QCOMPARE(session.state(), ChatSession::State::Active);
    QCOMPARE(connection.count(), 1);
    QCOMPARE(connection.first().first().toBool(), true);
    QCOMPARE(session.reconnectAttempts(), 0);
}

void TestChatSession::framesBeforeAuthAreDropped()
{
    auto channel = new FakeChannel;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);
    QSignalSpy messages(&session, &ChatSession::messageReceived);

    session.connectToServer();
    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);

    QJsonObject early;
    early["type"] = QStringLiteral("message");
    early["content"] = QStringLiteral("too soon");
    channel->deliver(early);
    QCOMPARE(messages.count(), 0);
    QCOMPARE(session.state(), ChatSession::State::Authenticating);
}

void TestChatSession::rejectedAuthReconnects()
{
    auto channel = new FakeChannel;
    SessionSettings settings = fastSettings();
    settings.backoffBaseMs = 10000;
    settings.backoffCapMs = 10000;
    ChatSession session(7, "127.0.0.1", 8000, "bad", settings, channel);
    QSignalSpy rejected(&session, &ChatSession::authenticationFailed);

    session.connectToServer();
    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);
    channel->deliver(authResponse("error", "Invalid token"));

    QCOMPARE(rejected.count(), 1);
    QCOMPARE(rejected.first().first().toString(), QString("Invalid token"));
    QCOMPARE(session.state(), ChatSession::State::Reconnecting);
    QCOMPARE(session.reconnectAttempts(), 1);
}

void TestChatSession::heartbeatFramesAreNotDelivered()
{
    auto channel = new FakeChannel;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);
    activate(session, channel);
    QSignalSpy messages(&session, &ChatSession::messageReceived);
    const int sentBefore = channel->sent().size();

    channel->deliver(QStringLiteral("pong"));
    QCOMPARE(channel->sent().size(), sentBefore);

    channel->deliver(QStringLiteral("ping"));
    QCOMPARE(channel->lastSent(), QString("pong"));

    QJsonObject ping;
    ping["type"] = QStringLiteral("ping");
    channel->deliver(ping);
    QCOMPARE(channel->sent().size(), sentBefore + 2);
    QCOMPARE(channel->lastSent(), QString("pong"));

    channel->deliver(QStringLiteral("{not json"));
    QCOMPARE(messages.count(), 0);
    QCOMPARE(session.state(), ChatSession::State::Active);
}

void TestChatSession::statusUpdatesAndMessagesAreDispatched()
{
    auto channel = new FakeChannel;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);
    activate(session, channel);
    QSignalSpy messages(&session, &ChatSession::messageReceived);
    QSignalSpy statuses(&session, &ChatSession::statusUpdated);

    QJsonObject status;
    status["type"] = QStringLiteral("user_status_update");
    status["user_id"] = 9;
    status["is_online"] = true;
    channel->deliver(status);

    QJsonObject message;
    message["type"] = QStringLiteral("message");
    message["sender_id"] = 9;
    message["content"] = QStringLiteral("hello");
    channel->deliver(message);

    QCOMPARE(statuses.count(), 1);
    QCOMPARE(messages.count(), 1);
    const QJsonObject received = messages.first().first().toJsonObject();
    QCOMPARE(received.value("content").toString(), QString("hello"));
    QVERIFY(session.lastActivity().isValid());
}

void TestChatSession::sendFailsFastWhenNotActive()
{
    auto channel = new FakeChannel;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);

    QJsonObject message;
    message["type"] = QStringLiteral("message");
    QVERIFY(!session.sendMessage(message));
    QVERIFY(channel->sent().isEmpty());

    session.connectToServer();
    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);
    QVERIFY(!session.sendMessage(message));
    QCOMPARE(channel->sent().size(), 1);
}

void TestChatSession::sendFailureStartsReconnect()
{
    auto channel = new FakeChannel;
    SessionSettings settings = fastSettings();
    settings.backoffBaseMs = 10000;
    settings.backoffCapMs = 10000;
    ChatSession session(7, "127.0.0.1", 8000, "secret", settings, channel);
    activate(session, channel);

    QJsonObject message;
    message["type"] = QStringLiteral("message");
    message["recipient_id"] = 9;
    QVERIFY(session.sendMessage(message));
    QCOMPARE(QJsonDocument::fromJson(channel->lastSent().toUtf8()).object().value("recipient_id").toInt(), 9);

    channel->sendOk = false;
    QVERIFY(!session.sendMessage(message));
    QCOMPARE(session.state(), ChatSession::State::Reconnecting);
    QCOMPARE(session.reconnectAttempts(), 1);
}

void TestChatSession::quietConnectionIsPinged()
{
    auto channel = new FakeChannel;
    SessionSettings settings = fastSettings();
    settings.readTimeoutMs = 50;
    ChatSession session(7, "127.0.0.1", 8000, "secret", settings, channel);
    activate(session, channel);

    QTRY_COMPARE(channel->lastSent(), QString("ping"));
    QCOMPARE(session.state(), ChatSession::State::Active);
}

void TestChatSession::failedPingStartsReconnect()
{
    auto channel = new FakeChannel;
    SessionSettings settings = fastSettings();
    settings.readTimeoutMs = 50;
    settings.backoffBaseMs = 10000;
    settings.backoffCapMs = 10000;
    ChatSession session(7, "127.0.0.1", 8000, "secret", settings, channel);
    QSignalSpy connection(&session, &ChatSession::connectionChanged);
    activate(session, channel);

    channel->sendOk = false;
    QTRY_COMPARE(session.state(), ChatSession::State::Reconnecting);
    QCOMPARE(session.reconnectAttempts(), 1);
    QCOMPARE(connection.count(), 2);
    QCOMPARE(connection.last().first().toBool(), false);
}

void TestChatSession::successfulReconnectResetsAttempts()
{
    auto channel = new FakeChannel;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);

    session.connectToServer();
    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);
    channel->deliver(authResponse("error", "busy"));
    QCOMPARE(session.reconnectAttempts(), 1);

    QTRY_COMPARE(session.state(), ChatSession::State::Authenticating);
    QCOMPARE(channel->openCount, 2);
    channel->deliver(authResponse("success"));
    QCOMPARE(session.state(), ChatSession::State::Active);
    QCOMPARE(session.reconnectAttempts(), 0);
}

void TestChatSession::reconnectAttemptsAreBounded()
{
    auto channel = new FakeChannel(FakeChannel::Mode::FailOpen);
    FakePresence presence;
    SessionSettings settings = fastSettings();
    settings.maxReconnectAttempts = 3;
    ChatSession session(7, "127.0.0.1", 8000, "secret", settings, channel, &presence);
    QSignalSpy exhausted(&session, &ChatSession::reconnectAttemptsExhausted);
    QSignalSpy ended(&session, &ChatSession::sessionEnded);
    int callsWhenEnded = -1;
    connect(&session, &ChatSession::sessionEnded, this, [&]() { callsWhenEnded = presence.calls; });

    session.connectToServer();
    QTRY_COMPARE(exhausted.count(), 1);
    QCOMPARE(session.state(), ChatSession::State::Disconnected);
    QCOMPARE(channel->openCount, 3);
    QCOMPARE(presence.calls, 1);
    // The owner learns about the end only after the offline call went out.
    QCOMPARE(ended.count(), 1);
    QCOMPARE(callsWhenEnded, 1);
    QCOMPARE(ended.first().at(0).toBool(), true);
    QCOMPARE(ended.first().at(1).toBool(), true);
    QCOMPARE(presence.lastUserId, qint64(7));
    QCOMPARE(presence.lastPort, quint16(8000));

    QTest::qWait(200);
    QCOMPARE(channel->openCount, 3);
}

void TestChatSession::handshakeTimeoutCountsAsFailure()
{
    auto channel = new FakeChannel(FakeChannel::Mode::Silent);
    SessionSettings settings = fastSettings();
    settings.connectTimeoutMs = 50;
    settings.maxReconnectAttempts = 1;
    ChatSession session(7, "127.0.0.1", 8000, "secret", settings, channel);
    QSignalSpy exhausted(&session, &ChatSession::reconnectAttemptsExhausted);

    session.connectToServer();
    QCOMPARE(session.state(), ChatSession::State::Connecting);
    QTRY_COMPARE(exhausted.count(), 1);
    QCOMPARE(session.state(), ChatSession::State::Disconnected);
}

void TestChatSession::disconnectWhileReconnectingStopsRetrying()
{
    auto channel = new FakeChannel(FakeChannel::Mode::FailOpen);
    FakePresence presence;
    SessionSettings settings = fastSettings();
    settings.backoffBaseMs = 200;
    settings.backoffCapMs = 200;
    ChatSession session(7, "127.0.0.1", 8000, "secret", settings, channel, &presence);
    QSignalSpy ended(&session, &ChatSession::sessionEnded);

    session.connectToServer();
    QTRY_COMPARE(session.state(), ChatSession::State::Reconnecting);
    session.disconnectFromServer();
    QCOMPARE(session.state(), ChatSession::State::Disconnected);
    QCOMPARE(ended.count(), 1);
    QCOMPARE(ended.first().at(0).toBool(), false);
    QCOMPARE(ended.first().at(1).toBool(), false);

    QTest::qWait(400);
    QCOMPARE(channel->openCount, 1);
    QCOMPARE(session.state(), ChatSession::State::Disconnected);
    QCOMPARE(presence.calls, 0);
}

void TestChatSession::disconnectFromActiveMarksOffline()
{
    auto channel = new FakeChannel;
    FakePresence presence;
    ChatSession session(7, "127.0.0.1", 8000, "secret", fastSettings(), channel, &presence);
    activate(session, channel);
    QSignalSpy connection(&session, &ChatSession::connectionChanged);

    session.disconnectFromServer();
    QCOMPARE(session.state(), ChatSession::State::Disconnected);
    QCOMPARE(connection.count(), 1);
    QCOMPARE(connection.first().first().toBool(), false);
    QCOMPARE(presence.calls, 1);
    QCOMPARE(presence.lastHost, QString("127.0.0.1"));
    QCOMPARE(session.reconnectAttempts(), 0);

    QTest::qWait(100);
    QCOMPARE(channel->openCount, 1);
}

void TestChatSession::connectFromAnotherThread()
{
    auto channel = new FakeChannel;
    auto session = new ChatSession(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);
    QThread worker;
    session->moveToThread(&worker);
    connect(&worker, &QThread::finished, session, &QObject::deleteLater);
    worker.start();

    session->connectToServer();
    QTRY_COMPARE(session->state(), ChatSession::State::Authenticating);

    QMetaObject::invokeMethod(channel, [channel]() {
        channel->deliver(authResponse("success"));
    }, Qt::QueuedConnection);
    QTRY_COMPARE(session->state(), ChatSession::State::Active);

    QJsonObject message;
    message["type"] = QStringLiteral("message");
    message["content"] = QStringLiteral("from main");
    QVERIFY(session->sendMessage(message));
    QTRY_COMPARE(channel->sent().size(), 2);
    QVERIFY(session->lastActivity().isValid());
    QVERIFY(session->lastActivity() <= QDateTime::currentDateTime());

    session->disconnectFromServer();
    QTRY_COMPARE(session->state(), ChatSession::State::Disconnected);

    worker.quit();
    QVERIFY(worker.wait(2000));
}

void TestChatSession::failureAfterCrossThreadDisconnectClosesChannel()
{
    auto channel = new FakeChannel;
    auto session = new ChatSession(7, "127.0.0.1", 8000, "secret", fastSettings(), channel);
    QThread worker;
    session->moveToThread(&worker);
    worker.start();

    session->connectToServer();
    QTRY_COMPARE(session->state(), ChatSession::State::Authenticating);
    QMetaObject::invokeMethod(channel, [channel]() {
        channel->deliver(authResponse("success"));
    }, Qt::QueuedConnection);
    QTRY_COMPARE(session->state(), ChatSession::State::Active);

    // Hold the worker so the error is handled after the running flag is cleared.
    QSemaphore entered;
    QSemaphore gate;
    QMetaObject::invokeMethod(session, [&]() {
        entered.release();
        gate.acquire();
    }, Qt::QueuedConnection);
    entered.acquire();

    QMetaObject::invokeMethod(channel, [channel]() {
        channel->fail(QStringLiteral("Remote host closed"));
    }, Qt::QueuedConnection);
    session->disconnectFromServer();
    gate.release();

    QTRY_COMPARE(session->state(), ChatSession::State::Disconnected);
    worker.quit();
    QVERIFY(worker.wait(2000));

    QVERIFY(channel->closeCount >= 1);
    QVERIFY(!channel->isConnected());
    QCOMPARE(channel->openCount, 1);
    delete session;
}

void TestChatSession::backoffDelay_data()
{
    QTest::addColumn<int>("attempt");
    QTest::addColumn<int>("expected");

    QTest::newRow("first") << 1 << 2000;
    QTest::newRow("second") << 2 << 4000;
    QTest::newRow("fifth hits cap") << 5 << 10000;
    QTest::newRow("beyond cap") << 9 << 10000;
    QTest::newRow("zero treated as first") << 0 << 2000;
}

void TestChatSession::backoffDelay()
{
    QFETCH(int, attempt);
    QFETCH(int, expected);
    QCOMPARE(ChatSession::backoffDelay(attempt, 2000, 10000), expected);
}

QTEST_GUILESS_MAIN(TestChatSession)
#include "tst_chatsession.moc"
