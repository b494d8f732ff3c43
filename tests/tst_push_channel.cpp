#include <QJsonDocument>
#include <QSignalSpy>
#include <QTest>

#include "fakes.h"
#include "push_channel.h"

using namespace homesync;
using homesync::testing::FakeTransport;

namespace {

const QUrl kUrl(QStringLiteral("ws://hub.local:8080/ws"));

ReconnectPolicy fastPolicy()
{
    ReconnectPolicy policy;
    policy.baseDelayMs = 20;
    policy.maxDelayMs = 80;
    policy.maxFastAttempts = 3;
    policy.longRetryIntervalMs = 400;
    policy.connectTimeoutMs = 60;
    return policy;
}

} // namespace

class PushChannelTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void firstMessageConnects();
    void connectIsNoOpWhileActive();
    void answersPingWithPong();
    void routesDeviceUpdates();
    void malformedFrameKeepsChannelUp();
    void unknownTypeIsIgnored();
    void closeSchedulesExactlyOneReconnect();
    void reconnectTimerReopens();
    void backoffSequenceThenLongInterval();
    void connectTimeoutCountsAsFailure();
    void successfulConnectResetsAttempts();
    void restartResetsAttemptsAndConnects();
    void disconnectSuppressesReconnect();
    void duplicateErrorAndCloseCountOnce();
    void missingUrlOnRetrySettlesDisconnected();
};

void PushChannelTest::initTestCase()
{
    qRegisterMetaType<homesync::ConnectionState>();
    qRegisterMetaType<homesync::Patch>();
    qRegisterMetaType<homesync::SyncError>();
}

void PushChannelTest::firstMessageConnects()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy states(&push, &PushChannelManager::stateChanged);

    push.connectChannel();
    QCOMPARE(push.state(), ConnectionState::Connecting);
    QCOMPARE(transport.openCount, 1);
    QCOMPARE(transport.lastUrl, kUrl);

    // An open socket alone is not enough.
    transport.simulateOpened();
    QCOMPARE(push.state(), ConnectionState::Connecting);

    transport.simulateFrame(R"({"type":"ping"})");
    QCOMPARE(push.state(), ConnectionState::Connected);
    QCOMPARE(states.count(), 2);
    QCOMPARE(states.at(1).at(0).value<ConnectionState>(), ConnectionState::Connected);
    QVERIFY(push.lastActivityMs() > 0);
}

void PushChannelTest::connectIsNoOpWhileActive()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);

    push.connectChannel();
    push.connectChannel();
    QCOMPARE(transport.openCount, 1);

    transport.simulateOpened();
    transport.simulateFrame(R"({"type":"ping"})");
    push.connectChannel();
    push.restart();
    QCOMPARE(transport.openCount, 1);
    QCOMPARE(push.state(), ConnectionState::Connected);
}

void PushChannelTest::answersPingWithPong()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    push.connectChannel();
    transport.simulateOpened();

    const qint64 before = QDateTime::currentMSecsSinceEpoch();
    transport.simulateFrame(R"({"type":"ping"})");

    QCOMPARE(transport.sentFrames.size(), 1);
    const QJsonObject pong = QJsonDocument::fromJson(transport.sentFrames.first()).object();
    QCOMPARE(pong.value(QStringLiteral("type")).toString(), QStringLiteral("pong"));
    QVERIFY(static_cast<qint64>(pong.value(QStringLiteral("timestamp")).toDouble()) >= before);

    // Pongs are recorded, never answered.
    QSignalSpy pongs(&push, &PushChannelManager::pongReceived);
    transport.simulateFrame(R"({"type":"pong","timestamp":1714566600000})");
    QCOMPARE(pongs.count(), 1);
    QCOMPARE(transport.sentFrames.size(), 1);
}

void PushChannelTest::routesDeviceUpdates()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy patches(&push, &PushChannelManager::patchReceived);

    push.connectChannel();
    transport.simulateOpened();
    transport.simulateFrame(R"({"type":"device_update","device_name":"lamp","state":{"state":"ON"}})");

    QCOMPARE(push.state(), ConnectionState::Connected);
    QCOMPARE(patches.count(), 1);
    const Patch patch = patches.at(0).at(0).value<Patch>();
    QCOMPARE(patch.deviceId, QStringLiteral("lamp"));
    QCOMPARE(patch.properties.value(QStringLiteral("state")).toString(), QStringLiteral("ON"));
}

void PushChannelTest::malformedFrameKeepsChannelUp()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy errors(&push, &PushChannelManager::syncError);

    push.connectChannel();
    transport.simulateOpened();
    transport.simulateFrame(R"({"type":"ping"})");
    transport.simulateFrame("{not json");

    QCOMPARE(push.state(), ConnectionState::Connected);
    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.at(0).at(0).value<SyncError>().kind, SyncError::Kind::Protocol);
    QCOMPARE(transport.abortCount, 0);
}

void PushChannelTest::unknownTypeIsIgnored()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy errors(&push, &PushChannelManager::syncError);
    QSignalSpy patches(&push, &PushChannelManager::patchReceived);

    push.connectChannel();
    transport.simulateFrame(R"({"type":"bridge_event","data":{}})");

    QCOMPARE(push.state(), ConnectionState::Connected);
    QCOMPARE(errors.count(), 0);
    QCOMPARE(patches.count(), 0);
}

void PushChannelTest::closeSchedulesExactlyOneReconnect()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    push.connectChannel();
    transport.simulateOpened();
    transport.simulateFrame(R"({"type":"ping"})");
    QCOMPARE(push.state(), ConnectionState::Connected);

    QSignalSpy states(&push, &PushChannelManager::stateChanged);
    QSignalSpy scheduled(&push, &PushChannelManager::reconnectScheduled);
    QSignalSpy errors(&push, &PushChannelManager::syncError);

    transport.simulateClosed();

    QCOMPARE(states.count(), 2);
    QCOMPARE(states.at(0).at(0).value<ConnectionState>(), ConnectionState::Disconnected);
    QCOMPARE(states.at(1).at(0).value<ConnectionState>(), ConnectionState::Reconnecting);
    QCOMPARE(scheduled.count(), 1);
    QCOMPARE(scheduled.at(0).at(0).toInt(), 1);
    QCOMPARE(scheduled.at(0).at(1).toInt(), 20);
    QVERIFY(push.reconnectPending());
    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.at(0).at(0).value<SyncError>().kind, SyncError::Kind::Transport);

    // Late signals from the dead channel do not arm a second timer.
    transport.simulateError();
    transport.simulateClosed();
    QCOMPARE(scheduled.count(), 1);
}

void PushChannelTest::reconnectTimerReopens()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    push.connectChannel();
    transport.simulateError();
    QCOMPARE(push.state(), ConnectionState::Reconnecting);

    QTRY_COMPARE(transport.openCount, 2);
    QCOMPARE(push.state(), ConnectionState::Connecting);
}

void PushChannelTest::backoffSequenceThenLongInterval()
{
    FakeTransport transport;
    PushChannelManager push(&transport, ReconnectPolicy());
    push.setUrl(kUrl);
    QSignalSpy scheduled(&push, &PushChannelManager::reconnectScheduled);

    // Each connectChannel() is an immediate attempt that fails at once.
    for (int i = 0; i < 7; ++i) {
        push.connectChannel();
        transport.simulateError();
    }

    QList<int> delays;
    for (const QList<QVariant> &args : std::as_const(scheduled))
        delays.append(args.at(1).toInt());
    QCOMPARE(delays, (QList<int>{2000, 4000, 8000, 16000, 30000, 120000, 120000}));
    QCOMPARE(push.state(), ConnectionState::Failed);
    QCOMPARE(push.failureCount(), 7);
}

void PushChannelTest::connectTimeoutCountsAsFailure()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy scheduled(&push, &PushChannelManager::reconnectScheduled);

    push.connectChannel();
    transport.simulateOpened();

    QTRY_VERIFY(scheduled.count() >= 1);
    QCOMPARE(scheduled.at(0).at(0).toInt(), 1);
    QCOMPARE(scheduled.at(0).at(1).toInt(), 20);
    QVERIFY(transport.abortCount >= 1);
}

void PushChannelTest::successfulConnectResetsAttempts()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);

    push.connectChannel();
    transport.simulateError();
    push.connectChannel();
    transport.simulateError();
    QCOMPARE(push.failureCount(), 2);

    push.connectChannel();
    transport.simulateFrame(R"({"type":"ping"})");
    QCOMPARE(push.failureCount(), 0);

    QSignalSpy scheduled(&push, &PushChannelManager::reconnectScheduled);
    transport.simulateClosed();
    QCOMPARE(scheduled.at(0).at(1).toInt(), 20);
}

void PushChannelTest::restartResetsAttemptsAndConnects()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);

    for (int i = 0; i < 4; ++i) {
        push.connectChannel();
        transport.simulateError();
    }
    QCOMPARE(push.state(), ConnectionState::Failed);
    const int opens = transport.openCount;

    push.restart();
    QCOMPARE(push.failureCount(), 0);
    QCOMPARE(push.state(), ConnectionState::Connecting);
    QCOMPARE(transport.openCount, opens + 1);
    QVERIFY(!push.reconnectPending());
}

void PushChannelTest::disconnectSuppressesReconnect()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    push.connectChannel();
    transport.simulateFrame(R"({"type":"ping"})");

    QSignalSpy scheduled(&push, &PushChannelManager::reconnectScheduled);
    push.disconnectChannel();
    push.disconnectChannel();
    QCOMPARE(push.state(), ConnectionState::Disconnected);
    QVERIFY(!push.autoReconnectEnabled());

    transport.simulateClosed();
    QTest::qWait(100);
    QCOMPARE(scheduled.count(), 0);
    QCOMPARE(transport.openCount, 1);

    push.connectChannel();
    QCOMPARE(transport.openCount, 2);
    QVERIFY(push.autoReconnectEnabled());
}

void PushChannelTest::duplicateErrorAndCloseCountOnce()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy errors(&push, &PushChannelManager::syncError);

    push.connectChannel();
    transport.simulateError(QStringLiteral("host unreachable"));
    transport.simulateClosed();

    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.at(0).at(0).value<SyncError>().message, QStringLiteral("host unreachable"));
    QCOMPARE(push.failureCount(), 1);
}

void PushChannelTest::missingUrlOnRetrySettlesDisconnected()
{
    FakeTransport transport;
    PushChannelManager push(&transport, fastPolicy());
    push.setUrl(kUrl);
    QSignalSpy errors(&push, &PushChannelManager::syncError);

    push.connectChannel();
    transport.simulateError();
    QCOMPARE(push.state(), ConnectionState::Reconnecting);
    QVERIFY(push.reconnectPending());

    push.setUrl(QUrl());
    QTRY_COMPARE(push.state(), ConnectionState::Disconnected);
    QVERIFY(!push.reconnectPending());
    QCOMPARE(transport.openCount, 1);
    QCOMPARE(errors.count(), 2);
    QCOMPARE(errors.at(1).at(0).value<SyncError>().message, QStringLiteral("Push URL is not set"));

    push.setUrl(kUrl);
    push.connectChannel();
    QCOMPARE(push.state(), ConnectionState::Connecting);
    QCOMPARE(transport.openCount, 2);
}

QTEST_GUILESS_MAIN(PushChannelTest)

#include "tst_push_channel.moc"
