#include <QSignalSpy>
#include <QTest>

#include "device_store.h"
#include "fakes.h"
#include "poll_fetcher.h"

using namespace homesync;
using homesync::testing::ScriptedSnapshotSource;
using homesync::testing::makeDevice;

namespace {

PollPolicy fastPolicy()
{
    PollPolicy policy;
    policy.shortIntervalMs = 40;
    policy.longIntervalMs = 400;
    return policy;
}

QJsonObject state(const QString &value)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("state"), value);
    return obj;
}

} // namespace

class PollFetcherTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void tickDecision_data();
    void tickDecision();
    void startFetchesImmediately();
    void pendingWriteSkipsTick();
    void forceFetchBypassesPendingGate();
    void inFlightFetchSkipsTick();
    void forceWhileInFlightIsQueued();
    void failureKeepsStateAndReports();
    void stopIgnoresLateReply();
    void intervalFollowsPushState();
    void timerKeepsPolling();
};

void PollFetcherTest::initTestCase()
{
    qRegisterMetaType<homesync::PollState>();
    qRegisterMetaType<homesync::PollOutcome>();
    qRegisterMetaType<homesync::SyncError>();
}

void PollFetcherTest::tickDecision_data()
{
    QTest::addColumn<PollState>("state");
    QTest::addColumn<bool>("pending");
    QTest::addColumn<bool>("forced");
    QTest::addColumn<PollOutcome>("expected");

    QTest::newRow("idle") << PollState::Idle << false << false << PollOutcome::Fetched;
    QTest::newRow("idle pending") << PollState::Idle << true << false << PollOutcome::SkippedPendingWrites;
    QTest::newRow("idle pending forced") << PollState::Idle << true << true << PollOutcome::Fetched;
    QTest::newRow("fetching") << PollState::Fetching << false << false << PollOutcome::SkippedInFlight;
    QTest::newRow("fetching forced") << PollState::Fetching << true << true << PollOutcome::SkippedInFlight;
    QTest::newRow("stopped") << PollState::Stopped << false << false << PollOutcome::SkippedStopped;
    QTest::newRow("stopped forced") << PollState::Stopped << false << true << PollOutcome::SkippedStopped;
}

void PollFetcherTest::tickDecision()
{
    QFETCH(PollState, state);
    QFETCH(bool, pending);
    QFETCH(bool, forced);
    QFETCH(PollOutcome, expected);

    QCOMPARE(evaluatePollTick(state, pending, forced), expected);
}

void PollFetcherTest::startFetchesImmediately()
{
    DeviceStore store;
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    QSignalSpy completed(&poller, &PollFetcher::fetchCompleted);

    poller.start();
    QCOMPARE(source.fetchCount, 1);
    QCOMPARE(poller.state(), PollState::Fetching);

    source.succeedNext({makeDevice(QStringLiteral("lamp")), makeDevice(QStringLiteral("plug"))});
    QCOMPARE(poller.state(), PollState::Idle);
    QCOMPARE(store.size(), 2);
    QCOMPARE(completed.count(), 1);
    QVERIFY(poller.lastSuccess().isValid());
}

void PollFetcherTest::pendingWriteSkipsTick()
{
    DeviceStore store;
    store.applyFullSnapshot({makeDevice(QStringLiteral("lamp"), state(QStringLiteral("OFF")))});
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    poller.start(false);

    const DeviceStore::WriteToken token = store.beginPendingWrite(QStringLiteral("lamp"));
    QSignalSpy ticks(&poller, &PollFetcher::tickEvaluated);
    const quint64 revision = store.revision();

    poller.requestFetch();
    QCOMPARE(ticks.count(), 1);
    QCOMPARE(ticks.at(0).at(0).value<PollOutcome>(), PollOutcome::SkippedPendingWrites);
    QCOMPARE(source.fetchCount, 0);
    QCOMPARE(store.revision(), revision);

    // Timer ticks are gated the same way.
    QTRY_VERIFY(ticks.count() >= 3);
    QCOMPARE(source.fetchCount, 0);

    store.endPendingWrite(QStringLiteral("lamp"), token);
    QTRY_COMPARE(source.fetchCount, 1);
}

void PollFetcherTest::forceFetchBypassesPendingGate()
{
    DeviceStore store;
    store.applyFullSnapshot({makeDevice(QStringLiteral("lamp"), state(QStringLiteral("OFF"))),
                             makeDevice(QStringLiteral("plug"), state(QStringLiteral("OFF")))});
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    poller.start(false);

    const DeviceStore::WriteToken token = store.beginPendingWrite(QStringLiteral("lamp"));
    store.applyOptimistic(QStringLiteral("lamp"), state(QStringLiteral("ON")), token);

    QSignalSpy ticks(&poller, &PollFetcher::tickEvaluated);
    poller.forceFetch();
    QCOMPARE(ticks.at(0).at(0).value<PollOutcome>(), PollOutcome::Fetched);
    QCOMPARE(ticks.at(0).at(1).toBool(), true);
    QCOMPARE(source.fetchCount, 1);

    source.succeedNext({makeDevice(QStringLiteral("lamp"), state(QStringLiteral("OFF"))),
                        makeDevice(QStringLiteral("plug"), state(QStringLiteral("ON")))});

    // The in-flight optimistic value survives, the rest is refreshed.
    QCOMPARE(store.device(QStringLiteral("lamp"))->properties.value(QStringLiteral("state")).toString(),
             QStringLiteral("ON"));
    QCOMPARE(store.device(QStringLiteral("plug"))->properties.value(QStringLiteral("state")).toString(),
             QStringLiteral("ON"));
}

void PollFetcherTest::inFlightFetchSkipsTick()
{
    DeviceStore store;
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    poller.start();
    QCOMPARE(source.fetchCount, 1);

    QSignalSpy ticks(&poller, &PollFetcher::tickEvaluated);
    poller.requestFetch();
    QCOMPARE(ticks.at(0).at(0).value<PollOutcome>(), PollOutcome::SkippedInFlight);
    QCOMPARE(source.fetchCount, 1);
}

void PollFetcherTest::forceWhileInFlightIsQueued()
{
    DeviceStore store;
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    poller.start();

    poller.forceFetch();
    QCOMPARE(source.fetchCount, 1);

    source.succeedNext({makeDevice(QStringLiteral("lamp"))});
    QCOMPARE(source.fetchCount, 2);
    QCOMPARE(poller.state(), PollState::Fetching);
}

void PollFetcherTest::failureKeepsStateAndReports()
{
    DeviceStore store;
    store.applyFullSnapshot({makeDevice(QStringLiteral("lamp"), state(QStringLiteral("ON")))});
    const DeviceStore::Snapshot before = store.snapshot();

    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    QSignalSpy errors(&poller, &PollFetcher::syncError);
    QSignalSpy completed(&poller, &PollFetcher::fetchCompleted);

    poller.start();
    source.failNext(QStringLiteral("HTTP 502"));

    QCOMPARE(poller.state(), PollState::Idle);
    QCOMPARE(store.snapshot().get(), before.get());
    QCOMPARE(errors.count(), 1);
    const SyncError error = errors.at(0).at(0).value<SyncError>();
    QCOMPARE(error.kind, SyncError::Kind::Fetch);
    QCOMPARE(error.message, QStringLiteral("HTTP 502"));
    QCOMPARE(completed.at(0).at(0).toBool(), false);

    // Retried on the next tick, no separate backoff.
    QTRY_COMPARE(source.fetchCount, 2);
}

void PollFetcherTest::stopIgnoresLateReply()
{
    DeviceStore store;
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    QSignalSpy completed(&poller, &PollFetcher::fetchCompleted);

    poller.start();
    poller.stop();
    QCOMPARE(poller.state(), PollState::Stopped);

    source.succeedNext({makeDevice(QStringLiteral("lamp"))});
    QCOMPARE(store.size(), 0);
    QCOMPARE(completed.count(), 0);

    QTest::qWait(100);
    QCOMPARE(source.fetchCount, 1);
}

void PollFetcherTest::intervalFollowsPushState()
{
    DeviceStore store;
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());

    QCOMPARE(poller.interval(), 40);
    poller.setPushState(ConnectionState::Connected);
    QCOMPARE(poller.interval(), 400);
    poller.setPushState(ConnectionState::Reconnecting);
    QCOMPARE(poller.interval(), 40);
    QCOMPARE(pollIntervalFor(ConnectionState::Failed, PollPolicy()), 10000);
    QCOMPARE(pollIntervalFor(ConnectionState::Connected, PollPolicy()), 30000);
}

void PollFetcherTest::timerKeepsPolling()
{
    DeviceStore store;
    ScriptedSnapshotSource source;
    PollFetcher poller(&store, &source, fastPolicy());
    poller.start(false);

    QTRY_COMPARE(source.fetchCount, 1);
    source.succeedNext({});
    QTRY_COMPARE(source.fetchCount, 2);
}

QTEST_GUILESS_MAIN(PollFetcherTest)

#include "tst_poll_fetcher.moc"
