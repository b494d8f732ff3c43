#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QTimer>

#include "device_store.h"
#include "sync_config.h"
#include "sync_types.h"

namespace homesync {

class SnapshotSource;
struct FetchResult;

enum class PollState {
    Stopped,
    Idle,
    // A snapshot request is in flight.
    Fetching
};

enum class PollOutcome {
    Fetched,
    SkippedPendingWrites,
    SkippedInFlight,
    SkippedStopped
};

QString pollStateName(PollState state);
QString pollOutcomeName(PollOutcome outcome);

// Decision for one tick. A forced tick bypasses only the pending-write gate.
PollOutcome evaluatePollTick(PollState state, bool hasPendingWrites, bool forced);

// Long interval while push is Connected, short otherwise.
int pollIntervalFor(ConnectionState pushState, const PollPolicy &policy);

class PollFetcher : public QObject
{
    Q_OBJECT
public:
    PollFetcher(DeviceStore *store, SnapshotSource *source, const PollPolicy &policy, QObject *parent = nullptr);
    ~PollFetcher() override;

    PollState state() const { return m_state; }
    int interval() const { return m_timer.interval(); }
    bool isActive() const { return m_state != PollState::Stopped; }
    QDateTime lastSuccess() const { return m_lastSuccess; }

public slots:
    // Arms the repeating timer. With fetchNow the first tick runs at once.
    void start(bool fetchNow = true);
    // Cancels the timer; a reply that arrives later is ignored.
    void stop();
    void setPushState(homesync::ConnectionState state);
    // Out-of-band resync. Bypasses the pending-write gate; while a fetch is
    // in flight another one is queued behind it.
    void forceFetch();
    // Runs a tick now, subject to the usual gates.
    void requestFetch();

signals:
    void stateChanged(homesync::PollState state);
    void tickEvaluated(homesync::PollOutcome outcome, bool forced);
    void fetchCompleted(bool ok, int deviceCount);
    void syncError(const homesync::SyncError &error);

private slots:
    void onTimeout();

private:
    void tick(bool forced);
    void issueFetch();
    void onFetchFinished(const FetchResult &result);
    void setState(PollState state);

    QPointer<DeviceStore> m_store;
    SnapshotSource *m_source = nullptr;
    PollPolicy m_policy;
    QTimer m_timer;
    PollState m_state = PollState::Stopped;
    ConnectionState m_pushState = ConnectionState::Disconnected;
    DeviceStore::SnapshotTicket m_ticket;
    quint64 m_generation = 0;
    bool m_forceQueued = false;
    QDateTime m_lastSuccess;
};

} // namespace homesync

Q_DECLARE_METATYPE(homesync::PollState)
Q_DECLARE_METATYPE(homesync::PollOutcome)
