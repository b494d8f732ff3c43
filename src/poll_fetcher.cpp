#include "poll_fetcher.h"

#include "gateway_client.h"
#include "sync_log.h"

namespace homesync {

QString pollStateName(PollState state)
{
    switch (state) {
    case PollState::Stopped:
        return QStringLiteral("Stopped");
    case PollState::Idle:
        return QStringLiteral("Idle");
    case PollState::Fetching:
        return QStringLiteral("Fetching");
    }
    return QStringLiteral("Unknown");
}

QString pollOutcomeName(PollOutcome outcome)
{
    switch (outcome) {
    case PollOutcome::Fetched:
        return QStringLiteral("Fetched");
    case PollOutcome::SkippedPendingWrites:
        return QStringLiteral("SkippedPendingWrites");
    case PollOutcome::SkippedInFlight:
        return QStringLiteral("SkippedInFlight");
    case PollOutcome::SkippedStopped:
        return QStringLiteral("SkippedStopped");
    }
    return QStringLiteral("Unknown");
}

PollOutcome evaluatePollTick(PollState state, bool hasPendingWrites, bool forced)
{
    if (state == PollState::Stopped)
        return PollOutcome::SkippedStopped;
    if (state == PollState::Fetching)
        return PollOutcome::SkippedInFlight;
    if (hasPendingWrites && !forced)
        return PollOutcome::SkippedPendingWrites;
    return PollOutcome::Fetched;
}

int pollIntervalFor(ConnectionState pushState, const PollPolicy &policy)
{
    return pushState == ConnectionState::Connected ? policy.longIntervalMs : policy.shortIntervalMs;
}

PollFetcher::PollFetcher(DeviceStore *store, SnapshotSource *source, const PollPolicy &policy, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_source(source)
    , m_policy(policy)
{
    m_timer.setSingleShot(false);
    m_timer.setInterval(pollIntervalFor(m_pushState, m_policy));
    connect(&m_timer, &QTimer::timeout, this, &PollFetcher::onTimeout);
}

PollFetcher::~PollFetcher()
{
    stop();
}

void PollFetcher::start(bool fetchNow)
{
    if (m_state != PollState::Stopped)
        return;
    setState(PollState::Idle);
    m_timer.start(pollIntervalFor(m_pushState, m_policy));
    qCInfo(pollLog) << "polling every" << m_timer.interval() << "ms";
    if (fetchNow)
        tick(false);
}

void PollFetcher::stop()
{
    m_timer.stop();
    ++m_generation;
    m_forceQueued = false;
    if (m_ticket.isValid() && m_store)
        m_store->cancelSnapshot(m_ticket);
    m_ticket = {};
    if (m_state != PollState::Stopped)
        qCInfo(pollLog) << "polling stopped";
    setState(PollState::Stopped);
}

void PollFetcher::setPushState(ConnectionState state)
{
    m_pushState = state;
    const int interval = pollIntervalFor(state, m_policy);
    if (interval == m_timer.interval())
        return;

    qCInfo(pollLog) << "push" << connectionStateName(state) << "- poll interval now" << interval << "ms";
    if (m_timer.isActive())
        m_timer.start(interval);
    else
        m_timer.setInterval(interval);
}

void PollFetcher::forceFetch()
{
    if (m_state == PollState::Fetching) {
        m_forceQueued = true;
        emit tickEvaluated(PollOutcome::SkippedInFlight, true);
        return;
    }
    tick(true);
}

void PollFetcher::requestFetch()
{
    tick(false);
}

void PollFetcher::onTimeout()
{
    tick(false);
}

void PollFetcher::tick(bool forced)
{
    const bool pending = m_store && m_store->hasPendingWrites();
    const PollOutcome outcome = evaluatePollTick(m_state, pending, forced);
    if (outcome != PollOutcome::Fetched)
        qCDebug(pollLog) << "poll tick skipped:" << pollOutcomeName(outcome);
    emit tickEvaluated(outcome, forced);
    if (outcome == PollOutcome::Fetched)
        issueFetch();
}

void PollFetcher::issueFetch()
{
    if (!m_source || !m_store) {
        SyncError error;
        error.kind = SyncError::Kind::Fetch;
        error.message = QStringLiteral("No snapshot source configured");
        emit syncError(error);
        return;
    }

    m_ticket = m_store->beginSnapshot();
    setState(PollState::Fetching);

    const quint64 generation = m_generation;
    QPointer<PollFetcher> self(this);
    m_source->fetchDevices([self, generation](const FetchResult &result) {
        if (!self || self->m_generation != generation)
            return;
        self->onFetchFinished(result);
    });
}

void PollFetcher::onFetchFinished(const FetchResult &result)
{
    const DeviceStore::SnapshotTicket ticket = m_ticket;
    m_ticket = {};
    setState(PollState::Idle);

    if (!m_store)
        return;
    if (result.ok) {
        m_store->applyFullSnapshot(result.devices, ticket);
        m_lastSuccess = QDateTime::currentDateTimeUtc();
        emit fetchCompleted(true, result.devices.size());
    } else {
        m_store->cancelSnapshot(ticket);
        qCWarning(pollLog) << "snapshot fetch failed:" << result.error;
        SyncError error;
        error.kind = SyncError::Kind::Fetch;
        error.message = result.error;
        emit syncError(error);
        emit fetchCompleted(false, 0);
    }

    if (m_forceQueued && m_state == PollState::Idle) {
        m_forceQueued = false;
        tick(true);
    }
}

void PollFetcher::setState(PollState state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(state);
}

} // namespace homesync
