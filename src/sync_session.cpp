#include "sync_session.h"

#include "gateway_client.h"
#include "push_transport.h"
#include "sync_log.h"

namespace homesync {

SyncSession::SyncSession(const SessionConfig &config,
                         PushTransport *transport,
                         SnapshotSource *source,
                         WriteSink *sink,
                         QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_source(source)
    , m_sink(sink)
    , m_push(transport, config.reconnect)
    , m_poll(&m_store, source, config.poll)
    , m_writer(&m_store, sink, config.write)
{
    m_store.setUnknownPatchBuffering(config.bufferUnknownPatches, config.maxBufferedPatches);
    m_push.setUrl(config.gateway.pushUrl());

    connect(&m_push, &PushChannelManager::patchReceived, &m_store,
            [this](const Patch &patch) { m_store.applyPatch(patch); });
    connect(&m_push, &PushChannelManager::stateChanged,
            this, &SyncSession::onPushStateChanged);
    connect(&m_writer, &WriteCoordinator::resyncRequested,
            this, &SyncSession::onResyncRequested);

    connect(&m_push, &PushChannelManager::syncError, this, &SyncSession::onComponentError);
    connect(&m_poll, &PollFetcher::syncError, this, &SyncSession::onComponentError);
    connect(&m_writer, &WriteCoordinator::syncError, this, &SyncSession::onComponentError);
}

SyncSession::~SyncSession()
{
    shutdown();
}

void SyncSession::start()
{
    if (m_running || m_shutdown)
        return;
    m_running = true;
    qCInfo(sessionLog) << "starting session for" << m_config.gateway.baseUrl().toString();
    m_poll.setPushState(m_push.state());
    m_poll.start(true);
    m_push.connectChannel();
}

void SyncSession::resumeConnectivity()
{
    if (!m_running)
        return;
    qCInfo(sessionLog) << "connectivity resumed, restarting push channel and resyncing";
    m_push.restart();
    m_poll.forceFetch();
}

void SyncSession::requestPropertyChange(const QString &deviceId, const QString &property, const QJsonValue &value)
{
    if (m_shutdown)
        return;
    m_writer.requestPropertyChange(deviceId, property, value);
}

void SyncSession::requestPropertyChanges(const QString &deviceId, const QJsonObject &properties)
{
    if (m_shutdown)
        return;
    m_writer.requestPropertyChanges(deviceId, properties);
}

void SyncSession::shutdown()
{
    if (m_shutdown)
        return;
    m_shutdown = true;
    m_running = false;

    m_writer.shutdown();
    m_poll.stop();
    m_push.disconnectChannel();
    if (m_source)
        m_source->cancelAll();
    if (m_sink)
        m_sink->cancelAll();
    m_store.clear();
    qCInfo(sessionLog) << "session shut down";
}

void SyncSession::onPushStateChanged(ConnectionState state)
{
    m_poll.setPushState(state);
    emit connectionStateChanged(state);

    // Catch up on whatever the channel missed while it was down.
    if (state == ConnectionState::Connected && m_running)
        m_poll.requestFetch();
}

void SyncSession::onResyncRequested(const QString &deviceId)
{
    if (!m_running)
        return;
    m_poll.forceFetch();
    if (m_sink && !deviceId.isEmpty())
        m_sink->requestRefresh(deviceId);
}

void SyncSession::onComponentError(const SyncError &error)
{
    emit syncError(error);
}

} // namespace homesync
