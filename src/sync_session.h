#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QObject>

#include "device_store.h"
#include "poll_fetcher.h"
#include "push_channel.h"
#include "sync_config.h"
#include "sync_types.h"
#include "write_coordinator.h"

namespace homesync {

class PushTransport;
class SnapshotSource;
class WriteSink;

// One replica-sync session. Collaborators are injected and not owned; they
// must outlive the session.
class SyncSession : public QObject
{
    Q_OBJECT
public:
    SyncSession(const SessionConfig &config,
                PushTransport *transport,
                SnapshotSource *source,
                WriteSink *sink,
                QObject *parent = nullptr);
    ~SyncSession() override;

    const SessionConfig &config() const { return m_config; }
    DeviceStore *store() { return &m_store; }
    PushChannelManager *push() { return &m_push; }
    PollFetcher *poller() { return &m_poll; }
    WriteCoordinator *writer() { return &m_writer; }
    bool isRunning() const { return m_running; }

public slots:
    void start();
    // Host detected resumed connectivity (network back, app foregrounded).
    void resumeConnectivity();
    void requestPropertyChange(const QString &deviceId, const QString &property, const QJsonValue &value);
    void requestPropertyChanges(const QString &deviceId, const QJsonObject &properties);
    // Cancels every timer and request and empties the store; nothing fires
    // afterwards. Idempotent.
    void shutdown();

signals:
    void connectionStateChanged(homesync::ConnectionState state);
    void syncError(const homesync::SyncError &error);

private slots:
    void onPushStateChanged(homesync::ConnectionState state);
    void onResyncRequested(const QString &deviceId);
    void onComponentError(const homesync::SyncError &error);

private:
    SessionConfig m_config;
    SnapshotSource *m_source = nullptr;
    WriteSink *m_sink = nullptr;
    // Declared first so it outlives the components that reference it.
    DeviceStore m_store;
    PushChannelManager m_push;
    PollFetcher m_poll;
    WriteCoordinator m_writer;
    bool m_running = false;
    bool m_shutdown = false;
};

} // namespace homesync
