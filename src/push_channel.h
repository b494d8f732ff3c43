#pragma once

#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QUrl>

#include "push_transport.h"
#include "sync_config.h"
#include "sync_types.h"

namespace homesync {

// Owns the lifecycle of the push channel: connection timeout, automatic
// reconnect with exponential backoff, long fixed retry after too many
// consecutive failures, and answering server pings. Failures never escape
// as exceptions; they become state transitions plus syncError().
class PushChannelManager : public QObject
{
    Q_OBJECT
public:
    PushChannelManager(PushTransport *transport, const ReconnectPolicy &policy, QObject *parent = nullptr);
    ~PushChannelManager() override;

    void setUrl(const QUrl &url);
    QUrl url() const { return m_url; }

    ConnectionState state() const { return m_state; }
    // Consecutive failures since the last successful connect.
    int failureCount() const { return m_failures; }
    bool autoReconnectEnabled() const { return m_autoReconnect; }
    bool reconnectPending() const { return m_reconnectTimer.isActive(); }
    qint64 lastActivityMs() const { return m_lastActivityMs; }
    const ReconnectPolicy &policy() const { return m_policy; }

public slots:
    // No-op while Connecting or Connected. Re-enables auto reconnect after
    // disconnectChannel().
    void connectChannel();
    // Resets the failure counter and connects now unless already
    // Connecting or Connected.
    void restart();
    // Host-requested disconnect: cancels timers, drops the channel and
    // suppresses auto reconnect until connectChannel() is called again.
    void disconnectChannel();

signals:
    void stateChanged(homesync::ConnectionState state);
    void patchReceived(const homesync::Patch &patch);
    void pongReceived(qint64 timestampMs);
    void reconnectScheduled(int attempt, int delayMs);
    void syncError(const homesync::SyncError &error);

private slots:
    void onTransportOpened();
    void onFrameReceived(const QByteArray &frame);
    void onTransportError(const QString &message);
    void onTransportClosed();
    void onConnectTimeout();
    void onReconnectTimeout();

private:
    bool isActive() const;
    void openTransport();
    void handleFailure(const QString &reason);
    void scheduleReconnect();
    void setState(ConnectionState state);
    void reportError(SyncError::Kind kind, const QString &message);

    QPointer<PushTransport> m_transport;
    ReconnectPolicy m_policy;
    QUrl m_url;
    QTimer m_connectTimer;
    QTimer m_reconnectTimer;
    ConnectionState m_state = ConnectionState::Disconnected;
    int m_failures = 0;
    bool m_autoReconnect = true;
    qint64 m_lastActivityMs = 0;
};

} // namespace homesync
