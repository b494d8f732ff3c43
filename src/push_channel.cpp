#include "push_channel.h"

#include <QDateTime>

#include "message_codec.h"
#include "sync_log.h"

namespace homesync {

PushChannelManager::PushChannelManager(PushTransport *transport, const ReconnectPolicy &policy, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_policy(policy)
{
    m_connectTimer.setSingleShot(true);
    m_connectTimer.setInterval(m_policy.connectTimeoutMs);
    connect(&m_connectTimer, &QTimer::timeout,
            this, &PushChannelManager::onConnectTimeout);

    m_reconnectTimer.setSingleShot(true);
    connect(&m_reconnectTimer, &QTimer::timeout,
            this, &PushChannelManager::onReconnectTimeout);

    if (m_transport) {
        connect(m_transport, &PushTransport::opened,
                this, &PushChannelManager::onTransportOpened);
        connect(m_transport, &PushTransport::frameReceived,
                this, &PushChannelManager::onFrameReceived);
        connect(m_transport, &PushTransport::errorOccurred,
                this, &PushChannelManager::onTransportError);
        connect(m_transport, &PushTransport::closed,
                this, &PushChannelManager::onTransportClosed);
    }
}

PushChannelManager::~PushChannelManager()
{
    m_connectTimer.stop();
    m_reconnectTimer.stop();
    if (m_transport) {
        disconnect(m_transport, nullptr, this, nullptr);
        m_transport->abort();
    }
}

void PushChannelManager::setUrl(const QUrl &url)
{
    m_url = url;
}

void PushChannelManager::connectChannel()
{
    m_autoReconnect = true;
    if (isActive())
        return;
    m_reconnectTimer.stop();
    openTransport();
}

void PushChannelManager::restart()
{
    m_autoReconnect = true;
    m_failures = 0;
    if (isActive())
        return;
    qCInfo(pushLog) << "PushChannelManager::restart - reconnecting now";
    m_reconnectTimer.stop();
    openTransport();
}

void PushChannelManager::disconnectChannel()
{
    m_autoReconnect = false;
    m_connectTimer.stop();
    m_reconnectTimer.stop();
    if (m_transport)
        m_transport->abort();
    if (m_state != ConnectionState::Disconnected)
        qCInfo(pushLog) << "PushChannelManager::disconnectChannel - auto reconnect suppressed";
    setState(ConnectionState::Disconnected);
}

void PushChannelManager::onTransportOpened()
{
    // Stay in Connecting until the first frame parses.
    if (m_state == ConnectionState::Connecting)
        qCDebug(pushLog) << "push channel open, waiting for first message";
}

void PushChannelManager::onFrameReceived(const QByteArray &frame)
{
    if (!isActive())
        return;

    m_lastActivityMs = QDateTime::currentMSecsSinceEpoch();

    InboundMessage msg;
    QString error;
    if (!decodeFrame(frame, &msg, &error)) {
        QString snippet = QString::fromUtf8(frame.left(256));
        if (frame.size() > 256)
            snippet.append(QStringLiteral(" ..."));
        qCWarning(codecLog).noquote() << "dropping malformed push frame:" << error << "payload:" << snippet;
        reportError(SyncError::Kind::Protocol, error);
        return;
    }

    if (m_state == ConnectionState::Connecting) {
        m_connectTimer.stop();
        m_failures = 0;
        setState(ConnectionState::Connected);
    }

    switch (msg.type) {
    case MessageType::DeviceUpdate:
        emit patchReceived(msg.patch);
        break;
    case MessageType::Ping:
        if (!m_transport || !m_transport->sendFrame(encodePong(QDateTime::currentMSecsSinceEpoch())))
            qCWarning(pushLog) << "failed to answer ping";
        break;
    case MessageType::Pong:
        emit pongReceived(msg.pongTimestampMs);
        break;
    case MessageType::Unknown:
        qCDebug(codecLog) << "ignoring push frame of type" << msg.typeName;
        break;
    }
}

void PushChannelManager::onTransportError(const QString &message)
{
    if (!isActive())
        return;
    handleFailure(message.isEmpty() ? QStringLiteral("Transport error") : message);
}

void PushChannelManager::onTransportClosed()
{
    if (!isActive())
        return;
    handleFailure(QStringLiteral("Push channel closed by peer"));
}

void PushChannelManager::onConnectTimeout()
{
    if (m_state != ConnectionState::Connecting)
        return;
    handleFailure(QStringLiteral("No message within %1 ms of connecting").arg(m_policy.connectTimeoutMs));
}

void PushChannelManager::onReconnectTimeout()
{
    if (!m_autoReconnect || isActive())
        return;
    qCInfo(pushLog) << "reconnect attempt" << m_failures << "to" << m_url.toString();
    openTransport();
}

bool PushChannelManager::isActive() const
{
    return m_state == ConnectionState::Connecting || m_state == ConnectionState::Connected;
}

void PushChannelManager::openTransport()
{
    // Neither case is fixed by retrying; a later connectChannel() starts over.
    if (!m_transport) {
        reportError(SyncError::Kind::Transport, QStringLiteral("No push transport available"));
        setState(ConnectionState::Disconnected);
        return;
    }
    if (!m_url.isValid() || m_url.host().isEmpty()) {
        qCWarning(pushLog) << "PushChannelManager: push URL is not set, cannot connect";
        reportError(SyncError::Kind::Transport, QStringLiteral("Push URL is not set"));
        setState(ConnectionState::Disconnected);
        return;
    }

    setState(ConnectionState::Connecting);
    m_connectTimer.start(m_policy.connectTimeoutMs);
    m_transport->open(m_url);
}

void PushChannelManager::handleFailure(const QString &reason)
{
    const bool wasConnected = m_state == ConnectionState::Connected;
    m_connectTimer.stop();
    if (m_transport)
        m_transport->abort();

    qCWarning(pushLog) << "push channel" << (wasConnected ? "lost:" : "failed:") << reason;
    reportError(SyncError::Kind::Transport, reason);
    setState(ConnectionState::Disconnected);

    if (m_autoReconnect)
        scheduleReconnect();
}

void PushChannelManager::scheduleReconnect()
{
    ++m_failures;

    int delayMs = 0;
    if (m_failures > m_policy.maxFastAttempts) {
        delayMs = m_policy.longRetryIntervalMs;
        if (m_state != ConnectionState::Failed) {
            qCWarning(pushLog) << "push channel failed after" << m_failures - 1
                               << "reconnect attempts; retrying every" << delayMs << "ms";
        }
        setState(ConnectionState::Failed);
    } else {
        delayMs = m_policy.delayForAttempt(m_failures);
        qCInfo(pushLog) << "reconnecting push channel (attempt" << m_failures
                        << "of" << m_policy.maxFastAttempts << ") in" << delayMs << "ms";
        setState(ConnectionState::Reconnecting);
    }

    m_reconnectTimer.start(delayMs);
    emit reconnectScheduled(m_failures, delayMs);
}

void PushChannelManager::setState(ConnectionState state)
{
    if (m_state == state)
        return;
    m_state = state;
    qCDebug(pushLog) << "push channel state" << connectionStateName(state);
    emit stateChanged(state);
}

void PushChannelManager::reportError(SyncError::Kind kind, const QString &message)
{
    SyncError error;
    error.kind = kind;
    error.message = message;
    emit syncError(error);
}

} // namespace homesync
