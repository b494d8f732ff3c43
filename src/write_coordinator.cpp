#include "write_coordinator.h"

#include <utility>

#include <QPointer>
#include <QTimer>

#include "gateway_client.h"
#include "sync_log.h"

namespace homesync {

WriteCoordinator::WriteCoordinator(DeviceStore *store, WriteSink *sink, const WritePolicy &policy, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_sink(sink)
    , m_policy(policy)
{
}

WriteCoordinator::~WriteCoordinator()
{
    shutdown();
}

bool WriteCoordinator::isContinuous(const QString &property) const
{
    return m_policy.continuousProperties.contains(property);
}

bool WriteCoordinator::hasDebouncedChanges(const QString &deviceId) const
{
    return m_debounced.contains(deviceId);
}

QJsonObject WriteCoordinator::debouncedChanges(const QString &deviceId) const
{
    return m_debounced.value(deviceId).properties;
}

int WriteCoordinator::inFlightCount() const
{
    return m_inFlight.size();
}

void WriteCoordinator::requestPropertyChange(const QString &deviceId, const QString &property, const QJsonValue &value)
{
    if (property.isEmpty())
        return;
    QJsonObject properties;
    properties.insert(property, value);
    requestPropertyChanges(deviceId, properties);
}

void WriteCoordinator::requestPropertyChanges(const QString &deviceId, const QJsonObject &properties)
{
    if (m_shutdown || !m_store || deviceId.isEmpty() || properties.isEmpty())
        return;

    bool continuous = false;
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
        if (isContinuous(it.key())) {
            continuous = true;
            break;
        }
    }

    if (!continuous) {
        dispatch(deviceId, properties);
        return;
    }

    auto it = m_debounced.find(deviceId);
    if (it == m_debounced.end()) {
        // Pending from acceptance, so a poll tick inside the window is skipped.
        DebouncedChange change;
        change.token = m_store->beginPendingWrite(deviceId);
        it = m_debounced.insert(deviceId, change);
    }
    for (auto prop = properties.constBegin(); prop != properties.constEnd(); ++prop)
        it->properties.insert(prop.key(), prop.value());

    debounceTimer(deviceId)->start(m_policy.debounceMs);
    qCDebug(writeLog) << "debouncing" << properties.keys() << "for" << deviceId;
}

void WriteCoordinator::flush()
{
    const QStringList ids = m_debounced.keys();
    for (const QString &id : ids)
        flushDevice(id);
}

void WriteCoordinator::flushDevice(const QString &deviceId)
{
    if (!m_store || !m_debounced.contains(deviceId))
        return;
    dispatch(deviceId);
}

void WriteCoordinator::shutdown()
{
    if (m_shutdown)
        return;
    m_shutdown = true;
    ++m_generation;

    for (QTimer *timer : std::as_const(m_timers)) {
        timer->stop();
        timer->deleteLater();
    }
    m_timers.clear();

    if (m_store) {
        for (auto it = m_debounced.constBegin(); it != m_debounced.constEnd(); ++it)
            m_store->endPendingWrite(it.key(), it->token, false);
        for (auto it = m_inFlight.constBegin(); it != m_inFlight.constEnd(); ++it)
            m_store->endPendingWrite(it.value(), it.key(), false);
    }
    if (!m_debounced.isEmpty())
        qCInfo(writeLog) << "dropping debounced changes for" << m_debounced.keys();
    m_debounced.clear();
    m_inFlight.clear();
}

QTimer *WriteCoordinator::debounceTimer(const QString &deviceId)
{
    QTimer *timer = m_timers.value(deviceId);
    if (timer)
        return timer;

    timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, deviceId]() {
        flushDevice(deviceId);
    });
    m_timers.insert(deviceId, timer);
    return timer;
}

void WriteCoordinator::dispatch(const QString &deviceId, const QJsonObject &extra)
{
    QJsonObject properties;
    DeviceStore::WriteToken token = 0;
    if (m_debounced.contains(deviceId)) {
        // Reuses the pending mark taken when debouncing started.
        const DebouncedChange change = m_debounced.take(deviceId);
        token = change.token;
        properties = change.properties;
        if (QTimer *timer = m_timers.value(deviceId))
            timer->stop();
    } else {
        token = m_store->beginPendingWrite(deviceId);
    }
    for (auto it = extra.constBegin(); it != extra.constEnd(); ++it)
        properties.insert(it.key(), it.value());

    m_store->applyOptimistic(deviceId, properties, token);
    m_inFlight.insert(token, deviceId);
    emit writeDispatched(deviceId, properties);

    if (!m_sink) {
        WriteResult result;
        result.error = QStringLiteral("No write endpoint configured");
        onWriteFinished(deviceId, token, properties, result);
        return;
    }

    qCDebug(writeLog) << "sending" << properties.keys() << "to" << deviceId;
    const quint64 generation = m_generation;
    QPointer<WriteCoordinator> self(this);
    m_sink->writeProperties(deviceId, properties,
                            [self, generation, deviceId, token, properties](const WriteResult &result) {
                                if (!self || self->m_generation != generation)
                                    return;
                                self->onWriteFinished(deviceId, token, properties, result);
                            });
}

void WriteCoordinator::onWriteFinished(const QString &deviceId, DeviceStore::WriteToken token,
                                       const QJsonObject &properties, const WriteResult &result)
{
    m_inFlight.remove(token);
    // A rejected write drops its overlay so the resync below can revert it.
    if (m_store)
        m_store->endPendingWrite(deviceId, token, result.ok);

    emit writeFinished(deviceId, properties, result.ok);
    if (result.ok)
        return;

    qCWarning(writeLog) << "write to" << deviceId << "failed:" << result.error << "- requesting resync";
    SyncError error;
    error.kind = SyncError::Kind::Write;
    error.message = result.error;
    error.deviceId = deviceId;
    emit syncError(error);
    emit resyncRequested(deviceId);
}

} // namespace homesync
