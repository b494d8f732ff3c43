#pragma once

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QString>

#include "device_store.h"
#include "sync_config.h"
#include "sync_types.h"

class QTimer;

namespace homesync {

class WriteSink;
struct WriteResult;

// Applies local property changes to the store ahead of the gateway and sends
// them out. Continuous properties (sliders) are coalesced per device until a
// quiet period passes; discrete ones go out at once and take any debounced
// changes of the same device with them.
//
// A device is marked pending in the store from the moment a change is
// accepted until its request resolves.
class WriteCoordinator : public QObject
{
    Q_OBJECT
public:
    WriteCoordinator(DeviceStore *store, WriteSink *sink, const WritePolicy &policy, QObject *parent = nullptr);
    ~WriteCoordinator() override;

    bool isContinuous(const QString &property) const;
    bool hasDebouncedChanges(const QString &deviceId) const;
    QJsonObject debouncedChanges(const QString &deviceId) const;
    int inFlightCount() const;

public slots:
    void requestPropertyChange(const QString &deviceId, const QString &property, const QJsonValue &value);
    // Continuous when any key is continuous.
    void requestPropertyChanges(const QString &deviceId, const QJsonObject &properties);
    void flush();
    void flushDevice(const QString &deviceId);
    // Cancels every debounce timer, releases pending marks and ignores any
    // reply that arrives later. Idempotent.
    void shutdown();

signals:
    void writeDispatched(const QString &deviceId, const QJsonObject &properties);
    void writeFinished(const QString &deviceId, const QJsonObject &properties, bool ok);
    void resyncRequested(const QString &deviceId);
    void syncError(const homesync::SyncError &error);

private:
    struct DebouncedChange {
        DeviceStore::WriteToken token = 0;
        QJsonObject properties;
    };

    QTimer *debounceTimer(const QString &deviceId);
    void dispatch(const QString &deviceId, const QJsonObject &extra = {});
    void onWriteFinished(const QString &deviceId, DeviceStore::WriteToken token, const QJsonObject &properties,
                         const WriteResult &result);

    QPointer<DeviceStore> m_store;
    WriteSink *m_sink = nullptr;
    WritePolicy m_policy;
    QHash<QString, QTimer *> m_timers;
    QHash<QString, DebouncedChange> m_debounced;
    QHash<DeviceStore::WriteToken, QString> m_inFlight;
    quint64 m_generation = 0;
    bool m_shutdown = false;
};

} // namespace homesync
