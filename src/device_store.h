#pragma once

#include <memory>
#include <optional>

#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QStringList>

#include "sync_types.h"

namespace homesync {

// Canonical replica of the gateway's devices.
//
// Every mutation runs under one mutex and publishes a new immutable map, so
// readers holding a Snapshot never see a partially merged record. Change
// signals are emitted after the lock is released, from the mutating thread.
class DeviceStore : public QObject
{
    Q_OBJECT
public:
    using Snapshot = std::shared_ptr<const DeviceMap>;
    // Identifies one pending write request; 0 is never issued.
    using WriteToken = quint64;

    // Marks the point a snapshot fetch was issued. Patches applied after it
    // are replayed on top of the snapshot that the fetch returns.
    struct SnapshotTicket {
        quint64 id = 0;
        quint64 sequence = 0;
        bool isValid() const noexcept { return id != 0; }
    };

    explicit DeviceStore(QObject *parent = nullptr);
    ~DeviceStore() override;

    void setUnknownPatchBuffering(bool enabled, int maxEntries);

    SnapshotTicket beginSnapshot();
    void cancelSnapshot(const SnapshotTicket &ticket);
    void applyFullSnapshot(const DeviceList &devices);
    void applyFullSnapshot(const DeviceList &devices, const SnapshotTicket &ticket);

    // Returns true when a known device changed. Patches for unknown ids leave
    // the contents untouched and are buffered when buffering is enabled.
    bool applyPatch(const Patch &patch);
    bool applyPatch(const QString &deviceId, const QJsonObject &diff);

    // Local change applied ahead of remote confirmation. With a token the
    // values join that write's overlay, and while a snapshot fetch is open
    // they are journaled so the older snapshot cannot roll them back.
    bool applyOptimistic(const QString &deviceId, const QJsonObject &properties, WriteToken token = 0);

    // Each pending write keeps its own overlay, re-applied over full
    // snapshots until that write resolves. An unconfirmed write also loses
    // its journal entries.
    WriteToken beginPendingWrite(const QString &deviceId, const QJsonObject &properties = {});
    void endPendingWrite(const QString &deviceId, WriteToken token, bool confirmed = true);
    bool hasPendingWrites() const;
    bool isPending(const QString &deviceId) const;

    Snapshot snapshot() const;
    std::optional<DeviceEntity> device(const QString &deviceId) const;
    bool contains(const QString &deviceId) const;
    QStringList deviceIds() const;
    DeviceList devicesInZone(const QString &zone) const;
    int size() const;
    quint64 revision() const;
    int bufferedPatchCount() const;

    // Drops devices, tickets, buffers and pending marks.
    void clear();

signals:
    void devicesChanged(const QStringList &deviceIds);
    void snapshotApplied(int deviceCount);
    void pendingWritesChanged(bool hasPendingWrites);

private:
    struct SequencedPatch {
        quint64 sequence = 0;
        Patch patch;
        WriteToken writeToken = 0;
    };

    struct PendingWrite {
        WriteToken token = 0;
        QJsonObject properties;
    };

    static bool mergePatchInto(DeviceMap *map, const Patch &patch);
    void publishLocked(DeviceMap next);
    void bufferUnknownLocked(const SequencedPatch &entry);
    void releaseTicketLocked(quint64 ticketId);
    void applySnapshotLocked(const DeviceList &devices, const SnapshotTicket *ticket, QStringList *changed);

    mutable QMutex m_mutex;
    Snapshot m_devices;
    quint64 m_revision = 0;
    quint64 m_patchSequence = 0;
    quint64 m_nextTicketId = 1;
    WriteToken m_nextWriteToken = 1;
    QHash<quint64, quint64> m_openTickets;
    QList<SequencedPatch> m_journal;
    QList<SequencedPatch> m_unknownPatches;
    bool m_bufferUnknown = true;
    int m_maxBufferedPatches = 256;
    QHash<QString, QList<PendingWrite>> m_pending;
};

} // namespace homesync
