#include "device_store.h"

#include <algorithm>
#include <limits>
#include <utility>

#include <QMap>
#include <QMutexLocker>

#include "sync_log.h"

namespace homesync {

DeviceStore::DeviceStore(QObject *parent)
    : QObject(parent)
    , m_devices(std::make_shared<const DeviceMap>())
{
}

DeviceStore::~DeviceStore() = default;

void DeviceStore::setUnknownPatchBuffering(bool enabled, int maxEntries)
{
    QMutexLocker locker(&m_mutex);
    m_bufferUnknown = enabled;
    m_maxBufferedPatches = std::max(0, maxEntries);
    if (!m_bufferUnknown)
        m_unknownPatches.clear();
    while (m_unknownPatches.size() > m_maxBufferedPatches)
        m_unknownPatches.removeFirst();
}

DeviceStore::SnapshotTicket DeviceStore::beginSnapshot()
{
    QMutexLocker locker(&m_mutex);
    SnapshotTicket ticket;
    ticket.id = m_nextTicketId++;
    ticket.sequence = m_patchSequence;
    m_openTickets.insert(ticket.id, ticket.sequence);
    return ticket;
}

void DeviceStore::cancelSnapshot(const SnapshotTicket &ticket)
{
    if (!ticket.isValid())
        return;
    QMutexLocker locker(&m_mutex);
    releaseTicketLocked(ticket.id);
}

void DeviceStore::applyFullSnapshot(const DeviceList &devices)
{
    QStringList changed;
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        applySnapshotLocked(devices, nullptr, &changed);
        count = m_devices->size();
    }
    if (!changed.isEmpty())
        emit devicesChanged(changed);
    emit snapshotApplied(count);
}

void DeviceStore::applyFullSnapshot(const DeviceList &devices, const SnapshotTicket &ticket)
{
    QStringList changed;
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (ticket.isValid() && m_openTickets.contains(ticket.id)) {
            applySnapshotLocked(devices, &ticket, &changed);
            releaseTicketLocked(ticket.id);
        } else {
            if (ticket.isValid())
                qCWarning(storeLog) << "snapshot ticket" << ticket.id << "is no longer open; applying without replay";
            applySnapshotLocked(devices, nullptr, &changed);
        }
        count = m_devices->size();
    }
    if (!changed.isEmpty())
        emit devicesChanged(changed);
    emit snapshotApplied(count);
}

bool DeviceStore::applyPatch(const Patch &patch)
{
    if (patch.deviceId.isEmpty())
        return false;

    {
        QMutexLocker locker(&m_mutex);
        SequencedPatch entry;
        entry.sequence = ++m_patchSequence;
        entry.patch = patch;
        if (!m_openTickets.isEmpty())
            m_journal.append(entry);

        if (!m_devices->contains(patch.deviceId)) {
            if (m_bufferUnknown) {
                bufferUnknownLocked(entry);
                qCDebug(storeLog) << "buffered patch for unknown device" << patch.deviceId;
            } else {
                qCDebug(storeLog) << "dropped patch for unknown device" << patch.deviceId;
            }
            return false;
        }

        DeviceMap next = *m_devices;
        if (!mergePatchInto(&next, patch))
            return false;
        publishLocked(std::move(next));
    }

    emit devicesChanged(QStringList{patch.deviceId});
    return true;
}

bool DeviceStore::applyPatch(const QString &deviceId, const QJsonObject &diff)
{
    Patch patch;
    patch.deviceId = deviceId;
    patch.properties = diff;
    return applyPatch(patch);
}

bool DeviceStore::applyOptimistic(const QString &deviceId, const QJsonObject &properties, WriteToken token)
{
    if (deviceId.isEmpty() || properties.isEmpty())
        return false;

    {
        QMutexLocker locker(&m_mutex);
        if (token != 0) {
            auto pendingIt = m_pending.find(deviceId);
            if (pendingIt != m_pending.end()) {
                for (PendingWrite &write : *pendingIt) {
                    if (write.token == token) {
                        mergeProperties(&write.properties, properties);
                        break;
                    }
                }
            }
        }

        auto it = m_devices->constFind(deviceId);
        if (it == m_devices->constEnd()) {
            qCDebug(storeLog) << "optimistic change for unknown device" << deviceId << "ignored";
            return false;
        }

        if (!m_openTickets.isEmpty()) {
            SequencedPatch entry;
            entry.sequence = ++m_patchSequence;
            entry.patch.deviceId = deviceId;
            entry.patch.properties = properties;
            entry.writeToken = token;
            m_journal.append(entry);
        }

        DeviceEntity updated = it.value();
        if (!mergeProperties(&updated.properties, properties))
            return false;

        DeviceMap next = *m_devices;
        next.insert(deviceId, updated);
        publishLocked(std::move(next));
    }

    emit devicesChanged(QStringList{deviceId});
    return true;
}

DeviceStore::WriteToken DeviceStore::beginPendingWrite(const QString &deviceId, const QJsonObject &properties)
{
    if (deviceId.isEmpty())
        return 0;

    bool becamePending = false;
    WriteToken token = 0;
    {
        QMutexLocker locker(&m_mutex);
        becamePending = m_pending.isEmpty();
        token = m_nextWriteToken++;
        PendingWrite write;
        write.token = token;
        write.properties = properties;
        m_pending[deviceId].append(write);
    }
    if (becamePending)
        emit pendingWritesChanged(true);
    return token;
}

void DeviceStore::endPendingWrite(const QString &deviceId, WriteToken token, bool confirmed)
{
    bool drained = false;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_pending.find(deviceId);
        if (it == m_pending.end())
            return;
        const auto removed = std::remove_if(it->begin(), it->end(), [token](const PendingWrite &write) {
            return write.token == token;
        });
        if (removed == it->end())
            return;
        it->erase(removed, it->end());
        if (it->isEmpty())
            m_pending.erase(it);
        drained = m_pending.isEmpty();

        if (!confirmed) {
            m_journal.erase(std::remove_if(m_journal.begin(), m_journal.end(),
                                           [token](const SequencedPatch &entry) {
                                               return entry.writeToken == token;
                                           }),
                            m_journal.end());
        }
    }
    if (drained)
        emit pendingWritesChanged(false);
}

bool DeviceStore::hasPendingWrites() const
{
    QMutexLocker locker(&m_mutex);
    return !m_pending.isEmpty();
}

bool DeviceStore::isPending(const QString &deviceId) const
{
    QMutexLocker locker(&m_mutex);
    return m_pending.contains(deviceId);
}

DeviceStore::Snapshot DeviceStore::snapshot() const
{
    QMutexLocker locker(&m_mutex);
    return m_devices;
}

std::optional<DeviceEntity> DeviceStore::device(const QString &deviceId) const
{
    const Snapshot current = snapshot();
    auto it = current->constFind(deviceId);
    if (it == current->constEnd())
        return std::nullopt;
    return it.value();
}

bool DeviceStore::contains(const QString &deviceId) const
{
    return snapshot()->contains(deviceId);
}

QStringList DeviceStore::deviceIds() const
{
    QStringList ids = snapshot()->keys();
    ids.sort();
    return ids;
}

DeviceList DeviceStore::devicesInZone(const QString &zone) const
{
    const Snapshot current = snapshot();
    DeviceList out;
    for (const DeviceEntity &device : *current) {
        if (device.zones.contains(zone))
            out.append(device);
    }
    std::sort(out.begin(), out.end(), [](const DeviceEntity &a, const DeviceEntity &b) {
        return a.id < b.id;
    });
    return out;
}

int DeviceStore::size() const
{
    return snapshot()->size();
}

quint64 DeviceStore::revision() const
{
    QMutexLocker locker(&m_mutex);
    return m_revision;
}

int DeviceStore::bufferedPatchCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_unknownPatches.size();
}

void DeviceStore::clear()
{
    QStringList removed;
    bool hadPending = false;
    {
        QMutexLocker locker(&m_mutex);
        removed = m_devices->keys();
        hadPending = !m_pending.isEmpty();
        m_openTickets.clear();
        m_journal.clear();
        m_unknownPatches.clear();
        m_pending.clear();
        if (!removed.isEmpty())
            publishLocked(DeviceMap());
    }
    if (!removed.isEmpty())
        emit devicesChanged(removed);
    if (hadPending)
        emit pendingWritesChanged(false);
}

bool DeviceStore::mergePatchInto(DeviceMap *map, const Patch &patch)
{
    auto it = map->find(patch.deviceId);
    if (it == map->end())
        return false;

    DeviceEntity updated = it.value();
    bool changed = mergeProperties(&updated.properties, patch.properties);
    if (patch.timestamp.isValid()
        && (!updated.lastSeen.isValid() || patch.timestamp > updated.lastSeen)) {
        updated.lastSeen = patch.timestamp;
        changed = true;
    }
    if (!changed)
        return false;

    it.value() = updated;
    return true;
}

void DeviceStore::publishLocked(DeviceMap next)
{
    m_devices = std::make_shared<const DeviceMap>(std::move(next));
    ++m_revision;
}

void DeviceStore::bufferUnknownLocked(const SequencedPatch &entry)
{
    if (m_maxBufferedPatches <= 0)
        return;
    m_unknownPatches.append(entry);
    while (m_unknownPatches.size() > m_maxBufferedPatches)
        m_unknownPatches.removeFirst();
}

void DeviceStore::releaseTicketLocked(quint64 ticketId)
{
    m_openTickets.remove(ticketId);
    if (m_openTickets.isEmpty()) {
        m_journal.clear();
        return;
    }

    quint64 oldest = std::numeric_limits<quint64>::max();
    for (quint64 sequence : std::as_const(m_openTickets))
        oldest = std::min(oldest, sequence);
    m_journal.erase(std::remove_if(m_journal.begin(), m_journal.end(),
                                   [oldest](const SequencedPatch &entry) {
                                       return entry.sequence <= oldest;
                                   }),
                    m_journal.end());
}

void DeviceStore::applySnapshotLocked(const DeviceList &devices, const SnapshotTicket *ticket, QStringList *changed)
{
    DeviceMap next;
    next.reserve(devices.size());
    for (const DeviceEntity &device : devices) {
        if (device.id.isEmpty())
            continue;
        next.insert(device.id, device);
    }

    // Buffered patches for then-unknown devices and patches that arrived
    // after the fetch was issued, in arrival order.
    QMap<quint64, Patch> replay;
    for (const SequencedPatch &entry : std::as_const(m_unknownPatches))
        replay.insert(entry.sequence, entry.patch);
    if (ticket) {
        for (const SequencedPatch &entry : std::as_const(m_journal)) {
            if (entry.sequence > ticket->sequence)
                replay.insert(entry.sequence, entry.patch);
        }
    }
    int replayed = 0;
    for (auto it = replay.constBegin(); it != replay.constEnd(); ++it) {
        if (mergePatchInto(&next, it.value()))
            ++replayed;
    }
    m_unknownPatches.clear();

    for (auto it = m_pending.constBegin(); it != m_pending.constEnd(); ++it) {
        auto deviceIt = next.find(it.key());
        if (deviceIt == next.end())
            continue;
        DeviceEntity updated = deviceIt.value();
        bool merged = false;
        for (const PendingWrite &write : it.value())
            merged = mergeProperties(&updated.properties, write.properties) || merged;
        if (merged)
            deviceIt.value() = updated;
    }

    const DeviceMap &previous = *m_devices;
    for (auto it = previous.constBegin(); it != previous.constEnd(); ++it) {
        if (!next.contains(it.key()))
            changed->append(it.key());
    }
    for (auto it = next.constBegin(); it != next.constEnd(); ++it) {
        auto prevIt = previous.constFind(it.key());
        if (prevIt == previous.constEnd() || prevIt.value() != it.value())
            changed->append(it.key());
    }

    qCInfo(storeLog) << "applied snapshot with" << next.size() << "devices," << changed->size()
                     << "changed," << replayed << "patches replayed";

    if (!changed->isEmpty())
        publishLocked(std::move(next));
}

} // namespace homesync
