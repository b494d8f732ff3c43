#pragma once

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QSet>
#include <QString>
#include <QStringList>

namespace homesync {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    // Backoff retry armed.
    Reconnecting,
    // Too many consecutive failures; long fixed retry armed.
    Failed
};

QString connectionStateName(ConnectionState state);

struct DeviceEntity {
    QString id;
    // Property name -> bool / double / string. Never contains null values.
    QJsonObject properties;
    QSet<QString> zones;
    bool online = true;
    bool interviewing = false;
    QDateTime lastSeen;

    bool operator==(const DeviceEntity &other) const;
    bool operator!=(const DeviceEntity &other) const { return !(*this == other); }
};

using DeviceList = QList<DeviceEntity>;
using DeviceMap = QHash<QString, DeviceEntity>;

struct Patch {
    QString deviceId;
    // A null value removes the key, an absent key leaves it untouched.
    QJsonObject properties;
    QDateTime timestamp;
};

// Merges diff into properties. Null values in diff delete the key.
// Returns true when properties changed.
bool mergeProperties(QJsonObject *properties, const QJsonObject &diff);

struct SyncError {
    enum class Kind {
        Transport,
        Protocol,
        Fetch,
        Write
    };

    Kind kind = Kind::Transport;
    QString message;
    QString deviceId;
};

QString syncErrorKindName(SyncError::Kind kind);

} // namespace homesync

Q_DECLARE_METATYPE(homesync::ConnectionState)
Q_DECLARE_METATYPE(homesync::DeviceEntity)
Q_DECLARE_METATYPE(homesync::Patch)
Q_DECLARE_METATYPE(homesync::SyncError)
