#include "sync_types.h"

namespace homesync {

QString connectionStateName(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:
        return QStringLiteral("Disconnected");
    case ConnectionState::Connecting:
        return QStringLiteral("Connecting");
    case ConnectionState::Connected:
        return QStringLiteral("Connected");
    case ConnectionState::Reconnecting:
        return QStringLiteral("Reconnecting");
    case ConnectionState::Failed:
        return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

bool DeviceEntity::operator==(const DeviceEntity &other) const
{
    return id == other.id
        && properties == other.properties
        && zones == other.zones
        && online == other.online
        && interviewing == other.interviewing
        && lastSeen == other.lastSeen;
}

bool mergeProperties(QJsonObject *properties, const QJsonObject &diff)
{
    if (!properties)
        return false;

    bool changed = false;
    for (auto it = diff.constBegin(); it != diff.constEnd(); ++it) {
        if (it.value().isNull() || it.value().isUndefined()) {
            if (properties->contains(it.key())) {
                properties->remove(it.key());
                changed = true;
            }
            continue;
        }
        if (properties->value(it.key()) == it.value())
            continue;
        properties->insert(it.key(), it.value());
        changed = true;
    }
    return changed;
}

QString syncErrorKindName(SyncError::Kind kind)
{
    switch (kind) {
    case SyncError::Kind::Transport:
        return QStringLiteral("TransportError");
    case SyncError::Kind::Protocol:
        return QStringLiteral("ProtocolError");
    case SyncError::Kind::Fetch:
        return QStringLiteral("FetchError");
    case SyncError::Kind::Write:
        return QStringLiteral("WriteError");
    }
    return QStringLiteral("UnknownError");
}

} // namespace homesync
