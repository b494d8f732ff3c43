#pragma once

#include <QByteArray>
#include <QString>

#include "sync_types.h"

namespace homesync {

enum class MessageType {
    DeviceUpdate,
    Ping,
    Pong,
    Unknown
};

struct InboundMessage {
    MessageType type = MessageType::Unknown;
    // Raw value of the "type" field, kept for diagnostics of unknown frames.
    QString typeName;
    // Valid for DeviceUpdate.
    Patch patch;
    // Valid for Pong when the peer sent a timestamp.
    qint64 pongTimestampMs = 0;
};

// Returns false for frames that are not a JSON object with a string "type",
// or for device_update frames missing device_name/state. Unknown types are
// decoded successfully with MessageType::Unknown.
bool decodeFrame(const QByteArray &frame, InboundMessage *out, QString *error = nullptr);

QByteArray encodePong(qint64 timestampMs);
QByteArray encodeDeviceUpdate(const Patch &patch);

// Accepts ISO-8601 (with or without fractional seconds) and millisecond or
// second epoch numbers. Returns an invalid QDateTime otherwise.
QDateTime parseTimestamp(const QJsonValue &value);

} // namespace homesync
