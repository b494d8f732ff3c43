#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "sync_types.h"

namespace homesync {

// Parses the body of the snapshot endpoint. A literal "null" body is an
// empty device list. Entries without an id are skipped, duplicate ids keep
// the last entry.
bool parseDeviceList(const QByteArray &payload, DeviceList *out, QString *error = nullptr);

bool parseDevice(const QJsonObject &obj, DeviceEntity *out);

QJsonObject deviceToJson(const DeviceEntity &device);

} // namespace homesync
