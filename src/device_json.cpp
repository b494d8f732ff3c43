#include "device_json.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>

#include "message_codec.h"

namespace homesync {

namespace {

QString deviceIdFromObject(const QJsonObject &obj)
{
    const QString friendlyName = obj.value(QStringLiteral("friendly_name")).toString().trimmed();
    if (!friendlyName.isEmpty())
        return friendlyName;
    return obj.value(QStringLiteral("id")).toString().trimmed();
}

bool onlineFromObject(const QJsonObject &obj)
{
    const QJsonValue explicitOnline = obj.value(QStringLiteral("online"));
    if (explicitOnline.isBool())
        return explicitOnline.toBool();

    // zigbee2mqtt reports availability either as a string or as {"state": ...}.
    const QJsonValue availability = obj.value(QStringLiteral("availability"));
    QString availabilityText = availability.toString();
    if (availability.isObject())
        availabilityText = availability.toObject().value(QStringLiteral("state")).toString();
    availabilityText = availabilityText.trimmed().toLower();
    if (availabilityText == QLatin1String("offline"))
        return false;
    if (availabilityText == QLatin1String("online"))
        return true;

    return !obj.value(QStringLiteral("disabled")).toBool(false);
}

QJsonObject stripNulls(const QJsonObject &state)
{
    QJsonObject out;
    for (auto it = state.constBegin(); it != state.constEnd(); ++it) {
        if (it.value().isNull() || it.value().isUndefined())
            continue;
        out.insert(it.key(), it.value());
    }
    return out;
}

} // namespace

bool parseDevice(const QJsonObject &obj, DeviceEntity *out)
{
    if (!out)
        return false;

    const QString id = deviceIdFromObject(obj);
    if (id.isEmpty())
        return false;

    DeviceEntity device;
    device.id = id;
    device.properties = stripNulls(obj.value(QStringLiteral("state")).toObject());

    const QJsonArray zones = obj.value(QStringLiteral("zones")).toArray();
    for (const QJsonValue &zone : zones) {
        const QString name = zone.toString().trimmed();
        if (!name.isEmpty())
            device.zones.insert(name);
    }

    device.online = onlineFromObject(obj);
    device.interviewing = obj.value(QStringLiteral("interviewing")).toBool(false);
    device.lastSeen = parseTimestamp(obj.value(QStringLiteral("last_seen")));

    *out = device;
    return true;
}

bool parseDeviceList(const QByteArray &payload, DeviceList *out, QString *error)
{
    if (!out)
        return false;

    const QByteArray trimmed = payload.trimmed();
    if (trimmed.isEmpty() || trimmed == "null") {
        out->clear();
        if (error)
            error->clear();
        return true;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("Device list is not valid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isArray()) {
        if (error)
            *error = QStringLiteral("Device list response is not a JSON array");
        return false;
    }

    DeviceList devices;
    QHash<QString, int> indexById;
    const QJsonArray entries = doc.array();
    for (const QJsonValue &entry : entries) {
        if (!entry.isObject())
            continue;
        DeviceEntity device;
        if (!parseDevice(entry.toObject(), &device))
            continue;
        const auto existing = indexById.constFind(device.id);
        if (existing != indexById.constEnd()) {
            devices[existing.value()] = device;
            continue;
        }
        indexById.insert(device.id, devices.size());
        devices.append(device);
    }

    *out = devices;
    if (error)
        error->clear();
    return true;
}

QJsonObject deviceToJson(const DeviceEntity &device)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("friendly_name"), device.id);
    obj.insert(QStringLiteral("state"), device.properties);

    QStringList zones = device.zones.values();
    zones.sort();
    obj.insert(QStringLiteral("zones"), QJsonArray::fromStringList(zones));
    obj.insert(QStringLiteral("online"), device.online);
    obj.insert(QStringLiteral("interviewing"), device.interviewing);
    if (device.lastSeen.isValid())
        obj.insert(QStringLiteral("last_seen"), device.lastSeen.toUTC().toString(Qt::ISODateWithMs));
    return obj;
}

} // namespace homesync
