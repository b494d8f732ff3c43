#include "message_codec.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace homesync {

namespace {

const QString kTypeKey = QStringLiteral("type");
const QString kDeviceUpdate = QStringLiteral("device_update");
const QString kPing = QStringLiteral("ping");
const QString kPong = QStringLiteral("pong");

// Epoch values below this are taken as seconds (year 2286 in ms).
constexpr qint64 kSecondsEpochLimit = 10000000000LL;

bool fail(QString *error, const QString &message)
{
    if (error)
        *error = message;
    return false;
}

} // namespace

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (value.isDouble()) {
        const qint64 raw = static_cast<qint64>(value.toDouble());
        if (raw <= 0)
            return {};
        if (raw < kSecondsEpochLimit)
            return QDateTime::fromSecsSinceEpoch(raw, Qt::UTC);
        return QDateTime::fromMSecsSinceEpoch(raw, Qt::UTC);
    }

    const QString text = value.toString().trimmed();
    if (text.isEmpty())
        return {};

    QDateTime ts = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!ts.isValid())
        ts = QDateTime::fromString(text, Qt::ISODate);
    if (ts.isValid())
        return ts.toUTC();

    // The gateway has been seen sending plain epoch numbers as strings.
    bool ok = false;
    const qint64 raw = text.toLongLong(&ok);
    if (ok)
        return parseTimestamp(QJsonValue(static_cast<double>(raw)));
    return {};
}

bool decodeFrame(const QByteArray &frame, InboundMessage *out, QString *error)
{
    if (!out)
        return fail(error, QStringLiteral("Output message is null"));

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(frame, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(error, QStringLiteral("Invalid JSON: %1").arg(parseError.errorString()));
    if (!doc.isObject())
        return fail(error, QStringLiteral("Frame is not a JSON object"));

    const QJsonObject root = doc.object();
    const QJsonValue typeValue = root.value(kTypeKey);
    if (!typeValue.isString())
        return fail(error, QStringLiteral("Frame has no string \"type\" field"));

    InboundMessage msg;
    msg.typeName = typeValue.toString();

    if (msg.typeName == kDeviceUpdate) {
        const QString deviceId = root.value(QStringLiteral("device_name")).toString().trimmed();
        if (deviceId.isEmpty())
            return fail(error, QStringLiteral("device_update without device_name"));
        const QJsonValue state = root.value(QStringLiteral("state"));
        if (!state.isObject())
            return fail(error, QStringLiteral("device_update for %1 without state object").arg(deviceId));

        msg.type = MessageType::DeviceUpdate;
        msg.patch.deviceId = deviceId;
        msg.patch.properties = state.toObject();
        msg.patch.timestamp = parseTimestamp(root.value(QStringLiteral("timestamp")));
    } else if (msg.typeName == kPing) {
        msg.type = MessageType::Ping;
    } else if (msg.typeName == kPong) {
        msg.type = MessageType::Pong;
        const QDateTime ts = parseTimestamp(root.value(QStringLiteral("timestamp")));
        msg.pongTimestampMs = ts.isValid() ? ts.toMSecsSinceEpoch() : 0;
    } else {
        msg.type = MessageType::Unknown;
    }

    *out = msg;
    if (error)
        error->clear();
    return true;
}

QByteArray encodePong(qint64 timestampMs)
{
    QJsonObject obj;
    obj.insert(kTypeKey, kPong);
    obj.insert(QStringLiteral("timestamp"), static_cast<double>(timestampMs));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray encodeDeviceUpdate(const Patch &patch)
{
    QJsonObject obj;
    obj.insert(kTypeKey, kDeviceUpdate);
    obj.insert(QStringLiteral("device_name"), patch.deviceId);
    obj.insert(QStringLiteral("state"), patch.properties);
    const QDateTime ts = patch.timestamp.isValid() ? patch.timestamp : QDateTime::currentDateTimeUtc();
    obj.insert(QStringLiteral("timestamp"), ts.toUTC().toString(Qt::ISODateWithMs));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace homesync
