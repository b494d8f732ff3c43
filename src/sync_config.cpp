#include "sync_config.h"

#include <algorithm>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QVariant>

namespace homesync {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    const QString value = obj.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

QString normalizedPath(const QString &path)
{
    if (path.startsWith(QLatin1Char('/')))
        return path;
    return QStringLiteral("/") + path;
}

} // namespace

int GatewaySettings::effectivePort() const
{
    if (port > 0)
        return port;
    return useTls ? 443 : 80;
}

QUrl GatewaySettings::baseUrl() const
{
    QUrl url;
    url.setScheme(useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(host.trimmed());
    url.setPort(effectivePort());
    return url;
}

QUrl GatewaySettings::pushUrl() const
{
    QUrl url;
    url.setScheme(useTls ? QStringLiteral("wss") : QStringLiteral("ws"));
    url.setHost(host.trimmed());
    url.setPort(effectivePort());
    url.setPath(normalizedPath(pushPath));
    return url;
}

int ReconnectPolicy::delayForAttempt(int attempt) const
{
    const int base = std::max(1, baseDelayMs);
    const int ceiling = std::max(base, maxDelayMs);
    if (attempt <= 1)
        return base;

    // Stop doubling once the ceiling is reached to stay clear of overflow.
    qint64 delay = base;
    for (int i = 1; i < attempt && delay < ceiling; ++i)
        delay *= 2;
    return static_cast<int>(std::clamp<qint64>(delay, base, ceiling));
}

SessionConfig loadSessionConfig(const QJsonObject &root)
{
    SessionConfig config;

    const QJsonObject gateway = root.value(QStringLiteral("gateway")).toObject();
    config.gateway.host = gateway.value(QStringLiteral("host")).toString().trimmed();
    config.gateway.port = std::clamp(readInt(gateway, QStringLiteral("port"), 0), 0, 65535);
    config.gateway.token = gateway.value(QStringLiteral("token")).toString().trimmed();
    if (gateway.contains(QStringLiteral("useTls")))
        config.gateway.useTls = gateway.value(QStringLiteral("useTls")).toBool(false);
    else
        config.gateway.useTls = (config.gateway.port == 443);
    config.gateway.devicesPath = normalizedPath(
        readString(gateway, QStringLiteral("devicesPath"), config.gateway.devicesPath));
    config.gateway.setPathPrefix = normalizedPath(
        readString(gateway, QStringLiteral("setPathPrefix"), config.gateway.setPathPrefix));
    config.gateway.refreshPathPrefix = normalizedPath(
        readString(gateway, QStringLiteral("refreshPathPrefix"), config.gateway.refreshPathPrefix));
    config.gateway.pushPath = normalizedPath(
        readString(gateway, QStringLiteral("pushPath"), config.gateway.pushPath));

    const QJsonObject reconnect = root.value(QStringLiteral("reconnect")).toObject();
    ReconnectPolicy &rp = config.reconnect;
    rp.baseDelayMs = std::clamp(readInt(reconnect, QStringLiteral("baseDelayMs"), rp.baseDelayMs), 100, 600000);
    rp.maxDelayMs = std::clamp(readInt(reconnect, QStringLiteral("maxDelayMs"), rp.maxDelayMs), rp.baseDelayMs, 600000);
    rp.maxFastAttempts = std::clamp(readInt(reconnect, QStringLiteral("maxFastAttempts"), rp.maxFastAttempts), 1, 100);
    rp.longRetryIntervalMs = std::clamp(readInt(reconnect, QStringLiteral("longRetryIntervalMs"), rp.longRetryIntervalMs),
                                        1000, 3600000);
    rp.connectTimeoutMs = std::clamp(readInt(reconnect, QStringLiteral("connectTimeoutMs"), rp.connectTimeoutMs),
                                     500, 120000);

    const QJsonObject poll = root.value(QStringLiteral("poll")).toObject();
    PollPolicy &pp = config.poll;
    pp.shortIntervalMs = std::clamp(readInt(poll, QStringLiteral("shortIntervalMs"), pp.shortIntervalMs), 1000, 600000);
    pp.longIntervalMs = std::clamp(readInt(poll, QStringLiteral("longIntervalMs"), pp.longIntervalMs), 1000, 600000);
    pp.requestTimeoutMs = std::clamp(readInt(poll, QStringLiteral("requestTimeoutMs"), pp.requestTimeoutMs), 1000, 60000);

    const QJsonObject write = root.value(QStringLiteral("write")).toObject();
    WritePolicy &wp = config.write;
    wp.debounceMs = std::clamp(readInt(write, QStringLiteral("debounceMs"), wp.debounceMs), 0, 5000);
    wp.requestTimeoutMs = std::clamp(readInt(write, QStringLiteral("requestTimeoutMs"), wp.requestTimeoutMs), 1000, 60000);
    if (write.value(QStringLiteral("continuousProperties")).isArray()) {
        wp.continuousProperties.clear();
        const QJsonArray names = write.value(QStringLiteral("continuousProperties")).toArray();
        for (const QJsonValue &name : names) {
            const QString trimmed = name.toString().trimmed();
            if (!trimmed.isEmpty())
                wp.continuousProperties.insert(trimmed);
        }
    }

    config.bufferUnknownPatches = root.value(QStringLiteral("bufferUnknownPatches")).toBool(true);
    config.maxBufferedPatches = std::clamp(readInt(root, QStringLiteral("maxBufferedPatches"), config.maxBufferedPatches),
                                           0, 100000);
    config.logRules = root.value(QStringLiteral("logRules")).toString();
    return config;
}

bool readSessionConfigFile(const QString &path, SessionConfig *out, QString *error)
{
    if (!out)
        return false;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(path, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("%1: top-level value is not a JSON object").arg(path);
        return false;
    }

    *out = loadSessionConfig(doc.object());
    if (error)
        error->clear();
    return true;
}

} // namespace homesync
