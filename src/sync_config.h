#pragma once

#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QUrl>

namespace homesync {

struct GatewaySettings {
    QString host;
    int port = 0;
    bool useTls = false;
    // Optional bearer token, sent as "Authorization: Bearer <token>".
    QString token;
    QString devicesPath = QStringLiteral("/api/zigbee2mqtt/list_devices");
    QString setPathPrefix = QStringLiteral("/api/zigbee2mqtt/set/");
    QString refreshPathPrefix = QStringLiteral("/api/zigbee2mqtt/get/");
    QString pushPath = QStringLiteral("/ws");

    int effectivePort() const;
    QUrl baseUrl() const;
    QUrl pushUrl() const;
};

struct ReconnectPolicy {
    int baseDelayMs = 2000;
    int maxDelayMs = 30000;
    // Consecutive failures before switching to the long fixed interval.
    int maxFastAttempts = 5;
    int longRetryIntervalMs = 120000;
    int connectTimeoutMs = 10000;

    // base * 2^(attempt-1), clamped to [base, max]. attempt starts at 1.
    int delayForAttempt(int attempt) const;
};

struct PollPolicy {
    // While the push channel is not Connected.
    int shortIntervalMs = 10000;
    // While the push channel is Connected.
    int longIntervalMs = 30000;
    int requestTimeoutMs = 8000;
};

struct WritePolicy {
    int debounceMs = 100;
    int requestTimeoutMs = 8000;
    QSet<QString> continuousProperties = {
        QStringLiteral("brightness"),
        QStringLiteral("color_temp"),
        QStringLiteral("color"),
        QStringLiteral("position"),
        QStringLiteral("volume"),
    };
};

struct SessionConfig {
    GatewaySettings gateway;
    ReconnectPolicy reconnect;
    PollPolicy poll;
    WritePolicy write;
    bool bufferUnknownPatches = true;
    int maxBufferedPatches = 256;
    QString logRules;
};

SessionConfig loadSessionConfig(const QJsonObject &root);

bool readSessionConfigFile(const QString &path, SessionConfig *out, QString *error = nullptr);

} // namespace homesync
