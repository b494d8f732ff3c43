#include "gateway_client.h"

#include <utility>

#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>

#include "device_json.h"
#include "sync_log.h"

namespace homesync {

GatewayClient::GatewayClient(const GatewaySettings &settings, int fetchTimeoutMs, int writeTimeoutMs, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_fetchTimeoutMs(fetchTimeoutMs)
    , m_writeTimeoutMs(writeTimeoutMs)
    , m_manager(new QNetworkAccessManager(this))
    , m_http(m_manager)
{
}

GatewayClient::~GatewayClient()
{
    cancelAll();
}

void GatewayClient::fetchDevices(FetchCallback callback)
{
    QString error;
    QNetworkReply *reply = m_http.get(m_settings, m_settings.devicesPath, m_fetchTimeoutMs,
        [callback](const HttpResult &http) {
            FetchResult result;
            if (!http.ok) {
                result.error = http.error;
                if (http.statusCode > 0 && !http.payload.isEmpty())
                    result.error += QStringLiteral(": ") + QString::fromUtf8(http.payload.left(200));
            } else {
                result.ok = parseDeviceList(http.payload, &result.devices, &result.error);
            }
            if (result.ok)
                qCDebug(gatewayLog) << "device list fetched," << result.devices.size() << "devices";
            if (callback)
                callback(result);
        }, &error);

    if (!reply) {
        qCWarning(gatewayLog) << "GatewayClient::fetchDevices -" << error;
        // Keep the callback asynchronous even when the request never left.
        QTimer::singleShot(0, this, [callback, error]() {
            FetchResult result;
            result.error = error;
            if (callback)
                callback(result);
        });
        return;
    }
    track(reply);
}

void GatewayClient::writeProperties(const QString &deviceId, const QJsonObject &properties, WriteCallback callback)
{
    const QByteArray body = QJsonDocument(properties).toJson(QJsonDocument::Compact);
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("state"), QString::fromUtf8(body));

    QString error;
    QNetworkReply *reply = m_http.postJson(m_settings, m_settings.setPathPrefix + deviceId, query, body,
        m_writeTimeoutMs, [deviceId, callback](const HttpResult &http) {
            WriteResult result;
            result.ok = http.ok;
            result.error = http.error;
            if (!http.ok)
                qCWarning(gatewayLog) << "write to" << deviceId << "failed:" << http.error;
            if (callback)
                callback(result);
        }, &error);

    if (!reply) {
        qCWarning(gatewayLog) << "GatewayClient::writeProperties -" << error;
        QTimer::singleShot(0, this, [callback, error]() {
            WriteResult result;
            result.error = error;
            if (callback)
                callback(result);
        });
        return;
    }
    qCDebug(gatewayLog).noquote() << "write" << deviceId << QString::fromUtf8(body);
    track(reply);
}

void GatewayClient::requestRefresh(const QString &deviceId)
{
    QString error;
    QNetworkReply *reply = m_http.postJson(m_settings, m_settings.refreshPathPrefix + deviceId, {}, {},
        m_writeTimeoutMs, [deviceId](const HttpResult &http) {
            if (!http.ok)
                qCWarning(gatewayLog) << "refresh of" << deviceId << "failed:" << http.error;
        }, &error);
    if (!reply) {
        qCWarning(gatewayLog) << "GatewayClient::requestRefresh -" << error;
        return;
    }
    track(reply);
}

void GatewayClient::cancelAll()
{
    const QSet<QNetworkReply *> replies = std::exchange(m_replies, {});
    for (QNetworkReply *reply : replies) {
        disconnect(reply, nullptr, nullptr, nullptr);
        reply->abort();
        reply->deleteLater();
    }
}

void GatewayClient::track(QNetworkReply *reply)
{
    m_replies.insert(reply);
    connect(reply, &QObject::destroyed, this, [this, reply]() {
        m_replies.remove(reply);
    });
}

} // namespace homesync
