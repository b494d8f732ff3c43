#pragma once

#include <functional>

#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <QString>

#include "gateway_http.h"
#include "sync_config.h"
#include "sync_types.h"

class QNetworkAccessManager;
class QNetworkReply;

namespace homesync {

struct FetchResult {
    bool ok = false;
    DeviceList devices;
    QString error;
};

struct WriteResult {
    bool ok = false;
    QString error;
};

// Request/response source of full device snapshots. The callback runs once,
// asynchronously, unless cancelAll() was called first.
class SnapshotSource
{
public:
    using FetchCallback = std::function<void(const FetchResult &)>;

    virtual ~SnapshotSource() = default;
    virtual void fetchDevices(FetchCallback callback) = 0;
    virtual void cancelAll() = 0;
};

// Remote write endpoint. Same callback contract as SnapshotSource.
class WriteSink
{
public:
    using WriteCallback = std::function<void(const WriteResult &)>;

    virtual ~WriteSink() = default;
    virtual void writeProperties(const QString &deviceId, const QJsonObject &properties, WriteCallback callback) = 0;
    // Fire-and-forget request asking the gateway to re-read one device.
    virtual void requestRefresh(const QString &deviceId) = 0;
    virtual void cancelAll() = 0;
};

class GatewayClient : public QObject, public SnapshotSource, public WriteSink
{
    Q_OBJECT
public:
    GatewayClient(const GatewaySettings &settings, int fetchTimeoutMs, int writeTimeoutMs, QObject *parent = nullptr);
    ~GatewayClient() override;

    const GatewaySettings &settings() const { return m_settings; }

    void fetchDevices(FetchCallback callback) override;
    void writeProperties(const QString &deviceId, const QJsonObject &properties, WriteCallback callback) override;
    void requestRefresh(const QString &deviceId) override;
    void cancelAll() override;

private:
    void track(QNetworkReply *reply);

    GatewaySettings m_settings;
    int m_fetchTimeoutMs = 8000;
    int m_writeTimeoutMs = 8000;
    QNetworkAccessManager *m_manager = nullptr;
    HttpClient m_http;
    QSet<QNetworkReply *> m_replies;
};

} // namespace homesync
