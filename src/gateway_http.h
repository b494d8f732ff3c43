#pragma once

#include <functional>

#include <QByteArray>
#include <QString>
#include <QUrlQuery>

#include "sync_config.h"

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace homesync {

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

// Thin asynchronous wrapper over QNetworkAccessManager. Requests never block;
// the callback runs once from the event loop when the reply finishes or the
// transfer timeout expires. Aborting a returned reply after disconnecting it
// suppresses the callback.
class HttpClient
{
public:
    using Callback = std::function<void(const HttpResult &)>;

    explicit HttpClient(QNetworkAccessManager *manager);

    QNetworkReply *get(const GatewaySettings &settings,
                       const QString &path,
                       int timeoutMs,
                       Callback callback,
                       QString *error = nullptr) const;

    QNetworkReply *postJson(const GatewaySettings &settings,
                            const QString &path,
                            const QUrlQuery &query,
                            const QByteArray &payload,
                            int timeoutMs,
                            Callback callback,
                            QString *error = nullptr) const;

    bool buildRequest(const GatewaySettings &settings,
                      const QString &path,
                      const QUrlQuery &query,
                      bool hasJsonBody,
                      int timeoutMs,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

private:
    QNetworkReply *send(const GatewaySettings &settings,
                        const QByteArray &method,
                        const QString &path,
                        const QUrlQuery &query,
                        const QByteArray &payload,
                        int timeoutMs,
                        Callback callback,
                        QString *error) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace homesync
