#include "gateway_http.h"

#include <utility>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

namespace homesync {

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QNetworkReply *HttpClient::get(const GatewaySettings &settings,
                               const QString &path,
                               int timeoutMs,
                               Callback callback,
                               QString *error) const
{
    return send(settings, QByteArrayLiteral("GET"), path, {}, {}, timeoutMs, std::move(callback), error);
}

QNetworkReply *HttpClient::postJson(const GatewaySettings &settings,
                                    const QString &path,
                                    const QUrlQuery &query,
                                    const QByteArray &payload,
                                    int timeoutMs,
                                    Callback callback,
                                    QString *error) const
{
    return send(settings, QByteArrayLiteral("POST"), path, query, payload, timeoutMs, std::move(callback), error);
}

bool HttpClient::buildRequest(const GatewaySettings &settings,
                              const QString &path,
                              const QUrlQuery &query,
                              bool hasJsonBody,
                              int timeoutMs,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (settings.host.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("Gateway host is empty");
        return false;
    }

    QUrl url = settings.baseUrl();
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);
    if (!query.isEmpty())
        url.setQuery(query);

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "homesync/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!settings.token.isEmpty())
        out.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + settings.token.toUtf8());
    out.setTransferTimeout(timeoutMs > 0 ? timeoutMs : 8000);

#if QT_CONFIG(ssl)
    if (settings.useTls) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        out.setSslConfiguration(ssl);
    }
#endif

    *request = out;
    if (error)
        error->clear();
    return true;
}

QNetworkReply *HttpClient::send(const GatewaySettings &settings,
                                const QByteArray &method,
                                const QString &path,
                                const QUrlQuery &query,
                                const QByteArray &payload,
                                int timeoutMs,
                                Callback callback,
                                QString *error) const
{
    if (!m_manager) {
        if (error)
            *error = QStringLiteral("Network manager unavailable");
        return nullptr;
    }

    QNetworkRequest request;
    if (!buildRequest(settings, path, query, !payload.isEmpty(), timeoutMs, &request, error))
        return nullptr;

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET"))
        reply = m_manager->get(request);
    else if (method == QByteArrayLiteral("POST"))
        reply = m_manager->post(request, payload);
    else
        reply = m_manager->sendCustomRequest(request, method, payload);

    if (!reply) {
        if (error)
            *error = QStringLiteral("Failed to create network request");
        return nullptr;
    }

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, callback = std::move(callback)]() {
        HttpResult result;
        result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        result.payload = reply->readAll();

        if (reply->error() == QNetworkReply::OperationCanceledError) {
            // Transfer timeout aborts the reply with OperationCanceledError.
            result.error = QStringLiteral("Request timed out");
        } else if (reply->error() != QNetworkReply::NoError) {
            result.error = reply->errorString();
        } else if (result.statusCode >= 200 && result.statusCode < 300) {
            result.ok = true;
        } else {
            result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
        }

        reply->deleteLater();
        if (callback)
            callback(result);
    });

    if (error)
        error->clear();
    return reply;
}

} // namespace homesync
