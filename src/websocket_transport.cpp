#include "websocket_transport.h"

#include <QNetworkRequest>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include "sync_log.h"

namespace homesync {

WebSocketTransport::WebSocketTransport(QObject *parent)
    : PushTransport(parent)
{
}

WebSocketTransport::~WebSocketTransport()
{
    releaseSocket();
}

void WebSocketTransport::setBearerToken(const QString &token)
{
    m_token = token.trimmed();
}

void WebSocketTransport::setIgnoreSslErrors(bool ignore)
{
    m_ignoreSslErrors = ignore;
}

void WebSocketTransport::open(const QUrl &url)
{
    releaseSocket();
    m_errorReported = false;

    m_socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    connect(m_socket, &QWebSocket::connected, this, &WebSocketTransport::onConnected);
    connect(m_socket, &QWebSocket::disconnected, this, &WebSocketTransport::onDisconnected);
    connect(m_socket, &QWebSocket::textMessageReceived, this, &WebSocketTransport::onTextMessageReceived);
    connect(m_socket, &QWebSocket::binaryMessageReceived, this, &WebSocketTransport::onBinaryMessageReceived);
    connect(m_socket, &QWebSocket::errorOccurred, this, &WebSocketTransport::onErrorOccurred);

    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", "homesync/1.0");
    if (!m_token.isEmpty())
        request.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + m_token.toUtf8());

#if QT_CONFIG(ssl)
    if (url.scheme() == QLatin1String("wss")) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        if (m_ignoreSslErrors)
            ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        m_socket->setSslConfiguration(ssl);
    }
#endif

    qCDebug(pushLog) << "WebSocketTransport::open - connecting to" << url.toString();
    m_socket->open(request);
}

bool WebSocketTransport::sendFrame(const QByteArray &frame)
{
    if (!isOpen())
        return false;
    const qint64 sent = m_socket->sendTextMessage(QString::fromUtf8(frame));
    return sent == frame.size();
}

void WebSocketTransport::close()
{
    if (!m_socket)
        return;
    m_socket->close(QWebSocketProtocol::CloseCodeNormal);
}

void WebSocketTransport::abort()
{
    releaseSocket();
}

bool WebSocketTransport::isOpen() const
{
    return m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

void WebSocketTransport::onConnected()
{
    emit opened();
}

void WebSocketTransport::onDisconnected()
{
    if (m_socket && m_socket->closeCode() != QWebSocketProtocol::CloseCodeNormal) {
        qCDebug(pushLog) << "WebSocketTransport closed with code" << m_socket->closeCode()
                         << m_socket->closeReason();
    }
    emit closed();
}

void WebSocketTransport::onTextMessageReceived(const QString &message)
{
    emit frameReceived(message.toUtf8());
}

void WebSocketTransport::onBinaryMessageReceived(const QByteArray &message)
{
    emit frameReceived(message);
}

void WebSocketTransport::onErrorOccurred(QAbstractSocket::SocketError error)
{
    if (m_errorReported)
        return;
    m_errorReported = true;
    const QString message = m_socket ? m_socket->errorString() : QStringLiteral("socket error %1").arg(static_cast<int>(error));
    emit errorOccurred(message);
}

void WebSocketTransport::releaseSocket()
{
    if (!m_socket)
        return;
    disconnect(m_socket, nullptr, this, nullptr);
    m_socket->abort();
    m_socket->deleteLater();
    m_socket = nullptr;
}

} // namespace homesync
