#pragma once

#include <QPointer>
#include <QWebSocket>

#include "push_transport.h"

namespace homesync {

class WebSocketTransport final : public PushTransport
{
    Q_OBJECT
public:
    explicit WebSocketTransport(QObject *parent = nullptr);
    ~WebSocketTransport() override;

    void setBearerToken(const QString &token);
    void setIgnoreSslErrors(bool ignore);

    void open(const QUrl &url) override;
    bool sendFrame(const QByteArray &frame) override;
    void close() override;
    void abort() override;
    bool isOpen() const override;

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessageReceived(const QString &message);
    void onBinaryMessageReceived(const QByteArray &message);
    void onErrorOccurred(QAbstractSocket::SocketError error);

private:
    void releaseSocket();

    QPointer<QWebSocket> m_socket;
    QString m_token;
    bool m_ignoreSslErrors = true;
    bool m_errorReported = false;
};

} // namespace homesync
