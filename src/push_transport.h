#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QUrl>

namespace homesync {

// Duplex frame channel used by PushChannelManager. The handshake belongs to
// the implementation; the manager only sees frames and lifecycle signals.
//
// After open() an implementation emits opened() or errorOccurred(). An error
// may be followed by closed(); callers treat the first of the two as the
// failure. abort() tears the channel down without any further signal.
class PushTransport : public QObject
{
    Q_OBJECT
public:
    explicit PushTransport(QObject *parent = nullptr) : QObject(parent) {}
    ~PushTransport() override = default;

    virtual void open(const QUrl &url) = 0;
    virtual bool sendFrame(const QByteArray &frame) = 0;
    // Graceful close; closed() follows.
    virtual void close() = 0;
    // Immediate teardown without any further signal.
    virtual void abort() = 0;
    virtual bool isOpen() const = 0;

signals:
    void opened();
    void frameReceived(const QByteArray &frame);
    void errorOccurred(const QString &message);
    void closed();
};

} // namespace homesync
