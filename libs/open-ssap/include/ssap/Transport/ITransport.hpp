#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QUrl>

namespace ssap {

/// One bidirectional message channel to the TV.
/// A session holds two of these: the primary (SSAP requests) and the
/// secondary (pointer/key input socket).
class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;

    virtual void open(const QUrl& url) = 0;
    virtual void close() = 0;

    /// Returns false if the channel is not open; nothing is queued.
    virtual bool sendText(const QString& message) = 0;
    virtual bool sendBinary(const QByteArray& data) = 0;
    virtual bool ping() = 0;

    virtual bool isConnected() const = 0;
    virtual QUrl url() const = 0;

signals:
    void connected();
    void disconnected();
    void textReceived(const QString& message);
    void binaryReceived(const QByteArray& data);
    void error(const QString& message);
};

} // namespace ssap
