#pragma once

#include <ssap/Transport/ITransport.hpp>
#include <QWebSocket>

namespace ssap {

class WebSocketTransport : public ITransport {
    Q_OBJECT
public:
    explicit WebSocketTransport(QObject* parent = nullptr);
    ~WebSocketTransport() override;

    /// TVs serve a self-signed certificate on the secure port.
    void setIgnoreSslErrors(bool ignore);

    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& message) override;
    bool sendBinary(const QByteArray& data) override;
    bool ping() override;
    bool isConnected() const override;
    QUrl url() const override;

private:
    void connectSocketSignals();
    void disconnectSocketSignals();

    QWebSocket* socket_ = nullptr;
    QUrl url_;
    bool ignoreSslErrors_ = true;
};

} // namespace ssap
