#include <ssap/Transport/WebSocketTransport.hpp>
#include <QDebug>

namespace ssap {

WebSocketTransport::WebSocketTransport(QObject* parent)
    : ITransport(parent)
{
}

WebSocketTransport::~WebSocketTransport()
{
    close();
}

void WebSocketTransport::setIgnoreSslErrors(bool ignore)
{
    ignoreSslErrors_ = ignore;
}

void WebSocketTransport::open(const QUrl& url)
{
    close();

    url_ = url;
    socket_ = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    connectSocketSignals();
    qDebug() << "[WebSocketTransport] opening" << url_.toString();
    socket_->open(url_);
}

void WebSocketTransport::close()
{
    if (!socket_) return;

    disconnectSocketSignals();
    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->close(QWebSocketProtocol::CloseCodeGoingAway);
    }
    socket_->deleteLater();
    socket_ = nullptr;
}

bool WebSocketTransport::sendText(const QString& message)
{
    if (!isConnected()) {
        qWarning() << "[WebSocketTransport] text DROPPED:" << message.size()
                   << "chars (socket state:" << (socket_ ? (int)socket_->state() : -1) << ")";
        return false;
    }
    socket_->sendTextMessage(message);
    return true;
}

bool WebSocketTransport::sendBinary(const QByteArray& data)
{
    if (!isConnected()) {
        qWarning() << "[WebSocketTransport] binary DROPPED:" << data.size() << "bytes";
        return false;
    }
    socket_->sendBinaryMessage(data);
    return true;
}

bool WebSocketTransport::ping()
{
    if (!isConnected()) return false;
    socket_->ping();
    return true;
}

bool WebSocketTransport::isConnected() const
{
    return socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

QUrl WebSocketTransport::url() const
{
    return url_;
}

void WebSocketTransport::connectSocketSignals()
{
    connect(socket_, &QWebSocket::connected, this, &WebSocketTransport::connected);
    connect(socket_, &QWebSocket::disconnected, this, &WebSocketTransport::disconnected);
    connect(socket_, &QWebSocket::textMessageReceived, this, &WebSocketTransport::textReceived);
    connect(socket_, &QWebSocket::binaryMessageReceived, this, &WebSocketTransport::binaryReceived);
    connect(socket_, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit error(socket_->errorString());
    });
#ifndef QT_NO_SSL
    connect(socket_, &QWebSocket::sslErrors, this, [this](const QList<QSslError>& errors) {
        if (!ignoreSslErrors_) return;
        qDebug() << "[WebSocketTransport] ignoring" << errors.size() << "TLS errors";
        socket_->ignoreSslErrors();
    });
#endif
}

void WebSocketTransport::disconnectSocketSignals()
{
    disconnect(socket_, nullptr, this, nullptr);
}

} // namespace ssap
