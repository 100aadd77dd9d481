#include <ssap/Transport/ReplayTransport.hpp>

namespace ssap {

ReplayTransport::ReplayTransport(QObject* parent)
    : ITransport(parent)
{
}

ReplayTransport::~ReplayTransport() = default;

void ReplayTransport::open(const QUrl& url)
{
    url_ = url;
    openRequested_ = true;
    openCount_++;
}

void ReplayTransport::close()
{
    openRequested_ = false;
    connected_ = false;
    closeCount_++;
}

bool ReplayTransport::sendText(const QString& message)
{
    if (!connected_) return false;
    writtenText_.append(message);
    return true;
}

bool ReplayTransport::sendBinary(const QByteArray& data)
{
    if (!connected_) return false;
    writtenBinary_.append(data);
    return true;
}

bool ReplayTransport::ping()
{
    if (!connected_ || failPings_) return false;
    pingCount_++;
    return true;
}

bool ReplayTransport::isConnected() const
{
    return connected_;
}

QUrl ReplayTransport::url() const
{
    return url_;
}

void ReplayTransport::feedText(const QString& message)
{
    emit textReceived(message);
}

void ReplayTransport::feedBinary(const QByteArray& data)
{
    emit binaryReceived(data);
}

void ReplayTransport::simulateConnect()
{
    connected_ = true;
    emit connected();
}

void ReplayTransport::simulateDisconnect()
{
    connected_ = false;
    emit disconnected();
}

void ReplayTransport::simulateError(const QString& message)
{
    emit error(message);
}

void ReplayTransport::setFailPings(bool fail)
{
    failPings_ = fail;
}

bool ReplayTransport::isOpenRequested() const { return openRequested_; }
int ReplayTransport::openCount() const { return openCount_; }
int ReplayTransport::closeCount() const { return closeCount_; }
int ReplayTransport::pingCount() const { return pingCount_; }

QList<QString> ReplayTransport::writtenText() const
{
    return writtenText_;
}

QList<QByteArray> ReplayTransport::writtenBinary() const
{
    return writtenBinary_;
}

void ReplayTransport::clearWritten()
{
    writtenText_.clear();
    writtenBinary_.clear();
}

} // namespace ssap
