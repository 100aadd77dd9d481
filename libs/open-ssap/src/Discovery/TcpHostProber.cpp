#include <ssap/Discovery/IHostProber.hpp>
#include <QHostAddress>
#include <QTcpSocket>

namespace ssap {

bool TcpHostProber::probe(const QString& address, uint16_t port, int timeoutMs)
{
    // Socket lives entirely on the calling worker thread.
    QTcpSocket socket;
    socket.connectToHost(QHostAddress(address), port);
    const bool open = socket.waitForConnected(timeoutMs);
    socket.abort();
    return open;
}

} // namespace ssap
