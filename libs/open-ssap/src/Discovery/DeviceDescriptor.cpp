#include <ssap/Discovery/DeviceDescriptor.hpp>
#include <QHostAddress>

namespace ssap {

bool addressLessThan(const QString& a, const QString& b)
{
    QHostAddress ha;
    QHostAddress hb;
    const bool va = ha.setAddress(a) && ha.protocol() == QAbstractSocket::IPv4Protocol;
    const bool vb = hb.setAddress(b) && hb.protocol() == QAbstractSocket::IPv4Protocol;
    if (va && vb) return ha.toIPv4Address() < hb.toIPv4Address();
    if (va != vb) return va;
    return a < b;
}

} // namespace ssap
