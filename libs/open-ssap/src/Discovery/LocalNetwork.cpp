#include <ssap/Discovery/LocalNetwork.hpp>
#include <QHostAddress>
#include <QNetworkInterface>
#include <QDebug>

namespace ssap {

QString LocalNetwork::localIPv4Address(const QString& interfaceName)
{
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface& iface : interfaces) {
        if (!interfaceName.isEmpty() && iface.name() != interfaceName)
            continue;

        const auto flags = iface.flags();
        if (!(flags & QNetworkInterface::IsUp) || !(flags & QNetworkInterface::IsRunning))
            continue;
        if (flags & QNetworkInterface::IsLoopBack)
            continue;

        for (const QNetworkAddressEntry& entry : iface.addressEntries()) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() == QAbstractSocket::IPv4Protocol && !ip.isLoopback())
                return ip.toString();
        }
    }

    qDebug() << "[LocalNetwork] no usable IPv4 address"
             << (interfaceName.isEmpty() ? QString() : QStringLiteral("on ") + interfaceName);
    return {};
}

QString LocalNetwork::subnetPrefix(const QString& interfaceName)
{
    return prefixOf(localIPv4Address(interfaceName));
}

QString LocalNetwork::prefixOf(const QString& ipv4Address)
{
    QHostAddress addr;
    if (!addr.setAddress(ipv4Address) || addr.protocol() != QAbstractSocket::IPv4Protocol)
        return {};

    const QStringList parts = ipv4Address.trimmed().split('.');
    if (parts.size() != 4)
        return {};
    return parts.mid(0, 3).join('.');
}

} // namespace ssap
