#pragma once

#include <QString>

namespace ssap {

class LocalNetwork {
public:
    /// IPv4 address of the named interface, or of the first interface that is
    /// up, running and not loopback when the name is empty. Empty if none.
    static QString localIPv4Address(const QString& interfaceName = {});

    /// "192.168.1" for the local address; empty when there is no usable one.
    static QString subnetPrefix(const QString& interfaceName = {});

    /// "192.168.1.34" → "192.168.1"; empty for anything that is not dotted IPv4.
    static QString prefixOf(const QString& ipv4Address);
};

} // namespace ssap
