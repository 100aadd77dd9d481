#pragma once

#include <QList>
#include <QMetaType>
#include <QString>
#include <cstdint>

namespace ssap {

struct DeviceDescriptor {
    QString address;
    uint16_t port = 0;
    QString name;

    bool operator==(const DeviceDescriptor& other) const {
        return address == other.address && port == other.port;
    }
    bool operator!=(const DeviceDescriptor& other) const { return !(*this == other); }
};

/// Numeric IPv4 ordering (".5" before ".12"); non-IPv4 strings sort lexically after.
bool addressLessThan(const QString& a, const QString& b);

} // namespace ssap

Q_DECLARE_METATYPE(ssap::DeviceDescriptor)
Q_DECLARE_METATYPE(QList<ssap::DeviceDescriptor>)
