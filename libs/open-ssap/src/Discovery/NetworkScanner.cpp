#include <ssap/Discovery/NetworkScanner.hpp>
#include <ssap/Discovery/LocalNetwork.hpp>
#include <QMetaObject>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QDebug>
#include <algorithm>

namespace ssap {

/// Result set shared by all probes of one sweep. Every access goes through
/// the mutex; once sealed no further finds are accepted.
class ScanAccumulator {
public:
    explicit ScanAccumulator(int outstanding) : outstanding_(outstanding) {}

    /// True if the device was new.
    bool add(const DeviceDescriptor& device)
    {
        QMutexLocker lock(&mutex_);
        if (sealed_ || seen_.contains(device.address)) return false;
        seen_.insert(device.address);
        devices_.append(device);
        return true;
    }

    /// True for the probe that brings the outstanding count to zero.
    bool completeProbe()
    {
        QMutexLocker lock(&mutex_);
        return --outstanding_ == 0;
    }

    QList<DeviceDescriptor> seal()
    {
        QMutexLocker lock(&mutex_);
        sealed_ = true;
        QList<DeviceDescriptor> sorted = devices_;
        std::sort(sorted.begin(), sorted.end(),
                  [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
                      return addressLessThan(a.address, b.address);
                  });
        return sorted;
    }

private:
    QMutex mutex_;
    int outstanding_;
    bool sealed_ = false;
    QSet<QString> seen_;
    QList<DeviceDescriptor> devices_;
};

NetworkScanner::NetworkScanner(IHostProber* prober, QObject* parent)
    : QObject(parent)
    , prober_(prober)
{
    if (!prober_) {
        ownedProber_ = std::make_unique<TcpHostProber>();
        prober_ = ownedProber_.get();
    }
}

NetworkScanner::~NetworkScanner()
{
    pool_.waitForDone();
}

bool NetworkScanner::scan(const ScanOptions& options)
{
    if (scanning_) {
        qDebug() << "[NetworkScanner] scan already running";
        return false;
    }

    QString prefix = options.subnetPrefix;
    if (prefix.isEmpty())
        prefix = LocalNetwork::subnetPrefix(options.interfaceName);
    if (prefix.isEmpty()) {
        qWarning() << "[NetworkScanner] no local IPv4 network";
        results_.clear();
        emit scanFailed(QStringLiteral("No network"));
        return false;
    }

    const int first = qBound(1, options.rangeStart, 254);
    const int last = qBound(1, options.rangeEnd, 254);
    const int hostCount = last >= first ? last - first + 1 : 0;

    scanning_ = true;
    results_.clear();
    pool_.setMaxThreadCount(qMax(1, options.maxConcurrentProbes));

    qInfo() << "[NetworkScanner] scanning" << prefix + ".x" << first << "-" << last
            << "port" << options.port;
    emit scanStarted(prefix, hostCount);

    auto accumulator = std::make_shared<ScanAccumulator>(hostCount);
    if (hostCount == 0) {
        QMetaObject::invokeMethod(this, [this, accumulator]() { finish(accumulator); },
                                  Qt::QueuedConnection);
        return true;
    }

    IHostProber* prober = prober_;
    const uint16_t port = options.port;
    const int timeout = options.probeTimeout;

    for (int host = first; host <= last; ++host) {
        const QString address = QStringLiteral("%1.%2").arg(prefix).arg(host);
        pool_.start([this, accumulator, prober, address, port, timeout]() {
            if (prober->probe(address, port, timeout)) {
                DeviceDescriptor device{address, port, deviceName(address)};
                if (accumulator->add(device)) {
                    QMetaObject::invokeMethod(this, [this, device]() {
                        qInfo() << "[NetworkScanner] found" << device.address;
                        results_.append(device);
                        emit deviceFound(device);
                    }, Qt::QueuedConnection);
                }
            }
            if (accumulator->completeProbe()) {
                QMetaObject::invokeMethod(this, [this, accumulator]() { finish(accumulator); },
                                          Qt::QueuedConnection);
            }
        });
    }
    return true;
}

bool NetworkScanner::isScanning() const
{
    return scanning_;
}

QList<DeviceDescriptor> NetworkScanner::results() const
{
    return results_;
}

QString NetworkScanner::deviceName(const QString& address)
{
    return QStringLiteral("LG webOS TV (%1)").arg(address);
}

void NetworkScanner::finish(const std::shared_ptr<ScanAccumulator>& accumulator)
{
    results_ = accumulator->seal();
    scanning_ = false;
    qInfo() << "[NetworkScanner] sweep complete," << results_.size() << "device(s)";
    emit finished(results_);
}

} // namespace ssap
