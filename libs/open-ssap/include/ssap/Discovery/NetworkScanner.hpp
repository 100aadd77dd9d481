#pragma once

#include <QObject>
#include <QThreadPool>
#include <memory>

#include <ssap/Discovery/DeviceDescriptor.hpp>
#include <ssap/Discovery/IHostProber.hpp>
#include <ssap/Version.hpp>

namespace ssap {

struct ScanOptions {
    QString subnetPrefix;         // empty → derived from the local interface
    QString interfaceName;        // preferred interface for the derivation
    int rangeStart = 1;           // DHCP tends to hand out the low end first
    int rangeEnd = 20;
    uint16_t port = DEFAULT_SECURE_PORT;
    int probeTimeout = 200;       // ms
    int maxConcurrentProbes = 50;
};

class ScanAccumulator;

/// One-shot sweep of subnetPrefix.rangeStart..rangeEnd for hosts accepting
/// TCP on the TV port. Probes run on a thread pool capped at
/// maxConcurrentProbes; finds are reported as they happen and once more,
/// sorted, when the last probe returns.
class NetworkScanner : public QObject {
    Q_OBJECT
public:
    /// prober is not owned; nullptr uses a TcpHostProber.
    explicit NetworkScanner(IHostProber* prober = nullptr, QObject* parent = nullptr);
    ~NetworkScanner() override;

    /// False if a sweep is running or no subnet could be determined
    /// (scanFailed is emitted for the latter).
    bool scan(const ScanOptions& options);

    bool isScanning() const;
    QList<DeviceDescriptor> results() const;

    static QString deviceName(const QString& address);

signals:
    void scanStarted(const QString& subnetPrefix, int hostCount);
    void deviceFound(const ssap::DeviceDescriptor& device);
    void finished(const QList<ssap::DeviceDescriptor>& devices);
    void scanFailed(const QString& reason);

private:
    void finish(const std::shared_ptr<ScanAccumulator>& accumulator);

    std::unique_ptr<IHostProber> ownedProber_;
    IHostProber* prober_;
    QThreadPool pool_;
    bool scanning_ = false;
    QList<DeviceDescriptor> results_;
};

} // namespace ssap
