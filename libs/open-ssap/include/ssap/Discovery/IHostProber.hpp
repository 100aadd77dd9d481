#pragma once

#include <QString>
#include <cstdint>

namespace ssap {

/// Reachability check for one host. Called concurrently from scanner
/// worker threads; implementations must be thread-safe.
class IHostProber {
public:
    virtual ~IHostProber() = default;

    /// True iff a TCP connection to address:port completes within timeoutMs.
    virtual bool probe(const QString& address, uint16_t port, int timeoutMs) = 0;
};

class TcpHostProber : public IHostProber {
public:
    bool probe(const QString& address, uint16_t port, int timeoutMs) override;
};

} // namespace ssap
