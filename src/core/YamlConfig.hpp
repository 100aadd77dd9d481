#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

#include <ssap/Discovery/NetworkScanner.hpp>
#include <ssap/Session/SessionConfig.hpp>

namespace tvr {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merges the file over the defaults. Throws YAML::Exception on
    /// malformed input; the previous tree is kept in that case.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    static QString defaultConfigPath();

    // TV
    QString tvAddress() const;
    void setTvAddress(const QString& v);
    uint16_t tvPort() const;
    void setTvPort(uint16_t v);
    bool tvSecure() const;
    void setTvSecure(bool v);

    // Session
    bool heartbeatEnabled() const;
    void setHeartbeatEnabled(bool v);
    int heartbeatIntervalMs() const;
    void setHeartbeatIntervalMs(int v);
    int requestTimeoutMs() const;
    void setRequestTimeoutMs(int v);
    QString pairingType() const;
    void setPairingType(const QString& v);

    // Discovery
    QString discoveryInterface() const;
    void setDiscoveryInterface(const QString& v);
    /// "192.168.1"; empty derives it from the interface address
    QString discoverySubnet() const;
    void setDiscoverySubnet(const QString& v);
    int discoveryRangeStart() const;
    int discoveryRangeEnd() const;
    void setDiscoveryRange(int start, int end);
    uint16_t discoveryPort() const;
    int probeTimeoutMs() const;
    int maxConcurrentProbes() const;

    // Credentials
    QString credentialsPath() const;
    void setCredentialsPath(const QString& v);
    QString credentialKey() const;

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);
    QString protocolLogPath() const;
    void setProtocolLogPath(const QString& v);
    QString protocolLogFormat() const;

    /// Session settings assembled from tv.* and session.*; an unknown
    /// pairing type falls back to PIN.
    ssap::SessionConfig sessionConfig() const;
    ssap::ScanOptions scanOptions() const;

    // Generic dot-path access (e.g. "discovery.range_end")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
    static QString expandHome(const QString& path);
};

} // namespace tvr
