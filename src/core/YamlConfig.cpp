#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <ssap/Protocol/MessageCodec.hpp>
#include <fstream>

namespace tvr {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["tv"]["address"] = "";
    root_["tv"]["port"] = static_cast<int>(ssap::DEFAULT_SECURE_PORT);
    root_["tv"]["secure"] = true;

    root_["session"]["heartbeat_enabled"] = true;
    root_["session"]["heartbeat_interval_ms"] = ssap::DEFAULT_HEARTBEAT_INTERVAL_MS;
    root_["session"]["request_timeout_ms"] = 0;
    root_["session"]["pairing_type"] = "PIN";

    root_["discovery"]["interface"] = "";
    root_["discovery"]["subnet"] = "";
    root_["discovery"]["range_start"] = 1;
    root_["discovery"]["range_end"] = 20;
    root_["discovery"]["port"] = static_cast<int>(ssap::DEFAULT_SECURE_PORT);
    root_["discovery"]["probe_timeout_ms"] = 200;
    root_["discovery"]["max_concurrent_probes"] = 50;

    root_["credentials"]["path"] = "~/.config/tvremote/credentials.yaml";
    root_["credentials"]["key"] = "webos_client_key";

    root_["logging"]["level"] = "info";
    root_["logging"]["protocol_log"] = "";
    root_["logging"]["protocol_format"] = "tsv";
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node defaults = buildDefaultsNode();
    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QString YamlConfig::defaultConfigPath()
{
    return QDir::homePath() + QStringLiteral("/.config/tvremote/config.yaml");
}

QString YamlConfig::expandHome(const QString& path)
{
    if (path == QLatin1String("~"))
        return QDir::homePath();
    if (path.startsWith(QLatin1String("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

// --- TV ---

QString YamlConfig::tvAddress() const
{
    return QString::fromStdString(root_["tv"]["address"].as<std::string>(""));
}

void YamlConfig::setTvAddress(const QString& v)
{
    root_["tv"]["address"] = v.toStdString();
}

uint16_t YamlConfig::tvPort() const
{
    return root_["tv"]["port"].as<uint16_t>(ssap::DEFAULT_SECURE_PORT);
}

void YamlConfig::setTvPort(uint16_t v)
{
    root_["tv"]["port"] = static_cast<int>(v);
}

bool YamlConfig::tvSecure() const
{
    return root_["tv"]["secure"].as<bool>(true);
}

void YamlConfig::setTvSecure(bool v)
{
    root_["tv"]["secure"] = v;
}

// --- Session ---

bool YamlConfig::heartbeatEnabled() const
{
    return root_["session"]["heartbeat_enabled"].as<bool>(true);
}

void YamlConfig::setHeartbeatEnabled(bool v)
{
    root_["session"]["heartbeat_enabled"] = v;
}

int YamlConfig::heartbeatIntervalMs() const
{
    return root_["session"]["heartbeat_interval_ms"].as<int>(ssap::DEFAULT_HEARTBEAT_INTERVAL_MS);
}

void YamlConfig::setHeartbeatIntervalMs(int v)
{
    root_["session"]["heartbeat_interval_ms"] = v;
}

int YamlConfig::requestTimeoutMs() const
{
    return root_["session"]["request_timeout_ms"].as<int>(0);
}

void YamlConfig::setRequestTimeoutMs(int v)
{
    root_["session"]["request_timeout_ms"] = v;
}

QString YamlConfig::pairingType() const
{
    return QString::fromStdString(root_["session"]["pairing_type"].as<std::string>("PIN"));
}

void YamlConfig::setPairingType(const QString& v)
{
    root_["session"]["pairing_type"] = v.toStdString();
}

// --- Discovery ---

QString YamlConfig::discoveryInterface() const
{
    return QString::fromStdString(root_["discovery"]["interface"].as<std::string>(""));
}

void YamlConfig::setDiscoveryInterface(const QString& v)
{
    root_["discovery"]["interface"] = v.toStdString();
}

QString YamlConfig::discoverySubnet() const
{
    return QString::fromStdString(root_["discovery"]["subnet"].as<std::string>(""));
}

void YamlConfig::setDiscoverySubnet(const QString& v)
{
    root_["discovery"]["subnet"] = v.toStdString();
}

int YamlConfig::discoveryRangeStart() const
{
    return root_["discovery"]["range_start"].as<int>(1);
}

int YamlConfig::discoveryRangeEnd() const
{
    return root_["discovery"]["range_end"].as<int>(20);
}

void YamlConfig::setDiscoveryRange(int start, int end)
{
    root_["discovery"]["range_start"] = start;
    root_["discovery"]["range_end"] = end;
}

uint16_t YamlConfig::discoveryPort() const
{
    return root_["discovery"]["port"].as<uint16_t>(ssap::DEFAULT_SECURE_PORT);
}

int YamlConfig::probeTimeoutMs() const
{
    return root_["discovery"]["probe_timeout_ms"].as<int>(200);
}

int YamlConfig::maxConcurrentProbes() const
{
    return root_["discovery"]["max_concurrent_probes"].as<int>(50);
}

// --- Credentials ---

QString YamlConfig::credentialsPath() const
{
    return expandHome(QString::fromStdString(root_["credentials"]["path"].as<std::string>("")));
}

void YamlConfig::setCredentialsPath(const QString& v)
{
    root_["credentials"]["path"] = v.toStdString();
}

QString YamlConfig::credentialKey() const
{
    return QString::fromStdString(root_["credentials"]["key"].as<std::string>("webos_client_key"));
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

QString YamlConfig::protocolLogPath() const
{
    return expandHome(QString::fromStdString(root_["logging"]["protocol_log"].as<std::string>("")));
}

void YamlConfig::setProtocolLogPath(const QString& v)
{
    root_["logging"]["protocol_log"] = v.toStdString();
}

QString YamlConfig::protocolLogFormat() const
{
    return QString::fromStdString(root_["logging"]["protocol_format"].as<std::string>("tsv"));
}

// --- Derived settings ---

ssap::SessionConfig YamlConfig::sessionConfig() const
{
    ssap::SessionConfig config;
    config.secure = tvSecure();
    config.port = tvPort();
    ssap::PairingType type = ssap::PairingType::Pin;
    if (ssap::MessageCodec::pairingTypeFromName(pairingType(), type) && type != ssap::PairingType::None)
        config.pairingType = type;
    config.credentialKey = credentialKey();
    config.heartbeatEnabled = heartbeatEnabled();
    config.heartbeatInterval = qMax(1, heartbeatIntervalMs());
    config.requestTimeout = qMax(0, requestTimeoutMs());
    return config;
}

ssap::ScanOptions YamlConfig::scanOptions() const
{
    ssap::ScanOptions options;
    options.subnetPrefix = discoverySubnet();
    options.interfaceName = discoveryInterface();
    options.rangeStart = discoveryRangeStart();
    options.rangeEnd = discoveryRangeEnd();
    options.port = discoveryPort();
    options.probeTimeout = probeTimeoutMs();
    options.maxConcurrentProbes = maxConcurrentProbes();
    return options;
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only known leaf keys are writable
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
        node[leafKey] = value.toInt();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace tvr
