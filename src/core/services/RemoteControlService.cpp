#include "RemoteControlService.hpp"
#include <ssap/Transport/WebSocketTransport.hpp>
#include <boost/log/trivial.hpp>

namespace tvr {

RemoteControlService::RemoteControlService(const YamlConfig& config,
                                           ssap::ICredentialStore* credentials,
                                           QObject* parent)
    : RemoteControlService(config, credentials,
                           new ssap::WebSocketTransport(),
                           new ssap::WebSocketTransport(),
                           nullptr, parent)
{
    // Production transports live as long as the service
    primary_->setParent(this);
    secondary_->setParent(this);
}

RemoteControlService::RemoteControlService(const YamlConfig& config,
                                           ssap::ICredentialStore* credentials,
                                           ssap::ITransport* primary,
                                           ssap::ITransport* secondary,
                                           ssap::IHostProber* prober,
                                           QObject* parent)
    : QObject(parent)
    , scanOptions_(config.scanOptions())
    , credentials_(credentials)
    , credentialKey_(config.credentialKey())
    , primary_(primary)
    , secondary_(secondary)
    , session_(std::make_unique<ssap::WebOSSession>(primary, secondary, credentials,
                                                    config.sessionConfig()))
    , scanner_(std::make_unique<ssap::NetworkScanner>(prober))
{
    const QString logPath = config.protocolLogPath();
    if (!logPath.isEmpty()) {
        protocolLogger_ = std::make_unique<ssap::ProtocolLogger>();
        if (config.protocolLogFormat().compare(QLatin1String("jsonl"), Qt::CaseInsensitive) == 0)
            protocolLogger_->setFormat(ssap::ProtocolLogger::OutputFormat::Jsonl);
        protocolLogger_->open(logPath.toStdString());
        if (protocolLogger_->isOpen()) {
            protocolLogger_->attach(session_.get());
        } else {
            BOOST_LOG_TRIVIAL(warning) << "RemoteControlService: protocol log unavailable at "
                                       << logPath.toStdString();
            protocolLogger_.reset();
        }
    }

    wire();
}

RemoteControlService::~RemoteControlService()
{
    if (protocolLogger_)
        protocolLogger_->detach();
    session_->disconnectFromDevice();
}

void RemoteControlService::wire()
{
    connect(session_.get(), &ssap::WebOSSession::stateChanged,
            this, &RemoteControlService::onStateChanged);
    connect(session_.get(), &ssap::WebOSSession::errorOccurred,
            this, &RemoteControlService::onSessionError);
    connect(session_.get(), &ssap::WebOSSession::registered, this, [this](const QString&) {
        setLastError({});
        emit credentialChanged();
        emit paired();
    });
    connect(session_.get(), &ssap::WebOSSession::pinRequired,
            this, &RemoteControlService::pinRequested);
    connect(session_.get(), &ssap::WebOSSession::requestFailed,
            this, [](const QString& id, const QString& message) {
        BOOST_LOG_TRIVIAL(debug) << "RemoteControlService: request " << id.toStdString()
                                 << " failed: " << message.toStdString();
    });

    connect(scanner_.get(), &ssap::NetworkScanner::deviceFound,
            this, &RemoteControlService::onDeviceFound);
    connect(scanner_.get(), &ssap::NetworkScanner::finished,
            this, &RemoteControlService::onScanFinished);
    connect(scanner_.get(), &ssap::NetworkScanner::scanFailed,
            this, &RemoteControlService::onScanFailed);
}

// --- Commands ---

void RemoteControlService::connectToTv(const QString& address)
{
    BOOST_LOG_TRIVIAL(info) << "RemoteControlService: connecting to " << address.toStdString();
    endStatus_.clear();
    session_->connectToDevice(address);
}

void RemoteControlService::disconnectFromTv()
{
    endStatus_.clear();
    session_->disconnectFromDevice();
}

bool RemoteControlService::submitPin(const QString& pin)
{
    return session_->submitPin(pin.trimmed());
}

bool RemoteControlService::sendCommand(const ssap::RemoteCommand& command)
{
    if (!session_->sendCommand(command)) {
        BOOST_LOG_TRIVIAL(warning) << "RemoteControlService: "
                                   << ssap::CommandTable::name(command.action).toStdString()
                                   << " not sent: " << lastError_.toStdString();
        return false;
    }
    return true;
}

bool RemoteControlService::sendCommandByName(const QString& name, const QString& argument)
{
    ssap::CommandAction action;
    if (!ssap::CommandTable::fromName(name, action)) {
        setLastError(QStringLiteral("Unknown command: %1").arg(name));
        return false;
    }

    ssap::RemoteCommand command(action);
    if (ssap::CommandTable::requiresArgument(action)) {
        if (argument.isEmpty()) {
            setLastError(QStringLiteral("%1 needs an argument").arg(name));
            return false;
        }
        if (action == ssap::CommandAction::SetVolume) {
            bool ok = false;
            const int level = argument.toInt(&ok);
            if (!ok) {
                setLastError(QStringLiteral("Invalid volume level: %1").arg(argument));
                return false;
            }
            command = ssap::RemoteCommand::setVolume(level);
        } else if (action == ssap::CommandAction::LaunchApp) {
            command = ssap::RemoteCommand::launchApp(argument);
        } else {
            command = ssap::RemoteCommand::selectInput(argument);
        }
    }
    return sendCommand(command);
}

bool RemoteControlService::scanForDevices()
{
    if (scanner_->isScanning())
        return false;

    discovered_.clear();
    emit discoveredDevicesChanged();

    if (!scanner_->scan(scanOptions_))
        return false;

    setStatus(QStringLiteral("Scanning..."));
    emit scanningChanged();
    return true;
}

void RemoteControlService::forgetPairing()
{
    session_->forgetCredential();
    emit credentialChanged();
}

// --- Session observers ---

QString RemoteControlService::statusForState(ssap::SessionState state)
{
    switch (state) {
    case ssap::SessionState::Idle:                  return QStringLiteral("Disconnected");
    case ssap::SessionState::Connecting:            return QStringLiteral("Connecting...");
    case ssap::SessionState::AwaitingRegistration:  return QStringLiteral("Connected");
    case ssap::SessionState::AwaitingPairingPrompt: return QStringLiteral("Pairing required");
    case ssap::SessionState::AwaitingPin:           return QStringLiteral("Enter PIN from TV");
    case ssap::SessionState::Paired:                return QStringLiteral("Connected & Paired");
    case ssap::SessionState::Disconnected:          return {};
    }
    return {};
}

void RemoteControlService::onStateChanged(ssap::SessionState state)
{
    BOOST_LOG_TRIVIAL(debug) << "RemoteControlService: session "
                             << ssap::sessionStateName(state);

    if (state == ssap::SessionState::Disconnected)
        setStatus(endStatus_.isEmpty() ? QStringLiteral("Disconnected") : endStatus_);
    else
        setStatus(statusForState(state));
    emit phaseChanged();
}

void RemoteControlService::onSessionError(ssap::SessionError error, const QString& message)
{
    BOOST_LOG_TRIVIAL(warning) << "RemoteControlService: "
                               << ssap::sessionErrorName(error)
                               << ": " << message.toStdString();
    setLastError(message);

    switch (error) {
    case ssap::SessionError::CannotReachDevice:
        endStatus_ = QStringLiteral("Cannot reach device");
        setStatus(endStatus_);
        break;
    case ssap::SessionError::ConnectionLost:
        endStatus_ = QStringLiteral("Connection lost");
        setStatus(endStatus_);
        break;
    case ssap::SessionError::PairingRejected:
        setStatus(QStringLiteral("Pairing rejected - wrong PIN"));
        break;
    case ssap::SessionError::PairingTimedOut:
        setStatus(QStringLiteral("Pairing cancelled - timeout"));
        break;
    case ssap::SessionError::NetworkError:
        setStatus(QStringLiteral("Network error"));
        break;
    default:
        break;
    }
}

void RemoteControlService::onDeviceFound(const ssap::DeviceDescriptor& device)
{
    if (discovered_.contains(device))
        return;
    discovered_.append(device);
    emit discoveredDevicesChanged();
}

void RemoteControlService::onScanFinished(const QList<ssap::DeviceDescriptor>& devices)
{
    discovered_ = devices;
    emit discoveredDevicesChanged();
    emit scanningChanged();

    if (devices.isEmpty())
        setStatus(QStringLiteral("No TVs found"));
    else
        setStatus(QStringLiteral("Found %1 TV(s)").arg(devices.size()));
    emit scanFinished(devices);
}

void RemoteControlService::onScanFailed(const QString& reason)
{
    setLastError(reason);
    setStatus(QStringLiteral("No network"));
    emit scanFinished({});
}

void RemoteControlService::setStatus(const QString& status)
{
    if (status_ == status)
        return;
    status_ = status;
    emit statusChanged(status_);
}

void RemoteControlService::setLastError(const QString& message)
{
    if (lastError_ == message)
        return;
    lastError_ = message;
    emit lastErrorChanged();
}

// --- Properties ---

QString RemoteControlService::phase() const
{
    return QString::fromLatin1(ssap::sessionStateName(session_->state()));
}

QString RemoteControlService::status() const
{
    return status_;
}

QString RemoteControlService::lastError() const
{
    return lastError_;
}

bool RemoteControlService::isConnected() const
{
    return session_->state() == ssap::SessionState::Paired;
}

bool RemoteControlService::requiresPairing() const
{
    return session_->state() == ssap::SessionState::AwaitingPin
        || session_->state() == ssap::SessionState::AwaitingPairingPrompt;
}

bool RemoteControlService::hasCredential() const
{
    return credentials_ && credentials_->contains(credentialKey_);
}

QString RemoteControlService::pairedAddress() const
{
    return isConnected() ? session_->address() : QString();
}

bool RemoteControlService::isScanning() const
{
    return scanner_->isScanning();
}

QList<ssap::DeviceDescriptor> RemoteControlService::discoveredDevices() const
{
    return discovered_;
}

QVariantList RemoteControlService::discoveredDevicesVariant() const
{
    QVariantList list;
    for (const auto& device : discovered_) {
        QVariantMap entry;
        entry["address"] = device.address;
        entry["port"] = static_cast<int>(device.port);
        entry["name"] = device.name;
        list.append(entry);
    }
    return list;
}

ssap::WebOSSession* RemoteControlService::session() const
{
    return session_.get();
}

ssap::NetworkScanner* RemoteControlService::scanner() const
{
    return scanner_.get();
}

} // namespace tvr
