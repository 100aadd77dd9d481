#pragma once

#include <QObject>
#include <QStringList>
#include <QVariantList>
#include <memory>

#include <ssap/Discovery/NetworkScanner.hpp>
#include <ssap/Protocol/ProtocolLogger.hpp>
#include <ssap/Protocol/RemoteCommand.hpp>
#include <ssap/Session/WebOSSession.hpp>
#include <ssap/Transport/ITransport.hpp>

#include "core/YamlConfig.hpp"

namespace tvr {

/// Presentation-facing facade: connect/disconnect, PIN submission, commands
/// and network scan, with the session's progress folded into one status line.
/// Owns the session, the scanner and (unless injected) both transports.
class RemoteControlService : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString phase READ phase NOTIFY phaseChanged)
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)
    Q_PROPERTY(bool connected READ isConnected NOTIFY phaseChanged)
    Q_PROPERTY(bool requiresPairing READ requiresPairing NOTIFY phaseChanged)
    Q_PROPERTY(bool hasCredential READ hasCredential NOTIFY credentialChanged)
    Q_PROPERTY(QString pairedAddress READ pairedAddress NOTIFY phaseChanged)
    Q_PROPERTY(bool scanning READ isScanning NOTIFY scanningChanged)
    Q_PROPERTY(QVariantList discoveredDevices READ discoveredDevicesVariant NOTIFY discoveredDevicesChanged)

public:
    /// Production wiring: WebSocket transports, TCP prober.
    RemoteControlService(const YamlConfig& config, ssap::ICredentialStore* credentials,
                         QObject* parent = nullptr);

    /// Injected transports and prober are not owned.
    RemoteControlService(const YamlConfig& config, ssap::ICredentialStore* credentials,
                         ssap::ITransport* primary, ssap::ITransport* secondary,
                         ssap::IHostProber* prober, QObject* parent = nullptr);
    ~RemoteControlService() override;

    Q_INVOKABLE void connectToTv(const QString& address);
    Q_INVOKABLE void disconnectFromTv();
    Q_INVOKABLE bool submitPin(const QString& pin);
    bool sendCommand(const ssap::RemoteCommand& command);

    /// Parses a command name ("volume-up", "launch-app") plus optional
    /// argument; false and lastError set when the name is unknown or an
    /// argument is missing.
    Q_INVOKABLE bool sendCommandByName(const QString& name, const QString& argument = {});

    /// Sweeps the local subnet; status follows with "Scanning..." and the
    /// result count.
    Q_INVOKABLE bool scanForDevices();
    Q_INVOKABLE void forgetPairing();

    QString phase() const;
    QString status() const;
    QString lastError() const;
    bool isConnected() const;
    bool requiresPairing() const;
    bool hasCredential() const;
    QString pairedAddress() const;
    bool isScanning() const;
    QList<ssap::DeviceDescriptor> discoveredDevices() const;
    QVariantList discoveredDevicesVariant() const;

    ssap::WebOSSession* session() const;
    ssap::NetworkScanner* scanner() const;

    /// Human-readable status for a session state; empty for Disconnected,
    /// whose text depends on why the session ended.
    static QString statusForState(ssap::SessionState state);

signals:
    void phaseChanged();
    void statusChanged(const QString& status);
    void lastErrorChanged();
    void credentialChanged();
    void scanningChanged();
    void discoveredDevicesChanged();

    void paired();
    void pinRequested();
    void scanFinished(const QList<ssap::DeviceDescriptor>& devices);

private:
    void wire();
    void setStatus(const QString& status);
    void setLastError(const QString& message);

    void onStateChanged(ssap::SessionState state);
    void onSessionError(ssap::SessionError error, const QString& message);
    void onDeviceFound(const ssap::DeviceDescriptor& device);
    void onScanFinished(const QList<ssap::DeviceDescriptor>& devices);
    void onScanFailed(const QString& reason);

    ssap::ScanOptions scanOptions_;
    ssap::ICredentialStore* credentials_;
    QString credentialKey_;

    ssap::ITransport* primary_;
    ssap::ITransport* secondary_;
    std::unique_ptr<ssap::WebOSSession> session_;
    std::unique_ptr<ssap::NetworkScanner> scanner_;
    std::unique_ptr<ssap::ProtocolLogger> protocolLogger_;

    QString status_ = QStringLiteral("Disconnected");
    QString endStatus_;
    QString lastError_;
    QList<ssap::DeviceDescriptor> discovered_;
};

} // namespace tvr
