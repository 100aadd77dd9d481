#pragma once

#include <QHash>
#include <QObject>
#include <QTimer>
#include <QUrl>

#include <ssap/Protocol/Message.hpp>
#include <ssap/Protocol/RemoteCommand.hpp>
#include <ssap/Session/ICredentialStore.hpp>
#include <ssap/Session/SessionConfig.hpp>
#include <ssap/Session/SessionState.hpp>
#include <ssap/Transport/ITransport.hpp>

namespace ssap {

/// Drives one connection to a TV: register/pairing handshake on the primary
/// channel, pointer-socket setup on the secondary channel, heartbeat and
/// request/response correlation.
///
/// Transports and the credential store are not owned. All calls must be made
/// from the thread the session lives in.
class WebOSSession : public QObject {
    Q_OBJECT
public:
    WebOSSession(ITransport* primary, ITransport* secondary,
                 ICredentialStore* credentials, const SessionConfig& config,
                 QObject* parent = nullptr);
    ~WebOSSession() override;

    void connectToDevice(const QString& address);

    /// Idempotent. Stops the heartbeat, closes both channels and returns to
    /// Idle; unanswered requests are dropped.
    void disconnectFromDevice();

    /// Sends the PIN shown on the TV. Rejected without touching the network
    /// unless the PIN has exactly PIN_LENGTH characters and the session is
    /// waiting for one.
    bool submitPin(const QString& pin);

    /// No-op reporting NotConnected unless the session is Paired.
    bool sendCommand(const RemoteCommand& command);

    /// Correlated primary-channel request; returns its id, empty on failure.
    QString sendRequest(const QString& uri, const QJsonObject& payload = {});
    QString subscribe(const QString& uri, const QJsonObject& payload = {});
    bool unsubscribe(const QString& subscriptionId);

    /// Drops the stored client-key so the next connect pairs again.
    void forgetCredential();

    SessionState state() const;
    QString address() const;
    QString lastError() const;
    bool hasCredential() const;
    bool isInputChannelOpen() const;
    QString pointerRequestId() const;
    int pendingRequestCount() const;
    bool isPending(const QString& id) const;
    const SessionConfig& config() const;

signals:
    void stateChanged(ssap::SessionState newState);
    void registered(const QString& clientKey);
    void promptRequired();
    void pinRequired();
    void inputChannelReady();
    void responseReceived(const ssap::Response& response);
    void requestFailed(const QString& id, const QString& message);
    void errorOccurred(ssap::SessionError error, const QString& message);

    /// channel is "primary" or "input"
    void frameSent(const QString& channel, const QString& frame);
    void frameReceived(const QString& channel, const QString& frame);

private:
    struct PendingRequest {
        RequestType type = RequestType::Request;
        QString uri;
    };

    void setState(SessionState newState);
    void reportError(SessionError error, const QString& message);
    void teardown(SessionState finalState);

    QString issue(Request request);
    bool isActive() const;

    void startHeartbeat();
    void stopHeartbeat();
    void onHeartbeatTick();

    void onPrimaryConnected();
    void onPrimaryDisconnected();
    void onPrimaryError(const QString& message);
    void onPrimaryFrame(const QByteArray& frame);

    void onSecondaryConnected();
    void onSecondaryDisconnected();
    void onSecondaryError(const QString& message);

    void handleResponse(const Response& response);
    void handleError(const Response& response);
    void handleRegistered(const Response& response);
    void onRequestTimeout(const QString& id);

    QUrl primaryUrl(const QString& address) const;
    QUrl resolveSocketPath(const QString& socketPath) const;
    static SessionError classifyDeviceError(const QString& message);

    ITransport* primary_;
    ITransport* secondary_;
    ICredentialStore* credentials_;
    SessionConfig config_;

    SessionState state_ = SessionState::Idle;
    QString address_;
    QString lastError_;
    QString pointerRequestId_;
    bool secondaryOpen_ = false;
    bool closing_ = false;

    QHash<QString, PendingRequest> pending_;
    QTimer heartbeatTimer_;
};

} // namespace ssap
