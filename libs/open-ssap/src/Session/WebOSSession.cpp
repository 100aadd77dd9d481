#include <ssap/Session/WebOSSession.hpp>
#include <ssap/Protocol/MessageCodec.hpp>
#include <QDebug>
#include <QUuid>

namespace ssap {

namespace {

const QString kPrimaryChannel = QStringLiteral("primary");
const QString kInputChannel = QStringLiteral("input");

QString newRequestId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toLower();
}

} // namespace

WebOSSession::WebOSSession(ITransport* primary, ITransport* secondary,
                           ICredentialStore* credentials, const SessionConfig& config,
                           QObject* parent)
    : QObject(parent)
    , primary_(primary)
    , secondary_(secondary)
    , credentials_(credentials)
    , config_(config)
{
    connect(&heartbeatTimer_, &QTimer::timeout, this, &WebOSSession::onHeartbeatTick);

    // Primary channel
    connect(primary_, &ITransport::connected,
            this, &WebOSSession::onPrimaryConnected);
    connect(primary_, &ITransport::disconnected,
            this, &WebOSSession::onPrimaryDisconnected);
    connect(primary_, &ITransport::error,
            this, &WebOSSession::onPrimaryError);
    connect(primary_, &ITransport::textReceived,
            this, [this](const QString& message) { onPrimaryFrame(message.toUtf8()); });
    connect(primary_, &ITransport::binaryReceived,
            this, &WebOSSession::onPrimaryFrame);

    // Secondary (pointer input) channel — outbound only
    connect(secondary_, &ITransport::connected,
            this, &WebOSSession::onSecondaryConnected);
    connect(secondary_, &ITransport::disconnected,
            this, &WebOSSession::onSecondaryDisconnected);
    connect(secondary_, &ITransport::error,
            this, &WebOSSession::onSecondaryError);
}

WebOSSession::~WebOSSession()
{
    stopHeartbeat();
}

void WebOSSession::connectToDevice(const QString& address)
{
    if (address.trimmed().isEmpty()) {
        reportError(SessionError::CannotReachDevice, QStringLiteral("No device address"));
        return;
    }

    if (state_ != SessionState::Idle && state_ != SessionState::Disconnected) {
        qInfo() << "[WebOSSession] Replacing session with" << address_;
        teardown(SessionState::Idle);
    }

    address_ = address.trimmed();
    lastError_.clear();
    setState(SessionState::Connecting);

    const QUrl url = primaryUrl(address_);
    qInfo() << "[WebOSSession] Connecting to" << url.toString();
    primary_->open(url);
}

void WebOSSession::disconnectFromDevice()
{
    if (state_ == SessionState::Idle) return;
    qInfo() << "[WebOSSession] Disconnect requested";
    teardown(SessionState::Idle);
}

bool WebOSSession::submitPin(const QString& pin)
{
    if (pin.size() != PIN_LENGTH) {
        reportError(SessionError::InvalidPin,
                    QStringLiteral("PIN must be %1 characters").arg(PIN_LENGTH));
        return false;
    }
    if (state_ != SessionState::AwaitingPin) {
        reportError(SessionError::NotConnected, QStringLiteral("TV is not waiting for a PIN"));
        return false;
    }

    qInfo() << "[WebOSSession] Submitting pairing PIN";
    return !issue(MessageCodec::setPinRequest(pin)).isEmpty();
}

bool WebOSSession::sendCommand(const RemoteCommand& command)
{
    if (state_ != SessionState::Paired) {
        reportError(SessionError::NotConnected, QStringLiteral("Not connected to TV"));
        return false;
    }

    if (CommandTable::channel(command.action) == CommandChannel::Input) {
        if (!secondaryOpen_) {
            reportError(SessionError::NotConnected, QStringLiteral("Input channel not ready"));
            return false;
        }
        const QString frame = MessageCodec::encodeButton(CommandTable::buttonName(command.action));
        if (!secondary_->sendText(frame)) {
            reportError(SessionError::NetworkError, QStringLiteral("Failed to send key"));
            return false;
        }
        emit frameSent(kInputChannel, frame);
        return true;
    }

    return !issue(MessageCodec::commandRequest(command)).isEmpty();
}

QString WebOSSession::sendRequest(const QString& uri, const QJsonObject& payload)
{
    if (state_ != SessionState::Paired) {
        reportError(SessionError::NotConnected, QStringLiteral("Not connected to TV"));
        return {};
    }
    Request req;
    req.uri = uri;
    req.payload = payload;
    return issue(req);
}

QString WebOSSession::subscribe(const QString& uri, const QJsonObject& payload)
{
    if (state_ != SessionState::Paired) {
        reportError(SessionError::NotConnected, QStringLiteral("Not connected to TV"));
        return {};
    }
    Request req;
    req.type = RequestType::Subscribe;
    req.uri = uri;
    req.payload = payload;
    return issue(req);
}

bool WebOSSession::unsubscribe(const QString& subscriptionId)
{
    auto it = pending_.find(subscriptionId);
    if (it == pending_.end() || it->type != RequestType::Subscribe)
        return false;

    Request req;
    req.type = RequestType::Unsubscribe;
    req.id = subscriptionId;
    req.uri = it->uri;
    pending_.erase(it);

    const QString frame = MessageCodec::encodeRequest(req);
    if (!primary_->sendText(frame)) {
        reportError(SessionError::NetworkError, QStringLiteral("Failed to send unsubscribe"));
        return false;
    }
    emit frameSent(kPrimaryChannel, frame);
    return true;
}

void WebOSSession::forgetCredential()
{
    if (credentials_)
        credentials_->remove(config_.credentialKey);
}

SessionState WebOSSession::state() const { return state_; }
QString WebOSSession::address() const { return address_; }
QString WebOSSession::lastError() const { return lastError_; }
bool WebOSSession::isInputChannelOpen() const { return secondaryOpen_; }
QString WebOSSession::pointerRequestId() const { return pointerRequestId_; }
int WebOSSession::pendingRequestCount() const { return static_cast<int>(pending_.size()); }
bool WebOSSession::isPending(const QString& id) const { return pending_.contains(id); }
const SessionConfig& WebOSSession::config() const { return config_; }

bool WebOSSession::hasCredential() const
{
    return credentials_ && !credentials_->value(config_.credentialKey).isEmpty();
}

void WebOSSession::setState(SessionState newState)
{
    if (state_ == newState) return;
    state_ = newState;
    qDebug() << "[WebOSSession] State:" << sessionStateName(newState);
    emit stateChanged(newState);
}

void WebOSSession::reportError(SessionError error, const QString& message)
{
    qWarning() << "[WebOSSession]" << sessionErrorName(error) << message;
    lastError_ = message;
    emit errorOccurred(error, message);
}

void WebOSSession::teardown(SessionState finalState)
{
    stopHeartbeat();
    pending_.clear();
    pointerRequestId_.clear();

    // Both closes are attempted; neither reports back while closing_ is set.
    closing_ = true;
    secondaryOpen_ = false;
    secondary_->close();
    primary_->close();
    closing_ = false;

    setState(finalState);
}

QString WebOSSession::issue(Request request)
{
    if (request.id.isEmpty())
        request.id = newRequestId();

    PendingRequest entry;
    entry.type = request.type;
    entry.uri = request.uri;
    pending_.insert(request.id, entry);

    const QString frame = MessageCodec::encodeRequest(request);
    if (!primary_->sendText(frame)) {
        pending_.remove(request.id);
        reportError(SessionError::NetworkError,
                    QStringLiteral("Failed to send %1").arg(
                        request.uri.isEmpty() ? MessageCodec::requestTypeName(request.type)
                                              : request.uri));
        return {};
    }
    emit frameSent(kPrimaryChannel, frame);

    // Register stays open while the user confirms on the TV
    if (config_.requestTimeout > 0
            && request.type != RequestType::Subscribe
            && request.type != RequestType::Register) {
        const QString id = request.id;
        QTimer::singleShot(config_.requestTimeout, this, [this, id]() { onRequestTimeout(id); });
    }
    return request.id;
}

bool WebOSSession::isActive() const
{
    return !closing_
        && state_ != SessionState::Idle
        && state_ != SessionState::Disconnected;
}

void WebOSSession::startHeartbeat()
{
    if (!config_.heartbeatEnabled || config_.heartbeatInterval <= 0) return;
    heartbeatTimer_.start(config_.heartbeatInterval);
}

void WebOSSession::stopHeartbeat()
{
    heartbeatTimer_.stop();
}

void WebOSSession::onHeartbeatTick()
{
    if (!isActive()) return;

    // A failed ping is reported only; the transport's own close is what ends
    // the session.
    if (secondaryOpen_ && !secondary_->ping())
        reportError(SessionError::NetworkError, QStringLiteral("Ping failed on input channel"));
    if (!primary_->ping())
        reportError(SessionError::NetworkError, QStringLiteral("Ping failed on primary channel"));
}

void WebOSSession::onPrimaryConnected()
{
    if (closing_ || state_ != SessionState::Connecting) return;

    const QString clientKey = credentials_ ? credentials_->value(config_.credentialKey) : QString();
    qInfo() << "[WebOSSession] Primary channel open, registering"
            << (clientKey.isEmpty() ? "without" : "with") << "stored client-key";

    setState(SessionState::AwaitingRegistration);
    startHeartbeat();
    issue(MessageCodec::registerRequest(config_.pairingType, clientKey));
}

void WebOSSession::onPrimaryDisconnected()
{
    if (!isActive()) return;

    if (state_ == SessionState::Connecting) {
        reportError(SessionError::CannotReachDevice,
                    QStringLiteral("Cannot reach %1").arg(address_));
    } else {
        reportError(SessionError::ConnectionLost, QStringLiteral("Connection lost"));
    }
    teardown(SessionState::Disconnected);
}

void WebOSSession::onPrimaryError(const QString& message)
{
    if (!isActive()) return;

    if (state_ == SessionState::Connecting) {
        reportError(SessionError::CannotReachDevice, message);
        teardown(SessionState::Disconnected);
        return;
    }
    reportError(SessionError::NetworkError, message);
}

void WebOSSession::onPrimaryFrame(const QByteArray& frame)
{
    if (!isActive()) return;

    emit frameReceived(kPrimaryChannel, QString::fromUtf8(frame));

    Response response;
    QString why;
    if (!MessageCodec::decodeResponse(frame, response, &why)) {
        reportError(SessionError::ProtocolError, why);
        return;
    }

    if (response.type == ResponseType::Error)
        handleError(response);
    else
        handleResponse(response);
}

void WebOSSession::onSecondaryConnected()
{
    if (!isActive()) return;
    qInfo() << "[WebOSSession] Input channel open";
    secondaryOpen_ = true;
    emit inputChannelReady();
}

void WebOSSession::onSecondaryDisconnected()
{
    if (!isActive() || !secondaryOpen_) return;
    secondaryOpen_ = false;
    reportError(SessionError::NetworkError, QStringLiteral("Input channel closed"));
}

void WebOSSession::onSecondaryError(const QString& message)
{
    if (!isActive()) return;
    reportError(SessionError::NetworkError, QStringLiteral("Input channel: %1").arg(message));
}

void WebOSSession::handleResponse(const Response& response)
{
    if (response.type == ResponseType::Registered)
        handleRegistered(response);

    if (state_ != SessionState::Paired) {
        if (response.pairingType == PairingType::Prompt) {
            setState(SessionState::AwaitingPairingPrompt);
            emit promptRequired();
        } else if (response.pairingType == PairingType::Pin) {
            setState(SessionState::AwaitingPin);
            emit pinRequired();
        }
    }

    if (!response.socketPath.isEmpty() && !response.id.isEmpty()
        && response.id == pointerRequestId_) {
        const QUrl url = resolveSocketPath(response.socketPath);
        qInfo() << "[WebOSSession] Opening input channel" << url.toString();
        pointerRequestId_.clear();
        secondaryOpen_ = false;
        secondary_->open(url);
    }

    auto it = pending_.find(response.id);
    if (it != pending_.end()) {
        const bool resolves = it->type == RequestType::Register
            ? response.type == ResponseType::Registered
            : it->type != RequestType::Subscribe;
        if (resolves)
            pending_.erase(it);
    }

    emit responseReceived(response);
}

void WebOSSession::handleError(const Response& response)
{
    const QString message = response.error.isEmpty()
        ? QStringLiteral("Unknown error") : response.error;

    if (!response.id.isEmpty() && pending_.remove(response.id))
        emit requestFailed(response.id, message);
    if (!response.id.isEmpty() && response.id == pointerRequestId_)
        pointerRequestId_.clear();

    reportError(classifyDeviceError(message), message);
}

void WebOSSession::handleRegistered(const Response& response)
{
    if (response.clientKey.isEmpty()) {
        reportError(SessionError::ProtocolError,
                    QStringLiteral("registered response without client-key"));
        return;
    }

    if (credentials_)
        credentials_->setValue(config_.credentialKey, response.clientKey);

    qInfo() << "[WebOSSession] Registered with" << address_;
    setState(SessionState::Paired);
    emit registered(response.clientKey);

    if (!secondaryOpen_ && pointerRequestId_.isEmpty())
        pointerRequestId_ = issue(MessageCodec::pointerSocketRequest());
}

void WebOSSession::onRequestTimeout(const QString& id)
{
    if (!pending_.remove(id)) return;
    if (id == pointerRequestId_)
        pointerRequestId_.clear();
    const QString message = QStringLiteral("Request timed out");
    emit requestFailed(id, message);
    reportError(SessionError::RequestTimedOut, message);
}

QUrl WebOSSession::primaryUrl(const QString& address) const
{
    QUrl url;
    url.setScheme(config_.secure ? QStringLiteral("wss") : QStringLiteral("ws"));
    url.setHost(address);
    url.setPort(config_.port);
    return url;
}

QUrl WebOSSession::resolveSocketPath(const QString& socketPath) const
{
    const QUrl path(socketPath);
    if (path.isRelative())
        return primaryUrl(address_).resolved(path);
    return path;
}

SessionError WebOSSession::classifyDeviceError(const QString& message)
{
    if (message.contains(QLatin1String("rejected pairing"), Qt::CaseInsensitive))
        return SessionError::PairingRejected;
    if (message.contains(QLatin1String("cancelled"), Qt::CaseInsensitive))
        return SessionError::PairingTimedOut;
    return SessionError::RequestFailed;
}

} // namespace ssap
