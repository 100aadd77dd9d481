#pragma once

#include <QMetaType>

namespace ssap {

enum class SessionState {
    Idle,
    Connecting,
    AwaitingRegistration,
    AwaitingPairingPrompt,
    AwaitingPin,
    Paired,
    Disconnected
};

enum class SessionError {
    CannotReachDevice,
    ConnectionLost,
    NetworkError,
    ProtocolError,
    PairingRejected,
    PairingTimedOut,
    RequestFailed,
    RequestTimedOut,
    NotConnected,
    InvalidPin
};

const char* sessionStateName(SessionState state);
const char* sessionErrorName(SessionError error);

} // namespace ssap

Q_DECLARE_METATYPE(ssap::SessionState)
Q_DECLARE_METATYPE(ssap::SessionError)
