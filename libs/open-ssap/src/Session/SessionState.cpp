#include <ssap/Session/SessionState.hpp>

namespace ssap {

const char* sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle:                  return "Idle";
    case SessionState::Connecting:            return "Connecting";
    case SessionState::AwaitingRegistration:  return "AwaitingRegistration";
    case SessionState::AwaitingPairingPrompt: return "AwaitingPairingPrompt";
    case SessionState::AwaitingPin:           return "AwaitingPin";
    case SessionState::Paired:                return "Paired";
    case SessionState::Disconnected:          return "Disconnected";
    }
    return "Unknown";
}

const char* sessionErrorName(SessionError error)
{
    switch (error) {
    case SessionError::CannotReachDevice: return "CannotReachDevice";
    case SessionError::ConnectionLost:    return "ConnectionLost";
    case SessionError::NetworkError:      return "NetworkError";
    case SessionError::ProtocolError:     return "ProtocolError";
    case SessionError::PairingRejected:   return "PairingRejected";
    case SessionError::PairingTimedOut:   return "PairingTimedOut";
    case SessionError::RequestFailed:     return "RequestFailed";
    case SessionError::RequestTimedOut:   return "RequestTimedOut";
    case SessionError::NotConnected:      return "NotConnected";
    case SessionError::InvalidPin:        return "InvalidPin";
    }
    return "Unknown";
}

} // namespace ssap
