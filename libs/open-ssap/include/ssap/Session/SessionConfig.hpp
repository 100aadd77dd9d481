#pragma once

#include <ssap/Protocol/Message.hpp>
#include <ssap/Version.hpp>
#include <QString>
#include <cstdint>

namespace ssap {

struct SessionConfig {
    bool secure = true;                       // wss:// vs ws://
    uint16_t port = DEFAULT_SECURE_PORT;
    PairingType pairingType = PairingType::Pin;

    QString credentialKey = QStringLiteral("webos_client_key");

    bool heartbeatEnabled = true;
    int heartbeatInterval = DEFAULT_HEARTBEAT_INTERVAL_MS;

    // 0 disables; an unanswered request then never completes.
    int requestTimeout = 0;
};

} // namespace ssap
