#pragma once
#include <cstdint>

namespace ssap {

constexpr uint16_t DEFAULT_SECURE_PORT = 3001;
constexpr uint16_t DEFAULT_PLAIN_PORT = 3000;

constexpr int MANIFEST_VERSION = 1;
constexpr int PIN_LENGTH = 8;

constexpr int DEFAULT_HEARTBEAT_INTERVAL_MS = 10000;

} // namespace ssap
