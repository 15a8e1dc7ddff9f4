#pragma once

#include "server/wire_protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rsproxy {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct ListenerConfig {
    std::string host = "0.0.0.0";
    int port = 27017;                       // 0 = ephemeral (tests)
    size_t max_client_connections = 1024;
};

struct BackendConfig {
    std::vector<std::string> seeds;         // "host:port"
    size_t max_connections = 64;            // global cap across all members
    size_t pool_capacity = 16;              // per member
    size_t min_idle_connections = 0;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds message_timeout{120000};
    std::chrono::milliseconds server_idle_timeout{300000};
    size_t max_message_bytes = wire::DEFAULT_MAX_MESSAGE_BYTES;
};

struct SessionLimitsConfig {
    std::chrono::milliseconds idle_timeout{3600000};
    std::chrono::milliseconds write_timeout{30000};
};

struct ProbeConfig {
    std::chrono::milliseconds probe_interval{5000};
    std::chrono::milliseconds probe_timeout{2000};
    uint32_t unreachable_grace_cycles = 3;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AdminConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 9180;                        // 0 = ephemeral (tests)
};

struct ProxyConfig {
    ListenerConfig listener;
    BackendConfig backend;
    SessionLimitsConfig sessions;
    ProbeConfig topology;
    LoggingConfig logging;
    AdminConfig admin;
};

} // namespace rsproxy
