#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "../Discovery/DiscoveryTypes.hpp"

namespace FXN {

// Timing and thresholds for the unit registry. Tests shrink the intervals;
// production uses MakeDefault().
struct RegistryConfig {
    std::chrono::milliseconds pollInterval{0};
    std::chrono::milliseconds pollRetryDelay{0};
    std::chrono::milliseconds rpcTimeout{0};
    uint32_t failureThreshold{0};
    std::chrono::milliseconds rediscoveryInterval{0};
    std::chrono::milliseconds writeConfirmWindow{0};
    Discovery::DiscoveryOptions rediscovery;
    uint16_t defaultBacnetPort{0};
    double settingsTolerance{0};

    static RegistryConfig MakeDefault();
};

// Whole-engine configuration, populated by the host before the EngineContext
// is built.
struct EngineConfig {
    RegistryConfig registry;
    std::string discoveryInterface;

    static EngineConfig MakeDefault();

    // MakeDefault() with FXN_POLL_INTERVAL_MS, FXN_RPC_TIMEOUT_MS and
    // FXN_DISCOVERY_INTERFACE applied. Malformed values are logged and ignored.
    static EngineConfig FromEnvironment();
};

} // namespace FXN
