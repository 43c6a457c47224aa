#include "EngineConfig.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

#include "../Logging/Logging.hpp"

namespace FXN {

namespace {

std::optional<std::chrono::milliseconds> ReadMillis(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    const std::string_view text(raw);
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0) {
        FXN_LOG_WARNING(Service, "Ignoring {}={}: expected a positive number of milliseconds", name, text);
        return std::nullopt;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

RegistryConfig RegistryConfig::MakeDefault() {
    using namespace std::chrono_literals;

    RegistryConfig config;
    config.pollInterval = 10s;
    config.pollRetryDelay = 1s;
    config.rpcTimeout = 5s;
    config.failureThreshold = 3;
    config.rediscoveryInterval = 60s;
    config.writeConfirmWindow = 60s;
    config.rediscovery.interfaceAddress = "auto";
    config.rediscovery.timeout = 3s;
    config.rediscovery.burstCount = 3;
    config.rediscovery.burstInterval = 300ms;
    config.defaultBacnetPort = Discovery::kDefaultBacnetPort;
    config.settingsTolerance = 0.5;
    return config;
}

EngineConfig EngineConfig::MakeDefault() {
    EngineConfig config;
    config.registry = RegistryConfig::MakeDefault();
    config.discoveryInterface = "auto";
    return config;
}

EngineConfig EngineConfig::FromEnvironment() {
    EngineConfig config = MakeDefault();

    if (auto poll = ReadMillis("FXN_POLL_INTERVAL_MS")) {
        config.registry.pollInterval = *poll;
    }
    if (auto timeout = ReadMillis("FXN_RPC_TIMEOUT_MS")) {
        config.registry.rpcTimeout = *timeout;
    }
    if (const char* iface = std::getenv("FXN_DISCOVERY_INTERFACE"); iface != nullptr && *iface != '\0') {
        config.discoveryInterface = iface;
        config.registry.rediscovery.interfaceAddress = iface;
    }

    FXN_LOG_V1(Service, "Engine config: poll={}ms rpcTimeout={}ms interface={}",
               config.registry.pollInterval.count(),
               config.registry.rpcTimeout.count(),
               config.discoveryInterface);
    return config;
}

} // namespace FXN
