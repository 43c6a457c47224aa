//
// LogConfig.cpp
// FXNDriver
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace FXN {

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

LogConfig::LogConfig()
{
    registryVerbosity_.store(1);        // Default: Compact
    discoveryVerbosity_.store(1);
    transportVerbosity_.store(1);
    serviceVerbosity_.store(1);
    initialized_.store(false);
}

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::InitializeFromEnvironment() {
    if (initialized_.exchange(true)) {
        FXN_LOG_DEBUG(Service, "LogConfig already initialized, skipping");
        return;
    }

    registryVerbosity_.store(ReadLevel("FXN_REGISTRY_VERBOSITY", 1));
    discoveryVerbosity_.store(ReadLevel("FXN_DISCOVERY_VERBOSITY", 1));
    transportVerbosity_.store(ReadLevel("FXN_TRANSPORT_VERBOSITY", 1));
    serviceVerbosity_.store(ReadLevel("FXN_SERVICE_VERBOSITY", 1));

    if (const char* level = std::getenv("FXN_LOG_LEVEL"); level && *level) {
        Logging::SetLevel(spdlog::level::from_str(level));
    }

    FXN_LOG_INFO(Service,
                 "LogConfig initialized: Registry={} Discovery={} Transport={} Service={}",
                 registryVerbosity_.load(), discoveryVerbosity_.load(),
                 transportVerbosity_.load(), serviceVerbosity_.load());
}

// ============================================================================
// Getters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetRegistryVerbosity() const {
    return registryVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetDiscoveryVerbosity() const {
    return discoveryVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetTransportVerbosity() const {
    return transportVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetServiceVerbosity() const {
    return serviceVerbosity_.load(std::memory_order_relaxed);
}

// ============================================================================
// Runtime Setters (Thread-Safe)
// ============================================================================

void LogConfig::SetRegistryVerbosity(uint8_t level) {
    level = ClampLevel(level);
    registryVerbosity_.store(level, std::memory_order_relaxed);
    FXN_LOG_INFO(Service, "Registry verbosity changed to {}", level);
}

void LogConfig::SetDiscoveryVerbosity(uint8_t level) {
    level = ClampLevel(level);
    discoveryVerbosity_.store(level, std::memory_order_relaxed);
    FXN_LOG_INFO(Service, "Discovery verbosity changed to {}", level);
}

void LogConfig::SetTransportVerbosity(uint8_t level) {
    level = ClampLevel(level);
    transportVerbosity_.store(level, std::memory_order_relaxed);
    FXN_LOG_INFO(Service, "Transport verbosity changed to {}", level);
}

void LogConfig::SetServiceVerbosity(uint8_t level) {
    level = ClampLevel(level);
    serviceVerbosity_.store(level, std::memory_order_relaxed);
    FXN_LOG_INFO(Service, "Service verbosity changed to {}", level);
}

// ============================================================================
// Helpers
// ============================================================================

uint8_t LogConfig::ReadLevel(const char* name, uint8_t defaultValue) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return defaultValue;
    }
    std::string_view text(raw);
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        FXN_LOG_WARNING(Service, "Ignoring malformed {}='{}'", name, text);
        return defaultValue;
    }
    return ClampLevel(static_cast<uint8_t>(value > 4 ? 4 : value));
}

uint8_t LogConfig::ClampLevel(uint8_t level) {
    return (level > 4) ? 4 : level;
}

} // namespace FXN
