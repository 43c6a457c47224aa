//
// LogConfig.hpp
// FXNDriver
//
// Runtime logging configuration singleton
// Reads verbosity levels from the environment and supports runtime updates
//

#ifndef FXN_LOGGING_LOGCONFIG_HPP
#define FXN_LOGGING_LOGCONFIG_HPP

#include <atomic>
#include <cstdint>

namespace FXN {

/**
 * @brief Centralized logging configuration manager
 *
 * Reads settings from the process environment:
 * - FXN_REGISTRY_VERBOSITY (integer 0-4): unit registry detail (polls, point reads, writes)
 * - FXN_DISCOVERY_VERBOSITY (integer 0-4): discovery sessions and replies
 * - FXN_TRANSPORT_VERBOSITY (integer 0-4): transport pool and request guards
 * - FXN_LOG_LEVEL (spdlog level name): global spdlog level for all categories
 *
 * Thread-safe singleton; setters may be called at any time.
 */
class LogConfig {
public:
    static LogConfig& Shared();

    /**
     * @brief Initialize from environment variables
     *
     * Unset or malformed variables keep their defaults. Safe to call more
     * than once; only the first call has an effect.
     */
    void InitializeFromEnvironment();

    uint8_t GetRegistryVerbosity() const;
    uint8_t GetDiscoveryVerbosity() const;
    uint8_t GetTransportVerbosity() const;
    uint8_t GetServiceVerbosity() const;

    /**
     * @brief Set Registry verbosity at runtime
     * @param level New verbosity level (0-4, clamped if out of range)
     */
    void SetRegistryVerbosity(uint8_t level);
    void SetDiscoveryVerbosity(uint8_t level);
    void SetTransportVerbosity(uint8_t level);
    void SetServiceVerbosity(uint8_t level);

private:
    LogConfig();
    ~LogConfig() = default;

    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    static uint8_t ReadLevel(const char* name, uint8_t defaultValue);

    /**
     * @brief Clamp verbosity level to valid range [0, 4]
     */
    static uint8_t ClampLevel(uint8_t level);

    std::atomic<uint8_t> registryVerbosity_;
    std::atomic<uint8_t> discoveryVerbosity_;
    std::atomic<uint8_t> transportVerbosity_;
    std::atomic<uint8_t> serviceVerbosity_;
    std::atomic<bool> initialized_;
};

} // namespace FXN

#endif // FXN_LOGGING_LOGCONFIG_HPP
