#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../Core/Error.hpp"

namespace FXN::Discovery {

// ============================================================================
// Wire constants
// ============================================================================

inline constexpr const char* kRequestGroup = "224.0.0.180";
inline constexpr uint16_t kRequestPort = 30000;
inline constexpr const char* kReplyGroup = "224.0.0.181";
inline constexpr uint16_t kReplyPort = 30001;

inline constexpr uint16_t kDefaultBacnetPort = 47808;

// ============================================================================
// Discovery result
// ============================================================================

// Identity of one unit as advertised in its multicast reply.
struct DiscoveredUnit {
    std::string name;
    std::string serial;             // "800131-000001"
    std::string serialNormalized;   // "800131000001"
    std::string ip;
    uint16_t port{kDefaultBacnetPort};
    std::optional<std::string> mac;
    std::optional<std::string> firmware;
};

struct DiscoveryOptions {
    // Empty or "auto" selects every candidate interface.
    std::string interfaceAddress;
    std::chrono::milliseconds timeout{5000};
    uint32_t burstCount{10};
    std::chrono::milliseconds burstInterval{300};
};

using DiscoveryCompletion = std::function<void(Result<std::vector<DiscoveredUnit>>)>;

// Seam between the unit registry (rediscovery) and the multicast session.
class IDiscoveryService {
public:
    virtual ~IDiscoveryService() = default;

    // Completion runs on the owning io_context.
    virtual void Discover(const DiscoveryOptions& options, DiscoveryCompletion completion) = 0;
};

} // namespace FXN::Discovery
