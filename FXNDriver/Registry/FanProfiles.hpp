#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "../Core/Error.hpp"
#include "ModeArbiter.hpp"
#include "PointCatalog.hpp"

namespace FXN::Registry {

enum class FanLeg : uint8_t {
    kSupply,
    kExhaust,
};

[[nodiscard]] constexpr const char* ToString(FanLeg leg) noexcept {
    switch (leg) {
        case FanLeg::kSupply:  return "supply";
        case FanLeg::kExhaust: return "exhaust";
    }
    return "unknown";
}

struct PercentRange {
    int min;
    int max;
};

[[nodiscard]] PercentRange FanProfileRange(FanProfileMode mode, FanLeg leg) noexcept;

// Point holding the profile setpoint for one mode/leg.
[[nodiscard]] Point FanProfilePoint(FanProfileMode mode, FanLeg leg) noexcept;

// Sink setting key, e.g. "fan_profile_home_supply".
[[nodiscard]] std::string FanProfileSettingKey(FanProfileMode mode, FanLeg leg);

[[nodiscard]] std::span<const FanProfileMode> AllFanProfileModes() noexcept;

/// Round and range-check a requested profile percent.
/// @return the rounded percent, or kInvalidArgument naming mode, leg and range
[[nodiscard]] Result<int> ValidateFanProfilePercent(FanProfileMode mode, FanLeg leg, double percent);

} // namespace FXN::Registry
