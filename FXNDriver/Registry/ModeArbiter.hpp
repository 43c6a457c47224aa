#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace FXN::Registry {

class PointSnapshot;

// ============================================================================
// Mode enums
// ============================================================================

enum class FanMode : uint8_t {
    kAway,
    kHome,
    kHigh,
    kFireplace,
};

[[nodiscard]] constexpr const char* ToString(FanMode mode) noexcept {
    switch (mode) {
        case FanMode::kAway:      return "away";
        case FanMode::kHome:      return "home";
        case FanMode::kHigh:      return "high";
        case FanMode::kFireplace: return "fireplace";
    }
    return "unknown";
}

[[nodiscard]] std::optional<FanMode> ParseFanMode(std::string_view text);

// Fan speed profiles stored on the unit. Cooker has its own profile even though
// it arbitrates to high.
enum class FanProfileMode : uint8_t {
    kHigh,
    kHome,
    kAway,
    kFireplace,
    kCooker,
};

inline constexpr size_t kFanProfileModeCount = 5;

[[nodiscard]] constexpr const char* ToString(FanProfileMode mode) noexcept {
    switch (mode) {
        case FanProfileMode::kHigh:      return "high";
        case FanProfileMode::kHome:      return "home";
        case FanProfileMode::kAway:      return "away";
        case FanProfileMode::kFireplace: return "fireplace";
        case FanProfileMode::kCooker:    return "cooker";
    }
    return "unknown";
}

[[nodiscard]] std::optional<FanProfileMode> ParseFanProfileMode(std::string_view text);

// ============================================================================
// Raw device values
// ============================================================================

enum class OperationMode : uint8_t {
    kOff = 1,
    kAway = 2,
    kHome = 3,
    kHigh = 4,
    kCookerHood = 5,
    kFireplace = 6,
    kTemporaryHigh = 7,
};

enum class VentilationMode : uint8_t {
    kStop = 1,
    kAway = 2,
    kHome = 3,
    kHigh = 4,
};

inline constexpr double kTriggerValue = 2;

// ============================================================================
// Arbitration
// ============================================================================

// Mode-relevant values from one poll. Absent fields were not reported.
struct ModeSignals {
    std::optional<double> operationMode;
    std::optional<double> ventilationMode;
    std::optional<double> modeRfInput;
    std::optional<double> remainingTempVentOp;
    std::optional<double> remainingFireplaceVent;
    std::optional<double> remainingRapidVent;
    std::optional<double> comfortButton;
    std::optional<double> fireplaceActive;
    std::optional<double> rapidActive;

    [[nodiscard]] bool HasAny() const noexcept;

    static ModeSignals FromSnapshot(const PointSnapshot& snapshot);
};

[[nodiscard]] FanMode MapOperationMode(double value) noexcept;
[[nodiscard]] FanMode MapVentilationMode(double value) noexcept;
[[nodiscard]] std::optional<FanMode> MapRfInput(double value) noexcept;

/// Collapse the overlapping device signals into one mode.
///
/// Precedence, lowest first: operation mode, ventilation mode, RF input,
/// temporary-ventilation timers, comfort button. A reported ventilation mode
/// then overrides that base; fireplace-active and rapid-active override
/// everything.
///
/// @return nullopt when no mode signal is present at all
[[nodiscard]] std::optional<FanMode> ResolveFanMode(const ModeSignals& signals);

// Profile whose fan setpoints are in effect for the arbitrated mode.
[[nodiscard]] FanProfileMode ResolveFanProfileMode(std::optional<double> operationMode, FanMode mode) noexcept;

[[nodiscard]] FanProfileMode ProfileFor(FanMode mode) noexcept;

} // namespace FXN::Registry
