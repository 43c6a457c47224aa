#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../Common/ObjectRef.hpp"

namespace FXN::Registry {

// ============================================================================
// Known points
// ============================================================================

// Every point the engine interprets. Diagnostic-only points live in
// DiagnosticPoints() and are never interpreted.
enum class Point : uint8_t {
    // Temperatures / climate
    kSetpointHome,
    kSetpointAway,
    kSupplyTemperature,
    kOutdoorTemperature,
    kExtractTemperature,
    kExhaustTemperature,
    kHumidity,
    kHeaterPower,
    kHeatingCoilEnable,

    // Fans
    kSupplyFanRpm,
    kExtractFanRpm,
    kSupplyFanPercent,
    kExtractFanPercent,

    // Filter
    kFilterOperatingTime,
    kFilterLimit,

    // Mode and comfort
    kComfortButton,
    kComfortButtonDelay,
    kVentilationMode,
    kOperationMode,
    kRapidTrigger,
    kRapidRuntime,
    kRapidRemaining,
    kRapidActive,
    kFireplaceTrigger,
    kFireplaceRuntime,
    kFireplaceRemaining,
    kFireplaceActive,
    kCookerHood,
    kAwayDelayActive,
    kTempVentOpRemaining,
    kModeRfInput,

    // Fan profile setpoints (percent)
    kFanSupplyHigh,
    kFanSupplyHome,
    kFanSupplyAway,
    kFanSupplyFireplace,
    kFanSupplyCooker,
    kFanExhaustHigh,
    kFanExhaustHome,
    kFanExhaustAway,
    kFanExhaustFireplace,
    kFanExhaustCooker,

    kCount
};

inline constexpr size_t kPointCount = static_cast<size_t>(Point::kCount);

struct PointInfo {
    Point point;
    ObjectRef ref;
    const char* label;
    bool logChanges;    // mode-related: value changes logged at verbosity 2
};

struct DiagnosticInfo {
    ObjectRef ref;
    const char* label;
};

[[nodiscard]] const PointInfo& Describe(Point point);
[[nodiscard]] ObjectRef RefOf(Point point);
[[nodiscard]] std::optional<Point> FindPoint(const ObjectRef& ref);

[[nodiscard]] std::span<const DiagnosticInfo> DiagnosticPoints();

// Label for any polled ref, known point or diagnostic point; nullptr otherwise.
[[nodiscard]] const char* LabelOf(const ObjectRef& ref);
[[nodiscard]] bool ShouldLogChanges(const ObjectRef& ref);

// Every ref read by one poll: known points first, then diagnostic points.
[[nodiscard]] const std::vector<ObjectRef>& PollList();

// ============================================================================
// Per-poll value set
// ============================================================================

class PointSnapshot {
public:
    void Set(Point point, double value) { values_[Index(point)] = value; }
    [[nodiscard]] std::optional<double> Get(Point point) const { return values_[Index(point)]; }
    [[nodiscard]] bool Has(Point point) const { return values_[Index(point)].has_value(); }

    // True when the point is present and rounds to `value`.
    [[nodiscard]] bool Is(Point point, int value) const;

private:
    static constexpr size_t Index(Point point) { return static_cast<size_t>(point); }

    std::array<std::optional<double>, kPointCount> values_{};
};

} // namespace FXN::Registry
