#include "ModeArbiter.hpp"

#include <cmath>

#include "PointCatalog.hpp"

namespace FXN::Registry {

namespace {

bool Positive(const std::optional<double>& value) {
    return value.has_value() && *value > 0;
}

bool IsOne(const std::optional<double>& value) {
    return value.has_value() && std::lround(*value) == 1;
}

} // namespace

std::optional<FanMode> ParseFanMode(std::string_view text) {
    if (text == "away") return FanMode::kAway;
    if (text == "home") return FanMode::kHome;
    if (text == "high") return FanMode::kHigh;
    if (text == "fireplace") return FanMode::kFireplace;
    return std::nullopt;
}

std::optional<FanProfileMode> ParseFanProfileMode(std::string_view text) {
    if (text == "high") return FanProfileMode::kHigh;
    if (text == "home") return FanProfileMode::kHome;
    if (text == "away") return FanProfileMode::kAway;
    if (text == "fireplace") return FanProfileMode::kFireplace;
    if (text == "cooker") return FanProfileMode::kCooker;
    return std::nullopt;
}

bool ModeSignals::HasAny() const noexcept {
    return operationMode || ventilationMode || modeRfInput || remainingTempVentOp ||
           remainingFireplaceVent || remainingRapidVent || comfortButton ||
           fireplaceActive || rapidActive;
}

ModeSignals ModeSignals::FromSnapshot(const PointSnapshot& snapshot) {
    ModeSignals signals;
    signals.operationMode = snapshot.Get(Point::kOperationMode);
    signals.ventilationMode = snapshot.Get(Point::kVentilationMode);
    signals.modeRfInput = snapshot.Get(Point::kModeRfInput);
    signals.remainingTempVentOp = snapshot.Get(Point::kTempVentOpRemaining);
    signals.remainingFireplaceVent = snapshot.Get(Point::kFireplaceRemaining);
    signals.remainingRapidVent = snapshot.Get(Point::kRapidRemaining);
    signals.comfortButton = snapshot.Get(Point::kComfortButton);
    signals.fireplaceActive = snapshot.Get(Point::kFireplaceActive);
    signals.rapidActive = snapshot.Get(Point::kRapidActive);
    return signals;
}

FanMode MapOperationMode(double value) noexcept {
    switch (static_cast<OperationMode>(std::lround(value))) {
        case OperationMode::kHome:
            return FanMode::kHome;
        case OperationMode::kHigh:
        case OperationMode::kTemporaryHigh:
        case OperationMode::kCookerHood:
            return FanMode::kHigh;
        case OperationMode::kFireplace:
            return FanMode::kFireplace;
        case OperationMode::kAway:
        case OperationMode::kOff:
            return FanMode::kAway;
    }
    return FanMode::kAway;
}

FanMode MapVentilationMode(double value) noexcept {
    switch (static_cast<VentilationMode>(std::lround(value))) {
        case VentilationMode::kHome:
            return FanMode::kHome;
        case VentilationMode::kHigh:
            return FanMode::kHigh;
        case VentilationMode::kAway:
        case VentilationMode::kStop:
            return FanMode::kAway;
    }
    return FanMode::kAway;
}

std::optional<FanMode> MapRfInput(double value) noexcept {
    switch (std::lround(value)) {
        case 3:
        case 13:
            return FanMode::kHigh;
        case 24:
            return FanMode::kHome;
        case 26:
            return FanMode::kFireplace;
        default:
            return std::nullopt;
    }
}

std::optional<FanMode> ResolveFanMode(const ModeSignals& s) {
    if (!s.HasAny()) {
        return std::nullopt;
    }

    const std::optional<FanMode> rfMode = s.modeRfInput ? MapRfInput(*s.modeRfInput) : std::nullopt;

    FanMode mode = FanMode::kAway;
    if (s.operationMode) {
        mode = MapOperationMode(*s.operationMode);
    } else if (s.ventilationMode) {
        mode = MapVentilationMode(*s.ventilationMode);
    } else if (rfMode) {
        mode = *rfMode;
    } else if (Positive(s.remainingTempVentOp)) {
        if (Positive(s.remainingFireplaceVent)) {
            mode = FanMode::kFireplace;
        } else if (Positive(s.remainingRapidVent)) {
            mode = FanMode::kHigh;
        } else {
            mode = IsOne(s.comfortButton) ? FanMode::kHome : FanMode::kAway;
        }
    } else if (IsOne(s.comfortButton)) {
        mode = FanMode::kHome;
    }

    if (s.ventilationMode) {
        mode = MapVentilationMode(*s.ventilationMode);
    }

    if (IsOne(s.fireplaceActive)) {
        mode = FanMode::kFireplace;
    } else if (IsOne(s.rapidActive)) {
        mode = FanMode::kHigh;
    }

    return mode;
}

FanProfileMode ProfileFor(FanMode mode) noexcept {
    switch (mode) {
        case FanMode::kAway:      return FanProfileMode::kAway;
        case FanMode::kHome:      return FanProfileMode::kHome;
        case FanMode::kHigh:      return FanProfileMode::kHigh;
        case FanMode::kFireplace: return FanProfileMode::kFireplace;
    }
    return FanProfileMode::kAway;
}

FanProfileMode ResolveFanProfileMode(std::optional<double> operationMode, FanMode mode) noexcept {
    if (operationMode &&
        std::lround(*operationMode) == static_cast<long>(OperationMode::kCookerHood)) {
        return FanProfileMode::kCooker;
    }
    return ProfileFor(mode);
}

} // namespace FXN::Registry
