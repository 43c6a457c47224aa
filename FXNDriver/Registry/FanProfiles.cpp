#include "FanProfiles.hpp"

#include <array>
#include <cmath>

#include <fmt/format.h>

namespace FXN::Registry {

namespace {

struct ProfileEntry {
    FanProfileMode mode;
    PercentRange supply;
    PercentRange exhaust;
    Point supplyPoint;
    Point exhaustPoint;
};

constexpr std::array<ProfileEntry, kFanProfileModeCount> kProfiles = {{
    {FanProfileMode::kHigh,      {80, 100}, {79, 100}, Point::kFanSupplyHigh,      Point::kFanExhaustHigh},
    {FanProfileMode::kHome,      {56, 100}, {55, 99},  Point::kFanSupplyHome,      Point::kFanExhaustHome},
    {FanProfileMode::kAway,      {30, 80},  {30, 79},  Point::kFanSupplyAway,      Point::kFanExhaustAway},
    {FanProfileMode::kFireplace, {30, 100}, {30, 100}, Point::kFanSupplyFireplace, Point::kFanExhaustFireplace},
    {FanProfileMode::kCooker,    {30, 100}, {30, 100}, Point::kFanSupplyCooker,    Point::kFanExhaustCooker},
}};

constexpr std::array<FanProfileMode, kFanProfileModeCount> kModes = {
    FanProfileMode::kHigh,
    FanProfileMode::kHome,
    FanProfileMode::kAway,
    FanProfileMode::kFireplace,
    FanProfileMode::kCooker,
};

const ProfileEntry& EntryFor(FanProfileMode mode) {
    return kProfiles[static_cast<size_t>(mode)];
}

} // namespace

PercentRange FanProfileRange(FanProfileMode mode, FanLeg leg) noexcept {
    const auto& entry = EntryFor(mode);
    return leg == FanLeg::kSupply ? entry.supply : entry.exhaust;
}

Point FanProfilePoint(FanProfileMode mode, FanLeg leg) noexcept {
    const auto& entry = EntryFor(mode);
    return leg == FanLeg::kSupply ? entry.supplyPoint : entry.exhaustPoint;
}

std::string FanProfileSettingKey(FanProfileMode mode, FanLeg leg) {
    return fmt::format("fan_profile_{}_{}", ToString(mode), ToString(leg));
}

std::span<const FanProfileMode> AllFanProfileModes() noexcept {
    return kModes;
}

Result<int> ValidateFanProfilePercent(FanProfileMode mode, FanLeg leg, double percent) {
    const auto range = FanProfileRange(mode, leg);
    const auto rangeError = [&] {
        return FXN_ERROR_INVALID(fmt::format("{} {} fan profile must be between {} and {} percent",
                                             ToString(mode), ToString(leg), range.min, range.max));
    };

    if (!std::isfinite(percent)) {
        return rangeError();
    }
    const long rounded = std::lround(percent);
    if (rounded < range.min || rounded > range.max) {
        return rangeError();
    }
    return static_cast<int>(rounded);
}

} // namespace FXN::Registry
