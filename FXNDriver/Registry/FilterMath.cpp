#include "FilterMath.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace FXN::Registry {

std::optional<double> FilterRemainingPercent(std::optional<double> operatingHours,
                                             std::optional<double> limitHours) {
    if (!operatingHours || !limitHours || *limitHours <= 0) {
        return std::nullopt;
    }
    const double remaining = std::max(0.0, (1.0 - *operatingHours / *limitHours) * 100.0);
    return std::round(remaining * 10.0) / 10.0;
}

Result<double> ValidateFilterIntervalHours(double hours) {
    if (!std::isfinite(hours) || hours < kFilterMinHours || hours > kFilterMaxHours) {
        return FXN_ERROR_INVALID(fmt::format(
            "filter change interval must be between {} and {} hours ({}-{} months)",
            kFilterMinHours, kFilterMaxHours, kFilterMinMonths, kFilterMaxMonths));
    }
    return hours;
}

FilterMonths HoursToMonths(double hours) {
    const double raw = hours / kFilterHoursPerMonth;
    if (std::isnan(raw)) {
        return {kFilterMinMonths, false};
    }
    const double nearest = std::round(raw);
    const bool exact = std::fabs(raw - nearest) < 1e-6;
    const double bounded = std::clamp(nearest, static_cast<double>(kFilterMinMonths),
                                      static_cast<double>(kFilterMaxMonths));
    return {static_cast<int>(bounded), exact};
}

double RoundSetpoint(double celsius) {
    const double clamped = std::clamp(celsius, kSetpointMin, kSetpointMax);
    return std::round(clamped * 2.0) / 2.0;
}

} // namespace FXN::Registry
