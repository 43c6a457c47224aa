#pragma once

#include <optional>

#include "../Core/Error.hpp"

namespace FXN::Registry {

inline constexpr double kFilterHoursPerMonth = 732;
inline constexpr int kFilterMinMonths = 3;
inline constexpr int kFilterMaxMonths = 12;
inline constexpr double kFilterMinHours = kFilterMinMonths * kFilterHoursPerMonth;   // 2196
inline constexpr double kFilterMaxHours = kFilterMaxMonths * kFilterHoursPerMonth;   // 8784

inline constexpr double kSetpointMin = 10;
inline constexpr double kSetpointMax = 30;

/// Remaining filter life in percent, one decimal.
/// @return nullopt when either input is missing or the limit is not positive
[[nodiscard]] std::optional<double> FilterRemainingPercent(std::optional<double> operatingHours,
                                                           std::optional<double> limitHours);

[[nodiscard]] Result<double> ValidateFilterIntervalHours(double hours);

struct FilterMonths {
    int months;
    bool exact;     // hours was a whole number of months before clamping
};

[[nodiscard]] FilterMonths HoursToMonths(double hours);

// Clamp to 10-30 and round to the nearest 0.5.
[[nodiscard]] double RoundSetpoint(double celsius);

} // namespace FXN::Registry
