#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "../Common/ObjectRef.hpp"

namespace FXN::Registry {

using Clock = std::chrono::steady_clock;

inline constexpr double kValueTolerance = 0.01;

// Device error codes carried in transport messages as "Code:<n>".
inline constexpr uint32_t kCodeWritePending = 37;
inline constexpr uint32_t kCodeWriteAccessDenied = 40;
inline constexpr uint32_t kCodeInvalidDataType = 9;

struct WriteRecord {
    double value;
    Clock::time_point at;
};

[[nodiscard]] bool ValuesMatch(double actual, double expected) noexcept;

/// A write is redundant when the unit already reports the desired value and
/// no newer, different write is waiting to show up in a poll.
[[nodiscard]] bool ShouldSkipWrite(std::optional<double> current,
                                   double desired,
                                   const std::optional<WriteRecord>& lastWrite,
                                   std::optional<Clock::time_point> lastPollAt) noexcept;

[[nodiscard]] std::optional<uint32_t> ParseProtocolCode(std::string_view message);

enum class WriteErrorClass : uint8_t {
    kSoftPending,   // accepted, value applied later
    kDenied,
    kOther,
};

[[nodiscard]] WriteErrorClass ClassifyWriteError(std::string_view message);

// Points whose denials are transient and must never be blocked.
[[nodiscard]] bool IsNeverBlocked(const ObjectRef& ref);

} // namespace FXN::Registry
