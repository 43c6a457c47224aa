#include "WritePolicy.hpp"

#include <charconv>
#include <cmath>
#include <regex>

#include "PointCatalog.hpp"

namespace FXN::Registry {

bool ValuesMatch(double actual, double expected) noexcept {
    return std::fabs(actual - expected) < kValueTolerance;
}

bool ShouldSkipWrite(std::optional<double> current,
                     double desired,
                     const std::optional<WriteRecord>& lastWrite,
                     std::optional<Clock::time_point> lastPollAt) noexcept {
    if (!current || !ValuesMatch(*current, desired)) {
        return false;
    }
    if (!lastWrite) {
        return true;
    }
    // No poll yet counts as the epoch: every recorded write is newer.
    if (lastPollAt && lastWrite->at <= *lastPollAt) {
        return true;
    }
    return ValuesMatch(lastWrite->value, desired);
}

std::optional<uint32_t> ParseProtocolCode(std::string_view message) {
    static const std::regex kCodePattern(R"(Code:(\d+))");

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(message.begin(), message.end(), match, kCodePattern)) {
        return std::nullopt;
    }
    const auto digits = match[1];
    uint32_t code = 0;
    const auto [ptr, ec] = std::from_chars(&*digits.first, &*digits.first + digits.length(), code);
    if (ec != std::errc()) {
        return std::nullopt;
    }
    return code;
}

WriteErrorClass ClassifyWriteError(std::string_view message) {
    const auto code = ParseProtocolCode(message);
    if (!code) {
        return WriteErrorClass::kOther;
    }
    switch (*code) {
        case kCodeWritePending:
            return WriteErrorClass::kSoftPending;
        case kCodeWriteAccessDenied:
        case kCodeInvalidDataType:
            return WriteErrorClass::kDenied;
        default:
            return WriteErrorClass::kOther;
    }
}

bool IsNeverBlocked(const ObjectRef& ref) {
    const auto point = FindPoint(ref);
    if (!point) {
        return false;
    }
    switch (*point) {
        case Point::kVentilationMode:
        case Point::kComfortButton:
        case Point::kFireplaceTrigger:
        case Point::kFireplaceRuntime:
        case Point::kRapidTrigger:
            return true;
        default:
            return false;
    }
}

} // namespace FXN::Registry
