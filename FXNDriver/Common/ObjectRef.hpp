#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <fmt/format.h>

namespace FXN {

// ============================================================================
// BACnet object addressing
// ============================================================================

// Object types exposed by Flexit Nordic controllers. Values are the
// BACnet wire encoding (ASHRAE 135 clause 21, BACnetObjectType).
enum class ObjectType : uint16_t {
    AnalogInput = 0,
    AnalogOutput = 1,
    AnalogValue = 2,
    BinaryInput = 3,
    BinaryValue = 5,
    MultiStateValue = 19,
    PositiveIntegerValue = 48,
};

[[nodiscard]] constexpr const char* ShortName(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::AnalogInput:          return "AI";
        case ObjectType::AnalogOutput:         return "AO";
        case ObjectType::AnalogValue:          return "AV";
        case ObjectType::BinaryInput:          return "BI";
        case ObjectType::BinaryValue:          return "BV";
        case ObjectType::MultiStateValue:      return "MSV";
        case ObjectType::PositiveIntegerValue: return "PIV";
    }
    return "OBJ";
}

// (type, instance) pair addressing one point on a unit.
struct ObjectRef {
    ObjectType type{ObjectType::AnalogValue};
    uint32_t instance{0};

    constexpr auto operator<=>(const ObjectRef&) const = default;

    // "AV:1994" - for logs only, never used as a key.
    [[nodiscard]] std::string ToString() const {
        return fmt::format("{}:{}", ShortName(type), instance);
    }
};

struct ObjectRefHash {
    size_t operator()(const ObjectRef& ref) const noexcept {
        return std::hash<uint64_t>{}((uint64_t(ref.type) << 32) | ref.instance);
    }
};

} // namespace FXN

template <>
struct fmt::formatter<FXN::ObjectRef> : fmt::formatter<std::string> {
    auto format(const FXN::ObjectRef& ref, format_context& ctx) const {
        return fmt::formatter<std::string>::format(ref.ToString(), ctx);
    }
};
