#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "DiscoveryTypes.hpp"

namespace FXN::Discovery {

// Best-effort identity extraction from a discovery reply. The reply is binary
// with embedded ASCII; only the serial and BACnet endpoint are essential.
class ReplyParser {
public:
    // Returns nullopt when no serial is present or the serial is not a
    // Nordic family serial (8001xx, 8002xx, 8003xx).
    [[nodiscard]] static std::optional<DiscoveredUnit> Parse(std::span<const uint8_t> payload,
                                                             std::string_view senderAddress);

    // Non-printable byte runs collapsed to one space, then trimmed.
    [[nodiscard]] static std::string ToPrintable(std::span<const uint8_t> payload);

    [[nodiscard]] static std::string NormalizeSerial(std::string_view serial);
    [[nodiscard]] static bool IsNordicSerial(std::string_view serialNormalized);

private:
    static std::string PickName(std::string_view text);
};

} // namespace FXN::Discovery
