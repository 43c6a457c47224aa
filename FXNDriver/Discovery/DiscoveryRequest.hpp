#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../Core/Error.hpp"

namespace FXN::Discovery {

// Units ignore any request that is not exactly this long.
inline constexpr size_t kDiscoverRequestSize = 104;

inline constexpr uint8_t kTlvMarker = 0x0B;
inline constexpr uint8_t kTlvTagClient = 0x02;
inline constexpr uint8_t kTlvTagQuery = 0x03;

inline constexpr std::string_view kClientPrefix = "ABTMobile:";
inline constexpr std::string_view kDevicesQuery = "?Devices=All";

/**
 * Build the multicast discover request.
 *
 * Layout:
 *   80 01 00 04 | 00 00 00 08 | "discover" | 00 00 00 00 | 0c 00 01 0b |
 *   00 01 00 00 00 00 | TLV(2, "ABTMobile:<uuid>") | TLV(3, "?Devices=All") | 00 00
 * TLV header: 0b 00 <tag> 00 00 00 <len8>
 *
 * @param clientUuid 36-character UUID text; any other length produces a
 *        request that is not 104 bytes and is rejected.
 */
[[nodiscard]] Result<std::vector<uint8_t>> BuildDiscoverRequest(std::string_view clientUuid);

/// Same as above with a fresh random UUID v4.
[[nodiscard]] Result<std::vector<uint8_t>> BuildDiscoverRequest();

[[nodiscard]] std::string MakeClientUuid();

} // namespace FXN::Discovery
