#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace FXN::Discovery {

struct NetworkInterface {
    std::string name;       // "eth0"
    std::string address;    // dotted IPv4
};

// Up, non-loopback IPv4 interfaces in enumeration order.
[[nodiscard]] std::vector<NetworkInterface> ListIPv4Interfaces();

// Candidate interfaces for a discovery session: all of them for "" / "auto",
// otherwise only the one whose address matches.
[[nodiscard]] std::vector<NetworkInterface> SelectInterfaces(const std::vector<NetworkInterface>& all,
                                                             std::string_view interfaceAddress);

} // namespace FXN::Discovery
