#include "NetworkInterfaces.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>

#include "../Logging/Logging.hpp"

namespace FXN::Discovery {

std::vector<NetworkInterface> ListIPv4Interfaces() {
    std::vector<NetworkInterface> out;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        FXN_LOG_ERROR(Discovery, "getifaddrs failed: {}", std::strerror(errno));
        return out;
    }

    for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP)) {
            continue;
        }

        char buf[INET_ADDRSTRLEN] = {};
        const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            continue;
        }
        out.push_back(NetworkInterface{ifa->ifa_name ? ifa->ifa_name : "", buf});
    }

    freeifaddrs(list);
    return out;
}

std::vector<NetworkInterface> SelectInterfaces(const std::vector<NetworkInterface>& all,
                                               std::string_view interfaceAddress) {
    if (interfaceAddress.empty() || interfaceAddress == "auto") {
        return all;
    }

    std::vector<NetworkInterface> selected;
    for (const auto& nic : all) {
        if (nic.address == interfaceAddress) {
            selected.push_back(nic);
        }
    }
    return selected;
}

} // namespace FXN::Discovery
