#include "TransportPool.hpp"

#include <utility>

#include <fmt/format.h>

#include "../Discovery/DiscoveryTypes.hpp"
#include "../Logging/Logging.hpp"

namespace FXN::Bacnet {

TransportPool::TransportPool(Factory factory)
    : factory_(std::move(factory)) {}

Result<std::shared_ptr<IBacnetTransport>> TransportPool::Get(uint16_t port) {
    if (port == 0) {
        port = Discovery::kDefaultBacnetPort;
    }

    if (auto it = byPort_.find(port); it != byPort_.end()) {
        return it->second;
    }

    if (!factory_) {
        return FXN_ERROR_INTERNAL("transport pool has no factory");
    }

    auto transport = factory_(port);
    if (!transport) {
        return FXN_ERROR_TRANSPORT(fmt::format("failed to create BACnet client on port {}", port));
    }

    FXN_LOG_V1(Transport, "Created BACnet client on local port {}", port);
    byPort_.emplace(port, transport);
    return transport;
}

void TransportPool::Clear() {
    if (!byPort_.empty()) {
        FXN_LOG_V2(Transport, "Releasing {} BACnet client(s)", byPort_.size());
    }
    byPort_.clear();
}

} // namespace FXN::Bacnet
