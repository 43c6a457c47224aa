#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include "IBacnetTransport.hpp"
#include "../Core/Error.hpp"

namespace FXN::Bacnet {

// One transport per local UDP port, created on first use and shared by every
// unit bound to that port. Owned by the composition root and injected into
// the registry.
class TransportPool {
public:
    using Factory = std::function<std::shared_ptr<IBacnetTransport>(uint16_t port)>;

    explicit TransportPool(Factory factory);
    ~TransportPool() = default;

    TransportPool(const TransportPool&) = delete;
    TransportPool& operator=(const TransportPool&) = delete;

    // Port 0 maps to the default BACnet port (47808).
    [[nodiscard]] Result<std::shared_ptr<IBacnetTransport>> Get(uint16_t port);

    [[nodiscard]] size_t Size() const { return byPort_.size(); }

    void Clear();

private:
    Factory factory_;
    std::map<uint16_t, std::shared_ptr<IBacnetTransport>> byPort_;
};

} // namespace FXN::Bacnet
