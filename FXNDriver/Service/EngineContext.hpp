#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include "../Bacnet/TransportPool.hpp"
#include "../Core/EngineConfig.hpp"
#include "../Discovery/DiscoveryProtocol.hpp"
#include "../Registry/UnitRegistry.hpp"

namespace FXN::Service {

// Composition root for the hub glue. Owns the transport pool, the discovery
// protocol and the unit registry, all bound to the caller's io_context.
class EngineContext {
public:
    EngineContext(boost::asio::io_context& io,
                  Bacnet::TransportPool::Factory transportFactory,
                  EngineConfig config = EngineConfig::MakeDefault());
    ~EngineContext();

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    FXN::Registry::UnitRegistry& Registry() { return *registry_; }
    FXN::Discovery::DiscoveryProtocol& Discovery() { return *discovery_; }
    Bacnet::TransportPool& Transports() { return *transports_; }
    const EngineConfig& Config() const { return config_; }

    // Pairing scan with the configured interface.
    void Discover(FXN::Discovery::DiscoveryCompletion completion);

    // Drops every unit and releases all BACnet clients.
    void Reset();

private:
    boost::asio::io_context& io_;
    EngineConfig config_;
    std::unique_ptr<Bacnet::TransportPool> transports_;
    std::unique_ptr<FXN::Discovery::DiscoveryProtocol> discovery_;
    std::unique_ptr<FXN::Registry::UnitRegistry> registry_;
};

} // namespace FXN::Service
