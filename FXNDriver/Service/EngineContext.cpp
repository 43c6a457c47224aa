#include "EngineContext.hpp"

#include <utility>

#include "../Logging/Logging.hpp"

namespace FXN::Service {

EngineContext::EngineContext(boost::asio::io_context& io,
                             Bacnet::TransportPool::Factory transportFactory,
                             EngineConfig config)
    : io_(io)
    , config_(std::move(config)) {
    LogConfig::Shared().InitializeFromEnvironment();

    transports_ = std::make_unique<Bacnet::TransportPool>(std::move(transportFactory));
    discovery_ = std::make_unique<FXN::Discovery::DiscoveryProtocol>(io_);
    registry_ = std::make_unique<FXN::Registry::UnitRegistry>(io_, *transports_, *discovery_, config_.registry);

    FXN_LOG_V1(Service, "Engine started (poll={}ms, interface={})",
               config_.registry.pollInterval.count(), config_.discoveryInterface);
}

EngineContext::~EngineContext() {
    Reset();
}

void EngineContext::Discover(FXN::Discovery::DiscoveryCompletion completion) {
    FXN::Discovery::DiscoveryOptions options;
    options.interfaceAddress = config_.discoveryInterface;
    discovery_->Discover(options, std::move(completion));
}

void EngineContext::Reset() {
    if (registry_) {
        FXN_LOG_V1(Service, "Engine reset: {} unit(s)", registry_->UnitCount());
        registry_->Destroy();
    }
    if (transports_) {
        transports_->Clear();
    }
}

} // namespace FXN::Service
