#include "UnitRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include "../Logging/Logging.hpp"

namespace FXN::Registry {

UnitRegistry::UnitRegistry(boost::asio::io_context& io,
                           Bacnet::TransportPool& transports,
                           Discovery::IDiscoveryService& discovery,
                           RegistryConfig config)
    : io_(io)
    , transports_(transports)
    , discovery_(discovery)
    , config_(std::move(config)) {}

UnitRegistry::~UnitRegistry() {
    Destroy();
}

// ============================================================================
// Lifecycle
// ============================================================================

void UnitRegistry::Register(const std::string& unitId, IUnitSink& sink) {
    UnitPtr unit = FindUnit(unitId);
    if (!unit) {
        unit = CreateUnit(unitId, sink);
    }

    if (std::find(unit->sinks.begin(), unit->sinks.end(), &sink) == unit->sinks.end()) {
        unit->sinks.push_back(&sink);
        FXN_LOG_V2(Registry, "{}: sink attached ({} total)", unitId, unit->sinks.size());
    }
}

void UnitRegistry::Unregister(const std::string& unitId, IUnitSink& sink) {
    UnitPtr unit = FindUnit(unitId);
    if (!unit) {
        return;
    }

    std::erase(unit->sinks, &sink);
    FXN_LOG_V2(Registry, "{}: sink detached ({} left)", unitId, unit->sinks.size());
    if (unit->sinks.empty()) {
        RemoveUnit(unit);
    }
}

void UnitRegistry::Destroy() {
    while (!units_.empty()) {
        RemoveUnit(units_.begin()->second);
    }
}

UnitRegistry::UnitPtr UnitRegistry::CreateUnit(const std::string& unitId, IUnitSink& sink) {
    auto unit = std::make_shared<UnitState>();
    unit->unitId = unitId;
    unit->ip = SettingAsString(sink.GetSetting("ip"));
    unit->serial = SettingAsString(sink.GetSetting("serial"));

    const auto port = SettingAsNumber(sink.GetSetting("bacnetPort"));
    if (port && *port > 0 && *port <= 65535) {
        unit->port = static_cast<uint16_t>(std::lround(*port));
    } else {
        unit->port = config_.defaultBacnetPort;
    }

    unit->pollTimer = std::make_unique<boost::asio::steady_timer>(io_);
    unit->retryTimer = std::make_unique<boost::asio::steady_timer>(io_);
    unit->writeQueue = WriteQueue::Create(io_);

    units_.emplace(unitId, unit);
    FXN_LOG_V1(Registry, "{}: registered at {}:{} (serial '{}')", unitId, unit->ip, unit->port, unit->serial);

    boost::asio::post(io_, [this, weak = UnitWeak(unit)] {
        if (auto unit = weak.lock()) {
            PollUnit(unit, 0);
        }
    });
    SchedulePoll(unit);
    return unit;
}

void UnitRegistry::RemoveUnit(UnitPtr unit) {
    FXN_LOG_V1(Registry, "{}: removing unit", unit->unitId);

    boost::system::error_code ec;
    unit->pollTimer->cancel(ec);
    unit->retryTimer->cancel(ec);
    StopRediscovery(unit);
    unit->CancelInflight();
    unit->writeQueue->Shutdown();
    unit->sinks.clear();

    const std::string unitId = unit->unitId;
    units_.erase(unitId);
}

UnitRegistry::UnitPtr UnitRegistry::FindUnit(const std::string& unitId) const {
    if (auto it = units_.find(unitId); it != units_.end()) {
        return it->second;
    }
    return nullptr;
}

Result<UnitRegistry::UnitPtr> UnitRegistry::RequireUnit(const std::string& unitId) const {
    if (auto unit = FindUnit(unitId)) {
        return unit;
    }
    return FXN_ERROR_NOT_FOUND(fmt::format("Unit not found: {}", unitId));
}

Result<void> UnitRegistry::PollNow(const std::string& unitId) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    boost::asio::post(io_, [this, weak = UnitWeak(unit)] {
        if (auto unit = weak.lock()) {
            PollUnit(unit, 0);
        }
    });
    return {};
}

// ============================================================================
// Observation
// ============================================================================

void UnitRegistry::SetFanSetpointChangedHandler(FanSetpointChangedHandler handler) {
    fanSetpointChanged_ = std::move(handler);
}

void UnitRegistry::SetHeatingCoilStateChangedHandler(HeatingCoilStateChangedHandler handler) {
    heatingCoilChanged_ = std::move(handler);
}

std::optional<UnitStatus> UnitRegistry::GetStatus(const std::string& unitId) const {
    const auto unit = FindUnit(unitId);
    if (!unit) {
        return std::nullopt;
    }

    UnitStatus status;
    status.unitId = unit->unitId;
    status.serial = unit->serial;
    status.ip = unit->ip;
    status.port = unit->port;
    status.available = unit->available;
    status.consecutiveFailures = unit->consecutiveFailures;
    status.mode = unit->lastMode;
    status.heatingCoilEnabled = unit->heatingCoilEnabled;
    status.queuedWrites = unit->writeQueue->Pending() + (unit->writeQueue->Busy() ? 1 : 0);
    status.blockedWrites = unit->blockedWrites.size();
    status.pendingWriteMarkers = unit->pendingWriteErrors.size();
    status.writeContextMarkers = unit->writeContext.size();
    return status;
}

} // namespace FXN::Registry
