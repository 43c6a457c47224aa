#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/steady_timer.hpp>

#include "../Bacnet/RequestGuard.hpp"
#include "../Common/ObjectRef.hpp"
#include "IUnitSink.hpp"
#include "ModeArbiter.hpp"
#include "PointCatalog.hpp"
#include "WritePolicy.hpp"
#include "WriteQueue.hpp"

namespace FXN::Registry {

// Device answered "write pending"; verified against the next poll.
struct PendingWriteMarker {
    double value;
    uint32_t code;
    Clock::time_point at;
};

// Mode write whose effect is checked against the next poll.
struct WriteContextMarker {
    double value;
    FanMode mode;
    Clock::time_point at;
};

// Everything the registry knows about one physical unit. Owned by the
// registry; callbacks hold weak_ptr and bail out once the unit is removed.
struct UnitState {
    std::string unitId;
    std::string serial;
    std::string ip;
    uint16_t port{0};

    std::vector<IUnitSink*> sinks;

    std::unique_ptr<boost::asio::steady_timer> pollTimer;
    std::unique_ptr<boost::asio::steady_timer> retryTimer;
    std::unique_ptr<boost::asio::steady_timer> rediscoveryTimer;   // only while unavailable

    std::shared_ptr<WriteQueue> writeQueue;

    // Last numeric value of every polled ref (known and diagnostic points).
    std::map<ObjectRef, double> polledValues;
    std::set<ObjectRef> blockedWrites;
    std::map<ObjectRef, PendingWriteMarker> pendingWriteErrors;
    std::map<ObjectRef, WriteRecord> lastWriteValues;
    std::optional<Clock::time_point> lastPollAt;
    std::map<ObjectRef, WriteContextMarker> writeContext;

    std::optional<FanMode> expectedMode;
    std::string lastMismatchKey;
    std::optional<FanMode> lastMode;

    uint32_t consecutiveFailures{0};
    bool available{true};
    bool pollInFlight{false};
    bool rediscoveryInFlight{false};
    bool missingSerialLogged{false};

    // Last known heating coil enable state, from polls and own writes.
    std::optional<bool> heatingCoilEnabled;

    std::optional<FanProfileMode> currentFanSetpointMode;
    std::optional<double> currentSupplySetpoint;
    std::optional<double> currentExhaustSetpoint;
    bool fanSetpointsInitialized{false};

    std::vector<std::shared_ptr<Bacnet::RequestGuard>> inflight;

    [[nodiscard]] std::optional<double> Value(const ObjectRef& ref) const {
        if (auto it = polledValues.find(ref); it != polledValues.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> Value(Point point) const { return Value(RefOf(point)); }

    // Known points from the accumulated poll values.
    [[nodiscard]] PointSnapshot Snapshot() const {
        PointSnapshot snapshot;
        for (size_t i = 0; i < kPointCount; ++i) {
            const auto point = static_cast<Point>(i);
            if (auto value = Value(point)) {
                snapshot.Set(point, *value);
            }
        }
        return snapshot;
    }

    void Track(std::shared_ptr<Bacnet::RequestGuard> guard) {
        std::erase_if(inflight, [](const auto& g) { return g->IsSettled(); });
        inflight.push_back(std::move(guard));
    }

    void CancelInflight() {
        for (auto& guard : inflight) {
            guard->Cancel();
        }
        inflight.clear();
    }
};

} // namespace FXN::Registry
