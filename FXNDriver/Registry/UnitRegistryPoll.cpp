#include "UnitRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include "../Discovery/ReplyParser.hpp"
#include "../Logging/Logging.hpp"
#include "FilterMath.hpp"

namespace FXN::Registry {

namespace {

constexpr const char* kUnreachableReason = "Unit unreachable, will auto-reconnect";

std::string FormatValue(std::optional<double> value) {
    return value ? fmt::format("{}", *value) : std::string("unset");
}

} // namespace

// ============================================================================
// Poll scheduling
// ============================================================================

void UnitRegistry::SchedulePoll(const UnitPtr& unit) {
    unit->pollTimer->expires_after(config_.pollInterval);
    unit->pollTimer->async_wait([this, weak = UnitWeak(unit)](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto unit = weak.lock();
        if (!unit) {
            return;
        }
        PollUnit(unit, 0);
        SchedulePoll(unit);
    });
}

void UnitRegistry::PollUnit(const UnitPtr& unit, uint32_t attempt) {
    if (attempt == 0) {
        if (unit->pollInFlight) {
            FXN_LOG_V3(Registry, "{}: previous poll still in flight, skipping tick", unit->unitId);
            return;
        }
        unit->pollInFlight = true;
    }

    FXN_LOG_V3(Registry, "{}: polling {} (attempt {})", unit->unitId, unit->ip, attempt + 1);

    ReadPoints(unit, PollList(), [this, weak = UnitWeak(unit), attempt](Result<std::vector<Bacnet::PointReading>> result) {
        auto unit = weak.lock();
        if (!unit) {
            return;
        }
        if (!result) {
            OnPollError(unit, result.error(), attempt);
            return;
        }
        unit->pollInFlight = false;
        OnPollData(unit, *result);
    });
}

void UnitRegistry::OnPollError(const UnitPtr& unit, const Error& error, uint32_t attempt) {
    if (error.Is(ErrorCode::kTimeout) && attempt == 0) {
        FXN_LOG_WARNING(Registry, "{}: poll timeout, retrying once", unit->unitId);
        unit->retryTimer->expires_after(config_.pollRetryDelay);
        unit->retryTimer->async_wait([this, weak = UnitWeak(unit)](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto unit = weak.lock()) {
                PollUnit(unit, 1);
            }
        });
        return;
    }

    unit->pollInFlight = false;
    HandlePollFailure(unit, error);
}

// ============================================================================
// Availability
// ============================================================================

void UnitRegistry::HandlePollFailure(const UnitPtr& unit, const Error& error) {
    ++unit->consecutiveFailures;
    FXN_LOG_RL_FOR(Registry, "poll/failure", unit->unitId, 30000, spdlog::level::err,
                   "{}: poll failed ({}/{}): {}", unit->unitId, unit->consecutiveFailures,
                   config_.failureThreshold, error.message);

    if (unit->available && unit->consecutiveFailures >= config_.failureThreshold) {
        unit->available = false;
        FXN_LOG_WARNING(Registry, "{}: marking unavailable after {} failed polls",
                        unit->unitId, unit->consecutiveFailures);
        error.LogAsWarning();
        ForEachSink(unit, [](IUnitSink& sink) { sink.SetUnavailable(kUnreachableReason); });
        if (IsLive(unit)) {
            StartRediscovery(unit);
        }
    }
}

void UnitRegistry::HandlePollSuccess(const UnitPtr& unit) {
    unit->consecutiveFailures = 0;
    if (unit->available) {
        return;
    }

    unit->available = true;
    FXN_LOG_INFO(Registry, "{}: reachable again at {}:{}", unit->unitId, unit->ip, unit->port);
    StopRediscovery(unit);
    ForEachSink(unit, [](IUnitSink& sink) { sink.SetAvailable(); });
}

// ============================================================================
// Poll data
// ============================================================================

void UnitRegistry::OnPollData(const UnitPtr& unit, const std::vector<Bacnet::PointReading>& readings) {
    const auto now = Clock::now();
    unit->lastPollAt = now;

    PointSnapshot snapshot;
    for (const auto& reading : readings) {
        if (!reading.value || !std::isfinite(*reading.value)) {
            continue;
        }
        const double value = *reading.value;

        auto [it, inserted] = unit->polledValues.try_emplace(reading.ref, value);
        if (!inserted && it->second != value) {
            const double previous = it->second;
            it->second = value;
            if (ShouldLogChanges(reading.ref)) {
                FXN_LOG_V2(Registry, "{}: {} ({}) {} -> {}", unit->unitId, LabelOf(reading.ref),
                           reading.ref, previous, value);
            }
        } else if (inserted && ShouldLogChanges(reading.ref)) {
            FXN_LOG_V2(Registry, "{}: {} ({}) = {}", unit->unitId, LabelOf(reading.ref), reading.ref, value);
        }

        if (auto point = FindPoint(reading.ref)) {
            snapshot.Set(*point, value);
        }
    }

    ReconcileMarkers(unit, now);
    HandlePollSuccess(unit);
    if (!IsLive(unit)) {
        return;
    }

    const auto mode = ResolveFanMode(ModeSignals::FromSnapshot(snapshot));
    if (mode) {
        unit->lastMode = mode;
    }

    PushCapabilities(unit, snapshot, mode);
    SyncSettings(unit, snapshot);
    if (!IsLive(unit)) {
        return;
    }
    UpdateFanSetpoints(unit, snapshot, mode);
    if (mode && IsLive(unit)) {
        CheckExpectedMode(unit, snapshot, *mode);
    }
}

void UnitRegistry::ReconcileMarkers(const UnitPtr& unit, Clock::time_point now) {
    for (auto it = unit->pendingWriteErrors.begin(); it != unit->pendingWriteErrors.end();) {
        const auto& [ref, marker] = *it;
        const auto actual = unit->Value(ref);
        const bool expired = now - marker.at > config_.writeConfirmWindow;
        if (actual && ValuesMatch(*actual, marker.value)) {
            FXN_LOG_INFO(Registry, "{}: pending write to {} confirmed: now {} (was Code:{})",
                         unit->unitId, ref, *actual, marker.code);
            it = unit->pendingWriteErrors.erase(it);
        } else if (actual && !expired) {
            FXN_LOG_RL_FOR(Registry, "poll/pending_mismatch", unit->unitId, 10000, spdlog::level::warn,
                           "{}: pending write to {} not applied: expected {}, got {}",
                           unit->unitId, ref, marker.value, *actual);
            it = unit->pendingWriteErrors.erase(it);
        } else if (expired) {
            FXN_LOG_V2(Registry, "{}: dropping stale pending-write marker for {}", unit->unitId, ref);
            it = unit->pendingWriteErrors.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = unit->writeContext.begin(); it != unit->writeContext.end();) {
        const auto& [ref, marker] = *it;
        const auto actual = unit->Value(ref);
        const bool expired = now - marker.at > config_.writeConfirmWindow;
        if (actual && ValuesMatch(*actual, marker.value)) {
            FXN_LOG_V2(Registry, "{}: {} confirmed at {} for '{}'", unit->unitId, ref, *actual,
                       ToString(marker.mode));
            it = unit->writeContext.erase(it);
        } else if (actual && !expired) {
            FXN_LOG_RL_FOR(Registry, "poll/context_mismatch", unit->unitId, 10000, spdlog::level::warn,
                           "{}: {} mismatch after write: expected {} for '{}', got {}",
                           unit->unitId, ref, marker.value, ToString(marker.mode), *actual);
            it = unit->writeContext.erase(it);
        } else if (expired) {
            it = unit->writeContext.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// Capability and settings push
// ============================================================================

// Sinks may detach (and the unit may go away) from inside a callback, so the
// list is copied and each entry re-checked before it is called.
void UnitRegistry::ForEachSink(const UnitPtr& unit, const std::function<void(IUnitSink&)>& fn) {
    const auto sinks = unit->sinks;
    for (auto* sink : sinks) {
        if (!IsLive(unit)) {
            return;
        }
        if (std::find(unit->sinks.begin(), unit->sinks.end(), sink) == unit->sinks.end()) {
            continue;
        }
        fn(*sink);
    }
}

bool UnitRegistry::IsLive(const UnitPtr& unit) const {
    return FindUnit(unit->unitId) == unit;
}

void UnitRegistry::PushCapability(const UnitPtr& unit, const std::string& capability, const CapabilityValue& value) {
    ForEachSink(unit, [&](IUnitSink& sink) {
        if (auto result = sink.SetCapabilityValue(capability, value); !result) {
            FXN_LOG_DEBUG(Registry, "{}: {} not accepted: {}", unit->unitId, capability, result.error().message);
        }
    });
}

void UnitRegistry::PushCapabilities(const UnitPtr& unit, const PointSnapshot& snapshot, std::optional<FanMode> mode) {
    const auto push = [&](const char* capability, Point point, double scale = 1.0) {
        if (auto value = snapshot.Get(point)) {
            PushCapability(unit, capability, *value * scale);
        }
    };

    const Point authoritative = (mode == FanMode::kAway) ? Point::kSetpointAway : Point::kSetpointHome;
    push("target_temperature", authoritative);
    push("measure_temperature", Point::kSupplyTemperature);
    push("measure_temperature.outdoor", Point::kOutdoorTemperature);
    push("measure_temperature.extract", Point::kExtractTemperature);
    push("measure_temperature.exhaust", Point::kExhaustTemperature);
    push("measure_humidity", Point::kHumidity);
    push("measure_power", Point::kHeaterPower, 1000.0);
    push("measure_motor_rpm", Point::kSupplyFanRpm);
    push("measure_motor_rpm.extract", Point::kExtractFanRpm);
    push("measure_fan_speed_percent", Point::kSupplyFanPercent);
    push("measure_fan_speed_percent.extract", Point::kExtractFanPercent);

    if (auto life = FilterRemainingPercent(snapshot.Get(Point::kFilterOperatingTime),
                                           snapshot.Get(Point::kFilterLimit))) {
        PushCapability(unit, "measure_hepa_filter", *life);
    }

    if (mode) {
        PushCapability(unit, "fan_mode", std::string(ToString(*mode)));
    }

    if (auto coil = snapshot.Get(Point::kHeatingCoilEnable)) {
        NoteHeatingCoilState(unit, std::lround(*coil) != 0);
    }
}

void UnitRegistry::SyncSettings(const UnitPtr& unit, const PointSnapshot& snapshot) {
    std::vector<std::pair<std::string, double>> observed;

    if (auto home = snapshot.Get(Point::kSetpointHome)) {
        observed.emplace_back("target_temperature_home", *home);
    }
    if (auto away = snapshot.Get(Point::kSetpointAway)) {
        observed.emplace_back("target_temperature_away", *away);
    }
    for (const auto mode : AllFanProfileModes()) {
        for (const auto leg : {FanLeg::kSupply, FanLeg::kExhaust}) {
            if (auto percent = snapshot.Get(FanProfilePoint(mode, leg))) {
                observed.emplace_back(FanProfileSettingKey(mode, leg), *percent);
            }
        }
    }
    if (auto limit = snapshot.Get(Point::kFilterLimit); limit && *limit > 0) {
        observed.emplace_back("filter_change_interval_hours", *limit);
        observed.emplace_back("filter_change_interval_months",
                              static_cast<double>(HoursToMonths(*limit).months));
    }

    if (observed.empty()) {
        return;
    }

    ForEachSink(unit, [&](IUnitSink& sink) {
        SettingsBatch batch;
        for (const auto& [key, value] : observed) {
            const auto current = SettingAsNumber(sink.GetSetting(key));
            if (!current || std::fabs(*current - value) > config_.settingsTolerance) {
                batch.emplace(key, value);
            }
        }
        if (batch.empty()) {
            return;
        }
        FXN_LOG_V2(Registry, "{}: syncing {} setting(s) from unit", unit->unitId, batch.size());
        if (auto result = sink.SetSettings(batch); !result) {
            FXN_LOG_DEBUG(Registry, "{}: settings sync rejected: {}", unit->unitId, result.error().message);
        }
    });
}

void UnitRegistry::PushSettings(const UnitPtr& unit, const SettingsBatch& batch) {
    ForEachSink(unit, [&](IUnitSink& sink) {
        if (auto result = sink.SetSettings(batch); !result) {
            FXN_LOG_DEBUG(Registry, "{}: settings update rejected: {}", unit->unitId, result.error().message);
        }
    });
}

// ============================================================================
// Fan setpoints and mode tracking
// ============================================================================

void UnitRegistry::UpdateFanSetpoints(const UnitPtr& unit, const PointSnapshot& snapshot, std::optional<FanMode> mode) {
    if (!mode) {
        return;
    }

    const auto profile = ResolveFanProfileMode(snapshot.Get(Point::kOperationMode), *mode);
    const auto supply = snapshot.Get(FanProfilePoint(profile, FanLeg::kSupply));
    const auto exhaust = snapshot.Get(FanProfilePoint(profile, FanLeg::kExhaust));

    if (supply) {
        PushCapability(unit, "measure_fan_setpoint_percent", *supply);
    }
    if (exhaust) {
        PushCapability(unit, "measure_fan_setpoint_percent.extract", *exhaust);
    }

    const auto notify = [&](FanLeg leg, const std::optional<double>& previous, const std::optional<double>& current) {
        if (!current || (previous && ValuesMatch(*previous, *current))) {
            return;
        }
        FXN_LOG_V1(Registry, "{}: {} {} fan setpoint {} -> {}", unit->unitId, ToString(profile),
                   ToString(leg), FormatValue(previous), *current);
        if (fanSetpointChanged_) {
            fanSetpointChanged_(FanSetpointChange{unit->unitId, profile, leg, *current});
        }
    };

    if (unit->fanSetpointsInitialized) {
        notify(FanLeg::kSupply, unit->currentSupplySetpoint, supply);
        notify(FanLeg::kExhaust, unit->currentExhaustSetpoint, exhaust);
    }

    unit->currentFanSetpointMode = profile;
    if (supply) {
        unit->currentSupplySetpoint = supply;
    }
    if (exhaust) {
        unit->currentExhaustSetpoint = exhaust;
    }
    unit->fanSetpointsInitialized = true;
}

void UnitRegistry::NoteHeatingCoilState(const UnitPtr& unit, bool enabled) {
    const auto previous = unit->heatingCoilEnabled;
    unit->heatingCoilEnabled = enabled;
    PushCapability(unit, "heating_coil_onoff", CapabilityValue(std::in_place_type<bool>, enabled));

    if (!previous || *previous == enabled) {
        return;
    }
    FXN_LOG_INFO(Registry, "{}: heating coil turned {}", unit->unitId, enabled ? "on" : "off");
    if (heatingCoilChanged_ && IsLive(unit)) {
        heatingCoilChanged_(HeatingCoilStateChange{unit->unitId, enabled});
    }
}

void UnitRegistry::CheckExpectedMode(const UnitPtr& unit, const PointSnapshot& snapshot, FanMode mode) {
    if (!unit->expectedMode) {
        return;
    }
    const FanMode expected = *unit->expectedMode;
    if (expected == mode) {
        unit->lastMismatchKey.clear();
        return;
    }

    const bool awayPending = expected == FanMode::kAway &&
                             snapshot.Is(Point::kComfortButton, 0) &&
                             snapshot.Is(Point::kAwayDelayActive, 1);
    if (awayPending) {
        const std::string key = fmt::format("{}->pending", ToString(expected));
        if (unit->lastMismatchKey != key) {
            unit->lastMismatchKey = key;
            FXN_LOG_INFO(Registry, "{}: away pending, delay active (configured {} min)",
                         unit->unitId, FormatValue(snapshot.Get(Point::kComfortButtonDelay)));
        }
        return;
    }

    const std::string key = fmt::format("{}->{}", ToString(expected), ToString(mode));
    if (unit->lastMismatchKey != key) {
        unit->lastMismatchKey = key;
        FXN_LOG_WARNING(Registry, "{}: mode mismatch: expected '{}' got '{}'",
                        unit->unitId, ToString(expected), ToString(mode));
    }
}

// ============================================================================
// Rediscovery
// ============================================================================

void UnitRegistry::StartRediscovery(const UnitPtr& unit) {
    if (unit->rediscoveryTimer) {
        return;
    }
    unit->rediscoveryTimer = std::make_unique<boost::asio::steady_timer>(io_);
    FXN_LOG_V1(Registry, "{}: starting rediscovery every {}ms", unit->unitId,
               config_.rediscoveryInterval.count());

    RunRediscovery(unit);
    ScheduleRediscovery(unit, config_.rediscoveryInterval);
}

void UnitRegistry::StopRediscovery(const UnitPtr& unit) {
    if (!unit->rediscoveryTimer) {
        return;
    }
    boost::system::error_code ec;
    unit->rediscoveryTimer->cancel(ec);
    unit->rediscoveryTimer.reset();
    FXN_LOG_V2(Registry, "{}: rediscovery stopped", unit->unitId);
}

void UnitRegistry::ScheduleRediscovery(const UnitPtr& unit, std::chrono::milliseconds delay) {
    if (!unit->rediscoveryTimer) {
        return;
    }
    unit->rediscoveryTimer->expires_after(delay);
    unit->rediscoveryTimer->async_wait([this, weak = UnitWeak(unit)](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto unit = weak.lock();
        if (!unit || !unit->rediscoveryTimer) {
            return;
        }
        RunRediscovery(unit);
        ScheduleRediscovery(unit, config_.rediscoveryInterval);
    });
}

void UnitRegistry::RunRediscovery(const UnitPtr& unit) {
    if (unit->serial.empty()) {
        if (!unit->missingSerialLogged) {
            unit->missingSerialLogged = true;
            FXN_LOG_WARNING(Registry, "{}: no serial stored, cannot rediscover", unit->unitId);
        }
        return;
    }
    if (unit->rediscoveryInFlight) {
        return;
    }

    unit->rediscoveryInFlight = true;
    FXN_LOG_V2(Registry, "{}: rediscovery scan for serial {}", unit->unitId, unit->serial);
    discovery_.Discover(config_.rediscovery,
        [this, weak = UnitWeak(unit)](Result<std::vector<Discovery::DiscoveredUnit>> result) {
            auto unit = weak.lock();
            if (!unit) {
                return;
            }
            unit->rediscoveryInFlight = false;
            OnRediscoveryResult(unit, result);
        });
}

void UnitRegistry::OnRediscoveryResult(const UnitPtr& unit,
                                       const Result<std::vector<Discovery::DiscoveredUnit>>& result) {
    if (!result) {
        FXN_LOG_WARNING(Registry, "{}: rediscovery failed: {}", unit->unitId, result.error().message);
        return;
    }

    const std::string wanted = Discovery::ReplyParser::NormalizeSerial(unit->serial);
    for (const auto& found : *result) {
        if (found.serialNormalized != wanted) {
            continue;
        }

        if (found.ip != unit->ip || found.port != unit->port) {
            FXN_LOG_INFO(Registry, "{}: endpoint moved {}:{} -> {}:{}", unit->unitId,
                         unit->ip, unit->port, found.ip, found.port);
            unit->ip = found.ip;
            unit->port = found.port;
            PushSettings(unit, SettingsBatch{
                {"ip", found.ip},
                {"bacnetPort", static_cast<double>(found.port)},
            });
            if (!IsLive(unit)) {
                return;
            }
        } else {
            FXN_LOG_V2(Registry, "{}: rediscovered at unchanged endpoint {}:{}", unit->unitId,
                       unit->ip, unit->port);
        }

        PollUnit(unit, 0);
        return;
    }

    FXN_LOG_V2(Registry, "{}: not found in rediscovery scan ({} unit(s) seen)", unit->unitId, result->size());
}

} // namespace FXN::Registry
