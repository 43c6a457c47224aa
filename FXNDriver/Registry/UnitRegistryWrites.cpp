#include "UnitRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include "../Logging/Logging.hpp"
#include "FilterMath.hpp"

namespace FXN::Registry {

namespace {

constexpr int kDefaultFireplaceMinutes = 10;
constexpr int kFireplaceMinMinutes = 1;
constexpr int kFireplaceMaxMinutes = 360;

constexpr const char* BoolText(bool value) { return value ? "true" : "false"; }

} // namespace

// ============================================================================
// Queue plumbing
// ============================================================================

void UnitRegistry::EnqueueWrite(const UnitPtr& unit, std::string label, WriteBody body, WriteCompletion completion) {
    // Shared one-shot slot: either the body's result or an abort fills it.
    auto slot = std::make_shared<WriteCompletion>(std::move(completion));
    const auto finish = [slot](Result<void> result) {
        if (!*slot) {
            return;
        }
        auto callback = std::move(*slot);
        *slot = nullptr;
        callback(std::move(result));
    };

    WriteQueue::Task task;
    task.label = fmt::format("{} {}", unit->unitId, label);
    task.run = [weak = UnitWeak(unit), body = std::move(body), finish, label](WriteQueue::Done done) {
        auto unit = weak.lock();
        if (!unit) {
            finish(FXN_ERROR_ABORTED(fmt::format("{} aborted: unit removed", label)));
            done();
            return;
        }
        body(unit, [finish, done](Result<void> result) {
            finish(std::move(result));
            done();
        });
    };
    task.abort = [finish, label] {
        finish(FXN_ERROR_ABORTED(fmt::format("{} aborted: unit removed", label)));
    };

    unit->writeQueue->Enqueue(std::move(task));
}

void UnitRegistry::IssueWrite(const UnitPtr& unit, const PointWrite& write, StepDone done) {
    const ObjectRef ref = write.ref;

    if (unit->blockedWrites.contains(ref)) {
        FXN_LOG_WARNING(Registry, "{}: skipping write {} (write access denied previously)", unit->unitId, ref);
        boost::asio::post(io_, [done, ref] {
            done(FXN_ERROR_DENIED(fmt::format("writes to {} are blocked after an earlier denial", ref)));
        });
        return;
    }

    if (!write.force) {
        std::optional<WriteRecord> lastWrite;
        if (auto it = unit->lastWriteValues.find(ref); it != unit->lastWriteValues.end()) {
            lastWrite = it->second;
        }
        if (ShouldSkipWrite(unit->Value(ref), write.value, lastWrite, unit->lastPollAt)) {
            FXN_LOG_V1(Registry, "{}: {} already {}, skipping write", unit->unitId, ref, write.value);
            boost::asio::post(io_, [done] { done(WriteOutcome::kSkipped); });
            return;
        }
    }

    Bacnet::WriteOptions options;
    options.priority = write.priority;

    FXN_LOG_V1(Registry, "{}: writing {} = {} (priority {})", unit->unitId, ref, write.value,
               write.priority ? fmt::format("{}", *write.priority) : std::string("none"));

    WritePoint(unit, ref, Bacnet::TypedValue{write.tag, write.value}, options,
        [weak = UnitWeak(unit), ref, value = write.value, done](Result<void> result) {
            auto unit = weak.lock();
            if (!unit) {
                return;
            }
            const auto now = Clock::now();

            if (result) {
                unit->lastWriteValues[ref] = WriteRecord{value, now};
                FXN_LOG_V1(Registry, "{}: wrote {} = {}", unit->unitId, ref, value);
                done(WriteOutcome::kWritten);
                return;
            }

            const Error& error = result.error();
            if (error.Is(ErrorCode::kTimeout)) {
                FXN_LOG_ERROR(Registry, "{}: timeout writing {}", unit->unitId, ref);
                done(std::unexpected(error));
                return;
            }

            switch (ClassifyWriteError(error.message)) {
                case WriteErrorClass::kSoftPending:
                    unit->lastWriteValues[ref] = WriteRecord{value, now};
                    unit->pendingWriteErrors[ref] = PendingWriteMarker{value, kCodeWritePending, now};
                    FXN_LOG_WARNING(Registry, "{}: write {} returned Code:{}; will verify on next poll",
                                    unit->unitId, ref, kCodeWritePending);
                    done(WriteOutcome::kSoftPending);
                    return;

                case WriteErrorClass::kDenied:
                    unit->lastWriteValues[ref] = WriteRecord{value, now};
                    if (IsNeverBlocked(ref)) {
                        FXN_LOG_WARNING(Registry, "{}: write {} denied, will keep retrying", unit->unitId, ref);
                    } else {
                        unit->blockedWrites.insert(ref);
                        FXN_LOG_WARNING(Registry, "{}: disabling writes to {} after device denial", unit->unitId, ref);
                    }
                    done(FXN_ERROR_DENIED(fmt::format("write {} denied: {}", ref, error.message)));
                    return;

                case WriteErrorClass::kOther:
                    FXN_LOG_ERROR(Registry, "{}: failed to write {} = {}: {}", unit->unitId, ref, value, error.message);
                    done(std::unexpected(error));
                    return;
            }
        });
}

void UnitRegistry::RunChain(const UnitPtr& unit, std::shared_ptr<Chain> chain, size_t index,
                            std::shared_ptr<std::optional<Error>> firstError, WriteDone done) {
    // Declined steps are skipped inline; the chain only yields on real writes.
    std::optional<PointWrite> write;
    while (index < chain->size()) {
        const auto& step = (*chain)[index];
        write = step.prepare ? step.prepare() : std::nullopt;
        if (write) {
            break;
        }
        ++index;
    }

    if (!write) {
        if (*firstError) {
            done(std::unexpected(**firstError));
        } else {
            done({});
        }
        return;
    }

    IssueWrite(unit, *write,
        [this, weak = UnitWeak(unit), chain, index, firstError, done](Result<WriteOutcome> outcome) {
            auto unit = weak.lock();
            if (!unit) {
                return;
            }
            const auto& step = (*chain)[index];
            if (step.after) {
                step.after(outcome);
            }
            if (!outcome && !*firstError) {
                *firstError = outcome.error();
            }
            RunChain(unit, chain, index + 1, firstError, done);
        });
}

// ============================================================================
// Setpoint
// ============================================================================

Result<void> UnitRegistry::WriteSetpoint(const std::string& unitId, double celsius, WriteCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    if (!std::isfinite(celsius)) {
        return FXN_ERROR_INVALID("setpoint must be a finite number");
    }

    const double value = RoundSetpoint(celsius);
    FXN_LOG_INFO(Registry, "{}: writing setpoint {} (requested {})", unitId, value, celsius);

    EnqueueWrite(unit, "setpoint",
        [this, value](const UnitPtr& unit, WriteDone done) {
            const auto mode = ResolveFanMode(ModeSignals::FromSnapshot(unit->Snapshot()));
            const Point target = (mode == FanMode::kAway) ? Point::kSetpointAway : Point::kSetpointHome;
            IssueWrite(unit, PointWrite{RefOf(target), Bacnet::ApplicationTag::kReal, value},
                [done](Result<WriteOutcome> outcome) {
                    if (!outcome) {
                        done(std::unexpected(outcome.error()));
                        return;
                    }
                    done({});
                });
        },
        std::move(completion));
    return {};
}

// ============================================================================
// Fan mode
// ============================================================================

Result<void> UnitRegistry::SetFanMode(const std::string& unitId, FanMode mode, WriteCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    FXN_LOG_INFO(Registry, "{}: setting fan mode '{}'", unitId, ToString(mode));

    EnqueueWrite(unit, fmt::format("fan mode {}", ToString(mode)),
        [this, mode](const UnitPtr& unit, WriteDone done) {
            auto chain = std::make_shared<Chain>(BuildModeChain(unit, mode));
            RunChain(unit, chain, 0, std::make_shared<std::optional<Error>>(), std::move(done));
        },
        std::move(completion));
    return {};
}

UnitRegistry::Chain UnitRegistry::BuildModeChain(const UnitPtr& unit, FanMode mode) {
    using Bacnet::ApplicationTag;

    unit->expectedMode = mode;
    unit->lastMismatchKey.clear();
    std::erase_if(unit->blockedWrites, [](const ObjectRef& ref) { return IsNeverBlocked(ref); });

    const auto snapshot = unit->Snapshot();
    const bool fireplaceActive = snapshot.Is(Point::kFireplaceActive, 1);
    const bool rapidActive = snapshot.Is(Point::kRapidActive, 1);
    const bool tempVentActive = snapshot.Get(Point::kTempVentOpRemaining).value_or(0) > 0;
    const bool temporaryActive = rapidActive || tempVentActive;

    const ObjectRef comfortRef = RefOf(Point::kComfortButton);
    const ObjectRef ventModeRef = RefOf(Point::kVentilationMode);

    // Shared between steps: later steps depend on the comfort write.
    auto comfortOk = std::make_shared<bool>(false);
    UnitWeak weak(unit);

    const auto fixed = [](PointWrite write) {
        return ChainStep{[write] { return std::optional<PointWrite>(write); }, nullptr};
    };
    const auto trigger = [&](Point point) {
        return fixed(PointWrite{RefOf(point), ApplicationTag::kUnsignedInt, kTriggerValue, std::nullopt, true});
    };
    const auto comfort = [&](double value, bool force) {
        return ChainStep{
            [=] { return std::optional<PointWrite>(PointWrite{comfortRef, ApplicationTag::kEnumerated, value,
                                                              Bacnet::kPriorityDefault, force}); },
            [comfortOk](const Result<WriteOutcome>& outcome) { *comfortOk = outcome.has_value(); }};
    };
    const auto ventilationMode = [&](VentilationMode value, bool force) {
        return ChainStep{
            [=]() -> std::optional<PointWrite> {
                auto unit = weak.lock();
                if (!unit || !*comfortOk) {
                    return std::nullopt;
                }
                if (unit->blockedWrites.contains(ventModeRef)) {
                    FXN_LOG_WARNING(Registry, "{}: ventilation mode write blocked; cannot set '{}'",
                                    unit->unitId, ToString(mode));
                    return std::nullopt;
                }
                return PointWrite{ventModeRef, ApplicationTag::kUnsignedInt, static_cast<double>(value),
                                  Bacnet::kPriorityDefault, force};
            },
            [=](const Result<WriteOutcome>& outcome) {
                auto unit = weak.lock();
                if (unit && outcome && *outcome != WriteOutcome::kSkipped) {
                    unit->writeContext[ventModeRef] =
                        WriteContextMarker{static_cast<double>(value), mode, Clock::now()};
                }
            }};
    };

    Chain chain;

    if (mode != FanMode::kFireplace && fireplaceActive) {
        FXN_LOG_V1(Registry, "{}: clearing active fireplace ventilation", unit->unitId);
        chain.push_back(trigger(Point::kFireplaceTrigger));
    }

    switch (mode) {
        case FanMode::kHome:
            chain.push_back(comfort(1, false));
            chain.push_back(ventilationMode(VentilationMode::kHome, true));
            if (temporaryActive) {
                chain.push_back(trigger(Point::kRapidTrigger));
            }
            break;

        case FanMode::kAway:
            chain.push_back(comfort(0, fireplaceActive));
            if (temporaryActive) {
                chain.push_back(trigger(Point::kRapidTrigger));
            }
            break;

        case FanMode::kHigh:
            chain.push_back(comfort(1, false));
            chain.push_back(ventilationMode(VentilationMode::kHigh, false));
            break;

        case FanMode::kFireplace: {
            if (temporaryActive) {
                FXN_LOG_WARNING(Registry, "{}: fireplace requested while temporary ventilation is active "
                                "(rapid={} temp={}); proceeding anyway",
                                unit->unitId, BoolText(rapidActive), BoolText(tempVentActive));
            }
            if (!snapshot.Is(Point::kComfortButton, 1)) {
                chain.push_back(comfort(1, false));
            }
            const double observed = snapshot.Get(Point::kFireplaceRuntime).value_or(kDefaultFireplaceMinutes);
            const int runtime = std::clamp(static_cast<int>(std::lround(observed)),
                                           kFireplaceMinMinutes, kFireplaceMaxMinutes);
            chain.push_back(fixed(PointWrite{RefOf(Point::kFireplaceRuntime), ApplicationTag::kUnsignedInt,
                                             static_cast<double>(runtime), Bacnet::kPriorityDefault, true}));
            chain.push_back(fixed(PointWrite{RefOf(Point::kFireplaceTrigger), ApplicationTag::kUnsignedInt,
                                             kTriggerValue, Bacnet::kPriorityDefault, true}));
            break;
        }
    }

    return chain;
}

// ============================================================================
// Fan profiles
// ============================================================================

Result<void> UnitRegistry::SetFanProfileMode(const std::string& unitId, FanProfileMode mode,
                                             double supplyPercent, double exhaustPercent,
                                             WriteCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    const int supply = FXN_TRY(ValidateFanProfilePercent(mode, FanLeg::kSupply, supplyPercent));
    const int exhaust = FXN_TRY(ValidateFanProfilePercent(mode, FanLeg::kExhaust, exhaustPercent));

    FXN_LOG_INFO(Registry, "{}: setting {} fan profile supply={}% exhaust={}%", unitId, ToString(mode),
                 supply, exhaust);

    EnqueueWrite(unit, fmt::format("fan profile {}", ToString(mode)),
        [this, mode, supply, exhaust](const UnitPtr& unit, WriteDone done) {
            const auto step = [&](FanLeg leg, int percent) {
                const PointWrite write{RefOf(FanProfilePoint(mode, leg)), Bacnet::ApplicationTag::kReal,
                                       static_cast<double>(percent), Bacnet::kPriorityVendorApp};
                return ChainStep{[write] { return std::optional<PointWrite>(write); }, nullptr};
            };
            auto chain = std::make_shared<Chain>(Chain{step(FanLeg::kSupply, supply), step(FanLeg::kExhaust, exhaust)});

            RunChain(unit, chain, 0, std::make_shared<std::optional<Error>>(),
                [this, weak = UnitWeak(unit), mode, supply, exhaust, done](Result<void> result) {
                    auto unit = weak.lock();
                    if (!unit) {
                        return;
                    }
                    if (!result) {
                        done(std::move(result));
                        return;
                    }
                    VerifyFanProfile(unit, mode, supply, exhaust, done);
                });
        },
        std::move(completion));
    return {};
}

void UnitRegistry::VerifyFanProfile(const UnitPtr& unit, FanProfileMode mode, int supply, int exhaust, WriteDone done) {
    const ObjectRef supplyRef = RefOf(FanProfilePoint(mode, FanLeg::kSupply));
    const ObjectRef exhaustRef = RefOf(FanProfilePoint(mode, FanLeg::kExhaust));

    ReadPoints(unit, {supplyRef, exhaustRef},
        [this, weak = UnitWeak(unit), mode, supply, exhaust, supplyRef, exhaustRef, done](
            Result<std::vector<Bacnet::PointReading>> result) {
            auto unit = weak.lock();
            if (!unit) {
                return;
            }

            double verifiedSupply = supply;
            double verifiedExhaust = exhaust;
            if (!result) {
                FXN_LOG_WARNING(Registry, "{}: could not read back {} fan profile: {}", unit->unitId,
                                ToString(mode), result.error().message);
            } else {
                for (const auto& reading : *result) {
                    if (!reading.value) {
                        continue;
                    }
                    unit->polledValues[reading.ref] = *reading.value;
                    if (reading.ref == supplyRef) {
                        verifiedSupply = *reading.value;
                    } else if (reading.ref == exhaustRef) {
                        verifiedExhaust = *reading.value;
                    }
                }
                if (!ValuesMatch(verifiedSupply, supply) || !ValuesMatch(verifiedExhaust, exhaust)) {
                    FXN_LOG_WARNING(Registry, "{}: {} fan profile reads back {}/{} after writing {}/{}",
                                    unit->unitId, ToString(mode), verifiedSupply, verifiedExhaust, supply, exhaust);
                }
            }

            PushSettings(unit, SettingsBatch{
                {FanProfileSettingKey(mode, FanLeg::kSupply), verifiedSupply},
                {FanProfileSettingKey(mode, FanLeg::kExhaust), verifiedExhaust},
            });
            done({});
        });
}

// ============================================================================
// Filter
// ============================================================================

Result<void> UnitRegistry::SetFilterChangeInterval(const std::string& unitId, double hours, WriteCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    const double validated = FXN_TRY(ValidateFilterIntervalHours(hours));

    FXN_LOG_INFO(Registry, "{}: setting filter change interval to {}h", unitId, validated);

    EnqueueWrite(unit, "filter interval",
        [this, validated](const UnitPtr& unit, WriteDone done) {
            const PointWrite write{RefOf(Point::kFilterLimit), Bacnet::ApplicationTag::kReal, validated,
                                   Bacnet::kPriorityVendorApp};
            IssueWrite(unit, write, [this, weak = UnitWeak(unit), validated, done](Result<WriteOutcome> outcome) {
                auto unit = weak.lock();
                if (!unit) {
                    return;
                }
                if (!outcome) {
                    done(std::unexpected(outcome.error()));
                    return;
                }
                VerifyFilterInterval(unit, validated, done);
            });
        },
        std::move(completion));
    return {};
}

void UnitRegistry::VerifyFilterInterval(const UnitPtr& unit, double requestedHours, WriteDone done) {
    const ObjectRef limitRef = RefOf(Point::kFilterLimit);

    ReadPoints(unit, {limitRef},
        [this, weak = UnitWeak(unit), requestedHours, limitRef, done](Result<std::vector<Bacnet::PointReading>> result) {
            auto unit = weak.lock();
            if (!unit) {
                return;
            }

            double hours = requestedHours;
            if (!result) {
                FXN_LOG_WARNING(Registry, "{}: could not read back filter interval: {}", unit->unitId,
                                result.error().message);
            } else {
                for (const auto& reading : *result) {
                    if (reading.ref == limitRef && reading.value) {
                        hours = *reading.value;
                        unit->polledValues[limitRef] = hours;
                    }
                }
            }

            const auto months = HoursToMonths(hours);
            if (!months.exact) {
                FXN_LOG_WARNING(Registry, "{}: filter interval {}h is not a whole number of months; showing {}",
                                unit->unitId, hours, months.months);
            }

            PushSettings(unit, SettingsBatch{
                {"filter_change_interval_hours", hours},
                {"filter_change_interval_months", static_cast<double>(months.months)},
            });
            done({});
        });
}

Result<void> UnitRegistry::ResetFilterTimer(const std::string& unitId, WriteCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    FXN_LOG_INFO(Registry, "{}: resetting filter timer", unitId);

    EnqueueWrite(unit, "filter reset",
        [this](const UnitPtr& unit, WriteDone done) {
            const PointWrite write{RefOf(Point::kFilterOperatingTime), Bacnet::ApplicationTag::kReal, 0.0,
                                   Bacnet::kPriorityVendorApp, true};
            IssueWrite(unit, write, [done](Result<WriteOutcome> outcome) {
                if (!outcome) {
                    done(std::unexpected(outcome.error()));
                    return;
                }
                done({});
            });
        },
        std::move(completion));
    return {};
}

// ============================================================================
// Heating coil
// ============================================================================

Result<void> UnitRegistry::SetHeatingCoilEnabled(const std::string& unitId, bool enabled, WriteCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    FXN_LOG_INFO(Registry, "{}: turning heating coil {}", unitId, enabled ? "on" : "off");

    EnqueueWrite(unit, "heating coil",
        [this, enabled](const UnitPtr& unit, WriteDone done) {
            WriteHeatingCoil(unit, enabled, false, std::move(done));
        },
        std::move(completion));
    return {};
}

Result<void> UnitRegistry::ToggleHeatingCoilEnabled(const std::string& unitId, StateCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));
    FXN_LOG_INFO(Registry, "{}: toggling heating coil", unitId);

    auto written = std::make_shared<bool>(false);
    EnqueueWrite(unit, "heating coil toggle",
        [this, written](const UnitPtr& unit, WriteDone done) {
            ReadHeatingCoil(unit, [this, weak = UnitWeak(unit), written, done](Result<bool> current) {
                auto unit = weak.lock();
                if (!unit) {
                    return;
                }
                if (!current) {
                    done(std::unexpected(current.error()));
                    return;
                }
                *written = !*current;
                WriteHeatingCoil(unit, *written, true, done);
            });
        },
        [written, completion = std::move(completion)](Result<void> result) {
            if (!result) {
                completion(std::unexpected(result.error()));
                return;
            }
            completion(*written);
        });
    return {};
}

Result<void> UnitRegistry::GetHeatingCoilEnabled(const std::string& unitId, StateCompletion completion) {
    auto unit = FXN_TRY(RequireUnit(unitId));

    // Queued so the answer reflects writes issued before it.
    auto state = std::make_shared<bool>(false);
    EnqueueWrite(unit, "heating coil read",
        [this, state](const UnitPtr& unit, WriteDone done) {
            ReadHeatingCoil(unit, [state, done](Result<bool> current) {
                if (!current) {
                    done(std::unexpected(current.error()));
                    return;
                }
                *state = *current;
                done({});
            });
        },
        [state, completion = std::move(completion)](Result<void> result) {
            if (!result) {
                completion(std::unexpected(result.error()));
                return;
            }
            completion(*state);
        });
    return {};
}

void UnitRegistry::ReadHeatingCoil(const UnitPtr& unit, StateCompletion done) {
    const ObjectRef coilRef = RefOf(Point::kHeatingCoilEnable);

    ReadPoints(unit, {coilRef},
        [this, weak = UnitWeak(unit), coilRef, done](Result<std::vector<Bacnet::PointReading>> result) {
            auto unit = weak.lock();
            if (!unit) {
                return;
            }
            if (!result) {
                FXN_LOG_WARNING(Registry, "{}: could not read heating coil state: {}", unit->unitId,
                                result.error().message);
                done(std::unexpected(result.error()));
                return;
            }
            for (const auto& reading : *result) {
                if (reading.ref != coilRef || !reading.value || !std::isfinite(*reading.value)) {
                    continue;
                }
                unit->polledValues[coilRef] = *reading.value;
                const bool enabled = std::lround(*reading.value) != 0;
                NoteHeatingCoilState(unit, enabled);
                done(enabled);
                return;
            }
            done(FXN_ERROR_NOT_FOUND(fmt::format("{} did not report the heating coil state", unit->unitId)));
        });
}

void UnitRegistry::WriteHeatingCoil(const UnitPtr& unit, bool enabled, bool force, WriteDone done) {
    const PointWrite write{RefOf(Point::kHeatingCoilEnable), Bacnet::ApplicationTag::kEnumerated,
                           enabled ? 1.0 : 0.0, Bacnet::kPriorityDefault, force};
    IssueWrite(unit, write, [this, weak = UnitWeak(unit), enabled, done](Result<WriteOutcome> outcome) {
        auto unit = weak.lock();
        if (!unit) {
            return;
        }
        if (!outcome) {
            done(std::unexpected(outcome.error()));
            return;
        }
        if (*outcome == WriteOutcome::kWritten) {
            NoteHeatingCoilState(unit, enabled);
        }
        done({});
    });
}

} // namespace FXN::Registry
