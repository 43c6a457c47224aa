#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "../Bacnet/IBacnetTransport.hpp"
#include "../Bacnet/TransportPool.hpp"
#include "../Core/EngineConfig.hpp"
#include "../Core/Error.hpp"
#include "../Discovery/DiscoveryTypes.hpp"
#include "FanProfiles.hpp"
#include "IUnitSink.hpp"
#include "ModeArbiter.hpp"
#include "UnitState.hpp"

namespace FXN::Registry {

using WriteCompletion = std::function<void(Result<void>)>;

struct FanSetpointChange {
    std::string unitId;
    FanProfileMode mode;
    FanLeg leg;
    double setpointPercent;
};

using FanSetpointChangedHandler = std::function<void(const FanSetpointChange&)>;

struct HeatingCoilStateChange {
    std::string unitId;
    bool enabled;
};

using HeatingCoilStateChangedHandler = std::function<void(const HeatingCoilStateChange&)>;
using StateCompletion = std::function<void(Result<bool>)>;

struct UnitStatus {
    std::string unitId;
    std::string serial;
    std::string ip;
    uint16_t port{0};
    bool available{true};
    uint32_t consecutiveFailures{0};
    std::optional<FanMode> mode;
    std::optional<bool> heatingCoilEnabled;
    size_t queuedWrites{0};
    size_t blockedWrites{0};
    size_t pendingWriteMarkers{0};    // Code:37 writes awaiting a poll
    size_t writeContextMarkers{0};    // mode writes awaiting a poll
};

/// Per-unit communication engine.
///
/// Owns one UnitState per registered unit and drives it entirely from the
/// io_context: periodic polls, serialized writes, availability tracking and
/// rediscovery. Every public method must be called on the io_context thread.
///
/// Write methods validate synchronously: a returned error means nothing was
/// queued and the completion will never run. Otherwise the completion runs
/// exactly once on the io_context, with kAborted if the unit is removed first.
class UnitRegistry {
public:
    UnitRegistry(boost::asio::io_context& io,
                 Bacnet::TransportPool& transports,
                 Discovery::IDiscoveryService& discovery,
                 RegistryConfig config = RegistryConfig::MakeDefault());
    ~UnitRegistry();

    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    // First sink for an id creates the unit from the sink's "ip", "bacnetPort"
    // and "serial" settings and starts polling.
    void Register(const std::string& unitId, IUnitSink& sink);

    // Removing the last sink cancels timers and in-flight requests and aborts
    // queued writes.
    void Unregister(const std::string& unitId, IUnitSink& sink);

    void Destroy();

    [[nodiscard]] Result<void> PollNow(const std::string& unitId);

    // ------------------------------------------------------------------------
    // Writes
    // ------------------------------------------------------------------------

    [[nodiscard]] Result<void> WriteSetpoint(const std::string& unitId, double celsius,
                                             WriteCompletion completion);

    [[nodiscard]] Result<void> SetFanMode(const std::string& unitId, FanMode mode,
                                          WriteCompletion completion);

    [[nodiscard]] Result<void> SetFanProfileMode(const std::string& unitId, FanProfileMode mode,
                                                 double supplyPercent, double exhaustPercent,
                                                 WriteCompletion completion);

    [[nodiscard]] Result<void> SetFilterChangeInterval(const std::string& unitId, double hours,
                                                       WriteCompletion completion);

    [[nodiscard]] Result<void> ResetFilterTimer(const std::string& unitId, WriteCompletion completion);

    // Electric heating coil enable (BV445). Set skips when the unit already
    // reports the requested state; toggle reads the live state first and
    // completes with the state it wrote. Get reads from the unit once earlier
    // queued writes have finished. All three share the write queue.
    [[nodiscard]] Result<void> SetHeatingCoilEnabled(const std::string& unitId, bool enabled,
                                                     WriteCompletion completion);
    [[nodiscard]] Result<void> ToggleHeatingCoilEnabled(const std::string& unitId, StateCompletion completion);
    [[nodiscard]] Result<void> GetHeatingCoilEnabled(const std::string& unitId, StateCompletion completion);

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------

    void SetFanSetpointChangedHandler(FanSetpointChangedHandler handler);

    // Fires when a known heating coil state flips, whether seen by a poll or
    // caused by a write. The first observation only sets the baseline.
    void SetHeatingCoilStateChangedHandler(HeatingCoilStateChangedHandler handler);

    [[nodiscard]] std::optional<UnitStatus> GetStatus(const std::string& unitId) const;
    [[nodiscard]] size_t UnitCount() const { return units_.size(); }

private:
    using UnitPtr = std::shared_ptr<UnitState>;
    using UnitWeak = std::weak_ptr<UnitState>;
    using ReadDone = std::function<void(Result<std::vector<Bacnet::PointReading>>)>;
    using WriteDone = std::function<void(Result<void>)>;

    enum class WriteOutcome : uint8_t {
        kWritten,
        kSoftPending,
        kSkipped,
    };

    struct PointWrite {
        ObjectRef ref;
        Bacnet::ApplicationTag tag{Bacnet::ApplicationTag::kReal};
        double value{0};
        std::optional<uint8_t> priority{Bacnet::kPriorityDefault};
        bool force{false};
    };

    using StepDone = std::function<void(Result<WriteOutcome>)>;

    // One write in a sequence. prepare() runs when the step is reached and may
    // decline (nullopt); after() observes the outcome.
    struct ChainStep {
        std::function<std::optional<PointWrite>()> prepare;
        std::function<void(const Result<WriteOutcome>&)> after;
    };

    using Chain = std::vector<ChainStep>;
    using WriteBody = std::function<void(const UnitPtr&, WriteDone)>;

    [[nodiscard]] UnitPtr FindUnit(const std::string& unitId) const;
    [[nodiscard]] Result<UnitPtr> RequireUnit(const std::string& unitId) const;
    UnitPtr CreateUnit(const std::string& unitId, IUnitSink& sink);
    void RemoveUnit(UnitPtr unit);

    // Guarded transport calls (UnitRegistryTransport.cpp)
    void ReadPoints(const UnitPtr& unit, std::vector<ObjectRef> refs, ReadDone done);
    void WritePoint(const UnitPtr& unit, const ObjectRef& ref, Bacnet::TypedValue value,
                    const Bacnet::WriteOptions& options, WriteDone done);

    // Polling (UnitRegistryPoll.cpp)
    void SchedulePoll(const UnitPtr& unit);
    void PollUnit(const UnitPtr& unit, uint32_t attempt);
    void OnPollError(const UnitPtr& unit, const Error& error, uint32_t attempt);
    void OnPollData(const UnitPtr& unit, const std::vector<Bacnet::PointReading>& readings);
    void ReconcileMarkers(const UnitPtr& unit, Clock::time_point now);
    void HandlePollSuccess(const UnitPtr& unit);
    void HandlePollFailure(const UnitPtr& unit, const Error& error);
    void ForEachSink(const UnitPtr& unit, const std::function<void(IUnitSink&)>& fn);
    [[nodiscard]] bool IsLive(const UnitPtr& unit) const;
    void PushCapability(const UnitPtr& unit, const std::string& capability, const CapabilityValue& value);
    void PushCapabilities(const UnitPtr& unit, const PointSnapshot& snapshot, std::optional<FanMode> mode);
    void SyncSettings(const UnitPtr& unit, const PointSnapshot& snapshot);
    void PushSettings(const UnitPtr& unit, const SettingsBatch& batch);
    void UpdateFanSetpoints(const UnitPtr& unit, const PointSnapshot& snapshot, std::optional<FanMode> mode);
    void CheckExpectedMode(const UnitPtr& unit, const PointSnapshot& snapshot, FanMode mode);
    void NoteHeatingCoilState(const UnitPtr& unit, bool enabled);

    // Rediscovery (UnitRegistryPoll.cpp)
    void StartRediscovery(const UnitPtr& unit);
    void StopRediscovery(const UnitPtr& unit);
    void ScheduleRediscovery(const UnitPtr& unit, std::chrono::milliseconds delay);
    void RunRediscovery(const UnitPtr& unit);
    void OnRediscoveryResult(const UnitPtr& unit, const Result<std::vector<Discovery::DiscoveredUnit>>& result);

    // Writes (UnitRegistryWrites.cpp)
    void EnqueueWrite(const UnitPtr& unit, std::string label, WriteBody body, WriteCompletion completion);
    void IssueWrite(const UnitPtr& unit, const PointWrite& write, StepDone done);
    void RunChain(const UnitPtr& unit, std::shared_ptr<Chain> chain, size_t index,
                  std::shared_ptr<std::optional<Error>> firstError, WriteDone done);
    [[nodiscard]] Chain BuildModeChain(const UnitPtr& unit, FanMode mode);
    void VerifyFanProfile(const UnitPtr& unit, FanProfileMode mode, int supply, int exhaust, WriteDone done);
    void VerifyFilterInterval(const UnitPtr& unit, double requestedHours, WriteDone done);
    void ReadHeatingCoil(const UnitPtr& unit, StateCompletion done);
    void WriteHeatingCoil(const UnitPtr& unit, bool enabled, bool force, WriteDone done);

    boost::asio::io_context& io_;
    Bacnet::TransportPool& transports_;
    Discovery::IDiscoveryService& discovery_;
    RegistryConfig config_;

    std::map<std::string, UnitPtr> units_;
    FanSetpointChangedHandler fanSetpointChanged_;
    HeatingCoilStateChangedHandler heatingCoilChanged_;
};

} // namespace FXN::Registry
