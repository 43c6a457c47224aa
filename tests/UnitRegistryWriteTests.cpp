#include "UnitRegistryFixture.hpp"

#include <gmock/gmock.h>

#include <limits>
#include <string>
#include <vector>

#include "mocks/MockBacnetTransport.hpp"

using namespace FXN;
using namespace FXN::Registry;
using namespace FXN::Registry::Testing;
using FXN::Bacnet::ApplicationTag;
using FXN::Bacnet::kPriorityDefault;
using FXN::Bacnet::kPriorityVendorApp;
using FXN::Bacnet::kPropertyPresentValue;

namespace {

constexpr ObjectRef kComfortButton{ObjectType::BinaryValue, 50};
constexpr ObjectRef kVentilationMode{ObjectType::MultiStateValue, 42};
constexpr ObjectRef kFireplaceTrigger{ObjectType::MultiStateValue, 360};
constexpr ObjectRef kFireplaceRuntime{ObjectType::PositiveIntegerValue, 270};
constexpr ObjectRef kRapidTrigger{ObjectType::MultiStateValue, 357};
constexpr ObjectRef kSetpointHome{ObjectType::AnalogValue, 1994};
constexpr ObjectRef kSetpointAway{ObjectType::AnalogValue, 1985};
constexpr ObjectRef kFilterOperatingTime{ObjectType::AnalogValue, 285};
constexpr ObjectRef kFilterLimit{ObjectType::AnalogValue, 286};
constexpr ObjectRef kFanSupplyHome{ObjectType::AnalogValue, 1836};
constexpr ObjectRef kFanExhaustHome{ObjectType::AnalogValue, 1841};
constexpr ObjectRef kHeatingCoil{ObjectType::BinaryValue, 445};

} // namespace

class UnitRegistryWriteTest : public UnitRegistryTest {
protected:
    void StartClean() {
        Start();
        transport_->ClearWrites();
    }

    void ExpectWrite(size_t index, const ObjectRef& ref, ApplicationTag tag, double value,
                     std::optional<uint8_t> priority) {
        const auto& writes = transport_->Writes();
        ASSERT_LT(index, writes.size());
        const auto& write = writes[index];
        EXPECT_EQ(write.address, kUnitIp);
        EXPECT_EQ(write.ref, ref) << "write " << index << " went to " << write.ref.ToString();
        EXPECT_EQ(write.propertyId, kPropertyPresentValue);
        EXPECT_EQ(write.value.tag, tag);
        EXPECT_DOUBLE_EQ(write.value.value, value);
        EXPECT_EQ(write.priority, priority);
    }

    static void ExpectOk(const std::optional<Result<void>>& outcome) {
        ASSERT_TRUE(outcome.has_value()) << "completion did not run";
        EXPECT_TRUE(outcome->has_value()) << outcome->error().message;
    }

    static void ExpectError(const std::optional<Result<void>>& outcome, ErrorCode code) {
        ASSERT_TRUE(outcome.has_value()) << "completion did not run";
        ASSERT_FALSE(outcome->has_value());
        EXPECT_TRUE(outcome->error().Is(code)) << ToString(outcome->error().code);
    }
};

// =============================================================================
// Fan mode
// =============================================================================

TEST_F(UnitRegistryWriteTest, AwayClearsComfortButton) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kAway, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kComfortButton, ApplicationTag::kEnumerated, 0, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, HomeSetsComfortThenVentilationMode) {
    LoadAwayState();
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHome, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(0, kComfortButton, ApplicationTag::kEnumerated, 1, kPriorityDefault);
    ExpectWrite(1, kVentilationMode, ApplicationTag::kUnsignedInt, 3, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, HomeSkipsVentilationModeWhenComfortFails) {
    LoadAwayState();
    transport_->FailWrite(kComfortButton, "BacnetError - Class:2 Code:31");
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHome, Capture(outcome)).has_value());
    Drain();

    ExpectError(outcome, ErrorCode::kTransport);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kComfortButton, ApplicationTag::kEnumerated, 1, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, HighSkipsComfortAlreadySet) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHigh, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kVentilationMode, ApplicationTag::kUnsignedInt, 4, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, HomeClearsRapidVentilation) {
    Set(Point::kRapidActive, 1);
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHome, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    // Comfort already 1 is skipped; ventilation mode is always rewritten
    ExpectWrite(0, kVentilationMode, ApplicationTag::kUnsignedInt, 3, kPriorityDefault);
    ExpectWrite(1, kRapidTrigger, ApplicationTag::kUnsignedInt, 2, std::nullopt);
}

TEST_F(UnitRegistryWriteTest, FireplaceWritesRuntimeThenTrigger) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kFireplace, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(0, kFireplaceRuntime, ApplicationTag::kUnsignedInt, 15, kPriorityDefault);
    ExpectWrite(1, kFireplaceTrigger, ApplicationTag::kUnsignedInt, 2, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, FireplaceDefaultsRuntimeAndSetsComfort) {
    LoadAwayState();
    transport_->ClearValue(kFireplaceRuntime);
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kFireplace, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 3u);
    ExpectWrite(0, kComfortButton, ApplicationTag::kEnumerated, 1, kPriorityDefault);
    ExpectWrite(1, kFireplaceRuntime, ApplicationTag::kUnsignedInt, 10, kPriorityDefault);
    ExpectWrite(2, kFireplaceTrigger, ApplicationTag::kUnsignedInt, 2, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, LeavingFireplaceTogglesTriggerFirst) {
    Set(Point::kFireplaceActive, 1);
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kAway, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(0, kFireplaceTrigger, ApplicationTag::kUnsignedInt, 2, std::nullopt);
    ExpectWrite(1, kComfortButton, ApplicationTag::kEnumerated, 0, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, ExpectedModeConfirmedByNextPoll) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHigh, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);

    Poll();
    EXPECT_EQ(Status().mode, FanMode::kHigh);
    EXPECT_EQ(sink_.CapabilityText("fan_mode"), "high");
}

// =============================================================================
// Write errors
// =============================================================================

TEST_F(UnitRegistryWriteTest, DeniedSetpointIsBlocked) {
    transport_->FailWrite(kSetpointHome, "BacnetError - Class:2 Code:40");
    StartClean();
    std::optional<Result<void>> first;
    std::optional<Result<void>> second;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(first)).has_value());
    Drain();
    ExpectError(first, ErrorCode::kDenied);
    EXPECT_EQ(Status().blockedWrites, 1u);

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 23, Capture(second)).has_value());
    Drain();
    ExpectError(second, ErrorCode::kDenied);
    EXPECT_EQ(transport_->Writes().size(), 1u);
}

TEST_F(UnitRegistryWriteTest, DeniedModePointKeepsRetrying) {
    transport_->FailWrite(kComfortButton, "BacnetError - Class:2 Code:40");
    StartClean();
    std::optional<Result<void>> first;
    std::optional<Result<void>> second;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kAway, Capture(first)).has_value());
    Drain();
    ExpectError(first, ErrorCode::kDenied);
    EXPECT_EQ(Status().blockedWrites, 0u);

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kAway, Capture(second)).has_value());
    Drain();
    ExpectError(second, ErrorCode::kDenied);
    EXPECT_EQ(transport_->Writes().size(), 2u);
}

TEST_F(UnitRegistryWriteTest, WritePendingCodeIsAccepted) {
    transport_->FailWrite(kSetpointHome, "BacnetError - Class:2 Code:37");
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    EXPECT_EQ(Status().blockedWrites, 0u);
}

TEST_F(UnitRegistryWriteTest, WriteTimeoutReported) {
    StartClean();
    transport_->HoldRequests(true);
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(outcome)).has_value());
    RunFor(100ms);

    ExpectError(outcome, ErrorCode::kTimeout);
}

// =============================================================================
// Write markers
// =============================================================================

TEST_F(UnitRegistryWriteTest, PendingMarkerClearedWhenPollConfirms) {
    transport_->FailWrite(kSetpointHome, "BacnetError - Class:2 Code:37");
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);
    EXPECT_EQ(Status().pendingWriteMarkers, 1u);

    Set(Point::kSetpointHome, 22);
    Poll();
    EXPECT_EQ(Status().pendingWriteMarkers, 0u);
    EXPECT_EQ(sink_.CapabilityNumber("target_temperature"), 22.0);
}

TEST_F(UnitRegistryWriteTest, PendingMarkerDroppedWhenPollDisagrees) {
    transport_->FailWrite(kSetpointHome, "BacnetError - Class:2 Code:37");
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);

    Poll();
    EXPECT_EQ(Status().pendingWriteMarkers, 0u);
    EXPECT_EQ(sink_.CapabilityNumber("target_temperature"), 20.0);
}

TEST_F(UnitRegistryWriteTest, PendingMarkerKeptWhilePointUnread) {
    transport_->ClearValue(kSetpointHome);
    transport_->FailWrite(kSetpointHome, "BacnetError - Class:2 Code:37");
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);

    Poll();
    EXPECT_EQ(Status().pendingWriteMarkers, 1u);

    Set(Point::kSetpointHome, 22);
    Poll();
    EXPECT_EQ(Status().pendingWriteMarkers, 0u);
}

TEST_F(UnitRegistryWriteTest, PendingMarkerDoesNotSuppressRepeatWrite) {
    transport_->FailWrite(kSetpointHome, "BacnetError - Class:2 Code:37");
    StartClean();
    std::optional<Result<void>> first;
    std::optional<Result<void>> second;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(first)).has_value());
    Drain();
    ExpectOk(first);

    // Device still reports 20, so the same request goes out again
    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(second)).has_value());
    Drain();
    ExpectOk(second);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(1, kSetpointHome, ApplicationTag::kReal, 22, kPriorityDefault);
    EXPECT_EQ(Status().pendingWriteMarkers, 1u);
}

TEST_F(UnitRegistryWriteTest, ModeContextConfirmedByPoll) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHigh, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);
    ExpectWrite(0, kVentilationMode, ApplicationTag::kUnsignedInt, 4, kPriorityDefault);
    EXPECT_EQ(Status().writeContextMarkers, 1u);

    Poll();
    EXPECT_EQ(Status().writeContextMarkers, 0u);
    EXPECT_EQ(Status().mode, FanMode::kHigh);
}

TEST_F(UnitRegistryWriteTest, ModeContextDroppedWhenPollDisagrees) {
    StartClean();
    transport_->SetApplyWrites(false);
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHigh, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);
    EXPECT_EQ(Status().writeContextMarkers, 1u);

    Poll();
    EXPECT_EQ(Status().writeContextMarkers, 0u);
    EXPECT_EQ(Status().mode, FanMode::kHome);
}

TEST_F(UnitRegistryWriteTest, ModeContextKeptWhilePointUnread) {
    transport_->ClearValue(kVentilationMode);
    StartClean();
    transport_->SetApplyWrites(false);
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanMode(kUnitId, FanMode::kHigh, Capture(outcome)).has_value());
    Drain();
    ExpectOk(outcome);
    EXPECT_EQ(Status().writeContextMarkers, 1u);

    Poll();
    EXPECT_EQ(Status().writeContextMarkers, 1u);
}

// =============================================================================
// Serialization
// =============================================================================

TEST_F(UnitRegistryWriteTest, WritesRunOneAtATime) {
    StartClean();
    transport_->HoldRequests(true);
    std::optional<Result<void>> setpoint;
    std::optional<Result<void>> reset;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(setpoint)).has_value());
    ASSERT_TRUE(registry_->ResetFilterTimer(kUnitId, Capture(reset)).has_value());
    Drain();

    // The reset waits behind the unanswered setpoint write
    ASSERT_EQ(transport_->Writes().size(), 1u);
    EXPECT_EQ(Status().queuedWrites, 2u);

    RunFor(150ms);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(0, kSetpointHome, ApplicationTag::kReal, 22, kPriorityDefault);
    ExpectWrite(1, kFilterOperatingTime, ApplicationTag::kReal, 0, kPriorityVendorApp);
    ExpectError(setpoint, ErrorCode::kTimeout);
    ExpectError(reset, ErrorCode::kTimeout);
}

TEST_F(UnitRegistryWriteTest, UnregisterAbortsQueuedWrites) {
    StartClean();
    transport_->HoldRequests(true);
    std::optional<Result<void>> running;
    std::optional<Result<void>> queued;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(running)).has_value());
    ASSERT_TRUE(registry_->ResetFilterTimer(kUnitId, Capture(queued)).has_value());
    Drain();

    registry_->Unregister(kUnitId, sink_);
    Drain();

    ExpectError(running, ErrorCode::kAborted);
    ExpectError(queued, ErrorCode::kAborted);
    EXPECT_EQ(running->error().message, "setpoint aborted: unit removed");
    EXPECT_EQ(transport_->Writes().size(), 1u);
}

TEST_F(UnitRegistryWriteTest, DestroyAbortsWritesAndDropsUnits) {
    StartClean();
    transport_->HoldRequests(true);
    std::optional<Result<void>> running;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 22, Capture(running)).has_value());
    Drain();

    registry_->Destroy();
    Drain();

    ExpectError(running, ErrorCode::kAborted);
    EXPECT_EQ(registry_->UnitCount(), 0u);
    EXPECT_FALSE(registry_->GetStatus(kUnitId).has_value());
}

TEST_F(UnitRegistryWriteTest, UnknownUnitRejectedSynchronously) {
    StartClean();
    std::optional<Result<void>> outcome;

    const auto result = registry_->SetFanMode("missing", FanMode::kHome, Capture(outcome));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(ErrorCode::kNotFound));
    Drain();
    EXPECT_FALSE(outcome.has_value());
}

// =============================================================================
// Setpoint
// =============================================================================

TEST_F(UnitRegistryWriteTest, SetpointIsClampedAndRounded) {
    StartClean();
    std::optional<Result<void>> high;
    std::optional<Result<void>> fine;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 35, Capture(high)).has_value());
    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 21.3, Capture(fine)).has_value());
    Drain();

    ExpectOk(high);
    ExpectOk(fine);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(0, kSetpointHome, ApplicationTag::kReal, 30, kPriorityDefault);
    ExpectWrite(1, kSetpointHome, ApplicationTag::kReal, 21.5, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, SetpointTargetsAwayRegisterInAway) {
    LoadAwayState();
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 17.3, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kSetpointAway, ApplicationTag::kReal, 17.5, kPriorityDefault);
}

TEST_F(UnitRegistryWriteTest, SetpointAlreadyAppliedIsSkipped) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->WriteSetpoint(kUnitId, 20, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    EXPECT_TRUE(transport_->Writes().empty());
}

TEST_F(UnitRegistryWriteTest, SetpointRejectsNaN) {
    StartClean();
    std::optional<Result<void>> outcome;

    const auto result = registry_->WriteSetpoint(kUnitId, std::numeric_limits<double>::quiet_NaN(), Capture(outcome));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(ErrorCode::kInvalidArgument));
}

// =============================================================================
// Fan profiles
// =============================================================================

TEST_F(UnitRegistryWriteTest, FanProfileOutOfRangeWritesNothing) {
    StartClean();
    std::optional<Result<void>> outcome;

    const auto result = registry_->SetFanProfileMode(kUnitId, FanProfileMode::kHigh, 70, 90, Capture(outcome));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(ErrorCode::kInvalidArgument));
    EXPECT_EQ(result.error().message, "high supply fan profile must be between 80 and 100 percent");

    Drain();
    EXPECT_TRUE(transport_->Writes().empty());
    EXPECT_FALSE(outcome.has_value());
}

TEST_F(UnitRegistryWriteTest, FanProfileWritesBothLegsAndVerifies) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanProfileMode(kUnitId, FanProfileMode::kHome, 72.4, 68, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 2u);
    ExpectWrite(0, kFanSupplyHome, ApplicationTag::kReal, 72, kPriorityVendorApp);
    ExpectWrite(1, kFanExhaustHome, ApplicationTag::kReal, 68, kPriorityVendorApp);
    EXPECT_EQ(sink_.Number("fan_profile_home_supply"), 72.0);
    EXPECT_EQ(sink_.Number("fan_profile_home_exhaust"), 68.0);
}

TEST_F(UnitRegistryWriteTest, FanProfileReportsReadBackValue) {
    transport_->SetApplyWrites(false);
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFanProfileMode(kUnitId, FanProfileMode::kHome, 80, 75, Capture(outcome)).has_value());
    Drain();

    // The unit kept its old values; the hub record shows what it holds
    ExpectOk(outcome);
    EXPECT_EQ(sink_.Number("fan_profile_home_supply"), 70.0);
    EXPECT_EQ(sink_.Number("fan_profile_home_exhaust"), 70.0);
}

// =============================================================================
// Filter
// =============================================================================

TEST_F(UnitRegistryWriteTest, FilterIntervalWritesHoursAndPublishesMonths) {
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetFilterChangeInterval(kUnitId, 4380, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kFilterLimit, ApplicationTag::kReal, 4380, kPriorityVendorApp);
    EXPECT_EQ(sink_.Number("filter_change_interval_hours"), 4380.0);
    EXPECT_EQ(sink_.Number("filter_change_interval_months"), 6.0);
}

TEST_F(UnitRegistryWriteTest, FilterIntervalOutOfRange) {
    StartClean();
    std::optional<Result<void>> outcome;

    const auto result = registry_->SetFilterChangeInterval(kUnitId, 1000, Capture(outcome));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(ErrorCode::kInvalidArgument));
    Drain();
    EXPECT_TRUE(transport_->Writes().empty());
}

TEST_F(UnitRegistryWriteTest, FilterResetAlwaysWrites) {
    Set(Point::kFilterOperatingTime, 0);
    StartClean();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->ResetFilterTimer(kUnitId, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kFilterOperatingTime, ApplicationTag::kReal, 0, kPriorityVendorApp);
}

// =============================================================================
// Exact wire request
// =============================================================================

TEST(UnitRegistryWireTest, AwayRequestMatchesControllerExpectations) {
    using ::testing::_;
    using ::testing::Field;
    using ::testing::Optional;
    using Bacnet::Mocks::MockBacnetTransport;

    boost::asio::io_context io;
    auto transport = std::make_shared<::testing::StrictMock<MockBacnetTransport>>();
    Bacnet::TransportPool pool([transport](uint16_t) -> std::shared_ptr<Bacnet::IBacnetTransport> { return transport; });
    Discovery::Fakes::FakeDiscoveryService discovery(io);
    Fakes::FakeUnitSink sink(kUnitId);
    sink.Set("ip", std::string(kUnitIp));

    EXPECT_CALL(*transport, ReadPropertyMultiple(kUnitIp, _, _))
        .WillRepeatedly([](const std::string&, std::span<const ObjectRef> points, Bacnet::ReadCompletion completion) {
            std::vector<Bacnet::PointReading> readings;
            for (const auto& ref : points) {
                readings.push_back({ref, ref == kComfortButton ? std::optional<double>(1) : std::nullopt});
            }
            completion(Bacnet::TransportReply{}, readings);
            return Bacnet::TransportHandle{1};
        });

    EXPECT_CALL(*transport, WriteProperty(kUnitIp, kComfortButton, kPropertyPresentValue, _,
                                          Field(&Bacnet::WriteOptions::priority, Optional(kPriorityDefault)), _))
        .WillOnce([](const std::string&, const ObjectRef&, uint32_t, std::span<const Bacnet::TypedValue> values,
                     const Bacnet::WriteOptions& options, Bacnet::WriteCompletion completion) {
            EXPECT_EQ(values.size(), 1u);
            EXPECT_EQ(values[0].tag, ApplicationTag::kEnumerated);
            EXPECT_DOUBLE_EQ(values[0].value, 0.0);
            EXPECT_EQ(options.maxSegments, Bacnet::kMaxSegmentsNone);
            EXPECT_EQ(options.maxApdu, Bacnet::kMaxApdu1476);
            completion(Bacnet::TransportReply{});
            return Bacnet::TransportHandle{2};
        });

    std::optional<Result<void>> outcome;
    {
        UnitRegistry registry(io, pool, discovery, UnitRegistryTest::TestConfig());
        registry.Register(kUnitId, sink);
        io.restart();
        while (io.poll() > 0) {
        }

        ASSERT_TRUE(registry.SetFanMode(kUnitId, FanMode::kAway,
                                        [&outcome](Result<void> result) { outcome = std::move(result); })
                        .has_value());
        io.restart();
        while (io.poll() > 0) {
        }
    }

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->has_value());
}

// =============================================================================
// Heating coil
// =============================================================================

class HeatingCoilTest : public UnitRegistryWriteTest {
protected:
    static StateCompletion CaptureState(std::optional<Result<bool>>& slot) {
        return [&slot](Result<bool> result) { slot = std::move(result); };
    }

    void WatchChanges() {
        registry_->SetHeatingCoilStateChangedHandler([this](const HeatingCoilStateChange& change) {
            changes_.push_back(change);
        });
    }

    std::vector<HeatingCoilStateChange> changes_;
};

TEST_F(HeatingCoilTest, PollPublishesStateWithoutEvent) {
    Start();
    WatchChanges();

    EXPECT_EQ(Status().heatingCoilEnabled, false);
    EXPECT_EQ(sink_.CapabilityFlag("heating_coil_onoff"), false);

    Poll();
    EXPECT_TRUE(changes_.empty());
}

TEST_F(HeatingCoilTest, TurnOnWritesEnumeratedOne) {
    StartClean();
    WatchChanges();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetHeatingCoilEnabled(kUnitId, true, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kHeatingCoil, ApplicationTag::kEnumerated, 1, kPriorityDefault);
    EXPECT_EQ(Status().heatingCoilEnabled, true);
    EXPECT_EQ(sink_.CapabilityFlag("heating_coil_onoff"), true);
    ASSERT_EQ(changes_.size(), 1u);
    EXPECT_EQ(changes_[0].unitId, kUnitId);
    EXPECT_TRUE(changes_[0].enabled);

    // The confirming poll reports the same state: no second event
    Poll();
    EXPECT_EQ(changes_.size(), 1u);
}

TEST_F(HeatingCoilTest, TurnOffWhenAlreadyOffIsSkipped) {
    StartClean();
    WatchChanges();
    std::optional<Result<void>> outcome;

    ASSERT_TRUE(registry_->SetHeatingCoilEnabled(kUnitId, false, Capture(outcome)).has_value());
    Drain();

    ExpectOk(outcome);
    EXPECT_TRUE(transport_->Writes().empty());
    EXPECT_TRUE(changes_.empty());
}

TEST_F(HeatingCoilTest, ToggleReadsLiveStateAndWritesInverse) {
    StartClean();
    WatchChanges();
    // Switched on at the panel since the last poll
    Set(Point::kHeatingCoilEnable, 1);
    std::optional<Result<bool>> outcome;

    ASSERT_TRUE(registry_->ToggleHeatingCoilEnabled(kUnitId, CaptureState(outcome)).has_value());
    Drain();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value()) << outcome->error().message;
    EXPECT_FALSE(**outcome);
    ASSERT_EQ(transport_->Writes().size(), 1u);
    ExpectWrite(0, kHeatingCoil, ApplicationTag::kEnumerated, 0, kPriorityDefault);
    // Off -> on seen by the read, then on -> off by the write
    ASSERT_EQ(changes_.size(), 2u);
    EXPECT_TRUE(changes_[0].enabled);
    EXPECT_FALSE(changes_[1].enabled);
}

TEST_F(HeatingCoilTest, GetReadsFromUnit) {
    StartClean();
    Set(Point::kHeatingCoilEnable, 1);
    std::optional<Result<bool>> outcome;

    ASSERT_TRUE(registry_->GetHeatingCoilEnabled(kUnitId, CaptureState(outcome)).has_value());
    Drain();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value()) << outcome->error().message;
    EXPECT_TRUE(**outcome);
    EXPECT_EQ(Status().heatingCoilEnabled, true);
}

TEST_F(HeatingCoilTest, GetFailsWhenUnitDoesNotReportState) {
    transport_->ClearValue(kHeatingCoil);
    StartClean();
    std::optional<Result<bool>> outcome;

    ASSERT_TRUE(registry_->GetHeatingCoilEnabled(kUnitId, CaptureState(outcome)).has_value());
    Drain();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_TRUE(outcome->error().Is(ErrorCode::kNotFound));
}

TEST_F(HeatingCoilTest, DeniedWriteBlocksPoint) {
    transport_->FailWrite(kHeatingCoil, "BacnetError - Class:2 Code:40");
    StartClean();
    std::optional<Result<void>> first;
    std::optional<Result<bool>> toggled;

    ASSERT_TRUE(registry_->SetHeatingCoilEnabled(kUnitId, true, Capture(first)).has_value());
    Drain();
    ExpectError(first, ErrorCode::kDenied);
    EXPECT_EQ(Status().blockedWrites, 1u);
    EXPECT_EQ(Status().heatingCoilEnabled, false);

    ASSERT_TRUE(registry_->ToggleHeatingCoilEnabled(kUnitId, CaptureState(toggled)).has_value());
    Drain();
    ASSERT_TRUE(toggled.has_value());
    ASSERT_FALSE(toggled->has_value());
    EXPECT_TRUE(toggled->error().Is(ErrorCode::kDenied));
    EXPECT_EQ(transport_->Writes().size(), 1u);
}

TEST_F(HeatingCoilTest, PanelChangeSeenByPollNotifies) {
    Start();
    WatchChanges();

    Set(Point::kHeatingCoilEnable, 1);
    Poll();
    ASSERT_EQ(changes_.size(), 1u);
    EXPECT_TRUE(changes_[0].enabled);
    EXPECT_EQ(sink_.CapabilityFlag("heating_coil_onoff"), true);
}

TEST_F(HeatingCoilTest, UnregisterAbortsQueuedRead) {
    StartClean();
    transport_->HoldRequests(true);
    std::optional<Result<void>> write;
    std::optional<Result<bool>> read;

    ASSERT_TRUE(registry_->SetHeatingCoilEnabled(kUnitId, true, Capture(write)).has_value());
    ASSERT_TRUE(registry_->GetHeatingCoilEnabled(kUnitId, CaptureState(read)).has_value());
    Drain();

    registry_->Unregister(kUnitId, sink_);
    Drain();
    ExpectError(write, ErrorCode::kAborted);
    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(read->has_value());
    EXPECT_TRUE(read->error().Is(ErrorCode::kAborted));
}

TEST_F(HeatingCoilTest, UnknownUnitRejectedSynchronously) {
    Start();
    std::optional<Result<bool>> outcome;
    const auto result = registry_->GetHeatingCoilEnabled("nope", CaptureState(outcome));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(ErrorCode::kNotFound));
    Drain();
    EXPECT_FALSE(outcome.has_value());
}
