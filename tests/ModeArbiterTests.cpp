#include <gtest/gtest.h>

#include "FXNDriver/Registry/ModeArbiter.hpp"
#include "FXNDriver/Registry/PointCatalog.hpp"

using namespace FXN::Registry;

// =============================================================================
// Raw value mapping
// =============================================================================

TEST(ModeArbiterMapping, OperationMode) {
    EXPECT_EQ(MapOperationMode(1), FanMode::kAway);
    EXPECT_EQ(MapOperationMode(2), FanMode::kAway);
    EXPECT_EQ(MapOperationMode(3), FanMode::kHome);
    EXPECT_EQ(MapOperationMode(4), FanMode::kHigh);
    EXPECT_EQ(MapOperationMode(5), FanMode::kHigh);
    EXPECT_EQ(MapOperationMode(6), FanMode::kFireplace);
    EXPECT_EQ(MapOperationMode(7), FanMode::kHigh);
    EXPECT_EQ(MapOperationMode(99), FanMode::kAway);
}

TEST(ModeArbiterMapping, VentilationMode) {
    EXPECT_EQ(MapVentilationMode(1), FanMode::kAway);
    EXPECT_EQ(MapVentilationMode(2), FanMode::kAway);
    EXPECT_EQ(MapVentilationMode(3), FanMode::kHome);
    EXPECT_EQ(MapVentilationMode(4), FanMode::kHigh);
    EXPECT_EQ(MapVentilationMode(3.2), FanMode::kHome);
}

TEST(ModeArbiterMapping, RfInput) {
    EXPECT_EQ(MapRfInput(3), FanMode::kHigh);
    EXPECT_EQ(MapRfInput(13), FanMode::kHigh);
    EXPECT_EQ(MapRfInput(24), FanMode::kHome);
    EXPECT_EQ(MapRfInput(26), FanMode::kFireplace);
    EXPECT_FALSE(MapRfInput(0).has_value());
}

TEST(ModeArbiterMapping, ParseRoundTripsNames) {
    EXPECT_EQ(ParseFanMode("fireplace"), FanMode::kFireplace);
    EXPECT_FALSE(ParseFanMode("turbo").has_value());
    EXPECT_EQ(ParseFanProfileMode("cooker"), FanProfileMode::kCooker);
    EXPECT_FALSE(ParseFanProfileMode("").has_value());
}

// =============================================================================
// Arbitration
// =============================================================================

TEST(ModeArbiterResolve, NoSignalsIsUnknown) {
    EXPECT_FALSE(ResolveFanMode(ModeSignals{}).has_value());
}

TEST(ModeArbiterResolve, OperationModeIsBase) {
    ModeSignals s;
    s.operationMode = 3;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHome);
}

TEST(ModeArbiterResolve, VentilationModeOverridesOperationMode) {
    ModeSignals s;
    s.operationMode = 3;
    s.ventilationMode = 4;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHigh);
}

TEST(ModeArbiterResolve, RfInputWhenNoModeRegisters) {
    ModeSignals s;
    s.modeRfInput = 26;
    s.comfortButton = 1;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kFireplace);
}

TEST(ModeArbiterResolve, TemporaryVentilationTimers) {
    ModeSignals s;
    s.remainingTempVentOp = 12;
    s.remainingFireplaceVent = 8;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kFireplace);

    s.remainingFireplaceVent = 0;
    s.remainingRapidVent = 5;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHigh);

    s.remainingRapidVent = 0;
    s.comfortButton = 1;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHome);
}

TEST(ModeArbiterResolve, ComfortButtonAlone) {
    ModeSignals s;
    s.comfortButton = 1;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHome);

    s.comfortButton = 0;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kAway);
}

TEST(ModeArbiterResolve, FireplaceActiveOverridesEverything) {
    ModeSignals s;
    s.operationMode = 3;
    s.ventilationMode = 4;
    s.rapidActive = 1;
    s.fireplaceActive = 1;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kFireplace);
}

TEST(ModeArbiterResolve, FireplaceActiveOverHomeOperationMode) {
    ModeSignals s;
    s.operationMode = static_cast<double>(OperationMode::kHome);
    s.fireplaceActive = 1;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kFireplace);
}

TEST(ModeArbiterResolve, RfInputBeatsComfortButton) {
    ModeSignals s;
    s.comfortButton = 0;
    s.modeRfInput = 3;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHigh);
}

TEST(ModeArbiterResolve, RapidActiveForcesHigh) {
    ModeSignals s;
    s.ventilationMode = 2;
    s.rapidActive = 1;
    EXPECT_EQ(ResolveFanMode(s), FanMode::kHigh);
}

TEST(ModeArbiterResolve, FromSnapshotReadsModePoints) {
    PointSnapshot snapshot;
    snapshot.Set(Point::kComfortButton, 1);
    snapshot.Set(Point::kVentilationMode, 2);

    const auto signals = ModeSignals::FromSnapshot(snapshot);
    ASSERT_TRUE(signals.HasAny());
    EXPECT_EQ(ResolveFanMode(signals), FanMode::kAway);
}

// =============================================================================
// Profile selection
// =============================================================================

TEST(ModeArbiterProfile, CookerHoodUsesCookerProfile) {
    EXPECT_EQ(ResolveFanProfileMode(5.0, FanMode::kHigh), FanProfileMode::kCooker);
    EXPECT_EQ(ResolveFanProfileMode(4.0, FanMode::kHigh), FanProfileMode::kHigh);
    EXPECT_EQ(ResolveFanProfileMode(std::nullopt, FanMode::kAway), FanProfileMode::kAway);
}
