#include <gtest/gtest.h>

#include "FXNDriver/Discovery/UnitModel.hpp"

using FXN::Discovery::ModelFromSerial;

TEST(UnitModel, KnownPrefixes) {
    EXPECT_EQ(ModelFromSerial("800131-000001"), "S4 REL");
    EXPECT_EQ(ModelFromSerial("800130000001"), "S4 RER");
    EXPECT_EQ(ModelFromSerial("800201-123456"), "CL3 REL");
    EXPECT_EQ(ModelFromSerial("800221-000042"), "CL4 REL");
    EXPECT_EQ(ModelFromSerial("800300-000001"), "KS3 RER");
}

TEST(UnitModel, UnknownPrefix) {
    EXPECT_FALSE(ModelFromSerial("800199-000001").has_value());
}

TEST(UnitModel, TooShort) {
    EXPECT_FALSE(ModelFromSerial("8001").has_value());
    EXPECT_FALSE(ModelFromSerial("").has_value());
}
