/**
 * @file test_hill_config.cpp
 * @brief Unit tests for King of the Hill option parsing
 */

#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "rules/HillConfig.hpp"

#include <nlohmann/json.hpp>

using namespace Hillkeeper;
using namespace Hillkeeper::Rules;
using json = nlohmann::json;

namespace {

MapInfo MakeMap(float sizeX = 2000.0f, float sizeZ = 2000.0f) {
    MapInfo map;
    map.sizeX = sizeX;
    map.sizeZ = sizeZ;
    map.ticksPerSecond = 30;
    return map;
}

} // namespace

// =============================================================================
// Area Parsing Tests
// =============================================================================

TEST(HillAreaTest, DefaultAreaIsCenteredRect) {
    EXPECT_EQ(MapRegion::Rect(750.0f, 1250.0f, 1250.0f, 750.0f), DefaultHillArea(MakeMap()));
    EXPECT_EQ(MapRegion::Rect(750.0f, 625.0f, 1250.0f, 375.0f), DefaultHillArea(MakeMap(2000.0f, 1000.0f)));
}

TEST(HillAreaTest, ParsesRect) {
    auto area = ParseHillArea("rect 0 200 100 50", MakeMap());
    ASSERT_TRUE(area.has_value());
    EXPECT_EQ(MapRegion::Rect(0.0f, 2000.0f, 1000.0f, 500.0f), *area);
}

TEST(HillAreaTest, ParsesCircleScaledByLargerSide) {
    auto area = ParseHillArea("circle 100 100 50", MakeMap(2000.0f, 1000.0f));
    ASSERT_TRUE(area.has_value());
    EXPECT_EQ(MapRegion::Circle(1000.0f, 500.0f, 500.0f), *area);
}

TEST(HillAreaTest, ToleratesExtraWhitespace) {
    auto area = ParseHillArea("  rect   75 125\t125  75 ", MakeMap());
    ASSERT_TRUE(area.has_value());
    EXPECT_EQ(DefaultHillArea(MakeMap()), *area);
}

TEST(HillAreaTest, AcceptsRangeBounds) {
    EXPECT_TRUE(ParseHillArea("rect 0 200 200 0", MakeMap()).has_value());
    EXPECT_TRUE(ParseHillArea("circle 0 0 200", MakeMap()).has_value());
    EXPECT_TRUE(ParseHillArea("rect 0.5 199.5 10.25 0", MakeMap()).has_value());
}

TEST(HillAreaTest, RejectsTooFewArguments) {
    EXPECT_FALSE(ParseHillArea("", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("rect 1 2 3", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("circle 1 2", MakeMap()).has_value());
}

TEST(HillAreaTest, RejectsUnknownShape) {
    EXPECT_FALSE(ParseHillArea("square 1 2 3 4", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("RECT 1 2 3 4", MakeMap()).has_value());
}

TEST(HillAreaTest, RejectsInvalidNumbers) {
    EXPECT_FALSE(ParseHillArea("rect 0 201 10 10", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("rect -1 100 10 10", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("rect a 100 10 10", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("circle 10 10 5x", MakeMap()).has_value());
    EXPECT_FALSE(ParseHillArea("circle 10 10 nan", MakeMap()).has_value());
}

// =============================================================================
// Option Parsing Tests
// =============================================================================

TEST(HillConfigTest, DisabledWhenFlagMissing) {
    Config options;
    const auto config = HillConfig::FromOptions(options, MakeMap());
    EXPECT_FALSE(config.enabled);
}

TEST(HillConfigTest, DisabledWhenFlagFalse) {
    Config options(json{{"kingofthehillenabled", "0"}});
    EXPECT_FALSE(HillConfig::FromOptions(options, MakeMap()).enabled);

    Config boolOptions(json{{"kingofthehillenabled", false}});
    EXPECT_FALSE(HillConfig::FromOptions(boolOptions, MakeMap()).enabled);
}

TEST(HillConfigTest, ParsesStringOptions) {
    Config options(json{
        {"kingofthehillenabled", "1"},
        {"kingofthehillarea", "circle 100 100 20"},
        {"kingofthehillbuildoutsideboxes", "0"},
        {"kingofthehillwinkingtime", "5"},
        {"kingofthehillcapturedelay", "15"},
        {"kingofthehillhealthmultiplier", "2.5"},
        {"kingofthehillkinggloballos", "1"}
    });

    const auto config = HillConfig::FromOptions(options, MakeMap());
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(MapRegion::Circle(1000.0f, 1000.0f, 200.0f), config.hillArea);
    EXPECT_FALSE(config.buildOutsideBoxes);
    EXPECT_DOUBLE_EQ(5.0, config.winKingTimeMinutes);
    EXPECT_DOUBLE_EQ(15.0, config.captureDelaySeconds);
    EXPECT_DOUBLE_EQ(2.5, config.healthMultiplier);
    EXPECT_TRUE(config.kingGlobalLos);

    EXPECT_EQ(30 * 5 * 60, config.winKingTicks);
    EXPECT_EQ(30 * 15, config.captureDelayTicks);
}

TEST(HillConfigTest, ParsesNativeJsonOptions) {
    Config options(json{
        {"kingofthehillenabled", true},
        {"kingofthehillarea", "rect 75 125 125 75"},
        {"kingofthehillbuildoutsideboxes", true},
        {"kingofthehillwinkingtime", 1},
        {"kingofthehillcapturedelay", 0.5},
        {"kingofthehillkinggloballos", false}
    });

    const auto config = HillConfig::FromOptions(options, MakeMap());
    EXPECT_TRUE(config.buildOutsideBoxes);
    EXPECT_EQ(1800, config.winKingTicks);
    EXPECT_EQ(15, config.captureDelayTicks);
    EXPECT_FALSE(config.kingGlobalLos);
}

TEST(HillConfigTest, MalformedAreaFallsBackToDefault) {
    Config options(json{
        {"kingofthehillenabled", "1"},
        {"kingofthehillarea", "hexagon 1 2 3 4"}
    });
    EXPECT_EQ(DefaultHillArea(MakeMap()), HillConfig::FromOptions(options, MakeMap()).hillArea);
}

TEST(HillConfigTest, MissingAreaFallsBackToDefault) {
    Config options(json{{"kingofthehillenabled", "1"}});
    EXPECT_EQ(DefaultHillArea(MakeMap()), HillConfig::FromOptions(options, MakeMap()).hillArea);
}

TEST(HillConfigTest, MissingNumbersUseDefaults) {
    Config options(json{{"kingofthehillenabled", "1"}});
    const auto config = HillConfig::FromOptions(options, MakeMap());

    EXPECT_TRUE(config.buildOutsideBoxes);
    EXPECT_DOUBLE_EQ(10.0, config.winKingTimeMinutes);
    EXPECT_DOUBLE_EQ(20.0, config.captureDelaySeconds);
    EXPECT_DOUBLE_EQ(1.0, config.healthMultiplier);
    EXPECT_FALSE(config.kingGlobalLos);
    EXPECT_EQ(6, config.ticksPerUpdate);
    EXPECT_EQ(18000, config.winKingTicks);
    EXPECT_EQ(600, config.captureDelayTicks);
}

TEST(HillConfigTest, MalformedNumbersUseDefaults) {
    Config options(json{
        {"kingofthehillenabled", "1"},
        {"kingofthehillwinkingtime", "ten"},
        {"kingofthehillcapturedelay", -4},
        {"kingofthehillhealthmultiplier", json::array({2})}
    });
    const auto config = HillConfig::FromOptions(options, MakeMap());

    EXPECT_DOUBLE_EQ(10.0, config.winKingTimeMinutes);
    EXPECT_DOUBLE_EQ(20.0, config.captureDelaySeconds);
    EXPECT_DOUBLE_EQ(1.0, config.healthMultiplier);
}

TEST(HillConfigTest, OutOfRangeNumbersUseDefaults) {
    Config options(json{
        {"kingofthehillenabled", true},
        {"kingofthehillwinkingtime", "1e30"},
        {"kingofthehillcapturedelay", "1e300"},
        {"kingofthehillupdateinterval", 1e20}
    });
    const auto config = HillConfig::FromOptions(options, MakeMap());

    EXPECT_DOUBLE_EQ(10.0, config.winKingTimeMinutes);
    EXPECT_DOUBLE_EQ(20.0, config.captureDelaySeconds);
    EXPECT_EQ(6, config.ticksPerUpdate);
    EXPECT_EQ(18000, config.winKingTicks);
    EXPECT_EQ(600, config.captureDelayTicks);
}

TEST(HillConfigTest, LongButRepresentableDurationIsKept) {
    Config options(json{
        {"kingofthehillenabled", true},
        {"kingofthehillwinkingtime", "100000"}
    });
    const auto config = HillConfig::FromOptions(options, MakeMap());

    EXPECT_DOUBLE_EQ(100000.0, config.winKingTimeMinutes);
    EXPECT_EQ(Tick{180000000}, config.winKingTicks);
}

TEST(HillConfigTest, UpdateDerivedClampsTickCounts) {
    HillConfig config;
    config.ticksPerSecond = 30;
    config.winKingTimeMinutes = 1e30;
    config.captureDelaySeconds = -5.0;
    config.UpdateDerived();

    EXPECT_EQ(MaxOptionTicks, config.winKingTicks);
    EXPECT_EQ(0, config.captureDelayTicks);
}

TEST(HillConfigTest, UpdateIntervalOption) {
    Config options(json{
        {"kingofthehillenabled", "1"},
        {"kingofthehillupdateinterval", "30"}
    });
    EXPECT_EQ(30, HillConfig::FromOptions(options, MakeMap()).ticksPerUpdate);

    Config zero(json{
        {"kingofthehillenabled", "1"},
        {"kingofthehillupdateinterval", 0}
    });
    EXPECT_EQ(1, HillConfig::FromOptions(zero, MakeMap()).ticksPerUpdate);
}

TEST(HillConfigTest, ToJson) {
    Config options(json{{"kingofthehillenabled", "1"}});
    const json j = HillConfig::FromOptions(options, MakeMap()).ToJson();

    EXPECT_TRUE(j["enabled"].get<bool>());
    EXPECT_EQ(600, j["captureDelayTicks"].get<int>());
    EXPECT_EQ(DefaultHillArea(MakeMap()).ToString(), j["hillArea"].get<std::string>());
}
