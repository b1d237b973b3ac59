/*
 * test_types.cpp - Tests for miner value types and their JSON forms
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include <gtest/gtest.h>

#include "device/driver.hpp"

using namespace minerhub::device;

TEST(MinerTypesTest, PowerModeKind_UnknownNameIsBalanced) {
    EXPECT_EQ(powerModeKindFromString("turbo"), PowerModeKind::Balanced);
    EXPECT_EQ(powerModeKindFromString("custom"), PowerModeKind::Custom);
    EXPECT_EQ(powerModeKindToString(PowerModeKind::Low), "low");
}

TEST(MinerTypesTest, PowerMode_FromJsonFillsMissingFields) {
    auto mode = PowerMode::fromJson(json{{"kind", "high"}, {"watts", 3250}});
    EXPECT_EQ(mode.kind, PowerModeKind::High);
    EXPECT_EQ(mode.watts, 3250);
    EXPECT_EQ(mode.freqMhz, 0);
}

TEST(MinerTypesTest, FanConfig_ManualSpeed) {
    auto fan = FanConfig::fromJson(json{{"mode", "manual"}, {"speedPct", 80}});
    EXPECT_EQ(fan.mode, FanModeKind::Manual);
    EXPECT_EQ(fan.speedPct, 80);
    EXPECT_EQ(fan.toJson()["mode"], "manual");
}

TEST(MinerTypesTest, MinerStats_FromJsonReadsNestedModel) {
    auto stats = MinerStats::fromJson(json{
        {"model", {{"vendor", "Bitmain"}, {"product", "S19"}}},
        {"hashrate5s", 95000.5},
        {"uptimeSec", 3600}});
    EXPECT_EQ(stats.model.vendor, "Bitmain");
    EXPECT_EQ(stats.model.firmware, "");
    EXPECT_DOUBLE_EQ(stats.hashrate5s, 95000.5);
    EXPECT_EQ(stats.uptimeSec, 3600);
}

TEST(MinerTypesTest, MiningPool_FromJsonDefaultsInactive) {
    auto pool = MiningPool::fromJson(
        json{{"id", 2}, {"url", "stratum+tcp://pool.example:3333"}});
    EXPECT_EQ(pool.id, 2);
    EXPECT_EQ(pool.user, "");
    EXPECT_FALSE(pool.active);
}

TEST(MinerTypesTest, Capability_ToJsonListsPowerModes) {
    Capability caps;
    caps.powerControl = true;
    caps.supportedPowerModes = {PowerModeKind::Low, PowerModeKind::High};

    auto j = caps.toJson();
    EXPECT_TRUE(j["powerControl"].get<bool>());
    EXPECT_EQ(j["supportedPowerModes"], json::array({"low", "high"}));
    EXPECT_TRUE(j["commands"].empty());
}

TEST(MinerTypesTest, Device_InfoFlattensEndpoint) {
    Device device{"rig-3", Endpoint{"10.1.0.3:4028"}, nullptr, "cgminer"};
    auto info = device.info();
    EXPECT_EQ(info.id, "rig-3");
    EXPECT_EQ(info.address, "10.1.0.3:4028");
    EXPECT_EQ(info.driver, "cgminer");
}
