/*
 * test_driver_registry.cpp - Tests for DriverRegistry detection order
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "device/driver_registry.hpp"
#include "mock_miner.hpp"

using namespace minerhub::device;
using namespace minerhub::device::test;
using namespace testing;
using namespace std::chrono_literals;

class DriverRegistryTest : public Test {
protected:
    void SetUp() override { registry_ = std::make_unique<DriverRegistry>(); }

    SessionFactory factory_;
    std::unique_ptr<DriverRegistry> registry_;
    Endpoint endpoint_{"10.0.0.5:4028"};
};

// ========== Registration Tests ==========

TEST_F(DriverRegistryTest, RegisterDriver_KeepsRegistrationOrder) {
    registry_->registerDriver(makeDriver("antminer", factory_));
    registry_->registerDriver(makeDriver("whatsminer", factory_));
    registry_->registerDriver(makeDriver("braiins", factory_));

    EXPECT_EQ(registry_->size(), 3);
    EXPECT_THAT(registry_->driverNames(),
                ElementsAre("antminer", "whatsminer", "braiins"));
}

TEST_F(DriverRegistryTest, RegisterDriver_IgnoresNull) {
    registry_->registerDriver(nullptr);
    EXPECT_EQ(registry_->size(), 0);
}

TEST_F(DriverRegistryTest, Get_ReturnsFirstDriverWithName) {
    auto first = makeDriver("antminer", factory_);
    auto second = makeDriver("antminer", factory_);
    registry_->registerDriver(first);
    registry_->registerDriver(second);

    EXPECT_EQ(registry_->size(), 2);
    EXPECT_EQ(registry_->get("antminer"), first);
}

TEST_F(DriverRegistryTest, Get_UnknownNameReturnsNull) {
    registry_->registerDriver(makeDriver("antminer", factory_));
    EXPECT_EQ(registry_->get("avalon"), nullptr);
}

// ========== Detection Tests ==========

TEST_F(DriverRegistryTest, Detect_FirstMatchWinsInRegistrationOrder) {
    auto d1 = makeDriver("d1", factory_);
    auto d2 = makeDriver("d2", factory_);
    auto d3 = makeDriver("d3", factory_);
    registry_->registerDriver(d1);
    registry_->registerDriver(d2);
    registry_->registerDriver(d3);

    {
        InSequence seq;
        EXPECT_CALL(*d1, detect(_, endpoint_))
            .WillOnce(Return(DeviceResult<bool>(false)));
        EXPECT_CALL(*d2, detect(_, endpoint_))
            .WillOnce(Return(DeviceResult<bool>(true)));
    }
    EXPECT_CALL(*d3, detect).Times(0);

    auto result = registry_->detect({}, endpoint_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, d2);
}

TEST_F(DriverRegistryTest, Detect_ErrorStopsScanEvenIfLaterDriverMatches) {
    auto d1 = makeDriver("d1", factory_);
    auto d2 = makeDriver("d2", factory_);
    registry_->registerDriver(d1);
    registry_->registerDriver(d2);

    EXPECT_CALL(*d1, detect)
        .WillOnce(Return(DeviceResult<bool>(
            std::unexpected(error::timeout("probe of 10.0.0.5 timed out")))));
    EXPECT_CALL(*d2, detect).Times(0);

    auto result = registry_->detect({}, endpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::Timeout);
    EXPECT_EQ(result.error().details, "probe of 10.0.0.5 timed out");
}

TEST_F(DriverRegistryTest, Detect_NoMatchReturnsDriverNotFound) {
    auto d1 = makeDriver("d1", factory_);
    auto d2 = makeDriver("d2", factory_);
    registry_->registerDriver(d1);
    registry_->registerDriver(d2);

    EXPECT_CALL(*d1, detect).Times(1);
    EXPECT_CALL(*d2, detect).Times(1);

    auto result = registry_->detect({}, endpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::DriverNotFound);
}

TEST_F(DriverRegistryTest, Detect_EmptyRegistryReturnsDriverNotFound) {
    auto result = registry_->detect({}, endpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::DriverNotFound);
}

TEST_F(DriverRegistryTest, Detect_PassesStopTokenToDrivers) {
    auto d1 = makeDriver("d1", factory_);
    registry_->registerDriver(d1);

    std::stop_source source;
    source.request_stop();

    EXPECT_CALL(*d1, detect)
        .WillOnce([](std::stop_token stop, const Endpoint&) {
            if (stop.stop_requested()) {
                return DeviceResult<bool>(
                    std::unexpected(error::timeout("cancelled")));
            }
            return DeviceResult<bool>(true);
        });

    auto result = registry_->detect(source.get_token(), endpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::Timeout);
}

// ========== Probe Timeout Tests ==========

TEST_F(DriverRegistryTest, ProbeTimeout_StopsSlowProbeAndMovesOn) {
    auto slow = makeDriver("slow", factory_);
    auto fast = makeDriver("fast", factory_);
    registry_->registerDriver(slow);
    registry_->registerDriver(fast);
    registry_->setProbeTimeout(20ms);
    EXPECT_EQ(registry_->probeTimeout(), 20ms);

    EXPECT_CALL(*slow, detect)
        .WillOnce([](std::stop_token stop, const Endpoint&) {
            auto until = std::chrono::steady_clock::now() + 5s;
            while (!stop.stop_requested() &&
                   std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(1ms);
            }
            return DeviceResult<bool>(!stop.stop_requested());
        });
    EXPECT_CALL(*fast, detect)
        .WillOnce([](std::stop_token stop, const Endpoint&) {
            return DeviceResult<bool>(!stop.stop_requested());
        });

    auto started = std::chrono::steady_clock::now();
    auto result = registry_->detect({}, endpoint_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, fast);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST_F(DriverRegistryTest, ProbeTimeout_ZeroMeansNoDeadline) {
    auto d1 = makeDriver("d1", factory_);
    registry_->registerDriver(d1);
    EXPECT_EQ(registry_->probeTimeout(), 0ms);

    EXPECT_CALL(*d1, detect)
        .WillOnce([](std::stop_token stop, const Endpoint&) {
            std::this_thread::sleep_for(30ms);
            return DeviceResult<bool>(!stop.stop_requested());
        });

    auto result = registry_->detect({}, endpoint_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, d1);
}
