/*
 * driver.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Miner driver and session abstraction implemented per vendor

*************************************************/

#ifndef MINERHUB_DEVICE_DRIVER_HPP
#define MINERHUB_DEVICE_DRIVER_HPP

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "common/device_result.hpp"
#include "types.hpp"

namespace minerhub::device {

/**
 * @brief Live handle to one physical miner's control interface
 *
 * Sessions are created by MinerDriver::open() and held by exactly one owner
 * at a time: the connection pool while idle, or one caller while checked
 * out. The core never interprets payloads; every call may succeed or fail
 * with a DeviceError.
 *
 * The stop token is the only cancellation channel. Implementations that
 * block on network I/O should abort and return an error once it is stopped.
 */
class MinerSession {
public:
    virtual ~MinerSession() = default;

    /**
     * @brief Release the underlying connection
     */
    virtual auto close() -> DeviceVoidResult = 0;

    // ==================== Read Operations ====================

    virtual auto model(std::stop_token stop) -> DeviceResult<Model> = 0;
    virtual auto stats(std::stop_token stop) -> DeviceResult<MinerStats> = 0;
    virtual auto summary(std::stop_token stop)
        -> DeviceResult<MinerSummary> = 0;
    virtual auto pools(std::stop_token stop)
        -> DeviceResult<std::vector<MiningPool>> = 0;

    // ==================== Pool Management ====================

    virtual auto addPool(std::stop_token stop, const std::string& url,
                         const std::string& user, const std::string& pass)
        -> DeviceVoidResult = 0;
    virtual auto enablePool(std::stop_token stop, int64_t poolId)
        -> DeviceVoidResult = 0;
    virtual auto disablePool(std::stop_token stop, int64_t poolId)
        -> DeviceVoidResult = 0;
    virtual auto removePool(std::stop_token stop, int64_t poolId)
        -> DeviceVoidResult = 0;
    virtual auto switchPool(std::stop_token stop, int64_t poolId)
        -> DeviceVoidResult = 0;

    // ==================== Control ====================

    virtual auto restart(std::stop_token stop) -> DeviceVoidResult = 0;
    virtual auto quit(std::stop_token stop) -> DeviceVoidResult = 0;

    /**
     * @brief Execute a firmware-specific command
     * @param command Raw command name
     * @param parameter Driver-defined parameter string
     * @return Raw response bytes
     */
    virtual auto exec(std::stop_token stop, const std::string& command,
                      const std::string& parameter)
        -> DeviceResult<std::string> = 0;

    // ==================== Power & Fan ====================

    virtual auto getPowerMode(std::stop_token stop)
        -> DeviceResult<PowerMode> = 0;
    virtual auto setPowerMode(std::stop_token stop, const PowerMode& mode)
        -> DeviceVoidResult = 0;
    virtual auto getFan(std::stop_token stop) -> DeviceResult<FanConfig> = 0;
    virtual auto setFan(std::stop_token stop, const FanConfig& fan)
        -> DeviceVoidResult = 0;
};

/**
 * @brief A device-family implementation
 *
 * Drivers are registered once into the DriverRegistry and live for the
 * lifetime of the process. They must be safe to call from several threads.
 */
class MinerDriver {
public:
    virtual ~MinerDriver() = default;

    /**
     * @brief Stable identifier, stored as the driver name of a Device
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Probe whether the endpoint belongs to this driver
     *
     * Must be bounded in time and free of side effects. An error aborts
     * registry-wide detection.
     */
    virtual auto detect(std::stop_token stop, const Endpoint& endpoint)
        -> DeviceResult<bool> = 0;

    /**
     * @brief Static feature set of this driver
     */
    [[nodiscard]] virtual auto capabilities() const -> Capability = 0;

    /**
     * @brief Create a new live session, possibly performing a handshake
     */
    virtual auto open(std::stop_token stop, const Endpoint& endpoint)
        -> DeviceResult<std::shared_ptr<MinerSession>> = 0;
};

/**
 * @brief A tracked registration
 */
struct Device {
    DeviceId id;
    Endpoint endpoint;
    std::shared_ptr<MinerDriver> driver;
    std::string driverName;

    [[nodiscard]] auto info() const -> DeviceInfo {
        return DeviceInfo{id, endpoint.address, driverName};
    }
};

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_DRIVER_HPP
