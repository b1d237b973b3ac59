/*
 * driver_registry.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Ordered driver catalog with sequential endpoint detection

*************************************************/

#ifndef MINERHUB_DEVICE_DRIVER_REGISTRY_HPP
#define MINERHUB_DEVICE_DRIVER_REGISTRY_HPP

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "driver.hpp"

namespace minerhub::device {

/**
 * @brief Driver registry
 *
 * Holds drivers in registration order. Registration order is detection
 * priority: the first registered driver is probed first.
 */
class DriverRegistry {
public:
    explicit DriverRegistry(std::shared_ptr<spdlog::logger> logger = nullptr);

    DriverRegistry(const DriverRegistry&) = delete;
    DriverRegistry& operator=(const DriverRegistry&) = delete;

    /**
     * @brief Append a driver. Names are not checked for uniqueness.
     */
    void registerDriver(std::shared_ptr<MinerDriver> driver);

    /**
     * @brief Deadline for a single driver's detect() call
     *
     * When it passes, the stop token handed to that driver is stopped. Zero
     * disables the deadline.
     */
    void setProbeTimeout(std::chrono::milliseconds timeout);

    [[nodiscard]] auto probeTimeout() const -> std::chrono::milliseconds;

    /**
     * @brief Resolve an endpoint to the first driver that claims it
     *
     * Drivers are probed one at a time in registration order. The first
     * driver whose detect() yields true wins. A detect() error stops the
     * scan and is returned unchanged, even if a later driver would match.
     * Each probe sees a token that stops when @p stop does or when the
     * probe timeout passes.
     *
     * @return The matching driver, or DriverNotFound when none matched
     */
    auto detect(std::stop_token stop, const Endpoint& endpoint)
        -> DeviceResult<std::shared_ptr<MinerDriver>>;

    /**
     * @brief Get the first registered driver with this name
     * @return Driver instance or nullptr
     */
    [[nodiscard]] auto get(const std::string& name) const
        -> std::shared_ptr<MinerDriver>;

    /**
     * @brief Driver names in registration order
     */
    [[nodiscard]] auto driverNames() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> size_t;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<MinerDriver>> drivers_;
    std::chrono::milliseconds probeTimeout_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_DRIVER_REGISTRY_HPP
