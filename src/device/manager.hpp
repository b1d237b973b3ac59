/*
 * manager.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Device Manager - device table and pooled session access

**************************************************/

#ifndef MINERHUB_DEVICE_MANAGER_HPP
#define MINERHUB_DEVICE_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/config.hpp"
#include "connection_pool.hpp"
#include "driver_registry.hpp"

namespace minerhub::device {

/**
 * @brief Operation run against a checked-out session
 */
using SessionFunction = std::function<DeviceVoidResult(MinerSession&)>;

/**
 * @class DeviceManager
 * @brief Tracks miners and runs operations on pooled sessions.
 *
 * The DeviceManager is responsible for:
 * - Device registration, with driver auto-detection through the registry
 * - Checkout/checkin of pooled sessions around caller operations
 * - Periodic eviction of expired idle sessions
 */
class DeviceManager {
public:
    /**
     * @param registry Driver catalog used for auto-detection
     * @param logger Logger for the manager and its pool; null discards
     * @param limits Initial pool limits
     * @param clock Time source for session ages
     */
    explicit DeviceManager(std::shared_ptr<DriverRegistry> registry,
                           std::shared_ptr<spdlog::logger> logger = nullptr,
                           PoolLimits limits = {}, ClockFunction clock = {});

    /**
     * @brief Stops the cleanup task and closes the pool.
     */
    ~DeviceManager();

    // Disable copy
    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    /**
     * @brief Create a manager with pool limits taken from configuration
     *
     * Also sets the registry's per-driver probe timeout.
     */
    static auto create(std::shared_ptr<DriverRegistry> registry,
                       const config::MinerHubConfig& config,
                       std::shared_ptr<spdlog::logger> logger = nullptr)
        -> std::shared_ptr<DeviceManager>;

    // ==================== Device Registration ====================

    /**
     * @brief Register a device, detecting its driver if none is given
     *
     * An existing record with the same id is replaced. On failure the
     * registry's or driver's error is returned and the table is unchanged.
     */
    auto addOrDetect(std::stop_token stop, const DeviceId& id,
                     const Endpoint& endpoint,
                     std::shared_ptr<MinerDriver> driver = nullptr)
        -> DeviceVoidResult;

    // ==================== Device Access ====================

    /**
     * @brief Snapshot of all tracked devices, in no particular order
     */
    [[nodiscard]] auto list() const -> std::vector<Device>;

    /**
     * @brief Snapshot of all tracked devices as flat DTOs
     */
    [[nodiscard]] auto deviceInfos() const -> std::vector<DeviceInfo>;

    [[nodiscard]] auto getDevice(const DeviceId& id) const
        -> std::optional<Device>;

    /**
     * @brief Capabilities of the driver assigned to a device
     * @return NotFound for an unknown id
     */
    [[nodiscard]] auto getCapabilities(const DeviceId& id) const
        -> DeviceResult<Capability>;

    // ==================== Sessions ====================

    /**
     * @brief Run @p fn against a pooled session for device @p id
     *
     * The session is returned to the pool exactly once, whether @p fn
     * succeeds, fails or throws. The error from @p fn or from checkout is
     * returned unchanged. A failed checkin is logged, not returned.
     *
     * @return NotFound without calling @p fn if the id is unknown
     */
    auto withSession(std::stop_token stop, const DeviceId& id,
                     const SessionFunction& fn) -> DeviceVoidResult;

    // ==================== Pool Maintenance ====================

    /**
     * @brief Start periodic eviction of expired idle sessions
     *
     * The task runs every @p interval until @p stop is requested or the
     * manager is closed. Once @p stop is requested a new task may be
     * started right away.
     *
     * @return false if a cleanup task is already running or the interval
     *         is not positive
     */
    auto startCleanup(std::stop_token stop, std::chrono::milliseconds interval)
        -> bool;

    [[nodiscard]] auto isCleanupRunning() const -> bool;

    /**
     * @brief Evict expired idle sessions now
     * @return Number of sessions closed
     */
    auto cleanupExpired() -> size_t;

    /**
     * @brief Limits for device sub-pools created after this call
     */
    void setPoolLimits(const PoolLimits& limits);

    [[nodiscard]] auto getPoolStats() const
        -> std::unordered_map<DeviceId, PoolStats>;

    /**
     * @brief Stop the cleanup task and close every pooled session
     *
     * Safe to call more than once.
     */
    void close();

private:
    void stopCleanup();
    void cleanupLoop(std::stop_token own, std::stop_token caller,
                     std::chrono::milliseconds interval);

    std::shared_ptr<DriverRegistry> registry_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex devicesMutex_;
    std::unordered_map<DeviceId, Device> devices_;

    ConnectionPool pool_;

    std::mutex cleanupMutex_;
    std::atomic<bool> cleanupRunning_{false};
    std::stop_token cleanupCaller_;  // guarded by cleanupMutex_
    std::jthread cleanupThread_;
};

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_MANAGER_HPP
