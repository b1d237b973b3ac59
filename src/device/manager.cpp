/*
 * manager.cpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include "manager.hpp"

#include <condition_variable>

#include "logging/logger.hpp"

namespace minerhub::device {

namespace {

// Checks a session back in when the operation scope ends, including by
// exception.
class SessionReturner {
public:
    SessionReturner(ConnectionPool& pool, PooledSession handle,
                    spdlog::logger& logger)
        : pool_(pool), handle_(std::move(handle)), logger_(logger) {}

    ~SessionReturner() {
        auto result = pool_.returnSession(handle_);
        if (!result) {
            logger_.warn("Failed to return session for {}: {}",
                         handle_.deviceId(), result.error().toString());
        }
    }

    SessionReturner(const SessionReturner&) = delete;
    SessionReturner& operator=(const SessionReturner&) = delete;

private:
    ConnectionPool& pool_;
    PooledSession handle_;
    spdlog::logger& logger_;
};

}  // namespace

DeviceManager::DeviceManager(std::shared_ptr<DriverRegistry> registry,
                             std::shared_ptr<spdlog::logger> logger,
                             PoolLimits limits, ClockFunction clock)
    : registry_(registry ? std::move(registry)
                         : std::make_shared<DriverRegistry>(logger)),
      logger_(logging::orNullLogger(logger)),
      pool_(limits, logger_, std::move(clock)) {}

DeviceManager::~DeviceManager() { close(); }

auto DeviceManager::create(std::shared_ptr<DriverRegistry> registry,
                           const config::MinerHubConfig& config,
                           std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<DeviceManager> {
    if (registry) {
        registry->setProbeTimeout(
            std::chrono::milliseconds(config.manager.probeTimeoutMs));
    }
    return std::make_shared<DeviceManager>(std::move(registry),
                                           std::move(logger),
                                           config.pool.toPoolLimits());
}

auto DeviceManager::addOrDetect(std::stop_token stop, const DeviceId& id,
                                const Endpoint& endpoint,
                                std::shared_ptr<MinerDriver> driver)
    -> DeviceVoidResult {
    // Detection performs network I/O, so it runs outside the table lock
    if (!driver) {
        auto detected = registry_->detect(stop, endpoint);
        if (!detected) {
            logger_->warn("Could not register {} at {}: {}", id,
                          endpoint.address, detected.error().toString());
            return std::unexpected(detected.error());
        }
        driver = std::move(*detected);
    }

    Device device{id, endpoint, driver, driver->name()};

    std::unique_lock lock(devicesMutex_);
    auto [it, inserted] = devices_.insert_or_assign(id, std::move(device));
    logger_->info("{} device {} at {} with driver {}",
                  inserted ? "Registered" : "Replaced", id, endpoint.address,
                  it->second.driverName);
    return success();
}

auto DeviceManager::list() const -> std::vector<Device> {
    std::shared_lock lock(devicesMutex_);
    std::vector<Device> result;
    result.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

auto DeviceManager::deviceInfos() const -> std::vector<DeviceInfo> {
    std::shared_lock lock(devicesMutex_);
    std::vector<DeviceInfo> result;
    result.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        result.push_back(device.info());
    }
    return result;
}

auto DeviceManager::getDevice(const DeviceId& id) const
    -> std::optional<Device> {
    std::shared_lock lock(devicesMutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DeviceManager::getCapabilities(const DeviceId& id) const
    -> DeviceResult<Capability> {
    auto device = getDevice(id);
    if (!device) {
        return std::unexpected(error::notFound("device " + id));
    }
    return device->driver->capabilities();
}

auto DeviceManager::withSession(std::stop_token stop, const DeviceId& id,
                                const SessionFunction& fn)
    -> DeviceVoidResult {
    if (!fn) {
        return std::unexpected(error::invalidInput("empty session function"));
    }

    auto device = getDevice(id);
    if (!device) {
        return std::unexpected(error::notFound());
    }

    auto handle = pool_.getSession(stop, id, *device);
    if (!handle) {
        return std::unexpected(handle.error());
    }

    auto& session = **handle;
    SessionReturner returner(pool_, std::move(*handle), *logger_);
    return fn(session);
}

auto DeviceManager::startCleanup(std::stop_token stop,
                                 std::chrono::milliseconds interval) -> bool {
    if (interval <= std::chrono::milliseconds::zero()) {
        logger_->warn("Refusing to start cleanup with interval {}ms",
                      interval.count());
        return false;
    }

    std::lock_guard lock(cleanupMutex_);
    if (cleanupRunning_ && !cleanupCaller_.stop_requested()) {
        logger_->warn("Cleanup task already running");
        return false;
    }
    if (cleanupThread_.joinable()) {
        // Previous task's caller token is stopped; it exits on its own
        cleanupThread_.join();
    }

    cleanupRunning_ = true;
    cleanupCaller_ = stop;
    cleanupThread_ = std::jthread(
        [this, caller = std::move(stop), interval](std::stop_token own) {
            cleanupLoop(std::move(own), caller, interval);
            cleanupRunning_ = false;
        });
    logger_->info("Started pool cleanup every {}ms", interval.count());
    return true;
}

void DeviceManager::cleanupLoop(std::stop_token own, std::stop_token caller,
                                std::chrono::milliseconds interval) {
    std::stop_source merged;
    std::stop_callback onClose(own, [&merged] { merged.request_stop(); });
    std::stop_callback onCancel(caller, [&merged] { merged.request_stop(); });
    auto token = merged.get_token();

    std::mutex mutex;
    std::condition_variable_any wakeup;
    std::unique_lock lock(mutex);

    while (!token.stop_requested()) {
        wakeup.wait_for(lock, token, interval, [] { return false; });
        if (token.stop_requested()) {
            break;
        }
        try {
            pool_.cleanUp();
        } catch (const std::exception& e) {
            logger_->error("Error in pool cleanup: {}", e.what());
        }
    }
    logger_->debug("Pool cleanup task stopped");
}

auto DeviceManager::isCleanupRunning() const -> bool {
    return cleanupRunning_;
}

auto DeviceManager::cleanupExpired() -> size_t { return pool_.cleanUp(); }

void DeviceManager::setPoolLimits(const PoolLimits& limits) {
    pool_.setLimits(limits);
}

auto DeviceManager::getPoolStats() const
    -> std::unordered_map<DeviceId, PoolStats> {
    return pool_.stats();
}

void DeviceManager::stopCleanup() {
    std::lock_guard lock(cleanupMutex_);
    if (cleanupThread_.joinable()) {
        cleanupThread_.request_stop();
        cleanupThread_.join();
    }
    cleanupRunning_ = false;
    cleanupCaller_ = {};
}

void DeviceManager::close() {
    stopCleanup();
    pool_.close();
}

}  // namespace minerhub::device
