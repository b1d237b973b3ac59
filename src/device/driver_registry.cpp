/*
 * driver_registry.cpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include "driver_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "logging/logger.hpp"

namespace minerhub::device {

namespace {

// Stop token for one probe: stopped by the caller or when the timeout passes
class ProbeDeadline {
public:
    ProbeDeadline(const std::stop_token& caller,
                  std::chrono::milliseconds timeout)
        : onCancel_(caller, [this] { source_.request_stop(); }) {
        if (timeout > std::chrono::milliseconds::zero()) {
            timer_ = std::jthread([this, timeout](std::stop_token own) {
                std::mutex mutex;
                std::condition_variable_any wakeup;
                std::unique_lock lock(mutex);
                wakeup.wait_for(lock, own, timeout, [] { return false; });
                if (!own.stop_requested()) {
                    expired_ = true;
                    source_.request_stop();
                }
            });
        }
    }

    [[nodiscard]] auto token() const -> std::stop_token {
        return source_.get_token();
    }

    [[nodiscard]] auto expired() const -> bool { return expired_; }

private:
    std::stop_source source_;
    std::atomic<bool> expired_{false};
    std::stop_callback<std::function<void()>> onCancel_;
    std::jthread timer_;
};

}  // namespace

DriverRegistry::DriverRegistry(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::orNullLogger(std::move(logger))) {}

void DriverRegistry::registerDriver(std::shared_ptr<MinerDriver> driver) {
    if (!driver) {
        logger_->warn("Ignoring null driver registration");
        return;
    }

    auto name = driver->name();
    std::unique_lock lock(mutex_);
    drivers_.push_back(std::move(driver));
    logger_->debug("Registered driver {} at priority {}", name,
                   drivers_.size() - 1);
}

void DriverRegistry::setProbeTimeout(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    probeTimeout_ = timeout;
}

auto DriverRegistry::probeTimeout() const -> std::chrono::milliseconds {
    std::shared_lock lock(mutex_);
    return probeTimeout_;
}

auto DriverRegistry::detect(std::stop_token stop, const Endpoint& endpoint)
    -> DeviceResult<std::shared_ptr<MinerDriver>> {
    // Probing performs network I/O, so it runs on a snapshot of the list
    std::vector<std::shared_ptr<MinerDriver>> drivers;
    std::chrono::milliseconds timeout;
    {
        std::shared_lock lock(mutex_);
        drivers = drivers_;
        timeout = probeTimeout_;
    }

    for (const auto& driver : drivers) {
        ProbeDeadline deadline(stop, timeout);
        auto matched = driver->detect(deadline.token(), endpoint);
        if (deadline.expired()) {
            logger_->debug("Driver {} probe of {} hit the {}ms deadline",
                           driver->name(), endpoint.address, timeout.count());
        }
        if (!matched) {
            logger_->warn("Driver {} failed probing {}: {}", driver->name(),
                          endpoint.address, matched.error().toString());
            return std::unexpected(matched.error());
        }
        if (*matched) {
            logger_->info("Endpoint {} detected as {}", endpoint.address,
                          driver->name());
            return driver;
        }
    }

    logger_->debug("No driver matched endpoint {}", endpoint.address);
    return std::unexpected(error::driverNotFound());
}

auto DriverRegistry::get(const std::string& name) const
    -> std::shared_ptr<MinerDriver> {
    std::shared_lock lock(mutex_);
    for (const auto& driver : drivers_) {
        if (driver->name() == name) {
            return driver;
        }
    }
    return nullptr;
}

auto DriverRegistry::driverNames() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(drivers_.size());
    for (const auto& driver : drivers_) {
        names.push_back(driver->name());
    }
    return names;
}

auto DriverRegistry::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return drivers_.size();
}

}  // namespace minerhub::device
