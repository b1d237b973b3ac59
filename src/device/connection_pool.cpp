/*
 * connection_pool.cpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

#include "connection_pool.hpp"

#include <mutex>
#include <shared_mutex>
#include <vector>

#include "logging/logger.hpp"

namespace minerhub::device {

namespace {

using SlotPtr = std::shared_ptr<detail::SessionSlot>;

std::atomic<uint64_t> nextPoolId{1};

// Sessions for a single device
struct DevicePool {
    std::mutex mutex;
    std::vector<SlotPtr> idle;  // back is the most recently returned
    std::unordered_map<const detail::SessionSlot*, SlotPtr> active;
    PoolLimits limits;
    uint64_t generation{0};
};

}  // namespace

class ConnectionPool::Impl {
public:
    PoolLimits limits_;
    std::unordered_map<DeviceId, std::shared_ptr<DevicePool>> pools_;
    mutable std::shared_mutex poolsMutex_;

    const uint64_t id_{nextPoolId.fetch_add(1, std::memory_order_relaxed)};
    std::atomic<uint64_t> generation_{0};  // bumped by close()
    std::atomic<uint64_t> nextLease_{1};
    std::shared_ptr<spdlog::logger> logger_;
    ClockFunction clock_;

    Impl(PoolLimits limits, std::shared_ptr<spdlog::logger> logger,
         ClockFunction clock)
        : limits_(limits),
          logger_(logging::orNullLogger(std::move(logger))),
          clock_(clock ? std::move(clock)
                       : ClockFunction([] { return PoolClock::now(); })) {}

    auto findPool(const DeviceId& id) const -> std::shared_ptr<DevicePool> {
        std::shared_lock lock(poolsMutex_);
        auto it = pools_.find(id);
        return it == pools_.end() ? nullptr : it->second;
    }

    auto getOrCreatePool(const DeviceId& id) -> std::shared_ptr<DevicePool> {
        if (auto pool = findPool(id)) {
            return pool;
        }

        std::unique_lock lock(poolsMutex_);
        auto& pool = pools_[id];
        if (!pool) {
            pool = std::make_shared<DevicePool>();
            pool->limits = limits_;
            pool->generation = generation_;
            logger_->debug(
                "Created sub-pool for {} (maxIdle={}, maxOpen={}, ttl={}ms)",
                id, limits_.maxIdle, limits_.maxOpen, limits_.idleTtl.count());
        }
        return pool;
    }

    void closeSlot(const DeviceId& id, detail::SessionSlot& slot,
                   const char* reason) {
        auto result = slot.closeOnce();
        if (!result) {
            logger_->warn("Closing {} session for {} failed: {}", reason, id,
                          result.error().toString());
        }
    }

    auto checkout(const DeviceId& id, DevicePool& pool, const SlotPtr& slot)
        -> PooledSession {
        slot->lease = nextLease_.fetch_add(1, std::memory_order_relaxed);
        pool.active.emplace(slot.get(), slot);
        return makeHandle(id, slot, slot->lease);
    }

    auto getSession(std::stop_token stop, const DeviceId& id,
                    const Device& device) -> DeviceResult<PooledSession> {
        auto pool = getOrCreatePool(id);
        std::lock_guard lock(pool->mutex);

        if (!pool->idle.empty()) {
            auto slot = std::move(pool->idle.back());
            pool->idle.pop_back();
            logger_->trace("Reusing idle session for {}", id);
            return checkout(id, *pool, slot);
        }

        if (pool->active.size() >= pool->limits.maxOpen) {
            logger_->warn("Connection pool exhausted for {} ({} active)", id,
                          pool->active.size());
            return std::unexpected(error::poolExhausted(id));
        }

        if (!device.driver) {
            return std::unexpected(
                error::internalError("device " + id + " has no driver"));
        }

        auto opened = device.driver->open(stop, device.endpoint);
        if (!opened) {
            logger_->warn("Opening session for {} at {} failed: {}", id,
                          device.endpoint.address, opened.error().toString());
            return std::unexpected(opened.error());
        }
        if (!*opened) {
            return std::unexpected(error::internalError(
                "driver " + device.driverName + " returned a null session"));
        }

        auto slot = std::make_shared<detail::SessionSlot>();
        slot->session = std::move(*opened);
        slot->createdAt = clock_();
        slot->owner = id_;
        slot->generation = pool->generation;
        logger_->debug("Opened new session for {} via {}", id,
                       device.driverName);
        return checkout(id, *pool, slot);
    }

    // Return of a session checked out before close(); only the first succeeds
    auto retire(const PooledSession& handle, detail::SessionSlot& slot)
        -> DeviceVoidResult {
        const auto& id = handle.deviceId();
        auto lease = handle.lease();
        if (lease == 0 || !slot.lease.compare_exchange_strong(lease, 0)) {
            return std::unexpected(
                error::invalidSession(id, "already returned"));
        }
        logger_->debug("Session for {} outlived pool close, closing", id);
        closeSlot(id, slot, "retired");
        return success();
    }

    auto returnSession(const PooledSession& handle) -> DeviceVoidResult {
        const auto& id = handle.deviceId();
        const auto& slot = slotOf(handle);
        if (!slot) {
            return std::unexpected(error::invalidSession(id, "empty handle"));
        }

        if (slot->owner != id_) {
            logger_->error("Rejected return of session for {} from another pool",
                           id);
            return std::unexpected(
                error::invalidSession(id, "checked out from another pool"));
        }

        if (slot->generation != generation_) {
            return retire(handle, *slot);
        }

        auto pool = findPool(id);
        if (!pool) {
            if (slot->generation != generation_) {
                return retire(handle, *slot);
            }
            return std::unexpected(
                error::invalidSession(id, "no sub-pool for device"));
        }

        std::lock_guard lock(pool->mutex);
        auto it = pool->active.find(slot.get());
        if (it == pool->active.end() && slot->generation != generation_) {
            // close() ran after the generation check above
            return retire(handle, *slot);
        }
        if (it == pool->active.end() || slot->lease != handle.lease()) {
            logger_->error("Rejected return of session for {} (lease {})", id,
                           handle.lease());
            return std::unexpected(error::invalidSession(
                id, "not checked out or already returned"));
        }
        pool->active.erase(it);
        slot->lease = 0;

        if (pool->idle.size() < pool->limits.maxIdle) {
            pool->idle.push_back(slot);
            return success();
        }

        closeSlot(id, *slot, "overflow");
        slot->createdAt.reset();
        return success();
    }

    auto cleanExpired(const DeviceId& id, DevicePool& pool) -> size_t {
        std::lock_guard lock(pool.mutex);

        auto now = clock_();
        std::vector<SlotPtr> valid;
        valid.reserve(pool.idle.size());
        size_t evicted = 0;

        for (auto& slot : pool.idle) {
            // A session without a creation time counts as expired
            if (slot->createdAt && now - *slot->createdAt < pool.limits.idleTtl) {
                valid.push_back(std::move(slot));
            } else {
                closeSlot(id, *slot, "expired");
                slot->createdAt.reset();
                ++evicted;
            }
        }

        pool.idle = std::move(valid);
        return evicted;
    }

    auto cleanUp() -> size_t {
        std::vector<std::pair<DeviceId, std::shared_ptr<DevicePool>>> snapshot;
        {
            std::shared_lock lock(poolsMutex_);
            snapshot.assign(pools_.begin(), pools_.end());
        }

        size_t evicted = 0;
        for (auto& [id, pool] : snapshot) {
            evicted += cleanExpired(id, *pool);
        }
        if (evicted > 0) {
            logger_->info("Evicted {} expired idle sessions", evicted);
        }
        return evicted;
    }

    void close() {
        std::unique_lock lock(poolsMutex_);
        ++generation_;

        for (auto& [id, pool] : pools_) {
            std::lock_guard poolLock(pool->mutex);
            for (auto& slot : pool->idle) {
                closeSlot(id, *slot, "idle");
            }
            // Leases stay set so the holder's single return is accepted
            for (auto& [_, slot] : pool->active) {
                closeSlot(id, *slot, "active");
            }
            pool->idle.clear();
            pool->active.clear();
        }

        if (!pools_.empty()) {
            logger_->info("Connection pool closed ({} devices)", pools_.size());
        }
        pools_.clear();
    }

    auto stats() const -> std::unordered_map<DeviceId, PoolStats> {
        std::shared_lock lock(poolsMutex_);

        std::unordered_map<DeviceId, PoolStats> result;
        for (const auto& [id, pool] : pools_) {
            std::lock_guard poolLock(pool->mutex);
            result[id] = PoolStats{pool->active.size(), pool->idle.size(),
                                   pool->limits.maxOpen, pool->limits.maxIdle};
        }
        return result;
    }
};

auto ConnectionPool::makeHandle(DeviceId id,
                                std::shared_ptr<detail::SessionSlot> slot,
                                uint64_t lease) -> PooledSession {
    return PooledSession(std::move(id), std::move(slot), lease);
}

auto ConnectionPool::slotOf(const PooledSession& handle)
    -> const std::shared_ptr<detail::SessionSlot>& {
    return handle.slot_;
}

ConnectionPool::ConnectionPool(PoolLimits limits,
                               std::shared_ptr<spdlog::logger> logger,
                               ClockFunction clock)
    : pimpl_(std::make_unique<Impl>(limits, std::move(logger),
                                    std::move(clock))) {}

ConnectionPool::~ConnectionPool() { pimpl_->close(); }

void ConnectionPool::setLimits(const PoolLimits& limits) {
    std::unique_lock lock(pimpl_->poolsMutex_);
    pimpl_->limits_ = limits;
}

auto ConnectionPool::limits() const -> PoolLimits {
    std::shared_lock lock(pimpl_->poolsMutex_);
    return pimpl_->limits_;
}

auto ConnectionPool::getSession(std::stop_token stop, const DeviceId& id,
                                const Device& device)
    -> DeviceResult<PooledSession> {
    return pimpl_->getSession(std::move(stop), id, device);
}

auto ConnectionPool::returnSession(const PooledSession& handle)
    -> DeviceVoidResult {
    return pimpl_->returnSession(handle);
}

auto ConnectionPool::cleanUp() -> size_t { return pimpl_->cleanUp(); }

void ConnectionPool::close() { pimpl_->close(); }

auto ConnectionPool::stats() const -> std::unordered_map<DeviceId, PoolStats> {
    return pimpl_->stats();
}

}  // namespace minerhub::device
