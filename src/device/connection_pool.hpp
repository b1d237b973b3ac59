/*
 * connection_pool.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Per-device session pool with bounded reuse and idle eviction

*************************************************/

#ifndef MINERHUB_DEVICE_CONNECTION_POOL_HPP
#define MINERHUB_DEVICE_CONNECTION_POOL_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "driver.hpp"

namespace minerhub::device {

using PoolClock = std::chrono::steady_clock;

/**
 * @brief Time source used for session ages; injectable for tests
 */
using ClockFunction = std::function<PoolClock::time_point()>;

/**
 * @brief Pool limits, captured by each device sub-pool when it is created
 */
struct PoolLimits {
    size_t maxIdle{5};
    size_t maxOpen{10};
    std::chrono::milliseconds idleTtl{std::chrono::minutes(5)};
};

/**
 * @brief Read-only snapshot of one device sub-pool
 */
struct PoolStats {
    size_t activeConnections{0};
    size_t idleConnections{0};
    size_t maxOpen{0};
    size_t maxIdle{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"active_connections", activeConnections},
                {"idle_connections", idleConnections},
                {"max_open", maxOpen},
                {"max_idle", maxIdle}};
    }
};

namespace detail {

/**
 * @brief Pool-side bookkeeping for one live session
 *
 * lease is non-zero only while the session is checked out. owner identifies
 * the ConnectionPool that opened the session and generation the close()
 * cycle of that pool it was opened in.
 */
struct SessionSlot {
    std::shared_ptr<MinerSession> session;
    std::optional<PoolClock::time_point> createdAt;
    std::atomic<uint64_t> lease{0};
    uint64_t owner{0};
    uint64_t generation{0};
    std::atomic<bool> closed{false};

    /**
     * @brief Close the session unless it was already closed
     */
    auto closeOnce() -> DeviceVoidResult {
        if (closed.exchange(true)) {
            return success();
        }
        return session->close();
    }
};

}  // namespace detail

/**
 * @brief Handle for one checkout of a pooled session
 *
 * Carries the lease number assigned at checkout. Returning a handle twice,
 * returning it after the session was checked out again, or returning it to
 * another pool is reported as InvalidSession instead of corrupting the
 * pool's accounting.
 */
class PooledSession {
public:
    PooledSession() = default;

    [[nodiscard]] auto deviceId() const -> const DeviceId& { return deviceId_; }
    [[nodiscard]] auto lease() const -> uint64_t { return lease_; }

    [[nodiscard]] auto session() const -> std::shared_ptr<MinerSession> {
        return slot_ ? slot_->session : nullptr;
    }

    auto operator->() const -> MinerSession* { return slot_->session.get(); }
    auto operator*() const -> MinerSession& { return *slot_->session; }

    explicit operator bool() const { return slot_ != nullptr; }

private:
    friend class ConnectionPool;

    PooledSession(DeviceId id, std::shared_ptr<detail::SessionSlot> slot,
                  uint64_t lease)
        : deviceId_(std::move(id)), slot_(std::move(slot)), lease_(lease) {}

    DeviceId deviceId_;
    std::shared_ptr<detail::SessionSlot> slot_;
    uint64_t lease_{0};
};

/**
 * @brief Connection pool keyed by device id
 *
 * The top level only guards lazy creation of per-device sub-pools. Each
 * sub-pool has its own mutex, so work on different devices never contends.
 * Checkout never waits: it reuses the most recently returned idle session,
 * opens a new one while below maxOpen, or fails immediately with a
 * DeviceError.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(PoolLimits limits = {},
                            std::shared_ptr<spdlog::logger> logger = nullptr,
                            ClockFunction clock = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Set limits for sub-pools created after this call
     *
     * Existing sub-pools keep the limits they captured at creation.
     */
    void setLimits(const PoolLimits& limits);

    [[nodiscard]] auto limits() const -> PoolLimits;

    /**
     * @brief Check out a session for a device
     *
     * The driver's open() runs under the device's sub-pool lock, so a slow
     * handshake delays other checkouts for the same device only.
     *
     * @return Handle to an idle or newly opened session, the driver's
     *         open() error unchanged, or DeviceError when maxOpen sessions
     *         are already checked out
     */
    auto getSession(std::stop_token stop, const DeviceId& id,
                    const Device& device) -> DeviceResult<PooledSession>;

    /**
     * @brief Check a session back in
     *
     * The session becomes idle if the sub-pool has fewer than maxIdle idle
     * sessions, otherwise it is closed. A session checked out before the
     * last close() is closed (if close() has not done so already) and the
     * call succeeds once.
     *
     * @return InvalidSession if the handle came from another pool, was
     *         already returned, or is not a current checkout
     */
    auto returnSession(const PooledSession& handle) -> DeviceVoidResult;

    /**
     * @brief Close idle sessions older than their sub-pool's idle TTL
     * @return Number of sessions evicted
     */
    auto cleanUp() -> size_t;

    /**
     * @brief Close every idle and active session and drop all sub-pools
     */
    void close();

    [[nodiscard]] auto stats() const
        -> std::unordered_map<DeviceId, PoolStats>;

private:
    static auto makeHandle(DeviceId id,
                           std::shared_ptr<detail::SessionSlot> slot,
                           uint64_t lease) -> PooledSession;
    static auto slotOf(const PooledSession& handle)
        -> const std::shared_ptr<detail::SessionSlot>&;

    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_CONNECTION_POOL_HPP
