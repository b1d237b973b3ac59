/*
 * device_result.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Device operation result types using std::expected

**************************************************/

#ifndef MINERHUB_DEVICE_COMMON_DEVICE_RESULT_HPP
#define MINERHUB_DEVICE_COMMON_DEVICE_RESULT_HPP

#include <expected>
#include <functional>
#include <optional>
#include <type_traits>

#include "device_error.hpp"
#include "device_exceptions.hpp"

namespace minerhub::device {

/**
 * @brief Result type for device operations
 *
 * Uses std::expected to represent either a successful value or an error.
 * Drivers, sessions and the core all report failures through this type.
 */
template <typename T>
using DeviceResult = std::expected<T, DeviceError>;

/**
 * @brief Result type for operations with no return value
 */
using DeviceVoidResult = DeviceResult<void>;

/**
 * @brief Create a successful result
 */
template <typename T>
[[nodiscard]] inline auto success(T&& value) -> DeviceResult<std::decay_t<T>> {
    return DeviceResult<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @brief Create a successful void result
 */
[[nodiscard]] inline auto success() -> DeviceVoidResult {
    return DeviceVoidResult();
}

/**
 * @brief Create a failure result
 */
template <typename T>
[[nodiscard]] inline auto failure(const DeviceError& error) -> DeviceResult<T> {
    return std::unexpected(error);
}

/**
 * @brief Create a failure void result
 */
[[nodiscard]] inline auto failure(const DeviceError& error) -> DeviceVoidResult {
    return std::unexpected(error);
}

/**
 * @brief Convert result to optional (discarding error info)
 */
template <typename T>
[[nodiscard]] auto toOptional(DeviceResult<T>&& result) -> std::optional<T> {
    if (result) {
        return std::move(*result);
    }
    return std::nullopt;
}

/**
 * @brief Throw exception if result is error
 */
template <typename T>
auto throwIfError(DeviceResult<T>&& result) -> T {
    if (!result) {
        throw DeviceException(result.error());
    }
    return std::move(*result);
}

/**
 * @brief Throw exception if void result is error
 */
inline void throwIfError(DeviceVoidResult&& result) {
    if (!result) {
        throw DeviceException(result.error());
    }
}

/**
 * @brief Try to execute a function and convert exceptions to DeviceResult
 *
 * Only DeviceException and std::exception are translated; anything else
 * propagates to the caller.
 */
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> DeviceResult<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            std::invoke(std::forward<F>(func));
            return success();
        } else {
            return success(std::invoke(std::forward<F>(func)));
        }
    } catch (const DeviceException& e) {
        return std::unexpected(e.error());
    } catch (const std::exception& e) {
        return std::unexpected(
            DeviceError(DeviceErrorCode::InternalError, e.what()));
    }
}

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_COMMON_DEVICE_RESULT_HPP
