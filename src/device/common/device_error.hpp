/*
 * device_error.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Device error codes and structures for unified error handling

**************************************************/

#ifndef MINERHUB_DEVICE_COMMON_DEVICE_ERROR_HPP
#define MINERHUB_DEVICE_COMMON_DEVICE_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace minerhub::device {

/**
 * @brief Error categories surfaced by the registry, the pool and drivers
 */
enum class DeviceErrorCode {
    Unknown = 0,
    NotFound = 10,          ///< Unknown device id
    DriverNotFound = 11,    ///< No registered driver claimed the endpoint
    InvalidInput = 12,
    NotImplemented = 13,
    DeviceError = 200,      ///< Pool exhaustion or driver-side failure
    ConnectionFailed = 300,
    Timeout = 301,
    InvalidSession = 400,   ///< Stale, foreign or double-returned session
    InternalError = 900
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] inline auto deviceErrorCodeToString(DeviceErrorCode code)
    -> std::string {
    switch (code) {
        case DeviceErrorCode::Unknown:
            return "Unknown";
        case DeviceErrorCode::NotFound:
            return "NotFound";
        case DeviceErrorCode::DriverNotFound:
            return "DriverNotFound";
        case DeviceErrorCode::InvalidInput:
            return "InvalidInput";
        case DeviceErrorCode::NotImplemented:
            return "NotImplemented";
        case DeviceErrorCode::DeviceError:
            return "DeviceError";
        case DeviceErrorCode::ConnectionFailed:
            return "ConnectionFailed";
        case DeviceErrorCode::Timeout:
            return "Timeout";
        case DeviceErrorCode::InvalidSession:
            return "InvalidSession";
        case DeviceErrorCode::InternalError:
            return "InternalError";
        default:
            return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @brief Check if error code is worth retrying later
 */
[[nodiscard]] inline auto isRecoverable(DeviceErrorCode code) -> bool {
    switch (code) {
        case DeviceErrorCode::DeviceError:
        case DeviceErrorCode::ConnectionFailed:
        case DeviceErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Device error structure with detailed information
 */
struct DeviceError {
    DeviceErrorCode code{DeviceErrorCode::Unknown};
    std::string message;
    std::optional<std::string> deviceId;
    std::optional<std::string> details;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    DeviceError() = default;

    explicit DeviceError(DeviceErrorCode errorCode,
                         std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    DeviceError(DeviceErrorCode errorCode, std::string errorMessage,
                std::string errorDetails)
        : code(errorCode),
          message(std::move(errorMessage)),
          details(std::move(errorDetails)) {}

    /**
     * @brief Create error with full context
     */
    static auto create(DeviceErrorCode code, const std::string& message,
                       const std::string& device = "",
                       const std::string& details = "") -> DeviceError {
        DeviceError err(code, message);
        if (!device.empty()) {
            err.deviceId = device;
        }
        if (!details.empty()) {
            err.details = details;
        }
        return err;
    }

    /**
     * @brief Get formatted error string
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + deviceErrorCodeToString(code) + "] " + message;
        if (deviceId) {
            result += " (device: " + *deviceId + ")";
        }
        if (details) {
            result += " - " + *details;
        }
        return result;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j;
        j["code"] = static_cast<int>(code);
        j["codeName"] = deviceErrorCodeToString(code);
        j["message"] = message;
        if (deviceId) {
            j["deviceId"] = *deviceId;
        }
        if (details) {
            j["details"] = *details;
        }
        j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
        return j;
    }

    [[nodiscard]] auto isRecoverable() const -> bool {
        return minerhub::device::isRecoverable(code);
    }
};

// Convenient factory functions
namespace error {

inline auto notFound(const std::string& what = "device") -> DeviceError {
    return DeviceError(DeviceErrorCode::NotFound, what + " not found");
}

inline auto driverNotFound() -> DeviceError {
    return DeviceError(DeviceErrorCode::DriverNotFound,
                       "no suitable driver found");
}

inline auto invalidInput(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InvalidInput, msg);
}

inline auto notImplemented(const std::string& what) -> DeviceError {
    return DeviceError(DeviceErrorCode::NotImplemented,
                       what + " not implemented");
}

inline auto deviceError(const std::string& msg,
                        const std::string& details = "") -> DeviceError {
    return DeviceError::create(DeviceErrorCode::DeviceError, msg, "", details);
}

inline auto poolExhausted(const std::string& device) -> DeviceError {
    return DeviceError::create(DeviceErrorCode::DeviceError,
                               "connection pool exhausted", device,
                               "too many active connections");
}

inline auto connectionFailed(const std::string& details) -> DeviceError {
    return DeviceError(DeviceErrorCode::ConnectionFailed,
                       "failed to connect to device", details);
}

inline auto timeout(const std::string& details) -> DeviceError {
    return DeviceError(DeviceErrorCode::Timeout, "operation timed out",
                       details);
}

inline auto invalidSession(const std::string& device,
                           const std::string& reason) -> DeviceError {
    return DeviceError::create(DeviceErrorCode::InvalidSession,
                               "session was not checked out from this pool",
                               device, reason);
}

inline auto internalError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InternalError, msg);
}

}  // namespace error

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_COMMON_DEVICE_ERROR_HPP
