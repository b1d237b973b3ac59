/*
 * device_exceptions.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Exception carrying a DeviceError, for callers that prefer
             throwing over DeviceResult

**************************************************/

#ifndef MINERHUB_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
#define MINERHUB_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "device_error.hpp"

namespace minerhub::device {

/**
 * @brief Base exception class for all device-related exceptions
 */
class DeviceException : public std::runtime_error {
public:
    explicit DeviceException(const std::string& message,
                             DeviceErrorCode code = DeviceErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message) {}

    explicit DeviceException(const DeviceError& error)
        : std::runtime_error(error.toString()), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const DeviceError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> DeviceErrorCode {
        return error_.code;
    }

protected:
    DeviceError error_;
};

}  // namespace minerhub::device

#endif  // MINERHUB_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
