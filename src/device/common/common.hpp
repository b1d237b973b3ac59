/*
 * common.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-12

Description: Aggregated header for device common module

**************************************************/

#ifndef MINERHUB_DEVICE_COMMON_HPP
#define MINERHUB_DEVICE_COMMON_HPP

// Error codes and error structures
#include "device_error.hpp"

// Exception carrying a DeviceError
#include "device_exceptions.hpp"

// Result types using std::expected
#include "device_result.hpp"

#endif  // MINERHUB_DEVICE_COMMON_HPP
