/*
 * exception.hpp
 *
 * Copyright (C) 2024 The minerhub Authors
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef MINERHUB_CONFIG_EXCEPTION_HPP
#define MINERHUB_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace minerhub::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                        \
    throw minerhub::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                               ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)         \
    throw minerhub::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                        \
    throw minerhub::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for malformed configuration documents
 */
class ConfigParseException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_PARSE_EXCEPTION(...)         \
    throw minerhub::config::ConfigParseException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace minerhub::config

#endif  // MINERHUB_CONFIG_EXCEPTION_HPP
