/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file error.hpp
 * @brief Typed failure taxonomy shared by every chronoid subsystem.
 *
 * @details
 * Synchronous operations (parsing, analysis, range arithmetic) report failures by
 * throwing `core::Error`. The `ErrorKind` lets callers distinguish failure classes
 * without string matching, and the request layer maps it onto the `error_kind`
 * field of its JSON responses.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chronoid::core {

/**
 * @enum ErrorKind
 * @brief Classification of every failure chronoid can surface.
 */
enum class ErrorKind {
    InvalidFormat,      ///< Input does not parse as a 128-bit UUID.
    UnsupportedVersion, ///< Requested UUID version is outside {1, 2, 3, 4}.
    RangeOverflow,      ///< A value does not fit the 60-bit timestamp (or 48-bit node) space.
    IOFailure,          ///< The output sink could not be opened or written.
    Cancelled,          ///< Requested early termination. Not a fault.
    NotFound,           ///< Unknown task identifier.
    InvalidArgument     ///< Missing or malformed request argument.
};

/**
 * @brief Returns the stable name of an error kind (e.g. `"InvalidFormat"`).
 */
const char* to_string(ErrorKind kind);

/**
 * @class Error
 * @brief Exception carrying an `ErrorKind` alongside the human-readable message.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

} // namespace chronoid::core
