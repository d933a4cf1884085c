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
 * @file error.cpp
 * @brief Stable names for the error taxonomy.
 */

#include "chronoid/core/error.hpp"

namespace chronoid::core {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidFormat:
        return "InvalidFormat";
    case ErrorKind::UnsupportedVersion:
        return "UnsupportedVersion";
    case ErrorKind::RangeOverflow:
        return "RangeOverflow";
    case ErrorKind::IOFailure:
        return "IOFailure";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

} // namespace chronoid::core
