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
 * @file timestamp_codec.cpp
 * @brief Implementation of the UUID timestamp codec.
 */

#include "chronoid/core/timestamp_codec.hpp"

#include "chronoid/core/error.hpp"

#include <cmath>
#include <string>

namespace chronoid::core {

namespace {

// Unix seconds of the largest 60-bit timestamp, rounded down.
constexpr double kMaxUnixSeconds =
    static_cast<double>(TimestampCodec::kMaxTimestamp / TimestampCodec::kTicksPerSecond -
                        TimestampCodec::kEpochOffsetSeconds);

void check_width(std::uint64_t uuid_timestamp)
{
    if (uuid_timestamp > TimestampCodec::kMaxTimestamp) {
        throw Error(ErrorKind::RangeOverflow,
                    "Timestamp exceeds 60 bits: " + std::to_string(uuid_timestamp));
    }
}

} // namespace

std::uint64_t TimestampCodec::to_uuid_timestamp(double unix_seconds)
{
    if (!std::isfinite(unix_seconds) ||
        unix_seconds < -static_cast<double>(kEpochOffsetSeconds) ||
        unix_seconds > kMaxUnixSeconds + 1.0) {
        throw Error(ErrorKind::RangeOverflow, "Unix time outside the 60-bit UUID timestamp window");
    }

    double whole = std::floor(unix_seconds);
    double fraction = unix_seconds - whole;

    std::int64_t ticks = (static_cast<std::int64_t>(whole) + kEpochOffsetSeconds) * kTicksPerSecond +
                         std::llround(fraction * static_cast<double>(kTicksPerSecond));
    if (ticks < 0) {
        throw Error(ErrorKind::RangeOverflow, "Unix time precedes the UUID epoch");
    }

    std::uint64_t result = static_cast<std::uint64_t>(ticks);
    check_width(result);
    return result;
}

double TimestampCodec::to_unix_timestamp(std::uint64_t uuid_timestamp)
{
    std::int64_t ticks = to_unix_ticks(uuid_timestamp);

    // Whole seconds and remainder are kept apart until the final addition.
    std::int64_t seconds = ticks / kTicksPerSecond;
    std::int64_t remainder = ticks % kTicksPerSecond;
    return static_cast<double>(seconds) +
           static_cast<double>(remainder) / static_cast<double>(kTicksPerSecond);
}

std::int64_t TimestampCodec::to_unix_ticks(std::uint64_t uuid_timestamp)
{
    check_width(uuid_timestamp);
    return static_cast<std::int64_t>(uuid_timestamp) - kEpochOffsetSeconds * kTicksPerSecond;
}

TimestampFields TimestampCodec::split(std::uint64_t uuid_timestamp)
{
    check_width(uuid_timestamp);

    TimestampFields fields;
    fields.time_low = static_cast<std::uint32_t>(uuid_timestamp & 0xFFFFFFFFULL);
    fields.time_mid = static_cast<std::uint16_t>((uuid_timestamp >> 32) & 0xFFFF);
    fields.time_hi = static_cast<std::uint16_t>((uuid_timestamp >> 48) & 0x0FFF);
    return fields;
}

std::uint64_t TimestampCodec::join(std::uint32_t time_low, std::uint16_t time_mid,
                                   std::uint16_t time_hi)
{
    return (static_cast<std::uint64_t>(time_hi & 0x0FFF) << 48) |
           (static_cast<std::uint64_t>(time_mid) << 32) | static_cast<std::uint64_t>(time_low);
}

} // namespace chronoid::core
