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
 * @file timestamp_codec.hpp
 * @brief Conversions between Unix time and the 60-bit UUID version-1 timestamp.
 *
 * @details
 * A version-1 timestamp counts 100-nanosecond intervals ("ticks") since the UUID
 * epoch, 1582-10-15T00:00:00Z. The codec is a set of pure functions over that
 * quantity: Unix seconds in and out, and the bit-slicing into the `time_low`,
 * `time_mid` and `time_hi` fields of the UUID layout.
 *
 * All arithmetic uses 64-bit integers. Values wider than 60 bits are rejected
 * with `ErrorKind::RangeOverflow` instead of being truncated.
 */

#pragma once

#include <cstdint>

namespace chronoid::core {

/**
 * @struct TimestampFields
 * @brief The three UUID fields a 60-bit timestamp is sliced into.
 */
struct TimestampFields {
    std::uint32_t time_low; ///< Bits 0-31.
    std::uint16_t time_mid; ///< Bits 32-47.
    std::uint16_t time_hi;  ///< Bits 48-59 (12 significant bits, no version nibble).
};

/**
 * @class TimestampCodec
 * @brief Stateless codec for UUID timestamps.
 */
class TimestampCodec {
  public:
    /// @brief Seconds between the UUID epoch and the Unix epoch.
    static constexpr std::int64_t kEpochOffsetSeconds = 12219292800LL;

    /// @brief 100ns ticks per second.
    static constexpr std::int64_t kTicksPerSecond = 10000000LL;

    /// @brief Largest representable timestamp (60 bits set).
    static constexpr std::uint64_t kMaxTimestamp = 0x0FFFFFFFFFFFFFFFULL;

    /**
     * @brief Converts Unix seconds to a UUID timestamp.
     *
     * Computes `round((unix_seconds + 12219292800) * 10^7)`. The integral seconds and the
     * fraction are converted separately so the result keeps the full precision of the
     * input double.
     *
     * @throws core::Error `RangeOverflow` if the instant precedes the UUID epoch or does
     * not fit in 60 bits (including NaN and infinities).
     */
    static std::uint64_t to_uuid_timestamp(double unix_seconds);

    /**
     * @brief Converts a UUID timestamp back to Unix seconds (`ts / 10^7 - 12219292800`).
     * @throws core::Error `RangeOverflow` if `uuid_timestamp` exceeds 60 bits.
     */
    static double to_unix_timestamp(std::uint64_t uuid_timestamp);

    /**
     * @brief Exact signed tick count relative to the Unix epoch.
     *
     * Negative for instants before 1970. Used wherever calendar rendering needs
     * integer precision instead of a double.
     */
    static std::int64_t to_unix_ticks(std::uint64_t uuid_timestamp);

    /**
     * @brief Slices a timestamp into `time_low`, `time_mid`, and `time_hi`.
     * @throws core::Error `RangeOverflow` if `uuid_timestamp` exceeds 60 bits.
     */
    static TimestampFields split(std::uint64_t uuid_timestamp);

    /**
     * @brief Joins the three fields back into a timestamp.
     *
     * The version nibble (top 4 bits of `time_hi`) is masked out, so the raw
     * `time_hi_and_version` field may be passed as-is.
     */
    static std::uint64_t join(std::uint32_t time_low, std::uint16_t time_mid,
                              std::uint16_t time_hi);
};

} // namespace chronoid::core
