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
 * @file range_enumerator.hpp
 * @brief Inclusive enumeration of every UUID between two time-based UUIDs.
 *
 * @details
 * Two UUIDs bound a range of 60-bit timestamps. The range is normalized so that
 * `start <= end`, and every timestamp in `[start, end]` is rendered with the clock
 * sequence, node and version marker of the (normalized) start UUID. Only the
 * timestamp varies, so the output is strictly ascending and fully deterministic.
 *
 * `total_possible` may be as large as 2^60 and is always carried as `uint64_t`.
 */

#pragma once

#include "chronoid/core/uuid.hpp"

#include <cstdint>
#include <string>

namespace chronoid::core {

/**
 * @struct RangeSpec
 * @brief Normalized description of a generation range.
 */
struct RangeSpec {
    std::uint64_t start = 0;          ///< Smallest timestamp, inclusive.
    std::uint64_t end = 0;            ///< Largest timestamp, inclusive.
    std::uint64_t total_possible = 0; ///< `end - start + 1`.
    std::uint16_t clock_seq = 0;      ///< 16-bit clock-sequence word incl. variant bits.
    std::uint64_t node = 0;           ///< 48-bit node.
    char version_nibble = '1';        ///< First hex digit of the start UUID's third group.
    std::string start_uuid;           ///< Canonical text of the normalized start bound.
    std::string end_uuid;             ///< Canonical text of the normalized end bound.
};

/**
 * @struct RangeEstimate
 * @brief Size and expected duration of generating a range.
 */
struct RangeEstimate {
    std::uint64_t start_timestamp = 0;
    std::uint64_t end_timestamp = 0;
    std::uint64_t total_possible = 0;
    double estimated_time_seconds = 0.0;
    std::string estimated_time_human; ///< `[N day[s], ]H:MM:SS[.ffffff]`.
};

/**
 * @class RangeCursor
 * @brief Forward iterator over the UUIDs of a `RangeSpec`.
 *
 * @details
 * The cursor is single-pass and not thread-safe; each generation worker owns one.
 */
class RangeCursor {
  public:
    /// @throws core::Error if the range's node or version marker cannot be encoded.
    explicit RangeCursor(const RangeSpec& spec);

    /// @brief True once every timestamp has been produced.
    bool done() const
    {
        return done_;
    }

    /// @brief Number of UUIDs produced so far.
    std::uint64_t produced() const
    {
        return produced_;
    }

    /**
     * @brief Writes the next UUID into `out` (resized to 36 characters).
     * @return false if the range is exhausted; `out` is left untouched.
     */
    bool next(std::string& out);

    /**
     * @brief Appends up to `max_lines` newline-terminated UUIDs to `out`.
     * @return The number of lines appended.
     */
    std::size_t next_batch(std::string& out, std::size_t max_lines);

  private:
    std::uint64_t current_;
    std::uint64_t end_;
    std::uint16_t clock_seq_;
    std::uint64_t node_;
    char version_nibble_;
    std::uint64_t produced_ = 0;
    bool done_ = false;
};

/**
 * @class RangeEnumerator
 * @brief Stateless computations over UUID ranges.
 */
class RangeEnumerator {
  public:
    /// @brief Seconds assumed per generated UUID when estimating duration.
    static constexpr double kSecondsPerUuid = 0.0001;

    /**
     * @brief Extracts the 60-bit timestamp by field access.
     *
     * Concatenates the low 12 bits of `time_hi_and_version`, `time_mid` and `time_low`.
     * No calendar decoding happens, so any UUID version yields a value.
     */
    static std::uint64_t extract_timestamp(const Uuid& uuid);

    /**
     * @brief Normalizes two bounds into a `RangeSpec`.
     *
     * The bound with the smaller timestamp becomes the start. Clock sequence, node
     * and version marker are taken from that start bound.
     *
     * @throws core::Error `InvalidFormat` if either string is not a UUID.
     */
    static RangeSpec compute(const std::string& first_uuid, const std::string& second_uuid);

    /// @overload
    static RangeSpec compute(const Uuid& first, const Uuid& second);

    /// @throws core::Error `InvalidFormat` if either string is not a UUID.
    static RangeEstimate estimate(const std::string& first_uuid, const std::string& second_uuid);

    /**
     * @brief Formats a duration as `[N day[s], ]H:MM:SS[.ffffff]`.
     *
     * @param days Whole days.
     * @param micros_of_day Microseconds into the last day, below 86400 * 10^6.
     * @return e.g. `0:22:19.721100`, `1 day, 0:00:00`, `3 days, 4:05:06`.
     */
    static std::string format_duration(std::uint64_t days, std::uint64_t micros_of_day);
};

} // namespace chronoid::core
