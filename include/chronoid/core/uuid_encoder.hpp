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
 * @file uuid_encoder.hpp
 * @brief Renders a (timestamp, clock sequence, node) triple as canonical UUID text.
 *
 * @details
 * The encoder sits in the innermost loop of range generation. `encode_into` writes
 * straight into a caller-owned 36-byte buffer with a nibble lookup table, so a batch
 * of lines can be assembled without a heap allocation per UUID.
 */

#pragma once

#include <cstdint>
#include <string>

namespace chronoid::core {

/**
 * @class UuidEncoder
 * @brief Stateless formatter for `time_low-time_mid-{v}{time_hi}-{clock_seq}-{node}`.
 */
class UuidEncoder {
  public:
    /**
     * @brief Encodes one UUID.
     *
     * @param uuid_timestamp 60-bit timestamp.
     * @param clock_seq Full 16-bit `clock_seq_hi_and_reserved || clock_seq_low` word,
     * variant bits included.
     * @param node 48-bit node.
     * @param version_nibble Hex digit written as the first character of the third group.
     *
     * @throws core::Error `RangeOverflow` if the timestamp exceeds 60 bits or the node
     * exceeds 48 bits; `InvalidFormat` if `version_nibble` is not a hex digit.
     */
    static std::string encode(std::uint64_t uuid_timestamp, std::uint16_t clock_seq,
                              std::uint64_t node, char version_nibble);

    /**
     * @brief Unchecked fast path of `encode`.
     *
     * Writes exactly 36 characters to `out` (no terminator). The caller guarantees the
     * widths and that `version_nibble` is already a lowercase hex digit; use
     * `validate` once per range.
     */
    static void encode_into(char* out, std::uint64_t uuid_timestamp, std::uint16_t clock_seq,
                            std::uint64_t node, char version_nibble) noexcept;

    /**
     * @brief Checks the arguments of `encode` and normalizes the nibble to lowercase.
     * @throws core::Error as documented on `encode`.
     */
    static char validate(std::uint64_t uuid_timestamp, std::uint64_t node, char version_nibble);
};

} // namespace chronoid::core
