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
 * @file uuid.hpp
 * @brief 128-bit UUID value with RFC 4122 field accessors.
 *
 * @details
 * `Uuid` stores the 16 octets in network (big-endian) order, exactly as they appear
 * in the canonical `8-4-4-4-12` text form. The accessors expose the logical fields
 * defined in RFC 4122 section 4.1.2 without interpreting them: whether `time_low`
 * actually holds a timestamp depends on the version and is decided by the analyzer.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chronoid::core {

/**
 * @class Uuid
 * @brief Immutable 16-byte UUID value.
 */
class Uuid {
  public:
    /// @brief Number of octets in a UUID.
    static constexpr std::size_t kSize = 16;

    /// @brief Length of the canonical hyphenated text form.
    static constexpr std::size_t kTextLength = 36;

    /// @brief The nil UUID (all zero bits).
    Uuid() : bytes_{} {}

    explicit Uuid(const std::array<std::uint8_t, kSize>& bytes) : bytes_(bytes) {}

    /**
     * @brief Parses the canonical `8-4-4-4-12` text form.
     *
     * Surrounding whitespace is ignored and hex digits are case-insensitive.
     *
     * @param text The candidate UUID string.
     * @return Uuid The decoded value.
     * @throws core::Error with `ErrorKind::InvalidFormat` if the text is not a UUID.
     */
    static Uuid parse(const std::string& text);

    /**
     * @brief Checks the canonical text form without throwing.
     */
    static bool is_valid(const std::string& text);

    /**
     * @brief Assembles a UUID from its six RFC 4122 fields.
     *
     * @param node The 48-bit node; higher bits must be zero.
     * @throws core::Error with `ErrorKind::RangeOverflow` if `node` exceeds 48 bits.
     */
    static Uuid from_fields(std::uint32_t time_low, std::uint16_t time_mid,
                            std::uint16_t time_hi_and_version, std::uint8_t clock_seq_hi_and_reserved,
                            std::uint8_t clock_seq_low, std::uint64_t node);

    /// @brief Renders the lowercase canonical form.
    std::string to_string() const;

    const std::array<std::uint8_t, kSize>& bytes() const
    {
        return bytes_;
    }

    std::uint32_t time_low() const;
    std::uint16_t time_mid() const;
    std::uint16_t time_hi_and_version() const;
    std::uint8_t clock_seq_hi_and_reserved() const;
    std::uint8_t clock_seq_low() const;

    /// @brief The 48-bit node field, right-aligned.
    std::uint64_t node() const;

    /// @brief Top 4 bits of `time_hi_and_version`.
    int version() const;

    /// @brief Top 2 bits of `clock_seq_hi_and_reserved` (0..3).
    int variant_code() const;

    /// @brief The 14-bit clock sequence (variant bits stripped).
    std::uint16_t clock_seq() const;

    /// @brief The full 16-bit `clock_seq_hi_and_reserved || clock_seq_low` word.
    std::uint16_t clock_seq_word() const;

    bool operator==(const Uuid& other) const
    {
        return bytes_ == other.bytes_;
    }

    bool operator!=(const Uuid& other) const
    {
        return bytes_ != other.bytes_;
    }

  private:
    std::array<std::uint8_t, kSize> bytes_;
};

} // namespace chronoid::core
