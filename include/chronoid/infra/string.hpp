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
 * @file string.hpp
 * @brief Supplementary string and hex-text primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` covering the text chores of UUID handling: whitespace trimming of
 * user input, case folding of namespace names, and fixed-width hexadecimal rendering
 * of UUID fields.
 */

#pragma once

#include <cstdint>
#include <string>

namespace chronoid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /// @brief Lowercase hexadecimal alphabet indexed by nibble value.
    static constexpr const char* kHexDigits = "0123456789abcdef";

    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string instance containing the trimmed content.
     * Returns an empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = chronoid::infra::String::trim("  0867d7ee-f8d5-11ef-8a38-aedb2c11800f\n");
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII uppercase copy of `s`.
    static std::string to_upper(const std::string& s);

    /**
     * @brief Decodes one hexadecimal digit.
     * @return The nibble value (0-15), or -1 if `c` is not a hex digit.
     */
    static int hex_value(char c);

    /**
     * @brief Renders `value` as lowercase hex, left-padded with zeros to `width` digits.
     *
     * Digits beyond `width` are kept, mirroring `printf("%0*llx")`.
     */
    static std::string to_hex(std::uint64_t value, int width);

    /// @brief Decimal rendering with `,` between thousands groups (`13,397,211`).
    static std::string with_thousands(std::uint64_t value);
};

} // namespace chronoid::infra
