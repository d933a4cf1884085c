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
 * @file uuid.cpp
 * @brief Parsing, formatting, and field extraction for the `Uuid` value type.
 */

#include "chronoid/core/uuid.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/infra/string.hpp"

namespace chronoid::core {

namespace {

constexpr std::uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;

/// Offsets of the four hyphens in the canonical text form.
bool is_hyphen_position(std::size_t i)
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

bool Uuid::is_valid(const std::string& text)
{
    std::string s = infra::String::trim(text);
    if (s.size() != kTextLength) {
        return false;
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_hyphen_position(i)) {
            if (s[i] != '-') {
                return false;
            }
        } else if (infra::String::hex_value(s[i]) < 0) {
            return false;
        }
    }
    return true;
}

Uuid Uuid::parse(const std::string& text)
{
    if (!is_valid(text)) {
        throw Error(ErrorKind::InvalidFormat,
                    "Invalid UUID format. UUID must be in format: "
                    "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }

    std::string s = infra::String::trim(text);
    std::array<std::uint8_t, kSize> bytes{};
    std::size_t out = 0;

    // Two hex digits per octet, hyphens skipped.
    for (std::size_t i = 0; i < s.size();) {
        if (is_hyphen_position(i)) {
            ++i;
            continue;
        }
        int hi = infra::String::hex_value(s[i]);
        int lo = infra::String::hex_value(s[i + 1]);
        bytes[out++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Uuid(bytes);
}

Uuid Uuid::from_fields(std::uint32_t time_low, std::uint16_t time_mid,
                       std::uint16_t time_hi_and_version, std::uint8_t clock_seq_hi_and_reserved,
                       std::uint8_t clock_seq_low, std::uint64_t node)
{
    if (node > kNodeMask) {
        throw Error(ErrorKind::RangeOverflow, "Node value exceeds 48 bits");
    }

    std::array<std::uint8_t, kSize> b{};
    b[0] = static_cast<std::uint8_t>(time_low >> 24);
    b[1] = static_cast<std::uint8_t>(time_low >> 16);
    b[2] = static_cast<std::uint8_t>(time_low >> 8);
    b[3] = static_cast<std::uint8_t>(time_low);
    b[4] = static_cast<std::uint8_t>(time_mid >> 8);
    b[5] = static_cast<std::uint8_t>(time_mid);
    b[6] = static_cast<std::uint8_t>(time_hi_and_version >> 8);
    b[7] = static_cast<std::uint8_t>(time_hi_and_version);
    b[8] = clock_seq_hi_and_reserved;
    b[9] = clock_seq_low;
    for (int i = 0; i < 6; ++i) {
        b[10 + i] = static_cast<std::uint8_t>(node >> (8 * (5 - i)));
    }
    return Uuid(b);
}

std::string Uuid::to_string() const
{
    std::string out;
    out.reserve(kTextLength);
    for (std::size_t i = 0; i < kSize; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(infra::String::kHexDigits[bytes_[i] >> 4]);
        out.push_back(infra::String::kHexDigits[bytes_[i] & 0x0F]);
    }
    return out;
}

std::uint32_t Uuid::time_low() const
{
    return (static_cast<std::uint32_t>(bytes_[0]) << 24) |
           (static_cast<std::uint32_t>(bytes_[1]) << 16) |
           (static_cast<std::uint32_t>(bytes_[2]) << 8) | static_cast<std::uint32_t>(bytes_[3]);
}

std::uint16_t Uuid::time_mid() const
{
    return static_cast<std::uint16_t>((bytes_[4] << 8) | bytes_[5]);
}

std::uint16_t Uuid::time_hi_and_version() const
{
    return static_cast<std::uint16_t>((bytes_[6] << 8) | bytes_[7]);
}

std::uint8_t Uuid::clock_seq_hi_and_reserved() const
{
    return bytes_[8];
}

std::uint8_t Uuid::clock_seq_low() const
{
    return bytes_[9];
}

std::uint64_t Uuid::node() const
{
    std::uint64_t node = 0;
    for (std::size_t i = 10; i < kSize; ++i) {
        node = (node << 8) | bytes_[i];
    }
    return node;
}

int Uuid::version() const
{
    return bytes_[6] >> 4;
}

int Uuid::variant_code() const
{
    return bytes_[8] >> 6;
}

std::uint16_t Uuid::clock_seq() const
{
    return static_cast<std::uint16_t>(((bytes_[8] & 0x3F) << 8) | bytes_[9]);
}

std::uint16_t Uuid::clock_seq_word() const
{
    return static_cast<std::uint16_t>((bytes_[8] << 8) | bytes_[9]);
}

} // namespace chronoid::core
