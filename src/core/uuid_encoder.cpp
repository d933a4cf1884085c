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
 * @file uuid_encoder.cpp
 * @brief Implementation of the UUID text encoder.
 */

#include "chronoid/core/uuid_encoder.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/core/timestamp_codec.hpp"
#include "chronoid/core/uuid.hpp"
#include "chronoid/infra/string.hpp"

namespace chronoid::core {

namespace {

constexpr std::uint64_t kMaxNode = 0xFFFFFFFFFFFFULL;

/// Writes the low `digits` nibbles of `value` to `out`, most significant first.
inline void put_hex(char* out, std::uint64_t value, int digits) noexcept
{
    for (int i = digits - 1; i >= 0; --i) {
        out[i] = infra::String::kHexDigits[value & 0x0F];
        value >>= 4;
    }
}

} // namespace

char UuidEncoder::validate(std::uint64_t uuid_timestamp, std::uint64_t node, char version_nibble)
{
    if (uuid_timestamp > TimestampCodec::kMaxTimestamp) {
        throw Error(ErrorKind::RangeOverflow,
                    "Timestamp exceeds 60 bits: " + std::to_string(uuid_timestamp));
    }
    if (node > kMaxNode) {
        throw Error(ErrorKind::RangeOverflow, "Node exceeds 48 bits: " + std::to_string(node));
    }

    int nibble = infra::String::hex_value(version_nibble);
    if (nibble < 0) {
        throw Error(ErrorKind::InvalidFormat,
                    std::string("Version marker is not a hex digit: '") + version_nibble + "'");
    }
    return infra::String::kHexDigits[nibble];
}

void UuidEncoder::encode_into(char* out, std::uint64_t uuid_timestamp, std::uint16_t clock_seq,
                              std::uint64_t node, char version_nibble) noexcept
{
    // Layout: 8-4-4-4-12 with hyphens at 8, 13, 18, 23. The timestamp slices below
    // are TimestampCodec::split inlined for the hot loop; the two must stay identical.
    put_hex(out, uuid_timestamp & 0xFFFFFFFFULL, 8);
    out[8] = '-';
    put_hex(out + 9, (uuid_timestamp >> 32) & 0xFFFF, 4);
    out[13] = '-';
    out[14] = version_nibble;
    put_hex(out + 15, (uuid_timestamp >> 48) & 0x0FFF, 3);
    out[18] = '-';
    put_hex(out + 19, clock_seq, 4);
    out[23] = '-';
    put_hex(out + 24, node, 12);
}

std::string UuidEncoder::encode(std::uint64_t uuid_timestamp, std::uint16_t clock_seq,
                                std::uint64_t node, char version_nibble)
{
    char nibble = validate(uuid_timestamp, node, version_nibble);

    std::string out(Uuid::kTextLength, '0');
    encode_into(&out[0], uuid_timestamp, clock_seq, node, nibble);
    return out;
}

} // namespace chronoid::core
