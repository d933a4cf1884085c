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
 * @file codec_test.cpp
 * @brief Unit tests for the UUID value type, the timestamp codec and the encoder.
 */

#include "chronoid/core/timestamp_codec.hpp"
#include "chronoid/core/uuid.hpp"
#include "chronoid/core/uuid_encoder.hpp"
#include "framework.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using chronoid::core::TimestampCodec;
using chronoid::core::Uuid;
using chronoid::core::UuidEncoder;

namespace {

const std::string kStart = "0867d7ee-f8d5-11ef-8a38-aedb2c11800f";
constexpr std::uint64_t kStartTimestamp = 139603707324520430ULL;

} // namespace

/**
 * @brief Parsing accepts mixed case and surrounding whitespace, and renders lowercase.
 */
void test_uuid_parse_canonical()
{
    Uuid u = Uuid::parse("  0867D7EE-F8D5-11EF-8A38-AEDB2C11800F\n");
    ASSERT_EQ(u.to_string(), kStart);

    ASSERT_EQ(u.time_low(), static_cast<std::uint32_t>(0x0867d7ee));
    ASSERT_EQ(u.time_mid(), static_cast<std::uint16_t>(0xf8d5));
    ASSERT_EQ(u.time_hi_and_version(), static_cast<std::uint16_t>(0x11ef));
    ASSERT_EQ(static_cast<int>(u.clock_seq_hi_and_reserved()), 0x8a);
    ASSERT_EQ(static_cast<int>(u.clock_seq_low()), 0x38);
    ASSERT_EQ(u.node(), static_cast<std::uint64_t>(0xaedb2c11800fULL));

    ASSERT_EQ(u.version(), 1);
    ASSERT_EQ(u.variant_code(), 2);
    ASSERT_EQ(u.clock_seq(), static_cast<std::uint16_t>(0x0a38));
    ASSERT_EQ(u.clock_seq_word(), static_cast<std::uint16_t>(0x8a38));
}

void test_uuid_parse_rejects_garbage()
{
    ASSERT_FALSE(Uuid::is_valid(""));
    ASSERT_FALSE(Uuid::is_valid("not-a-uuid"));
    ASSERT_FALSE(Uuid::is_valid("0867d7eef8d511ef8a38aedb2c11800f"));
    ASSERT_FALSE(Uuid::is_valid("0867d7ee-f8d5-11ef-8a38-aedb2c11800g"));
    ASSERT_FALSE(Uuid::is_valid("0867d7ee_f8d5-11ef-8a38-aedb2c11800f"));
    ASSERT_TRUE(Uuid::is_valid(kStart));

    ASSERT_THROWS_KIND(Uuid::parse("not-a-uuid"), InvalidFormat);
    ASSERT_THROWS_KIND(Uuid::parse("0867d7ee-f8d5-11ef-8a38-aedb2c11800"), InvalidFormat);
}

void test_uuid_from_fields()
{
    Uuid u = Uuid::from_fields(0x0867d7ee, 0xf8d5, 0x11ef, 0x8a, 0x38, 0xaedb2c11800fULL);
    ASSERT_EQ(u.to_string(), kStart);
    ASSERT_TRUE(u == Uuid::parse(kStart));

    Uuid nil;
    ASSERT_EQ(nil.to_string(), std::string("00000000-0000-0000-0000-000000000000"));
    ASSERT_TRUE(nil != u);

    ASSERT_THROWS_KIND(Uuid::from_fields(0, 0, 0, 0, 0, 0x1000000000000ULL), RangeOverflow);
}

/**
 * @brief The Unix epoch sits exactly at the Gregorian-to-Unix offset.
 */
void test_codec_unix_epoch()
{
    ASSERT_EQ(TimestampCodec::to_uuid_timestamp(0.0),
              static_cast<std::uint64_t>(122192928000000000ULL));
    ASSERT_EQ(TimestampCodec::to_unix_ticks(122192928000000000ULL), static_cast<std::int64_t>(0));
    ASSERT_EQ(TimestampCodec::to_uuid_timestamp(0.25),
              static_cast<std::uint64_t>(122192928002500000ULL));
}

/**
 * @brief Binary fractions survive the round trip exactly.
 */
void test_codec_round_trip()
{
    const double samples[] = {0.5, 1741077932.25, 1741077932.5, 86400.75};
    for (double t : samples) {
        std::uint64_t ts = TimestampCodec::to_uuid_timestamp(t);
        ASSERT_TRUE(TimestampCodec::to_unix_timestamp(ts) == t);
    }

    double start = TimestampCodec::to_unix_timestamp(kStartTimestamp);
    ASSERT_TRUE(std::fabs(start - 1741077932.452043) < 1e-6);
}

void test_codec_split_join()
{
    auto f = TimestampCodec::split(kStartTimestamp);
    ASSERT_EQ(f.time_low, static_cast<std::uint32_t>(0x0867d7ee));
    ASSERT_EQ(f.time_mid, static_cast<std::uint16_t>(0xf8d5));
    ASSERT_EQ(f.time_hi, static_cast<std::uint16_t>(0x01ef));

    ASSERT_EQ(TimestampCodec::join(f.time_low, f.time_mid, f.time_hi), kStartTimestamp);

    // The raw field with its version nibble joins to the same value.
    ASSERT_EQ(TimestampCodec::join(0x0867d7ee, 0xf8d5, 0x11ef), kStartTimestamp);
    ASSERT_EQ(TimestampCodec::join(0x0867d7ee, 0xf8d5, 0xf1ef), kStartTimestamp);
}

void test_codec_rejects_out_of_window()
{
    ASSERT_THROWS_KIND(TimestampCodec::split(TimestampCodec::kMaxTimestamp + 1), RangeOverflow);
    ASSERT_THROWS_KIND(TimestampCodec::to_uuid_timestamp(std::nan("")), RangeOverflow);
    ASSERT_THROWS_KIND(
        TimestampCodec::to_uuid_timestamp(std::numeric_limits<double>::infinity()), RangeOverflow);
    ASSERT_THROWS_KIND(TimestampCodec::to_uuid_timestamp(-12219292801.0), RangeOverflow);

    auto top = TimestampCodec::split(TimestampCodec::kMaxTimestamp);
    ASSERT_EQ(top.time_hi, static_cast<std::uint16_t>(0x0fff));
}

void test_encoder_known_value()
{
    ASSERT_EQ(UuidEncoder::encode(kStartTimestamp, 0x8a38, 0xaedb2c11800fULL, '1'), kStart);

    // Upper-case markers are normalized.
    std::string v = UuidEncoder::encode(0, 0, 0, 'A');
    ASSERT_EQ(v, std::string("00000000-0000-a000-0000-000000000000"));

    std::string top = UuidEncoder::encode(TimestampCodec::kMaxTimestamp, 0xffff,
                                          0xffffffffffffULL, '1');
    ASSERT_EQ(top, std::string("ffffffff-ffff-1fff-ffff-ffffffffffff"));
}

/**
 * @brief The encoder's inline field slicing agrees with TimestampCodec::split.
 */
void test_encoder_matches_codec_split()
{
    const std::uint64_t samples[] = {0ULL,
                                     1ULL,
                                     0xFFFFFFFFULL,
                                     0x100000000ULL,
                                     0xFFFFFFFFFFFFULL,
                                     0x1000000000000ULL,
                                     kStartTimestamp,
                                     0x0123456789ABCDEULL,
                                     TimestampCodec::kMaxTimestamp};
    for (std::uint64_t ts : samples) {
        auto f = TimestampCodec::split(ts);
        Uuid expected = Uuid::from_fields(f.time_low, f.time_mid,
                                          static_cast<std::uint16_t>(f.time_hi | 0x1000), 0x8a,
                                          0x38, 0xaedb2c11800fULL);
        ASSERT_EQ(UuidEncoder::encode(ts, 0x8a38, 0xaedb2c11800fULL, '1'), expected.to_string());
    }
}

void test_encoder_rejects_bad_input()
{
    ASSERT_THROWS_KIND(UuidEncoder::encode(0, 0, 0, 'x'), InvalidFormat);
    ASSERT_THROWS_KIND(UuidEncoder::encode(0, 0, 0x1000000000000ULL, '1'), RangeOverflow);
    ASSERT_THROWS_KIND(UuidEncoder::encode(TimestampCodec::kMaxTimestamp + 1, 0, 0, '1'),
                       RangeOverflow);
}
