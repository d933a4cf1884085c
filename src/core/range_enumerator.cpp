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
 * @file range_enumerator.cpp
 * @brief Implementation of range normalization, iteration and estimation.
 */

#include "chronoid/core/range_enumerator.hpp"

#include "chronoid/core/timestamp_codec.hpp"
#include "chronoid/core/uuid_encoder.hpp"

#include <iomanip>
#include <sstream>

namespace chronoid::core {

namespace {

// One UUID costs 100 microseconds, so a day holds 864,000,000 of them.
constexpr std::uint64_t kMicrosPerUuid = 100;
constexpr std::uint64_t kMicrosPerDay = 86400ULL * 1000000ULL;
constexpr std::uint64_t kUuidsPerDay = kMicrosPerDay / kMicrosPerUuid;

} // namespace

RangeCursor::RangeCursor(const RangeSpec& spec)
    : current_(spec.start), end_(spec.end), clock_seq_(spec.clock_seq), node_(spec.node),
      version_nibble_(UuidEncoder::validate(spec.end, spec.node, spec.version_nibble)),
      done_(spec.start > spec.end)
{
}

bool RangeCursor::next(std::string& out)
{
    if (done_) {
        return false;
    }

    out.resize(Uuid::kTextLength);
    UuidEncoder::encode_into(&out[0], current_, clock_seq_, node_, version_nibble_);
    ++produced_;

    // `end_` may be the largest 60-bit value; stop before incrementing past it.
    if (current_ == end_) {
        done_ = true;
    } else {
        ++current_;
    }
    return true;
}

std::size_t RangeCursor::next_batch(std::string& out, std::size_t max_lines)
{
    std::size_t written = 0;
    char line[Uuid::kTextLength + 1];
    line[Uuid::kTextLength] = '\n';

    while (written < max_lines && !done_) {
        UuidEncoder::encode_into(line, current_, clock_seq_, node_, version_nibble_);
        out.append(line, sizeof(line));
        ++written;
        ++produced_;

        if (current_ == end_) {
            done_ = true;
        } else {
            ++current_;
        }
    }
    return written;
}

std::uint64_t RangeEnumerator::extract_timestamp(const Uuid& uuid)
{
    return TimestampCodec::join(uuid.time_low(), uuid.time_mid(), uuid.time_hi_and_version());
}

RangeSpec RangeEnumerator::compute(const std::string& first_uuid, const std::string& second_uuid)
{
    return compute(Uuid::parse(first_uuid), Uuid::parse(second_uuid));
}

RangeSpec RangeEnumerator::compute(const Uuid& first, const Uuid& second)
{
    std::uint64_t a = extract_timestamp(first);
    std::uint64_t b = extract_timestamp(second);

    const Uuid& start = (a <= b) ? first : second;
    const Uuid& end = (a <= b) ? second : first;

    RangeSpec spec;
    spec.start = (a <= b) ? a : b;
    spec.end = (a <= b) ? b : a;
    spec.total_possible = spec.end - spec.start + 1;
    spec.clock_seq = start.clock_seq_word();
    spec.node = start.node();
    spec.version_nibble = start.to_string()[14];
    spec.start_uuid = start.to_string();
    spec.end_uuid = end.to_string();
    return spec;
}

RangeEstimate RangeEnumerator::estimate(const std::string& first_uuid,
                                        const std::string& second_uuid)
{
    RangeSpec spec = compute(first_uuid, second_uuid);

    RangeEstimate est;
    est.start_timestamp = spec.start;
    est.end_timestamp = spec.end;
    est.total_possible = spec.total_possible;
    est.estimated_time_seconds = static_cast<double>(spec.total_possible) * kSecondsPerUuid;

    // Exact integer split; total * 100us would overflow 64 bits near 2^60.
    est.estimated_time_human =
        format_duration(spec.total_possible / kUuidsPerDay,
                        (spec.total_possible % kUuidsPerDay) * kMicrosPerUuid);
    return est;
}

std::string RangeEnumerator::format_duration(std::uint64_t days, std::uint64_t micros_of_day)
{
    std::uint64_t seconds = micros_of_day / 1000000;
    std::uint64_t micros = micros_of_day % 1000000;

    std::ostringstream ss;
    if (days > 0) {
        ss << days << (days == 1 ? " day, " : " days, ");
    }
    ss << (seconds / 3600) << ':' << std::setfill('0') << std::setw(2) << (seconds / 60) % 60
       << ':' << std::setw(2) << seconds % 60;
    if (micros != 0) {
        ss << '.' << std::setw(6) << micros;
    }
    return ss.str();
}

} // namespace chronoid::core
