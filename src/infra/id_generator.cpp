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
 * @file id_generator.cpp
 * @brief Implementation of the random identifier utility.
 *
 * @details
 * Follows RFC 4122 for Version 4 (Random) UUIDs: version bits `0100` in the 7th byte
 * and variant bits `10` in the 9th byte.
 */

#include "chronoid/infra/id_generator.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace chronoid::infra {

namespace {

/// Per-thread Mersenne Twister seeded from `std::random_device`.
std::mt19937_64& engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

} // namespace

std::uint64_t IdGenerator::next_u64()
{
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;
    return dis(engine());
}

std::uint64_t IdGenerator::next_in(std::uint64_t low, std::uint64_t high)
{
    std::uniform_int_distribution<std::uint64_t> dis(low, high);
    return dis(engine());
}

std::string IdGenerator::generate()
{
    // Generate 128 bits of randomness using two 64-bit samples.
    std::uint64_t p1 = next_u64();
    std::uint64_t p2 = next_u64();

    std::stringstream ss;
    ss << std::hex
       << std::setfill('0')

       // Group 1: Time-low (8 hex digits / 32 bits)
       << std::setw(8) << static_cast<std::uint32_t>(p1 >> 32)
       << "-"

       // Group 2: Time-mid (4 hex digits / 16 bits)
       << std::setw(4) << static_cast<std::uint16_t>((p1 >> 16) & 0xFFFF)
       << "-"

       // Group 3: Force high nibble to '4' (Version 4: Random).
       << std::setw(4) << ((p1 & 0x0FFF) | 0x4000)
       << "-"

       // Group 4: Force high bits to '10' (RFC 4122 variant).
       << std::setw(4) << (((p2 >> 48) & 0x3FFF) | 0x8000)
       << "-"

       // Group 5: Node ID (12 hex digits / 48 bits)
       << std::setw(12) << (p2 & 0xFFFFFFFFFFFF);

    return ss.str();
}

} // namespace chronoid::infra
