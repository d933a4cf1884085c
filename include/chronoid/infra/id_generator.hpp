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
 * @file id_generator.hpp
 * @brief Fast non-cryptographic source for task identifiers and pattern fields.
 *
 * @details
 * This file declares the `IdGenerator` class, a stateless utility that produces
 * Version 4 (random) UUID strings. Chronoid uses it for task identifiers and for the
 * domain and identifier fields of DCE-style UUIDs. UUIDs handed to clients as random
 * values (version 4, version 1 clock sequences and nodes) come from OpenSSL instead.
 */

#pragma once

#include <cstdint>
#include <string>

namespace chronoid::infra {

/**
 * @class IdGenerator
 * @brief A static utility for generating standard Version 4 UUIDs.
 *
 * @details
 * Each thread owns its own seeded engine, so concurrent callers never contend.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random Version 4 UUID string.
     *
     * The output string adheres to the standard canonical textual representation:
     * `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`
     *
     * **Format Specifications:**
     * - `x`: A random hexadecimal digit (0-9, a-f).
     * - `4`: The version identifier (Version 4, Random).
     * - `y`: The variant identifier (RFC 4122), strictly limited to `{8, 9, a, b}`.
     *
     * @code
     * std::string task_id = chronoid::infra::IdGenerator::generate();
     * @endcode
     */
    static std::string generate();

    /// @brief 64 uniformly random bits from the calling thread's engine.
    static std::uint64_t next_u64();

    /// @brief Uniform integer in the closed interval `[low, high]`.
    static std::uint64_t next_in(std::uint64_t low, std::uint64_t high);
};

} // namespace chronoid::infra
