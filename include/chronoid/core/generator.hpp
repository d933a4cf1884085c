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
 * @file generator.hpp
 * @brief Single UUID generation for versions 1 through 4.
 *
 * @details
 * - **v1**: current time, random 14-bit clock sequence, random node with the
 *   multicast bit set (RFC 4122 section 4.5, no hardware address is read). Both come
 *   from OpenSSL `RAND_bytes`.
 * - **v2**: a DCE Security *pattern* on version-1 bits. The standard library of most
 *   platforms has no real v2 generator; the value carries POSIX-like domain, uid and
 *   gid in its node so that the analyzer's DCE decoding has something to show.
 * - **v3**: MD5 of namespace bytes followed by the name, via OpenSSL EVP.
 * - **v4**: 122 bits from OpenSSL `RAND_bytes`; failure raises `IOFailure`.
 */

#pragma once

#include "chronoid/core/field_analyzer.hpp"
#include "chronoid/core/uuid.hpp"

#include <optional>
#include <string>

namespace chronoid::core {

/**
 * @struct GeneratedUuid
 * @brief A freshly generated UUID together with its analysis.
 */
struct GeneratedUuid {
    Uuid uuid;
    AnalysisRecord analysis;
    std::optional<std::string> name;           ///< v3 only.
    std::optional<std::string> namespace_uuid; ///< v3 only.
};

class Generator {
  public:
    /**
     * @brief Generates one UUID of the requested version and analyzes it.
     *
     * @param version 1, 2, 3 or 4.
     * @param name Name hashed by v3. Ignored otherwise.
     * @param namespace_name `DNS`, `URL`, `OID` or `X500` (case-insensitive) for v3.
     *
     * @throws core::Error `UnsupportedVersion` for other versions; `InvalidArgument` for
     * an empty v3 name or unknown namespace.
     */
    static GeneratedUuid generate(int version, const std::string& name = "",
                                  const std::string& namespace_name = "DNS");

    static Uuid time_based();

    /**
     * @brief Version-1 UUID at a given instant.
     *
     * The clock sequence is derived from the instant's microseconds: the low byte
     * becomes `clock_seq_low`, the next six bits `clock_seq_hi` under the RFC variant.
     *
     * @throws core::Error `RangeOverflow` if the instant is outside the UUID epoch window
     * or `node` exceeds 48 bits.
     */
    static Uuid time_based_at(double unix_seconds, std::uint64_t node);

    static Uuid dce_security_like();

    /// @throws core::Error `InvalidArgument` for an unknown namespace.
    static Uuid name_based_md5(const std::string& namespace_name, const std::string& name);

    /// @overload Hashes under an explicit namespace UUID.
    static Uuid name_based_md5(const Uuid& namespace_uuid, const std::string& name);

    static Uuid random();

    /// @brief Random 48-bit node with the multicast bit set.
    static std::uint64_t random_node();
};

} // namespace chronoid::core
