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
 * @file field_analyzer.hpp
 * @brief Version-aware decoding of the fields of an arbitrary UUID.
 *
 * @details
 * The analyzer turns a UUID into an `AnalysisRecord`: version, variant, the raw
 * fields in hex, and an interpretation that depends on the version. Only versions 1
 * and 2 carry a clock; for versions 3, 4 and 5 the fields that RFC 4122 names
 * `time_*`, `clock_seq` and `node` hold hash output or random bits, and the record
 * labels them as such instead of decoding a date.
 *
 * ## Version-2 heuristic
 * Version 1 and DCE Security (version 2) UUIDs share one bit layout and are told
 * apart by convention, not by the bits. A UUID whose version nibble is 1 is flagged
 * `possible_v2` when its variant code (`clock_seq_hi_and_reserved >> 6`) is 1, the
 * DCE Security range `0x40-0x7F`, and its 14-bit clock sequence lies in `[1, 0x3FFF]`. The flag is a guess: `version` keeps the value the
 * bits state, and `DceDetails::confidence_level` spells out the uncertainty.
 */

#pragma once

#include "chronoid/core/uuid.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chronoid::core {

/**
 * @enum VariantKind
 * @brief Layout family encoded in the top two bits of `clock_seq_hi_and_reserved`.
 */
enum class VariantKind {
    LegacyNcs = 0,     ///< Reserved, NCS backward compatibility.
    Rfc = 1,           ///< DCE 1.1, ISO/IEC 11578:1996.
    Microsoft = 2,     ///< Microsoft GUID (legacy).
    ReservedFuture = 3 ///< Reserved for future definition.
};

/**
 * @struct TemporalFields
 * @brief Calendar rendering of a decoded timestamp in UTC and IST (UTC+5:30).
 *
 * When `applicable` is false every string holds `"N/A"` (or an explanatory
 * sentence for the `friendly_*` members) and `unix_timestamp` is empty.
 */
struct TemporalFields {
    bool applicable = false;
    std::optional<std::uint64_t> uuid_timestamp;
    std::optional<double> unix_timestamp;
    std::string datetime_utc = "N/A"; ///< ISO-8601, e.g. `2025-03-04T08:45:32.452043`.
    std::string datetime_ist = "N/A";
    std::string date_utc = "N/A";
    std::string date_ist = "N/A";
    std::string time_utc = "N/A"; ///< `HH:MM:SS.mmm`.
    std::string time_ist = "N/A";
    std::string friendly_utc = "N/A"; ///< e.g. `Tuesday, March 04, 2025 at 08:45:32 AM`.
    std::string friendly_ist = "N/A";
    std::string timezone_utc = "N/A";
    std::string timezone_ist = "N/A";
};

/// @brief Extra decoding for version-1 UUIDs.
struct TimeBasedDetails {
    std::string timestamp_hex;         ///< `time_hi_and_version || time_mid || time_low`.
    std::string mac_address;           ///< 12 hex digits.
    std::string mac_address_formatted; ///< `aa:bb:cc:dd:ee:ff`.
    std::string clock_sequence_purpose;
    std::string time_precision;
    std::string epoch_base;
    std::string sandwich_attack_possibility;
    std::string sandwich_attack_description;
    std::string sandwich_attack_risk;
};

/// @brief DCE Security decoding, for version 2 or the version-2 heuristic.
struct DceDetails {
    std::string timestamp_hex;
    std::string dce_domain;
    std::string posix_uid_gid;
    std::string security_identifier;
    std::string clock_sequence_purpose;
    std::string time_precision;
    std::string epoch_base;
    std::string dce_security_features;
    bool heuristic = false; ///< Set when produced by the pattern heuristic.
    std::string detection_note;
    std::string confidence_level;
    std::string analysis_method;
    std::string recommendation;
};

/// @brief Labels for the MD5 output that a version-3 UUID carries.
struct HashDetails {
    std::string hash_algorithm;
    std::string hash_output;
    bool deterministic = true;
    std::string collision_resistance;
    std::string use_cases;
    std::string hash_low_32bits;
    std::string hash_mid_16bits;
    std::string hash_hi_12bits;
    std::string hash_clock_14bits;
    std::string hash_node_48bits;
    std::string components_note;
    std::string field_naming_note;
    std::optional<std::string> used_namespace;
    std::optional<std::string> used_namespace_uuid;
    std::optional<std::string> used_namespace_description;
    std::optional<std::string> used_namespace_note;
};

/// @brief Labels for a version-4 UUID.
struct RandomDetails {
    std::string randomness_source;
    std::string unpredictability;
    std::string collision_probability;
    std::string entropy_source;
    std::string use_cases;
    std::string security_level;
};

/**
 * @struct AnalysisRecord
 * @brief Immutable result of analyzing one UUID.
 */
struct AnalysisRecord {
    std::string uuid;
    int version = 0; ///< Exactly what the version nibble says.
    std::string version_desc;
    bool possible_v2 = false;

    VariantKind variant = VariantKind::LegacyNcs;
    int variant_code = 0;
    std::string variant_desc;

    TemporalFields time;

    std::string time_low;
    std::string time_mid;
    std::string time_hi;
    std::string time_hi_version;
    std::string clock_seq;
    std::string clock_seq_hi;
    std::string clock_seq_low;
    std::string node;
    std::string node_desc;
    std::string clock_seq_desc;

    /// Set for version 3 and 4, where the field names are misleading.
    std::optional<std::string> note_time_fields;
    std::optional<std::string> note_clock_node;

    std::optional<TimeBasedDetails> time_based;
    std::optional<DceDetails> dce;
    std::optional<HashDetails> hash;
    std::optional<RandomDetails> random;
};

/**
 * @struct NamespaceInfo
 * @brief One of the four RFC 4122 Appendix C name-space identifiers.
 */
struct NamespaceInfo {
    const char* name;        ///< `DNS`, `URL`, `OID`, `X500`.
    const char* uuid;        ///< Canonical namespace UUID.
    const char* description; ///< What names in this namespace look like.
};

/**
 * @class FieldAnalyzer
 * @brief Stateless, thread-safe UUID analyzer.
 */
class FieldAnalyzer {
  public:
    /**
     * @brief Analyzes one UUID string.
     *
     * @param uuid_text Canonical UUID text (case-insensitive, surrounding blanks ignored).
     * @param namespace_hint Optional name-space for version-3 UUIDs (`DNS`, `URL`, `OID`,
     * `X500`, case-insensitive). Unknown names are echoed back as custom.
     * @throws core::Error `InvalidFormat` if `uuid_text` is not a UUID.
     */
    static AnalysisRecord analyze(const std::string& uuid_text,
                                  const std::optional<std::string>& namespace_hint = std::nullopt);

    /// @overload
    static AnalysisRecord analyze(const Uuid& uuid,
                                  const std::optional<std::string>& namespace_hint = std::nullopt);

    /// @brief Applies the version-2 pattern heuristic described in the file header.
    static bool is_likely_v2(const Uuid& uuid);

    /// @brief Looks up a well-known name-space by name (case-insensitive).
    static std::optional<NamespaceInfo> find_namespace(const std::string& name);

    static std::string version_description(int version);
    static std::string variant_description(int variant_code);
    static std::string node_description(int version);
    static std::string clock_seq_description(int version);

    /// @brief DCE domain band derived from the 14-bit clock sequence.
    static std::string dce_domain(std::uint16_t clock_seq);

    /**
     * @brief Splits the 48-bit node into (4-bit domain, 16-bit uid, 16-bit gid, 12-bit pad).
     */
    static std::string posix_info(std::uint64_t node);

    /**
     * @brief Renders a UUID timestamp in UTC and IST.
     *
     * Timestamps that do not map onto a four-digit Gregorian year come back with
     * `applicable == false` instead of throwing.
     */
    static TemporalFields render_time(std::uint64_t uuid_timestamp);
};

} // namespace chronoid::core
