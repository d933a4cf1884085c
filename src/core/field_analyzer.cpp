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
 * @file field_analyzer.cpp
 * @brief Implementation of the version-aware UUID analyzer.
 *
 * @details
 * Analysis runs in three passes:
 * 1. **Decode**: version nibble, variant bits, the 14-bit clock sequence, raw fields.
 * 2. **Classify**: apply the version-2 heuristic on version-1 layouts.
 * 3. **Interpret**: fill the temporal fields (versions 1 and heuristic 2 only) and the
 * version-specific detail block.
 */

#include "chronoid/core/field_analyzer.hpp"

#include "chronoid/core/timestamp_codec.hpp"
#include "chronoid/infra/string.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace chronoid::core {

namespace {

using infra::String;

// IST is a fixed UTC+5:30 offset with no daylight saving.
constexpr std::int64_t kIstOffsetSeconds = 5 * 3600 + 30 * 60;

const std::array<NamespaceInfo, 4> kNamespaces = {{
    {"DNS", "6ba7b810-9dad-11d1-80b4-00c04fd430c8", "Domain Name System (DNS) - for domain names"},
    {"URL", "6ba7b811-9dad-11d1-80b4-00c04fd430c8", "Uniform Resource Locator (URL) - for URLs"},
    {"OID", "6ba7b812-9dad-11d1-80b4-00c04fd430c8", "ISO Object Identifier (OID) - for ISO OIDs"},
    {"X500", "6ba7b814-9dad-11d1-80b4-00c04fd430c8",
     "X.500 Distinguished Name (DN) - for X.500 DNs"},
}};

const char* const kEpochBase = "October 15, 1582 (Gregorian calendar reform)";
const char* const kPrecision = "100 nanoseconds";

std::int64_t floor_div(std::int64_t a, std::int64_t b)
{
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

/// Breaks Unix seconds into calendar fields; false if the year is outside 1..9999.
bool to_calendar(std::int64_t unix_seconds, std::tm& out)
{
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    if (gmtime_r(&t, &out) == nullptr) {
        return false;
    }
    int year = out.tm_year + 1900;
    return year >= 1 && year <= 9999;
}

std::string format_tm(const std::tm& tm, const char* pattern)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, pattern);
    return ss.str();
}

std::string pad_decimal(std::int64_t value, int width)
{
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

/// Timestamp fields in wire order with the version nibble left in.
std::string timestamp_hex(const Uuid& uuid)
{
    return String::to_hex(uuid.time_hi_and_version(), 4) + String::to_hex(uuid.time_mid(), 4) +
           String::to_hex(uuid.time_low(), 8);
}

TimeBasedDetails time_based_details(const Uuid& uuid)
{
    TimeBasedDetails d;
    d.timestamp_hex = timestamp_hex(uuid);
    d.mac_address = String::to_hex(uuid.node(), 12);
    for (std::size_t i = 0; i < d.mac_address.size(); i += 2) {
        if (i > 0) {
            d.mac_address_formatted.push_back(':');
        }
        d.mac_address_formatted.append(d.mac_address, i, 2);
    }
    d.clock_sequence_purpose = "Prevents duplicates when system clock goes backwards";
    d.time_precision = kPrecision;
    d.epoch_base = kEpochBase;
    d.sandwich_attack_possibility =
        "HIGH - Time-based UUIDs are vulnerable to sandwich attacks";
    d.sandwich_attack_description = "UUID v1 timestamps are predictable and can be manipulated "
                                    "to create collisions or predict future UUIDs";
    d.sandwich_attack_risk = "Attackers can generate UUIDs with timestamps before and after a "
                             "target UUID, potentially causing database conflicts";
    return d;
}

DceDetails dce_details(const Uuid& uuid, bool heuristic)
{
    DceDetails d;
    std::uint16_t clock_seq = uuid.clock_seq();
    d.timestamp_hex = timestamp_hex(uuid);
    d.dce_domain = FieldAnalyzer::dce_domain(clock_seq);
    d.posix_uid_gid = FieldAnalyzer::posix_info(uuid.node());
    d.security_identifier = String::to_hex(clock_seq, 4);
    d.clock_sequence_purpose = "DCE Security domain and POSIX UID/GID identification";
    d.time_precision = kPrecision;
    d.epoch_base = kEpochBase;
    d.dce_security_features = "Distributed Computing Environment security model";
    d.heuristic = heuristic;
    if (heuristic) {
        d.detection_note =
            "Detected as possible v2 based on DCE Security patterns despite version bit 1";
        d.confidence_level = "Low - heuristic match only; version 1 and DCE Security UUIDs share "
                             "one bit layout and cannot be told apart from the value alone";
        d.analysis_method = "Pattern-based detection using variant bits and clock sequence range";
        d.recommendation = "Treat as UUID v2 only if the issuing system is known to emit DCE "
                           "Security UUIDs";
    }
    return d;
}

HashDetails hash_details(const Uuid& uuid, const std::optional<std::string>& namespace_hint)
{
    HashDetails d;
    d.hash_algorithm = "MD5";
    d.hash_output = "128 bits";
    d.deterministic = true;
    d.collision_resistance = "Good (MD5 provides sufficient collision resistance for namespaces)";
    d.use_cases = "Identifiers, URLs, Namespaces, Consistent ID generation";
    d.hash_low_32bits = String::to_hex(uuid.time_low(), 8);
    d.hash_mid_16bits = String::to_hex(uuid.time_mid(), 4);
    d.hash_hi_12bits = String::to_hex(uuid.time_hi_and_version() & 0x0FFF, 4);
    d.hash_clock_14bits = String::to_hex(uuid.clock_seq(), 4);
    d.hash_node_48bits = String::to_hex(uuid.node(), 12);
    d.components_note = "These fields are MD5 hash output components, not time/clock/node values";
    d.field_naming_note = "UUID v3 uses the same field structure as v1, but all fields "
                          "represent MD5 hash output rather than timestamp, clock sequence, "
                          "and MAC address";

    if (namespace_hint && !namespace_hint->empty()) {
        if (auto ns = FieldAnalyzer::find_namespace(*namespace_hint)) {
            d.used_namespace = ns->name;
            d.used_namespace_uuid = ns->uuid;
            d.used_namespace_description = ns->description;
        } else {
            d.used_namespace = *namespace_hint;
            d.used_namespace_note = "Custom or unknown namespace";
        }
    }
    return d;
}

RandomDetails random_details()
{
    RandomDetails d;
    d.randomness_source = "Cryptographically secure random number generator";
    d.unpredictability = "Maximum (completely random)";
    d.collision_probability = "Extremely low (statistically negligible)";
    d.entropy_source = "Operating system entropy sources";
    d.use_cases = "Session IDs, Tokens, Unique Keys, Temporary Identifiers";
    d.security_level = "High (when using good random numbers generators)";
    return d;
}

void mark_not_time_based(AnalysisRecord& r, const char* reason)
{
    r.time.friendly_utc = std::string("N/A - ") + reason;
    r.time.friendly_ist = r.time.friendly_utc;
}

} // namespace

AnalysisRecord FieldAnalyzer::analyze(const std::string& uuid_text,
                                      const std::optional<std::string>& namespace_hint)
{
    return analyze(Uuid::parse(uuid_text), namespace_hint);
}

AnalysisRecord FieldAnalyzer::analyze(const Uuid& uuid,
                                      const std::optional<std::string>& namespace_hint)
{
    AnalysisRecord r;
    r.uuid = uuid.to_string();
    r.version = uuid.version();
    r.possible_v2 = is_likely_v2(uuid);

    r.variant_code = uuid.variant_code();
    r.variant = static_cast<VariantKind>(r.variant_code);
    r.variant_desc = variant_description(r.variant_code);

    if (r.possible_v2) {
        r.version_desc = "Possible UUID v2 (DCE Security) - Version bit shows 1 but patterns "
                         "suggest v2";
    } else {
        r.version_desc = version_description(r.version);
    }

    r.time_low = String::to_hex(uuid.time_low(), 8);
    r.time_mid = String::to_hex(uuid.time_mid(), 4);
    r.time_hi = String::to_hex(uuid.time_hi_and_version() & 0x0FFF, 4);
    r.time_hi_version = String::to_hex(uuid.time_hi_and_version(), 4);
    r.clock_seq = String::to_hex(uuid.clock_seq(), 4);
    r.clock_seq_hi = String::to_hex(uuid.clock_seq_hi_and_reserved(), 2);
    r.clock_seq_low = String::to_hex(uuid.clock_seq_low(), 2);
    r.node = String::to_hex(uuid.node(), 12);

    // A heuristic v2 is described with the DCE vocabulary, bits notwithstanding.
    int semantic_version = r.possible_v2 ? 2 : r.version;
    r.node_desc = node_description(semantic_version);
    r.clock_seq_desc = clock_seq_description(semantic_version);

    switch (r.version) {
    case 1: {
        std::uint64_t ts = TimestampCodec::join(uuid.time_low(), uuid.time_mid(),
                                                uuid.time_hi_and_version());
        r.time = render_time(ts);
        r.time_based = time_based_details(uuid);
        if (r.possible_v2) {
            r.dce = dce_details(uuid, true);
        }
        break;
    }
    case 2:
        r.time.timezone_utc = "UTC";
        r.time.timezone_ist = "IST (UTC+5:30)";
        r.dce = dce_details(uuid, false);
        break;
    case 3:
        mark_not_time_based(r, "UUID v3 is name-based, not time-based");
        r.node_desc = "MD5 hash component (48 bits) - not a MAC address";
        r.clock_seq_desc = "MD5 hash component (14 bits) - not a clock sequence";
        r.note_time_fields = "Fields named \"time_low\", \"time_mid\", \"time_hi\" are MD5 hash "
                             "components, not timestamps";
        r.note_clock_node = "Fields named \"clock_seq\" and \"node\" are MD5 hash components, "
                            "not clock sequence or MAC address";
        r.hash = hash_details(uuid, namespace_hint);
        break;
    case 4:
        mark_not_time_based(r, "UUID v4 is random, not time-based");
        r.node_desc = "Random bits (48 bits) - not a MAC address";
        r.clock_seq_desc = "Random bits (14 bits) - not a clock sequence";
        r.note_time_fields = "Fields named \"time_low\", \"time_mid\", \"time_hi\" are random "
                             "bits, not timestamps";
        r.note_clock_node = "Fields named \"clock_seq\" and \"node\" are random bits, not clock "
                            "sequence or MAC address";
        r.random = random_details();
        break;
    default:
        // Versions 0 and 5-15: fields are reported raw with the generic description.
        r.time.timezone_utc = "UTC";
        r.time.timezone_ist = "IST (UTC+5:30)";
        break;
    }

    return r;
}

bool FieldAnalyzer::is_likely_v2(const Uuid& uuid)
{
    if (uuid.version() != 1) {
        return false;
    }
    // DCE Security writes clock_seq_hi in 0x40-0x7F.
    if (uuid.variant_code() != 1) {
        return false;
    }
    std::uint16_t clock_seq = uuid.clock_seq();
    return clock_seq >= 0x0001 && clock_seq <= 0x3FFF;
}

std::optional<NamespaceInfo> FieldAnalyzer::find_namespace(const std::string& name)
{
    std::string key = String::to_upper(String::trim(name));
    for (const auto& ns : kNamespaces) {
        if (key == ns.name) {
            return ns;
        }
    }
    return std::nullopt;
}

std::string FieldAnalyzer::version_description(int version)
{
    switch (version) {
    case 1:
        return "Time-based UUID using timestamp and MAC address";
    case 2:
        return "DCE Security UUID (time-based + POSIX UID/GID)";
    case 3:
        return "Name-based UUID using MD5 hash";
    case 4:
        return "Random UUID (cryptographically secure)";
    case 5:
        return "Name-based UUID using SHA-1 hash";
    default:
        return "Unknown UUID version " + std::to_string(version);
    }
}

std::string FieldAnalyzer::variant_description(int variant_code)
{
    switch (variant_code) {
    case 0:
        return "Reserved (NCS backward compatibility)";
    case 1:
        return "DCE 1.1, ISO/IEC 11578:1996";
    case 2:
        return "Microsoft GUID";
    default:
        return "Reserved for future definition";
    }
}

std::string FieldAnalyzer::node_description(int version)
{
    switch (version) {
    case 1:
        return "MAC address of the generating computer";
    case 2:
        return "MAC address with POSIX UID/GID";
    case 3:
        return "MD5 hash output (48 bits) - part of the hash result, not a MAC address";
    case 4:
        return "Randomly generated (not a real MAC address)";
    case 5:
        return "SHA-1 hash output (48 bits) - part of the hash result, not a MAC address";
    default:
        return "Unknown node type";
    }
}

std::string FieldAnalyzer::clock_seq_description(int version)
{
    switch (version) {
    case 1:
        return "Random or pseudo-random number to ensure uniqueness";
    case 2:
        return "Security domain identifier";
    case 3:
        return "MD5 hash output (14 bits) - part of the hash result, not a clock sequence";
    case 4:
        return "Randomly generated (not used for timing)";
    case 5:
        return "SHA-1 hash output (14 bits) - part of the hash result, not a clock sequence";
    default:
        return "Unknown clock sequence type";
    }
}

std::string FieldAnalyzer::dce_domain(std::uint16_t clock_seq)
{
    if (clock_seq < 0x1000)
        return "Local DCE Security Domain";
    if (clock_seq < 0x2000)
        return "Network DCE Security Domain";
    if (clock_seq < 0x3000)
        return "Distributed DCE Security Domain";
    if (clock_seq < 0x4000)
        return "Enterprise DCE Security Domain";
    return "Custom DCE Security Domain";
}

std::string FieldAnalyzer::posix_info(std::uint64_t node)
{
    std::uint64_t domain = (node >> 44) & 0x0F;
    std::uint64_t uid = (node >> 28) & 0xFFFF;
    std::uint64_t gid = (node >> 12) & 0xFFFF;

    if (uid == 0 && gid == 0) {
        return "No POSIX UID/GID information";
    }
    return "Domain: " + std::to_string(domain) + ", UID: " + std::to_string(uid) +
           ", GID: " + std::to_string(gid);
}

TemporalFields FieldAnalyzer::render_time(std::uint64_t uuid_timestamp)
{
    TemporalFields t;
    t.uuid_timestamp = uuid_timestamp;
    t.unix_timestamp = TimestampCodec::to_unix_timestamp(uuid_timestamp);
    t.timezone_utc = "UTC";
    t.timezone_ist = "IST (UTC+5:30)";

    std::int64_t ticks = TimestampCodec::to_unix_ticks(uuid_timestamp);
    std::int64_t seconds = floor_div(ticks, TimestampCodec::kTicksPerSecond);
    std::int64_t sub_ticks = ticks - seconds * TimestampCodec::kTicksPerSecond;
    std::int64_t micros = sub_ticks / 10;
    std::int64_t millis = sub_ticks / 10000;

    std::tm utc{};
    std::tm ist{};
    if (!to_calendar(seconds, utc) || !to_calendar(seconds + kIstOffsetSeconds, ist)) {
        t.unix_timestamp.reset();
        t.friendly_utc = "Timestamp too large for conversion";
        t.friendly_ist = "Timestamp too large for conversion";
        return t;
    }

    // isoformat() style: the fraction appears only when non-zero.
    std::string fraction = micros != 0 ? "." + pad_decimal(micros, 6) : "";

    t.applicable = true;
    t.datetime_utc = format_tm(utc, "%Y-%m-%dT%H:%M:%S") + fraction;
    t.datetime_ist = format_tm(ist, "%Y-%m-%dT%H:%M:%S") + fraction;
    t.date_utc = format_tm(utc, "%Y-%m-%d");
    t.date_ist = format_tm(ist, "%Y-%m-%d");
    t.time_utc = format_tm(utc, "%H:%M:%S") + "." + pad_decimal(millis, 3);
    t.time_ist = format_tm(ist, "%H:%M:%S") + "." + pad_decimal(millis, 3);
    t.friendly_utc = format_tm(utc, "%A, %B %d, %Y at %I:%M:%S %p");
    t.friendly_ist = format_tm(ist, "%A, %B %d, %Y at %I:%M:%S %p");
    return t;
}

} // namespace chronoid::core
