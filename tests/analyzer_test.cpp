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
 * @file analyzer_test.cpp
 * @brief Unit tests for the field analyzer and the single-UUID generator.
 *
 * @details
 * Reference values were cross-checked against an independent RFC 4122 implementation.
 */

#include "chronoid/core/field_analyzer.hpp"
#include "chronoid/core/generator.hpp"
#include "chronoid/core/timestamp_codec.hpp"
#include "framework.hpp"

#include <set>
#include <string>

using chronoid::core::FieldAnalyzer;
using chronoid::core::Generator;
using chronoid::core::Uuid;

namespace {

const std::string kStart = "0867d7ee-f8d5-11ef-8a38-aedb2c11800f";
const std::string kDnsExample = "9073926b-929f-31c2-abc9-fad77ae3e8eb";

} // namespace

/**
 * @brief A version-1 UUID decodes to the instant it was minted, in both zones.
 */
void test_analyze_v1_time()
{
    auto r = FieldAnalyzer::analyze(kStart);

    ASSERT_EQ(r.uuid, kStart);
    ASSERT_EQ(r.version, 1);
    ASSERT_EQ(r.variant_code, 2);
    ASSERT_TRUE(r.time.applicable);
    ASSERT_TRUE(r.time.uuid_timestamp.has_value());
    ASSERT_EQ(*r.time.uuid_timestamp, static_cast<std::uint64_t>(139603707324520430ULL));
    ASSERT_TRUE(r.time.unix_timestamp.has_value());

    ASSERT_EQ(r.time.datetime_utc, std::string("2025-03-04T08:45:32.452043"));
    ASSERT_EQ(r.time.date_utc, std::string("2025-03-04"));
    ASSERT_EQ(r.time.time_utc, std::string("08:45:32.452"));
    ASSERT_EQ(r.time.friendly_utc, std::string("Tuesday, March 04, 2025 at 08:45:32 AM"));

    ASSERT_EQ(r.time.datetime_ist, std::string("2025-03-04T14:15:32.452043"));
    ASSERT_EQ(r.time.time_ist, std::string("14:15:32.452"));
    ASSERT_EQ(r.time.friendly_ist, std::string("Tuesday, March 04, 2025 at 02:15:32 PM"));
    ASSERT_EQ(r.time.timezone_utc, std::string("UTC"));
    ASSERT_EQ(r.time.timezone_ist, std::string("IST (UTC+5:30)"));
}

void test_analyze_v1_fields()
{
    auto r = FieldAnalyzer::analyze(kStart);

    ASSERT_EQ(r.time_low, std::string("0867d7ee"));
    ASSERT_EQ(r.time_mid, std::string("f8d5"));
    ASSERT_EQ(r.time_hi, std::string("01ef"));
    ASSERT_EQ(r.time_hi_version, std::string("11ef"));
    ASSERT_EQ(r.clock_seq, std::string("0a38"));
    ASSERT_EQ(r.clock_seq_hi, std::string("8a"));
    ASSERT_EQ(r.clock_seq_low, std::string("38"));
    ASSERT_EQ(r.node, std::string("aedb2c11800f"));

    ASSERT_TRUE(r.time_based.has_value());
    ASSERT_EQ(r.time_based->mac_address, std::string("aedb2c11800f"));
    ASSERT_EQ(r.time_based->mac_address_formatted, std::string("ae:db:2c:11:80:0f"));
    ASSERT_EQ(r.time_based->timestamp_hex, std::string("11eff8d50867d7ee"));
    ASSERT_FALSE(r.hash.has_value());
    ASSERT_FALSE(r.random.has_value());
}

/**
 * @brief A version-1 layout in the DCE variant range (0x40-0x7F) matches the v2 pattern.
 *
 * The flag is advisory: the version stays 1 and the v1 details stay present.
 */
void test_analyze_possible_v2_flag()
{
    auto r = FieldAnalyzer::analyze("0867d7ee-f8d5-11ef-4a38-aedb2c11800f");
    ASSERT_TRUE(r.possible_v2);
    ASSERT_EQ(r.version, 1);
    ASSERT_EQ(r.variant_code, 1);
    ASSERT_TRUE(r.version_desc.find("Possible UUID v2") == 0);
    ASSERT_TRUE(r.time.applicable);
    ASSERT_TRUE(r.time_based.has_value());
    ASSERT_TRUE(r.dce.has_value());
    ASSERT_TRUE(r.dce->heuristic);
    ASSERT_TRUE(r.dce->confidence_level.find("Low") == 0);
    ASSERT_EQ(r.dce->dce_domain, std::string("Local DCE Security Domain"));
    ASSERT_EQ(r.dce->security_identifier, std::string("0a38"));
    ASSERT_EQ(r.node_desc, FieldAnalyzer::node_description(2));
    ASSERT_EQ(r.clock_seq_desc, FieldAnalyzer::clock_seq_description(2));

    // Zero clock sequence: outside [1, 0x3FFF].
    ASSERT_FALSE(FieldAnalyzer::is_likely_v2(Uuid::parse("0867d7ee-f8d5-11ef-4000-aedb2c11800f")));
    // Other versions are never re-labeled.
    ASSERT_FALSE(FieldAnalyzer::is_likely_v2(Uuid::parse("0867d7ee-f8d5-31ef-4a38-aedb2c11800f")));
}

/**
 * @brief Ordinary RFC 4122 v1 UUIDs (variant bits 10) are reported as plain version 1.
 */
void test_analyze_rfc_v1_not_flagged()
{
    auto r = FieldAnalyzer::analyze(kStart);
    ASSERT_FALSE(r.possible_v2);
    ASSERT_EQ(r.variant_code, 2);
    ASSERT_EQ(r.version_desc, FieldAnalyzer::version_description(1));
    ASSERT_EQ(r.node_desc, FieldAnalyzer::node_description(1));
    ASSERT_EQ(r.clock_seq_desc, FieldAnalyzer::clock_seq_description(1));
    ASSERT_FALSE(r.dce.has_value());
    ASSERT_TRUE(r.time_based.has_value());

    // NCS variant: pattern does not apply either.
    auto ncs = FieldAnalyzer::analyze("0867d7ee-f8d5-11ef-0a38-aedb2c11800f");
    ASSERT_FALSE(ncs.possible_v2);
    ASSERT_EQ(ncs.variant_code, 0);
    ASSERT_FALSE(ncs.dce.has_value());
}

void test_analyze_v3_hash()
{
    auto r = FieldAnalyzer::analyze(kDnsExample, std::string("dns"));

    ASSERT_EQ(r.version, 3);
    ASSERT_FALSE(r.possible_v2);
    ASSERT_FALSE(r.time.applicable);
    ASSERT_FALSE(r.time.uuid_timestamp.has_value());
    ASSERT_FALSE(r.time.unix_timestamp.has_value());
    ASSERT_EQ(r.time.friendly_utc, std::string("N/A - UUID v3 is name-based, not time-based"));
    ASSERT_EQ(r.time.datetime_utc, std::string("N/A"));
    ASSERT_TRUE(r.note_time_fields.has_value());
    ASSERT_TRUE(r.note_clock_node.has_value());

    ASSERT_TRUE(r.hash.has_value());
    ASSERT_EQ(r.hash->hash_algorithm, std::string("MD5"));
    ASSERT_EQ(r.hash->hash_low_32bits, std::string("9073926b"));
    ASSERT_EQ(r.hash->hash_hi_12bits, std::string("01c2"));
    ASSERT_EQ(r.hash->hash_clock_14bits, std::string("2bc9"));
    ASSERT_EQ(r.hash->hash_node_48bits, std::string("fad77ae3e8eb"));
    ASSERT_TRUE(r.hash->used_namespace == std::string("DNS"));
    ASSERT_TRUE(r.hash->used_namespace_uuid ==
                std::string("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));

    auto custom = FieldAnalyzer::analyze(kDnsExample, std::string("corp"));
    ASSERT_TRUE(custom.hash->used_namespace == std::string("corp"));
    ASSERT_TRUE(custom.hash->used_namespace_note == std::string("Custom or unknown namespace"));

    auto bare = FieldAnalyzer::analyze(kDnsExample);
    ASSERT_FALSE(bare.hash->used_namespace.has_value());
}

void test_analyze_v4_random()
{
    auto r = FieldAnalyzer::analyze("f47ac10b-58cc-4372-a567-0e02b2c3d479");
    ASSERT_EQ(r.version, 4);
    ASSERT_TRUE(r.random.has_value());
    ASSERT_FALSE(r.time.applicable);
    ASSERT_EQ(r.time.friendly_ist, std::string("N/A - UUID v4 is random, not time-based"));
    ASSERT_FALSE(r.time.unix_timestamp.has_value());
    ASSERT_EQ(r.node_desc, std::string("Random bits (48 bits) - not a MAC address"));
}

void test_analyze_unknown_version()
{
    auto r = FieldAnalyzer::analyze("0867d7ee-f8d5-61ef-8a38-aedb2c11800f");
    ASSERT_EQ(r.version, 6);
    ASSERT_FALSE(r.possible_v2);
    ASSERT_EQ(r.version_desc, std::string("Unknown UUID version 6"));
    ASSERT_EQ(r.node_desc, std::string("Unknown node type"));
    ASSERT_FALSE(r.time.applicable);
    ASSERT_EQ(r.time.timezone_utc, std::string("UTC"));

    ASSERT_THROWS_KIND(FieldAnalyzer::analyze(std::string("garbage")), InvalidFormat);
}

void test_analyze_dce_helpers()
{
    ASSERT_EQ(FieldAnalyzer::dce_domain(0x0001), std::string("Local DCE Security Domain"));
    ASSERT_EQ(FieldAnalyzer::dce_domain(0x1000), std::string("Network DCE Security Domain"));
    ASSERT_EQ(FieldAnalyzer::dce_domain(0x2fff), std::string("Distributed DCE Security Domain"));
    ASSERT_EQ(FieldAnalyzer::dce_domain(0x3fff), std::string("Enterprise DCE Security Domain"));

    ASSERT_EQ(FieldAnalyzer::posix_info(0), std::string("No POSIX UID/GID information"));
    std::uint64_t node = (2ULL << 44) | (1000ULL << 28) | (1001ULL << 12);
    ASSERT_EQ(FieldAnalyzer::posix_info(node), std::string("Domain: 2, UID: 1000, GID: 1001"));

    ASSERT_TRUE(FieldAnalyzer::find_namespace(" url ").has_value());
    ASSERT_FALSE(FieldAnalyzer::find_namespace("SHA").has_value());
}

void test_generate_v3_known_values()
{
    auto g = Generator::generate(3, "example.com", "DNS");
    ASSERT_EQ(g.uuid.to_string(), kDnsExample);
    ASSERT_TRUE(g.name == std::string("example.com"));
    ASSERT_TRUE(g.namespace_uuid == std::string("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
    ASSERT_TRUE(g.analysis.hash.has_value());
    ASSERT_TRUE(g.analysis.hash->used_namespace == std::string("DNS"));

    auto url = Generator::name_based_md5("URL", "https://example.com/page");
    ASSERT_EQ(url.to_string(), std::string("38f4794a-55bd-3fcb-80e1-aec6cd14d856"));

    // Deterministic.
    ASSERT_EQ(Generator::generate(3, "example.com", "dns").uuid.to_string(), kDnsExample);
}

void test_generate_rejects_bad_requests()
{
    ASSERT_THROWS_KIND(Generator::generate(5), UnsupportedVersion);
    ASSERT_THROWS_KIND(Generator::generate(0), UnsupportedVersion);
    ASSERT_THROWS_KIND(Generator::generate(3, ""), InvalidArgument);
    ASSERT_THROWS_KIND(Generator::generate(3, "example.com", "SHA"), InvalidArgument);
}

void test_generate_time_based()
{
    auto g = Generator::generate(1);
    ASSERT_EQ(g.uuid.version(), 1);
    ASSERT_EQ(g.uuid.variant_code(), 2);
    ASSERT_TRUE((g.uuid.node() & 0x010000000000ULL) != 0);
    ASSERT_TRUE(g.analysis.time.applicable);

    Uuid at = Generator::time_based_at(1741077932.25, 0xaedb2c11800fULL);
    ASSERT_EQ(at.time_low(), static_cast<std::uint32_t>(0x0867d7ee - 2020430));
    ASSERT_EQ(at.node(), static_cast<std::uint64_t>(0xaedb2c11800fULL));
    ASSERT_EQ(at.version(), 1);
    ASSERT_EQ(at.variant_code(), 2);
}

void test_generate_dce_and_random()
{
    auto v2 = Generator::generate(2);
    ASSERT_EQ(v2.uuid.version(), 1);
    ASSERT_EQ(static_cast<int>(v2.uuid.clock_seq_hi_and_reserved()), 0x40);
    int low = v2.uuid.clock_seq_low();
    ASSERT_TRUE(low >= 0x01 && low <= 0x3F);
    ASSERT_EQ(v2.uuid.node() & 0xFFF, static_cast<std::uint64_t>(0));
    ASSERT_TRUE(((v2.uuid.node() >> 44) & 0x0F) >= 1);
    ASSERT_TRUE(v2.analysis.possible_v2);
    ASSERT_TRUE(v2.analysis.dce.has_value());
    ASSERT_EQ(v2.analysis.dce->posix_uid_gid.find("Domain: "), static_cast<size_t>(0));

    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto v4 = Generator::generate(4);
        ASSERT_EQ(v4.uuid.version(), 4);
        ASSERT_EQ(v4.uuid.variant_code(), 2);
        ASSERT_TRUE(v4.analysis.random.has_value());
        seen.insert(v4.uuid.to_string());
    }
    ASSERT_EQ(seen.size(), static_cast<size_t>(50));
}

/**
 * @brief Random UUIDs carry exactly the version-4 and RFC variant bits; the rest varies.
 */
void test_generate_v4_layout()
{
    std::set<std::string> seen;
    int or_bits = 0;
    int and_bits = 0xFF;
    for (int i = 0; i < 500; ++i) {
        Uuid u = Generator::random();
        ASSERT_EQ(u.bytes()[6] >> 4, 4);
        ASSERT_EQ(u.bytes()[8] >> 6, 2);
        or_bits |= u.bytes()[15];
        and_bits &= u.bytes()[15];
        seen.insert(u.to_string());

        std::uint64_t node = Generator::random_node();
        ASSERT_TRUE((node & 0x010000000000ULL) != 0);
        ASSERT_TRUE(node <= 0xFFFFFFFFFFFFULL);
    }
    ASSERT_EQ(seen.size(), static_cast<size_t>(500));
    // Every bit of the last octet takes both values across 500 draws.
    ASSERT_EQ(or_bits, 0xFF);
    ASSERT_EQ(and_bits, 0);
}
