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
 * @file generator.cpp
 * @brief Implementation of single UUID generation.
 */

#include "chronoid/core/generator.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/core/timestamp_codec.hpp"
#include "chronoid/infra/id_generator.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <memory>

namespace chronoid::core {

namespace {

using infra::IdGenerator;

// Bit 40 of the node is the least significant bit of the first octet.
constexpr std::uint64_t kMulticastBit = 0x010000000000ULL;
constexpr std::uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

std::array<std::uint8_t, 16> md5(const std::array<std::uint8_t, Uuid::kSize>& prefix,
                                 const std::string& name)
{
    std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw Error(ErrorKind::IOFailure, "OpenSSL: cannot allocate digest context");
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), prefix.data(), prefix.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 || digest_len != 16) {
        throw Error(ErrorKind::IOFailure, "OpenSSL: MD5 digest failed");
    }

    std::array<std::uint8_t, 16> out{};
    std::copy(digest.begin(), digest.begin() + 16, out.begin());
    return out;
}

/// Fills N bytes from the OpenSSL CSPRNG.
template <std::size_t N> std::array<std::uint8_t, N> secure_bytes()
{
    std::array<std::uint8_t, N> out{};
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw Error(ErrorKind::IOFailure, "OpenSSL: RAND_bytes failed");
    }
    return out;
}

std::uint64_t secure_u64()
{
    std::uint64_t value = 0;
    for (std::uint8_t b : secure_bytes<8>()) {
        value = (value << 8) | b;
    }
    return value;
}

double now_unix_seconds()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

Uuid with_timestamp(std::uint64_t uuid_timestamp, std::uint8_t clock_seq_hi,
                    std::uint8_t clock_seq_low, std::uint64_t node)
{
    TimestampFields f = TimestampCodec::split(uuid_timestamp);
    return Uuid::from_fields(f.time_low, f.time_mid, static_cast<std::uint16_t>(f.time_hi | 0x1000),
                             clock_seq_hi, clock_seq_low, node);
}

} // namespace

GeneratedUuid Generator::generate(int version, const std::string& name,
                                  const std::string& namespace_name)
{
    GeneratedUuid out;

    switch (version) {
    case 1:
        out.uuid = time_based();
        out.analysis = FieldAnalyzer::analyze(out.uuid);
        break;
    case 2:
        out.uuid = dce_security_like();
        out.analysis = FieldAnalyzer::analyze(out.uuid);
        break;
    case 3: {
        auto ns = FieldAnalyzer::find_namespace(namespace_name);
        if (!ns) {
            throw Error(ErrorKind::InvalidArgument,
                        "Invalid namespace. Must be one of: DNS, URL, OID, X500");
        }
        out.uuid = name_based_md5(Uuid::parse(ns->uuid), name);
        out.analysis = FieldAnalyzer::analyze(out.uuid, std::string(ns->name));
        out.name = name;
        out.namespace_uuid = ns->uuid;
        break;
    }
    case 4:
        out.uuid = random();
        out.analysis = FieldAnalyzer::analyze(out.uuid);
        break;
    default:
        throw Error(ErrorKind::UnsupportedVersion,
                    "Unsupported UUID version " + std::to_string(version) +
                        ". Must be 1, 2, 3, or 4");
    }
    return out;
}

Uuid Generator::time_based()
{
    std::uint64_t ts = TimestampCodec::to_uuid_timestamp(now_unix_seconds());
    std::uint64_t clock_seq = secure_u64() & 0x3FFF;
    return with_timestamp(ts, static_cast<std::uint8_t>((clock_seq >> 8) | 0x80),
                          static_cast<std::uint8_t>(clock_seq & 0xFF), random_node());
}

Uuid Generator::time_based_at(double unix_seconds, std::uint64_t node)
{
    std::uint64_t ts = TimestampCodec::to_uuid_timestamp(unix_seconds);

    auto micros = static_cast<std::int64_t>(unix_seconds * 1000000.0);
    auto csl = static_cast<std::uint8_t>(micros & 0xFF);
    auto csh = static_cast<std::uint8_t>(((micros >> 8) & 0x3F) | 0x80);
    return with_timestamp(ts, csh, csl, node);
}

Uuid Generator::dce_security_like()
{
    std::uint64_t ts = TimestampCodec::to_uuid_timestamp(now_unix_seconds());

    auto clock_seq_low = static_cast<std::uint8_t>(IdGenerator::next_in(0x01, 0x3F));
    std::uint64_t domain = IdGenerator::next_in(0x01, 0x0F);
    std::uint64_t uid = IdGenerator::next_in(1000, 0xFFFF);
    std::uint64_t gid = IdGenerator::next_in(1000, 0xFFFF);

    // domain(4) | uid(16) | gid(16) | padding(12)
    std::uint64_t node = (domain << 44) | (uid << 28) | (gid << 12);
    return with_timestamp(ts, 0x40, clock_seq_low, node);
}

Uuid Generator::name_based_md5(const std::string& namespace_name, const std::string& name)
{
    auto ns = FieldAnalyzer::find_namespace(namespace_name);
    if (!ns) {
        throw Error(ErrorKind::InvalidArgument,
                    "Invalid namespace. Must be one of: DNS, URL, OID, X500");
    }
    return name_based_md5(Uuid::parse(ns->uuid), name);
}

Uuid Generator::name_based_md5(const Uuid& namespace_uuid, const std::string& name)
{
    if (name.empty()) {
        throw Error(ErrorKind::InvalidArgument, "Name is required for UUID v3");
    }

    std::array<std::uint8_t, Uuid::kSize> bytes = md5(namespace_uuid.bytes(), name);
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x30);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
    return Uuid(bytes);
}

Uuid Generator::random()
{
    std::array<std::uint8_t, Uuid::kSize> bytes = secure_bytes<Uuid::kSize>();
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
    return Uuid(bytes);
}

std::uint64_t Generator::random_node()
{
    return (secure_u64() & kNodeMask) | kMulticastBit;
}

} // namespace chronoid::core
