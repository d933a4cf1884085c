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
 * @file serializer.cpp
 * @brief Implementation of the cJSON renderings.
 */

#include "chronoid/network/serializer.hpp"

#include <cstdlib>
#include <optional>

namespace chronoid::network {

namespace {

void add_string(cJSON* obj, const char* key, const std::string& value)
{
    cJSON_AddStringToObject(obj, key, value.c_str());
}

/// Like add_string, but replaces a key an earlier detail block already wrote.
void put_string(cJSON* obj, const char* key, const std::string& value)
{
    cJSON_DeleteItemFromObjectCaseSensitive(obj, key);
    add_string(obj, key, value);
}

void add_optional(cJSON* obj, const char* key, const std::optional<std::string>& value)
{
    if (value) {
        add_string(obj, key, *value);
    }
}

void add_time(cJSON* obj, const core::TemporalFields& t)
{
    if (t.uuid_timestamp) {
        Serializer::add_uint(obj, "uuid_timestamp", *t.uuid_timestamp);
    } else {
        add_string(obj, "uuid_timestamp", "N/A");
    }
    if (t.unix_timestamp) {
        cJSON_AddNumberToObject(obj, "timestamp", *t.unix_timestamp);
    } else {
        add_string(obj, "timestamp", "N/A");
    }

    add_string(obj, "datetime_utc", t.datetime_utc);
    add_string(obj, "datetime_ist", t.datetime_ist);
    add_string(obj, "date_utc", t.date_utc);
    add_string(obj, "date_ist", t.date_ist);
    add_string(obj, "time_utc", t.time_utc);
    add_string(obj, "time_ist", t.time_ist);
    add_string(obj, "friendly_utc", t.friendly_utc);
    add_string(obj, "friendly_ist", t.friendly_ist);
    add_string(obj, "timezone_utc", t.timezone_utc);
    add_string(obj, "timezone_ist", t.timezone_ist);
}

void add_time_based(cJSON* obj, const core::TimeBasedDetails& d)
{
    add_string(obj, "timestamp_hex", d.timestamp_hex);
    add_string(obj, "mac_address", d.mac_address);
    add_string(obj, "mac_address_formatted", d.mac_address_formatted);
    add_string(obj, "clock_sequence_purpose", d.clock_sequence_purpose);
    add_string(obj, "time_precision", d.time_precision);
    add_string(obj, "epoch_base", d.epoch_base);
    add_string(obj, "sandwich_attack_possibility", d.sandwich_attack_possibility);
    add_string(obj, "sandwich_attack_description", d.sandwich_attack_description);
    add_string(obj, "sandwich_attack_risk", d.sandwich_attack_risk);
}

void add_dce(cJSON* obj, const core::DceDetails& d)
{
    put_string(obj, "timestamp_hex", d.timestamp_hex);
    add_string(obj, "dce_domain", d.dce_domain);
    add_string(obj, "posix_uid_gid", d.posix_uid_gid);
    add_string(obj, "security_identifier", d.security_identifier);
    put_string(obj, "clock_sequence_purpose", d.clock_sequence_purpose);
    put_string(obj, "time_precision", d.time_precision);
    put_string(obj, "epoch_base", d.epoch_base);
    add_string(obj, "dce_security_features", d.dce_security_features);
    if (d.heuristic) {
        add_string(obj, "detection_note", d.detection_note);
        add_string(obj, "confidence_level", d.confidence_level);
        add_string(obj, "analysis_method", d.analysis_method);
        add_string(obj, "recommendation", d.recommendation);
    }
}

void add_hash(cJSON* obj, const core::HashDetails& d)
{
    add_string(obj, "hash_algorithm", d.hash_algorithm);
    add_string(obj, "hash_output", d.hash_output);
    cJSON_AddBoolToObject(obj, "deterministic", d.deterministic);
    add_string(obj, "collision_resistance", d.collision_resistance);
    add_string(obj, "use_cases", d.use_cases);
    add_string(obj, "hash_low_32bits", d.hash_low_32bits);
    add_string(obj, "hash_mid_16bits", d.hash_mid_16bits);
    add_string(obj, "hash_hi_12bits", d.hash_hi_12bits);
    add_string(obj, "hash_clock_14bits", d.hash_clock_14bits);
    add_string(obj, "hash_node_48bits", d.hash_node_48bits);
    add_string(obj, "hash_components_note", d.components_note);
    add_string(obj, "field_naming_note", d.field_naming_note);
    add_optional(obj, "used_namespace", d.used_namespace);
    add_optional(obj, "used_namespace_uuid", d.used_namespace_uuid);
    add_optional(obj, "used_namespace_description", d.used_namespace_description);
    add_optional(obj, "used_namespace_note", d.used_namespace_note);
}

void add_random(cJSON* obj, const core::RandomDetails& d)
{
    add_string(obj, "randomness_source", d.randomness_source);
    add_string(obj, "unpredictability", d.unpredictability);
    add_string(obj, "collision_probability", d.collision_probability);
    add_string(obj, "entropy_source", d.entropy_source);
    add_string(obj, "use_cases", d.use_cases);
    add_string(obj, "security_level", d.security_level);
}

} // namespace

void Serializer::add_uint(cJSON* object, const char* key, std::uint64_t value)
{
    cJSON_AddRawToObject(object, key, std::to_string(value).c_str());
}

std::string Serializer::print(const cJSON* node)
{
    char* raw_output = cJSON_PrintUnformatted(node);
    if (!raw_output) {
        return "{}";
    }
    std::string out(raw_output);
    free(raw_output);
    return out;
}

JsonPtr Serializer::analysis(const core::AnalysisRecord& r)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON* obj = root.get();

    add_string(obj, "uuid", r.uuid);
    cJSON_AddNumberToObject(obj, "version", r.version);
    add_string(obj, "version_desc", r.version_desc);
    cJSON_AddBoolToObject(obj, "possible_v2", r.possible_v2);
    cJSON_AddNumberToObject(obj, "variant_code", r.variant_code);
    add_string(obj, "variant", r.variant_desc);

    add_time(obj, r.time);

    add_string(obj, "time_low", r.time_low);
    add_string(obj, "time_mid", r.time_mid);
    add_string(obj, "time_hi", r.time_hi);
    add_string(obj, "time_hi_version", r.time_hi_version);
    add_string(obj, "clock_seq", r.clock_seq);
    add_string(obj, "clock_seq_hi", r.clock_seq_hi);
    add_string(obj, "clock_seq_low", r.clock_seq_low);
    add_string(obj, "node", r.node);
    add_string(obj, "node_desc", r.node_desc);
    add_string(obj, "clock_seq_desc", r.clock_seq_desc);
    add_optional(obj, "note_time_fields", r.note_time_fields);
    add_optional(obj, "note_clock_node", r.note_clock_node);

    if (r.time_based) {
        add_time_based(obj, *r.time_based);
    }
    if (r.dce) {
        add_dce(obj, *r.dce);
    }
    if (r.hash) {
        add_hash(obj, *r.hash);
    }
    if (r.random) {
        add_random(obj, *r.random);
    }
    return root;
}

JsonPtr Serializer::generated(const core::GeneratedUuid& g)
{
    JsonPtr root = analysis(g.analysis);
    add_optional(root.get(), "name", g.name);
    add_optional(root.get(), "namespace_uuid", g.namespace_uuid);
    return root;
}

JsonPtr Serializer::estimate(const core::RangeEstimate& e)
{
    JsonPtr root(cJSON_CreateObject());
    add_uint(root.get(), "start_timestamp", e.start_timestamp);
    add_uint(root.get(), "end_timestamp", e.end_timestamp);
    add_uint(root.get(), "total_possible", e.total_possible);
    cJSON_AddNumberToObject(root.get(), "estimated_time_seconds", e.estimated_time_seconds);
    add_string(root.get(), "estimated_time_human", e.estimated_time_human);
    return root;
}

JsonPtr Serializer::task(const tasks::GenerationTask& t)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON* obj = root.get();

    add_string(obj, "task_id", t.task_id);
    add_string(obj, "status", tasks::to_string(t.status));
    cJSON_AddNumberToObject(obj, "progress", t.progress);
    add_uint(obj, "count", t.count);
    add_uint(obj, "total_possible", t.total_possible);
    cJSON_AddBoolToObject(obj, "cancelled", t.cancelled);
    add_string(obj, "start_uuid", t.start_uuid);
    add_string(obj, "end_uuid", t.end_uuid);
    cJSON_AddNumberToObject(obj, "created_at", t.created_at);
    if (!t.output_path.empty()) {
        add_string(obj, "output_path", t.output_path);
    }
    if (!t.message.empty()) {
        add_string(obj, "message", t.message);
    }
    if (!t.error_message.empty()) {
        add_string(obj, "error", t.error_message);
    }
    return root;
}

} // namespace chronoid::network
