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
 * @file serializer.hpp
 * @brief cJSON renderings of the domain types exchanged over the wire.
 *
 * @details
 * 60-bit timestamps and range sizes exceed the 53-bit mantissa of a JSON double, so
 * every 64-bit integer is emitted as a raw integer literal (`cJSON_AddRawToObject`)
 * instead of through `cJSON_AddNumberToObject`.
 */

#pragma once

#include "chronoid/core/field_analyzer.hpp"
#include "chronoid/core/generator.hpp"
#include "chronoid/core/range_enumerator.hpp"
#include "chronoid/tasks/task.hpp"

#include <cJSON.h>
#include <cstdint>
#include <memory>
#include <string>

namespace chronoid::network {

struct JsonDeleter {
    void operator()(cJSON* node) const
    {
        cJSON_Delete(node);
    }
};

/// @brief Owning handle for a cJSON tree.
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

class Serializer {
  public:
    static JsonPtr analysis(const core::AnalysisRecord& record);
    static JsonPtr generated(const core::GeneratedUuid& generated);
    static JsonPtr estimate(const core::RangeEstimate& estimate);
    static JsonPtr task(const tasks::GenerationTask& task);

    /// @brief Adds `value` as an exact JSON integer.
    static void add_uint(cJSON* object, const char* key, std::uint64_t value);

    /// @brief Compact text of `node`.
    static std::string print(const cJSON* node);
};

} // namespace chronoid::network
