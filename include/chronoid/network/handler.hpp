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
 * @file handler.hpp
 * @brief Protocol adapter and command dispatcher for the server.
 *
 * @details
 * This header declares the `Handler` class, which deserializes one JSON request,
 * routes it to the analyzer, the generator or the generation engine, and serializes
 * the result.
 */

#pragma once

#include "chronoid/tasks/generation_engine.hpp"

#include <string>

namespace chronoid::network {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Processes a raw client request.
     *
     * The request is a JSON object with an `"action"` field:
     *
     * | action            | arguments                              |
     * |-------------------|----------------------------------------|
     * | `analyze`         | `uuid`, optional `namespace`           |
     * | `estimate`        | `start_uuid`, `end_uuid`               |
     * | `generate_single` | `version`, `name` and `namespace` (v3) |
     * | `generate_range`  | `start_uuid`, `end_uuid`               |
     * | `status`          | `task_id`                              |
     * | `cancel`          | `task_id`                              |
     * | `cleanup`         | `task_id`                              |
     * | `list`            |                                        |
     * | `exit`            |                                        |
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "error_kind": "<Kind>", "message": "<description>"}`
     * - **Exit:** `{"status": "goodbye", "message": "Closing connection"}`
     *
     * @code
     * {"action": "estimate",
     *  "start_uuid": "0867d7ee-f8d5-11ef-8a38-aedb2c11800f",
     *  "end_uuid": "093444c8-f8d5-11ef-8a38-aedb2c11800f"}
     * @endcode
     */
    static std::string process(tasks::GenerationEngine& engine, const std::string& raw_json);
};

} // namespace chronoid::network
