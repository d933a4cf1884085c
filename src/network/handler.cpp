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
 * @file handler.cpp
 * @brief Implementation of the command processing pipeline.
 *
 * @details
 * 1. **Ingest**: Parsing raw JSON from the socket.
 * 2. **Execute**: Routing the action to the core or the engine.
 * 3. **Respond**: Formatting the result, or the `core::Error` raised on the way,
 * into a JSON response.
 */

#include "chronoid/network/handler.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/core/field_analyzer.hpp"
#include "chronoid/core/generator.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/infra/string.hpp"
#include "chronoid/network/serializer.hpp"

#include <cJSON.h>
#include <cmath>
#include <optional>

namespace chronoid::network {

namespace {

using core::Error;
using core::ErrorKind;

std::string error_response(const char* kind, const std::string& message)
{
    JsonPtr resp(cJSON_CreateObject());
    cJSON_AddStringToObject(resp.get(), "status", "error");
    cJSON_AddStringToObject(resp.get(), "error_kind", kind);
    cJSON_AddStringToObject(resp.get(), "message", message.c_str());
    return Serializer::print(resp.get());
}

std::optional<std::string> optional_string(const cJSON* req, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        return std::string(item->valuestring);
    }
    return std::nullopt;
}

std::string required_string(const cJSON* req, const char* key)
{
    auto value = optional_string(req, key);
    if (!value || infra::String::trim(*value).empty()) {
        throw Error(ErrorKind::InvalidArgument, std::string("Missing argument: '") + key + "'");
    }
    return *value;
}

/// `version` may arrive as a number (`3`) or a string (`"3"`).
int required_version(const cJSON* req)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, "version");
    if (cJSON_IsNumber(item)) {
        double v = item->valuedouble;
        if (std::floor(v) == v && v >= 0 && v <= 15) {
            return static_cast<int>(v);
        }
    } else if (cJSON_IsString(item) && item->valuestring != nullptr) {
        std::string text = infra::String::trim(item->valuestring);
        if (text.size() == 1 && text[0] >= '0' && text[0] <= '9') {
            return text[0] - '0';
        }
    } else if (item == nullptr) {
        throw Error(ErrorKind::InvalidArgument, "Missing argument: 'version'");
    }
    throw Error(ErrorKind::UnsupportedVersion, "Invalid version. Must be 1, 2, 3, or 4");
}

/// Runs one action and returns its `data` payload, or nullptr when there is none.
JsonPtr dispatch(tasks::GenerationEngine& engine, const std::string& action, const cJSON* req,
                 std::string& msg)
{
    if (action == "analyze") {
        std::string uuid = required_string(req, "uuid");
        auto ns = optional_string(req, "namespace");
        if (ns && infra::String::trim(*ns).empty()) {
            ns.reset();
        }
        return Serializer::analysis(core::FieldAnalyzer::analyze(uuid, ns));
    }

    if (action == "estimate") {
        return Serializer::estimate(tasks::GenerationEngine::estimate(
            required_string(req, "start_uuid"), required_string(req, "end_uuid")));
    }

    if (action == "generate_single") {
        int version = required_version(req);
        std::string name = optional_string(req, "name").value_or("");
        std::string ns = optional_string(req, "namespace").value_or("DNS");
        return Serializer::generated(core::Generator::generate(version, name, ns));
    }

    if (action == "generate_range") {
        std::string task_id = engine.start_range_generation(required_string(req, "start_uuid"),
                                                            required_string(req, "end_uuid"));
        auto task = engine.get_status(task_id);
        if (!task) {
            throw Error(ErrorKind::NotFound, "Task vanished: " + task_id);
        }
        msg = "Range generation started";
        return Serializer::task(*task);
    }

    if (action == "status") {
        std::string task_id = required_string(req, "task_id");
        auto task = engine.get_status(task_id);
        if (!task) {
            throw Error(ErrorKind::NotFound, "Task not found: " + task_id);
        }
        return Serializer::task(*task);
    }

    if (action == "cancel") {
        std::string task_id = required_string(req, "task_id");
        tasks::CancelOutcome outcome = engine.cancel(task_id);
        if (outcome == tasks::CancelOutcome::NotFound) {
            throw Error(ErrorKind::NotFound, "Task not found: " + task_id);
        }
        JsonPtr data(cJSON_CreateObject());
        cJSON_AddStringToObject(data.get(), "task_id", task_id.c_str());
        cJSON_AddStringToObject(data.get(), "result", tasks::to_string(outcome));
        msg = outcome == tasks::CancelOutcome::Cancelled ? "Cancellation requested"
                                                          : "Task already finished";
        return data;
    }

    if (action == "cleanup") {
        std::string task_id = required_string(req, "task_id");
        if (!engine.delete_task(task_id)) {
            throw Error(ErrorKind::NotFound, "Task not found: " + task_id);
        }
        msg = "Task record removed";
        return nullptr;
    }

    if (action == "list") {
        JsonPtr data(cJSON_CreateArray());
        for (const auto& task : engine.list_tasks()) {
            cJSON_AddItemToArray(data.get(), Serializer::task(task).release());
        }
        return data;
    }

    throw Error(ErrorKind::InvalidArgument, "Unknown action: " + action);
}

} // namespace

std::string Handler::process(tasks::GenerationEngine& engine, const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response(to_string(ErrorKind::InvalidArgument), "Empty request payload");
    }

    JsonPtr req(cJSON_Parse(raw_json.c_str()));
    if (!req || !cJSON_IsObject(req.get())) {
        return error_response(to_string(ErrorKind::InvalidArgument), "Invalid JSON syntax");
    }

    std::string action = optional_string(req.get(), "action").value_or("");

    if (action == "exit") {
        return "{\"status\":\"goodbye\",\"message\":\"Closing connection\"}";
    }

    try {
        std::string msg;
        JsonPtr data = dispatch(engine, action, req.get(), msg);

        JsonPtr resp(cJSON_CreateObject());
        cJSON_AddStringToObject(resp.get(), "status", "ok");
        if (!msg.empty()) {
            cJSON_AddStringToObject(resp.get(), "message", msg.c_str());
        }
        if (data) {
            cJSON_AddItemToObject(resp.get(), "data", data.release());
        }
        return Serializer::print(resp.get());
    } catch (const Error& e) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Network: '" + action + "' rejected: " + std::string(e.what()));
        return error_response(to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Network: '" + action + "' failed: " + std::string(e.what()));
        return error_response("InternalError", e.what());
    }
}

} // namespace chronoid::network
