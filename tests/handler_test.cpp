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
 * @file handler_test.cpp
 * @brief Integration tests for the chronoid Network Handler and Command Dispatcher.
 *
 * @details
 * Drives the JSON protocol end to end: request text in, response text out, with a
 * real generation engine behind the dispatcher. A RAII directory manager keeps the
 * engine's output isolated from other suites.
 */

#include "chronoid/network/handler.hpp"
#include "chronoid/tasks/generation_engine.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using chronoid::network::Handler;

namespace {

/**
 * @class TestDirManager
 * @brief Clears the handler's output directory before and after the suite.
 */
class TestDirManager {
  public:
    const std::string out_path = "./handler_test_output";

    TestDirManager()
    {
        if (fs::exists(out_path)) {
            fs::remove_all(out_path);
        }
    }

    ~TestDirManager()
    {
        if (fs::exists(out_path)) {
            fs::remove_all(out_path);
        }
    }
};

/**
 * @brief Suite-wide engine instance.
 *
 * Static order guarantees the manager is constructed first and destroyed last.
 */
chronoid::tasks::GenerationEngine& get_handler_engine()
{
    static TestDirManager manager;
    static chronoid::tasks::TaskRegistry registry;
    static chronoid::tasks::GenerationEngine engine(registry, [] {
        chronoid::tasks::EngineOptions options;
        options.output_dir = manager.out_path;
        return options;
    }());
    return engine;
}

/// Owns a parsed response for the duration of a test.
struct Response {
    explicit Response(const std::string& text) : json(cJSON_Parse(text.c_str())) {}
    ~Response()
    {
        cJSON_Delete(json);
    }
    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    std::string str(const char* key) const
    {
        const cJSON* item = cJSON_GetObjectItemCaseSensitive(json, key);
        return cJSON_IsString(item) ? std::string(item->valuestring) : std::string();
    }

    const cJSON* data() const
    {
        return cJSON_GetObjectItemCaseSensitive(json, "data");
    }

    std::string data_str(const char* key) const
    {
        const cJSON* item = cJSON_GetObjectItemCaseSensitive(data(), key);
        return cJSON_IsString(item) ? std::string(item->valuestring) : std::string();
    }

    cJSON* json;
};

Response call(const std::string& request)
{
    std::string text = Handler::process(get_handler_engine(), request);
    Response resp(text);
    if (resp.json == nullptr) {
        printf("    [DEBUG] Unparseable response: %s\n", text.c_str());
    } else if (resp.str("status") == "error") {
        printf("    [DEBUG] Handler Rejection: %s\n", resp.str("message").c_str());
    }
    return Response(text);
}

} // namespace

/**
 * @brief Validates the "Happy Path" for an analysis request.
 */
void test_handle_analyze_request()
{
    Response resp = call("{\"action\":\"analyze\",\"uuid\":\"0867d7ee-f8d5-11ef-8a38-aedb2c11800f\"}");
    ASSERT_NE(resp.json, (cJSON*)nullptr);
    ASSERT_EQ(resp.str("status"), std::string("ok"));

    ASSERT_EQ(resp.data_str("datetime_utc"), std::string("2025-03-04T08:45:32.452043"));
    ASSERT_EQ(resp.data_str("mac_address_formatted"), std::string("ae:db:2c:11:80:0f"));
    ASSERT_TRUE(cJSON_IsFalse(cJSON_GetObjectItemCaseSensitive(resp.data(), "possible_v2")));

    const cJSON* version = cJSON_GetObjectItemCaseSensitive(resp.data(), "version");
    ASSERT_EQ(version->valueint, 1);
}

/**
 * @brief 60-bit timestamps travel as exact JSON integers.
 */
void test_handle_analyze_exact_integers()
{
    std::string text = Handler::process(
        get_handler_engine(),
        "{\"action\":\"analyze\",\"uuid\":\"0867d7ee-f8d5-11ef-8a38-aedb2c11800f\"}");
    ASSERT_TRUE(text.find("\"uuid_timestamp\":139603707324520430") != std::string::npos);
}

/**
 * @brief A v1 layout in the DCE variant range is flagged, and its v1 and DCE blocks merge.
 */
void test_handle_analyze_possible_v2()
{
    std::string text = Handler::process(
        get_handler_engine(),
        "{\"action\":\"analyze\",\"uuid\":\"0867d7ee-f8d5-11ef-4a38-aedb2c11800f\"}");
    Response resp(text);
    ASSERT_EQ(resp.str("status"), std::string("ok"));
    ASSERT_TRUE(cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(resp.data(), "possible_v2")));
    ASSERT_EQ(resp.data_str("dce_domain"), std::string("Local DCE Security Domain"));
    ASSERT_EQ(resp.data_str("mac_address_formatted"), std::string("ae:db:2c:11:80:0f"));

    // Keys shared by the v1 and DCE blocks appear once.
    size_t first = text.find("\"timestamp_hex\"");
    ASSERT_TRUE(first != std::string::npos);
    ASSERT_TRUE(text.find("\"timestamp_hex\"", first + 1) == std::string::npos);
}

void test_handle_analyze_v3_with_namespace()
{
    Response resp = call("{\"action\":\"analyze\",\"uuid\":\"9073926b-929f-31c2-abc9-fad77ae3e8eb\","
                         "\"namespace\":\"DNS\"}");
    ASSERT_EQ(resp.str("status"), std::string("ok"));
    ASSERT_EQ(resp.data_str("used_namespace"), std::string("DNS"));
    ASSERT_EQ(resp.data_str("uuid_timestamp"), std::string("N/A"));
    ASSERT_EQ(resp.data_str("hash_algorithm"), std::string("MD5"));
}

/**
 * @brief Validates robust error handling for syntactically invalid JSON.
 */
void test_handle_invalid_json()
{
    Response resp = call("{ action : \"analyze\", uuid : ... ");
    ASSERT_NE(resp.json, (cJSON*)nullptr);
    ASSERT_EQ(resp.str("status"), std::string("error"));
    ASSERT_EQ(resp.str("error_kind"), std::string("InvalidArgument"));

    Response empty = call("");
    ASSERT_EQ(empty.str("status"), std::string("error"));
}

void test_handle_error_kinds()
{
    Response unknown = call("{\"action\":\"teleport\"}");
    ASSERT_EQ(unknown.str("status"), std::string("error"));
    ASSERT_EQ(unknown.str("error_kind"), std::string("InvalidArgument"));
    ASSERT_EQ(unknown.str("message"), std::string("Unknown action: teleport"));

    Response bad_uuid = call("{\"action\":\"analyze\",\"uuid\":\"xyz\"}");
    ASSERT_EQ(bad_uuid.str("error_kind"), std::string("InvalidFormat"));

    Response missing = call("{\"action\":\"analyze\"}");
    ASSERT_EQ(missing.str("error_kind"), std::string("InvalidArgument"));
    ASSERT_EQ(missing.str("message"), std::string("Missing argument: 'uuid'"));

    Response version = call("{\"action\":\"generate_single\",\"version\":7}");
    ASSERT_EQ(version.str("error_kind"), std::string("UnsupportedVersion"));

    Response status = call("{\"action\":\"status\",\"task_id\":\"no-such-task\"}");
    ASSERT_EQ(status.str("error_kind"), std::string("NotFound"));
}

void test_handle_estimate()
{
    std::string text = Handler::process(
        get_handler_engine(), "{\"action\":\"estimate\","
                              "\"start_uuid\":\"093444c8-f8d5-11ef-8a38-aedb2c11800f\","
                              "\"end_uuid\":\"0867d7ee-f8d5-11ef-8a38-aedb2c11800f\"}");
    ASSERT_TRUE(text.find("\"total_possible\":13397211") != std::string::npos);
    ASSERT_TRUE(text.find("\"start_timestamp\":139603707324520430") != std::string::npos);

    Response resp(text);
    ASSERT_EQ(resp.data_str("estimated_time_human"), std::string("0:22:19.721100"));
}

void test_handle_generate_single()
{
    Response v3 = call("{\"action\":\"generate_single\",\"version\":\"3\",\"name\":\"example.com\"}");
    ASSERT_EQ(v3.str("status"), std::string("ok"));
    ASSERT_EQ(v3.data_str("uuid"), std::string("9073926b-929f-31c2-abc9-fad77ae3e8eb"));
    ASSERT_EQ(v3.data_str("name"), std::string("example.com"));
    ASSERT_EQ(v3.data_str("namespace_uuid"), std::string("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));

    Response v4 = call("{\"action\":\"generate_single\",\"version\":4}");
    ASSERT_EQ(v4.str("status"), std::string("ok"));
    ASSERT_EQ(v4.data_str("uuid").size(), static_cast<size_t>(36));
}

/**
 * @brief A range request returns a task handle that can be polled to completion.
 */
void test_handle_generate_range_lifecycle()
{
    Response started = call("{\"action\":\"generate_range\","
                            "\"start_uuid\":\"0867d7ee-f8d5-11ef-8a38-aedb2c11800f\","
                            "\"end_uuid\":\"0867d7f0-f8d5-11ef-8a38-aedb2c11800f\"}");
    ASSERT_EQ(started.str("status"), std::string("ok"));
    std::string task_id = started.data_str("task_id");
    ASSERT_FALSE(task_id.empty());

    ASSERT_TRUE(get_handler_engine().wait(task_id, std::chrono::seconds(10)));

    Response status = call("{\"action\":\"status\",\"task_id\":\"" + task_id + "\"}");
    ASSERT_EQ(status.data_str("status"), std::string("completed"));
    ASSERT_FALSE(status.data_str("output_path").empty());

    Response cancel = call("{\"action\":\"cancel\",\"task_id\":\"" + task_id + "\"}");
    ASSERT_EQ(cancel.data_str("result"), std::string("already_finished"));

    Response list = call("{\"action\":\"list\"}");
    ASSERT_TRUE(cJSON_IsArray(list.data()));
    ASSERT_TRUE(cJSON_GetArraySize(list.data()) >= 1);

    Response cleanup = call("{\"action\":\"cleanup\",\"task_id\":\"" + task_id + "\"}");
    ASSERT_EQ(cleanup.str("message"), std::string("Task record removed"));

    Response gone = call("{\"action\":\"status\",\"task_id\":\"" + task_id + "\"}");
    ASSERT_EQ(gone.str("error_kind"), std::string("NotFound"));
}

void test_handle_exit()
{
    Response resp = call("{\"action\":\"exit\"}");
    ASSERT_EQ(resp.str("status"), std::string("goodbye"));
}
