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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives.
 *
 * @details
 * Covers IdGenerator, String, the cancellation signal, the bounded channel,
 * the scheduler, and configuration loading.
 */

#include "chronoid/infra/bounded_channel.hpp"
#include "chronoid/infra/cancellation.hpp"
#include "chronoid/infra/config.hpp"
#include "chronoid/infra/id_generator.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/infra/scheduler.hpp"
#include "chronoid/infra/string.hpp"
#include "framework.hpp"

#include <atomic>
#include <map>
#include <string>
#include <thread>

using chronoid::infra::String;

/**
 * @brief A standard Version 4 UUID is 36 characters with the version and variant set.
 */
void test_uuid_length()
{
    std::string id = chronoid::infra::IdGenerator::generate();
    ASSERT_EQ(id.length(), static_cast<size_t>(36));
    ASSERT_EQ(id[14], '4');

    char variant = id[19];
    ASSERT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

void test_uuid_uniqueness()
{
    std::string id1 = chronoid::infra::IdGenerator::generate();
    std::string id2 = chronoid::infra::IdGenerator::generate();
    ASSERT_NE(id1, id2);
}

void test_random_in_bounds()
{
    for (int i = 0; i < 1000; ++i) {
        std::uint64_t v = chronoid::infra::IdGenerator::next_in(0x01, 0x3F);
        ASSERT_TRUE(v >= 0x01 && v <= 0x3F);
    }
}

void test_string_trim()
{
    std::string dirty = "   0867d7ee-f8d5-11ef-8a38-aedb2c11800f \n";
    ASSERT_EQ(String::trim(dirty), std::string("0867d7ee-f8d5-11ef-8a38-aedb2c11800f"));
    ASSERT_EQ(String::trim("  \t\n  \r "), std::string(""));
}

void test_string_hex()
{
    ASSERT_EQ(String::to_hex(0x1ef, 4), std::string("01ef"));
    ASSERT_EQ(String::to_hex(0, 2), std::string("00"));
    ASSERT_EQ(String::to_hex(0xaedb2c11800fULL, 12), std::string("aedb2c11800f"));
    ASSERT_EQ(String::hex_value('F'), 15);
    ASSERT_EQ(String::hex_value('g'), -1);
}

void test_string_thousands()
{
    ASSERT_EQ(String::with_thousands(0), std::string("0"));
    ASSERT_EQ(String::with_thousands(999), std::string("999"));
    ASSERT_EQ(String::with_thousands(1000), std::string("1,000"));
    ASSERT_EQ(String::with_thousands(13397211), std::string("13,397,211"));
    ASSERT_EQ(String::with_thousands(123456), std::string("123,456"));
}

/**
 * @brief Cancelling is idempotent and visible through every token.
 */
void test_cancellation_source()
{
    chronoid::infra::CancellationSource source;
    chronoid::infra::CancellationToken token = source.token();
    chronoid::infra::CancellationSource copy = source;

    ASSERT_FALSE(token.is_cancelled());
    ASSERT_TRUE(copy.cancel());
    ASSERT_FALSE(source.cancel());
    ASSERT_TRUE(token.is_cancelled());
    ASSERT_TRUE(source.is_cancelled());

    chronoid::infra::CancellationToken never;
    ASSERT_FALSE(never.is_cancelled());
}

/**
 * @brief A full channel blocks the producer; closing drains then ends the stream.
 */
void test_bounded_channel()
{
    chronoid::infra::BoundedChannel<int> channel(2);
    std::atomic<int> pushed{0};

    std::thread producer([&] {
        for (int i = 0; i < 5; ++i) {
            if (!channel.push(i)) {
                break;
            }
            pushed++;
        }
        channel.close();
    });

    int expected = 0;
    while (auto v = channel.pop()) {
        ASSERT_TRUE(channel.size() <= channel.capacity());
        ASSERT_EQ(*v, expected);
        expected++;
    }
    producer.join();

    ASSERT_EQ(expected, 5);
    ASSERT_EQ(pushed.load(), 5);
    ASSERT_FALSE(channel.push(42));
}

void test_scheduler_runs_all()
{
    std::atomic<int> done{0};
    {
        chronoid::infra::Scheduler pool(3);
        ASSERT_EQ(pool.size(), static_cast<size_t>(3));
        for (int i = 0; i < 20; ++i) {
            ASSERT_TRUE(pool.enqueue([&done] { done++; }));
        }
    }
    ASSERT_EQ(done.load(), 20);
}

void test_config_defaults()
{
    const char* argv[] = {"chronoid"};
    auto cfg = chronoid::infra::Config::load(1, argv, [](const char*) -> const char* {
        return nullptr;
    });

    ASSERT_EQ(cfg.port, 5001);
    ASSERT_EQ(cfg.output_dir, std::string("./chronoid_output"));
    ASSERT_EQ(cfg.batch_size, static_cast<size_t>(1000));
    ASSERT_EQ(cfg.session_threads, static_cast<size_t>(4));
}

/**
 * @brief Positional arguments override the environment, which overrides defaults.
 */
void test_config_precedence()
{
    std::map<std::string, std::string> env = {{"CHRONOID_PORT", "7000"},
                                              {"CHRONOID_OUTPUT_DIR", "/tmp/from_env"},
                                              {"CHRONOID_BATCH_SIZE", "5"},
                                              {"CHRONOID_SESSIONS", "3"},
                                              {"CHRONOID_LOG_LEVEL", "debug"}};
    auto lookup = [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    const char* argv1[] = {"chronoid"};
    auto cfg = chronoid::infra::Config::load(1, argv1, lookup);
    ASSERT_EQ(cfg.port, 7000);
    ASSERT_EQ(cfg.output_dir, std::string("/tmp/from_env"));
    ASSERT_EQ(cfg.batch_size, chronoid::infra::Config::kMinBatchSize);
    ASSERT_EQ(cfg.session_threads, static_cast<size_t>(3));
    ASSERT_TRUE(cfg.log_level == chronoid::infra::LogLevel::DEBUG);

    const char* argv3[] = {"chronoid", "./out", "6000"};
    cfg = chronoid::infra::Config::load(3, argv3, lookup);
    ASSERT_EQ(cfg.port, 6000);
    ASSERT_EQ(cfg.output_dir, std::string("./out"));
}

void test_config_rejects_garbage()
{
    const char* argv[] = {"chronoid", "./out", "80x"};
    auto none = [](const char*) -> const char* { return nullptr; };
    ASSERT_THROWS_KIND((chronoid::infra::Config::load(3, argv, none)), InvalidArgument);

    const char* argv_big[] = {"chronoid", "./out", "70000"};
    ASSERT_THROWS_KIND((chronoid::infra::Config::load(3, argv_big, none)), InvalidArgument);

    auto bad_level = [](const char* name) -> const char* {
        return std::string(name) == "CHRONOID_LOG_LEVEL" ? "loud" : nullptr;
    };
    const char* argv1[] = {"chronoid"};
    ASSERT_THROWS_KIND((chronoid::infra::Config::load(1, argv1, bad_level)), InvalidArgument);
}

void test_logger_parse_level()
{
    using chronoid::infra::Logger;
    using chronoid::infra::LogLevel;
    ASSERT_TRUE(Logger::parse_level("TRACE") == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level(" warn ") == LogLevel::WARN);
    ASSERT_FALSE(Logger::parse_level("verbose").has_value());
}
