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
 * @file sink.cpp
 * @brief Implementation of the task output file.
 *
 * @details
 * Writes go straight to the staging file in binary mode so that the `\n` line
 * terminator is byte-exact on every platform. Publication follows the
 * write-then-rename pattern: the final name never refers to a half-written file.
 */

#include "chronoid/storage/sink.hpp"

#include "chronoid/core/error.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace chronoid::storage {

UuidSink::UuidSink(const std::string& directory, const std::string& stem)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw core::Error(core::ErrorKind::IOFailure,
                          "Cannot create output directory '" + directory + "': " + ec.message());
    }

    final_path_ = (fs::path(directory) / (stem + ".txt")).string();
    staging_path_ = final_path_ + ".part";

    file_.open(staging_path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        finished_ = true;
        throw core::Error(core::ErrorKind::IOFailure,
                          "Cannot open output file '" + staging_path_ + "'");
    }
}

UuidSink::~UuidSink()
{
    if (!finished_) {
        discard();
    }
}

void UuidSink::write(const std::string& chunk)
{
    if (finished_) {
        throw core::Error(core::ErrorKind::IOFailure, "Write to a closed sink");
    }

    file_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!file_.good()) {
        throw core::Error(core::ErrorKind::IOFailure,
                          "Write failed on '" + staging_path_ + "' after " +
                              std::to_string(bytes_written_) + " bytes");
    }
    bytes_written_ += chunk.size();
}

std::string UuidSink::commit()
{
    if (finished_) {
        throw core::Error(core::ErrorKind::IOFailure, "Sink already closed");
    }

    file_.flush();
    file_.close();
    if (file_.fail()) {
        discard();
        throw core::Error(core::ErrorKind::IOFailure, "Flush failed on '" + staging_path_ + "'");
    }

    std::error_code ec;
    fs::rename(staging_path_, final_path_, ec);
    if (ec) {
        discard();
        throw core::Error(core::ErrorKind::IOFailure,
                          "Cannot publish '" + final_path_ + "': " + ec.message());
    }

    finished_ = true;
    return final_path_;
}

void UuidSink::discard() noexcept
{
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    fs::remove(staging_path_, ec);
    finished_ = true;
}

} // namespace chronoid::storage
