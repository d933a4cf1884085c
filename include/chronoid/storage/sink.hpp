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
 * @file sink.hpp
 * @brief Append-only, line-oriented output file for one generation task.
 *
 * @details
 * A sink writes into a staging file (`<name>.txt.part`) and only becomes visible
 * under its final name (`<name>.txt`) through `commit()`, which is an atomic
 * `rename`. A sink that is discarded, or destroyed without being committed, removes
 * its staging file, so a cancelled or failed task never leaves a readable artifact.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <string>

namespace chronoid::storage {

/**
 * @class UuidSink
 * @brief Exclusive owner of one task's output stream.
 */
class UuidSink {
  public:
    /**
     * @brief Creates `directory` if needed and opens a fresh staging file.
     *
     * @param directory Output root.
     * @param stem Unique file stem, normally derived from the task id.
     * @throws core::Error `IOFailure` if the directory or file cannot be created.
     */
    UuidSink(const std::string& directory, const std::string& stem);

    /// @brief Discards the staging file unless `commit()` succeeded.
    ~UuidSink();

    UuidSink(const UuidSink&) = delete;
    UuidSink& operator=(const UuidSink&) = delete;

    /**
     * @brief Appends `chunk` verbatim (callers pass newline-terminated lines).
     * @throws core::Error `IOFailure` on a write error.
     */
    void write(const std::string& chunk);

    /**
     * @brief Flushes, closes, and atomically publishes the file.
     * @return The final path.
     * @throws core::Error `IOFailure` if flushing or renaming fails.
     */
    std::string commit();

    /// @brief Closes and deletes the staging file. Idempotent, never throws.
    void discard() noexcept;

    /// @brief Bytes appended so far.
    std::uint64_t bytes_written() const
    {
        return bytes_written_;
    }

    const std::string& staging_path() const
    {
        return staging_path_;
    }

    const std::string& final_path() const
    {
        return final_path_;
    }

  private:
    std::string staging_path_;
    std::string final_path_;
    std::ofstream file_;
    std::uint64_t bytes_written_ = 0;
    bool finished_ = false;
};

} // namespace chronoid::storage
