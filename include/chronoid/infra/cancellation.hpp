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
 * @file cancellation.hpp
 * @brief Cooperative cancellation signal shared between a requester and a worker.
 *
 * @details
 * A `CancellationSource` owns the signal and hands out any number of
 * `CancellationToken`s. Requesting cancellation is idempotent; workers poll the token
 * at their own check points and are never interrupted mid-write.
 */

#pragma once

#include <atomic>
#include <memory>

namespace chronoid::infra {

/**
 * @class CancellationToken
 * @brief Read-only view of a cancellation signal. Cheap to copy.
 */
class CancellationToken {
  public:
    /// @brief A token that is never cancelled.
    CancellationToken() = default;

    bool is_cancelled() const noexcept
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

  private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag))
    {
    }

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/**
 * @class CancellationSource
 * @brief Owner of a cancellation signal.
 *
 * Copies share one signal.
 */
class CancellationSource {
  public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Raises the signal.
     * @return true if this call raised it, false if it was already raised.
     */
    bool cancel() noexcept
    {
        return !flag_->exchange(true, std::memory_order_acq_rel);
    }

    bool is_cancelled() const noexcept
    {
        return flag_->load(std::memory_order_acquire);
    }

    CancellationToken token() const
    {
        return CancellationToken(flag_);
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace chronoid::infra
