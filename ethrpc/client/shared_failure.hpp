// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace ethrpc::client {

//! Failure of a whole chunk as observed by one of its calls, all sharing the same root cause
class ChunkError : public std::runtime_error {
  public:
    ChunkError(const std::string& message, std::shared_ptr<const std::exception_ptr> cause)
        : std::runtime_error{message}, cause_{std::move(cause)} {}

    //! The root cause shared by all the calls in the failed chunk
    const std::exception_ptr& cause() const noexcept { return *cause_; }

    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(*cause_); }

  private:
    std::shared_ptr<const std::exception_ptr> cause_;
};

/**
 * Reference-counted immutable holder of a chunk failure root cause.
 * It cannot be copied: the only way to hand the failure out is the explicit duplicate operation,
 * producing a ChunkError which refers to the same root cause.
 */
class SharedFailure {
  public:
    explicit SharedFailure(std::exception_ptr cause);

    SharedFailure(const SharedFailure&) = delete;
    SharedFailure& operator=(const SharedFailure&) = delete;
    SharedFailure(SharedFailure&&) noexcept = default;
    SharedFailure& operator=(SharedFailure&&) noexcept = default;

    std::exception_ptr duplicate() const;

    const std::string& message() const { return message_; }
    const std::exception_ptr& cause() const { return *cause_; }
    long use_count() const { return cause_.use_count(); }

  private:
    std::shared_ptr<const std::exception_ptr> cause_;
    std::string message_;
};

}  // namespace ethrpc::client
