// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include <ethrpc/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ethrpc::concurrency {

//! Raised on the waiting side when the sink is destroyed before being resolved
class SinkAbandonedError : public std::logic_error {
  public:
    SinkAbandonedError() : std::logic_error("Invariant violation: completion sink dropped before being resolved") {}
};

class SinkAlreadyResolvedError : public std::logic_error {
  public:
    SinkAlreadyResolvedError() : std::logic_error("Invariant violation: completion sink resolved twice") {}
};

/**
 * Single-use completion slot delivering exactly one outcome (value or exception) to one waiter.
 *
 * The sink can be resolved from any thread, while the waiter awaits the outcome on its own executor.
 * Destroying an unresolved sink resolves it with SinkAbandonedError, so that a waiter never hangs.
 * See also: https://docs.rs/tokio/latest/tokio/sync/oneshot/index.html
 */
template <typename T>
class CompletionSink {
    using AsyncChannel = boost::asio::experimental::concurrent_channel<void(std::exception_ptr, std::optional<T>)>;

  public:
    class Future {
      public:
        Future(const Future&) = delete;
        Future& operator=(const Future&) = delete;
        Future(Future&&) noexcept = default;
        Future& operator=(Future&&) noexcept = default;

        //! Wait for the outcome: either the value or the exception set into the sink is thrown
        Task<T> get() {
            std::optional<T> result = co_await channel_->async_receive(boost::asio::use_awaitable);
            co_return std::move(result.value());
        }

      private:
        friend class CompletionSink<T>;
        explicit Future(std::shared_ptr<AsyncChannel> channel) : channel_(std::move(channel)) {}

        std::shared_ptr<AsyncChannel> channel_;
    };

    explicit CompletionSink(const boost::asio::any_io_executor& executor)
        : channel_(std::make_shared<AsyncChannel>(executor, 1)) {}
    ~CompletionSink() { abandon(); }

    CompletionSink(const CompletionSink&) = delete;
    CompletionSink& operator=(const CompletionSink&) = delete;

    CompletionSink(CompletionSink&& other) noexcept
        : channel_(std::move(other.channel_)), resolved_(std::exchange(other.resolved_, true)) {}
    CompletionSink& operator=(CompletionSink&& other) noexcept {
        if (this != &other) {
            abandon();
            channel_ = std::move(other.channel_);
            resolved_ = std::exchange(other.resolved_, true);
        }
        return *this;
    }

    Future get_future() const { return Future{channel_}; }

    void set_value(T value) { resolve(nullptr, std::move(value)); }

    void set_exception(std::exception_ptr ex_ptr) { resolve(std::move(ex_ptr), std::nullopt); }

    bool is_resolved() const { return resolved_; }

  private:
    void abandon() noexcept {
        if (channel_ && !resolved_) {
            resolved_ = true;
            channel_->try_send(std::make_exception_ptr(SinkAbandonedError{}), std::nullopt);
        }
    }

    void resolve(std::exception_ptr ex_ptr, std::optional<T> value) {
        if (resolved_) {
            throw SinkAlreadyResolvedError{};
        }
        resolved_ = true;
        // The outcome stays buffered until picked up, or is discarded along with the channel if nobody waits
        channel_->try_send(std::move(ex_ptr), std::move(value));
    }

    std::shared_ptr<AsyncChannel> channel_;
    bool resolved_{false};
};

}  // namespace ethrpc::concurrency
