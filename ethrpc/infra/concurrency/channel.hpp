// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <utility>

#include <ethrpc/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace ethrpc::concurrency {

//! Whether the error reports an operation on a closed (and drained) channel
inline bool is_channel_closed(const boost::system::system_error& ex) {
    return ex.code() == boost::asio::experimental::error::channel_closed;
}

//! Thread-safe FIFO of values with an optional capacity.
//! Closing keeps buffered values receivable: receive fails with channel_closed only once drained.
//! Cancellation surfaces as errc::operation_canceled like any other asio operation.
template <typename T>
class Channel {
  public:
    static constexpr std::size_t kUnbounded{std::numeric_limits<std::size_t>::max()};

    explicit Channel(const boost::asio::any_io_executor& executor, std::size_t capacity = kUnbounded)
        : impl_{executor, capacity} {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    //! Suspend while the channel is full
    Task<void> send(T value) {
        boost::system::error_code ec;
        co_await impl_.async_send(boost::system::error_code{}, std::move(value), redirect(ec));
        check(ec);
    }

    //! Buffer the value unless the channel is full or closed
    bool try_send(T value) {
        return impl_.try_send(boost::system::error_code{}, std::move(value));
    }

    //! Suspend while the channel is empty and open
    Task<T> receive() {
        boost::system::error_code ec;
        T value = co_await impl_.async_receive(redirect(ec));
        check(ec);
        co_return value;
    }

    //! Take a buffered value if there is one, never suspending
    std::optional<T> try_receive() {
        std::optional<T> value;
        boost::system::error_code ec;
        impl_.try_receive([&](const boost::system::error_code& error, T&& received) {
            ec = error;
            if (!error) value.emplace(std::move(received));
        });
        if (ec != boost::asio::experimental::error::channel_closed) {
            check(ec);
        }
        return value;
    }

    bool is_open() const { return impl_.is_open(); }

    void close() { impl_.close(); }

  private:
    using Impl = boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)>;

    static auto redirect(boost::system::error_code& ec) {
        return boost::asio::redirect_error(boost::asio::use_awaitable, ec);
    }

    static void check(const boost::system::error_code& ec) {
        if (!ec) return;
        if (ec == boost::asio::experimental::error::channel_cancelled) {
            throw boost::system::system_error{make_error_code(boost::system::errc::operation_canceled)};
        }
        throw boost::system::system_error{ec};
    }

    Impl impl_;
};

}  // namespace ethrpc::concurrency
