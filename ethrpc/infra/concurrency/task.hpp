// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// Declared in the top-level namespace: every component returns Task<T> from its coroutines
namespace ethrpc {

//! Coroutine handle of any asynchronous operation, resumed on an asio executor
template <typename T, typename Executor = boost::asio::any_io_executor>
using Task = boost::asio::awaitable<T, Executor>;

}  // namespace ethrpc
