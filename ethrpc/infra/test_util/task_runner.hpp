// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <ethrpc/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace ethrpc::test_util {

/**
 * Single-threaded io_context driving coroutines from test code.
 * Tests either run one task to completion or spawn several and drive them one by one, which lets
 * concurrent callers meet inside the same buffered client.
 */
class TaskRunner {
  public:
    TaskRunner() = default;
    virtual ~TaskRunner() = default;

    template <typename T>
    T run(Task<T> task) {
        auto future = spawn(std::move(task));
        drive_until_ready(future);
        return future.get();
    }

    //! Schedule the task without driving the context
    template <typename T>
    std::future<T> spawn(Task<T> task) {
        return boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    //! Execute ready handlers one at a time until the future holds a value or an exception
    template <typename T>
    void drive_until_ready(std::future<T>& future) {
        ioc_.restart();
        while (future.wait_for(std::chrono::seconds::zero()) != std::future_status::ready) {
            ioc_.poll_one();
        }
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  protected:
    boost::asio::io_context ioc_;
};

}  // namespace ethrpc::test_util
