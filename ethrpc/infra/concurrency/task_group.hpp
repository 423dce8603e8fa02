// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>

#include <ethrpc/infra/concurrency/channel.hpp>
#include <ethrpc/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace ethrpc::concurrency {

/**
 * Tracked dynamic spawn with an optional bound on the number of running tasks.
 *
 * Works like co_spawn(detached) but keeps count of the spawned tasks: spawn suspends while the
 * group is full, and wait closes the group and resumes only once every spawned task has completed.
 * Unlike a parallel_group the set of tasks is not fixed upfront.
 *
 * \code
 * TaskGroup group{executor, 4};
 * while (auto job = co_await next_job()) {
 *     co_await group.spawn(process(std::move(*job)));
 * }
 * co_await group.wait();
 * \endcode
 */
class TaskGroup {
  public:
    //! \param max_tasks limit on running tasks, no limit if empty
    TaskGroup(const boost::asio::any_io_executor& executor, std::optional<std::size_t> max_tasks);

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    class SpawnAfterCloseError : public std::logic_error {
      public:
        SpawnAfterCloseError() : std::logic_error("TaskGroup cannot spawn after wait started") {}
    };

    //! Suspend until the group has room, then start the task on the group executor
    Task<void> spawn(Task<void> task);

    //! Stop accepting tasks and wait for the running ones: rethrows the first task failure, if any
    Task<void> wait();

    //! Number of tasks spawned and not yet collected by wait
    std::size_t size() const;

  private:
    void on_complete(std::exception_ptr ex);

    boost::asio::any_io_executor executor_;
    std::optional<std::size_t> max_tasks_;
    mutable std::mutex mutex_;
    bool closed_{false};
    std::size_t running_{0};
    //! One buffered item per running task, used only when the group is bounded
    Channel<bool> slots_;
    Channel<std::exception_ptr> completions_;
};

}  // namespace ethrpc::concurrency
