// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "task_group.hpp"

#include <utility>

#include <boost/asio/co_spawn.hpp>

#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::concurrency {

TaskGroup::TaskGroup(const boost::asio::any_io_executor& executor, std::optional<std::size_t> max_tasks)
    : executor_{executor},
      max_tasks_{max_tasks},
      slots_{executor, max_tasks.value_or(1)},
      completions_{executor} {}

Task<void> TaskGroup::spawn(Task<void> task) {
    {
        std::scoped_lock lock{mutex_};
        if (closed_) throw SpawnAfterCloseError{};
    }
    if (max_tasks_) {
        co_await slots_.send(true);
    }
    {
        std::scoped_lock lock{mutex_};
        if (closed_) {
            if (max_tasks_) slots_.try_receive();
            throw SpawnAfterCloseError{};
        }
        ++running_;
    }
    boost::asio::co_spawn(executor_, std::move(task), [this](std::exception_ptr ex) { on_complete(std::move(ex)); });
}

Task<void> TaskGroup::wait() {
    {
        std::scoped_lock lock{mutex_};
        closed_ = true;
    }
    std::exception_ptr first_failure;
    while (size() > 0) {
        auto ex = co_await completions_.receive();
        {
            std::scoped_lock lock{mutex_};
            --running_;
        }
        if (ex && !first_failure) {
            first_failure = std::move(ex);
        }
    }
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

std::size_t TaskGroup::size() const {
    std::scoped_lock lock{mutex_};
    return running_;
}

void TaskGroup::on_complete(std::exception_ptr ex) {
    if (max_tasks_) {
        slots_.try_receive();
    }
    if (!completions_.try_send(std::move(ex))) {
        ETHRPC_CRIT << "TaskGroup: completion lost, waiter will not resume";
    }
}

}  // namespace ethrpc::concurrency
