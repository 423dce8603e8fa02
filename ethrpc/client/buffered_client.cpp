// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "buffered_client.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include <ethrpc/client/shared_failure.hpp>
#include <ethrpc/infra/common/ensure.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/infra/concurrency/task_group.hpp>
#include <ethrpc/jsonrpc/batch.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

namespace ethrpc::client {

using namespace boost::asio::experimental::awaitable_operators;

static std::optional<std::size_t> effective_concurrency(const Transport* transport, const BufferedSettings& settings) {
    ensure(transport != nullptr, "BufferedClient: transport must not be null");
    ensure(settings.max_batch_size > 0, "BufferedClient: max_batch_size must be positive");
    ensure(!settings.max_concurrent_requests || *settings.max_concurrent_requests > 0,
           "BufferedClient: max_concurrent_requests must be positive");
    if (!transport->supports_concurrency()) {
        return 1;
    }
    return settings.max_concurrent_requests;
}

struct BufferedClient::State {
    State(const boost::asio::any_io_executor& executor_, std::shared_ptr<Transport> transport_, const BufferedSettings& settings_)
        : executor{executor_},
          max_concurrency{effective_concurrency(transport_.get(), settings_)},
          transport{std::move(transport_)},
          settings{settings_},
          queue{executor_},
          dispatches{executor_, max_concurrency} {}

    boost::asio::any_io_executor executor;
    std::optional<std::size_t> max_concurrency;
    std::shared_ptr<Transport> transport;
    BufferedSettings settings;
    //! Pending calls issued by any number of callers
    concurrency::Channel<std::unique_ptr<PendingCall>> queue;
    //! Chunks in flight, bounded by max_concurrency
    concurrency::TaskGroup dispatches;
};

BufferedClient::BufferedClient(const boost::asio::any_io_executor& executor,
                               std::shared_ptr<Transport> transport,
                               BufferedSettings settings)
    : state_{std::make_shared<State>(executor, std::move(transport), settings)} {
    boost::asio::co_spawn(executor, run(state_), [state = state_](const std::exception_ptr& ex) {
        if (!ex) return;
        state->queue.close();
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            ETHRPC_CRIT << "BufferedClient worker stopped unexpectedly: " << e.what();
        }
    });
}

BufferedClient::~BufferedClient() {
    close();
}

void BufferedClient::close() {
    state_->queue.close();
}

std::optional<std::size_t> BufferedClient::max_concurrent_requests() const {
    return state_->max_concurrency;
}

Task<jsonrpc::Response> BufferedClient::roundtrip(jsonrpc::Request request) {
    concurrency::CompletionSink<jsonrpc::Response> sink{state_->executor};
    auto future = sink.get_future();
    if (!state_->queue.try_send(std::make_unique<PendingCall>(PendingCall{std::move(request), std::move(sink)}))) {
        ETHRPC_CRIT << "BufferedClient: call issued after close";
        throw invariant_violation("buffered client used after close");
    }
    try {
        co_return co_await future.get();
    } catch (const concurrency::SinkAbandonedError& ex) {
        ETHRPC_CRIT << "BufferedClient: pending call dropped before resolution: " << ex.what();
        throw;
    }
}

Task<void> BufferedClient::run(std::shared_ptr<State> state) {
    std::exception_ptr failure;
    try {
        while (true) {
            auto chunk = co_await collect(*state);
            if (chunk.empty()) break;

            ETHRPC_TRACE_M("BufferedClient: chunk collected", {"calls", std::to_string(chunk.size())});
            co_await state->dispatches.spawn(dispatch(state, std::move(chunk)));
        }
    } catch (...) {
        failure = std::current_exception();
    }
    // Chunks already handed to the transport are always awaited before the worker stops
    co_await state->dispatches.wait();
    if (failure) {
        std::rethrow_exception(failure);
    }
    ETHRPC_DEBUG << "BufferedClient: queue closed and drained, worker stopped";
}

Task<BufferedClient::Chunk> BufferedClient::collect(State& state) {
    Chunk chunk;
    const auto max_size = state.settings.max_batch_size;

    bool closed{false};
    std::unique_ptr<PendingCall> first;
    try {
        first = co_await state.queue.receive();
    } catch (const boost::system::system_error& ex) {
        if (!concurrency::is_channel_closed(ex)) throw;
        closed = true;
    }
    if (closed) co_return chunk;
    chunk.push_back(std::move(*first));

    if (state.settings.coalescing_delay.count() == 0) {
        while (chunk.size() < max_size) {
            auto call = state.queue.try_receive();
            if (!call) break;
            chunk.push_back(std::move(**call));
        }
        co_return chunk;
    }

    boost::asio::steady_timer deadline{state.executor};
    deadline.expires_after(state.settings.coalescing_delay);
    while (chunk.size() < max_size) {
        if (auto call = state.queue.try_receive()) {
            chunk.push_back(std::move(**call));
            continue;
        }
        if (!state.queue.is_open()) break;

        std::unique_ptr<PendingCall> received;
        bool expired{false};
        try {
            const auto winner = co_await (receive_into(state, received) || deadline.async_wait(boost::asio::use_awaitable));
            expired = winner.index() == 1;
        } catch (const boost::system::system_error& ex) {
            if (!concurrency::is_channel_closed(ex)) throw;
            closed = true;
        }
        // A call received while the deadline expired still belongs to this chunk
        if (received) {
            chunk.push_back(std::move(*received));
        }
        if (expired || closed) break;
    }
    co_return chunk;
}

Task<void> BufferedClient::receive_into(State& state, std::unique_ptr<PendingCall>& call) {
    call = co_await state.queue.receive();
}

Task<void> BufferedClient::dispatch(std::shared_ptr<State> state, Chunk chunk) {
    auto roundtrip = [transport = state->transport](std::string body) { return transport->roundtrip(std::move(body)); };

    std::exception_ptr failure;
    try {
        if (chunk.size() == 1) {
            auto response = co_await jsonrpc::roundtrip_request_async(chunk.front().request, roundtrip);
            chunk.front().sink.set_value(std::move(response));
        } else {
            std::vector<jsonrpc::Request> requests;
            requests.reserve(chunk.size());
            for (const auto& call : chunk) {
                requests.push_back(call.request);
            }
            auto responses = co_await jsonrpc::batch::detail::try_call_raw_async(std::move(requests), roundtrip);
            for (std::size_t i{0}; i < chunk.size(); ++i) {
                chunk[i].sink.set_value(std::move(responses[i]));
            }
        }
        ETHRPC_TRACE_M("BufferedClient: chunk dispatched", {"calls", std::to_string(chunk.size())});
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure) {
        fail(chunk, failure);
    }
}

void BufferedClient::fail(Chunk& chunk, std::exception_ptr cause) {
    // A single call has nothing to share its failure with: it observes the cause unchanged
    if (chunk.size() == 1) {
        if (!chunk.front().sink.is_resolved()) {
            chunk.front().sink.set_exception(std::move(cause));
        }
        return;
    }

    const SharedFailure shared{std::move(cause)};
    ETHRPC_WARN_M("BufferedClient: chunk failed", {"calls", std::to_string(chunk.size()), "error", shared.message()});
    for (auto& call : chunk) {
        if (!call.sink.is_resolved()) {
            call.sink.set_exception(shared.duplicate());
        }
    }
}

}  // namespace ethrpc::client
