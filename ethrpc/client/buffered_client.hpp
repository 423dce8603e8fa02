// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <ethrpc/client/settings.hpp>
#include <ethrpc/client/transport.hpp>
#include <ethrpc/infra/concurrency/channel.hpp>
#include <ethrpc/infra/concurrency/completion_sink.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/jsonrpc/call.hpp>
#include <ethrpc/jsonrpc/envelope.hpp>
#include <ethrpc/jsonrpc/method.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace ethrpc::client {

/**
 * JSON RPC client coalescing concurrent calls into batches.
 *
 * Each call is queued as a pending call and awaited independently. One background worker owns the
 * transport: it collects queued calls into chunks bounded by size and coalescing delay, then sends
 * each chunk as a single request (one call) or as a batch (several calls). Chunks are dispatched
 * concurrently up to the configured limit, clamped to one for transports without concurrency support.
 * A chunk-wide failure is reported to every call in the chunk as a ChunkError sharing the root cause.
 */
class BufferedClient {
  public:
    BufferedClient(const boost::asio::any_io_executor& executor,
                   std::shared_ptr<Transport> transport,
                   BufferedSettings settings = {});
    ~BufferedClient();

    BufferedClient(const BufferedClient&) = delete;
    BufferedClient& operator=(const BufferedClient&) = delete;

    template <jsonrpc::Method M>
    Task<typename M::Result> call(M method, typename M::Params params) {
        auto response = co_await roundtrip(jsonrpc::Request::make(method, params));
        co_return jsonrpc::unwrap_result<M>(response);
    }

    template <jsonrpc::Method M>
        requires std::same_as<typename M::Params, jsonrpc::Empty>
    Task<typename M::Result> exec(M method) {
        return call(std::move(method), jsonrpc::Empty{});
    }

    //! Stop accepting calls: the ones already queued are still dispatched
    void close();

    //! Effective limit on chunks in flight, if any
    std::optional<std::size_t> max_concurrent_requests() const;

  private:
    //! Queue one request and wait for its response: each caller observes its own outcome only
    Task<jsonrpc::Response> roundtrip(jsonrpc::Request request);

    struct PendingCall {
        jsonrpc::Request request;
        concurrency::CompletionSink<jsonrpc::Response> sink;
    };
    using Chunk = std::vector<PendingCall>;

    struct State;

    static Task<void> run(std::shared_ptr<State> state);
    static Task<Chunk> collect(State& state);
    static Task<void> receive_into(State& state, std::unique_ptr<PendingCall>& call);
    static Task<void> dispatch(std::shared_ptr<State> state, Chunk chunk);
    static void fail(Chunk& chunk, std::exception_ptr cause);

    std::shared_ptr<State> state_;
};

}  // namespace ethrpc::client
