// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/jsonrpc/call.hpp>
#include <ethrpc/jsonrpc/envelope.hpp>
#include <ethrpc/jsonrpc/error.hpp>
#include <ethrpc/jsonrpc/id.hpp>
#include <ethrpc/jsonrpc/method.hpp>

namespace ethrpc::jsonrpc::batch {

//! The batch response does not structurally match the batch request (count or id mismatch)
class BatchError : public std::runtime_error {
  public:
    BatchError() : std::runtime_error{"JSON RPC batch responses do not match requests"} {}
};

//! Serialize the requests as one JSON array
std::string encode_requests(const std::vector<Request>& requests);

//! Parse a JSON array of responses: a non-array body is a JsonError
std::vector<Response> decode_responses(std::string_view body);

/**
 * Pair the responses with the request ids, returning the responses in request order.
 * Responses are sorted by id and matched against the sorted request ids: any count mismatch,
 * duplicate request id, missing id or unknown id throws BatchError.
 */
std::vector<Response> correlate(const std::vector<Id>& ids, std::vector<Response> responses);

//! Per-batch-shape operations, specialized for tuples and vectors of (method, params) pairs
template <typename B>
struct BatchTraits;

//! Heterogeneous batch of fixed arity
template <Method... Ms>
struct BatchTraits<std::tuple<std::pair<Ms, typename Ms::Params>...>> {
    using Batch = std::tuple<std::pair<Ms, typename Ms::Params>...>;
    using Results = std::tuple<tl::expected<typename Ms::Result, Error>...>;
    using Values = std::tuple<typename Ms::Result...>;

    static std::vector<Request> requests(const Batch& batch) {
        // Braced initialization evaluates in order, so ids increase along the batch
        return std::apply(
            [](const auto&... call) { return std::vector<Request>{Request::make(call.first, call.second)...}; },
            batch);
    }

    static Results results(const std::vector<Response>& responses) {
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return Results{responses[I].template decode<Ms>()...};
        }(std::index_sequence_for<Ms...>{});
    }

    static Values values(Results results) {
        return std::apply(
            [](auto&... result) { return Values{unwrap(std::move(result))...}; },
            results);
    }

  private:
    template <typename R>
    static R unwrap(tl::expected<R, Error>&& result) {
        if (!result) {
            throw RpcError{std::move(result.error())};
        }
        return std::move(*result);
    }
};

//! Homogeneous batch of dynamic size
template <Method M>
struct BatchTraits<std::vector<std::pair<M, typename M::Params>>> {
    using Batch = std::vector<std::pair<M, typename M::Params>>;
    using Results = std::vector<tl::expected<typename M::Result, Error>>;
    using Values = std::vector<typename M::Result>;

    static std::vector<Request> requests(const Batch& batch) {
        std::vector<Request> requests;
        requests.reserve(batch.size());
        for (const auto& [method, params] : batch) {
            requests.push_back(Request::make(method, params));
        }
        return requests;
    }

    static Results results(const std::vector<Response>& responses) {
        Results results;
        results.reserve(responses.size());
        for (const auto& response : responses) {
            results.push_back(response.decode<M>());
        }
        return results;
    }

    static Values values(Results results) {
        Values values;
        values.reserve(results.size());
        for (auto& result : results) {
            if (!result) {
                throw RpcError{std::move(result.error())};
            }
            values.push_back(std::move(*result));
        }
        return values;
    }
};

template <typename B>
concept Batch = requires { typename BatchTraits<B>::Results; };

namespace detail {

    //! Execute requests built by this engine as one batch, returning the responses in request order
    template <Roundtrip F>
    std::vector<Response> try_call_raw(std::vector<Request> requests, F&& roundtrip) {
        if (requests.empty()) {
            return {};
        }
        std::vector<Id> ids;
        ids.reserve(requests.size());
        for (const auto& request : requests) {
            ids.push_back(request.id);
        }
        const std::string body = std::forward<F>(roundtrip)(encode_requests(requests));
        return correlate(ids, decode_responses(body));
    }

    template <AsyncRoundtrip F>
    Task<std::vector<Response>> try_call_raw_async(std::vector<Request> requests, F roundtrip) {
        if (requests.empty()) {
            co_return std::vector<Response>{};
        }
        std::vector<Id> ids;
        ids.reserve(requests.size());
        for (const auto& request : requests) {
            ids.push_back(request.id);
        }
        const std::string body = co_await roundtrip(encode_requests(requests));
        co_return correlate(ids, decode_responses(body));
    }

}  // namespace detail

/**
 * Execute a batch of JSON RPC calls through the provided round trip.
 * Returns one outcome per call in submission order, so that each call error can be handled separately.
 * Round trip failures, codec failures and BatchError fail the whole batch.
 */
template <Batch B, Roundtrip F>
typename BatchTraits<B>::Results try_call(const B& batch, F&& roundtrip) {
    auto responses = detail::try_call_raw(BatchTraits<B>::requests(batch), std::forward<F>(roundtrip));
    return BatchTraits<B>::results(responses);
}

template <Batch B, AsyncRoundtrip F>
Task<typename BatchTraits<B>::Results> try_call_async(B batch, F roundtrip) {
    auto responses = co_await detail::try_call_raw_async(BatchTraits<B>::requests(batch), std::move(roundtrip));
    co_return BatchTraits<B>::results(responses);
}

//! Execute a batch of JSON RPC calls, throwing RpcError for the first failed call in submission order
template <Batch B, Roundtrip F>
typename BatchTraits<B>::Values call(const B& batch, F&& roundtrip) {
    return BatchTraits<B>::values(try_call(batch, std::forward<F>(roundtrip)));
}

template <Batch B, AsyncRoundtrip F>
Task<typename BatchTraits<B>::Values> call_async(B batch, F roundtrip) {
    auto results = co_await try_call_async(std::move(batch), std::move(roundtrip));
    co_return BatchTraits<B>::values(std::move(results));
}

}  // namespace ethrpc::jsonrpc::batch
