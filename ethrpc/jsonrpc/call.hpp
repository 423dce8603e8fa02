// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <string>
#include <utility>

#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/jsonrpc/envelope.hpp>
#include <ethrpc/jsonrpc/error.hpp>
#include <ethrpc/jsonrpc/method.hpp>

namespace ethrpc::jsonrpc {

//! Blocking round trip: sends one serialized request body and returns the serialized response body
template <typename F>
concept Roundtrip = std::invocable<F, std::string> && std::convertible_to<std::invoke_result_t<F, std::string>, std::string>;

//! Asynchronous round trip: same as Roundtrip but suspending until the response body is available
template <typename F>
concept AsyncRoundtrip = std::invocable<F, std::string> && std::same_as<std::invoke_result_t<F, std::string>, Task<std::string>>;

//! Send one request through the round trip and decode the response envelope
template <Roundtrip F>
Response roundtrip_request(const Request& request, F&& roundtrip) {
    const std::string body = std::forward<F>(roundtrip)(request.dump());
    return Response::parse(body);
}

template <AsyncRoundtrip F>
Task<Response> roundtrip_request_async(Request request, F roundtrip) {
    const std::string body = co_await roundtrip(request.dump());
    co_return Response::parse(body);
}

//! Extract the typed result from the response, throwing RpcError if the peer rejected the call
template <Method M>
typename M::Result unwrap_result(const Response& response) {
    auto result = response.decode<M>();
    if (!result) {
        throw RpcError{std::move(result.error())};
    }
    return std::move(*result);
}

/**
 * Execute one JSON RPC call through the provided round trip.
 * Codec failures throw JsonError, remote rejections throw RpcError, round trip exceptions propagate unchanged.
 */
template <Method M, Roundtrip F>
typename M::Result call(const M& method, const typename M::Params& params, F&& roundtrip) {
    const auto request = Request::make(method, params);
    return unwrap_result<M>(roundtrip_request(request, std::forward<F>(roundtrip)));
}

//! Asynchronous version of call
template <Method M, AsyncRoundtrip F>
Task<typename M::Result> call_async(M method, typename M::Params params, F roundtrip) {
    auto request = Request::make(method, params);
    const auto response = co_await roundtrip_request_async(std::move(request), std::move(roundtrip));
    co_return unwrap_result<M>(response);
}

}  // namespace ethrpc::jsonrpc
