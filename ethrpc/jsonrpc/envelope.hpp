// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <ethrpc/jsonrpc/error.hpp>
#include <ethrpc/jsonrpc/id.hpp>
#include <ethrpc/jsonrpc/method.hpp>
#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::jsonrpc {

//! JSON RPC protocol version: only "2.0" is supported
struct Version {
    static constexpr std::string_view kV2{"2.0"};

    friend bool operator==(const Version&, const Version&) = default;
};

void to_json(nlohmann::json& json, const Version& version);
void from_json(const nlohmann::json& json, Version& version);

//! A request object, whose id is always allocated here
struct Request {
    Version jsonrpc;
    std::string method;
    Value params;
    Id id;

    template <Method M>
    static Request make(const M& method, const typename M::Params& params) {
        return Request{
            .jsonrpc = {},
            .method = std::string{method.name()},
            .params = Value::for_params<M>(params),
            .id = Id::next(),
        };
    }

    //! Serialize into JSON text
    std::string dump() const;
};

void to_json(nlohmann::json& json, const Request& request);
void from_json(const nlohmann::json& json, Request& request);

//! A request object without id: no response is expected
struct Notification {
    Version jsonrpc;
    std::string method;
    Value params;

    template <Method M>
    static Notification make(const M& method, const typename M::Params& params) {
        return Notification{.jsonrpc = {}, .method = std::string{method.name()}, .params = Value::for_params<M>(params)};
    }
};

void to_json(nlohmann::json& json, const Notification& notification);
void from_json(const nlohmann::json& json, Notification& notification);

//! A response object carrying either a result or an error
struct Response {
    Version jsonrpc;
    tl::expected<Value, Error> result;
    //! Absent when the peer could not determine the request id
    std::optional<Id> id;

    //! Parse from JSON text, throwing JsonError on malformed input
    static Response parse(std::string_view text);

    //! Decode the result into the method result shape: codec failures throw JsonError
    template <Method M>
    tl::expected<typename M::Result, Error> decode() const {
        if (!result) {
            return tl::make_unexpected(result.error());
        }
        return result->template result<M>();
    }

    std::string dump() const;
};

void to_json(nlohmann::json& json, const Response& response);
void from_json(const nlohmann::json& json, Response& response);

}  // namespace ethrpc::jsonrpc
