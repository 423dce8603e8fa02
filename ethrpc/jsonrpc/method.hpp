// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::jsonrpc {

//! A method descriptor binds one wire name to the shapes of its params and result
template <typename M>
concept Method = requires(const M& method,
                          const nlohmann::json& json,
                          const typename M::Params& params,
                          const typename M::Result& result) {
    { method.name() } -> std::convertible_to<std::string_view>;
    { M::serialize_params(params) } -> std::same_as<nlohmann::json>;
    { M::deserialize_params(json) } -> std::same_as<typename M::Params>;
    { M::serialize_result(result) } -> std::same_as<nlohmann::json>;
    { M::deserialize_result(json) } -> std::same_as<typename M::Result>;
};

//! Default codec hooks relying on the nlohmann to_json/from_json conversions of the shapes
template <typename P, typename R>
struct MethodBase {
    using Params = P;
    using Result = R;

    static nlohmann::json serialize_params(const Params& params) { return params; }
    static Params deserialize_params(const nlohmann::json& json) { return json.get<Params>(); }
    static nlohmann::json serialize_result(const Result& result) { return result; }
    static Result deserialize_result(const nlohmann::json& json) { return json.get<Result>(); }
};

//! Declare a method descriptor with fixed wire name
//! \warning params and result shapes with commas must be aliased before use
#define ETHRPC_METHOD(type, wire_name, params, result)                \
    struct type : public ::ethrpc::jsonrpc::MethodBase<params, result> { \
        static constexpr std::string_view kName{wire_name};           \
        std::string_view name() const { return kName; }               \
    }

//! Method named at runtime, with params and result left as opaque values
struct DynamicMethod : public MethodBase<Value, Value> {
    std::string method;

    explicit DynamicMethod(std::string name) : method{std::move(name)} {}
    std::string_view name() const { return method; }
};

//! Parameter shape of methods accepting no params, always encoded as an empty array
struct Empty {
    friend bool operator==(const Empty&, const Empty&) = default;
};

void to_json(nlohmann::json& json, const Empty& empty);
void from_json(const nlohmann::json& json, Empty& empty);

}  // namespace ethrpc::jsonrpc
