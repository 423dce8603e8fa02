// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

namespace ethrpc::jsonrpc {

std::string to_string(const ErrorCode& code) {
    switch (code.kind()) {
        case ErrorCode::Kind::kParseError:
            return "parse error";
        case ErrorCode::Kind::kInvalidRequest:
            return "invalid request";
        case ErrorCode::Kind::kMethodNotFound:
            return "method not found";
        case ErrorCode::Kind::kInvalidParams:
            return "invalid params";
        case ErrorCode::Kind::kInternalError:
            return "internal error";
        case ErrorCode::Kind::kServerError:
            return "server error (" + std::to_string(code.to_int()) + ")";
        case ErrorCode::Kind::kReserved:
            return "reserved (" + std::to_string(code.to_int()) + ")";
        case ErrorCode::Kind::kOther:
            break;
    }
    return std::to_string(code.to_int());
}

std::ostream& operator<<(std::ostream& out, const ErrorCode& code) {
    out << to_string(code);
    return out;
}

Error Error::custom(std::string message) {
    return Error{.code = ErrorCode{ErrorCode::kServerErrorMax}, .message = std::move(message), .data = {}};
}

std::ostream& operator<<(std::ostream& out, const Error& error) {
    out << error.code << ": " << error.message;
    return out;
}

void to_json(nlohmann::json& json, const ErrorCode& code) {
    json = code.to_int();
}

void from_json(const nlohmann::json& json, ErrorCode& code) {
    if (!json.is_number_integer()) {
        throw JsonError{"invalid JSON RPC error code: " + json.dump()};
    }
    const auto value = json.get<int64_t>();
    if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
        throw JsonError{"JSON RPC error code out of range: " + json.dump()};
    }
    code = ErrorCode{static_cast<int32_t>(value)};
}

void to_json(nlohmann::json& json, const Error& error) {
    json = {{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
        json["data"] = error.data;
    }
}

void from_json(const nlohmann::json& json, Error& error) {
    if (!json.is_object()) {
        throw JsonError{"invalid JSON RPC error: " + json.dump()};
    }
    for (const auto& [key, _] : json.items()) {
        if (key != "code" && key != "message" && key != "data") {
            throw JsonError{"unknown field '" + key + "' in JSON RPC error"};
        }
    }
    if (!json.contains("code") || !json.contains("message")) {
        throw JsonError{"missing 'code' or 'message' field in JSON RPC error"};
    }
    error.code = json.at("code").get<ErrorCode>();
    error.message = json.at("message").get<std::string>();
    error.data = json.contains("data") ? Value{json.at("data")} : Value{};
}

static std::string make_message(const Error& error) {
    std::stringstream out;
    out << error;
    return out.str();
}

RpcError::RpcError(Error error) : std::runtime_error{make_message(error)}, error_{std::move(error)} {}

}  // namespace ethrpc::jsonrpc
