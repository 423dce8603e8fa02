// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "envelope.hpp"

#include <initializer_list>

namespace ethrpc::jsonrpc {

namespace {

    void reject_unknown_fields(const nlohmann::json& json, std::initializer_list<std::string_view> fields, std::string_view what) {
        for (const auto& [key, _] : json.items()) {
            bool known{false};
            for (const auto field : fields) {
                if (key == field) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                throw JsonError{"unknown field '" + key + "' in JSON RPC " + std::string{what}};
            }
        }
    }

    const nlohmann::json& required_field(const nlohmann::json& json, const char* field, std::string_view what) {
        const auto it = json.find(field);
        if (it == json.end()) {
            throw JsonError{"missing field '" + std::string{field} + "' in JSON RPC " + std::string{what}};
        }
        return *it;
    }

    void expect_object(const nlohmann::json& json, std::string_view what) {
        if (!json.is_object()) {
            throw JsonError{"invalid JSON RPC " + std::string{what} + ": " + json.dump()};
        }
    }

    std::string dump_json(const nlohmann::json& json) {
        try {
            return json.dump();
        } catch (const nlohmann::json::exception& e) {
            throw JsonError{e.what()};
        }
    }

}  // namespace

void to_json(nlohmann::json& json, const Version& /*version*/) {
    json = std::string{Version::kV2};
}

void from_json(const nlohmann::json& json, Version& /*version*/) {
    if (!json.is_string() || json.get<std::string>() != Version::kV2) {
        throw JsonError{"unsupported JSON RPC version: " + json.dump()};
    }
}

std::string Request::dump() const {
    return dump_json(*this);
}

void to_json(nlohmann::json& json, const Request& request) {
    json = {
        {"jsonrpc", request.jsonrpc},
        {"method", request.method},
        {"params", request.params},
        {"id", request.id},
    };
}

void from_json(const nlohmann::json& json, Request& request) {
    expect_object(json, "request");
    reject_unknown_fields(json, {"jsonrpc", "method", "params", "id"}, "request");
    request.jsonrpc = required_field(json, "jsonrpc", "request").get<Version>();
    request.method = required_field(json, "method", "request").get<std::string>();
    request.params = required_field(json, "params", "request").get<Value>();
    request.id = required_field(json, "id", "request").get<Id>();
}

void to_json(nlohmann::json& json, const Notification& notification) {
    json = {
        {"jsonrpc", notification.jsonrpc},
        {"method", notification.method},
        {"params", notification.params},
    };
}

void from_json(const nlohmann::json& json, Notification& notification) {
    expect_object(json, "notification");
    reject_unknown_fields(json, {"jsonrpc", "method", "params"}, "notification");
    notification.jsonrpc = required_field(json, "jsonrpc", "notification").get<Version>();
    notification.method = required_field(json, "method", "notification").get<std::string>();
    notification.params = required_field(json, "params", "notification").get<Value>();
}

Response Response::parse(std::string_view text) {
    const auto value = Value::parse(text);
    try {
        return value.json().get<Response>();
    } catch (const nlohmann::json::exception& e) {
        throw JsonError{e.what()};
    }
}

std::string Response::dump() const {
    return dump_json(*this);
}

void to_json(nlohmann::json& json, const Response& response) {
    json = {{"jsonrpc", response.jsonrpc}};
    if (response.result) {
        json["result"] = *response.result;
    } else {
        json["error"] = response.result.error();
    }
    if (response.id) {
        json["id"] = *response.id;
    }
}

void from_json(const nlohmann::json& json, Response& response) {
    expect_object(json, "response");
    reject_unknown_fields(json, {"jsonrpc", "result", "error", "id"}, "response");
    response.jsonrpc = required_field(json, "jsonrpc", "response").get<Version>();

    // Some auto-mining nodes send both 'result' and 'error': the result wins
    if (const auto result = json.find("result"); result != json.end()) {
        response.result = result->get<Value>();
    } else if (const auto error = json.find("error"); error != json.end()) {
        response.result = tl::make_unexpected(error->get<Error>());
    } else {
        throw JsonError{"missing 'result' or 'error' field"};
    }

    const auto id = json.find("id");
    if (id == json.end() || id->is_null()) {
        response.id = std::nullopt;
    } else {
        response.id = id->get<Id>();
    }
}

}  // namespace ethrpc::jsonrpc
