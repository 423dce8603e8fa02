// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "value.hpp"

#include <ostream>

namespace ethrpc::jsonrpc {

Value Value::parse(std::string_view text) {
    return with([&]() { return Value{nlohmann::json::parse(text)}; });
}

std::string Value::dump() const {
    return with([&]() { return json_.dump(); });
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
    out << value.dump();
    return out;
}

void to_json(nlohmann::json& json, const Value& value) {
    json = value.json();
}

void from_json(const nlohmann::json& json, Value& value) {
    value = Value{json};
}

}  // namespace ethrpc::jsonrpc
