// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "method.hpp"

namespace ethrpc::jsonrpc {

void to_json(nlohmann::json& json, const Empty& /*empty*/) {
    json = nlohmann::json::array();
}

void from_json(const nlohmann::json& json, Empty& /*empty*/) {
    if (!json.is_array() || !json.empty()) {
        throw JsonError{"expected empty params array but got " + json.dump()};
    }
}

}  // namespace ethrpc::jsonrpc
