// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "id.hpp"

#include <atomic>
#include <limits>
#include <ostream>

#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::jsonrpc {

Id Id::next() {
    static std::atomic_uint32_t counter{0};
    return Id{counter.fetch_add(1, std::memory_order_relaxed)};
}

std::ostream& operator<<(std::ostream& out, const Id& id) {
    out << id.value;
    return out;
}

void to_json(nlohmann::json& json, const Id& id) {
    json = id.value;
}

void from_json(const nlohmann::json& json, Id& id) {
    if (!json.is_number_unsigned() || json.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw JsonError{"invalid JSON RPC id: " + json.dump()};
    }
    id.value = json.get<uint32_t>();
}

}  // namespace ethrpc::jsonrpc
