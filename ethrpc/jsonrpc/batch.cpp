// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "batch.hpp"

#include <algorithm>
#include <numeric>

#include <nlohmann/json.hpp>

#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::jsonrpc::batch {

std::string encode_requests(const std::vector<Request>& requests) {
    std::string body{"["};
    for (std::size_t i{0}; i < requests.size(); ++i) {
        if (i > 0) {
            body += ',';
        }
        body += requests[i].dump();
    }
    body += ']';
    return body;
}

std::vector<Response> decode_responses(std::string_view body) {
    const auto value = Value::parse(body);
    if (!value.json().is_array()) {
        throw JsonError{"invalid JSON RPC batch response: " + value.dump()};
    }
    try {
        return value.json().get<std::vector<Response>>();
    } catch (const nlohmann::json::exception& e) {
        throw JsonError{e.what()};
    }
}

std::vector<Response> correlate(const std::vector<Id>& ids, std::vector<Response> responses) {
    if (ids.size() != responses.size()) {
        ETHRPC_WARN << "batch correlation failed: requests=" << ids.size() << " responses=" << responses.size();
        throw BatchError{};
    }
    if (std::any_of(responses.cbegin(), responses.cend(), [](const auto& r) { return !r.id; })) {
        ETHRPC_WARN << "batch correlation failed: response without id";
        throw BatchError{};
    }

    // Request positions ordered by id: ids are allocated monotonically, but concurrent callers may enqueue out of order
    std::vector<std::size_t> positions(ids.size());
    std::iota(positions.begin(), positions.end(), 0);
    std::sort(positions.begin(), positions.end(), [&](std::size_t lhs, std::size_t rhs) { return ids[lhs] < ids[rhs]; });
    const auto duplicate = std::adjacent_find(positions.cbegin(), positions.cend(),
                                              [&](std::size_t lhs, std::size_t rhs) { return ids[lhs] == ids[rhs]; });
    if (duplicate != positions.cend()) {
        ETHRPC_WARN << "batch correlation failed: duplicate request id=" << ids[*duplicate];
        throw BatchError{};
    }

    std::sort(responses.begin(), responses.end(), [](const Response& lhs, const Response& rhs) { return *lhs.id < *rhs.id; });

    std::vector<Response> ordered(responses.size());
    for (std::size_t i{0}; i < responses.size(); ++i) {
        const auto position = positions[i];
        if (*responses[i].id != ids[position]) {
            ETHRPC_WARN << "batch correlation failed: unexpected response id=" << *responses[i].id;
            throw BatchError{};
        }
        ordered[position] = std::move(responses[i]);
    }
    return ordered;
}

}  // namespace ethrpc::jsonrpc::batch
