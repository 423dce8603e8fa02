// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

#include <ethrpc/jsonrpc/method.hpp>

namespace ethrpc::jsonrpc::test_util {

using BlockParams = std::tuple<std::string, bool>;

ETHRPC_METHOD(BlockNumber, "eth_blockNumber", Empty, std::string);
ETHRPC_METHOD(ChainId, "eth_chainId", Empty, std::string);
ETHRPC_METHOD(GetBlockByNumber, "eth_getBlockByNumber", BlockParams, nlohmann::json);
ETHRPC_METHOD(Echo, "test_echo", std::vector<uint64_t>, std::vector<uint64_t>);
//! Method whose result shape never matches what the node answers
ETHRPC_METHOD(BadResult, "eth_blockNumber", Empty, std::vector<int>);

/**
 * In-process node answering JSON RPC request bodies, either single requests or batches.
 * It records every received body and can shuffle batch responses to exercise correlation.
 */
class FakeNode {
  public:
    static constexpr const char* kBlockNumber{"0x10"};
    static constexpr const char* kChainId{"0x1"};

    //! Answer batches in reverse order
    bool reverse_batches{false};

    std::string handle(const std::string& body) {
        record(body);
        const auto request = nlohmann::json::parse(body);
        if (!request.is_array()) {
            return answer(request).dump();
        }
        auto responses = nlohmann::json::array();
        for (const auto& item : request) {
            responses.push_back(answer(item));
        }
        if (reverse_batches) {
            std::reverse(responses.begin(), responses.end());
        }
        return responses.dump();
    }

    std::size_t roundtrip_count() const {
        std::scoped_lock lock{mutex_};
        return bodies_.size();
    }

    std::vector<std::string> bodies() const {
        std::scoped_lock lock{mutex_};
        return bodies_;
    }

    //! Number of calls carried by each received body: 0 for a single, non-batched request
    std::vector<std::size_t> batch_sizes() const {
        std::vector<std::size_t> sizes;
        for (const auto& body : bodies()) {
            const auto request = nlohmann::json::parse(body);
            sizes.push_back(request.is_array() ? request.size() : 0);
        }
        return sizes;
    }

    static nlohmann::json answer(const nlohmann::json& request) {
        nlohmann::json response{{"jsonrpc", "2.0"}, {"id", request.at("id")}};
        const auto method = request.at("method").get<std::string>();
        if (method == BlockNumber::kName) {
            response["result"] = kBlockNumber;
        } else if (method == ChainId::kName) {
            response["result"] = kChainId;
        } else if (method == GetBlockByNumber::kName) {
            const auto& params = request.at("params");
            response["result"] = {{"number", params.at(0)}, {"hydrated", params.at(1)}};
        } else if (method == Echo::kName) {
            response["result"] = request.at("params");
        } else {
            response["error"] = {{"code", -32601}, {"message", "the method " + method + " does not exist/is not available"}};
        }
        return response;
    }

  private:
    void record(const std::string& body) {
        std::scoped_lock lock{mutex_};
        bodies_.push_back(body);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> bodies_;
};

}  // namespace ethrpc::jsonrpc::test_util
