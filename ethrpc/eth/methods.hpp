// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <evmc/bytes.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/eth/hex.hpp>
#include <ethrpc/eth/types.hpp>
#include <ethrpc/jsonrpc/method.hpp>

namespace ethrpc::eth {

//! Methods whose result is a byte string encoded as 0x-prefixed hex
template <typename P>
struct BytesResultMethod : public jsonrpc::MethodBase<P, evmc::bytes> {
    static nlohmann::json serialize_result(const evmc::bytes& result) { return to_hex(result); }
    static evmc::bytes deserialize_result(const nlohmann::json& json) {
        if (!json.is_string()) {
            throw jsonrpc::JsonError{"expected hex bytes but got " + json.dump()};
        }
        return from_hex(json.get_ref<const std::string&>());
    }
};

//! Methods answering null when the requested object is unknown to the node
template <typename P, typename R>
struct NullableResultMethod : public jsonrpc::MethodBase<P, std::optional<R>> {
    static nlohmann::json serialize_result(const std::optional<R>& result) {
        return result ? nlohmann::json(*result) : nlohmann::json(nullptr);
    }
    static std::optional<R> deserialize_result(const nlohmann::json& json) {
        if (json.is_null()) {
            return std::nullopt;
        }
        return json.get<R>();
    }
};

using AccountParams = std::tuple<evmc::address, BlockId>;
using CallParams = std::tuple<TransactionCall, BlockId>;
using BlockByNumberParams = std::tuple<BlockSpec, Hydrated>;
using BlockByHashParams = std::tuple<evmc::bytes32, Hydrated>;
using HashParams = std::tuple<evmc::bytes32>;
using BlockSpecParams = std::tuple<BlockSpec>;
using LogsParams = std::tuple<LogFilter>;
using TransactionByBlockHashParams = std::tuple<evmc::bytes32, intx::uint256>;
using TransactionByBlockIdParams = std::tuple<BlockId, intx::uint256>;

ETHRPC_METHOD(BlockNumber, "eth_blockNumber", jsonrpc::Empty, intx::uint256);
ETHRPC_METHOD(ChainId, "eth_chainId", jsonrpc::Empty, intx::uint256);
ETHRPC_METHOD(GasPrice, "eth_gasPrice", jsonrpc::Empty, intx::uint256);
ETHRPC_METHOD(GetBalance, "eth_getBalance", AccountParams, intx::uint256);
ETHRPC_METHOD(GetTransactionCount, "eth_getTransactionCount", AccountParams, intx::uint256);

//! Code deployed at an account, empty for externally owned accounts
struct GetCode : public BytesResultMethod<AccountParams> {
    static constexpr std::string_view kName{"eth_getCode"};
    std::string_view name() const { return kName; }
};

//! Message call executed against the given block state without creating a transaction
struct Call : public BytesResultMethod<CallParams> {
    static constexpr std::string_view kName{"eth_call"};
    std::string_view name() const { return kName; }
};

struct GetBlockByNumber : public NullableResultMethod<BlockByNumberParams, Block> {
    static constexpr std::string_view kName{"eth_getBlockByNumber"};
    std::string_view name() const { return kName; }
};

struct GetBlockByHash : public NullableResultMethod<BlockByHashParams, Block> {
    static constexpr std::string_view kName{"eth_getBlockByHash"};
    std::string_view name() const { return kName; }
};

//! Number of transactions in the block, null for unknown blocks
struct GetBlockTransactionCountByHash : public NullableResultMethod<HashParams, intx::uint256> {
    static constexpr std::string_view kName{"eth_getBlockTransactionCountByHash"};
    std::string_view name() const { return kName; }
};

struct GetBlockTransactionCountByNumber : public NullableResultMethod<BlockSpecParams, intx::uint256> {
    static constexpr std::string_view kName{"eth_getBlockTransactionCountByNumber"};
    std::string_view name() const { return kName; }
};

ETHRPC_METHOD(GetLogs, "eth_getLogs", LogsParams, std::vector<Log>);

struct GetTransactionByHash : public NullableResultMethod<HashParams, Transaction> {
    static constexpr std::string_view kName{"eth_getTransactionByHash"};
    std::string_view name() const { return kName; }
};

struct GetTransactionByBlockHashAndIndex : public NullableResultMethod<TransactionByBlockHashParams, Transaction> {
    static constexpr std::string_view kName{"eth_getTransactionByBlockHashAndIndex"};
    std::string_view name() const { return kName; }
};

struct GetTransactionByBlockNumberAndIndex : public NullableResultMethod<TransactionByBlockIdParams, Transaction> {
    static constexpr std::string_view kName{"eth_getTransactionByBlockNumberAndIndex"};
    std::string_view name() const { return kName; }
};

}  // namespace ethrpc::eth

//! Widely supported extensions of the standard methods
namespace ethrpc::ext::eth {

using CallParams = std::tuple<ethrpc::eth::TransactionCall, ethrpc::eth::BlockId, ethrpc::eth::StateOverrides>;

//! eth_call executed over a state with some accounts replaced
struct Call : public ethrpc::eth::BytesResultMethod<CallParams> {
    static constexpr std::string_view kName{"eth_call"};
    std::string_view name() const { return kName; }
};

}  // namespace ethrpc::ext::eth

namespace ethrpc::web3 {

ETHRPC_METHOD(ClientVersion, "web3_clientVersion", jsonrpc::Empty, std::string);

}  // namespace ethrpc::web3

namespace ethrpc::net {

//! Network identifier as decimal string
ETHRPC_METHOD(Version, "net_version", jsonrpc::Empty, std::string);

}  // namespace ethrpc::net
