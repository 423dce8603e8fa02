// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "methods.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/jsonrpc/batch.hpp>
#include <ethrpc/jsonrpc/call.hpp>

namespace ethrpc::eth {

using jsonrpc::Empty;
using jsonrpc::JsonError;
using namespace evmc::literals;

static_assert(jsonrpc::Method<web3::ClientVersion>);
static_assert(jsonrpc::Method<net::Version>);
static_assert(jsonrpc::Method<BlockNumber>);
static_assert(jsonrpc::Method<ChainId>);
static_assert(jsonrpc::Method<GasPrice>);
static_assert(jsonrpc::Method<GetBalance>);
static_assert(jsonrpc::Method<GetCode>);
static_assert(jsonrpc::Method<GetTransactionCount>);
static_assert(jsonrpc::Method<Call>);
static_assert(jsonrpc::Method<GetBlockByNumber>);
static_assert(jsonrpc::Method<GetBlockByHash>);
static_assert(jsonrpc::Method<GetBlockTransactionCountByHash>);
static_assert(jsonrpc::Method<GetBlockTransactionCountByNumber>);
static_assert(jsonrpc::Method<GetLogs>);
static_assert(jsonrpc::Method<GetTransactionByHash>);
static_assert(jsonrpc::Method<GetTransactionByBlockHashAndIndex>);
static_assert(jsonrpc::Method<GetTransactionByBlockNumberAndIndex>);
static_assert(jsonrpc::Method<ext::eth::Call>);

namespace {

    //! Node answering with a fixed result per method name and recording the last request
    class ScriptedNode {
      public:
        nlohmann::json results = nlohmann::json::object();
        nlohmann::json last_request;

        std::string handle(const std::string& body) {
            last_request = nlohmann::json::parse(body);
            if (last_request.is_array()) {
                auto responses = nlohmann::json::array();
                for (const auto& request : last_request) {
                    responses.push_back(answer(request));
                }
                return responses.dump();
            }
            return answer(last_request).dump();
        }

      private:
        nlohmann::json answer(const nlohmann::json& request) const {
            return {{"jsonrpc", "2.0"}, {"result", results.at(request.at("method").get<std::string>())}, {"id", request.at("id")}};
        }
    };

}  // namespace

TEST_CASE("method catalogue wire names", "[eth][methods]") {
    CHECK(web3::ClientVersion{}.name() == "web3_clientVersion");
    CHECK(net::Version{}.name() == "net_version");
    CHECK(BlockNumber{}.name() == "eth_blockNumber");
    CHECK(ChainId{}.name() == "eth_chainId");
    CHECK(GasPrice{}.name() == "eth_gasPrice");
    CHECK(GetBalance{}.name() == "eth_getBalance");
    CHECK(GetCode{}.name() == "eth_getCode");
    CHECK(GetTransactionCount{}.name() == "eth_getTransactionCount");
    CHECK(Call{}.name() == "eth_call");
    CHECK(GetBlockByNumber{}.name() == "eth_getBlockByNumber");
    CHECK(GetBlockByHash{}.name() == "eth_getBlockByHash");
    CHECK(GetBlockTransactionCountByHash{}.name() == "eth_getBlockTransactionCountByHash");
    CHECK(GetBlockTransactionCountByNumber{}.name() == "eth_getBlockTransactionCountByNumber");
    CHECK(GetLogs{}.name() == "eth_getLogs");
    CHECK(GetTransactionByHash{}.name() == "eth_getTransactionByHash");
    CHECK(GetTransactionByBlockHashAndIndex{}.name() == "eth_getTransactionByBlockHashAndIndex");
    CHECK(GetTransactionByBlockNumberAndIndex{}.name() == "eth_getTransactionByBlockNumberAndIndex");
    CHECK(ext::eth::Call{}.name() == "eth_call");
}

TEST_CASE("method catalogue calls", "[eth][methods]") {
    ScriptedNode node;
    auto roundtrip = [&node](std::string body) { return node.handle(body); };
    const auto account = 0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c_address;

    SECTION("quantities") {
        node.results["eth_blockNumber"] = "0x12a05f2";
        node.results["eth_chainId"] = "0x1";
        CHECK(jsonrpc::call(BlockNumber{}, Empty{}, roundtrip) == 19531250);
        CHECK(node.last_request.at("params") == nlohmann::json::array());
        CHECK(jsonrpc::call(ChainId{}, Empty{}, roundtrip) == 1);
    }

    SECTION("account state") {
        node.results["eth_getBalance"] = "0xde0b6b3a7640000";
        const auto balance = jsonrpc::call(GetBalance{}, {account, BlockTag::kFinalized}, roundtrip);
        CHECK(balance == intx::uint256{1000000000000000000});
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"(["0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c", "finalized"])"));

        node.results["eth_getCode"] = "0x6080";
        CHECK(jsonrpc::call(GetCode{}, {account, BlockId{uint64_t{100}}}, roundtrip) == evmc::bytes{0x60, 0x80});
        CHECK(node.last_request.at("params")[1] == "0x64");
    }

    SECTION("message call") {
        node.results["eth_call"] = "0x0000000000000000000000000000000000000000000000000000000000000001";
        TransactionCall call;
        call.to = account;
        call.input = evmc::bytes{0x06, 0xfd, 0xde, 0x03};
        const auto output = jsonrpc::call(Call{}, {call, BlockId{}}, roundtrip);
        CHECK(output.size() == 32);
        CHECK(output.back() == 0x01);
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"([
            {"to": "0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c", "input": "0x06fdde03"},
            "latest"
        ])"));
    }

    SECTION("unknown block is null") {
        node.results["eth_getBlockByNumber"] = nullptr;
        const auto block = jsonrpc::call(GetBlockByNumber{}, {uint64_t{99999999}, Hydrated::kNo}, roundtrip);
        CHECK_FALSE(block);
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"(["0x5f5e0ff", false])"));
    }

    SECTION("malformed bytes result") {
        node.results["eth_getCode"] = "0x608";
        CHECK_THROWS_AS(jsonrpc::call(GetCode{}, {account, BlockId{}}, roundtrip), JsonError);
    }

    SECTION("transaction count of a block") {
        const auto hash = 0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82_bytes32;
        node.results["eth_getBlockTransactionCountByHash"] = "0x9a";
        CHECK(jsonrpc::call(GetBlockTransactionCountByHash{}, {hash}, roundtrip) == intx::uint256{154});
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"(["0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82"])"));

        node.results["eth_getBlockTransactionCountByNumber"] = nullptr;
        CHECK_FALSE(jsonrpc::call(GetBlockTransactionCountByNumber{}, {BlockTag::kPending}, roundtrip));
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"(["pending"])"));
    }

    SECTION("logs") {
        node.results["eth_getLogs"] = nlohmann::json::parse(R"([{
            "removed": false,
            "logIndex": "0x0",
            "transactionIndex": "0x2",
            "transactionHash": "0x5b5b1b2a4a2cfa2a1e4bdb0a2a2e9cd8bd6b2a0b37ac5c6f6e8d3c0a2d1f4e5a",
            "blockHash": "0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82",
            "blockNumber": "0x1000000",
            "address": "0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c",
            "data": "0x",
            "topics": ["0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef"]
        }])");
        LogFilter filter;
        filter.blocks = BlockRange{.from = uint64_t{0x1000000}, .to = BlockTag::kLatest};
        filter.address = account;
        filter.topics = {0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};
        const auto logs = jsonrpc::call(GetLogs{}, {filter}, roundtrip);
        REQUIRE(logs.size() == 1);
        CHECK(logs[0].address == account);
        CHECK(logs[0].transaction_index == 2);
        CHECK(logs[0].data.empty());
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"([{
            "fromBlock": "0x1000000",
            "toBlock": "latest",
            "address": "0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c",
            "topics": ["0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef"]
        }])"));
    }

    SECTION("transaction lookups") {
        const auto tx_hash = 0x5b5b1b2a4a2cfa2a1e4bdb0a2a2e9cd8bd6b2a0b37ac5c6f6e8d3c0a2d1f4e5a_bytes32;
        const auto tx_json = nlohmann::json::parse(R"({"hash": "0x5b5b1b2a4a2cfa2a1e4bdb0a2a2e9cd8bd6b2a0b37ac5c6f6e8d3c0a2d1f4e5a", "nonce": "0x1"})");
        node.results["eth_getTransactionByHash"] = tx_json;
        const auto transaction = jsonrpc::call(GetTransactionByHash{}, {tx_hash}, roundtrip);
        REQUIRE(transaction);
        CHECK(transaction->json() == tx_json);

        node.results["eth_getTransactionByBlockHashAndIndex"] = nullptr;
        const auto block_hash = 0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82_bytes32;
        CHECK_FALSE(jsonrpc::call(GetTransactionByBlockHashAndIndex{}, {block_hash, intx::uint256{3}}, roundtrip));
        CHECK(node.last_request.at("params")[1] == "0x3");

        node.results["eth_getTransactionByBlockNumberAndIndex"] = tx_json;
        CHECK(jsonrpc::call(GetTransactionByBlockNumberAndIndex{}, {BlockTag::kLatest, intx::uint256{0}}, roundtrip));
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"(["latest", "0x0"])"));
    }

    SECTION("message call with state overrides") {
        node.results["eth_call"] = "0x01";
        TransactionCall call;
        call.to = account;
        ethrpc::eth::StateOverrides overrides;
        overrides[account].code = evmc::bytes{0x60, 0x01};
        const auto output = jsonrpc::call(ext::eth::Call{}, {call, BlockTag::kLatest, overrides}, roundtrip);
        CHECK(output == evmc::bytes{0x01});
        CHECK(node.last_request.at("params") == nlohmann::json::parse(R"([
            {"to": "0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c"},
            "latest",
            {"0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c": {"code": "0x6001"}}
        ])"));
    }

    SECTION("batch of heterogeneous methods") {
        node.results["web3_clientVersion"] = "Geth/v1.14.0";
        node.results["net_version"] = "1";
        node.results["eth_gasPrice"] = "0x3b9aca00";
        auto [version, network, gas_price] = jsonrpc::batch::call(
            std::tuple{
                std::pair{web3::ClientVersion{}, Empty{}},
                std::pair{net::Version{}, Empty{}},
                std::pair{GasPrice{}, Empty{}},
            },
            roundtrip);
        CHECK(version == "Geth/v1.14.0");
        CHECK(network == "1");
        CHECK(gas_price == 1000000000);
        CHECK(node.last_request.size() == 3);
    }
}

}  // namespace ethrpc::eth
