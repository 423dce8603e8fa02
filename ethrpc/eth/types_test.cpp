// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace ethrpc::eth {

using jsonrpc::JsonError;
using namespace evmc::literals;

namespace {

    nlohmann::json sample_block_json() {
        return nlohmann::json::parse(R"({
            "hash": "0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82",
            "parentHash": "0xe5d42a7cd2b8ff0c9d7e8a4c1b35dd5d4d26e6c7db7fc2e2c5eb4d0c38f2a7a4",
            "sha3Uncles": "0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347",
            "miner": "0x4838b106fce9647bdf1e7877bf73ce8b0bad5f97",
            "stateRoot": "0x5a2c7f7e2d3b4b7ebf0e5d0a0a3a0c7df0cd0ab6b0cb0fbf1f8f0b0c8e2d6f1a",
            "transactionsRoot": "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421",
            "receiptsRoot": "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421",
            "logsBloom": "0x)" + std::string(512, '0') + R"(",
            "difficulty": "0x0",
            "number": "0x1000000",
            "gasLimit": "0x1c9c380",
            "gasUsed": "0x0",
            "timestamp": "0x65f1b057",
            "extraData": "0x6265617665726275696c642e6f7267",
            "mixHash": "0x2c8c2fb0f5a09a5b3d7b8f9a4ad4e6aa4f3f1b0e2e1b8e5f9c7d0f7fbb1a0c3d",
            "nonce": "0x0000000000000000",
            "baseFeePerGas": "0x3b9aca00",
            "withdrawalsRoot": "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421",
            "size": "0x220",
            "transactions": [],
            "withdrawals": [
                {"index": "0x1", "validatorIndex": "0x2a", "address": "0x4838b106fce9647bdf1e7877bf73ce8b0bad5f97", "amount": "0x10"}
            ],
            "uncles": []
        })");
    }

}  // namespace

TEST_CASE("BlockTag", "[eth][types]") {
    CHECK(to_string(BlockTag::kEarliest) == "earliest");
    CHECK(to_string(BlockTag::kFinalized) == "finalized");
    CHECK(to_string(BlockTag::kSafe) == "safe");
    CHECK(to_string(BlockTag::kLatest) == "latest");
    CHECK(to_string(BlockTag::kPending) == "pending");
    CHECK(nlohmann::json(BlockTag::kSafe) == "safe");
    CHECK(nlohmann::json("pending").get<BlockTag>() == BlockTag::kPending);
    CHECK_THROWS_AS(nlohmann::json("Latest").get<BlockTag>(), JsonError);
    CHECK_THROWS_AS(nlohmann::json(1).get<BlockTag>(), JsonError);

    std::ostringstream out;
    out << BlockTag::kFinalized;
    CHECK(out.str() == "finalized");
}

TEST_CASE("BlockSpec", "[eth][types]") {
    SECTION("defaults to latest") {
        const BlockSpec spec;
        REQUIRE(spec.is_tag());
        CHECK(spec.tag() == BlockTag::kLatest);
        CHECK(nlohmann::json(spec) == "latest");
    }

    SECTION("number") {
        const BlockSpec spec{uint64_t{0x2a}};
        REQUIRE(spec.is_number());
        CHECK(nlohmann::json(spec) == "0x2a");
        CHECK(nlohmann::json("0x2a").get<BlockSpec>() == spec);
    }

    SECTION("tag") {
        CHECK(nlohmann::json("finalized").get<BlockSpec>() == BlockSpec{BlockTag::kFinalized});
    }

    SECTION("invalid") {
        CHECK_THROWS_AS(nlohmann::json("newest").get<BlockSpec>(), JsonError);
        CHECK_THROWS_AS(nlohmann::json(42).get<BlockSpec>(), JsonError);
    }
}

TEST_CASE("BlockId", "[eth][types]") {
    const auto hash = 0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82_bytes32;

    SECTION("number, hash or tag") {
        CHECK(nlohmann::json(BlockId{uint64_t{7}}) == "0x7");
        CHECK(nlohmann::json(BlockId{hash}) == "0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82");
        CHECK(nlohmann::json(BlockId{BlockTag::kEarliest}) == "earliest");
        CHECK(nlohmann::json(BlockId{}) == "latest");
    }

    SECTION("decode") {
        const auto by_hash = nlohmann::json("0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82").get<BlockId>();
        REQUIRE(by_hash.is_hash());
        CHECK(by_hash.hash() == hash);
        const auto by_number = nlohmann::json("0x7").get<BlockId>();
        REQUIRE(by_number.is_number());
        CHECK(by_number.number() == 7);
        CHECK(nlohmann::json("safe").get<BlockId>() == BlockId{BlockTag::kSafe});
    }

    SECTION("from block spec") {
        CHECK(BlockId{BlockSpec{uint64_t{3}}} == BlockId{uint64_t{3}});
        CHECK(BlockId{BlockSpec{BlockTag::kPending}} == BlockId{BlockTag::kPending});
    }
}

TEST_CASE("Hydrated", "[eth][types]") {
    CHECK(nlohmann::json(Hydrated::kYes) == true);
    CHECK(nlohmann::json(Hydrated::kNo) == false);
    CHECK(nlohmann::json(true).get<Hydrated>() == Hydrated::kYes);
    CHECK_THROWS_AS(nlohmann::json("true").get<Hydrated>(), JsonError);
}

TEST_CASE("TransactionCall", "[eth][types]") {
    SECTION("empty call is an empty object") {
        CHECK(nlohmann::json(TransactionCall{}) == nlohmann::json::object());
    }

    SECTION("set fields only") {
        TransactionCall call;
        call.to = 0x6b175474e89094c44da98b954eedeac495271d0f_address;
        call.input = evmc::bytes{0x18, 0x16, 0x0d, 0xdd};
        call.gas_price = intx::uint256{1000};
        const nlohmann::json json = call;
        CHECK(json == nlohmann::json::parse(R"({
            "to": "0x6b175474e89094c44da98b954eedeac495271d0f",
            "input": "0x18160ddd",
            "gasPrice": "0x3e8"
        })"));
        CHECK(json.get<TransactionCall>() == call);
    }

    SECTION("legacy data field") {
        const auto call = nlohmann::json::parse(R"({"data": "0x01"})").get<TransactionCall>();
        CHECK(call.input == evmc::bytes{0x01});
    }
}

TEST_CASE("Block", "[eth][types]") {
    SECTION("transaction hashes") {
        auto json = sample_block_json();
        json["transactions"] = nlohmann::json::array({"0x3ac225168df54212a25c1c01fd35bebfea408fdac2e31ddd6f80a4bbf9a5f1cb"});
        const auto block = json.get<Block>();
        CHECK(block.number == 0x1000000);
        CHECK(block.miner == 0x4838b106fce9647bdf1e7877bf73ce8b0bad5f97_address);
        CHECK(block.logs_bloom.size() == 256);
        CHECK(block.nonce.size() == 8);
        CHECK(block.base_fee_per_gas == intx::uint256{1000000000});
        CHECK_FALSE(block.total_difficulty);
        CHECK_FALSE(block.parent_beacon_block_root);
        CHECK_FALSE(block.hydrated());
        const auto& hashes = std::get<std::vector<evmc::bytes32>>(block.transactions);
        REQUIRE(hashes.size() == 1);
        CHECK(hashes[0] == 0x3ac225168df54212a25c1c01fd35bebfea408fdac2e31ddd6f80a4bbf9a5f1cb_bytes32);
        REQUIRE(block.withdrawals);
        CHECK(block.withdrawals->at(0) == Withdrawal{1, 42, 0x4838b106fce9647bdf1e7877bf73ce8b0bad5f97_address, 16});
        CHECK(nlohmann::json(block) == json);
    }

    SECTION("hydrated transactions stay opaque") {
        auto json = sample_block_json();
        json["transactions"] = nlohmann::json::parse(R"([{"hash": "0x01", "type": "0x2"}])");
        const auto block = json.get<Block>();
        CHECK(block.hydrated());
        const auto& transactions = std::get<std::vector<jsonrpc::Value>>(block.transactions);
        REQUIRE(transactions.size() == 1);
        CHECK(transactions[0].json().at("type") == "0x2");
    }

    SECTION("description") {
        std::ostringstream out;
        out << sample_block_json().get<Block>();
        CHECK(out.str() == "number: 16777216 hash: 0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82 transactions: 0");
    }

    SECTION("missing mandatory field") {
        auto json = sample_block_json();
        json.erase("stateRoot");
        CHECK_THROWS_AS(json.get<Block>(), nlohmann::json::out_of_range);
    }

    SECTION("malformed bloom") {
        auto json = sample_block_json();
        json["logsBloom"] = "0x00";
        CHECK_THROWS_AS(json.get<Block>(), JsonError);
    }
}

TEST_CASE("Log", "[eth][types]") {
    auto json = nlohmann::json::parse(R"({
        "removed": false,
        "logIndex": "0x3",
        "transactionIndex": "0x1",
        "transactionHash": "0x5b5b1b2a4a2cfa2a1e4bdb0a2a2e9cd8bd6b2a0b37ac5c6f6e8d3c0a2d1f4e5a",
        "blockHash": "0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82",
        "blockNumber": "0x1000000",
        "address": "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
        "data": "0x0000000000000000000000000000000000000000000000000000000005f5e100",
        "topics": [
            "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef",
            "0x000000000000000000000000d8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c"
        ]
    })");

    SECTION("decode") {
        const auto log = json.get<Log>();
        CHECK_FALSE(log.removed);
        CHECK(log.log_index == 3);
        CHECK(log.block_number == 0x1000000);
        CHECK_FALSE(log.block_timestamp);
        CHECK(log.address == 0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48_address);
        CHECK(log.data.size() == 32);
        REQUIRE(log.topics.size() == 2);
        CHECK(log.topics[0] == 0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
        CHECK(nlohmann::json(log) == json);
    }

    SECTION("block timestamp") {
        json["blockTimestamp"] = "0x65f1b057";
        CHECK(json.get<Log>().block_timestamp == intx::uint256{0x65f1b057});
    }

    SECTION("removed must be a boolean") {
        json["removed"] = "false";
        CHECK_THROWS_AS(json.get<Log>(), JsonError);
    }

    SECTION("too many topics") {
        for (int i{0}; i < 3; ++i) {
            json["topics"].push_back(json["topics"][0]);
        }
        CHECK_THROWS_AS(json.get<Log>(), JsonError);
    }
}

TEST_CASE("LogFilter", "[eth][types]") {
    const auto token = 0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48_address;
    const auto transfer = 0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32;
    const auto sender = 0x000000000000000000000000d8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c_bytes32;

    SECTION("block range") {
        LogFilter filter;
        filter.blocks = BlockRange{.from = uint64_t{0x100}, .to = BlockTag::kLatest};
        filter.address = token;
        filter.topics = {transfer, {}, std::vector<evmc::bytes32>{sender}};
        const auto json = nlohmann::json(filter);
        CHECK(json == nlohmann::json::parse(R"({
            "fromBlock": "0x100",
            "toBlock": "latest",
            "address": "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
            "topics": [
                "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef",
                null,
                ["0x000000000000000000000000d8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c"]
            ]
        })"));
        CHECK(json.get<LogFilter>() == filter);
    }

    SECTION("block hash") {
        LogFilter filter;
        filter.blocks = 0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82_bytes32;
        filter.address = std::vector<evmc::address>{token, 0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c_address};
        const auto json = nlohmann::json(filter);
        CHECK_FALSE(json.contains("fromBlock"));
        CHECK(json.at("blockHash") == "0x0ec62c2a397e114d84ce932387d841787d7ec5757ceba3708386da87934b7c82");
        CHECK(json.at("address").size() == 2);
        CHECK(json.at("topics") == nlohmann::json::array());
        CHECK(json.get<LogFilter>() == filter);
    }

    SECTION("missing criteria accept any value") {
        const auto filter = nlohmann::json::parse(R"({"fromBlock": "earliest", "toBlock": "0x10"})").get<LogFilter>();
        CHECK(std::holds_alternative<std::monostate>(filter.address));
        CHECK(filter.topics.empty());
        CHECK(std::get<BlockRange>(filter.blocks) == BlockRange{.from = BlockTag::kEarliest, .to = uint64_t{0x10}});
    }

    SECTION("too many topics") {
        auto json = nlohmann::json::parse(R"({"fromBlock": "latest", "toBlock": "latest", "topics": [null, null, null, null, null]})");
        CHECK_THROWS_AS(json.get<LogFilter>(), JsonError);
        json["topics"] = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";
        CHECK_THROWS_AS(json.get<LogFilter>(), JsonError);
    }
}

TEST_CASE("StateOverrides", "[eth][types]") {
    const auto account = 0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c_address;
    StateOverrides overrides;
    overrides[account].balance = intx::uint256{1000000000000000000};
    overrides[account].nonce = 7;
    overrides[account].state_diff = StorageOverrides{
        {0x0000000000000000000000000000000000000000000000000000000000000001_bytes32,
         0x00000000000000000000000000000000000000000000000000000000000000ff_bytes32},
    };
    overrides[0x0000000000000000000000000000000000000001_address].move_precompile_to_address =
        0x0000000000000000000000000000000000123456_address;

    const auto json = nlohmann::json(overrides);
    CHECK(json == nlohmann::json::parse(R"({
        "0x0000000000000000000000000000000000000001": {
            "movePrecompileToAddress": "0x0000000000000000000000000000000000123456"
        },
        "0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c": {
            "balance": "0xde0b6b3a7640000",
            "nonce": "0x7",
            "stateDiff": {
                "0x0000000000000000000000000000000000000000000000000000000000000001":
                    "0x00000000000000000000000000000000000000000000000000000000000000ff"
            }
        }
    })"));
    CHECK(json.get<StateOverrides>() == overrides);

    SECTION("code replacement") {
        const auto code = nlohmann::json::parse(R"({"0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c": {"code": "0x6080", "state": {}}})");
        const auto decoded = code.get<StateOverrides>();
        REQUIRE(decoded.contains(account));
        CHECK(decoded.at(account).code == evmc::bytes{0x60, 0x80});
        CHECK(decoded.at(account).state == StorageOverrides{});
        CHECK_FALSE(decoded.at(account).balance);
    }

    SECTION("invalid encodings") {
        CHECK_THROWS_AS(nlohmann::json::array().get<StateOverrides>(), JsonError);
        CHECK_THROWS_AS(nlohmann::json::parse(R"({"0xd8da6bf26964af9d7eed9e10e0dd2e4e8d5b6e7c": {"stateDiff": []}})").get<StateOverrides>(), JsonError);
    }
}

}  // namespace ethrpc::eth
