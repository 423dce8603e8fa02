// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <array>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace ethrpc::eth {

using jsonrpc::JsonError;

namespace {

    constexpr std::array<std::pair<BlockTag, std::string_view>, 5> kBlockTagNames{{
        {BlockTag::kEarliest, "earliest"},
        {BlockTag::kFinalized, "finalized"},
        {BlockTag::kSafe, "safe"},
        {BlockTag::kLatest, "latest"},
        {BlockTag::kPending, "pending"},
    }};

    constexpr size_t kHashHexLength{2 + 2 * sizeof(evmc::bytes32::bytes)};
    constexpr size_t kLogsBloomSize{256};
    constexpr size_t kBlockNonceSize{8};

    const std::string& expect_string(const nlohmann::json& json, std::string_view what) {
        if (!json.is_string()) {
            throw JsonError{"expected " + std::string{what} + " string but got " + json.dump()};
        }
        return json.get_ref<const std::string&>();
    }

    template <typename T>
    void set_optional(nlohmann::json& json, const char* key, const std::optional<T>& field) {
        if (field) {
            json[key] = *field;
        }
    }

    template <typename T>
    std::optional<T> get_optional(const nlohmann::json& json, const char* key) {
        const auto it = json.find(key);
        if (it == json.end() || it->is_null()) {
            return std::nullopt;
        }
        return it->get<T>();
    }

    std::optional<evmc::bytes> get_optional_bytes(const nlohmann::json& json, const char* key) {
        const auto it = json.find(key);
        if (it == json.end() || it->is_null()) {
            return std::nullopt;
        }
        return from_hex(expect_string(*it, key));
    }

    evmc::bytes get_bytes(const nlohmann::json& json, const char* key) {
        return from_hex(expect_string(json.at(key), key));
    }

    evmc::bytes get_bytes(const nlohmann::json& json, const char* key, size_t expected_size) {
        return from_hex(expect_string(json.at(key), key), expected_size);
    }

    uint64_t get_u64(const nlohmann::json& json, const char* key) {
        return from_quantity_u64(expect_string(json.at(key), key));
    }

    template <typename T>
    nlohmann::json filter_value_to_json(const FilterValue<T>& value) {
        if (std::holds_alternative<std::monostate>(value)) {
            return nullptr;
        }
        if (const auto* exact = std::get_if<T>(&value)) {
            return *exact;
        }
        return std::get<std::vector<T>>(value);
    }

    template <typename T>
    FilterValue<T> filter_value_from_json(const nlohmann::json& json) {
        if (json.is_null()) {
            return std::monostate{};
        }
        if (json.is_array()) {
            return json.get<std::vector<T>>();
        }
        return json.get<T>();
    }

    nlohmann::json storage_to_json(const StorageOverrides& storage) {
        auto json = nlohmann::json::object();
        for (const auto& [slot, value] : storage) {
            json[to_hex(evmc::bytes_view{slot.bytes, sizeof(slot.bytes)})] = value;
        }
        return json;
    }

    StorageOverrides storage_from_json(const nlohmann::json& json) {
        if (!json.is_object()) {
            throw JsonError{"invalid storage overrides: " + json.dump()};
        }
        StorageOverrides storage;
        for (const auto& [slot, value] : json.items()) {
            storage.emplace(nlohmann::json(slot).get<evmc::bytes32>(), value.get<evmc::bytes32>());
        }
        return storage;
    }

}  // namespace

std::string_view to_string(BlockTag tag) {
    for (const auto& [value, name] : kBlockTagNames) {
        if (value == tag) {
            return name;
        }
    }
    return "unknown";
}

std::optional<BlockTag> block_tag_from_string(std::string_view name) {
    for (const auto& [value, tag_name] : kBlockTagNames) {
        if (tag_name == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, BlockTag tag) {
    out << to_string(tag);
    return out;
}

void to_json(nlohmann::json& json, const BlockTag& tag) {
    json = std::string{to_string(tag)};
}

void from_json(const nlohmann::json& json, BlockTag& tag) {
    const auto& name = expect_string(json, "block tag");
    const auto parsed = block_tag_from_string(name);
    if (!parsed) {
        throw JsonError{"unknown block tag: " + name};
    }
    tag = *parsed;
}

void to_json(nlohmann::json& json, const BlockSpec& spec) {
    if (spec.is_number()) {
        json = to_quantity(spec.number());
    } else {
        json = spec.tag();
    }
}

void from_json(const nlohmann::json& json, BlockSpec& spec) {
    const auto& text = expect_string(json, "block number or tag");
    if (const auto tag = block_tag_from_string(text)) {
        spec = *tag;
    } else {
        spec = from_quantity(text);
    }
}

BlockId::BlockId(const BlockSpec& spec) {
    if (spec.is_number()) {
        value_ = spec.number();
    } else {
        value_ = spec.tag();
    }
}

void to_json(nlohmann::json& json, const BlockId& id) {
    if (id.is_number()) {
        json = to_quantity(id.number());
    } else if (id.is_hash()) {
        json = id.hash();
    } else {
        json = id.tag();
    }
}

void from_json(const nlohmann::json& json, BlockId& id) {
    const auto& text = expect_string(json, "block number, hash or tag");
    if (const auto tag = block_tag_from_string(text)) {
        id = *tag;
    } else if (text.size() == kHashHexLength) {
        id = json.get<evmc::bytes32>();
    } else {
        id = from_quantity(text);
    }
}

void to_json(nlohmann::json& json, const Hydrated& hydrated) {
    json = hydrated == Hydrated::kYes;
}

void from_json(const nlohmann::json& json, Hydrated& hydrated) {
    if (!json.is_boolean()) {
        throw JsonError{"expected hydrated flag as boolean but got " + json.dump()};
    }
    hydrated = json.get<bool>() ? Hydrated::kYes : Hydrated::kNo;
}

void to_json(nlohmann::json& json, const TransactionCall& call) {
    json = nlohmann::json::object();
    set_optional(json, "type", call.type);
    set_optional(json, "nonce", call.nonce);
    set_optional(json, "from", call.from);
    set_optional(json, "to", call.to);
    set_optional(json, "gas", call.gas);
    set_optional(json, "value", call.value);
    if (call.input) {
        json["input"] = to_hex(*call.input);
    }
    set_optional(json, "gasPrice", call.gas_price);
    set_optional(json, "maxPriorityFeePerGas", call.max_priority_fee_per_gas);
    set_optional(json, "maxFeePerGas", call.max_fee_per_gas);
    set_optional(json, "chainId", call.chain_id);
}

void from_json(const nlohmann::json& json, TransactionCall& call) {
    if (!json.is_object()) {
        throw JsonError{"invalid transaction call: " + json.dump()};
    }
    call.type = get_optional<intx::uint256>(json, "type");
    call.nonce = get_optional<intx::uint256>(json, "nonce");
    call.from = get_optional<evmc::address>(json, "from");
    call.to = get_optional<evmc::address>(json, "to");
    call.gas = get_optional<intx::uint256>(json, "gas");
    call.value = get_optional<intx::uint256>(json, "value");
    // Older nodes only understand the legacy name of the calldata field
    call.input = get_optional_bytes(json, "input");
    if (!call.input) {
        call.input = get_optional_bytes(json, "data");
    }
    call.gas_price = get_optional<intx::uint256>(json, "gasPrice");
    call.max_priority_fee_per_gas = get_optional<intx::uint256>(json, "maxPriorityFeePerGas");
    call.max_fee_per_gas = get_optional<intx::uint256>(json, "maxFeePerGas");
    call.chain_id = get_optional<intx::uint256>(json, "chainId");
}

void to_json(nlohmann::json& json, const Withdrawal& withdrawal) {
    json["index"] = to_quantity(withdrawal.index);
    json["validatorIndex"] = to_quantity(withdrawal.validator_index);
    json["address"] = withdrawal.address;
    json["amount"] = to_quantity(withdrawal.amount);
}

void from_json(const nlohmann::json& json, Withdrawal& withdrawal) {
    withdrawal.index = get_u64(json, "index");
    withdrawal.validator_index = get_u64(json, "validatorIndex");
    withdrawal.address = json.at("address").get<evmc::address>();
    withdrawal.amount = get_u64(json, "amount");
}

std::ostream& operator<<(std::ostream& out, const Block& block) {
    out << "number: " << intx::to_string(block.number)
        << " hash: " << to_hex(evmc::bytes_view{block.hash.bytes, sizeof(block.hash.bytes)})
        << " transactions: ";
    std::visit([&](const auto& transactions) { out << transactions.size(); }, block.transactions);
    out << (block.hydrated() ? " (hydrated)" : "");
    return out;
}

void to_json(nlohmann::json& json, const Block& block) {
    json["hash"] = block.hash;
    json["parentHash"] = block.parent_hash;
    json["sha3Uncles"] = block.sha3_uncles;
    json["miner"] = block.miner;
    json["stateRoot"] = block.state_root;
    json["transactionsRoot"] = block.transactions_root;
    json["receiptsRoot"] = block.receipts_root;
    json["logsBloom"] = to_hex(block.logs_bloom);
    json["difficulty"] = block.difficulty;
    json["number"] = block.number;
    json["gasLimit"] = block.gas_limit;
    json["gasUsed"] = block.gas_used;
    json["timestamp"] = block.timestamp;
    json["extraData"] = to_hex(block.extra_data);
    json["mixHash"] = block.mix_hash;
    json["nonce"] = to_hex(block.nonce);
    set_optional(json, "totalDifficulty", block.total_difficulty);
    set_optional(json, "baseFeePerGas", block.base_fee_per_gas);
    set_optional(json, "withdrawalsRoot", block.withdrawals_root);
    set_optional(json, "blobGasUsed", block.blob_gas_used);
    set_optional(json, "excessBlobGas", block.excess_blob_gas);
    set_optional(json, "parentBeaconBlockRoot", block.parent_beacon_block_root);
    set_optional(json, "requestsHash", block.requests_hash);
    json["size"] = block.size;
    std::visit([&](const auto& transactions) { json["transactions"] = transactions; }, block.transactions);
    set_optional(json, "withdrawals", block.withdrawals);
    json["uncles"] = block.uncles;
}

void from_json(const nlohmann::json& json, Block& block) {
    if (!json.is_object()) {
        throw JsonError{"invalid block: " + json.dump()};
    }
    block.hash = json.at("hash").get<evmc::bytes32>();
    block.parent_hash = json.at("parentHash").get<evmc::bytes32>();
    block.sha3_uncles = json.at("sha3Uncles").get<evmc::bytes32>();
    block.miner = json.at("miner").get<evmc::address>();
    block.state_root = json.at("stateRoot").get<evmc::bytes32>();
    block.transactions_root = json.at("transactionsRoot").get<evmc::bytes32>();
    block.receipts_root = json.at("receiptsRoot").get<evmc::bytes32>();
    block.logs_bloom = get_bytes(json, "logsBloom", kLogsBloomSize);
    block.difficulty = json.at("difficulty").get<intx::uint256>();
    block.number = json.at("number").get<intx::uint256>();
    block.gas_limit = json.at("gasLimit").get<intx::uint256>();
    block.gas_used = json.at("gasUsed").get<intx::uint256>();
    block.timestamp = json.at("timestamp").get<intx::uint256>();
    block.extra_data = get_bytes(json, "extraData");
    block.mix_hash = json.at("mixHash").get<evmc::bytes32>();
    block.nonce = get_bytes(json, "nonce", kBlockNonceSize);
    block.total_difficulty = get_optional<intx::uint256>(json, "totalDifficulty");
    block.base_fee_per_gas = get_optional<intx::uint256>(json, "baseFeePerGas");
    block.withdrawals_root = get_optional<evmc::bytes32>(json, "withdrawalsRoot");
    block.blob_gas_used = get_optional<intx::uint256>(json, "blobGasUsed");
    block.excess_blob_gas = get_optional<intx::uint256>(json, "excessBlobGas");
    block.parent_beacon_block_root = get_optional<evmc::bytes32>(json, "parentBeaconBlockRoot");
    block.requests_hash = get_optional<evmc::bytes32>(json, "requestsHash");
    block.size = json.at("size").get<intx::uint256>();

    const auto& transactions = json.at("transactions");
    if (!transactions.is_array()) {
        throw JsonError{"invalid block transactions: " + transactions.dump()};
    }
    if (!transactions.empty() && transactions.front().is_object()) {
        block.transactions = transactions.get<std::vector<jsonrpc::Value>>();
    } else {
        block.transactions = transactions.get<std::vector<evmc::bytes32>>();
    }
    block.withdrawals = get_optional<std::vector<Withdrawal>>(json, "withdrawals");
    block.uncles = json.at("uncles").get<std::vector<evmc::bytes32>>();
}

void to_json(nlohmann::json& json, const Log& log) {
    json["removed"] = log.removed;
    json["logIndex"] = log.log_index;
    json["transactionIndex"] = log.transaction_index;
    json["transactionHash"] = log.transaction_hash;
    json["blockHash"] = log.block_hash;
    json["blockNumber"] = log.block_number;
    set_optional(json, "blockTimestamp", log.block_timestamp);
    json["address"] = log.address;
    json["data"] = to_hex(log.data);
    json["topics"] = log.topics;
}

void from_json(const nlohmann::json& json, Log& log) {
    if (!json.is_object()) {
        throw JsonError{"invalid log: " + json.dump()};
    }
    const auto& removed = json.at("removed");
    if (!removed.is_boolean()) {
        throw JsonError{"expected removed flag as boolean but got " + removed.dump()};
    }
    log.removed = removed.get<bool>();
    log.log_index = json.at("logIndex").get<intx::uint256>();
    log.transaction_index = json.at("transactionIndex").get<intx::uint256>();
    log.transaction_hash = json.at("transactionHash").get<evmc::bytes32>();
    log.block_hash = json.at("blockHash").get<evmc::bytes32>();
    log.block_number = json.at("blockNumber").get<intx::uint256>();
    log.block_timestamp = get_optional<intx::uint256>(json, "blockTimestamp");
    log.address = json.at("address").get<evmc::address>();
    log.data = get_bytes(json, "data");
    log.topics = json.at("topics").get<std::vector<evmc::bytes32>>();
    if (log.topics.size() > LogFilter::kMaxTopics) {
        throw JsonError{"too many log topics: " + std::to_string(log.topics.size())};
    }
}

void to_json(nlohmann::json& json, const LogFilter& filter) {
    json = nlohmann::json::object();
    if (const auto* range = std::get_if<BlockRange>(&filter.blocks)) {
        json["fromBlock"] = range->from;
        json["toBlock"] = range->to;
    } else {
        json["blockHash"] = std::get<evmc::bytes32>(filter.blocks);
    }
    json["address"] = filter_value_to_json(filter.address);
    auto topics = nlohmann::json::array();
    for (const auto& topic : filter.topics) {
        topics.push_back(filter_value_to_json(topic));
    }
    json["topics"] = std::move(topics);
}

void from_json(const nlohmann::json& json, LogFilter& filter) {
    if (!json.is_object()) {
        throw JsonError{"invalid log filter: " + json.dump()};
    }
    if (json.contains("blockHash")) {
        filter.blocks = json.at("blockHash").get<evmc::bytes32>();
    } else {
        filter.blocks = BlockRange{.from = json.at("fromBlock").get<BlockSpec>(), .to = json.at("toBlock").get<BlockSpec>()};
    }
    // Missing criteria accept any value
    const auto address = json.find("address");
    filter.address = address == json.end() ? FilterValue<evmc::address>{} : filter_value_from_json<evmc::address>(*address);

    filter.topics.clear();
    const auto topics = json.find("topics");
    if (topics == json.end() || topics->is_null()) {
        return;
    }
    if (!topics->is_array() || topics->size() > LogFilter::kMaxTopics) {
        throw JsonError{"invalid log filter topics: " + topics->dump()};
    }
    for (const auto& topic : *topics) {
        filter.topics.push_back(filter_value_from_json<evmc::bytes32>(topic));
    }
}

void to_json(nlohmann::json& json, const AccountOverrides& overrides) {
    json = nlohmann::json::object();
    set_optional(json, "balance", overrides.balance);
    if (overrides.nonce) {
        json["nonce"] = to_quantity(*overrides.nonce);
    }
    if (overrides.code) {
        json["code"] = to_hex(*overrides.code);
    }
    if (overrides.state) {
        json["state"] = storage_to_json(*overrides.state);
    }
    if (overrides.state_diff) {
        json["stateDiff"] = storage_to_json(*overrides.state_diff);
    }
    set_optional(json, "movePrecompileToAddress", overrides.move_precompile_to_address);
}

void from_json(const nlohmann::json& json, AccountOverrides& overrides) {
    if (!json.is_object()) {
        throw JsonError{"invalid account overrides: " + json.dump()};
    }
    overrides.balance = get_optional<intx::uint256>(json, "balance");
    if (const auto it = json.find("nonce"); it != json.end() && !it->is_null()) {
        overrides.nonce = from_quantity_u64(expect_string(*it, "nonce"));
    }
    overrides.code = get_optional_bytes(json, "code");
    if (const auto it = json.find("state"); it != json.end() && !it->is_null()) {
        overrides.state = storage_from_json(*it);
    }
    if (const auto it = json.find("stateDiff"); it != json.end() && !it->is_null()) {
        overrides.state_diff = storage_from_json(*it);
    }
    overrides.move_precompile_to_address = get_optional<evmc::address>(json, "movePrecompileToAddress");
}

void to_json(nlohmann::json& json, const StateOverrides& overrides) {
    json = nlohmann::json::object();
    for (const auto& [account, account_overrides] : overrides) {
        json[to_hex(evmc::bytes_view{account.bytes, sizeof(account.bytes)})] = account_overrides;
    }
}

void from_json(const nlohmann::json& json, StateOverrides& overrides) {
    if (!json.is_object()) {
        throw JsonError{"invalid state overrides: " + json.dump()};
    }
    overrides.clear();
    for (const auto& [account, account_overrides] : json.items()) {
        overrides.emplace(nlohmann::json(account).get<evmc::address>(), account_overrides.get<AccountOverrides>());
    }
}

}  // namespace ethrpc::eth
