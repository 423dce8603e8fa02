// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include <evmc/bytes.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/eth/hex.hpp>
#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::eth {

//! Named block selectors understood by Ethereum nodes
enum class BlockTag {
    kEarliest,
    kFinalized,
    kSafe,
    kLatest,
    kPending,
};

std::string_view to_string(BlockTag tag);
std::optional<BlockTag> block_tag_from_string(std::string_view name);
std::ostream& operator<<(std::ostream& out, BlockTag tag);

void to_json(nlohmann::json& json, const BlockTag& tag);
void from_json(const nlohmann::json& json, BlockTag& tag);

//! Block selector by number or tag, defaulting to the latest block
class BlockSpec {
  public:
    BlockSpec() = default;
    BlockSpec(intx::uint256 number) : value_{number} {}  // NOLINT(google-explicit-constructor)
    BlockSpec(uint64_t number) : value_{intx::uint256{number}} {}  // NOLINT(google-explicit-constructor)
    BlockSpec(BlockTag tag) : value_{tag} {}  // NOLINT(google-explicit-constructor)

    bool is_number() const { return std::holds_alternative<intx::uint256>(value_); }
    bool is_tag() const { return std::holds_alternative<BlockTag>(value_); }

    const intx::uint256& number() const { return std::get<intx::uint256>(value_); }
    BlockTag tag() const { return std::get<BlockTag>(value_); }

    friend bool operator==(const BlockSpec&, const BlockSpec&) = default;

  private:
    std::variant<BlockTag, intx::uint256> value_{BlockTag::kLatest};
};

void to_json(nlohmann::json& json, const BlockSpec& spec);
void from_json(const nlohmann::json& json, BlockSpec& spec);

//! Block selector by number, hash or tag, defaulting to the latest block
class BlockId {
  public:
    BlockId() = default;
    BlockId(intx::uint256 number) : value_{number} {}  // NOLINT(google-explicit-constructor)
    BlockId(uint64_t number) : value_{intx::uint256{number}} {}  // NOLINT(google-explicit-constructor)
    BlockId(const evmc::bytes32& hash) : value_{hash} {}  // NOLINT(google-explicit-constructor)
    BlockId(BlockTag tag) : value_{tag} {}  // NOLINT(google-explicit-constructor)
    BlockId(const BlockSpec& spec);  // NOLINT(google-explicit-constructor)

    bool is_number() const { return std::holds_alternative<intx::uint256>(value_); }
    bool is_hash() const { return std::holds_alternative<evmc::bytes32>(value_); }
    bool is_tag() const { return std::holds_alternative<BlockTag>(value_); }

    const intx::uint256& number() const { return std::get<intx::uint256>(value_); }
    const evmc::bytes32& hash() const { return std::get<evmc::bytes32>(value_); }
    BlockTag tag() const { return std::get<BlockTag>(value_); }

    friend bool operator==(const BlockId&, const BlockId&) = default;

  private:
    std::variant<BlockTag, intx::uint256, evmc::bytes32> value_{BlockTag::kLatest};
};

void to_json(nlohmann::json& json, const BlockId& id);
void from_json(const nlohmann::json& json, BlockId& id);

//! Whether block transactions are returned as full objects or as hashes only, encoded as bool
enum class Hydrated : bool {
    kNo = false,
    kYes = true,
};

void to_json(nlohmann::json& json, const Hydrated& hydrated);
void from_json(const nlohmann::json& json, Hydrated& hydrated);

//! Message call simulated by eth_call: every field is optional and omitted when unset
struct TransactionCall {
    std::optional<intx::uint256> type;
    std::optional<intx::uint256> nonce;
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;
    std::optional<intx::uint256> gas;
    std::optional<intx::uint256> value;
    std::optional<evmc::bytes> input;
    std::optional<intx::uint256> gas_price;
    std::optional<intx::uint256> max_priority_fee_per_gas;
    std::optional<intx::uint256> max_fee_per_gas;
    std::optional<intx::uint256> chain_id;

    friend bool operator==(const TransactionCall&, const TransactionCall&) = default;
};

void to_json(nlohmann::json& json, const TransactionCall& call);
void from_json(const nlohmann::json& json, TransactionCall& call);

struct Withdrawal {
    uint64_t index{0};
    uint64_t validator_index{0};
    evmc::address address;
    uint64_t amount{0};

    friend bool operator==(const Withdrawal&, const Withdrawal&) = default;
};

void to_json(nlohmann::json& json, const Withdrawal& withdrawal);
void from_json(const nlohmann::json& json, Withdrawal& withdrawal);

//! Block transactions: hashes when not hydrated, opaque transaction objects otherwise
using BlockTransactions = std::variant<std::vector<evmc::bytes32>, std::vector<jsonrpc::Value>>;

//! Block as returned by eth_getBlockByNumber and eth_getBlockByHash
struct Block {
    evmc::bytes32 hash;
    evmc::bytes32 parent_hash;
    evmc::bytes32 sha3_uncles;
    evmc::address miner;
    evmc::bytes32 state_root;
    evmc::bytes32 transactions_root;
    evmc::bytes32 receipts_root;
    evmc::bytes logs_bloom;
    intx::uint256 difficulty;
    intx::uint256 number;
    intx::uint256 gas_limit;
    intx::uint256 gas_used;
    intx::uint256 timestamp;
    evmc::bytes extra_data;
    evmc::bytes32 mix_hash;
    evmc::bytes nonce;
    std::optional<intx::uint256> total_difficulty;
    std::optional<intx::uint256> base_fee_per_gas;
    std::optional<evmc::bytes32> withdrawals_root;
    std::optional<intx::uint256> blob_gas_used;
    std::optional<intx::uint256> excess_blob_gas;
    std::optional<evmc::bytes32> parent_beacon_block_root;
    std::optional<evmc::bytes32> requests_hash;
    intx::uint256 size;
    BlockTransactions transactions;
    std::optional<std::vector<Withdrawal>> withdrawals;
    std::vector<evmc::bytes32> uncles;

    bool hydrated() const { return std::holds_alternative<std::vector<jsonrpc::Value>>(transactions); }

    friend bool operator==(const Block&, const Block&) = default;
};

std::ostream& operator<<(std::ostream& out, const Block& block);

void to_json(nlohmann::json& json, const Block& block);
void from_json(const nlohmann::json& json, Block& block);

//! Signed transaction as returned by the transaction lookups, kept opaque like hydrated block transactions
using Transaction = jsonrpc::Value;

//! Log entry emitted by a contract
struct Log {
    bool removed{false};
    intx::uint256 log_index;
    intx::uint256 transaction_index;
    evmc::bytes32 transaction_hash;
    evmc::bytes32 block_hash;
    intx::uint256 block_number;
    std::optional<intx::uint256> block_timestamp;
    evmc::address address;
    evmc::bytes data;
    std::vector<evmc::bytes32> topics;

    friend bool operator==(const Log&, const Log&) = default;
};

void to_json(nlohmann::json& json, const Log& log);
void from_json(const nlohmann::json& json, Log& log);

//! Log filter criterion: any value (monostate), exactly one value, or one of several values
template <typename T>
using FilterValue = std::variant<std::monostate, T, std::vector<T>>;

//! Inclusive range of blocks scanned by a log filter
struct BlockRange {
    BlockSpec from;
    BlockSpec to;

    friend bool operator==(const BlockRange&, const BlockRange&) = default;
};

//! Filter of eth_getLogs, selecting blocks either by range or by hash (EIP-234)
struct LogFilter {
    static constexpr size_t kMaxTopics{4};

    std::variant<BlockRange, evmc::bytes32> blocks;
    FilterValue<evmc::address> address;
    //! Positional topic criteria, at most kMaxTopics
    std::vector<FilterValue<evmc::bytes32>> topics;

    friend bool operator==(const LogFilter&, const LogFilter&) = default;
};

void to_json(nlohmann::json& json, const LogFilter& filter);
void from_json(const nlohmann::json& json, LogFilter& filter);

//! Storage slot values keyed by slot
using StorageOverrides = std::map<evmc::bytes32, evmc::bytes32>;

//! Account fields replaced for the duration of one eth_call
struct AccountOverrides {
    std::optional<intx::uint256> balance;
    std::optional<uint64_t> nonce;
    std::optional<evmc::bytes> code;
    //! Replaces the whole account storage
    std::optional<StorageOverrides> state;
    //! Replaces individual storage slots
    std::optional<StorageOverrides> state_diff;
    std::optional<evmc::address> move_precompile_to_address;

    friend bool operator==(const AccountOverrides&, const AccountOverrides&) = default;
};

void to_json(nlohmann::json& json, const AccountOverrides& overrides);
void from_json(const nlohmann::json& json, AccountOverrides& overrides);

//! State overrides of eth_call, encoded as an object keyed by account address
using StateOverrides = std::map<evmc::address, AccountOverrides>;

void to_json(nlohmann::json& json, const StateOverrides& overrides);
void from_json(const nlohmann::json& json, StateOverrides& overrides);

}  // namespace ethrpc::eth
