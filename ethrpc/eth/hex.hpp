// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <evmc/bytes.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

namespace ethrpc::eth {

//! \brief Encode an integer as Ethereum quantity: 0x-prefixed hex without leading zeros ("0x0" for zero)
std::string to_quantity(const intx::uint256& value);

//! \brief Decode an Ethereum quantity, throwing jsonrpc::JsonError on malformed or overflowing input
intx::uint256 from_quantity(std::string_view quantity);

//! \brief Decode an Ethereum quantity that must fit 64 bits
uint64_t from_quantity_u64(std::string_view quantity);

//! \brief Encode a string of bytes as 0x-prefixed lowercase hex ("0x" for empty)
std::string to_hex(evmc::bytes_view bytes);

//! \brief Decode 0x-prefixed hex with even number of digits, throwing jsonrpc::JsonError otherwise
evmc::bytes from_hex(std::string_view hex);

//! \brief Decode 0x-prefixed hex of exactly the given number of bytes
evmc::bytes from_hex(std::string_view hex, size_t expected_size);

}  // namespace ethrpc::eth

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

void to_json(nlohmann::json& json, const uint256& ui256);
void from_json(const nlohmann::json& json, uint256& ui256);

}  // namespace intx
