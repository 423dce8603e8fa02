// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hex.hpp"

#include <cstring>
#include <limits>
#include <utility>

#include <evmc/hex.hpp>

#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::eth {

using jsonrpc::JsonError;

namespace {

    constexpr size_t kMaxQuantityDigits{64};

    std::string_view strip_prefix(std::string_view hex, std::string_view what) {
        if (hex.size() < 2 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
            throw JsonError{std::string{what} + " missing '0x' prefix: " + std::string{hex}};
        }
        return hex.substr(2);
    }

    bool is_hex_digit(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    const std::string& expect_string(const nlohmann::json& json, std::string_view what) {
        if (!json.is_string()) {
            throw JsonError{"expected " + std::string{what} + " string but got " + json.dump()};
        }
        return json.get_ref<const std::string&>();
    }

}  // namespace

std::string to_quantity(const intx::uint256& value) {
    return "0x" + intx::hex(value);
}

intx::uint256 from_quantity(std::string_view quantity) {
    const auto digits = strip_prefix(quantity, "quantity");
    if (digits.empty() || digits.size() > kMaxQuantityDigits) {
        throw JsonError{"invalid quantity length: " + std::string{quantity}};
    }
    for (const char c : digits) {
        if (!is_hex_digit(c)) {
            throw JsonError{"invalid hex digit in quantity: " + std::string{quantity}};
        }
    }
    return intx::from_string<intx::uint256>("0x" + std::string{digits});
}

uint64_t from_quantity_u64(std::string_view quantity) {
    const auto value = from_quantity(quantity);
    if (value > std::numeric_limits<uint64_t>::max()) {
        throw JsonError{"quantity does not fit 64 bits: " + std::string{quantity}};
    }
    return static_cast<uint64_t>(value);
}

std::string to_hex(evmc::bytes_view bytes) {
    return "0x" + evmc::hex(bytes);
}

evmc::bytes from_hex(std::string_view hex) {
    const auto digits = strip_prefix(hex, "bytes");
    if (digits.size() % 2 != 0) {
        throw JsonError{"odd number of digits in hex string: " + std::string{hex}};
    }
    auto bytes = evmc::from_hex(digits);
    if (!bytes) {
        throw JsonError{"invalid hex string: " + std::string{hex}};
    }
    return std::move(*bytes);
}

evmc::bytes from_hex(std::string_view hex, size_t expected_size) {
    auto bytes = from_hex(hex);
    if (bytes.size() != expected_size) {
        throw JsonError{"expected " + std::to_string(expected_size) + " bytes but got " +
                        std::to_string(bytes.size()) + ": " + std::string{hex}};
    }
    return bytes;
}

}  // namespace ethrpc::eth

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = ethrpc::eth::to_hex(bytes_view{addr.bytes, sizeof(addr.bytes)});
}

void from_json(const nlohmann::json& json, address& addr) {
    const auto bytes = ethrpc::eth::from_hex(ethrpc::eth::expect_string(json, "address"), sizeof(addr.bytes));
    std::memcpy(addr.bytes, bytes.data(), sizeof(addr.bytes));
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = ethrpc::eth::to_hex(bytes_view{b32.bytes, sizeof(b32.bytes)});
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto bytes = ethrpc::eth::from_hex(ethrpc::eth::expect_string(json, "hash"), sizeof(b32.bytes));
    std::memcpy(b32.bytes, bytes.data(), sizeof(b32.bytes));
}

}  // namespace evmc

namespace intx {

void to_json(nlohmann::json& json, const uint256& ui256) {
    json = ethrpc::eth::to_quantity(ui256);
}

void from_json(const nlohmann::json& json, uint256& ui256) {
    ui256 = ethrpc::eth::from_quantity(ethrpc::eth::expect_string(json, "quantity"));
}

}  // namespace intx
