// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <cstdint>
#include <iosfwd>

#include <nlohmann/json.hpp>

namespace ethrpc::jsonrpc {

//! Request and response identifier.
//! 32-bit unsigned so that it always fits losslessly in a double and never has a fractional part.
//! Ids are allocated by the engine only, never supplied by callers.
struct Id {
    uint32_t value{0};

    //! Allocate the next id from the process-wide monotonic counter
    static Id next();

    friend auto operator<=>(const Id&, const Id&) = default;
};

std::ostream& operator<<(std::ostream& out, const Id& id);

void to_json(nlohmann::json& json, const Id& id);
void from_json(const nlohmann::json& json, Id& id);

}  // namespace ethrpc::jsonrpc
