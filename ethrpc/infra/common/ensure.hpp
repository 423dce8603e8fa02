// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ethrpc {

//! Build the error reported when a lifecycle or ownership contract of the library is broken
inline std::logic_error invariant_violation(std::string_view what) {
    return std::logic_error{"Invariant violation: " + std::string{what}};
}

//! Raise a logic error carrying the message unless the condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! Like ensure, for conditions whose failure means a caller misused the library contract
inline void ensure_invariant(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw invariant_violation(message);
    }
}

}  // namespace ethrpc
