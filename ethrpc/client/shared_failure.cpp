// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "shared_failure.hpp"

#include <utility>

namespace ethrpc::client {

static std::string describe(const std::exception_ptr& cause) {
    if (!cause) {
        return "no failure recorded";
    }
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown failure";
    }
}

SharedFailure::SharedFailure(std::exception_ptr cause)
    : cause_{std::make_shared<const std::exception_ptr>(std::move(cause))},
      message_{"JSON RPC chunk failed: " + describe(*cause_)} {}

std::exception_ptr SharedFailure::duplicate() const {
    return std::make_exception_ptr(ChunkError{message_, cause_});
}

}  // namespace ethrpc::client
