// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <ethrpc/infra/concurrency/task.hpp>

namespace ethrpc::client {

//! Carries one serialized JSON RPC body to the node and returns the serialized response body
class Transport {
  public:
    virtual ~Transport() = default;

    //! One logical request produces exactly one logical response, or a transport failure is thrown
    virtual Task<std::string> roundtrip(std::string body) = 0;

    //! Whether several round trips may be in flight at the same time
    virtual bool supports_concurrency() const = 0;
};

}  // namespace ethrpc::client
