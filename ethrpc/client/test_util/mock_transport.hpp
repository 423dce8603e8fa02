// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <gmock/gmock.h>

#include <ethrpc/client/transport.hpp>
#include <ethrpc/infra/concurrency/task.hpp>

namespace ethrpc::client::test_util {

class MockTransport : public Transport {  // NOLINT
  public:
    MOCK_METHOD((Task<std::string>), roundtrip, (std::string), (override));
    MOCK_METHOD(bool, supports_concurrency, (), (const, override));
};

}  // namespace ethrpc::client::test_util
