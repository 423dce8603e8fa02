// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace ethrpc::client {

struct BufferedSettings {
    //! The maximum number of chunks in flight at the same time: no limit if empty
    std::optional<std::size_t> max_concurrent_requests{1};
    //! The maximum number of calls in one chunk
    std::size_t max_batch_size{20};
    //! Additional time to collect calls into a chunk, counted from the first call entering it
    std::chrono::milliseconds coalescing_delay{0};
};

}  // namespace ethrpc::client
