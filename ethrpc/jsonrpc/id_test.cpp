// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "id.hpp"

#include <set>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/jsonrpc/value.hpp>

namespace ethrpc::jsonrpc {

TEST_CASE("Id::next", "[jsonrpc][id]") {
    SECTION("strictly increasing") {
        auto previous = Id::next();
        for (int i{0}; i < 100; ++i) {
            const auto id = Id::next();
            CHECK(id > previous);
            previous = id;
        }
    }

    SECTION("unique across threads") {
        constexpr int kThreads{4};
        constexpr int kIdsPerThread{1000};
        std::vector<std::vector<Id>> ids(kThreads);
        std::vector<std::thread> threads;
        for (int t{0}; t < kThreads; ++t) {
            threads.emplace_back([&ids, t]() {
                for (int i{0}; i < kIdsPerThread; ++i) {
                    ids[t].push_back(Id::next());
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        std::set<Id> all;
        for (const auto& thread_ids : ids) {
            all.insert(thread_ids.cbegin(), thread_ids.cend());
        }
        CHECK(all.size() == kThreads * kIdsPerThread);
    }
}

TEST_CASE("Id JSON", "[jsonrpc][id]") {
    CHECK(nlohmann::json(Id{42}) == nlohmann::json(42));
    CHECK(nlohmann::json(42).get<Id>() == Id{42});
    CHECK(nlohmann::json(4294967295u).get<Id>() == Id{4294967295u});

    CHECK_THROWS_AS(nlohmann::json(4294967296u).get<Id>(), JsonError);
    CHECK_THROWS_AS(nlohmann::json(-1).get<Id>(), JsonError);
    CHECK_THROWS_AS(nlohmann::json(1.5).get<Id>(), JsonError);
    CHECK_THROWS_AS(nlohmann::json("1").get<Id>(), JsonError);
}

}  // namespace ethrpc::jsonrpc
