// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "url.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace ethrpc::http {

TEST_CASE("Url::parse", "[http][url]") {
    SECTION("host only") {
        const auto url = Url::parse("http://localhost");
        CHECK(url.host == "localhost");
        CHECK(url.port == "80");
        CHECK(url.target == "/");
    }

    SECTION("host and port") {
        const auto url = Url::parse("http://127.0.0.1:8545");
        CHECK(url.host == "127.0.0.1");
        CHECK(url.port == "8545");
        CHECK(url.target == "/");
    }

    SECTION("host, port and target") {
        const auto url = Url::parse("HTTP://node.example:8545/v3/key?x=1");
        CHECK(url.host == "node.example");
        CHECK(url.port == "8545");
        CHECK(url.target == "/v3/key?x=1");
        CHECK(url.to_string() == "http://node.example:8545/v3/key?x=1");
    }

    SECTION("IPv6 host") {
        const auto url = Url::parse("http://[::1]:8545/");
        CHECK(url.host == "::1");
        CHECK(url.port == "8545");
        CHECK(url.to_string() == "http://[::1]:8545/");
    }

    SECTION("invalid") {
        CHECK_THROWS_AS(Url::parse("https://localhost:8545"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("localhost:8545"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://:8545"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://localhost:0"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://localhost:70000"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://localhost:port"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://localhost:"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://localhost:/rpc"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://[::1]:"), std::invalid_argument);
        CHECK_THROWS_AS(Url::parse("http://[::1"), std::invalid_argument);
    }
}

}  // namespace ethrpc::http
