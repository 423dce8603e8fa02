// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace ethrpc::http {

//! Location of a node JSON RPC endpoint: http://host[:port][/target]
struct Url {
    std::string host;
    std::string port{"80"};
    std::string target{"/"};

    //! Parse an URL string, throwing std::invalid_argument if malformed or not plain HTTP
    static Url parse(std::string_view url);

    std::string to_string() const;

    friend bool operator==(const Url&, const Url&) = default;
};

std::ostream& operator<<(std::ostream& out, const Url& url);

}  // namespace ethrpc::http
