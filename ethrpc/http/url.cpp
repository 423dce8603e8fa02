// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "url.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

namespace ethrpc::http {

static constexpr std::string_view kScheme{"http://"};

Url Url::parse(std::string_view url) {
    if (!absl::StartsWithIgnoreCase(url, kScheme)) {
        throw std::invalid_argument{"unsupported URL scheme, expected " + std::string{kScheme} + ": " + std::string{url}};
    }
    std::string_view rest = url.substr(kScheme.size());

    Url result;
    const auto slash = rest.find('/');
    if (slash != std::string_view::npos) {
        result.target = std::string{rest.substr(slash)};
        rest = rest.substr(0, slash);
    }

    std::string_view host = rest;
    std::optional<std::string_view> port;
    if (absl::StartsWith(rest, "[")) {
        // IPv6 literal, e.g. [::1]:8545
        const auto closing = rest.find(']');
        if (closing == std::string_view::npos) {
            throw std::invalid_argument{"invalid IPv6 host in URL: " + std::string{url}};
        }
        host = rest.substr(1, closing - 1);
        const auto after = rest.substr(closing + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw std::invalid_argument{"invalid URL: " + std::string{url}};
            }
            port = after.substr(1);
        }
    } else if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        host = rest.substr(0, colon);
        port = rest.substr(colon + 1);
    }

    if (host.empty()) {
        throw std::invalid_argument{"missing host in URL: " + std::string{url}};
    }
    result.host = std::string{host};

    if (port) {
        uint32_t port_number{0};
        if (port->empty() || !absl::SimpleAtoi(*port, &port_number) || port_number == 0 || port_number > 65535) {
            throw std::invalid_argument{"invalid port in URL: " + std::string{url}};
        }
        result.port = std::to_string(port_number);
    }
    return result;
}

std::string Url::to_string() const {
    const bool ipv6 = host.find(':') != std::string::npos;
    return std::string{kScheme} + (ipv6 ? "[" + host + "]" : host) + ":" + port + target;
}

std::ostream& operator<<(std::ostream& out, const Url& url) {
    out << url.to_string();
    return out;
}

}  // namespace ethrpc::http
