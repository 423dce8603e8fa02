// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <cstdlib>
#include <stdexcept>

#include <ethrpc/infra/common/ensure.hpp>
#include <ethrpc/infra/common/log.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/system_error.hpp>

namespace ethrpc::http {

namespace beast_http = boost::beast::http;

StatusError::StatusError(unsigned int status, std::string body)
    : std::runtime_error{"HTTP " + std::to_string(status) + " error: " + body},
      status_{status},
      body_{std::move(body)} {}

Client::Client(const boost::asio::any_io_executor& executor, Url url, ClientSettings settings)
    : executor_{executor}, url_{std::move(url)}, settings_{std::move(settings)} {}

Client Client::from_env(const boost::asio::any_io_executor& executor) {
    const char* url = std::getenv(kUrlEnvVar);
    if (url == nullptr) {
        throw std::invalid_argument{std::string{"missing "} + kUrlEnvVar + " environment variable"};
    }
    return Client{executor, Url::parse(url)};
}

Task<std::string> Client::roundtrip(std::string body) {
    ensure_invariant(!in_flight_, "HTTP client round trips cannot overlap");
    in_flight_ = true;
    struct InFlightGuard {
        bool& flag;
        ~InFlightGuard() { flag = false; }
    } guard{in_flight_};

    if (!stream_) {
        co_await connect();
    }

    beast_http::request<beast_http::string_body> request{beast_http::verb::post, url_.target, 11};
    request.set(beast_http::field::host, url_.host);
    request.set(beast_http::field::user_agent, settings_.user_agent);
    request.set(beast_http::field::content_type, "application/json");
    request.keep_alive(true);
    request.body() = std::move(body);
    request.prepare_payload();

    beast_http::response_parser<beast_http::string_body> parser;
    parser.body_limit(settings_.max_response_size);
    try {
        stream_->expires_after(settings_.timeout);
        co_await beast_http::async_write(*stream_, request, boost::asio::use_awaitable);
        co_await beast_http::async_read(*stream_, buffer_, parser, boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        ETHRPC_DEBUG << "HTTP round trip to " << url_ << " failed: " << se.what();
        disconnect();
        throw;
    }
    auto response = parser.release();
    if (!response.keep_alive()) {
        disconnect();
    }

    const auto status = response.result_int();
    ETHRPC_TRACE << "HTTP round trip to " << url_ << " status=" << status << " size=" << response.body().size();
    if (status < 200 || status >= 300) {
        throw StatusError{status, std::move(response.body())};
    }
    co_return std::move(response.body());
}

Task<void> Client::connect() {
    boost::asio::ip::tcp::resolver resolver{executor_};
    const auto endpoints = co_await resolver.async_resolve(url_.host, url_.port, boost::asio::use_awaitable);

    boost::beast::tcp_stream stream{executor_};
    stream.expires_after(settings_.timeout);
    co_await stream.async_connect(endpoints, boost::asio::use_awaitable);
    stream_.emplace(std::move(stream));
    buffer_.clear();
    ETHRPC_DEBUG << "HTTP connection to " << url_ << " established";
}

void Client::disconnect() {
    if (stream_) {
        boost::system::error_code ec;
        stream_->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        if (ec) {
            ETHRPC_TRACE << "HTTP connection to " << url_ << " shutdown: " << ec.message();
        }
        stream_.reset();
    }
    buffer_.clear();
}

}  // namespace ethrpc::http
