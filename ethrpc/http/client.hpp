// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <ethrpc/client/transport.hpp>
#include <ethrpc/http/url.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/jsonrpc/batch.hpp>
#include <ethrpc/jsonrpc/call.hpp>
#include <ethrpc/jsonrpc/method.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

namespace ethrpc::http {

//! Name of the environment variable holding the node URL
inline constexpr const char* kUrlEnvVar{"ETHRPC"};

struct ClientSettings {
    //! Deadline for connecting and for each request/response exchange
    std::chrono::milliseconds timeout{std::chrono::seconds{30}};
    std::string user_agent{"ethrpc"};
    //! Largest accepted response body in bytes: a batch of hydrated blocks easily exceeds the Beast default of 8MiB
    std::uint64_t max_response_size{64 * 1024 * 1024};
};

//! The node answered with a non-success HTTP status
class StatusError : public std::runtime_error {
  public:
    StatusError(unsigned int status, std::string body);

    unsigned int status() const noexcept { return status_; }
    const std::string& body() const noexcept { return body_; }

  private:
    unsigned int status_;
    std::string body_;
};

/**
 * JSON RPC client over HTTP/1.1, posting each request body to the node URL.
 * A single keep-alive connection is opened lazily and reopened after any failure.
 * \warning one round trip at a time: share it between concurrent callers through client::BufferedClient
 */
class Client : public client::Transport {
  public:
    Client(const boost::asio::any_io_executor& executor, Url url, ClientSettings settings = {});

    //! Build a client for the URL read from the ETHRPC environment variable
    static Client from_env(const boost::asio::any_io_executor& executor);

    Task<std::string> roundtrip(std::string body) override;
    bool supports_concurrency() const override { return false; }

    template <jsonrpc::Method M>
    Task<typename M::Result> call(M method, typename M::Params params) {
        return jsonrpc::call_async(std::move(method), std::move(params), roundtrip_function());
    }

    template <jsonrpc::Method M>
        requires std::same_as<typename M::Params, jsonrpc::Empty>
    Task<typename M::Result> exec(M method) {
        return jsonrpc::call_async(std::move(method), jsonrpc::Empty{}, roundtrip_function());
    }

    //! Execute a batch, throwing RpcError for the first failed call
    template <jsonrpc::batch::Batch B>
    Task<typename jsonrpc::batch::BatchTraits<B>::Values> batch(B batch) {
        return jsonrpc::batch::call_async(std::move(batch), roundtrip_function());
    }

    //! Execute a batch, returning the outcome of each call
    template <jsonrpc::batch::Batch B>
    Task<typename jsonrpc::batch::BatchTraits<B>::Results> try_batch(B batch) {
        return jsonrpc::batch::try_call_async(std::move(batch), roundtrip_function());
    }

    const Url& url() const { return url_; }
    bool is_connected() const { return stream_.has_value(); }

  private:
    auto roundtrip_function() {
        return [this](std::string body) { return roundtrip(std::move(body)); };
    }

    Task<void> connect();
    void disconnect();

    boost::asio::any_io_executor executor_;
    Url url_;
    ClientSettings settings_;
    std::optional<boost::beast::tcp_stream> stream_;
    boost::beast::flat_buffer buffer_;
    bool in_flight_{false};
};

}  // namespace ethrpc::http
