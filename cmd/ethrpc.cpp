// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <ethrpc/client/buffered_client.hpp>
#include <ethrpc/http/client.hpp>
#include <ethrpc/http/url.hpp>
#include <ethrpc/infra/cli/common.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/jsonrpc/error.hpp>
#include <ethrpc/jsonrpc/method.hpp>
#include <ethrpc/jsonrpc/value.hpp>

using namespace ethrpc;
using namespace ethrpc::cmd::common;

struct Settings {
    log::Settings log_settings;
    std::string url;
    std::string method{"eth_blockNumber"};
    std::string params{"[]"};
    std::size_t repeat{1};
    client::BufferedSettings buffered_settings;
    http::ClientSettings http_settings;
};

Settings parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"Ethereum JSON RPC command line client"};

    try {
        Settings settings;
        add_logging_options(cli, settings.log_settings);
        add_option_url(cli, settings.url);
        cli.add_option("--method", settings.method, "JSON RPC method name")
            ->capture_default_str();
        cli.add_option("--params", settings.params, "JSON RPC params as JSON text")
            ->capture_default_str();
        cli.add_option("--repeat", settings.repeat, "Number of concurrent calls issued through the buffered client")
            ->check(CLI::PositiveNumber)
            ->capture_default_str();
        add_buffered_options(cli, settings.buffered_settings);
        add_http_options(cli, settings.http_settings);

        cli.parse(argc, argv);

        return settings;
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }
}

int main(int argc, char* argv[]) {
    try {
        const Settings settings = parse_cli_settings(argc, argv);

        log::init(settings.log_settings);
        log::set_thread_name("main");

        const auto params = jsonrpc::Value::parse(settings.params);

        boost::asio::io_context ioc;
        auto transport = std::make_shared<http::Client>(ioc.get_executor(), http::Url::parse(settings.url), settings.http_settings);
        client::BufferedClient client{ioc.get_executor(), transport, settings.buffered_settings};

        ETHRPC_INFO_M("Issuing calls", {"url", settings.url, "method", settings.method, "repeat", std::to_string(settings.repeat)});

        std::size_t pending{settings.repeat};
        std::size_t failures{0};
        for (std::size_t i{0}; i < settings.repeat; ++i) {
            boost::asio::co_spawn(
                ioc,
                client.call(jsonrpc::DynamicMethod{settings.method}, params),
                [&, i](const std::exception_ptr& ex, jsonrpc::Value result) {
                    if (ex) {
                        ++failures;
                        try {
                            std::rethrow_exception(ex);
                        } catch (const jsonrpc::RpcError& e) {
                            ETHRPC_ERROR_M("Call rejected by node", {"call", std::to_string(i), "error", e.what()});
                        } catch (const std::exception& e) {
                            ETHRPC_ERROR_M("Call failed", {"call", std::to_string(i), "error", e.what()});
                        }
                    } else {
                        std::cout << result << "\n";
                    }
                    if (--pending == 0) {
                        client.close();
                    }
                });
        }

        ioc.run();

        ETHRPC_INFO_M("Calls completed", {"succeeded", std::to_string(settings.repeat - failures), "failed", std::to_string(failures)});
        return failures == 0 ? 0 : 1;
    } catch (const CLI::ParseError&) {
        return -1;
    } catch (const std::exception& e) {
        ETHRPC_CRIT << "ethrpc exiting due to exception: " << e.what();
        return -2;
    }
}
