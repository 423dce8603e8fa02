// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include <ethrpc/client/settings.hpp>
#include <ethrpc/http/client.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::cmd::common {

//! CLI11 validator accepting only node endpoints in the form http://host[:port][/path]
struct UrlValidator : public CLI::Validator {
    UrlValidator();
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options to populate buffered client settings after cli.parse()
void add_buffered_options(CLI::App& cli, client::BufferedSettings& settings);

//! \brief Set up options to populate HTTP transport settings after cli.parse()
void add_http_options(CLI::App& cli, http::ClientSettings& settings);

//! \brief Set up option for the node endpoint URL, defaulting to the environment variable if present
void add_option_url(CLI::App& cli, std::string& url);

}  // namespace ethrpc::cmd::common
