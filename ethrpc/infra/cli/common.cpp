// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>

#include <ethrpc/http/url.hpp>

namespace ethrpc::cmd::common {

UrlValidator::UrlValidator() {
    name_ = "URL";
    func_ = [](const std::string& value) -> std::string {
        try {
            http::Url::parse(value);
        } catch (const std::invalid_argument& ex) {
            return "Value " + value + " is not a valid node URL: " + ex.what();
        }
        return {};
    };
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    static const std::map<std::string, log::Level> kLevelNames{
        {"crit", log::Level::kCritical},
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warn", log::Level::kWarning},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& group = *cli.add_option_group("Log", "Logging options");
    group.add_option("--log.verbosity", log_settings.log_verbosity, "Least severe level printed (crit, error, warn, info, debug, trace)")
        ->transform(CLI::CheckedTransformer(kLevelNames, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    group.add_flag("--log.stdout", log_settings.log_std_out, "Write log lines to standard output");
    group.add_flag("--log.nocolor", log_settings.log_nocolor, "Never colorize log lines");
    group.add_flag("--log.utc", log_settings.log_utc, "Print timestamps in UTC");
    group.add_flag("--log.threads", log_settings.log_threads, "Tag log lines with the thread name");
}

void add_buffered_options(CLI::App& cli, client::BufferedSettings& settings) {
    auto& buffer_opts = *cli.add_option_group("Buffer", "Call coalescing options");
    buffer_opts.add_option_function<std::size_t>(
                   "--buffer.concurrency",
                   [&settings](const std::size_t& value) {
                       settings.max_concurrent_requests = value == 0 ? std::nullopt : std::optional<std::size_t>{value};
                   },
                   "Maximum number of chunks in flight at the same time (0 means no limit)")
        ->default_val(1);
    buffer_opts.add_option("--buffer.batch_size", settings.max_batch_size, "Maximum number of calls coalesced into one batch")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    buffer_opts.add_option_function<uint32_t>(
                   "--buffer.delay",
                   [&settings](const uint32_t& value) { settings.coalescing_delay = std::chrono::milliseconds{value}; },
                   "Time in milliseconds spent collecting more calls after the first one")
        ->default_val(0);
}

void add_http_options(CLI::App& cli, http::ClientSettings& settings) {
    auto& http_opts = *cli.add_option_group("HTTP", "HTTP transport options");
    http_opts.add_option_function<uint32_t>(
                 "--http.timeout",
                 [&settings](const uint32_t& value) { settings.timeout = std::chrono::milliseconds{value}; },
                 "Deadline in milliseconds for each request/response exchange")
        ->check(CLI::PositiveNumber)
        ->default_val(settings.timeout.count());
    http_opts.add_option("--http.user_agent", settings.user_agent, "User-Agent header sent to the node")
        ->capture_default_str();
    http_opts.add_option("--http.max_response_size", settings.max_response_size, "Largest accepted response body in bytes")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
}

void add_option_url(CLI::App& cli, std::string& url) {
    cli.add_option("--url", url, std::string{"Node endpoint URL (default: value of "} + http::kUrlEnvVar + ")")
        ->envname(http::kUrlEnvVar)
        ->required()
        ->check(UrlValidator{});
}

}  // namespace ethrpc::cmd::common
