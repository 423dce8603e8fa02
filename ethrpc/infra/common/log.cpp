// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <unistd.h>

namespace ethrpc::log {

namespace {

    constexpr std::string_view kReset{"\x1b[0m"};
    constexpr std::string_view kTimestampColor{"\x1b[97m"};
    constexpr std::string_view kKeyColor{"\x1b[32m"};

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    // Indexed by Level
    constexpr std::array<LevelStyle, 7> kLevelStyles{{
        {"     ", "\x1b[0m"},
        {" CRIT", "\x1b[101m"},
        {"ERROR", "\x1b[91m"},
        {" WARN", "\x1b[1;33m"},
        {" INFO", "\x1b[32m"},
        {"DEBUG", "\x1b[105m"},
        {"TRACE", "\x1b[90m"},
    }};

    constexpr size_t kThreadNameWidth{11};
    constexpr int kMessageWidth{41};

    Settings settings;
    bool color_output{false};
    std::mutex output_mutex;
    thread_local std::string thread_name;

    const std::string& current_thread_name() {
        if (thread_name.empty()) {
            std::ostringstream id;
            id << std::this_thread::get_id();
            thread_name = id.str();
        }
        return thread_name;
    }

    std::ostream& output() { return settings.log_std_out ? std::cout : std::cerr; }

}  // namespace

void init(const Settings& s) {
    settings = s;
    const bool is_tty = ::isatty(::fileno(settings.log_std_out ? stdout : stderr)) != 0;
    color_output = is_tty && !settings.log_nocolor;
}

Level get_verbosity() { return settings.log_verbosity; }

void set_verbosity(Level level) { settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name = name;
    thread_name.resize(kThreadNameWidth, ' ');
}

Line::Line(Level level) : enabled_{test_verbosity(level)}, colored_{color_output} {
    if (enabled_) write_prefix(level);
}

Line::Line(Level level, std::string_view message, const Args& args) : Line(level) {
    if (enabled_) write_message(message, args);
}

Line::~Line() {
    if (!enabled_) return;
    if (colored_) text_ << kReset;
    text_ << '\n';
    const std::string line{text_.str()};
    std::scoped_lock lock{output_mutex};
    output() << line << std::flush;
}

void Line::write_prefix(Level level) {
    const auto& style = kLevelStyles[static_cast<size_t>(level)];
    const absl::TimeZone tz{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const std::string timestamp{absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz)};
    if (colored_) {
        text_ << ' ' << style.color << style.tag << kReset << ' ' << kTimestampColor << '[' << timestamp << "] " << kReset;
    } else {
        text_ << ' ' << style.tag << " [" << timestamp << "] ";
    }
    if (settings.log_threads) {
        text_ << '[' << current_thread_name() << "] ";
    }
}

void Line::write_message(std::string_view message, const Args& args) {
    text_ << std::left << std::setw(kMessageWidth) << message;
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key = i % 2 == 0;
        if (is_key && colored_) {
            text_ << kKeyColor << args[i] << kReset << '=';
        } else if (is_key) {
            text_ << args[i] << '=';
        } else {
            text_ << args[i] << ' ';
        }
    }
}

}  // namespace ethrpc::log
