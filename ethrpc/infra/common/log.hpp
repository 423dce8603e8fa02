// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ethrpc::log {

//! Severity of a log line, ordered from the most to the least important
enum class Level {
    kNone,      // Unconditional lines (banners, build info)
    kCritical,  // Broken library contract or unrecoverable failure
    kError,     // A call or chunk failed
    kWarning,   // Degraded operation the caller may want to look at
    kInfo,      // Regular operation
    kDebug,     // Chunk and connection lifecycle
    kTrace      // Per call details
};

struct Settings {
    bool log_std_out{false};  // print to std::cout instead of std::cerr
    bool log_utc{false};      // timestamps in UTC, local time zone otherwise
    bool log_nocolor{false};  // never emit ANSI escape sequences
    bool log_threads{false};  // tag lines with the thread name
    Level log_verbosity{Level::kInfo};
};

//! \brief Applies the settings to the process-wide logger
//! \note Call once from main before any thread starts logging
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! \brief Whether a line of the given level would reach the output
bool test_verbosity(Level level);

//! \brief Name printed for the calling thread when thread tagging is enabled
void set_thread_name(const char* name);

//! Alternating key and value strings appended to a line
using Args = std::vector<std::string>;

//! \brief One log line, written out atomically when it goes out of scope
class Line {
  public:
    explicit Line(Level level);
    Line(Level level, std::string_view message, const Args& args = {});
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        if (enabled_) text_ << value;
        return *this;
    }

  private:
    void write_prefix(Level level);
    void write_message(std::string_view message, const Args& args);

    const bool enabled_;
    const bool colored_;
    std::ostringstream text_;
};

}  // namespace ethrpc::log

#define ETHRPC_LOG_LINE(level_, ...)            \
    if (!ethrpc::log::test_verbosity(level_)) { \
    } else                                      \
        ethrpc::log::Line(level_ __VA_OPT__(, ) __VA_ARGS__)

#define ETHRPC_TRACE_M(...) ETHRPC_LOG_LINE(ethrpc::log::Level::kTrace, __VA_ARGS__)
#define ETHRPC_DEBUG_M(...) ETHRPC_LOG_LINE(ethrpc::log::Level::kDebug, __VA_ARGS__)
#define ETHRPC_INFO_M(...) ETHRPC_LOG_LINE(ethrpc::log::Level::kInfo, __VA_ARGS__)
#define ETHRPC_WARN_M(...) ETHRPC_LOG_LINE(ethrpc::log::Level::kWarning, __VA_ARGS__)
#define ETHRPC_ERROR_M(...) ETHRPC_LOG_LINE(ethrpc::log::Level::kError, __VA_ARGS__)
#define ETHRPC_CRIT_M(...) ETHRPC_LOG_LINE(ethrpc::log::Level::kCritical, __VA_ARGS__)

#define ETHRPC_TRACE ETHRPC_LOG_LINE(ethrpc::log::Level::kTrace)
#define ETHRPC_DEBUG ETHRPC_LOG_LINE(ethrpc::log::Level::kDebug)
#define ETHRPC_INFO ETHRPC_LOG_LINE(ethrpc::log::Level::kInfo)
#define ETHRPC_WARN ETHRPC_LOG_LINE(ethrpc::log::Level::kWarning)
#define ETHRPC_ERROR ETHRPC_LOG_LINE(ethrpc::log::Level::kError)
#define ETHRPC_CRIT ETHRPC_LOG_LINE(ethrpc::log::Level::kCritical)
