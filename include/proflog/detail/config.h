// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string_view>

// Supervision loop policy
// =======================

// The log loop wakes up at least every poll_wait, drains whatever became
// readable and redraws the live line. Stack samples are requested on a much
// coarser cadence, so that the child is not flooded with signals.

namespace proflog {

    // Upper bound of a single poll() wait in the log loop. This is also the
    // refresh rate of the elapsed-time counter on the live line.
    constexpr std::chrono::milliseconds poll_wait                       {50};

    // Minimum distance between two sample-file checks (and thus between two
    // refresh signals sent to the child).
    constexpr std::chrono::milliseconds default_sample_interval         {500};

    // Size of the loop-scoped buffer used for each read() on a child stream.
    constexpr size_t    read_buffer_size                                = 64 * 1024;

    // Only this many bytes at the end of a sample file are mapped. A sample
    // record longer than the window is reported as the placeholder.
    constexpr size_t    sample_tail_window                              = 4096;

    // Displayed instead of a sample that could not be read.
    constexpr std::string_view sample_placeholder                       = "?";

    // Descriptor number on which the child finds the progress channel.
    // It must be the first descriptor after stdin/stdout/stderr.
    constexpr int       progress_fileno                                 = 3;

    // Columns assumed when the terminal cannot be queried.
    constexpr int       fallback_terminal_columns                       = 80;

    // Columns taken by "MM:SS.mmm │ " and "executing │ " on a rendered row,
    // plus a margin for wide glyphs.
    constexpr int       render_prefix_columns                           = 15;

    // Exit codes
    constexpr int       exit_code_usage                                 = 2;
    constexpr int       exit_code_stopped                               = 1;
    constexpr int       exit_code_unexpected_wait                       = 42;
    constexpr int       exit_code_signal_base                           = 128;
    constexpr int       exit_code_not_executable                        = 126;
    constexpr int       exit_code_not_found                             = 127;
    constexpr int       exit_code_launch_failure                        = 1;

    // Names shared with the instrumentation payload.
    constexpr const char* stacktrace_dir_variable                       = "PROFLOG_STACKTRACE_DIR";
    constexpr const char* progress_fd_variable                          = "PROFLOG_PROGRESS_FD";
    constexpr const char* payload_file_name                             = "sitecustomize.py";
    constexpr const char* scratch_prefix                                = "proflog";

    // Suffixes tried before giving up on creating a scratch directory.
    constexpr int       max_scratch_attempts                            = 10000;


namespace detail {

inline bool env_flag(const char* name, bool default_value)
{
    const char* env = std::getenv(name);
    if (!env || *env == '\0') {
        return default_value;
    }
    std::string_view value(env);
    if (value == "0" || value == "false" || value == "FALSE" || value == "False") {
        return false;
    }
    return true;
}

} // namespace detail


inline bool color_enabled()
{
    static const bool enabled = detail::env_flag("PROFLOG_COLOR", true);
    return enabled;
}

inline bool trace_enabled()
{
    static const bool enabled = detail::env_flag("PROFLOG_TRACE", false);
    return enabled;
}

inline std::chrono::milliseconds sample_interval()
{
    static const std::chrono::milliseconds interval = [] {
        const char* env = std::getenv("PROFLOG_SAMPLE_INTERVAL_MS");
        if (!env || *env == '\0') {
            return default_sample_interval;
        }
        char* end = nullptr;
        const long value = std::strtol(env, &end, 10);
        if (end == env || *end != '\0' || value <= 0) {
            return default_sample_interval;
        }
        return std::chrono::milliseconds(value);
    }();
    return interval;
}

} // namespace proflog
