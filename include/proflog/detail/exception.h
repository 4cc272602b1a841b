// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace proflog {

// Exception thrown when proflog::launch() cannot produce a running child.
// Carries the step of the launch sequence that failed and the errno it failed with.
class launch_error : public std::runtime_error {
public:
    enum class stage : uint32_t {
        prepare = 1,               // Request rejected before anything was allocated
        allocate_pipes,            // pipe2() for a standard stream or the progress channel
        open_error_channel,        // pipe2() for the error channel
        open_null_device,          // /dev/null for ignored streams
        fork,                      // fork() itself

        // Reported by the child between fork and exec
        rewire_stdin,
        rewire_stdout,
        rewire_stderr,
        change_directory,
        install_progress_channel,
        set_group,
        set_user,
        replace_program,

        read_error_channel         // The parent could not read a complete report
    };

    launch_error(stage s, int errno_value, std::string program = {})
        : std::runtime_error(build_message(s, errno_value, program))
        , m_stage(s)
        , m_errno(errno_value)
        , m_program(std::move(program))
    {}

    stage failed_stage() const { return m_stage; }
    int errno_value() const { return m_errno; }
    const std::string& program() const { return m_program; }

    // True when the failure happened in the child, after fork.
    bool in_launch_window() const
    {
        return m_stage >= stage::rewire_stdin && m_stage <= stage::replace_program;
    }

    static const char* describe(stage s)
    {
        switch (s) {
            case stage::prepare:                  return "invalid launch request";
            case stage::allocate_pipes:           return "could not allocate stream pipes";
            case stage::open_error_channel:       return "could not allocate the launch error channel";
            case stage::open_null_device:         return "could not open /dev/null";
            case stage::fork:                     return "fork failed";
            case stage::rewire_stdin:             return "could not set up stdin";
            case stage::rewire_stdout:            return "could not set up stdout";
            case stage::rewire_stderr:            return "could not set up stderr";
            case stage::change_directory:         return "could not change working directory";
            case stage::install_progress_channel: return "could not install the progress channel";
            case stage::set_group:                return "could not change group id";
            case stage::set_user:                 return "could not change user id";
            case stage::replace_program:          return "could not execute program";
            case stage::read_error_channel:       return "lost the launch error report";
        }
        return "unknown launch failure";
    }

private:
    static std::string build_message(stage s, int errno_value, const std::string& program)
    {
        std::ostringstream oss;
        if (!program.empty()) {
            oss << program << ": ";
        }
        oss << describe(s);
        if (errno_value != 0) {
            oss << " (" << std::strerror(errno_value) << ")";
        }
        return oss.str();
    }

    stage m_stage;
    int m_errno;
    std::string m_program;
};


// Exception thrown when the scratch workspace cannot be set up.
class workspace_error : public std::runtime_error {
public:
    workspace_error(const std::string& what, const std::string& path, int errno_value)
        : std::runtime_error(what + " " + path + (errno_value ? std::string(" (") + std::strerror(errno_value) + ")" : std::string()))
        , m_path(path)
        , m_errno(errno_value)
    {}

    const std::string& path() const { return m_path; }
    int errno_value() const { return m_errno; }

private:
    std::string m_path;
    int m_errno;
};

} // namespace proflog
