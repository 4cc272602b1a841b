// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "exception.h"
#include "unique_fd.h"
#include "utility.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace proflog {


// One-shot handoff from the fork child to the parent.
//
// The channel carries at most one fixed-width value. The child writes it only
// when a step between fork and exec fails; on a successful exec the
// close-on-exec write end disappears, and the parent reads end-of-file with no
// data. Either way the parent learns the outcome from a single read.
class Error_channel
{
public:
    using payload_type = uint64_t;

    Error_channel() = default;
    Error_channel(const Error_channel&) = delete;
    Error_channel& operator=(const Error_channel&) = delete;

    void open(const std::string& program = {})
    {
        int fds[2] = {-1, -1};
        if (detail::call_pipe2(fds, O_CLOEXEC) != 0) {
            throw launch_error(launch_error::stage::open_error_channel, errno, program);
        }
        if (!detail::lift_descriptor(fds[0], progress_fileno) ||
            !detail::lift_descriptor(fds[1], progress_fileno)) {
            const int saved_errno = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            throw launch_error(launch_error::stage::open_error_channel, saved_errno, program);
        }
        m_read_end.reset(fds[0]);
        m_write_end.reset(fds[1]);
    }

    static payload_type encode(launch_error::stage s, int errno_value) noexcept
    {
        return (static_cast<payload_type>(s) << 32) | static_cast<uint32_t>(errno_value);
    }

    static std::optional<launch_error::stage> decode_stage(payload_type payload) noexcept
    {
        const auto raw = static_cast<uint32_t>(payload >> 32);
        if (raw < static_cast<uint32_t>(launch_error::stage::prepare) ||
            raw > static_cast<uint32_t>(launch_error::stage::read_error_channel)) {
            return std::nullopt;
        }
        return static_cast<launch_error::stage>(raw);
    }

    static int decode_errno(payload_type payload) noexcept
    {
        return static_cast<int>(static_cast<uint32_t>(payload & 0xffffffffu));
    }

    // Child side. Runs between fork and exec: no allocation, no exit
    // handlers, no stdio flushing. atexit hooks inherited from the parent
    // must not run a second time here.
    [[noreturn]] void report_and_exit(launch_error::stage s, int errno_value) const noexcept
    {
        const payload_type payload = encode(s, errno_value);
        (void)detail::write_fully(m_write_end.get(), &payload, sizeof(payload));
        ::_exit(EXIT_FAILURE);
    }

    // Parent side, after fork. Drops the parent's copy of the write end (so
    // that the child's exec is observable as end-of-file), then performs the
    // single read. Returns the decoded failure, or nothing when the child
    // reached exec.
    std::optional<launch_error> receive(const std::string& program = {})
    {
        m_write_end.reset();

        payload_type payload = 0;
        int read_errno = 0;
        const auto result = detail::read_fully(m_read_end.get(), &payload, sizeof(payload), &read_errno);
        m_read_end.reset();

        switch (result) {
            case detail::Read_result::Eof:
                return std::nullopt;
            case detail::Read_result::Error:
                return launch_error(launch_error::stage::read_error_channel, read_errno, program);
            case detail::Read_result::Value:
                break;
        }

        const auto s = decode_stage(payload);
        if (!s) {
            return launch_error(launch_error::stage::read_error_channel, EPROTO, program);
        }
        return launch_error(*s, decode_errno(payload), program);
    }

    int write_end() const { return m_write_end.get(); }
    bool is_open() const { return m_read_end.valid() || m_write_end.valid(); }

private:
    Unique_fd m_read_end;
    Unique_fd m_write_end;
};

} // namespace proflog
