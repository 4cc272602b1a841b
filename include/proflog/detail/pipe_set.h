// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "exception.h"
#include "logging.h"
#include "unique_fd.h"
#include "utility.h"

#include <cerrno>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace proflog {


// What the child gets on one of its standard streams.
enum class Stdio
{
    inherit,    // the parent's descriptor, untouched
    pipe,       // one end of a fresh pipe, the other end stays with the parent
    ignore,     // /dev/null
    close       // no descriptor at all
};


struct Stdio_dispositions
{
    Stdio stdin_mode  = Stdio::inherit;
    Stdio stdout_mode = Stdio::inherit;
    Stdio stderr_mode = Stdio::inherit;

    // With stdout_mode == pipe, the child's stderr is written into the stdout
    // pipe and stderr_mode is not consulted.
    bool merge_stderr = false;

    // Extra non-blocking pipe whose write end the child finds on progress_fileno.
    bool progress_channel = false;

    bool merged() const { return merge_stderr && stdout_mode == Stdio::pipe; }

    Stdio effective_stderr_mode() const { return merged() ? Stdio::pipe : stderr_mode; }

    bool any_ignored() const
    {
        return stdin_mode == Stdio::ignore ||
               stdout_mode == Stdio::ignore ||
               effective_stderr_mode() == Stdio::ignore;
    }
};


struct Pipe
{
    Unique_fd read_end;
    Unique_fd write_end;

    bool allocated() const { return read_end.valid() || write_end.valid(); }

    void destroy() noexcept
    {
        read_end.reset();
        write_end.reset();
    }
};


// The set of pipes needed for one launch. Every descriptor is created with
// close-on-exec and lifted above progress_fileno, so that the child's rewiring
// onto the fixed numbers 0..3 never overwrites a descriptor it still needs.
class Pipe_set
{
public:
    Pipe_set() = default;
    Pipe_set(Pipe_set&&) = default;
    Pipe_set& operator=(Pipe_set&&) = default;
    ~Pipe_set() { destroy(); }

    static Pipe_set allocate(const Stdio_dispositions& stdio, const std::string& program = {})
    {
        Pipe_set set;
        set.m_merged = stdio.merged();

        // Any failure below unwinds through ~Pipe_set, which closes the
        // pipes that were already made.
        if (stdio.stdin_mode == Stdio::pipe) {
            make_pipe(set.m_stdin, O_CLOEXEC, program);
        }
        if (stdio.stdout_mode == Stdio::pipe) {
            make_pipe(set.m_stdout, O_CLOEXEC, program);
        }
        if (stdio.stderr_mode == Stdio::pipe && !set.m_merged) {
            make_pipe(set.m_stderr, O_CLOEXEC, program);
        }
        if (stdio.progress_channel) {
            make_pipe(set.m_progress, O_CLOEXEC | O_NONBLOCK, program);
        }
        return set;
    }

    // Idempotent, also on a partially populated or moved-from set.
    void destroy() noexcept
    {
        m_stdin.destroy();
        m_stdout.destroy();
        m_stderr.destroy();
        m_progress.destroy();
    }

    // Ends that cross into the child, -1 when absent.
    int child_stdin() const    { return m_stdin.read_end.get(); }
    int child_stdout() const   { return m_stdout.write_end.get(); }
    int child_stderr() const   { return m_merged ? m_stdout.write_end.get() : m_stderr.write_end.get(); }
    int child_progress() const { return m_progress.write_end.get(); }

    // Parent side, right after fork.
    void close_child_ends() noexcept
    {
        m_stdin.read_end.reset();
        m_stdout.write_end.reset();
        m_stderr.write_end.reset();
        m_progress.write_end.reset();
    }

    Unique_fd release_parent_stdin()    { return std::move(m_stdin.write_end); }
    Unique_fd release_parent_stdout()   { return std::move(m_stdout.read_end); }
    Unique_fd release_parent_stderr()   { return std::move(m_stderr.read_end); }
    Unique_fd release_parent_progress() { return std::move(m_progress.read_end); }

    const Pipe& stdin_pipe() const    { return m_stdin; }
    const Pipe& stdout_pipe() const   { return m_stdout; }
    const Pipe& stderr_pipe() const   { return m_stderr; }
    const Pipe& progress_pipe() const { return m_progress; }
    bool merged() const { return m_merged; }

private:
    static void make_pipe(Pipe& pipe, int flags, const std::string& program)
    {
        int fds[2] = {-1, -1};
        if (detail::call_pipe2(fds, flags) != 0) {
            const int saved_errno = errno;
            ls_debug() << "pipe2 failed: errno " << saved_errno;
            throw launch_error(launch_error::stage::allocate_pipes, saved_errno, program);
        }
        if (!detail::lift_descriptor(fds[0], progress_fileno) ||
            !detail::lift_descriptor(fds[1], progress_fileno)) {
            const int saved_errno = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            throw launch_error(launch_error::stage::allocate_pipes, saved_errno, program);
        }
        pipe.read_end.reset(fds[0]);
        pipe.write_end.reset(fds[1]);
    }

    Pipe m_stdin;
    Pipe m_stdout;
    Pipe m_stderr;
    Pipe m_progress;
    bool m_merged = false;
};

} // namespace proflog
