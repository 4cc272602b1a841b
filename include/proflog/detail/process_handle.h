// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "logging.h"
#include "unique_fd.h"
#include "utility.h"

#include <cerrno>
#include <optional>
#include <utility>

#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace proflog {


// How a supervised child ended.
struct Exit_status
{
    enum class kind
    {
        exited,
        signaled,
        stopped,
        unknown
    };

    kind how = kind::unknown;
    int code = 0;               // exit code, or signal number for signaled/stopped
    long max_rss_kib = 0;       // peak resident set size, as reported by wait4

    static Exit_status from_wait_status(int status, const struct rusage& usage)
    {
        Exit_status result;
        result.max_rss_kib = usage.ru_maxrss;
        if (WIFEXITED(status)) {
            result.how = kind::exited;
            result.code = WEXITSTATUS(status);
        }
        else
        if (WIFSIGNALED(status)) {
            result.how = kind::signaled;
            result.code = WTERMSIG(status);
        }
        else
        if (WIFSTOPPED(status)) {
            result.how = kind::stopped;
            result.code = WSTOPSIG(status);
        }
        return result;
    }

    // The code proflog itself exits with.
    int exit_code() const
    {
        switch (how) {
            case kind::exited:   return code;
            case kind::signaled: return exit_code_signal_base + code;
            case kind::stopped:  return exit_code_stopped;
            case kind::unknown:  break;
        }
        return exit_code_unexpected_wait;
    }

    bool ok() const { return how == kind::exited && code == 0; }
};


// A launched child and the parent-side ends of its channels.
//
// The handle does not wait for the child on destruction. A handle that was
// never waited leaves a zombie until proflog itself exits, which is the only
// place this can happen.
class Process_handle
{
public:
    Process_handle() = default;

    Process_handle(pid_t pid, Unique_fd in, Unique_fd out, Unique_fd err, Unique_fd progress)
        : m_pid(pid)
        , m_stdin(std::move(in))
        , m_stdout(std::move(out))
        , m_stderr(std::move(err))
        , m_progress(std::move(progress))
    {}

    Process_handle(Process_handle&& other) noexcept
        : m_pid(std::exchange(other.m_pid, -1))
        , m_stdin(std::move(other.m_stdin))
        , m_stdout(std::move(other.m_stdout))
        , m_stderr(std::move(other.m_stderr))
        , m_progress(std::move(other.m_progress))
        , m_status(std::move(other.m_status))
    {}

    Process_handle& operator=(Process_handle&& other) noexcept
    {
        if (this != &other) {
            m_pid      = std::exchange(other.m_pid, -1);
            m_stdin    = std::move(other.m_stdin);
            m_stdout   = std::move(other.m_stdout);
            m_stderr   = std::move(other.m_stderr);
            m_progress = std::move(other.m_progress);
            m_status   = std::move(other.m_status);
        }
        return *this;
    }

    Process_handle(const Process_handle&) = delete;
    Process_handle& operator=(const Process_handle&) = delete;

    pid_t pid() const { return m_pid; }
    bool valid() const { return m_pid > 0; }

    int stdin_fd() const    { return m_stdin.get(); }
    int stdout_fd() const   { return m_stdout.get(); }
    int stderr_fd() const   { return m_stderr.get(); }
    int progress_fd() const { return m_progress.get(); }

    // Ownership of a stream may be taken over, e.g. by a reader loop that
    // closes each descriptor as soon as it reaches end-of-stream.
    Unique_fd take_stdout()   { return std::move(m_stdout); }
    Unique_fd take_stderr()   { return std::move(m_stderr); }
    Unique_fd take_progress() { return std::move(m_progress); }

    void close_stdin() { m_stdin.reset(); }

    void close_streams()
    {
        m_stdin.reset();
        m_stdout.reset();
        m_stderr.reset();
        m_progress.reset();
    }

    // Sends sig to the child; false (with errno set) if it could not be delivered.
    bool send_signal(int sig) const
    {
        if (!valid() || m_status) {
            errno = ESRCH;
            return false;
        }
        return detail::call_kill(m_pid, sig) == 0;
    }

    // Blocks until the child ends, then releases every stream.
    // Repeated calls return the status collected by the first one.
    Exit_status wait()
    {
        if (m_status) {
            return *m_status;
        }
        if (!valid()) {
            close_streams();
            return Exit_status{};
        }

        int status = 0;
        struct rusage usage{};
        pid_t rv = -1;
        do {
            rv = ::wait4(m_pid, &status, 0, &usage);
        } while (rv == -1 && errno == EINTR);
        const int wait_errno = errno;

        close_streams();
        if (rv != m_pid) {
            ls_warning() << "wait4 for pid " << m_pid << " failed: errno " << wait_errno;
            m_status = Exit_status{};
            return *m_status;
        }
        m_status = Exit_status::from_wait_status(status, usage);
        return *m_status;
    }

    // Non-blocking variant of wait(); nothing while the child is still running.
    std::optional<Exit_status> try_wait()
    {
        if (m_status || !valid()) {
            return m_status;
        }

        int status = 0;
        struct rusage usage{};
        pid_t rv = -1;
        do {
            rv = ::wait4(m_pid, &status, WNOHANG, &usage);
        } while (rv == -1 && errno == EINTR);

        if (rv == 0) {
            return std::nullopt;
        }
        const int wait_errno = errno;
        close_streams();
        if (rv != m_pid) {
            ls_warning() << "wait4 for pid " << m_pid << " failed: errno " << wait_errno;
            m_status = Exit_status{};
            return m_status;
        }
        m_status = Exit_status::from_wait_status(status, usage);
        return m_status;
    }

private:
    pid_t m_pid = -1;
    Unique_fd m_stdin;
    Unique_fd m_stdout;
    Unique_fd m_stderr;
    Unique_fd m_progress;
    std::optional<Exit_status> m_status;
};

} // namespace proflog
