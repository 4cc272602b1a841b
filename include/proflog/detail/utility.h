// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>


namespace proflog {


// C++ vector of strings to C style null terminated array of pointers
// conversion utility. Built before fork, read after it.
struct cstring_vector
{
    cstring_vector() { initialize(); }

    explicit cstring_vector(const std::vector<std::string>& v_in)
        : m_storage(v_in)
    {
        initialize();
    }

    explicit cstring_vector(std::vector<std::string>&& v_in)
        : m_storage(std::move(v_in))
    {
        initialize();
    }

    ~cstring_vector()
    {
        delete [] m_v;
    }

    cstring_vector(const cstring_vector&) = delete;
    cstring_vector& operator=(const cstring_vector&) = delete;
    cstring_vector(cstring_vector&&) = delete;
    cstring_vector& operator=(cstring_vector&&) = delete;

    char* const* v() const { return const_cast<char* const*>(m_v); }
    const char* operator[](size_t i) const { return m_v[i]; }
    size_t size() const { return m_storage.size(); }

private:
    void initialize()
    {
        const auto count = m_storage.size();
        m_v = new const char*[count + 1];
        for (size_t i = 0; i < count; ++i) {
            m_v[i] = m_storage[i].c_str();
        }
        m_v[count] = nullptr;
    }

    std::vector<std::string> m_storage;
    const char** m_v = nullptr;
};



namespace detail {

using pipe2_fn = int(*)(int[2], int);
using write_fn = ssize_t(*)(int, const void*, size_t);
using read_fn  = ssize_t(*)(int, void*, size_t);
using kill_fn  = int(*)(pid_t, int);

inline std::atomic<pipe2_fn>& pipe2_override()
{
    static std::atomic<pipe2_fn> fn{nullptr};
    return fn;
}

inline std::atomic<write_fn>& write_override()
{
    static std::atomic<write_fn> fn{nullptr};
    return fn;
}

inline std::atomic<read_fn>& read_override()
{
    static std::atomic<read_fn> fn{nullptr};
    return fn;
}

inline std::atomic<kill_fn>& kill_override()
{
    static std::atomic<kill_fn> fn{nullptr};
    return fn;
}

inline int fcntl_retry(int fd, int cmd)
{
    int rv = -1;
    do {
        rv = ::fcntl(fd, cmd);
    } while (rv == -1 && errno == EINTR);
    return rv;
}

inline int fcntl_retry(int fd, int cmd, int arg)
{
    int rv = -1;
    do {
        rv = ::fcntl(fd, cmd, arg);
    } while (rv == -1 && errno == EINTR);
    return rv;
}

inline int system_pipe2(int pipefd[2], int flags)
{
#if defined(__linux__) || defined(__FreeBSD__) || defined(__DragonFly__) || defined(__NetBSD__) || defined(__OpenBSD__)
    int rv = -1;
    do {
        rv = ::pipe2(pipefd, flags);
    } while (rv == -1 && errno == EINTR);
    return rv;
#else
    // Without pipe2() the flags can only be applied after creation, which
    // reopens the inheritance race for concurrently spawned siblings.
    if (flags & ~(O_CLOEXEC | O_NONBLOCK)) {
        errno = EINVAL;
        return -1;
    }

    int pipe_result = -1;
    do {
        pipe_result = ::pipe(pipefd);
    } while (pipe_result == -1 && errno == EINTR);
    if (pipe_result == -1) {
        return -1;
    }

    const auto set_flag = [&](int fd, int get_cmd, int set_cmd, int value) {
        int current = fcntl_retry(fd, get_cmd);
        if (current == -1) {
            return -1;
        }
        return fcntl_retry(fd, set_cmd, current | value);
    };

    if (flags & O_CLOEXEC) {
        if (set_flag(pipefd[0], F_GETFD, F_SETFD, FD_CLOEXEC) == -1 ||
            set_flag(pipefd[1], F_GETFD, F_SETFD, FD_CLOEXEC) == -1) {
            int saved_errno = errno;
            ::close(pipefd[0]);
            ::close(pipefd[1]);
            errno = saved_errno;
            return -1;
        }
    }

    if (flags & O_NONBLOCK) {
        if (set_flag(pipefd[0], F_GETFL, F_SETFL, O_NONBLOCK) == -1 ||
            set_flag(pipefd[1], F_GETFL, F_SETFL, O_NONBLOCK) == -1) {
            int saved_errno = errno;
            ::close(pipefd[0]);
            ::close(pipefd[1]);
            errno = saved_errno;
            return -1;
        }
    }

    return 0;
#endif
}

inline int call_pipe2(int pipefd[2], int flags)
{
    if (auto override = pipe2_override().load(std::memory_order_acquire)) {
        return override(pipefd, flags);
    }
    return system_pipe2(pipefd, flags);
}

inline ssize_t call_write(int fd, const void* buf, size_t count)
{
    if (auto override = write_override().load(std::memory_order_acquire)) {
        return override(fd, buf, count);
    }
    return ::write(fd, buf, count);
}

inline ssize_t call_read(int fd, void* buf, size_t count)
{
    if (auto override = read_override().load(std::memory_order_acquire)) {
        return override(fd, buf, count);
    }
    return ::read(fd, buf, count);
}

inline int call_kill(pid_t pid, int sig)
{
    if (auto override = kill_override().load(std::memory_order_acquire)) {
        return override(pid, sig);
    }
    return ::kill(pid, sig);
}

// Only direct system calls; safe between fork and exec.
inline bool write_fully(int fd, const void* buf, size_t count) noexcept
{
    const char* ptr = static_cast<const char*>(buf);
    size_t total_written = 0;
    while (total_written < count) {
        ssize_t rv = call_write(fd, ptr + total_written, count - total_written);
        if (rv < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (rv == 0) {
            return false;
        }
        total_written += static_cast<size_t>(rv);
    }
    return true;
}

enum class Read_result {
    Value,
    Eof,
    Error,
};

// Reads exactly count bytes. Eof is only reported when nothing at all was read;
// a short read followed by end-of-file is an Error with EPIPE.
inline Read_result read_fully(int fd, void* buf, size_t count, int* error_out = nullptr)
{
    char* ptr = static_cast<char*>(buf);
    size_t total_read = 0;
    while (total_read < count) {
        ssize_t rv = call_read(fd, ptr + total_read, count - total_read);
        if (rv < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (error_out) {
                *error_out = errno;
            }
            return Read_result::Error;
        }
        if (rv == 0) {
            if (total_read == 0) {
                return Read_result::Eof;
            }
            if (error_out) {
                *error_out = EPIPE;
            }
            return Read_result::Error;
        }
        total_read += static_cast<size_t>(rv);
    }
    return Read_result::Value;
}

inline void close_retaining_errno(int fd) noexcept
{
    if (fd < 0) {
        return;
    }
    int saved_errno = errno;
    ::close(fd);
    errno = saved_errno;
}

// Moves fd to the lowest free number above `floor`, keeping close-on-exec.
// On failure the original descriptor is left untouched.
inline bool lift_descriptor(int& fd, int floor)
{
    if (fd < 0 || fd > floor) {
        return true;
    }
    int lifted = fcntl_retry(fd, F_DUPFD_CLOEXEC, floor + 1);
    if (lifted == -1) {
        return false;
    }
    ::close(fd);
    fd = lifted;
    return true;
}

inline bool set_nonblocking(int fd)
{
    int flags = fcntl_retry(fd, F_GETFL);
    if (flags == -1) {
        return false;
    }
    if (flags & O_NONBLOCK) {
        return true;
    }
    return fcntl_retry(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

} // namespace detail


namespace testing {

inline detail::pipe2_fn set_pipe2_override(detail::pipe2_fn fn)
{
    return detail::pipe2_override().exchange(fn, std::memory_order_acq_rel);
}

inline detail::write_fn set_write_override(detail::write_fn fn)
{
    return detail::write_override().exchange(fn, std::memory_order_acq_rel);
}

inline detail::read_fn set_read_override(detail::read_fn fn)
{
    return detail::read_override().exchange(fn, std::memory_order_acq_rel);
}

inline detail::kill_fn set_kill_override(detail::kill_fn fn)
{
    return detail::kill_override().exchange(fn, std::memory_order_acq_rel);
}

} // namespace testing


} // namespace proflog
