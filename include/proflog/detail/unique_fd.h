// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <utility>

#include <unistd.h>

namespace proflog {

// Sole owner of a file descriptor. Closing is idempotent: the descriptor is
// forgotten as soon as it has been closed or released.
class Unique_fd
{
public:
    Unique_fd() = default;
    explicit Unique_fd(int fd) : m_fd(fd) {}

    ~Unique_fd() { reset(); }

    Unique_fd(const Unique_fd&) = delete;
    Unique_fd& operator=(const Unique_fd&) = delete;

    Unique_fd(Unique_fd&& other) noexcept : m_fd(other.release()) {}
    Unique_fd& operator=(Unique_fd&& other) noexcept
    {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    explicit operator bool() const { return valid(); }

    int release() noexcept
    {
        return std::exchange(m_fd, -1);
    }

    void reset(int fd = -1) noexcept
    {
        const int previous = std::exchange(m_fd, fd);
        if (previous >= 0) {
            // The descriptor is gone after close() even when it reports EINTR.
            ::close(previous);
        }
    }

private:
    int m_fd = -1;
};

} // namespace proflog
