// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "logging.h"
#include "utility.h"

#include <boost/interprocess/detail/os_file_functions.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/file_mapping.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace proflog {


enum class Sample_state
{
    unknown,
    available,
    unavailable
};


namespace detail {

// The last complete record in the tail of a sample file. The final segment,
// terminated or not, is the one the child may still be writing and is never
// returned. When the window does not start at the beginning of the file, the
// text before its first newline may be a cut-off record and is not usable.
inline std::optional<std::string> second_to_last_record(std::string_view tail, bool at_file_start)
{
    const size_t last = tail.rfind('\n');
    if (last == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t previous = last == 0 ? std::string_view::npos : tail.rfind('\n', last - 1);
    if (previous == std::string_view::npos) {
        if (!at_file_start) {
            return std::nullopt;
        }
        return std::string(tail.substr(0, last));
    }
    return std::string(tail.substr(previous + 1, last - previous - 1));
}

} // namespace detail


// Reads the current sample from a sample file, or the placeholder if the file
// is missing, empty, or holds no complete record in its tail window.
//
// The child may truncate and rewrite the file at any time, so the tail is
// copied out with pread() rather than mapped: a mapping that outlives the end
// of the file faults on access. A read that comes up short of the size taken
// by fstat() means the file shrank in between, and yields the placeholder.
inline std::string read_latest_sample(const std::string& path)
{
    namespace ipc = boost::interprocess;

    try {
        ipc::file_mapping file(path.c_str(), ipc::read_only);
        const int fd = ipc::ipcdetail::file_handle_from_mapping_handle(file.get_mapping_handle());

        struct stat st{};
        if (::fstat(fd, &st) == -1 || !S_ISREG(st.st_mode) || st.st_size <= 0) {
            return std::string(sample_placeholder);
        }

        const auto size   = static_cast<size_t>(st.st_size);
        const auto window = std::min(size, sample_tail_window);
        const auto offset = static_cast<off_t>(size - window);

        char buffer[sample_tail_window];
        size_t got = 0;
        while (got < window) {
            const ssize_t n = ::pread(fd, buffer + got, window - got, offset + static_cast<off_t>(got));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                ls_debug() << "could not read sample file " << path << ": errno " << errno;
                return std::string(sample_placeholder);
            }
            if (n == 0) {
                break;
            }
            got += static_cast<size_t>(n);
        }
        if (got < window) {
            return std::string(sample_placeholder);
        }

        if (auto record = detail::second_to_last_record(std::string_view(buffer, got), offset == 0)) {
            return *record;
        }
    }
    catch (const ipc::interprocess_exception& e) {
        ls_debug() << "could not open sample file " << path << ": " << e.what();
    }
    return std::string(sample_placeholder);
}


// Polls the per-process sample file of the child, and keeps the most recent
// sample read from it.
//
// The file is looked for once per interval. While it exists, every cycle asks
// the child to append a fresh sample (SIGUSR1) and takes the last complete
// record; the child's answer to this cycle's signal is usually read on the
// next one. A file that vanishes drops the sample, and a file that has not
// appeared yet is looked for again on every cycle.
class Sample_correlator
{
public:
    using clock = std::chrono::steady_clock;

    Sample_correlator(
        pid_t pid,
        std::string sample_path,
        std::chrono::milliseconds interval = sample_interval(),
        clock::time_point start = clock::now())
    :
        m_pid(pid),
        m_path(std::move(sample_path)),
        m_interval(interval),
        m_last_cycle(start)
    {}

    static std::string sample_path_for(const std::string& directory, pid_t pid)
    {
        return directory + "/" + std::to_string(pid);
    }

    // Runs one cycle if the interval has elapsed since the previous one.
    // Returns whether it did.
    bool tick(clock::time_point now)
    {
        if (now - m_last_cycle < m_interval) {
            return false;
        }
        m_last_cycle = now;
        ++m_cycles;

        const bool exists = file_exists();

        switch (m_state) {
            case Sample_state::unknown:
            case Sample_state::unavailable:
                if (exists) {
                    ls_debug() << "sample file " << m_path << " appeared";
                }
                m_state = exists ? Sample_state::available : Sample_state::unavailable;
                break;

            case Sample_state::available:
                if (!exists) {
                    ls_debug() << "sample file " << m_path << " is gone";
                    m_state = Sample_state::unavailable;
                    m_sample.reset();
                    break;
                }
                if (detail::call_kill(m_pid, SIGUSR1) == -1) {
                    ls_debug() << "could not signal pid " << m_pid << ": errno " << errno;
                }
                else {
                    ++m_signals_sent;
                }
                m_sample = read_latest_sample(m_path);
                break;
        }
        return true;
    }

    Sample_state state() const { return m_state; }
    const std::optional<std::string>& current_sample() const { return m_sample; }
    const std::string& path() const { return m_path; }

    unsigned long cycles() const { return m_cycles; }
    unsigned long signals_sent() const { return m_signals_sent; }

private:
    bool file_exists() const
    {
        return ::access(m_path.c_str(), F_OK) == 0;
    }

    pid_t                       m_pid;
    std::string                 m_path;
    std::chrono::milliseconds   m_interval;
    clock::time_point           m_last_cycle;

    Sample_state                m_state = Sample_state::unknown;
    std::optional<std::string>  m_sample;

    unsigned long               m_cycles        = 0;
    unsigned long               m_signals_sent  = 0;
};

} // namespace proflog
