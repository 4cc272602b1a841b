// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace proflog {


enum class Stream_id
{
    stdout_stream,
    stderr_stream,
    merged,         // stdout and stderr sharing one pipe
    progress        // the side channel on descriptor 3
};


struct Line_record
{
    std::string                             text;       // without the newline
    Stream_id                               stream  = Stream_id::stdout_stream;
    std::chrono::steady_clock::time_point   arrival;
};


// Reassembles newline-delimited records from arbitrarily chunked bytes.
// The records produced do not depend on how the input was split into feed()
// calls.
class Line_framer
{
public:
    void feed(const char* data, size_t size)
    {
        m_buffer.append(data, size);
    }

    // The next complete record, if one is buffered.
    std::optional<std::string> next_record()
    {
        const size_t newline = m_buffer.find('\n', m_scan_from);
        if (newline == std::string::npos) {
            m_scan_from = m_buffer.size();
            compact();
            return std::nullopt;
        }

        std::string record = m_buffer.substr(m_consumed, newline - m_consumed);
        m_consumed = newline + 1;
        m_scan_from = m_consumed;
        return record;
    }

    // The unterminated remainder, once the stream has ended.
    std::optional<std::string> flush_partial()
    {
        compact();
        if (m_buffer.empty()) {
            return std::nullopt;
        }
        std::string record;
        record.swap(m_buffer);
        m_scan_from = 0;
        return record;
    }

    size_t buffered() const { return m_buffer.size() - m_consumed; }

private:
    void compact()
    {
        if (m_consumed == 0) {
            return;
        }
        m_buffer.erase(0, m_consumed);
        m_scan_from -= m_consumed;
        m_consumed = 0;
    }

    std::string m_buffer;
    size_t      m_consumed  = 0;    // bytes of m_buffer already handed out
    size_t      m_scan_from = 0;    // no newline before this offset
};

} // namespace proflog
