// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "line_framer.h"
#include "logging.h"
#include "process_handle.h"
#include "renderer.h"
#include "sample_correlator.h"
#include "unique_fd.h"
#include "utility.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <poll.h>

namespace proflog {


// Reads everything the child writes, for as long as any of its streams is
// open, and keeps the renderer showing the most recent record.
//
// The loop is single threaded. Each cycle waits up to poll_wait for any
// stream to become readable, drains the readable ones down to EAGAIN, turns
// complete lines into records, lets the correlator run if its interval has
// passed, and redraws the live region.
class Log_multiplexer
{
public:
    using clock = std::chrono::steady_clock;
    using record_observer = std::function<void(const Line_record&)>;

    explicit Log_multiplexer(Renderer& renderer, Sample_correlator* correlator = nullptr)
    :
        m_renderer(renderer),
        m_correlator(correlator)
    {}

    Log_multiplexer(const Log_multiplexer&) = delete;
    Log_multiplexer& operator=(const Log_multiplexer&) = delete;

    // Called for every record, including progress records, which are not drawn.
    void set_record_observer(record_observer observer) { m_observer = std::move(observer); }

    // How records read from the child's stdout pipe are labelled.
    void set_stdout_stream(Stream_id id) { m_stdout_id = id; }

    // Returns once every stream has ended and the child has been reaped.
    Exit_status run(Process_handle& child)
    {
        std::vector<Tracked_stream> streams;
        track(streams, child.take_stdout(), m_stdout_id);
        track(streams, child.take_stderr(), Stream_id::stderr_stream);
        track(streams, child.take_progress(), Stream_id::progress);

        m_buffer.assign(read_buffer_size, 0);
        m_current.reset();

        std::vector<struct pollfd> fds;
        while (!streams.empty()) {
            fds.clear();
            for (const auto& s : streams) {
                struct pollfd p{};
                p.fd = s.fd.get();
                p.events = POLLIN;
                fds.push_back(p);
            }

            const int rv = ::poll(fds.data(), static_cast<nfds_t>(fds.size()),
                static_cast<int>(poll_wait.count()));
            if (rv == -1 && errno != EINTR) {
                ls_error() << "poll on child streams failed: errno " << errno;
                // Nothing more can be read; what is buffered is still shown.
                for (auto& s : streams) {
                    s.open = false;
                }
            }
            else
            if (rv > 0) {
                for (size_t i = 0; i < streams.size(); ++i) {
                    if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
                        streams[i].open = drain(streams[i]);
                    }
                }
            }

            for (auto& s : streams) {
                if (!s.open) {
                    if (auto partial = s.framer.flush_partial()) {
                        emit(Line_record{std::move(*partial), s.id, clock::now()});
                    }
                    ls_debug() << "end of stream on descriptor " << s.fd.get();
                    s.fd.reset();
                }
            }
            streams.erase(
                std::remove_if(streams.begin(), streams.end(),
                    [](const Tracked_stream& s) { return !s.open; }),
                streams.end());

            const auto now = clock::now();
            if (m_correlator) {
                m_correlator->tick(now);
            }
            redraw(now);
        }

        if (m_current) {
            redraw(clock::now());
        }
        m_renderer.close();
        m_current.reset();

        return child.wait();
    }

    unsigned long records() const { return m_records; }

private:
    struct Tracked_stream
    {
        Unique_fd   fd;
        Line_framer framer;
        Stream_id   id;
        bool        nonblocking = true;
        bool        open        = true;
    };

    void track(std::vector<Tracked_stream>& streams, Unique_fd fd, Stream_id id)
    {
        if (!fd) {
            return;
        }
        Tracked_stream s;
        s.fd = std::move(fd);
        s.id = id;
        if (!detail::set_nonblocking(s.fd.get())) {
            // One read per readiness notification is still safe.
            ls_warning() << "could not make descriptor " << s.fd.get() << " non-blocking: errno " << errno;
            s.nonblocking = false;
        }
        streams.push_back(std::move(s));
    }

    // Reads until the pipe is empty. Returns false at end-of-stream, which a
    // read error counts as.
    bool drain(Tracked_stream& s)
    {
        while (true) {
            const ssize_t n = detail::call_read(s.fd.get(), m_buffer.data(), m_buffer.size());
            if (n > 0) {
                const auto arrival = clock::now();
                s.framer.feed(m_buffer.data(), static_cast<size_t>(n));
                while (auto text = s.framer.next_record()) {
                    emit(Line_record{std::move(*text), s.id, arrival});
                }
                if (!s.nonblocking) {
                    return true;
                }
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            ls_debug() << "read on descriptor " << s.fd.get() << " failed: errno " << errno;
            return false;
        }
    }

    void emit(Line_record&& record)
    {
        ++m_records;
        if (m_observer) {
            m_observer(record);
        }
        if (record.stream == Stream_id::progress) {
            ls_debug() << "progress: " << record.text;
            return;
        }

        if (m_current) {
            // the previous record scrolls away with its final age
            redraw(record.arrival);
            m_renderer.finalize();
        }
        m_current = std::move(record);
        redraw(m_current->arrival);
    }

    void redraw(clock::time_point now)
    {
        if (!m_current) {
            return;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_current->arrival);
        m_renderer.render_live(
            elapsed,
            m_current->text,
            m_correlator ? m_correlator->current_sample() : std::optional<std::string>());
    }

    Renderer&                   m_renderer;
    Sample_correlator*          m_correlator;
    record_observer             m_observer;
    Stream_id                   m_stdout_id = Stream_id::stdout_stream;

    std::vector<char>           m_buffer;
    std::optional<Line_record>  m_current;
    unsigned long               m_records = 0;
};

} // namespace proflog
