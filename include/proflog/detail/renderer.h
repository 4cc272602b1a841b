// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "process_handle.h"
#include "terminal.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace proflog {


inline std::string format_elapsed(std::chrono::milliseconds elapsed)
{
    const long long total = elapsed.count() < 0 ? 0 : static_cast<long long>(elapsed.count());
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld.%03lld",
        total / 1000 / 60, total / 1000 % 60, total % 1000);
    return buffer;
}


// 1023B, 1.5KiB, 12.0MiB ...
inline std::string format_binary_size(uint64_t bytes)
{
    static const char* const units[] = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

    char buffer[32];
    if (bytes < 1024) {
        std::snprintf(buffer, sizeof(buffer), "%lluB", static_cast<unsigned long long>(bytes));
        return buffer;
    }
    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::snprintf(buffer, sizeof(buffer), "%.1f%s", value, units[unit]);
    return buffer;
}



// Draws the live region at the bottom of the terminal: one row with the
// current record and its age, and, while a stack sample is held, a second row
// with the sample. Every redraw first erases what the previous one drew, so
// the region is overwritten in place until finalize() leaves the record row
// behind as ordinary scrolled output.
class Renderer
{
public:
    using width_provider = std::function<int()>;

    explicit Renderer(
        FILE* out = stdout,
        bool color = color_enabled(),
        width_provider columns = [] { return terminal_columns(); })
    :
        m_out(out),
        m_color(color),
        m_columns(std::move(columns))
    {}

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    void render_live(
        std::chrono::milliseconds elapsed,
        const std::string& line,
        const std::optional<std::string>& sample)
    {
        m_elapsed = elapsed;
        m_line = line;
        m_has_record = true;

        std::string frame = erase_sequence();
        frame += record_row(elapsed, line);
        int rows = 1;
        if (sample) {
            frame += "\n";
            frame += sample_row(*sample);
            rows = 2;
        }
        emit(frame);
        m_live_rows = rows;
    }

    // Leaves the current record as history and ends the live region.
    void finalize()
    {
        if (m_live_rows == 0) {
            return;
        }
        std::string frame = erase_sequence();
        if (m_has_record) {
            frame += record_row(m_elapsed, m_line);
        }
        frame += "\n";
        emit(frame);
        m_live_rows = 0;
        m_has_record = false;
    }

    void close() { finalize(); }

    // Printed once, after the child has been reaped.
    void write_summary(std::chrono::milliseconds total, const Exit_status& status)
    {
        finalize();

        std::string text = highlight("Total execution time") + " " + format_elapsed(total) + "\n";
        switch (status.how) {
            case Exit_status::kind::exited:
                text += highlight("Terminated with code") + " " + std::to_string(status.code) +
                    (status.code == 0 ? " (OK)\n" : " (NOK)\n");
                text += highlight("Resource usage summary:") + "\n";
                text += "    " + highlight("Memory:") + " " +
                    format_binary_size(static_cast<uint64_t>(status.max_rss_kib) * 1024) + "\n";
                break;
            case Exit_status::kind::signaled:
                text += highlight("Terminated by signal") + " " + std::to_string(status.code) + "\n";
                break;
            case Exit_status::kind::stopped:
                text += highlight("Terminated with stop") + " " + std::to_string(status.code) + "\n";
                break;
            case Exit_status::kind::unknown:
                text += highlight("Terminated with unexpected wait status") + "\n";
                break;
        }
        emit(text);
    }

    int live_rows() const { return m_live_rows; }

private:
    // Cursor goes back to the first column of the first live row, then
    // everything from there down is cleared.
    std::string erase_sequence() const
    {
        if (m_live_rows == 0) {
            return {};
        }
        std::string seq = "\r";
        for (int i = 1; i < m_live_rows; ++i) {
            seq += "\x1b[A";
        }
        seq += "\x1b[J";
        return seq;
    }

    std::string record_row(std::chrono::milliseconds elapsed, const std::string& line) const
    {
        return highlight(format_elapsed(elapsed)) + " \xe2\x94\x82 " + display_truncate(line, text_columns());
    }

    std::string sample_row(const std::string& sample) const
    {
        return highlight("executing") + " \xe2\x94\x82 " + display_truncate(sample, text_columns());
    }

    int text_columns() const
    {
        const int columns = m_columns ? m_columns() : fallback_terminal_columns;
        return columns > render_prefix_columns ? columns - render_prefix_columns : 1;
    }

    std::string highlight(const std::string& text) const
    {
        if (!m_color) {
            return text;
        }
        return "\x1b[0;34m" + text + "\x1b[0m";
    }

    void emit(const std::string& text)
    {
        if (!m_out) {
            return;
        }
        std::fwrite(text.data(), 1, text.size(), m_out);
        std::fflush(m_out);
    }

    FILE*                       m_out;
    bool                        m_color;
    width_provider              m_columns;

    int                         m_live_rows  = 0;
    bool                        m_has_record = false;
    std::chrono::milliseconds   m_elapsed{0};
    std::string                 m_line;
};

} // namespace proflog
