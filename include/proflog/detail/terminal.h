// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"

#include <cstddef>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

namespace proflog {


inline int terminal_columns(int fd = STDOUT_FILENO)
{
    struct winsize ws{};
    if (::ioctl(fd, TIOCGWINSZ, &ws) == -1 || ws.ws_col == 0) {
        return fallback_terminal_columns;
    }
    return ws.ws_col;
}


namespace detail {

// Length of the UTF-8 sequence introduced by lead byte c; 1 for stray bytes.
inline size_t utf8_sequence_length(unsigned char c)
{
    if (c < 0x80)           return 1;
    if ((c & 0xe0) == 0xc0) return 2;
    if ((c & 0xf0) == 0xe0) return 3;
    if ((c & 0xf8) == 0xf0) return 4;
    return 1;
}

// Length of the CSI sequence at text[pos] ("ESC [" ... final byte), or 0.
inline size_t csi_length(const std::string& text, size_t pos)
{
    if (text[pos] != '\x1b' || pos + 1 >= text.size() || text[pos + 1] != '[') {
        return 0;
    }
    size_t end = pos + 2;
    while (end < text.size()) {
        const unsigned char c = static_cast<unsigned char>(text[end]);
        ++end;
        if (c >= 0x40 && c <= 0x7e) {
            return end - pos;
        }
    }
    return text.size() - pos;
}

} // namespace detail


// Cuts text down to at most max_columns visible code points, appending "…"
// when something was cut. Escape sequences take no columns and are kept.
inline std::string display_truncate(const std::string& text, int max_columns)
{
    if (max_columns <= 0) {
        return {};
    }

    const auto limit = static_cast<size_t>(max_columns);

    // first pass: does it fit at all?
    size_t columns = 0;
    for (size_t pos = 0; pos < text.size();) {
        if (size_t csi = detail::csi_length(text, pos)) {
            pos += csi;
            continue;
        }
        pos += detail::utf8_sequence_length(static_cast<unsigned char>(text[pos]));
        ++columns;
    }
    if (columns <= limit) {
        return text;
    }

    std::string result;
    columns = 0;
    for (size_t pos = 0; pos < text.size();) {
        if (size_t csi = detail::csi_length(text, pos)) {
            result.append(text, pos, csi);
            pos += csi;
            continue;
        }
        if (columns + 1 == limit) {
            break;
        }
        size_t len = detail::utf8_sequence_length(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size()) {
            // truncated sequence at the very end
            break;
        }
        result.append(text, pos, len);
        pos += len;
        ++columns;
    }
    result += "\xe2\x80\xa6";
    return result;
}

} // namespace proflog
