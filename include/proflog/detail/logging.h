// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"

#include <cstdio>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace proflog {

enum class log_level
{
    error,
    warning,
    info,
    debug
};

// Invoked from Log_stream's destructor, so a sink must not throw.
using log_callback_fn = void(*)(log_level level, const char* message, void* user_data) noexcept;

namespace detail {

// stdout carries the live render, so every level goes to stderr.
inline void default_log_callback(log_level /*level*/, const char* message, void* /*user_data*/) noexcept
{
    if (!message) {
        return;
    }
    std::fwrite(message, 1, std::strlen(message), stderr);
    std::fflush(stderr);
}

inline log_callback_fn& log_callback_storage()
{
    static log_callback_fn callback = &default_log_callback;
    return callback;
}

inline void*& log_user_storage()
{
    static void* user_data = nullptr;
    return user_data;
}

inline std::mutex& log_mutex()
{
    static std::mutex mutex;
    return mutex;
}

} // namespace detail

// Set a logging callback; pass nullptr to restore the default sink.
inline void set_log_callback(log_callback_fn callback, void* user_data = nullptr)
{
    if (!callback) {
        callback = &detail::default_log_callback;
        user_data = nullptr;
    }
    std::lock_guard<std::mutex> guard(detail::log_mutex());
    detail::log_callback_storage() = callback;
    detail::log_user_storage() = user_data;
}

inline log_callback_fn get_log_callback(void** user_data = nullptr)
{
    std::lock_guard<std::mutex> guard(detail::log_mutex());
    if (user_data) {
        *user_data = detail::log_user_storage();
    }
    return detail::log_callback_storage();
}

inline void log_raw(log_level level, const char* message)
{
    if (!message) {
        return;
    }
    log_callback_fn callback = nullptr;
    void* user_data = nullptr;
    {
        std::lock_guard<std::mutex> guard(detail::log_mutex());
        callback = detail::log_callback_storage();
        user_data = detail::log_user_storage();
    }
    if (!callback) {
        return;
    }
    callback(level, message, user_data);
}

class Log_stream
{
public:
    explicit Log_stream(log_level level, bool enabled = true, std::string postfix = {})
        : m_level(level)
        , m_enabled(enabled)
        , m_postfix(std::move(postfix))
    {}

    ~Log_stream() noexcept
    {
        if (!m_enabled) {
            return;
        }
        if (!m_postfix.empty()) {
            m_stream << m_postfix;
        }
        const auto text = m_stream.str();
        if (!text.empty()) {
            log_raw(m_level, text.c_str());
        }
    }

    Log_stream(const Log_stream&) = delete;
    Log_stream& operator=(const Log_stream&) = delete;
    Log_stream(Log_stream&& other) noexcept
        : m_stream(std::move(other.m_stream))
        , m_level(other.m_level)
        , m_enabled(other.m_enabled)
        , m_postfix(std::move(other.m_postfix))
    {
        other.m_enabled = false;
        other.m_postfix.clear();
    }
    Log_stream& operator=(Log_stream&& other) noexcept
    {
        if (this != &other) {
            m_stream = std::move(other.m_stream);
            m_level = other.m_level;
            m_enabled = other.m_enabled;
            m_postfix = std::move(other.m_postfix);
            other.m_enabled = false;
            other.m_postfix.clear();
        }
        return *this;
    }

    template <typename T>
    Log_stream& operator<<(const T& value)
    {
        if (m_enabled) {
            m_stream << value;
        }
        return *this;
    }

private:
    std::ostringstream m_stream;
    log_level m_level;
    bool m_enabled{true};
    std::string m_postfix;
};

// Every message is a complete line prefixed with the tool name.
inline Log_stream ls_info()    { return std::move(Log_stream(log_level::info, true, "\n") << "proflog: "); }
inline Log_stream ls_warning() { return std::move(Log_stream(log_level::warning, true, "\n") << "proflog: warning: "); }
inline Log_stream ls_error()   { return std::move(Log_stream(log_level::error, true, "\n") << "proflog: error: "); }
inline Log_stream ls_debug()   { return std::move(Log_stream(log_level::debug, trace_enabled(), "\n") << "proflog: trace: "); }

} // namespace proflog
