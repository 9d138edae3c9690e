/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mailwire.
Supports log levels, an optional sink callback and SMTP protocol tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace mailwire::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,
    receive
};

/// Log entry passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Process-wide logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Replace the default stderr output; an empty callback restores it.
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        dispatch(entry{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        });
    }

    /// Formats only when the level is enabled.
    template<typename... Args>
    void logf(level lvl, std::source_location loc, std::format_string<Args...> fmt, Args&&... args)
    {
        if (!is_enabled(lvl))
            return;
        log(lvl, std::format(fmt, std::forward<Args>(args)...), loc);
    }

    /// Record one protocol line. Callers pass data that is already redacted.
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        dispatch(entry{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{dir, std::string(protocol), std::string(data)}
        });
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        const auto stamp = std::chrono::floor<std::chrono::milliseconds>(e.timestamp);
        const std::string when = std::format("{:%H:%M:%S}", stamp);

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            std::cerr << std::format("[{}] {} {} {}\n", when, e.trace_info->protocol, dir_str,
                sanitize_trace(e.trace_info->data));
        }
        else
        {
            std::cerr << std::format("[{}] [{}] {}\n", when, level_to_string(e.lvl), e.message);
        }
    }

    /// Truncate long payloads and mask control characters.
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        constexpr std::size_t max_len = 500;
        std::string out(data.substr(0, max_len));

        for (char& c : out)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }
        while (!out.empty() && (out.back() == '\r' || out.back() == '\n'))
            out.pop_back();
        if (data.size() > max_len)
            out += "... [truncated]";
        return out;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

} // namespace mailwire::log

#define MAILWIRE_LOG(lvl, msg) \
    ::mailwire::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILWIRE_LOGF(lvl, ...) \
    ::mailwire::log::logger::instance().logf(lvl, std::source_location::current(), __VA_ARGS__)

#define MAILWIRE_TRACE(msg)  MAILWIRE_LOG(::mailwire::log::level::trace, msg)
#define MAILWIRE_DEBUG(msg)  MAILWIRE_LOG(::mailwire::log::level::debug, msg)
#define MAILWIRE_INFO(msg)   MAILWIRE_LOG(::mailwire::log::level::info, msg)
#define MAILWIRE_WARN(msg)   MAILWIRE_LOG(::mailwire::log::level::warn, msg)
#define MAILWIRE_ERROR(msg)  MAILWIRE_LOG(::mailwire::log::level::error, msg)
#define MAILWIRE_FATAL(msg)  MAILWIRE_LOG(::mailwire::log::level::fatal, msg)

#define MAILWIRE_TRACE_SEND(protocol, data) \
    ::mailwire::log::logger::instance().trace_protocol(protocol, ::mailwire::log::direction::send, data)

#define MAILWIRE_TRACE_RECV(protocol, data) \
    ::mailwire::log::logger::instance().trace_protocol(protocol, ::mailwire::log::direction::receive, data)
