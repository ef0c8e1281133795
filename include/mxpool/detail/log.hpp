/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mxpool.
Supports the MTA severity ladder, structured fields, two output formats,
optional callbacks, and protocol tracing.

*/

#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mxpool/detail/error_detail.hpp>

namespace mxpool::log
{

/// Log severity levels, most verbose first
enum class level : std::uint8_t
{
    data = 0,      ///< Raw payload dumps
    protocol = 1,  ///< Protocol-level tracing (C:/S: lines)
    debug = 2,     ///< Debug information
    info = 3,      ///< Informational messages
    notice = 4,    ///< Normal but significant events
    warn = 5,      ///< Warnings (non-fatal issues)
    error = 6,     ///< Errors (operation failures)
    crit = 7,      ///< Critical conditions (broken invariants)
    alert = 8,
    emerg = 9,
    off = 10       ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to the peer
    receive   ///< Data received from the peer
};

/// Output layout used by the default sink and format_entry()
enum class format : std::uint8_t
{
    text,    ///< [LEVEL] [source] message k=v
    logfmt   ///< level=LEVEL source=... message="..." k=v
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string source;
    std::string message;
    std::vector<detail::error_detail::field> fields;
    std::source_location location;

    // Optional protocol trace info
    struct trace_info_t
    {
        direction dir;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::data:     return "DATA";
        case level::protocol: return "PROTOCOL";
        case level::debug:    return "DEBUG";
        case level::info:     return "INFO";
        case level::notice:   return "NOTICE";
        case level::warn:     return "WARN";
        case level::error:    return "ERROR";
        case level::crit:     return "CRIT";
        case level::alert:    return "ALERT";
        case level::emerg:    return "EMERG";
        case level::off:      return "OFF";
    }
    return "UNKNOWN";
}

/**
 * Parse a level name ("warn", "LOGWARN", "Protocol") or an MTA style number
 * where 0 is EMERG and 9 is DATA.
 */
[[nodiscard]] inline std::optional<level> parse_level(std::string_view text) noexcept
{
    if (text.empty())
        return std::nullopt;

    unsigned value = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec == std::errc{} && res.ptr == text.data() + text.size())
    {
        if (value > 9)
            return std::nullopt;
        return static_cast<level>(9 - value);
    }

    std::string upper;
    upper.reserve(text.size());
    for (char c : text)
        upper.push_back((c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c);
    std::string_view name = upper;
    if (name.starts_with("LOG"))
        name.remove_prefix(3);

    for (std::uint8_t i = 0; i <= static_cast<std::uint8_t>(level::off); ++i)
    {
        if (level_to_string(static_cast<level>(i)) == name)
            return static_cast<level>(i);
    }
    return std::nullopt;
}

/// Escape CR/LF so one entry stays on one line. Trailing newlines are dropped.
[[nodiscard]] inline std::string escape_message(std::string_view message)
{
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.remove_suffix(1);

    std::string out;
    out.reserve(message.size());
    for (char c : message)
    {
        if (c == '\r')
            out.append("\\r");
        else if (c == '\n')
            out.append("\\n");
        else
            out.push_back(c);
    }
    return out;
}

/// Render an entry the way the default sink prints it (without timestamp).
[[nodiscard]] inline std::string format_entry(const entry& e, format fmt)
{
    const std::string message = escape_message(e.message);

    if (fmt == format::logfmt)
    {
        detail::error_detail line;
        line.add("level", level_to_string(e.lvl));
        line.add("source", e.source.empty() ? std::string_view("core") : std::string_view(e.source));
        line.add("message", message);
        for (const auto& [key, value] : e.fields)
            line.add(key, value);
        return line.logfmt();
    }

    std::string out;
    out.push_back('[');
    out.append(level_to_string(e.lvl));
    out.append("] [");
    out.append(e.source.empty() ? std::string_view("core") : std::string_view(e.source));
    out.append("] ");
    out.append(message);
    if (!e.fields.empty())
    {
        detail::error_detail tail;
        for (const auto& [key, value] : e.fields)
            tail.add(key, value);
        if (!message.empty())
            out.push_back(' ');
        out.append(tail.logfmt());
    }
    return out;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    void set_format(format fmt) noexcept
    {
        format_.store(static_cast<std::uint8_t>(fmt), std::memory_order_relaxed);
    }

    [[nodiscard]] format get_format() const noexcept
    {
        return static_cast<format>(format_.load(std::memory_order_relaxed));
    }

    /// Prefix default output with an ISO-8601 timestamp
    void set_timestamps(bool enabled) noexcept
    {
        timestamps_.store(enabled, std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Log a message
    void log(level lvl, std::string_view source, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        log(lvl, source, message, detail::error_detail{}, loc);
    }

    /// Log a message with structured fields
    void log(level lvl, std::string_view source, std::string_view message, const detail::error_detail& fields,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .source = std::string(source),
            .message = std::string(message),
            .fields = fields.fields(),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Log protocol trace, client lines as "C: ..." and peer lines as "S: ..."
    void trace_protocol(std::string_view source, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(level::protocol))
            return;

        std::string message(dir == direction::send ? "C: " : "S: ");
        message.append(data);

        entry e{
            .lvl = level::protocol,
            .timestamp = std::chrono::system_clock::now(),
            .source = std::string(source),
            .message = std::move(message),
            .fields = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        std::string line;
        if (timestamps_.load(std::memory_order_relaxed))
        {
            auto time = std::chrono::system_clock::to_time_t(e.timestamp);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                e.timestamp.time_since_epoch()) % 1000;

            std::tm tm_buf{};
            gmtime_r(&time, &tm_buf);
            char stamp[32]{};
            std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm_buf);
            char millis[8]{};
            std::snprintf(millis, sizeof(millis), ".%03dZ ", static_cast<int>(ms.count()));
            line.append(stamp);
            line.append(millis);
        }
        line.append(format_entry(e, get_format()));
        line.push_back('\n');
        std::cerr << line;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::warn)};
    std::atomic<std::uint8_t> format_{static_cast<std::uint8_t>(format::text)};
    std::atomic<bool> timestamps_{false};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros; the message argument is a stream expression
#define MXPOOL_LOG(lvl, source, msg) \
    do \
    { \
        auto& mxpool_logger_ = ::mxpool::log::logger::instance(); \
        if (mxpool_logger_.is_enabled(lvl)) \
        { \
            std::ostringstream mxpool_log_stream_; \
            mxpool_log_stream_ << msg; \
            mxpool_logger_.log(lvl, source, mxpool_log_stream_.str(), std::source_location::current()); \
        } \
    } while (0)

#define MXPOOL_LOG_DEBUG(source, msg)  MXPOOL_LOG(::mxpool::log::level::debug, source, msg)
#define MXPOOL_LOG_INFO(source, msg)   MXPOOL_LOG(::mxpool::log::level::info, source, msg)
#define MXPOOL_LOG_NOTICE(source, msg) MXPOOL_LOG(::mxpool::log::level::notice, source, msg)
#define MXPOOL_LOG_WARN(source, msg)   MXPOOL_LOG(::mxpool::log::level::warn, source, msg)
#define MXPOOL_LOG_ERROR(source, msg)  MXPOOL_LOG(::mxpool::log::level::error, source, msg)
#define MXPOOL_LOG_CRIT(source, msg)   MXPOOL_LOG(::mxpool::log::level::crit, source, msg)

/// Protocol trace helpers
#define MXPOOL_TRACE_SEND(source, data) \
    ::mxpool::log::logger::instance().trace_protocol(source, ::mxpool::log::direction::send, data)

#define MXPOOL_TRACE_RECV(source, data) \
    ::mxpool::log::logger::instance().trace_protocol(source, ::mxpool::log::direction::receive, data)

} // namespace mxpool::log
