/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Recoverable failures on the acquire path are returned via result<T>; the
release and teardown paths only log.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mxpool
{

/// Error categories for mxpool operations
enum class errc : std::uint16_t
{
    success = 0,

    // Connection establishment (100-199)
    connect_failed = 100,
    connect_timeout = 101,

    // Admission (200-299)
    backpressure = 200,
    pool_draining = 201,

    // Internal errors (900-999)
    internal_error = 900,
    cancelled = 902,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc ec) noexcept
{
    switch (ec)
    {
        case errc::success: return "Success";
        case errc::connect_failed: return "Connection failed";
        case errc::connect_timeout: return "Connection timeout";
        case errc::backpressure: return "Too many waiting clients";
        case errc::pool_draining: return "Pool is draining";
        case errc::internal_error: return "Internal error";
        case errc::cancelled: return "Operation cancelled";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, errc ec)
{
    return os << to_string(ec);
}

/// Rich error type: code, human message, structured detail, system cause and origin
struct error_info
{
    errc code{errc::success};
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    [[nodiscard]] bool is(errc ec) const noexcept { return code == ec; }

    /// Check if this failure happened while establishing a transport
    [[nodiscard]] bool is_connect_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code);
        return c >= 100 && c < 200;
    }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out.append(std::to_string(static_cast<int>(code)));
        out.append("] ");
        out.append(message.empty() ? std::string(mxpool::to_string(code)) : message);
        if (sys)
        {
            out.append(": ");
            out.append(sys.message());
        }
        return out;
    }
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error_info>;

/// Helper to create error result
template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message = {}, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    if (message.empty())
        message = std::string(to_string(code));
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, where});
}

} // namespace mxpool
