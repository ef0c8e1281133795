/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized mapping between Asio error codes and mxpool::errc for
connection establishment.

*/

#pragma once

#include <string_view>

#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/error_detail.hpp>
#include <mxpool/detail/result.hpp>

namespace mxpool::net
{

enum class io_stage
{
    resolve,
    bind,
    connect
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::bind: return "bind";
        case io_stage::connect: return "connect";
    }
    return "unknown";
}

/// A cancelled operation after the connect watchdog fired is a timeout, anything else a connect failure.
[[nodiscard]] inline errc map_connect_error(const mxpool::asio::error_code& ec, bool timeout_triggered) noexcept
{
    if (timeout_triggered || ec == mxpool::asio::error::timed_out)
        return errc::connect_timeout;
    return errc::connect_failed;
}

[[nodiscard]] inline detail::error_detail make_connect_detail(
    std::string_view host,
    unsigned short port,
    std::string_view local_addr,
    io_stage stage)
{
    detail::error_detail fields;
    fields.add("host", host);
    fields.add_int("port", port);
    if (!local_addr.empty())
        fields.add("local_addr", local_addr);
    fields.add("stage", stage_name(stage));
    return fields;
}

} // namespace mxpool::net
