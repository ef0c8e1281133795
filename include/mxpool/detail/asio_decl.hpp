/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for mxpool.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <chrono>
#include <utility>

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/redirect_error.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)

namespace mxpool::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;

    // Networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;
    namespace local = boost::asio::local;
    namespace generic = boost::asio::generic;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_read_until;
    using boost::asio::async_compose;
    using boost::asio::dynamic_buffer;

    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace mxpool::asio

#else
#error "mxpool requires coroutine support (C++20) and Boost.Asio 1.18+ (Boost 1.74+)"
#endif

// Common chrono literals
namespace mxpool
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
