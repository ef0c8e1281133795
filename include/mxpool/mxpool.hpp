/*

mxpool.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Outbound connection pooling.

*/

#pragma once

#include <mxpool/detail/log.hpp>
#include <mxpool/detail/result.hpp>
#include <mxpool/net/destination.hpp>
#include <mxpool/net/line_socket.hpp>
#include <mxpool/pool/pool_config.hpp>
#include <mxpool/pool/connection.hpp>
#include <mxpool/pool/connection_factory.hpp>
#include <mxpool/pool/teardown.hpp>
#include <mxpool/pool/connection_pool.hpp>
#include <mxpool/pool/pool_registry.hpp>
#include <mxpool/pool/client_pool.hpp>

/**
 * @file mxpool.hpp
 * @brief Reusable outbound connections for message delivery.
 *
 * @section Overview
 *
 * Connecting to a remote mail exchanger costs a resolution, a handshake and
 * a round trip before the first command. mxpool keeps connections per
 * destination (host, port, local address) and hands them out again, while
 * bounding how many connections and queued requests each destination may
 * hold.
 *
 * @section Usage
 *
 * @code
 * #include <mxpool/mxpool.hpp>
 *
 * asio::io_context ctx;
 * mxpool::pool::outbound_config config;
 * config.pool_concurrency_max = 5;
 *
 * mxpool::pool::pool_registry registry(ctx.get_executor(), config);
 * registry.init();
 * mxpool::pool::client_pool gate(ctx.get_executor(), registry);
 *
 * mxpool::net::destination dest{"mx.example.com", 25};
 * auto conn = co_await gate.get_client(dest);
 * if (!conn)
 * {
 *     std::cerr << conn.error().to_string() << "\n";
 *     co_return;
 * }
 *
 * co_await (*conn)->socket().write_line("EHLO relay.example.com", asio::use_awaitable);
 * // ...
 * gate.release_client(*conn, dest);
 *
 * // On shutdown
 * co_await gate.drain_pools();
 * @endcode
 *
 * @subsection Lease Scoped Release
 *
 * @code
 * auto lease = co_await gate.lease(dest);
 * if (lease)
 * {
 *     co_await (*lease)->socket().write_line("NOOP", asio::use_awaitable);
 *     // lease->invalidate() on a protocol error
 * } // released here
 * @endcode
 *
 * @subsection Configuration Configuration Options
 *
 * @code
 * auto direct = mxpool::pool::outbound_config::no_pooling();  // connect per delivery
 * auto bounded = mxpool::pool::outbound_config::no_reuse(4);  // cap, but never reuse
 * @endcode
 *
 * @section ThreadSafety Thread Safety
 *
 * - Run every operation on a single executor; nothing is internally synchronized
 * - A connection belongs to one caller between get_client() and release_client()
 * - The logger may be configured from any thread
 */

namespace mxpool
{

/**
 * @brief Library version.
 */
inline constexpr struct
{
    int major = 1;
    int minor = 0;
    int patch = 0;
} version;

} // namespace mxpool
