/*

pool/teardown.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <exception>
#include <memory>
#include <string>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/log.hpp>
#include <mxpool/pool/connection.hpp>
#include <mxpool/pool/pool_config.hpp>

namespace mxpool::pool
{

using namespace mxpool::asio;

struct teardown_watchdog
{
    explicit teardown_watchdog(any_io_executor executor)
        : timer(std::move(executor))
    {
    }

    steady_timer timer;
    bool fired = false;
};


inline awaitable<void> run_teardown(connection_ptr conn, bool was_writable, steady_clock::duration watchdog_timeout)
{
    auto& socket = conn->socket();
    auto watchdog = std::make_shared<teardown_watchdog>(socket.get_executor());

    watchdog->timer.expires_after(teardown_watchdog_for(watchdog_timeout));
    watchdog->timer.async_wait([watchdog, conn](asio::error_code ec)
    {
        if (ec)
            return;
        watchdog->fired = true;
        MXPOOL_LOG_WARN("outbound", "Teardown of connection " << conn->id() << " timed out, closing");
        asio::error_code ignored;
        conn->socket().close(ignored);
    });

    asio::error_code ec;
    if (was_writable)
    {
        co_await socket.write_line("QUIT", redirect_error(use_awaitable, ec));
        if (ec)
            MXPOOL_LOG_WARN("outbound", "Failed to send QUIT on connection " << conn->id() << ": " << ec.message());
    }

    ec.clear();
    socket.shutdown_send(ec);
    if (ec)
        MXPOOL_LOG_WARN("outbound", "Half-close of connection " << conn->id() << " failed: " << ec.message());

    // Whatever the peer still sends is traced by the line reader.
    for (;;)
    {
        ec.clear();
        co_await socket.read_line(redirect_error(use_awaitable, ec));
        if (!ec)
            continue;

        if (ec == asio::error::eof)
            MXPOOL_LOG_INFO("outbound", "Remote end half closed during destroy()");
        else if (!watchdog->fired && ec != asio::error::operation_aborted)
            MXPOOL_LOG_WARN("outbound", "Error during destroy() of connection " << conn->id() << ": " << ec.message());
        break;
    }

    watchdog->timer.cancel();
    ec.clear();
    socket.close(ec);
    conn->transition(connection_state::closed);
    MXPOOL_LOG_DEBUG("outbound", "Connection " << conn->id() << " closed");
}


/**
 * Retire a connection: QUIT if it can still be written to, half-close, then
 * a full close once the peer closes its side or the watchdog fires.
 *
 * The connection moves to destroying before this returns; the rest runs on
 * the connection's executor. A non-positive watchdog means
 * DEFAULT_TEARDOWN_TIMEOUT. Nothing is reported back, every transport error
 * is logged.
 *
 * @return False if the connection was already destroying or closed.
 */
inline bool start_teardown(const connection_ptr& conn, steady_clock::duration watchdog)
{
    if (!conn || !conn->transition(connection_state::destroying))
        return false;

    conn->set_acquired(false);
    conn->end_idle_period();
    const bool was_writable = conn->writable();

    co_spawn(conn->socket().get_executor(),
        run_teardown(conn, was_writable, watchdog),
        [id = conn->id()](std::exception_ptr e)
        {
            if (!e)
                return;
            try
            {
                std::rethrow_exception(e);
            }
            catch (const std::exception& ex)
            {
                MXPOOL_LOG_WARN("outbound", "Teardown of connection " << id << " failed: " << ex.what());
            }
        });
    return true;
}

} // namespace mxpool::pool
