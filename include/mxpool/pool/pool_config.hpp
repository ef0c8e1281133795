/*

pool/pool_config.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <chrono>
#include <mxpool/net/line_socket.hpp>

namespace mxpool::pool
{

/// Teardown watchdog used when none is configured
inline constexpr std::chrono::milliseconds DEFAULT_TEARDOWN_TIMEOUT{10000};

/// A teardown always runs under a watchdog; zero or negative means the default.
[[nodiscard]] constexpr steady_clock::duration teardown_watchdog_for(steady_clock::duration configured) noexcept
{
    return configured.count() > 0 ? configured : steady_clock::duration{DEFAULT_TEARDOWN_TIMEOUT};
}


/**
 * Configuration for outbound connection pooling.
 */
struct outbound_config
{
    /// Bound on a single connection attempt (resolution included)
    std::chrono::seconds connect_timeout{30};

    /// Idle connections are closed after this duration (0 = never reuse a connection)
    std::chrono::seconds pool_timeout{50};

    /// Maximum connections per destination and backpressure threshold on
    /// queued acquirers (0 = no pooling, every call connects directly)
    std::size_t pool_concurrency_max = 10;

    /// Watchdog for the QUIT / half-close sequence when retiring a connection
    /// (0 = DEFAULT_TEARDOWN_TIMEOUT, the watchdog cannot be disabled)
    std::chrono::milliseconds teardown_timeout{DEFAULT_TEARDOWN_TIMEOUT};

    /// Longest protocol line accepted from a peer
    std::size_t max_line_length = net::DEFAULT_MAX_LINE_LENGTH;

    [[nodiscard]] bool pooling_enabled() const noexcept
    {
        return pool_concurrency_max > 0;
    }

    [[nodiscard]] bool idle_reuse_enabled() const noexcept
    {
        return pool_timeout.count() > 0;
    }

    // ==================== Factory Methods ====================

    static outbound_config defaults()
    {
        return {};
    }

    /// Connect for every delivery, never pool
    static outbound_config no_pooling()
    {
        outbound_config cfg;
        cfg.pool_concurrency_max = 0;
        return cfg;
    }

    /// Bound concurrency per destination but close every connection on release
    static outbound_config no_reuse(std::size_t max_connections = 10)
    {
        outbound_config cfg;
        cfg.pool_concurrency_max = max_connections;
        cfg.pool_timeout = std::chrono::seconds{0};
        return cfg;
    }
};


/**
 * Settings of a single destination pool, derived from outbound_config.
 */
struct pool_settings
{
    std::size_t max_size = 10;
    steady_clock::duration idle_timeout{std::chrono::seconds{50}};
    steady_clock::duration teardown_timeout{std::chrono::seconds{10}};

    static pool_settings from(const outbound_config& cfg)
    {
        pool_settings s;
        s.max_size = cfg.pool_concurrency_max;
        s.idle_timeout = cfg.pool_timeout;
        s.teardown_timeout = teardown_watchdog_for(cfg.teardown_timeout);
        return s;
    }
};


/**
 * Pool statistics for monitoring.
 */
struct pool_stats
{
    std::size_t idle_connections = 0;      ///< Available in pool
    std::size_t busy_connections = 0;      ///< Currently handed out
    std::size_t pending_connections = 0;   ///< Being created
    std::size_t waiting_requests = 0;      ///< Queued acquirers

    std::size_t connections_created = 0;   ///< Total created since start
    std::size_t connections_destroyed = 0; ///< Total sent through teardown
    std::size_t connections_evicted = 0;   ///< Destroyed after idling too long
    std::size_t connections_failed = 0;    ///< Failed to create

    std::size_t acquisitions_total = 0;    ///< Total acquire() calls
    std::size_t acquisitions_immediate = 0;///< Served from the idle set
    std::size_t acquisitions_waited = 0;   ///< Had to queue for a connection
    std::size_t rejected_backpressure = 0; ///< Refused by the admission gate
    std::size_t rejected_releases = 0;     ///< release() on a connection not held

    /// Hit rate (immediate / total)
    [[nodiscard]] double hit_rate() const noexcept
    {
        return acquisitions_total > 0
            ? static_cast<double>(acquisitions_immediate) / acquisitions_total
            : 0.0;
    }
};

} // namespace mxpool::pool
