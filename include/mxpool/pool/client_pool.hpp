/*

pool/client_pool.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <source_location>
#include <string>
#include <utility>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/error_detail.hpp>
#include <mxpool/detail/log.hpp>
#include <mxpool/detail/result.hpp>
#include <mxpool/net/destination.hpp>
#include <mxpool/pool/connection.hpp>
#include <mxpool/pool/connection_factory.hpp>
#include <mxpool/pool/pool_config.hpp>
#include <mxpool/pool/pool_registry.hpp>

namespace mxpool::pool
{

using namespace mxpool::asio;

// Forward declaration
class client_pool;


/**
 * RAII wrapper for a connection obtained from client_pool.
 * Automatically releases the connection when destroyed.
 */
class client_lease
{
public:
    client_lease() = default;

    client_lease(client_lease&& other) noexcept
        : gate_(std::exchange(other.gate_, nullptr))
        , conn_(std::move(other.conn_))
        , dest_(std::move(other.dest_))
        , valid_(std::exchange(other.valid_, false))
    {
    }

    client_lease& operator=(client_lease&& other) noexcept
    {
        if (this != &other)
        {
            release();
            gate_ = std::exchange(other.gate_, nullptr);
            conn_ = std::move(other.conn_);
            dest_ = std::move(other.dest_);
            valid_ = std::exchange(other.valid_, false);
        }
        return *this;
    }

    // Non-copyable
    client_lease(const client_lease&) = delete;
    client_lease& operator=(const client_lease&) = delete;

    ~client_lease()
    {
        release();
    }

    /// Access the underlying connection
    connection& operator*() const { return *conn_; }
    connection* operator->() const { return conn_.get(); }
    [[nodiscard]] const connection_ptr& get() const noexcept { return conn_; }

    [[nodiscard]] const net::destination& destination() const noexcept { return dest_; }

    explicit operator bool() const noexcept { return conn_ != nullptr; }

    /// Mark the connection as failed; releasing it then tears it down
    void invalidate() noexcept { valid_ = false; }

    /// Explicitly release (normally done by destructor)
    void release();

private:
    friend class client_pool;

    client_lease(client_pool* gate, connection_ptr conn, net::destination dest)
        : gate_(gate)
        , conn_(std::move(conn))
        , dest_(std::move(dest))
        , valid_(true)
    {
    }

    client_pool* gate_ = nullptr;
    connection_ptr conn_;
    net::destination dest_;
    bool valid_ = false;
};


/**
 * Entry point for outbound deliveries: hands out connections per destination
 * and takes them back.
 *
 * With pooling enabled every destination gets a pool in the registry, and a
 * pool whose waiter queue already holds pool_concurrency_max acquirers turns
 * new requests away. With pooling disabled each request opens its own
 * connection, closed again on release.
 *
 * The backpressure check and the enqueue in the pool are not atomic; this is
 * only sound because all calls run on the one executor.
 */
class client_pool
{
public:
    client_pool(any_io_executor executor, outbound_config config, pool_registry& registry, connector_type connector)
        : executor_(std::move(executor))
        , config_(std::move(config))
        , registry_(registry)
        , connector_(std::move(connector))
    {
    }

    /// Gate sharing the registry's settings and connector.
    client_pool(any_io_executor executor, pool_registry& registry)
        : client_pool(std::move(executor), registry.config(), registry, registry.connector())
    {
    }

    client_pool(const client_pool&) = delete;
    client_pool& operator=(const client_pool&) = delete;

    /**
     * Get a connection to a destination.
     *
     * @return A connection marked acquired, or connect_failed, connect_timeout,
     *         backpressure or pool_draining.
     */
    awaitable<result<connection_ptr>> get_client(net::destination dest)
    {
        if (!config_.pooling_enabled())
        {
            auto created = co_await connector_(dest, std::string{});
            if (created)
            {
                (*created)->transition(connection_state::busy);
                (*created)->set_acquired(true);
            }
            co_return created;
        }

        pool_ptr pool = registry_.get_or_create(dest);
        if (pool->waiting_count() >= config_.pool_concurrency_max)
        {
            pool->record_backpressure();
            MXPOOL_LOG_INFO("outbound", "Too many waiting clients for pool " << pool->name()
                << " (" << pool->waiting_count() << " waiting)");
            detail::error_detail fields;
            fields.add("pool", pool->name());
            fields.add_int("waiting", pool->waiting_count());
            co_return fail<connection_ptr>(errc::backpressure, "Too many waiting clients for pool", fields.str());
        }

        auto acquired = co_await pool->acquire();
        if (!acquired)
            co_return acquired;

        (*acquired)->set_acquired(true);
        MXPOOL_LOG_INFO("outbound", "[" << pool->name() << "] acquired socket " << (*acquired)->id());
        co_return acquired;
    }

    /**
     * Get a connection with any completion token.
     * The handler receives (std::exception_ptr, result<connection_ptr>).
     */
    template<typename CompletionToken>
    auto async_get_client(net::destination dest, CompletionToken&& token)
    {
        return co_spawn(executor_, get_client(std::move(dest)), std::forward<CompletionToken>(token));
    }

    /**
     * Hand a connection back after use.
     *
     * @param conn           Connection obtained from get_client()
     * @param dest           Destination it was obtained for, used in log messages
     * @param error_occurred Tear the connection down instead of reusing it
     * @param where          Reported when the connection was not acquired
     */
    void release_client(const connection_ptr& conn, const net::destination& dest, bool error_occurred = false,
        std::source_location where = std::source_location::current())
    {
        if (!conn)
            return;

        if (!config_.pooling_enabled() && !conn->pooled())
        {
            conn->close_now();
            return;
        }

        if (!conn->acquired())
        {
            MXPOOL_LOG_WARN("outbound", "Release an un-acquired socket (connection " << conn->id()
                << ") from " << where.file_name() << ":" << where.line());
            return;
        }

        // The connection names its own pool; the destination only feeds the log.
        const std::string& name = conn->pool_key();
        pool_ptr pool = registry_.find(name);
        if (!pool)
        {
            MXPOOL_LOG_CRIT("outbound", "Releasing a pool (" << name << ") that doesn't exist! (connection "
                << conn->id() << " to " << dest.to_string() << ")");
            conn->close_now();
            return;
        }
        conn->set_acquired(false);

        if (error_occurred)
        {
            pool->destroy(conn);
            return;
        }

        if (!config_.idle_reuse_enabled())
        {
            MXPOOL_LOG_INFO("outbound", "[" << name << "] Pool_timeout is zero - shutting it down");
            pool->destroy(conn);
            return;
        }

        pool->release(conn);
    }

    /**
     * Get a connection wrapped in a lease that releases it on destruction.
     */
    awaitable<result<client_lease>> lease(net::destination dest)
    {
        auto acquired = co_await get_client(dest);
        if (!acquired)
            co_return fail<client_lease>(std::move(acquired.error()));
        co_return client_lease(this, std::move(*acquired), std::move(dest));
    }

    /**
     * Drain every destination pool; completes once all are drained.
     */
    awaitable<void> drain_pools()
    {
        co_await registry_.drain_all();
    }

    template<typename CompletionToken>
    auto async_drain_pools(CompletionToken&& token)
    {
        return co_spawn(executor_, drain_pools(), std::forward<CompletionToken>(token));
    }

    [[nodiscard]] const outbound_config& config() const noexcept { return config_; }
    [[nodiscard]] pool_registry& registry() noexcept { return registry_; }

private:
    any_io_executor executor_;
    outbound_config config_;
    pool_registry& registry_;
    connector_type connector_;
};


inline void client_lease::release()
{
    if (gate_ != nullptr && conn_)
        gate_->release_client(conn_, dest_, !valid_);
    gate_ = nullptr;
    conn_.reset();
    valid_ = false;
}

} // namespace mxpool::pool
