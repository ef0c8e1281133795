/*

pool/connection_pool.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/log.hpp>
#include <mxpool/detail/result.hpp>
#include <mxpool/pool/connection.hpp>
#include <mxpool/pool/pool_config.hpp>
#include <mxpool/pool/teardown.hpp>

namespace mxpool::pool
{

using namespace mxpool::asio;


/**
 * Connection pool for a single destination.
 *
 * Holds idle connections for reuse, counts busy ones, and queues acquirers
 * in arrival order once the maximum size is reached. Everything runs on one
 * executor; the pool takes no locks and must not be shared across threads.
 *
 * Always create through std::make_shared, the idle handlers and suspended
 * operations keep references to the pool.
 */
class connection_pool : public std::enable_shared_from_this<connection_pool>
{
public:
    using factory_type = std::function<awaitable<result<connection_ptr>>()>;

    /**
     * Create a connection pool.
     *
     * @param executor The executor for async operations
     * @param name     Pool key, stamped on every connection the factory creates
     * @param settings Maximum size, idle timeout, teardown watchdog
     * @param factory  Function that opens new connections
     */
    connection_pool(any_io_executor executor, std::string name, pool_settings settings, factory_type factory)
        : executor_(std::move(executor))
        , name_(std::move(name))
        , settings_(settings)
        , factory_(std::move(factory))
    {
    }

    // Non-copyable, non-movable
    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;
    connection_pool(connection_pool&&) = delete;
    connection_pool& operator=(connection_pool&&) = delete;

    /**
     * Acquire a connection from the pool.
     * Reuses the oldest valid idle connection, creates a new one while under
     * the maximum size, otherwise waits for a release or a freed slot.
     *
     * @return A busy connection, or the creation error, or pool_draining.
     */
    awaitable<result<connection_ptr>> acquire()
    {
        auto self = shared_from_this();
        if (draining_)
            co_return fail<connection_ptr>(errc::pool_draining, "Pool " + name_ + " is draining");

        ++stats_.acquisitions_total;

        if (auto conn = take_idle())
        {
            ++stats_.acquisitions_immediate;
            co_return conn;
        }

        if (has_room())
        {
            ++pending_;
            co_return co_await create_reserved();
        }

        MXPOOL_LOG_DEBUG("outbound", "Pool " << name_ << " at capacity, waiting for connection...");
        ++stats_.acquisitions_waited;
        auto waiter = std::make_shared<waiter_t>(executor_);
        waiters_.push_back(waiter);

        asio::error_code ec;
        co_await waiter->timer.async_wait(redirect_error(use_awaitable, ec));

        switch (waiter->outcome)
        {
            case waiter_t::outcome_t::handed:
                co_return std::move(waiter->conn);
            case waiter_t::outcome_t::slot:
                co_return co_await create_reserved();
            case waiter_t::outcome_t::aborted:
                co_return fail<connection_ptr>(errc::pool_draining, "Pool " + name_ + " drained while waiting");
            case waiter_t::outcome_t::pending:
                break;
        }

        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end())
            waiters_.erase(it);
        co_return fail<connection_ptr>(errc::cancelled, "Wait for pool " + name_ + " cancelled", {},
            static_cast<std::error_code>(ec));
    }

    /**
     * Return a busy connection to service. It goes to the first waiter, or to
     * the idle set; when reuse is off, on error, or while draining, it is torn
     * down instead.
     *
     * @return False, changing nothing, if the connection is not busy in this pool.
     */
    bool release(const connection_ptr& conn, bool error_occurred = false)
    {
        if (!conn || conn->pool_key() != name_ || conn->state() != connection_state::busy)
        {
            ++stats_.rejected_releases;
            MXPOOL_LOG_WARN("outbound", "Rejected release of connection "
                << (conn ? std::to_string(conn->id()) : std::string("(null)"))
                << " in state " << (conn ? state_name(conn->state()) : std::string_view("none"))
                << " to pool " << name_);
            return false;
        }

        if (error_occurred || settings_.idle_timeout.count() == 0 || draining_)
        {
            destroy(conn);
            return true;
        }

        if (!waiters_.empty())
        {
            auto waiter = waiters_.front();
            waiters_.pop_front();
            conn->mark_used();
            waiter->conn = conn;
            waiter->outcome = waiter_t::outcome_t::handed;
            waiter->timer.cancel();
            return true;
        }

        --in_use_;
        conn->transition(connection_state::idle);
        idle_.push_back(conn);
        watch_idle(conn);
        return true;
    }

    /**
     * Remove a connection from service through the teardown sequence. Its slot
     * is freed at once and offered to the next waiter.
     */
    void destroy(const connection_ptr& conn)
    {
        if (!conn || conn->pool_key() != name_)
            return;

        switch (conn->state())
        {
            case connection_state::destroying:
            case connection_state::closed:
                return;
            case connection_state::idle:
            {
                auto it = std::find(idle_.begin(), idle_.end(), conn);
                if (it != idle_.end())
                    idle_.erase(it);
                break;
            }
            case connection_state::busy:
                if (in_use_ > 0)
                    --in_use_;
                break;
            case connection_state::unassigned:
                break;
        }

        ++stats_.connections_destroyed;
        start_teardown(conn, settings_.teardown_timeout);
        dispatch_waiters();
        check_drained();
    }

    /**
     * Drain the pool: refuse new acquisitions, abort queued waiters, wait for
     * busy connections to come back, then tear down every idle connection.
     */
    awaitable<void> drain()
    {
        auto self = shared_from_this();
        if (!draining_)
        {
            MXPOOL_LOG_DEBUG("outbound", "Draining pool " << name_);
            draining_ = true;
            abort_waiters();
        }

        while (in_use_ + pending_ > 0)
        {
            auto signal = std::make_shared<steady_timer>(executor_, steady_timer::time_point::max());
            drain_signals_.push_back(signal);
            asio::error_code ec;
            co_await signal->async_wait(redirect_error(use_awaitable, ec));
        }

        while (!idle_.empty())
            destroy(idle_.front());

        MXPOOL_LOG_INFO("outbound", "Pool " << name_ << " drained");
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t max_size() const noexcept { return settings_.max_size; }
    [[nodiscard]] const pool_settings& settings() const noexcept { return settings_; }

    /// Connections parked for reuse
    [[nodiscard]] std::size_t idle_count() const noexcept { return idle_.size(); }

    /// Connections handed out
    [[nodiscard]] std::size_t busy_count() const noexcept { return in_use_; }

    /// Connections being created; they hold a slot like busy ones
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_; }

    /// Acquirers queued for a connection
    [[nodiscard]] std::size_t waiting_count() const noexcept { return waiters_.size(); }

    [[nodiscard]] std::size_t size() const noexcept { return idle_.size() + in_use_ + pending_; }

    [[nodiscard]] bool draining() const noexcept { return draining_; }

    /**
     * Get current pool statistics.
     */
    [[nodiscard]] pool_stats stats() const
    {
        pool_stats out = stats_;
        out.idle_connections = idle_.size();
        out.busy_connections = in_use_;
        out.pending_connections = pending_;
        out.waiting_requests = waiters_.size();
        return out;
    }

    /// Counted by the admission gate, which owns the backpressure check.
    void record_backpressure() noexcept { ++stats_.rejected_backpressure; }

private:
    struct waiter_t
    {
        enum class outcome_t { pending, handed, slot, aborted };

        explicit waiter_t(any_io_executor executor)
            : timer(std::move(executor), steady_timer::time_point::max())
        {
        }

        steady_timer timer;
        outcome_t outcome = outcome_t::pending;
        connection_ptr conn;
    };

    enum class idle_event { timeout, readable };

    [[nodiscard]] bool has_room() const noexcept
    {
        return size() < settings_.max_size;
    }

    connection_ptr take_idle()
    {
        while (!idle_.empty())
        {
            auto conn = idle_.front();
            if (conn->state() != connection_state::idle || !conn->writable())
            {
                MXPOOL_LOG_DEBUG("outbound", "Discarding invalid idle connection " << conn->id()
                    << " from pool " << name_);
                destroy(conn);
                continue;
            }

            idle_.pop_front();
            conn->end_idle_period();
            conn->transition(connection_state::busy);
            conn->mark_used();
            ++in_use_;
            return conn;
        }
        return nullptr;
    }

    /// Opens a connection for a slot already counted in pending_.
    awaitable<result<connection_ptr>> create_reserved()
    {
        result<connection_ptr> created = fail<connection_ptr>(errc::internal_error);
        try
        {
            created = co_await factory_();
        }
        catch (const std::exception& e)
        {
            created = fail<connection_ptr>(errc::internal_error, "Connection factory threw: " + std::string(e.what()));
        }

        if (created && (!*created || !(*created)->transition(connection_state::busy)))
            created = fail<connection_ptr>(errc::internal_error, "Connection factory returned an unusable connection");

        if (!created)
        {
            --pending_;
            ++stats_.connections_failed;
            MXPOOL_LOG_DEBUG("outbound", "Failed to create connection for pool " << name_ << ": "
                << created.error().message);
            dispatch_waiters();
            check_drained();
            co_return created;
        }

        ++stats_.connections_created;
        (*created)->mark_used();
        ++in_use_;
        --pending_;
        co_return created;
    }

    /// Hands freed slots to waiters in arrival order.
    void dispatch_waiters()
    {
        while (!waiters_.empty() && has_room())
        {
            auto waiter = waiters_.front();
            waiters_.pop_front();
            ++pending_;
            waiter->outcome = waiter_t::outcome_t::slot;
            waiter->timer.cancel();
        }
    }

    void abort_waiters()
    {
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto& waiter : waiters)
        {
            waiter->outcome = waiter_t::outcome_t::aborted;
            waiter->timer.cancel();
        }
    }

    void check_drained()
    {
        if (!draining_ || in_use_ + pending_ > 0)
            return;
        auto signals = std::move(drain_signals_);
        drain_signals_.clear();
        for (auto& signal : signals)
            signal->cancel();
    }

    void watch_idle(const connection_ptr& conn)
    {
        const std::uint64_t gen = conn->begin_idle_period();
        std::weak_ptr<connection_pool> weak_pool = weak_from_this();
        std::weak_ptr<connection> weak_conn = conn;

        conn->idle_timer().expires_after(settings_.idle_timeout);
        conn->idle_timer().async_wait([weak_pool, weak_conn, gen](asio::error_code ec)
        {
            if (ec)
                return;
            auto pool = weak_pool.lock();
            auto c = weak_conn.lock();
            if (pool && c)
                pool->on_idle_event(c, gen, idle_event::timeout, ec);
        });

        watch_readable(conn, gen);
    }

    void watch_readable(const connection_ptr& conn, std::uint64_t gen)
    {
        std::weak_ptr<connection_pool> weak_pool = weak_from_this();
        std::weak_ptr<connection> weak_conn = conn;
        conn->socket().async_wait_readable([weak_pool, weak_conn, gen](asio::error_code ec)
        {
            if (ec == asio::error::operation_aborted)
                return;
            auto pool = weak_pool.lock();
            auto c = weak_conn.lock();
            if (pool && c)
                pool->on_idle_event(c, gen, idle_event::readable, ec);
        });
    }

    /// Handlers of an idle period only act while it lasts.
    void on_idle_event(const connection_ptr& conn, std::uint64_t gen, idle_event event, asio::error_code ec)
    {
        if (conn->generation() != gen || conn->state() != connection_state::idle)
            return;

        if (event == idle_event::timeout)
        {
            MXPOOL_LOG_DEBUG("outbound", "Idle connection " << conn->id() << " in pool " << name_ << " timed out");
            ++stats_.connections_evicted;
            destroy(conn);
            return;
        }

        std::string received;
        net::idle_input input = net::idle_input::error;
        if (!ec)
            input = conn->socket().probe_idle(received, ec);
        if (!received.empty())
            MXPOOL_TRACE_RECV("outbound", received);

        switch (input)
        {
            case net::idle_input::none:
            case net::idle_input::data:
                watch_readable(conn, gen);
                break;
            case net::idle_input::eof:
                MXPOOL_LOG_INFO("outbound", "Socket [" << name_ << "] in pool got FIN");
                conn->socket().mark_unwritable();
                destroy(conn);
                break;
            case net::idle_input::error:
                MXPOOL_LOG_WARN("outbound", "Socket [" << name_ << "] in pool got an error: " << ec.message());
                conn->socket().mark_unwritable();
                destroy(conn);
                break;
        }
    }

    any_io_executor executor_;
    std::string name_;
    pool_settings settings_;
    factory_type factory_;

    std::deque<connection_ptr> idle_;
    std::size_t in_use_ = 0;
    std::size_t pending_ = 0;
    std::deque<std::shared_ptr<waiter_t>> waiters_;
    std::vector<std::shared_ptr<steady_timer>> drain_signals_;
    bool draining_ = false;

    pool_stats stats_;
};

using pool_ptr = std::shared_ptr<connection_pool>;

} // namespace mxpool::pool
