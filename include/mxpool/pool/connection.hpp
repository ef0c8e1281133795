/*

pool/connection.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/net/line_socket.hpp>

namespace mxpool::pool
{

using namespace mxpool::asio;

/// Ownership state of a pooled connection
enum class connection_state : std::uint8_t
{
    unassigned,  ///< Just created, not yet handed to a caller
    busy,        ///< Held by exactly one caller
    idle,        ///< Parked in its pool, eligible for reuse
    destroying,  ///< Going through teardown
    closed       ///< Terminal
};

[[nodiscard]] constexpr std::string_view state_name(connection_state state) noexcept
{
    switch (state)
    {
        case connection_state::unassigned: return "unassigned";
        case connection_state::busy: return "busy";
        case connection_state::idle: return "idle";
        case connection_state::destroying: return "destroying";
        case connection_state::closed: return "closed";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, connection_state state)
{
    return os << state_name(state);
}

/// Allowed transitions of the connection state machine.
[[nodiscard]] constexpr bool can_transition(connection_state from, connection_state to) noexcept
{
    using enum connection_state;
    switch (from)
    {
        case unassigned: return to == busy || to == destroying || to == closed;
        case busy: return to == idle || to == destroying || to == closed;
        case idle: return to == busy || to == destroying;
        case destroying: return to == closed;
        case closed: return false;
    }
    return false;
}

/// Process-unique sequence number for diagnostics.
[[nodiscard]] inline std::uint64_t next_connection_id() noexcept
{
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}


/**
 * One outbound transport plus the bookkeeping the pool needs about it.
 *
 * The pool key only names the owning pool; the connection never keeps its
 * pool alive.
 */
class connection
{
public:
    connection(std::uint64_t id, net::line_socket socket, std::string pool_key)
        : id_(id)
        , socket_(std::move(socket))
        , pool_key_(std::move(pool_key))
        , idle_timer_(socket_.get_executor())
        , connected_at_(steady_clock::now())
        , idle_since_(connected_at_)
    {
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string& pool_key() const noexcept { return pool_key_; }
    [[nodiscard]] bool pooled() const noexcept { return !pool_key_.empty(); }

    [[nodiscard]] connection_state state() const noexcept { return state_; }

    /// Marked by the admission gate between get_client and release_client
    [[nodiscard]] bool acquired() const noexcept { return acquired_; }
    void set_acquired(bool value) noexcept { acquired_ = value; }

    [[nodiscard]] bool writable() const noexcept { return socket_.writable(); }

    [[nodiscard]] net::line_socket& socket() noexcept { return socket_; }
    [[nodiscard]] const net::line_socket& socket() const noexcept { return socket_; }

    [[nodiscard]] steady_clock::time_point connected_at() const noexcept { return connected_at_; }
    [[nodiscard]] steady_clock::time_point idle_since() const noexcept { return idle_since_; }
    [[nodiscard]] std::size_t times_used() const noexcept { return times_used_; }

    /**
     * Move to another state. Returns false, leaving the state untouched, for
     * a transition the state machine does not allow.
     */
    bool transition(connection_state next) noexcept
    {
        if (!can_transition(state_, next))
            return false;
        state_ = next;
        return true;
    }

    /// Invalidates the handlers of the previous idle period and starts a new one.
    std::uint64_t begin_idle_period() noexcept
    {
        idle_since_ = steady_clock::now();
        return ++generation_;
    }

    /// Cancels the idle timer and pending waits; their handlers see a stale generation.
    void end_idle_period()
    {
        ++generation_;
        idle_timer_.cancel();
        socket_.cancel();
    }

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    [[nodiscard]] steady_timer& idle_timer() noexcept { return idle_timer_; }

    void mark_used() noexcept { ++times_used_; }

    /**
     * Close the transport immediately, skipping the teardown sequence. Used
     * for connections that no pool accounts for.
     */
    void close_now()
    {
        end_idle_period();
        acquired_ = false;
        asio::error_code ec;
        socket_.close(ec);
        state_ = connection_state::closed;
    }

private:
    std::uint64_t id_;
    net::line_socket socket_;
    std::string pool_key_;
    steady_timer idle_timer_;
    steady_clock::time_point connected_at_;
    steady_clock::time_point idle_since_;

    connection_state state_{connection_state::unassigned};
    bool acquired_{false};
    std::uint64_t generation_{0};
    std::size_t times_used_{0};
};

using connection_ptr = std::shared_ptr<connection>;

} // namespace mxpool::pool
