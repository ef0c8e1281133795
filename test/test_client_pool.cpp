/*

test_client_pool.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Admission gate: backpressure, pooling bypass, release routing, leases and
draining through the registry.

*/

#define BOOST_TEST_MODULE client_pool_test

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "test_support.hpp"

using namespace std::chrono_literals;
using namespace test_support;
using mxpool::errc;
using mxpool::net::destination;
using mxpool::pool::client_lease;
using mxpool::pool::client_pool;
using mxpool::pool::connection_state;
using mxpool::pool::outbound_config;
using mxpool::pool::pool_registry;

namespace
{

struct gate_fixture
{
    explicit gate_fixture(outbound_config cfg = {})
        : config(cfg)
        , registry(ctx.get_executor(), config, remote.connector())
        , gate(ctx.get_executor(), registry)
    {
        registry.init();
    }

    connection_ptr get_now(const destination& dest)
    {
        auto r = spawn(ctx, gate.get_client(dest));
        pump(ctx);
        BOOST_REQUIRE(r->has_value());
        BOOST_REQUIRE(r->value().has_value());
        return r->value().value();
    }

    std::string key(const destination& dest) const
    {
        return mxpool::net::pool_key(dest, config.pool_timeout);
    }

    asio::io_context ctx;
    fake_remote remote{ctx};
    outbound_config config;
    pool_registry registry;
    client_pool gate;
};

outbound_config bounded(std::size_t max_size)
{
    outbound_config cfg;
    cfg.pool_concurrency_max = max_size;
    cfg.teardown_timeout = 100ms;
    return cfg;
}

const destination mx{"mx.example.net", 25};

} // namespace


BOOST_AUTO_TEST_CASE(full_waiter_queue_rejects_with_backpressure)
{
    log_capture logs;
    gate_fixture f(bounded(1));

    auto held = f.get_now(mx);
    BOOST_TEST(held->acquired());

    auto queued = spawn(f.ctx, f.gate.get_client(mx));
    pump(f.ctx);
    auto pool = f.registry.find(f.key(mx));
    BOOST_REQUIRE(pool);
    BOOST_TEST(pool->waiting_count() == 1u);

    auto rejected = spawn(f.ctx, f.gate.get_client(mx));
    pump(f.ctx);
    BOOST_REQUIRE(rejected->has_value());
    BOOST_REQUIRE(!rejected->value().has_value());
    BOOST_TEST(rejected->value().error().code == errc::backpressure);
    BOOST_TEST(rejected->value().error().message == "Too many waiting clients for pool");

    BOOST_TEST(f.remote.attempts == 1u);
    BOOST_TEST(pool->waiting_count() == 1u);
    BOOST_TEST(pool->stats().rejected_backpressure == 1u);
    BOOST_TEST(queued->has_value() == false);

    f.gate.release_client(held, mx);
    pump(f.ctx);
    BOOST_REQUIRE(queued->has_value());
    BOOST_TEST(queued->value().value() == held);
    BOOST_TEST(held->acquired());
}

BOOST_AUTO_TEST_CASE(disabled_pooling_connects_and_closes_directly)
{
    gate_fixture f(outbound_config::no_pooling());

    std::vector<std::shared_ptr<std::optional<mxpool::result<connection_ptr>>>> requests;
    for (int i = 0; i < 3; ++i)
        requests.push_back(spawn(f.ctx, f.gate.get_client(mx)));
    pump(f.ctx);

    BOOST_TEST(f.remote.attempts == 3u);
    BOOST_TEST(f.registry.empty());
    BOOST_TEST(f.remote.destinations[0].host == "mx.example.net");

    auto conn = requests[0]->value().value();
    BOOST_TEST(!conn->pooled());
    BOOST_TEST(conn->state() == connection_state::busy);

    f.gate.release_client(conn, mx);
    BOOST_TEST(conn->state() == connection_state::closed);
    BOOST_TEST(f.registry.empty());

    auto peer = read_peer(*f.remote.peers[0]);
    BOOST_TEST(peer.data.empty());
    BOOST_TEST(peer.eof);
}

BOOST_AUTO_TEST_CASE(error_release_never_reaches_idle)
{
    outbound_config cfg = bounded(2);
    cfg.pool_timeout = 30s;
    gate_fixture f(cfg);

    auto conn = f.get_now(mx);
    f.gate.release_client(conn, mx, true);

    auto pool = f.registry.find(f.key(mx));
    BOOST_REQUIRE(pool);
    BOOST_TEST(conn->state() == connection_state::destroying);
    BOOST_TEST(pool->idle_count() == 0u);
    BOOST_TEST(pool->size() == 0u);
    BOOST_TEST(!conn->acquired());
}

BOOST_AUTO_TEST_CASE(zero_pool_timeout_closes_every_release)
{
    log_capture logs;
    outbound_config cfg = outbound_config::no_reuse(2);
    cfg.teardown_timeout = 100ms;
    gate_fixture f(cfg);

    auto first = f.get_now(mx);
    auto second = f.get_now(mx);
    f.gate.release_client(first, mx, false);
    f.gate.release_client(second, mx, true);

    BOOST_TEST(logs.contains(mxpool::log::level::info, "Pool_timeout is zero - shutting it down"));
    auto pool = f.registry.find(f.key(mx));
    BOOST_REQUIRE(pool);
    BOOST_TEST(pool->idle_count() == 0u);

    run_for(f.ctx, 2s);
    BOOST_TEST(first->state() == connection_state::closed);
    BOOST_TEST(second->state() == connection_state::closed);
}

BOOST_AUTO_TEST_CASE(sequential_cycles_reuse_the_connection)
{
    gate_fixture f(bounded(2));

    auto first = f.get_now(mx);
    const auto id = first->id();
    f.gate.release_client(first, mx);
    BOOST_TEST(!first->acquired());
    BOOST_TEST(first->state() == connection_state::idle);

    auto second = f.get_now(mx);
    BOOST_TEST(second->id() == id);
    BOOST_TEST(f.remote.attempts == 1u);
}

BOOST_AUTO_TEST_CASE(release_of_unacquired_connection_is_logged_only)
{
    log_capture logs;
    gate_fixture f(bounded(2));

    auto conn = f.get_now(mx);
    f.gate.release_client(conn, mx);
    auto pool = f.registry.find(f.key(mx));
    BOOST_REQUIRE(pool);
    BOOST_TEST(pool->idle_count() == 1u);

    f.gate.release_client(conn, mx);
    BOOST_TEST(pool->idle_count() == 1u);
    BOOST_TEST(pool->busy_count() == 0u);
    BOOST_TEST(conn->state() == connection_state::idle);
    BOOST_TEST(logs.contains(mxpool::log::level::warn, "Release an un-acquired socket"));
    BOOST_TEST(logs.contains(mxpool::log::level::warn, "test_client_pool.cpp"));
}

BOOST_AUTO_TEST_CASE(release_to_missing_pool_closes_directly)
{
    log_capture logs;
    gate_fixture f(bounded(2));

    auto conn = f.get_now(mx);
    f.registry.init();

    f.gate.release_client(conn, mx);
    BOOST_TEST(conn->state() == connection_state::closed);
    BOOST_TEST(logs.contains(mxpool::log::level::crit, "that doesn't exist!"));
}

BOOST_AUTO_TEST_CASE(connect_failure_is_returned_to_caller)
{
    gate_fixture f(bounded(2));
    f.remote.failures = 1;

    auto r = spawn(f.ctx, f.gate.get_client(mx));
    pump(f.ctx);

    BOOST_REQUIRE(r->has_value());
    BOOST_REQUIRE(!r->value().has_value());
    BOOST_TEST(r->value().error().code == errc::connect_failed);
    BOOST_TEST(r->value().error().is_connect_error());

    auto pool = f.registry.find(f.key(mx));
    BOOST_REQUIRE(pool);
    BOOST_TEST(pool->size() == 0u);
}

BOOST_AUTO_TEST_CASE(async_get_client_with_callback)
{
    gate_fixture f(bounded(2));

    std::optional<mxpool::result<connection_ptr>> got;
    f.gate.async_get_client(mx,
        [&](std::exception_ptr e, mxpool::result<connection_ptr> r)
        {
            if (e)
                std::rethrow_exception(e);
            got = std::move(r);
        });
    pump(f.ctx);

    BOOST_REQUIRE(got.has_value());
    BOOST_REQUIRE(got->has_value());
    BOOST_TEST((*got).value()->acquired());
}

BOOST_AUTO_TEST_CASE(lease_releases_on_scope_exit)
{
    gate_fixture f(bounded(2));

    auto r = spawn(f.ctx, f.gate.lease(mx));
    pump(f.ctx);
    BOOST_REQUIRE(r->has_value());
    BOOST_REQUIRE(r->value().has_value());

    connection_ptr conn;
    {
        client_lease lease = std::move(r->value().value());
        BOOST_TEST(static_cast<bool>(lease));
        conn = lease.get();
        BOOST_TEST(lease->acquired());
    }

    BOOST_TEST(conn->state() == connection_state::idle);
    BOOST_TEST(f.registry.find(f.key(mx))->idle_count() == 1u);
}

BOOST_AUTO_TEST_CASE(invalidated_lease_is_torn_down)
{
    gate_fixture f(bounded(2));

    auto r = spawn(f.ctx, f.gate.lease(mx));
    pump(f.ctx);
    BOOST_REQUIRE(r->has_value());

    client_lease lease = std::move(r->value().value());
    auto conn = lease.get();
    lease.invalidate();
    lease.release();

    BOOST_TEST(!lease);
    BOOST_TEST(conn->state() == connection_state::destroying);
    BOOST_TEST(f.registry.find(f.key(mx))->idle_count() == 0u);
}

BOOST_AUTO_TEST_CASE(drain_pools_waits_for_outstanding_connections)
{
    gate_fixture f(bounded(2));

    auto busy = f.get_now(mx);
    auto idle = f.get_now(destination{"mx2.example.net", 2525});
    f.gate.release_client(idle, destination{"mx2.example.net", 2525});
    BOOST_TEST(f.registry.size() == 2u);

    auto drained = spawn_void(f.ctx, f.gate.drain_pools());
    pump(f.ctx);
    BOOST_TEST(*drained == false);

    f.gate.release_client(busy, mx);
    BOOST_TEST(busy->state() == connection_state::destroying);
    pump(f.ctx);

    BOOST_TEST(*drained);
    BOOST_TEST(f.registry.empty());
    BOOST_TEST(idle->state() != connection_state::idle);
}

BOOST_AUTO_TEST_CASE(drain_pools_on_empty_registry_creates_nothing)
{
    log_capture logs;
    gate_fixture f(bounded(2));

    bool done = false;
    f.gate.async_drain_pools(
        [&](std::exception_ptr e)
        {
            if (e)
                std::rethrow_exception(e);
            done = true;
        });
    pump(f.ctx);

    BOOST_TEST(done);
    BOOST_TEST(f.registry.empty());
    BOOST_TEST(f.remote.attempts == 0u);
    BOOST_TEST(logs.contains(mxpool::log::level::info, "No pools available"));
}

BOOST_AUTO_TEST_CASE(lease_dropped_after_registry_reset_closes_connection)
{
    log_capture logs;
    gate_fixture f(bounded(2));

    connection_ptr conn;
    {
        auto r = spawn(f.ctx, f.gate.lease(mx));
        pump(f.ctx);
        BOOST_REQUIRE(r->has_value());
        BOOST_REQUIRE(r->value().has_value());
        client_lease lease = std::move(r->value().value());
        conn = lease.get();

        f.registry.init();
        BOOST_TEST(f.registry.empty());
    }

    BOOST_TEST(conn->state() == connection_state::closed);
    BOOST_TEST(!conn->acquired());
    BOOST_TEST(logs.contains(mxpool::log::level::crit, "that doesn't exist!"));
    BOOST_TEST(read_peer(*f.remote.peers[0]).eof);
}

BOOST_AUTO_TEST_CASE(release_goes_to_the_pool_that_owns_the_connection)
{
    gate_fixture f(bounded(1));

    auto conn = f.get_now(mx);
    auto pool = f.registry.find(f.key(mx));
    BOOST_REQUIRE(pool);
    BOOST_TEST(pool->busy_count() == 1u);

    const destination rebound{"mx.example.net", 25, "10.0.0.1"};
    f.gate.release_client(conn, rebound, true);

    BOOST_TEST(pool->busy_count() == 0u);
    BOOST_TEST(conn->state() == connection_state::destroying);
    BOOST_TEST(!conn->acquired());
    BOOST_TEST(!f.registry.find(f.key(rebound)));

    auto drained = spawn_void(f.ctx, f.gate.drain_pools());
    run_for(f.ctx, 1s);
    BOOST_TEST(*drained);
    BOOST_TEST(f.registry.empty());
    BOOST_TEST(conn->state() == connection_state::closed);
}

BOOST_AUTO_TEST_CASE(release_naming_another_pool_keeps_both_pools_consistent)
{
    gate_fixture f(bounded(2));
    const destination backup{"mx2.example.net", 25};

    auto conn = f.get_now(mx);
    auto other_conn = f.get_now(backup);
    f.gate.release_client(conn, backup);

    auto own = f.registry.find(f.key(mx));
    auto other = f.registry.find(f.key(backup));
    BOOST_REQUIRE(own);
    BOOST_REQUIRE(other);
    BOOST_TEST(conn->state() == connection_state::idle);
    BOOST_TEST(own->idle_count() == 1u);
    BOOST_TEST(own->busy_count() == 0u);
    BOOST_TEST(other->idle_count() == 0u);
    BOOST_TEST(other->busy_count() == 1u);
    BOOST_TEST(other_conn->acquired());
    BOOST_TEST(other->stats().rejected_releases == 0u);
}
