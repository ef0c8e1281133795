/*

pool/pool_registry.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/log.hpp>
#include <mxpool/net/destination.hpp>
#include <mxpool/pool/connection_factory.hpp>
#include <mxpool/pool/connection_pool.hpp>
#include <mxpool/pool/pool_config.hpp>

namespace mxpool::pool
{

using namespace mxpool::asio;


/**
 * Table of destination pools, keyed by pool name.
 *
 * Owned by the service: init() when it starts, pools are added on first use,
 * drain_all() on shutdown.
 */
class pool_registry
{
public:
    /**
     * @param executor  Executor every pool runs on
     * @param config    Outbound settings shared by all pools
     * @param connector Opens the connections of every pool
     */
    pool_registry(any_io_executor executor, outbound_config config, connector_type connector)
        : executor_(std::move(executor))
        , config_(std::move(config))
        , connector_(std::move(connector))
    {
    }

    /// Registry whose pools connect through a connection_factory.
    pool_registry(any_io_executor executor, outbound_config config)
        : pool_registry(executor, config, connection_factory(executor, config).connector())
    {
    }

    pool_registry(const pool_registry&) = delete;
    pool_registry& operator=(const pool_registry&) = delete;

    /// Start from an empty table.
    void init()
    {
        if (!pools_.empty())
            MXPOOL_LOG_WARN("outbound", "Pool registry re-initialized with " << pools_.size() << " pools still open");
        pools_.clear();
    }

    /**
     * Get the pool for a destination, creating it on first use.
     */
    pool_ptr get_or_create(const net::destination& dest)
    {
        std::string name = net::pool_key(dest, config_.pool_timeout);
        auto it = pools_.find(name);
        if (it != pools_.end())
            return it->second;

        auto factory = [connector = connector_, dest, name]()
        {
            return connector(dest, name);
        };
        auto pool = std::make_shared<connection_pool>(executor_, name, pool_settings::from(config_), std::move(factory));
        MXPOOL_LOG_DEBUG("outbound", "Created pool " << name << " (max " << config_.pool_concurrency_max << ")");
        pools_.emplace(std::move(name), pool);
        return pool;
    }

    /// The pool registered under name, or null.
    [[nodiscard]] pool_ptr find(const std::string& name) const
    {
        auto it = pools_.find(name);
        return it == pools_.end() ? nullptr : it->second;
    }

    [[nodiscard]] std::size_t size() const noexcept { return pools_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pools_.empty(); }

    [[nodiscard]] std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(pools_.size());
        for (const auto& [name, pool] : pools_)
            out.push_back(name);
        return out;
    }

    /**
     * Drain every pool and remove it from the table.
     */
    awaitable<void> drain_all()
    {
        if (pools_.empty())
        {
            MXPOOL_LOG_INFO("outbound", "Drain pools: No pools available");
            co_return;
        }

        MXPOOL_LOG_INFO("outbound", "Draining " << pools_.size() << " pools");
        // A pool stays registered while it drains so its busy connections
        // can still be released to it.
        while (!pools_.empty())
        {
            auto it = pools_.begin();
            const std::string name = it->first;
            pool_ptr pool = it->second;
            co_await pool->drain();

            it = pools_.find(name);
            if (it != pools_.end() && it->second == pool)
                pools_.erase(it);
        }
    }

    [[nodiscard]] const outbound_config& config() const noexcept { return config_; }
    [[nodiscard]] const connector_type& connector() const noexcept { return connector_; }

private:
    any_io_executor executor_;
    outbound_config config_;
    connector_type connector_;
    std::map<std::string, pool_ptr> pools_;
};

} // namespace mxpool::pool
