/*

pool/connection_factory.hpp
---------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/error_detail.hpp>
#include <mxpool/detail/log.hpp>
#include <mxpool/detail/result.hpp>
#include <mxpool/net/destination.hpp>
#include <mxpool/net/error_mapping.hpp>
#include <mxpool/net/line_socket.hpp>
#include <mxpool/pool/connection.hpp>
#include <mxpool/pool/pool_config.hpp>

namespace mxpool::pool
{

using namespace mxpool::asio;

/// Opens one connection for a destination; the pool key is empty for unpooled use.
using connector_type = std::function<awaitable<result<connection_ptr>>(net::destination, std::string)>;


/**
 * Opens raw outbound connections, TCP or local-domain, bounded by the
 * configured connect timeout.
 */
class connection_factory
{
public:
    connection_factory(any_io_executor executor, outbound_config config)
        : executor_(std::move(executor))
        , config_(std::move(config))
    {
    }

    /**
     * Connect to a destination.
     *
     * @return An unassigned connection, or connect_failed / connect_timeout.
     */
    awaitable<result<connection_ptr>> create(net::destination dest, std::string pool_key) const
    {
        return open(executor_, config_, std::move(dest), std::move(pool_key));
    }

    /// This factory as a connector for pools and the admission gate.
    [[nodiscard]] connector_type connector() const
    {
        return [executor = executor_, config = config_](net::destination dest, std::string pool_key)
        {
            return open(executor, config, std::move(dest), std::move(pool_key));
        };
    }

    static awaitable<result<connection_ptr>> open(
        any_io_executor executor,
        outbound_config config,
        net::destination dest,
        std::string pool_key)
    {
        if (!dest.is_unix_socket)
            dest = dest.normalized();

        const std::uint64_t id = next_connection_id();
        {
            detail::error_detail fields;
            fields.add_int("idx", id);
            fields.add("host", dest.host);
            fields.add_int("port", dest.port);
            fields.add_int("pool_timeout", static_cast<std::uint64_t>(config.pool_timeout.count()));
            log::logger::instance().log(log::level::debug, "outbound", "created", fields);
        }

        auto attempt = std::make_shared<connect_attempt>(executor);
        if (config.connect_timeout.count() > 0)
        {
            attempt->timer.expires_after(config.connect_timeout);
            attempt->timer.async_wait([weak = std::weak_ptr<connect_attempt>(attempt)](asio::error_code ec)
            {
                if (ec)
                    return;
                auto a = weak.lock();
                if (!a || a->done)
                    return;
                a->timed_out = true;
                a->resolver.cancel();
                asio::error_code ignored;
                a->socket.close(ignored);
            });
        }

        asio::error_code ec;
        net::io_stage stage = net::io_stage::connect;

        if (dest.is_unix_socket)
        {
            generic::stream_protocol::endpoint endpoint{local::stream_protocol::endpoint(dest.host)};
            attempt->socket.open(endpoint.protocol(), ec);
            if (!ec)
                co_await attempt->socket.async_connect(endpoint, redirect_error(use_awaitable, ec));
        }
        else
        {
            stage = net::io_stage::resolve;
            auto endpoints = co_await attempt->resolver.async_resolve(
                dest.host, std::to_string(dest.port), redirect_error(use_awaitable, ec));
            if (!ec && endpoints.empty())
                ec = asio::error::host_not_found;

            for (const auto& entry : endpoints)
            {
                if (attempt->timed_out)
                    break;

                generic::stream_protocol::endpoint endpoint{entry.endpoint()};
                asio::error_code ignored;
                attempt->socket.close(ignored);

                stage = net::io_stage::connect;
                attempt->socket.open(endpoint.protocol(), ec);
                if (ec)
                    continue;

                if (!dest.local_addr.empty())
                {
                    stage = net::io_stage::bind;
                    auto address = ip::make_address(dest.local_addr, ec);
                    if (!ec)
                        attempt->socket.bind(generic::stream_protocol::endpoint{tcp::endpoint(address, 0)}, ec);
                    if (ec)
                        continue;
                    stage = net::io_stage::connect;
                }

                co_await attempt->socket.async_connect(endpoint, redirect_error(use_awaitable, ec));
                if (!ec)
                    break;
            }
        }

        attempt->done = true;
        attempt->timer.cancel();

        if (ec || attempt->timed_out)
        {
            asio::error_code ignored;
            attempt->socket.close(ignored);

            const errc code = net::map_connect_error(ec, attempt->timed_out);
            std::string message = code == errc::connect_timeout
                ? "Outbound connection timed out to " + dest.to_string()
                : "Outbound connection error: " + ec.message();
            auto fields = net::make_connect_detail(dest.host, dest.port, dest.local_addr, stage);
            fields.add_int("idx", id);
            co_return fail<connection_ptr>(code, std::move(message), fields.str(), static_cast<std::error_code>(ec));
        }

        net::line_socket socket(std::move(attempt->socket), config.max_line_length);
        co_return std::make_shared<connection>(id, std::move(socket), std::move(pool_key));
    }

private:
    struct connect_attempt
    {
        explicit connect_attempt(any_io_executor executor)
            : socket(executor)
            , resolver(executor)
            , timer(executor)
        {
        }

        generic::stream_protocol::socket socket;
        tcp::resolver resolver;
        steady_timer timer;
        bool timed_out = false;
        bool done = false;
    };

    any_io_executor executor_;
    outbound_config config_;
};

} // namespace mxpool::pool
