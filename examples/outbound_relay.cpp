/*

outbound_relay.cpp
------------------

Opens pooled connections to an SMTP server, reads the greeting, says EHLO and
hands the connection back. The second round reuses the pooled connection.

Usage: outbound_relay [host] [port]
MXPOOL_LOG_LEVEL (name or 0-9) and MXPOOL_LOG_FORMAT=logfmt tune the log output.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mxpool/mxpool.hpp>
#include "example_util.hpp"


using mxpool::net::destination;
using mxpool::pool::client_pool;
using mxpool::pool::outbound_config;
using mxpool::pool::pool_registry;
using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    const std::string host = argc > 1 ? argv[1] : "localhost";
    const unsigned short port = argc > 2 ? static_cast<unsigned short>(std::atoi(argv[2])) : 25;

    auto& logger = mxpool::log::logger::instance();
    logger.set_level(mxpool::log::level::protocol);
    logger.set_timestamps(true);
    if (const char* level = std::getenv("MXPOOL_LOG_LEVEL"))
    {
        if (auto parsed = mxpool::log::parse_level(level))
            logger.set_level(*parsed);
    }
    if (const char* fmt = std::getenv("MXPOOL_LOG_FORMAT"); fmt != nullptr && std::string(fmt) == "logfmt")
        logger.set_format(mxpool::log::format::logfmt);

    boost::asio::io_context io_ctx;

    outbound_config config;
    config.connect_timeout = std::chrono::seconds{10};
    config.pool_concurrency_max = 2;

    pool_registry registry(io_ctx.get_executor(), config);
    registry.init();
    client_pool gate(io_ctx.get_executor(), registry);

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            destination dest{host, port};
            for (int round = 0; round < 2; ++round)
            {
                auto conn = co_await gate.get_client(dest);
                if (!conn)
                {
                    print_error(conn.error());
                    break;
                }

                bool failed = false;
                try
                {
                    auto& socket = (*conn)->socket();
                    if (round == 0)
                    {
                        std::string greeting = co_await socket.read_line(boost::asio::use_awaitable);
                        cout << "greeting: " << greeting << endl;
                    }
                    co_await socket.write_line("EHLO relay.localdomain", boost::asio::use_awaitable);
                    for (;;)
                    {
                        std::string line = co_await socket.read_line(boost::asio::use_awaitable);
                        if (line.size() < 4 || line[3] != '-')
                            break;
                    }
                    co_await socket.write_line("RSET", boost::asio::use_awaitable);
                    co_await socket.read_line(boost::asio::use_awaitable);
                }
                catch (const boost::system::system_error& exc)
                {
                    cout << exc.what() << endl;
                    failed = true;
                }

                gate.release_client(*conn, dest, failed);
                if (auto pool = registry.find(mxpool::net::pool_key(dest, config.pool_timeout)))
                    print_stats(pool->name(), pool->stats());
            }

            co_await gate.drain_pools();
            co_return;
        },
        [](std::exception_ptr e)
        {
            if (e)
                std::rethrow_exception(e);
        });

    io_ctx.run();
    return EXIT_SUCCESS;
}
