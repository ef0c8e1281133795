/*

destination.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace mxpool::net
{

/// Default SMTP port used when a destination leaves the port unset
inline constexpr unsigned short DEFAULT_PORT = 25;

/**
 * Where an outbound connection goes.
 * For a local-domain socket, host holds the filesystem path and port is ignored.
 */
struct destination
{
    std::string host;
    unsigned short port = 0;
    std::string local_addr;
    bool is_unix_socket = false;

    destination() = default;

    destination(std::string h, unsigned short p, std::string local = {}, bool unix_socket = false)
        : host(std::move(h)), port(p), local_addr(std::move(local)), is_unix_socket(unix_socket)
    {
    }

    /// Local-domain socket destination
    static destination unix_socket(std::string path)
    {
        return destination{std::move(path), 0, {}, true};
    }

    /// Fill in the defaults: port 25, host "localhost".
    [[nodiscard]] destination normalized() const
    {
        destination out = *this;
        if (out.port == 0)
            out.port = DEFAULT_PORT;
        if (out.host.empty())
            out.host = "localhost";
        return out;
    }

    /// host:port, or the socket path
    [[nodiscard]] std::string to_string() const
    {
        if (is_unix_socket)
            return host;
        return host + ":" + std::to_string(port);
    }
};

/**
 * Pool name for a destination: outbound::<port>:<host>:<local_addr>:<pool_timeout>.
 * The idle timeout is part of the identity so a reconfigured timeout never
 * reuses connections of the old pool.
 */
[[nodiscard]] inline std::string pool_key(const destination& dest, std::chrono::seconds pool_timeout)
{
    const destination d = dest.normalized();
    std::string key = "outbound::";
    key.append(std::to_string(d.port));
    key.push_back(':');
    key.append(d.host);
    key.push_back(':');
    key.append(d.local_addr);
    key.push_back(':');
    key.append(std::to_string(pool_timeout.count()));
    return key;
}

} // namespace mxpool::net
