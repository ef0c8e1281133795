/*

line_socket.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <mxpool/detail/asio_decl.hpp>
#include <mxpool/detail/log.hpp>

namespace mxpool
{
namespace net
{

// Import Asio types from the centralized declarations
using namespace mxpool::asio;

/// Default maximum line length for network protocols (RFC 5321: 998 + CRLF, but commonly 8K)
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/// What a readable idle socket had to offer
enum class idle_input
{
    none,   ///< spurious wakeup, nothing pending
    data,   ///< unsolicited bytes from the peer
    eof,    ///< peer half-closed
    error   ///< transport error
};

/**
Line oriented stream transport over TCP or a local-domain socket.
Tracks whether the write side is still usable, which is what the pool calls
writable.
**/
class line_socket
{
public:
    using socket_type = generic::stream_protocol::socket;
    using executor_type = any_io_executor;

    explicit line_socket(executor_type executor, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH)
        : socket_(std::move(executor)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH))
    {
    }

    explicit line_socket(socket_type socket, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH)
        : socket_(std::move(socket)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH))
    {
    }

    line_socket(line_socket&&) = default;
    line_socket& operator=(line_socket&&) = default;

    line_socket(const line_socket&) = delete;
    line_socket& operator=(const line_socket&) = delete;

    ~line_socket() = default;

    [[nodiscard]] executor_type get_executor() noexcept { return socket_.get_executor(); }

    [[nodiscard]] socket_type& socket() noexcept { return socket_; }
    [[nodiscard]] const socket_type& socket() const noexcept { return socket_; }

    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }

    /// Open, and neither half-closed by us nor seen failing on write.
    [[nodiscard]] bool writable() const noexcept { return socket_.is_open() && !write_closed_; }

    /// The peer went away; stop treating the transport as writable.
    void mark_unwritable() noexcept { write_closed_ = true; }

    void set_trace_source(std::string source)
    {
        trace_source_ = std::move(source);
    }

    /**
    Sending a line to network asynchronously.

    @param line  Line to send (CRLF added if missing).
    @param token Completion token (callback, use_awaitable, etc.).
    **/
    template<typename CompletionToken>
    auto write_line(std::string_view line, CompletionToken&& token)
    {
        auto payload = std::make_shared<std::string>(normalize_line(line));
        MXPOOL_TRACE_SEND(trace_source_, std::string_view(*payload).substr(0, payload->size() - 2));
        return asio::async_compose<CompletionToken, void(asio::error_code, std::size_t)>(
            [this, payload, started = false](auto& self, asio::error_code ec = {}, std::size_t n = 0) mutable
            {
                if (!started)
                {
                    started = true;
                    asio::async_write(socket_, asio::buffer(*payload), std::move(self));
                    return;
                }
                if (ec)
                    write_closed_ = true;
                self.complete(ec, n);
            }, token, socket_);
    }

    /**
    Receiving a line from network asynchronously.

    @param token Completion token.
    **/
    template<typename CompletionToken>
    auto read_line(CompletionToken&& token)
    {
        return asio::async_compose<CompletionToken, void(asio::error_code, std::string)>(
            [this, started = false](auto& self, asio::error_code ec = {}, std::size_t = 0) mutable
            {
                if (!started)
                {
                    started = true;
                    if (read_buffer_.find('\n') != std::string::npos)
                    {
                        complete_line(self, ec);
                        return;
                    }

                    std::size_t max_size = max_line_length_ + 2;
                    asio::async_read_until(socket_, asio::dynamic_buffer(read_buffer_, max_size), '\n', std::move(self));
                    return;
                }

                if (ec)
                {
                    self.complete(ec, std::string());
                    return;
                }
                complete_line(self, ec);
            }, token, socket_);
    }

    /// Completes when the socket has input (data, end-of-stream or an error).
    template<typename CompletionToken>
    auto async_wait_readable(CompletionToken&& token)
    {
        return socket_.async_wait(socket_type::wait_read, std::forward<CompletionToken>(token));
    }

    /**
    Classify pending input without blocking. Bytes read are appended to
    received; they are not part of any line read later.
    **/
    idle_input probe_idle(std::string& received, asio::error_code& ec)
    {
        const bool was_non_blocking = socket_.non_blocking();
        socket_.non_blocking(true, ec);
        if (ec)
            return idle_input::error;

        idle_input outcome = idle_input::none;
        char chunk[1024];
        for (;;)
        {
            std::size_t n = socket_.receive(asio::buffer(chunk), 0, ec);
            if (ec == asio::error::would_block || ec == asio::error::try_again)
            {
                ec.clear();
                break;
            }
            if (ec == asio::error::eof)
            {
                outcome = idle_input::eof;
                break;
            }
            if (ec)
            {
                outcome = idle_input::error;
                break;
            }
            received.append(chunk, n);
            outcome = idle_input::data;
        }

        asio::error_code restore_ec;
        socket_.non_blocking(was_non_blocking, restore_ec);
        return outcome;
    }

    /// Half-close: no more writes, reads still allowed.
    void shutdown_send(asio::error_code& ec)
    {
        write_closed_ = true;
        socket_.shutdown(socket_type::shutdown_send, ec);
    }

    /// Abort every pending asynchronous operation.
    void cancel() noexcept
    {
        asio::error_code ignored;
        socket_.cancel(ignored);
    }

    void close(asio::error_code& ec)
    {
        write_closed_ = true;
        socket_.close(ec);
    }

    void max_line_length(std::size_t value) noexcept { max_line_length_ = std::min(value, MAX_ALLOWED_LINE_LENGTH); }
    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

protected:
    static std::string normalize_line(std::string_view line)
    {
        if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n")
            return std::string(line);
        if (!line.empty() && line.back() == '\n')
        {
            std::string out(line.substr(0, line.size() - 1));
            out += "\r\n";
            return out;
        }
        if (!line.empty() && line.back() == '\r')
        {
            std::string out(line);
            out += "\n";
            return out;
        }
        std::string out(line);
        out += "\r\n";
        return out;
    }

    template<typename Self>
    void complete_line(Self& self, asio::error_code ec)
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            self.complete(asio::error::invalid_argument, std::string());
            return;
        }

        std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
        {
            self.complete(asio::error::message_size, std::string());
            return;
        }
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        MXPOOL_TRACE_RECV(trace_source_, line);
        self.complete(ec, std::move(line));
    }

    socket_type socket_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    bool write_closed_{false};
    std::string trace_source_{"outbound"};
};

} // namespace net
} // namespace mxpool
