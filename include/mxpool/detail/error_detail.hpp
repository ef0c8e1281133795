/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header-only helper to build structured key/value payloads without throwing
(except potential allocation failures). Used both for error_info::detail and
for the fields attached to log entries.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace mxpool::detail
{

class error_detail
{
public:
    using field = std::pair<std::string, std::string>;

    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        fields_.emplace_back(std::string(key), std::string(value));
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        fields_.emplace_back(std::string(key), to_decimal(v));
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        std::string value = ec.value() < 0
            ? "-" + to_decimal(static_cast<std::uint64_t>(-static_cast<std::int64_t>(ec.value())))
            : to_decimal(static_cast<std::uint64_t>(ec.value()));
        const std::string msg = ec.message();
        if (!msg.empty())
        {
            value.push_back(' ');
            value.append(msg);
        }
        fields_.emplace_back(std::string(key), std::move(value));
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const std::vector<field>& fields() const noexcept { return fields_; }

    /// One key=value per line.
    [[nodiscard]] std::string str() const
    {
        std::string out;
        for (const auto& [key, value] : fields_)
        {
            out.append(key);
            out.push_back('=');
            out.append(value);
            out.push_back('\n');
        }
        return out;
    }

    /// Space separated key=value pairs, values quoted when needed.
    [[nodiscard]] std::string logfmt() const
    {
        std::string out;
        for (const auto& [key, value] : fields_)
        {
            if (!out.empty())
                out.push_back(' ');
            out.append(key);
            out.push_back('=');
            append_logfmt_value(out, value);
        }
        return out;
    }

    static void append_logfmt_value(std::string& out, std::string_view value)
    {
        bool needs_quotes = value.empty();
        for (char c : value)
        {
            if (c == ' ' || c == '=' || c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20)
            {
                needs_quotes = true;
                break;
            }
        }
        if (!needs_quotes)
        {
            out.append(value);
            return;
        }

        out.push_back('"');
        for (char c : value)
        {
            switch (c)
            {
                case '"': out.append("\\\""); break;
                case '\\': out.append("\\\\"); break;
                case '\r': out.append("\\r"); break;
                case '\n': out.append("\\n"); break;
                case '\t': out.append("\\t"); break;
                default: out.push_back(c); break;
            }
        }
        out.push_back('"');
    }

private:
    std::vector<field> fields_;

    static std::string to_decimal(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec != std::errc{})
            return "0";
        return std::string(buffer, static_cast<std::size_t>(res.ptr - buffer));
    }
};

} // namespace mxpool::detail
