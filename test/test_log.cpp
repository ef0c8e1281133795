/*

test_log.cpp
------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE log_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mxpool/detail/log.hpp>

namespace mlog = mxpool::log;

namespace
{

struct recorder
{
    explicit recorder(mlog::level lvl)
    {
        mlog::logger::instance().set_level(lvl);
        mlog::logger::instance().set_callback([this](const mlog::entry& e) { entries.push_back(e); });
    }

    ~recorder()
    {
        mlog::logger::instance().clear_callback();
        mlog::logger::instance().set_level(mlog::level::warn);
    }

    std::vector<mlog::entry> entries;
};

mlog::entry make_entry(mlog::level lvl, std::string message)
{
    mlog::entry e{};
    e.lvl = lvl;
    e.source = "outbound";
    e.message = std::move(message);
    return e;
}

} // namespace


BOOST_AUTO_TEST_CASE(format_text)
{
    auto e = make_entry(mlog::level::info, "Pool drained");
    BOOST_TEST(mlog::format_entry(e, mlog::format::text) == "[INFO] [outbound] Pool drained");

    e.fields.emplace_back("pool", "outbound::25:mx::50");
    e.fields.emplace_back("idle", "2");
    BOOST_TEST(mlog::format_entry(e, mlog::format::text)
        == "[INFO] [outbound] Pool drained pool=outbound::25:mx::50 idle=2");

    e.source.clear();
    e.fields.clear();
    BOOST_TEST(mlog::format_entry(e, mlog::format::text) == "[INFO] [core] Pool drained");
}

BOOST_AUTO_TEST_CASE(format_logfmt)
{
    auto e = make_entry(mlog::level::warn, "Rejected release");
    e.fields.emplace_back("idx", "7");
    BOOST_TEST(mlog::format_entry(e, mlog::format::logfmt)
        == "level=WARN source=outbound message=\"Rejected release\" idx=7");
}

BOOST_AUTO_TEST_CASE(messages_stay_on_one_line)
{
    BOOST_TEST(mlog::escape_message("250-first\r\n250 last\r\n") == "250-first\\r\\n250 last");
    BOOST_TEST(mlog::escape_message("plain") == "plain");

    auto e = make_entry(mlog::level::protocol, "S: 421 bye\r\n");
    BOOST_TEST(mlog::format_entry(e, mlog::format::text) == "[PROTOCOL] [outbound] S: 421 bye");
}

BOOST_AUTO_TEST_CASE(parse_level_names_and_numbers)
{
    BOOST_TEST((mlog::parse_level("warn") == mlog::level::warn));
    BOOST_TEST((mlog::parse_level("LOGWARN") == mlog::level::warn));
    BOOST_TEST((mlog::parse_level("Protocol") == mlog::level::protocol));
    BOOST_TEST((mlog::parse_level("logcrit") == mlog::level::crit));
    BOOST_TEST((mlog::parse_level("0") == mlog::level::emerg));
    BOOST_TEST((mlog::parse_level("4") == mlog::level::warn));
    BOOST_TEST((mlog::parse_level("9") == mlog::level::data));
    BOOST_TEST(!mlog::parse_level("10").has_value());
    BOOST_TEST(!mlog::parse_level("verbose").has_value());
    BOOST_TEST(!mlog::parse_level("").has_value());
}

BOOST_AUTO_TEST_CASE(level_filtering)
{
    recorder rec(mlog::level::info);

    MXPOOL_LOG_DEBUG("outbound", "hidden " << 1);
    MXPOOL_LOG_INFO("outbound", "[pool] acquired socket " << 42);
    MXPOOL_LOG_CRIT("outbound", "broken");
    MXPOOL_TRACE_SEND("outbound", "QUIT");

    BOOST_REQUIRE(rec.entries.size() == 2u);
    BOOST_TEST(rec.entries[0].message == "[pool] acquired socket 42");
    BOOST_TEST(rec.entries[0].source == "outbound");
    BOOST_TEST((rec.entries[1].lvl == mlog::level::crit));

    BOOST_TEST(mlog::logger::instance().is_enabled(mlog::level::warn));
    BOOST_TEST(!mlog::logger::instance().is_enabled(mlog::level::debug));
    BOOST_TEST(!mlog::logger::instance().is_enabled(mlog::level::off));
}

BOOST_AUTO_TEST_CASE(protocol_traces)
{
    recorder rec(mlog::level::protocol);

    MXPOOL_TRACE_SEND("outbound", "QUIT");
    MXPOOL_TRACE_RECV("outbound", "221 2.0.0 Bye");

    BOOST_REQUIRE(rec.entries.size() == 2u);
    BOOST_TEST(rec.entries[0].message == "C: QUIT");
    BOOST_TEST(rec.entries[1].message == "S: 221 2.0.0 Bye");
    BOOST_REQUIRE(rec.entries[1].trace_info.has_value());
    BOOST_TEST((rec.entries[1].trace_info->dir == mlog::direction::receive));
    BOOST_TEST(rec.entries[1].trace_info->data == "221 2.0.0 Bye");
}

BOOST_AUTO_TEST_CASE(structured_fields)
{
    recorder rec(mlog::level::debug);

    mxpool::detail::error_detail fields;
    fields.add_int("idx", 3).add("host", "mx.example.net");
    mlog::logger::instance().log(mlog::level::debug, "outbound", "created", fields);

    BOOST_REQUIRE(rec.entries.size() == 1u);
    BOOST_REQUIRE(rec.entries[0].fields.size() == 2u);
    BOOST_TEST(rec.entries[0].fields[0].first == "idx");
    BOOST_TEST(rec.entries[0].fields[0].second == "3");
}
