/*

test_tee_streambuf.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE tee_streambuf_test

#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <rendmail/detail/output_sink.hpp>
#include <rendmail/io/line_reader.hpp>
#include <rendmail/io/tee_streambuf.hpp>

using rendmail::tee_streambuf;
using rendmail::detail::string_sink;
using std::string;


namespace
{

class rejecting_sink : public rendmail::detail::output_sink
{
public:
    bool write(std::string_view) override
    {
        calls++;
        return false;
    }

    int calls = 0;
};

} // namespace


BOOST_AUTO_TEST_CASE(copies_what_is_read)
{
    std::istringstream source("Subject: one\n\nbody\n");
    string copy;
    string_sink sink(copy);
    tee_streambuf tee(*source.rdbuf(), sink, 4);
    std::istream in(&tee);

    string line;
    BOOST_REQUIRE(std::getline(in, line));
    BOOST_CHECK_EQUAL(line, "Subject: one");
    BOOST_TEST(copy.length() >= line.length());
    BOOST_TEST(copy.length() < 20U);

    BOOST_REQUIRE(tee.drain().has_value());
    BOOST_CHECK_EQUAL(copy, "Subject: one\n\nbody\n");
    BOOST_TEST(tee.status().has_value());
}


BOOST_AUTO_TEST_CASE(drain_after_partial_read)
{
    const string message = "From: a\nSubject: b\n\n" + string(20000, 'x') + "\n";
    std::istringstream source(message);
    string copy;
    string_sink sink(copy);
    tee_streambuf tee(*source.rdbuf(), sink);
    std::istream in(&tee);

    rendmail::line_reader reader(in);
    auto line = reader.read_line();
    BOOST_REQUIRE(line.has_value() && line->has_value());
    BOOST_CHECK_EQUAL(**line, "From: a\n");

    BOOST_REQUIRE(tee.drain().has_value());
    BOOST_CHECK_EQUAL(copy, message);

    BOOST_REQUIRE(tee.drain().has_value());
    BOOST_CHECK_EQUAL(copy, message);
}


BOOST_AUTO_TEST_CASE(sink_failure_does_not_stop_reading)
{
    std::istringstream source("line one\nline two\n");
    rejecting_sink sink;
    tee_streambuf tee(*source.rdbuf(), sink, 4);
    std::istream in(&tee);

    std::ostringstream read;
    read << in.rdbuf();
    BOOST_CHECK_EQUAL(read.str(), "line one\nline two\n");
    BOOST_CHECK_EQUAL(sink.calls, 1);
    BOOST_TEST(tee.failed());

    auto st = tee.status();
    BOOST_REQUIRE(!st.has_value());
    BOOST_TEST(st.error().is(rendmail::error_code::backup_failed));
    BOOST_TEST(st.error().is_transport_error());
}
