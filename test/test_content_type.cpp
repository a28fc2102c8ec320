/*

test_content_type.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE content_type_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <rendmail/mime/content_type.hpp>

using rendmail::content_type_t;
using rendmail::parse_content_type;


namespace
{

content_type_t parsed(const std::string& value)
{
    auto ct = parse_content_type(value);
    BOOST_REQUIRE_MESSAGE(ct.has_value(), "parsing " << value);
    return *ct;
}

bool rejected(const std::string& value)
{
    auto ct = parse_content_type(value);
    return !ct.has_value() && ct.error().is(rendmail::error_code::invalid_content_type);
}

} // namespace


BOOST_AUTO_TEST_CASE(default_type)
{
    const content_type_t& def = content_type_t::default_type();
    BOOST_CHECK_EQUAL(def.media_type, "text/plain");
    BOOST_CHECK_EQUAL(def.param("charset"), "us-ascii");
    BOOST_TEST(!def.is_multipart());
    BOOST_CHECK(parsed("text/plain; charset=us-ascii") == def);
}


BOOST_AUTO_TEST_CASE(media_type_lower_cased)
{
    auto ct = parsed("  Multipart/Mixed ; BOUNDARY=\"=_Part_1\"");
    BOOST_CHECK_EQUAL(ct.media_type, "multipart/mixed");
    BOOST_TEST(ct.is_multipart());
    BOOST_CHECK_EQUAL(ct.param("boundary"), "=_Part_1");
}


BOOST_AUTO_TEST_CASE(parameter_values)
{
    auto ct = parsed("text/plain; charset=UTF-8; format=flowed");
    BOOST_CHECK_EQUAL(ct.param("charset"), "UTF-8");
    BOOST_CHECK_EQUAL(ct.param("format"), "flowed");
    BOOST_CHECK_EQUAL(ct.param("delsp"), "");

    auto quoted = parsed("application/octet-stream; name=\"a \\\"b\\\" c.bin\"");
    BOOST_CHECK_EQUAL(quoted.param("name"), "a \"b\" c.bin");

    BOOST_CHECK_EQUAL(parsed("image/png;").media_type, "image/png");
    BOOST_CHECK_EQUAL(parsed("image/png; name=a.png;").param("name"), "a.png");
    BOOST_CHECK_EQUAL(parsed("message/rfc822").params.size(), 0U);
    BOOST_CHECK_EQUAL(parsed("text").media_type, "text");
}


BOOST_AUTO_TEST_CASE(malformed_values)
{
    BOOST_TEST(rejected(""));
    BOOST_TEST(rejected("/plain"));
    BOOST_TEST(rejected("text/"));
    BOOST_TEST(rejected("text/plain/x"));
    BOOST_TEST(rejected("text plain"));
    BOOST_TEST(rejected("text/plain; charset"));
    BOOST_TEST(rejected("text/plain; charset=\"unterminated"));
    BOOST_TEST(rejected("text/plain; charset=a; charset=b"));
    BOOST_TEST(rejected("multipart/mixed; boundary=\"a\r\nb\""));
    BOOST_TEST(!rejected("text/plain; charset=a; charset=a"));
}


BOOST_AUTO_TEST_CASE(rfc2231_continuations)
{
    auto ct = parsed("message/external-body; access-type=URL; URL*0=\"ftp://\"; URL*1=\"cs.utk.edu/pub/moore/bulk-mailer/bulk-mailer.tar\"");
    BOOST_CHECK_EQUAL(ct.param("url"), "ftp://cs.utk.edu/pub/moore/bulk-mailer/bulk-mailer.tar");

    auto ext = parsed("application/x-stuff; title*=us-ascii'en-us'This%20is%20%2A%2A%2Afun%2A%2A%2A");
    BOOST_CHECK_EQUAL(ext.param("title"), "This is ***fun***");

    auto mixed = parsed("application/x-stuff; title*0*=us-ascii'en'This%20is%20even%20more%20; title*1*=%2A%2A%2Afun%2A%2A%2A%20; title*2=\"isn't it!\"");
    BOOST_CHECK_EQUAL(mixed.param("title"), "This is even more ***fun*** isn't it!");

    auto unknown_charset = parsed("application/x-stuff; title*=iso-8859-2''abc");
    BOOST_CHECK_EQUAL(unknown_charset.param("title"), "");
}
