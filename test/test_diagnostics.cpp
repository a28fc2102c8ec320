/*

test_diagnostics.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE diagnostics_test

#include <chrono>
#include <sstream>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <rendmail/detail/log.hpp>
#include <rendmail/detail/output_sink.hpp>
#include <rendmail/detail/result.hpp>
#include <rendmail/rewrite/rewriter.hpp>

using rendmail::error_code;
using rendmail::error_kind;
using rendmail::kind_of;
namespace rlog = rendmail::log;


namespace
{

/**
Collecting the log entries while alive.
**/
struct log_capture
{
    log_capture()
    {
        rlog::logger::instance().set_level(rlog::level::debug);
        rlog::logger::instance().set_callback([this](const rlog::entry& e)
        {
            entries.push_back(e);
        });
    }

    ~log_capture()
    {
        rlog::logger::instance().clear_callback();
        rlog::logger::instance().set_level(rlog::level::info);
    }

    bool contains(rlog::level lvl, const std::string& text) const
    {
        for (const auto& e : entries)
            if (e.lvl == lvl && e.message.find(text) != std::string::npos)
                return true;
        return false;
    }

    std::vector<rlog::entry> entries;
};


std::string rewrite(const std::string& input, const rendmail::rewrite_options& opts)
{
    std::istringstream in(input);
    std::string output;
    rendmail::detail::string_sink sink(output);
    auto res = rendmail::rewrite_message(in, sink, opts);
    BOOST_REQUIRE(res.has_value());
    return output;
}


const std::string MESSAGE =
    "Content-Type: multipart/mixed; boundary=b\n"
    "\n"
    "--b\n"
    "Content-Type: text/plain; charset\n"
    "\n"
    "text\n"
    "--b\n"
    "Content-Type: audio/ogg\n"
    "\n"
    "T2dnUw==\n"
    "--b\n"
    "\n"
    "truncated\n";

} // namespace


BOOST_AUTO_TEST_CASE(error_kinds)
{
    BOOST_TEST((kind_of(error_code::success) == error_kind::none));
    BOOST_TEST((kind_of(error_code::input_failed) == error_kind::transport));
    BOOST_TEST((kind_of(error_code::output_failed) == error_kind::transport));
    BOOST_TEST((kind_of(error_code::backup_failed) == error_kind::transport));
    BOOST_TEST((kind_of(error_code::missing_body) == error_kind::message_format));
    BOOST_TEST((kind_of(error_code::malformed_header_field) == error_kind::message_format));
    BOOST_TEST((kind_of(error_code::invalid_boundary) == error_kind::message_format));
    BOOST_TEST((kind_of(error_code::missing_delimiter) == error_kind::message_format));
    BOOST_TEST((kind_of(error_code::nesting_too_deep) == error_kind::message_format));
    BOOST_TEST((kind_of(error_code::invalid_content_type) == error_kind::message_format));
    BOOST_TEST((kind_of(error_code::invalid_argument) == error_kind::configuration));
    BOOST_TEST((kind_of(error_code::invalid_glob) == error_kind::configuration));

    rendmail::error err(error_code::missing_delimiter, "EOF while looking for delimiter");
    BOOST_TEST(err.is_message_error());
    BOOST_TEST(!err.is_transport_error());
    BOOST_CHECK_EQUAL(err.to_string(), "[603] EOF while looking for delimiter");
    BOOST_CHECK_EQUAL(rendmail::error(error_code::invalid_glob).message(), "Invalid glob pattern");
}


BOOST_AUTO_TEST_CASE(verbose_rewrite_logged)
{
    rendmail::rewrite_options opts;
    opts.delete_media_types = {"audio/*"};
    opts.verbose = true;

    log_capture capture;
    BOOST_CHECK_EQUAL(rewrite(MESSAGE, opts).find("T2dnUw=="), std::string::npos);
    BOOST_TEST(capture.contains(rlog::level::info, "Deleting audio/ogg"));
    BOOST_TEST(capture.contains(rlog::level::info, "Ignoring invalid Content-Type \"text/plain; charset\""));
    BOOST_TEST(capture.contains(rlog::level::warn, "Ignoring error: EOF while looking for delimiter \"--b\""));
}


BOOST_AUTO_TEST_CASE(quiet_rewrite_not_logged)
{
    rendmail::rewrite_options opts;
    opts.delete_media_types = {"audio/*"};

    log_capture capture;
    rewrite(MESSAGE, opts);
    BOOST_TEST(capture.entries.empty());
}
