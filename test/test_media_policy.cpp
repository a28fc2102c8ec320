/*

test_media_policy.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE media_policy_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <rendmail/mime/media_policy.hpp>
#include <rendmail/rewrite/options.hpp>

using rendmail::glob_match;
using rendmail::rewrite_options;
using rendmail::should_delete;
using rendmail::validate_glob;

BOOST_TEST_DONT_PRINT_LOG_VALUE(rendmail::error_kind)


namespace
{

bool deleted(const std::string& media_type, const std::vector<std::string>& del, const std::vector<std::string>& keep)
{
    auto res = should_delete(media_type, del, keep);
    BOOST_REQUIRE(res.has_value());
    return *res;
}

bool matches(const std::string& pattern, const std::string& name)
{
    auto res = glob_match(pattern, name);
    BOOST_REQUIRE(res.has_value());
    return *res;
}

} // namespace


BOOST_AUTO_TEST_CASE(should_delete_table)
{
    BOOST_TEST(!deleted("text/plain", {}, {}));
    BOOST_TEST(!deleted("text/plain", {"audio/*", "image/*"}, {}));
    BOOST_TEST(deleted("image/jpeg", {"audio/*", "image/*"}, {}));
    BOOST_TEST(deleted("image/jpeg", {"audio/*", "image/*"}, {"image/png"}));
    BOOST_TEST(!deleted("image/jpeg", {"audio/*", "image/*"}, {"image/jpeg"}));
    BOOST_TEST(!deleted("image/jpeg", {"audio/*", "image/*"}, {"image/png", "image/jpeg"}));
}


BOOST_AUTO_TEST_CASE(external_body_placeholder_is_not_deleted_again)
{
    BOOST_TEST(!deleted("message/external-body", {"image/*", "application/*", "audio/*", "video/*"}, {}));
}


BOOST_AUTO_TEST_CASE(globs_evaluated_in_order)
{
    BOOST_TEST(!deleted("image/png", {"image/*", "*/png"}, {"image/png"}));
    BOOST_TEST(deleted("image/png", {"*/png", "[bad"}, {}));

    auto late = should_delete("image/png", {"[bad", "*/png"}, {});
    BOOST_REQUIRE(!late.has_value());
    BOOST_TEST(late.error().is(rendmail::error_code::invalid_glob));

    // A keep glob is reached only once a delete glob matched.
    auto unreached = should_delete("text/plain", {"image/*"}, {"[bad"});
    BOOST_REQUIRE(unreached.has_value());
    BOOST_TEST(!*unreached);

    auto reached = should_delete("image/png", {"image/*"}, {"[bad"});
    BOOST_REQUIRE(!reached.has_value());
    BOOST_TEST(reached.error().is(rendmail::error_code::invalid_glob));
}


BOOST_AUTO_TEST_CASE(glob_syntax)
{
    BOOST_TEST(matches("image/*", "image/jpeg"));
    BOOST_TEST(!matches("image/*", "Image/jpeg"));
    BOOST_TEST(!matches("*", "image/jpeg"));
    BOOST_TEST(matches("*/*", "image/jpeg"));
    BOOST_TEST(matches("application/*+xml", "application/atom+xml"));
    BOOST_TEST(!matches("application/*+xml", "application/xml"));
    BOOST_TEST(matches("image/jp?g", "image/jpeg"));
    BOOST_TEST(!matches("image?jpeg", "image/jpeg"));
    BOOST_TEST(matches("image/[jp][pn]g", "image/png"));
    BOOST_TEST(matches("image/[^p]*", "image/jpeg"));
    BOOST_TEST(!matches("image/[^p]*", "image/png"));
    BOOST_TEST(matches("video/[a-m]*", "video/mp4"));
    BOOST_TEST(matches("text/x\\*", "text/x*"));
    BOOST_TEST(!matches("text/x\\*", "text/xy"));
    BOOST_TEST(matches("", ""));
    BOOST_TEST(!matches("", "text/plain"));
}


BOOST_AUTO_TEST_CASE(malformed_globs)
{
    for (const std::string& pattern : {"[", "image/[", "[]", "[a-]", "[-a]", "trailing\\", "[z-\\"})
    {
        BOOST_TEST_CONTEXT("pattern " << pattern)
        {
            auto res = validate_glob(pattern);
            BOOST_REQUIRE(!res.has_value());
            BOOST_TEST(res.error().is(rendmail::error_code::invalid_glob));
            BOOST_TEST(res.error().kind() == rendmail::error_kind::configuration);
        }
    }
    BOOST_TEST(validate_glob("image/[a-z]*").has_value());
    BOOST_TEST(validate_glob("application/pgp-*").has_value());
}


BOOST_AUTO_TEST_CASE(binary_presets)
{
    const auto& del = rewrite_options::binary_delete_types();
    const auto& keep = rewrite_options::binary_keep_types();

    BOOST_TEST(deleted("image/png", del, keep));
    BOOST_TEST(deleted("application/pdf", del, keep));
    BOOST_TEST(deleted("video/mp4", del, keep));
    BOOST_TEST(!deleted("application/json", del, keep));
    BOOST_TEST(!deleted("application/pgp-signature", del, keep));
    BOOST_TEST(!deleted("application/atom+xml", del, keep));
    BOOST_TEST(!deleted("text/html", del, keep));

    rewrite_options opts;
    opts.delete_media_types = del;
    opts.keep_media_types = keep;
    BOOST_TEST(opts.validate().has_value());
}


BOOST_AUTO_TEST_CASE(options_validation_reports_bad_glob)
{
    rewrite_options opts;
    opts.delete_media_types = {"image/*"};
    opts.keep_media_types = {"image/[png"};
    auto res = opts.validate();
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(rendmail::error_code::invalid_glob));
}
