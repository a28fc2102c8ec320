/*

test_header_folder.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE header_folder_test

#include <sstream>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <rendmail/io/line_reader.hpp>
#include <rendmail/mime/header_folder.hpp>

using rendmail::fold_header_field;
using std::string;
using std::vector;


namespace
{

const string a38(38, 'a');
const string a69(69, 'a');
const string a70(70, 'a');
const string a78(78, 'a');

} // namespace


BOOST_AUTO_TEST_CASE(fold_header_field_table)
{
    struct
    {
        string unfolded;
        string term;
        vector<string> expected;
    } cases[] =
    {
        {"", "\n", {}},
        {" ", "\n", {}},
        {"From: me", "\n", {"From: me\n"}},
        {"Subject: Some words", "\r\n", {"Subject: Some words\r\n"}},
        {"Subject: " + a69, "\n", {"Subject: " + a69 + "\n"}},
        {"Subject: " + a70, "\n", {"Subject:\n", " " + a70 + "\n"}},
        {"Subject: " + a69 + "\t" + a38 + " " + a38 + " " + a38, "\n",
            {"Subject: " + a69 + "\n", "\t" + a38 + " " + a38 + "\n", " " + a38 + "\n"}},
        {"Subject: " + a78 + " " + a78, "\n", {"Subject:\n", " " + a78 + "\n", " " + a78 + "\n"}},
        {"Subject: trailing  ", "\r\n", {"Subject: trailing\r\n"}},
    };

    for (const auto& c : cases)
    {
        BOOST_TEST_CONTEXT("line " << c.unfolded)
        {
            BOOST_TEST(fold_header_field(c.unfolded, c.term) == c.expected, boost::test_tools::per_element());
        }
    }
}


BOOST_AUTO_TEST_CASE(folded_lines_unfold_to_original)
{
    const string term = "\r\n";
    const string unfolded = "X-Rendmail-Subject: " + a38 + " " + a69 + "\t" + a38 + "  " + a70 + " end";

    vector<string> lines = fold_header_field(unfolded, term);
    BOOST_TEST(lines.size() > 1U);
    string joined;
    for (const auto& line : lines)
    {
        BOOST_TEST(line.length() <= 78U + term.length());
        joined += line;
    }

    std::istringstream in(joined);
    rendmail::line_reader reader(in);
    auto fl = reader.read_folded_line();
    BOOST_REQUIRE(fl.has_value() && fl->has_value());
    BOOST_CHECK_EQUAL((*fl)->unfolded, unfolded);
    BOOST_TEST((*fl)->lines == lines, boost::test_tools::per_element());
}
