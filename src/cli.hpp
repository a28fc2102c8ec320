/*

cli.hpp
-------

Command line handling of the `rendmail` tool: reading one message from the standard input and writing it rewritten to the standard output.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <rendmail/detail/result.hpp>
#include <rendmail/rewrite/options.hpp>


namespace rendmail::cli
{


/**
Exit statuses of the tool.
**/
enum exit_status : int
{
    STATUS_OK = 0,
    STATUS_FAILURE = 1,
    STATUS_USAGE = 2
};


/**
Arguments as given on the command line.
**/
struct arguments
{
    std::string backup_dir;
    bool delete_binary = false;
    std::string delete_types;
    std::string keep_types;
    std::string fake_now;
    bool decode_subject = false;
    bool strict = false;
    bool verbose = false;
    bool help = false;
};


/**
Time given on the command line, with the zone it was written in.
**/
struct zoned_time_point
{
    std::chrono::system_clock::time_point time;
    std::chrono::minutes offset{0};
};


/**
Parsing the command line with `getopt_long`.

@param argc Number of arguments.
@param argv Arguments, the program name first.
@return     Arguments, or error `invalid_argument` for an unknown option, a missing value or a stray operand.
**/
result<arguments> parse_arguments(int argc, char* argv[]);


/**
Splitting a comma separated list. Items are trimmed and empty items dropped.
**/
std::vector<std::string> split_list(std::string_view list);


/**
Parsing an RFC 3339 time such as `2021-02-18T21:54:42.123Z` or `2021-02-18T23:54:42+02:00`.

@param text Time to parse.
@return     Time and zone offset, or error `invalid_argument`.
**/
result<zoned_time_point> parse_rfc3339(std::string_view text);


/**
Offset of the local zone at the given time.
**/
std::chrono::minutes local_utc_offset(std::chrono::system_clock::time_point tp);


/**
Building the rewriting options from the arguments.

@param args Parsed arguments.
@param now  Current time and zone.
@return     Options, or error `invalid_argument` for incompatible arguments or `invalid_glob` for a malformed glob.
**/
result<rewrite_options> make_rewrite_options(const arguments& args, const zoned_time_point& now);


/**
Usage text.
**/
std::string usage(std::string_view program);


/**
Running the tool.

@param argc Number of arguments.
@param argv Arguments.
@param in   Message to read.
@param out  Destination of the rewritten message.
@return     Exit status.
**/
int run(int argc, char* argv[], std::istream& in, std::ostream& out);


} // namespace rendmail::cli
