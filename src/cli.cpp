/*

cli.cpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include "cli.hpp"

#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <utility>
#include <getopt.h>
#include <boost/algorithm/string.hpp>
#include <rendmail/detail/log.hpp>
#include <rendmail/detail/regex.hpp>
#include <rendmail/io/tee_streambuf.hpp>
#include <rendmail/rewrite/rewriter.hpp>
#include "backup.hpp"


namespace rendmail::cli
{

namespace
{

enum option_id : int
{
    OPT_BACKUP_DIR = 1000,
    OPT_DELETE_BINARY,
    OPT_DELETE_TYPES,
    OPT_KEEP_TYPES,
    OPT_FAKE_NOW,
    OPT_DECODE_SUBJECT,
    OPT_STRICT,
    OPT_VERBOSE,
    OPT_HELP
};


const struct option LONG_OPTIONS[] =
{
    {"backup-dir", required_argument, nullptr, OPT_BACKUP_DIR},
    {"delete-binary", no_argument, nullptr, OPT_DELETE_BINARY},
    {"delete-types", required_argument, nullptr, OPT_DELETE_TYPES},
    {"keep-types", required_argument, nullptr, OPT_KEEP_TYPES},
    {"fake-now", required_argument, nullptr, OPT_FAKE_NOW},
    {"decode-subject", no_argument, nullptr, OPT_DECODE_SUBJECT},
    {"strict", no_argument, nullptr, OPT_STRICT},
    {"verbose", no_argument, nullptr, OPT_VERBOSE},
    {"help", no_argument, nullptr, OPT_HELP},
    {nullptr, 0, nullptr, 0}
};


int rewrite(std::istream& in, std::ostream& out, const rewrite_options& opts)
{
    auto res = rewrite_message(in, out, opts);
    if (!res)
    {
        RENDMAIL_ERROR("Failed rewriting message: " + res.error().to_string());
        return STATUS_FAILURE;
    }
    return STATUS_OK;
}

} // namespace


result<arguments> parse_arguments(int argc, char* argv[])
{
    arguments args;
    // Zero makes GNU getopt start over, so that parsing can be repeated.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long_only(argc, argv, "", LONG_OPTIONS, nullptr)) != -1)
    {
        switch (opt)
        {
            case OPT_BACKUP_DIR:
                args.backup_dir = optarg;
                break;
            case OPT_DELETE_BINARY:
                args.delete_binary = true;
                break;
            case OPT_DELETE_TYPES:
                args.delete_types = optarg;
                break;
            case OPT_KEEP_TYPES:
                args.keep_types = optarg;
                break;
            case OPT_FAKE_NOW:
                args.fake_now = optarg;
                break;
            case OPT_DECODE_SUBJECT:
                args.decode_subject = true;
                break;
            case OPT_STRICT:
                args.strict = true;
                break;
            case OPT_VERBOSE:
                args.verbose = true;
                break;
            case OPT_HELP:
                args.help = true;
                break;
            default:
            {
                std::string arg = optind > 0 && optind <= argc ? argv[optind - 1] : "";
                return fail<arguments>(error_code::invalid_argument, "unknown option or missing value: " + arg);
            }
        }
    }

    if (optind < argc)
        return fail<arguments>(error_code::invalid_argument, std::string("unexpected argument: ") + argv[optind]);
    return args;
}


std::vector<std::string> split_list(std::string_view list)
{
    std::vector<std::string> pieces;
    std::string input(list);
    boost::split(pieces, input, boost::is_any_of(","));

    std::vector<std::string> items;
    for (auto& piece : pieces)
    {
        boost::trim(piece);
        if (!piece.empty())
            items.push_back(std::move(piece));
    }
    return items;
}


result<zoned_time_point> parse_rfc3339(std::string_view text)
{
    using namespace std::chrono;

    static const detail::regex RFC3339_REGEX{
        R"(([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2}):([0-9]{2}):([0-9]{2})(?:\.([0-9]{1,9}))?(?:(Z)|([+-])([0-9]{2}):([0-9]{2})))"};

    std::string input(text);
    detail::smatch m;
    if (!detail::regex_match(input, m, RFC3339_REGEX))
        return fail<zoned_time_point>(error_code::invalid_argument, "cannot parse " + detail::quote(text) + " as RFC 3339");

    auto num = [&m](int i) { return std::stoi(m[i].str()); };
    year_month_day ymd{year{num(1)}, month{static_cast<unsigned>(num(2))}, day{static_cast<unsigned>(num(3))}};
    int hh = num(4);
    int mm = num(5);
    int ss = num(6);
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 59)
        return fail<zoned_time_point>(error_code::invalid_argument, "time " + detail::quote(text) + " out of range");

    nanoseconds frac{0};
    if (m[7].matched)
    {
        std::string digits = m[7].str();
        digits.append(9 - digits.length(), '0');
        frac = nanoseconds(std::stoll(digits));
    }

    minutes offset{0};
    if (!m[8].matched)
    {
        int off_h = num(10);
        int off_m = num(11);
        if (off_h > 23 || off_m > 59)
            return fail<zoned_time_point>(error_code::invalid_argument, "zone offset of " + detail::quote(text) + " out of range");
        offset = hours(off_h) + minutes(off_m);
        if (m[9].str() == "-")
            offset = -offset;
    }

    auto since_epoch = sys_days{ymd}.time_since_epoch() + hours(hh) + minutes(mm) + seconds(ss) + frac - offset;
    return zoned_time_point{system_clock::time_point(duration_cast<system_clock::duration>(since_epoch)), offset};
}


std::chrono::minutes local_utc_offset(std::chrono::system_clock::time_point tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&tt, &tm_buf);
    return std::chrono::duration_cast<std::chrono::minutes>(std::chrono::seconds(tm_buf.tm_gmtoff));
}


result<rewrite_options> make_rewrite_options(const arguments& args, const zoned_time_point& now)
{
    rewrite_options opts;
    opts.now = now.time;
    opts.utc_offset = now.offset;
    if (args.delete_binary)
    {
        if (!args.delete_types.empty() || !args.keep_types.empty())
            return fail<rewrite_options>(error_code::invalid_argument, "--delete-binary is incompatible with --delete-types and --keep-types");
        opts.delete_media_types = rewrite_options::binary_delete_types();
        opts.keep_media_types = rewrite_options::binary_keep_types();
    }
    else
    {
        opts.delete_media_types = split_list(args.delete_types);
        opts.keep_media_types = split_list(args.keep_types);
    }
    opts.decode_subject = args.decode_subject;
    opts.strict = args.strict;
    opts.verbose = args.verbose;

    RENDMAIL_TRY_VOID(opts.validate());
    return opts;
}


std::string usage(std::string_view program)
{
    std::string text = "Usage: " + std::string(program) + " [flag]...\n";
    text += "Reads an email message from stdin and rewrites it to stdout.\n\n";
    text += "  --backup-dir DIR     Directory to which the original, unmodified message is saved\n";
    text += "  --delete-binary      Delete common binary attachments from the message\n";
    text += "  --delete-types LIST  Comma-separated globs of attachment media types to delete\n";
    text += "  --keep-types LIST    Comma-separated glob overrides for --delete-types\n";
    text += "  --fake-now TIME      Hardcoded RFC 3339 time (only used for testing)\n";
    text += "  --decode-subject     Add X-Rendmail-Subject with the ASCII form of Subject\n";
    text += "  --strict             Fail for malformed messages instead of copying them\n";
    text += "  --verbose            Write informational messages to stderr\n";
    text += "  --help               Print this help\n";
    return text;
}


int run(int argc, char* argv[], std::istream& in, std::ostream& out)
{
    std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "rendmail";

    auto args = parse_arguments(argc, argv);
    if (!args)
    {
        RENDMAIL_ERROR(args.error().message());
        std::cerr << usage(program);
        return STATUS_USAGE;
    }
    if (args->help)
    {
        std::cerr << usage(program);
        return STATUS_OK;
    }
    ::rendmail::log::logger::instance().set_level(args->verbose ? ::rendmail::log::level::debug : ::rendmail::log::level::info);

    zoned_time_point now;
    if (!args->fake_now.empty())
    {
        auto parsed = parse_rfc3339(args->fake_now);
        if (!parsed)
        {
            RENDMAIL_ERROR("Bad --fake-now time: " + parsed.error().message());
            return STATUS_USAGE;
        }
        now = *parsed;
    }
    else
    {
        now.time = std::chrono::system_clock::now();
        now.offset = local_utc_offset(now.time);
    }

    auto opts = make_rewrite_options(*args, now);
    if (!opts)
    {
        RENDMAIL_ERROR(opts.error().message());
        return STATUS_USAGE;
    }

    if (args->backup_dir.empty())
        return rewrite(in, out, *opts);

    auto backup = backup_file::create(args->backup_dir, now.time);
    if (!backup)
    {
        RENDMAIL_ERROR("Failed creating file: " + backup.error().message());
        return STATUS_FAILURE;
    }

    tee_streambuf tee(*in.rdbuf(), **backup);
    std::istream tee_in(&tee);
    int status = rewrite(tee_in, out, *opts);

    // The backup gets the part of the message left unread by a failed rewrite too.
    auto drained = tee.drain();
    if (!drained)
    {
        RENDMAIL_ERROR("Failed reading message: " + drained.error().message());
        status = STATUS_FAILURE;
    }
    auto written = tee.status();
    if (!written)
    {
        RENDMAIL_ERROR("Failed writing message to " + (*backup)->path().string() + ": " + written.error().message());
        status = STATUS_FAILURE;
    }
    auto closed = (*backup)->close();
    if (!closed)
    {
        RENDMAIL_ERROR("Failed closing file: " + closed.error().message());
        status = STATUS_FAILURE;
    }
    return status;
}


} // namespace rendmail::cli
