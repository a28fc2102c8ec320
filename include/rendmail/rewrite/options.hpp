/*

options.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>
#include <rendmail/config.hpp>
#include <rendmail/detail/result.hpp>
#include <rendmail/export.hpp>
#include <rendmail/mime/media_policy.hpp>


namespace rendmail
{


/**
Settings of a single message rewrite, built once before the message is read.
**/
struct RENDMAIL_EXPORT rewrite_options
{
    /**
    Globs of the media types of the body parts to delete.
    **/
    std::vector<std::string> delete_media_types;

    /**
    Globs of the media types kept even if matched by `delete_media_types`.
    **/
    std::vector<std::string> keep_media_types;

    /**
    Time stamped on the deletion placeholders.
    **/
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();

    /**
    Zone offset used for rendering `now`.
    **/
    std::chrono::minutes utc_offset{0};

    /**
    Adding `X-Rendmail-Subject` with the ASCII transliteration of the subject.
    **/
    bool decode_subject = false;

    /**
    Failing on malformed messages instead of copying the rest of the message as it is.
    **/
    bool strict = false;

    /**
    Logging what is done to the message.
    **/
    bool verbose = false;

    /**
    Deepest multipart nesting accepted.
    **/
    unsigned int max_nesting_depth = RENDMAIL_DEFAULT_MAX_NESTING_DEPTH;

    /**
    Checking the globs, so that a malformed one is reported before any input is read.

    @return Error `invalid_glob` for the first malformed glob.
    **/
    [[nodiscard]] result_void validate() const
    {
        for (const auto& glob : delete_media_types)
            RENDMAIL_TRY_VOID(validate_glob(glob));
        for (const auto& glob : keep_media_types)
            RENDMAIL_TRY_VOID(validate_glob(glob));
        return ok();
    }

    /**
    Media types deleted in the binary attachment mode.
    **/
    static const std::vector<std::string>& binary_delete_types()
    {
        static const std::vector<std::string> TYPES{"application/*", "audio/*", "image/*", "video/*"};
        return TYPES;
    }

    /**
    Textual subtypes of `application` kept in the binary attachment mode.
    **/
    static const std::vector<std::string>& binary_keep_types()
    {
        static const std::vector<std::string> TYPES
        {
            "application/ecmascript",
            "application/ics",
            "application/javascript",
            "application/json",
            "application/pgp-*",
            "application/pkcs7-signature",
            "application/rtf",
            "application/xml",

            "application/*+json",
            "application/*+xml",

            "application/x-csh",
            "application/x-dia-diagram",
            "application/x-ecmascript",
            "application/x-httpd-php",
            "application/x-javascript",
            "application/x-perl",
            "application/x-ruby",
            "application/x-sh",
        };
        return TYPES;
    }
};


/**
Formatting a time as in RFC 1123 with a numeric zone, like `Mon, 02 Jan 2006 15:04:05 -0700`.

@param tp     Time to format.
@param offset Offset of the zone to render the time in.
@return       Formatted time.
**/
[[nodiscard]] inline std::string format_rfc1123z(std::chrono::system_clock::time_point tp, std::chrono::minutes offset)
{
    static constexpr const char* DAY_NAMES[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* MONTH_NAMES[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    auto local = std::chrono::floor<std::chrono::seconds>(tp + offset);
    std::time_t tt = std::chrono::system_clock::to_time_t(local);
    std::tm tm_buf{};
    gmtime_r(&tt, &tm_buf);

    long total = static_cast<long>(offset.count());
    char sign = total < 0 ? '-' : '+';
    if (total < 0)
        total = -total;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d %c%02ld%02ld",
        DAY_NAMES[tm_buf.tm_wday], tm_buf.tm_mday, MONTH_NAMES[tm_buf.tm_mon], tm_buf.tm_year + 1900,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, sign, total / 60, total % 60);
    return buf;
}


} // namespace rendmail
