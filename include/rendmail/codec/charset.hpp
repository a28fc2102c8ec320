/*

charset.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <rendmail/codec/codec.hpp>
#include <rendmail/detail/ascii.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Conversion of encoded-word payloads to UTF-8.

Only the charsets commonly found in mail headers are recognized: UTF-8, ISO-8859-1, US-ASCII and Windows-1252.
**/
class RENDMAIL_EXPORT charset : public codec
{
public:

    inline static constexpr std::string_view UTF8{"utf-8"};

    inline static constexpr std::string_view ISO_8859_1{"iso-8859-1"};

    inline static constexpr std::string_view US_ASCII{"us-ascii"};

    inline static constexpr std::string_view WINDOWS_1252{"windows-1252"};

    /**
    UTF-8 encoding of U+FFFD, substituted for bytes that are invalid in the declared charset.
    **/
    inline static constexpr std::string_view REPLACEMENT_CHAR{"\xEF\xBF\xBD"};

    /**
    Checking whether a charset name is recognized, ignoring case.

    @param name Charset name as declared in the encoded-word.
    @return     True if supported.
    **/
    static bool is_supported(std::string_view name)
    {
        return detail::iequals_ascii(name, UTF8) || detail::iequals_ascii(name, ISO_8859_1) ||
            detail::iequals_ascii(name, US_ASCII) || detail::iequals_ascii(name, WINDOWS_1252);
    }

    /**
    Converting text from the given charset to UTF-8.

    UTF-8 text is passed through untouched; invalid sequences are left for the caller to deal with.

    @param text        Text in the given charset.
    @param name        Charset name.
    @return            UTF-8 text.
    @throw codec_error Unsupported charset.
    @throw codec_error Conversion failure.
    **/
    static std::string to_utf8(std::string_view text, std::string_view name)
    {
        if (detail::iequals_ascii(name, UTF8))
            return std::string(text);

        if (detail::iequals_ascii(name, US_ASCII))
        {
            std::string out;
            out.reserve(text.size());
            for (char ch : text)
            {
                if (is_8bit_char(ch))
                    out += REPLACEMENT_CHAR;
                else
                    out += ch;
            }
            return out;
        }

        if (detail::iequals_ascii(name, ISO_8859_1) || detail::iequals_ascii(name, WINDOWS_1252))
        {
            try
            {
                return boost::locale::conv::to_utf<char>(std::string(text), detail::to_lower_copy(name),
                    boost::locale::conv::skip);
            }
            catch (const boost::locale::conv::conversion_error& exc)
            {
                throw codec_error("Conversion from `" + std::string(name) + "` failed: " + exc.what());
            }
            catch (const boost::locale::conv::invalid_charset_error& exc)
            {
                throw codec_error("Charset `" + std::string(name) + "` unavailable: " + exc.what());
            }
        }

        throw codec_error("Unhandled charset `" + std::string(name) + "`.");
    }

    /**
    Dropping byte sequences that are not valid UTF-8.

    @param text Possibly broken UTF-8 text.
    @return     Valid UTF-8 text.
    **/
    static std::string sanitize_utf8(const std::string& text)
    {
        return boost::locale::conv::utf_to_utf<char>(text, boost::locale::conv::skip);
    }
};


} // namespace rendmail
