/*

transliterate.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Reduction of header field values to printable ASCII: RFC 2047 decoding, removal of diacritics and of whatever else is not ASCII.

*/


#pragma once

#include <iterator>
#include <locale>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <boost/locale/localization_backend.hpp>
#include <boost/locale/utf.hpp>
#include <unicode/uchar.h>
#include <rendmail/codec/charset.hpp>
#include <rendmail/codec/codec.hpp>
#include <rendmail/codec/q_codec.hpp>
#include <rendmail/detail/log.hpp>


namespace rendmail
{

namespace detail
{

    /**
    UTF-8 locale of the ICU backend, which carries the Unicode normalization facets.
    **/
    inline const std::locale& unicode_locale()
    {
        static const std::locale loc = []
        {
            boost::locale::localization_backend_manager manager = boost::locale::localization_backend_manager::global();
            manager.select("icu");
            boost::locale::generator gen(manager);
            return gen("en_US.UTF-8");
        }();
        return loc;
    }

    /**
    Dropping every code point of the general category Mn (nonspacing mark).

    @param text Valid UTF-8 text.
    @return     Text without nonspacing marks.
    **/
    [[nodiscard]] inline std::string strip_nonspacing_marks(const std::string& text)
    {
        using traits = boost::locale::utf::utf_traits<char>;
        std::string out;
        out.reserve(text.size());
        auto it = text.begin();
        while (it != text.end())
        {
            boost::locale::utf::code_point cp = traits::decode(it, text.end());
            if (cp == boost::locale::utf::illegal || cp == boost::locale::utf::incomplete)
                continue;
            if (u_charType(static_cast<UChar32>(cp)) == U_NON_SPACING_MARK)
                continue;
            traits::encode(cp, std::back_inserter(out));
        }
        return out;
    }

    /**
    Keeping only printable ASCII, space and horizontal tab, the characters allowed in a field body by RFC 5322 section 2.2.
    **/
    [[nodiscard]] inline std::string keep_printable_ascii(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (char ch : text)
        {
            unsigned char u = static_cast<unsigned char>(ch);
            if ((u >= 32 && u <= 126) || ch == '\t')
                out += ch;
        }
        return out;
    }

} // namespace detail


/**
Converting a raw header field value to 7-bit ASCII.

Encoded-words are decoded, the text is decomposed, nonspacing marks are removed so that accented letters keep their base letter,
the text is recomposed and finally anything outside of printable ASCII is dropped.

@param unfolded Unfolded header field value, possibly with encoded-words.
@return         The ASCII value, or empty if an encoded-word uses an unsupported charset or the conversion failed.
**/
[[nodiscard]] inline std::optional<std::string> decode_header_value(std::string_view unfolded)
{
    try
    {
        std::string dec = charset::sanitize_utf8(q_codec().decode_header(unfolded));
        const std::locale& loc = detail::unicode_locale();
        std::string nfd = boost::locale::normalize(dec, boost::locale::norm_nfd, loc);
        std::string nfc = boost::locale::normalize(detail::strip_nonspacing_marks(nfd), boost::locale::norm_nfc, loc);
        return detail::keep_printable_ascii(nfc);
    }
    catch (const codec_error& exc)
    {
        RENDMAIL_DEBUG(std::string("Header value not decoded: ") + exc.what());
        return std::nullopt;
    }
    catch (const std::runtime_error& exc)
    {
        RENDMAIL_DEBUG(std::string("Header value not transliterated: ") + exc.what());
        return std::nullopt;
    }
    catch (const std::bad_cast& exc)
    {
        RENDMAIL_DEBUG(std::string("Unicode normalization unavailable: ") + exc.what());
        return std::nullopt;
    }
}


} // namespace rendmail
