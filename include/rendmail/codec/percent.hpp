/*

percent.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <rendmail/codec/codec.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Percent decoding of extended parameter values as described in RFC 2231 section 4.
**/
class RENDMAIL_EXPORT percent : public codec
{
public:

    percent() = default;

    ~percent() = default;

    /**
    Decoding a percent encoded string.

    @param txt         String to decode.
    @return            Decoded string.
    @throw codec_error Percent sign not followed by two hexadecimal digits.
    **/
    std::string decode(std::string_view txt) const
    {
        std::string dec_text;
        dec_text.reserve(txt.length());
        for (std::string_view::size_type ch = 0; ch < txt.length(); ch++)
        {
            if (txt[ch] == PERCENT_HEX_FLAG)
            {
                if (ch + 2 >= txt.length() || !is_hex_digit(txt[ch + 1]) || !is_hex_digit(txt[ch + 2]))
                    throw codec_error("Bad character.");

                int nc_val = hex_digit_to_int(txt[ch + 1]);
                int nnc_val = hex_digit_to_int(txt[ch + 2]);
                dec_text += static_cast<char>((nc_val << 4) + nnc_val);
                ch += 2;
            }
            else
                dec_text += txt[ch];
        }
        return dec_text;
    }
};


} // namespace rendmail
