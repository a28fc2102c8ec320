/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <rendmail/codec/codec.hpp>
#include <rendmail/detail/ascii.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Base64 decoder for the payload of `B` encoded-words.

Only the standard alphabet is accepted and the padding must be complete, as RFC 2047 section 4.1 requires.
**/
class RENDMAIL_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static constexpr std::string_view CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    base64() = default;

    ~base64() = default;

    /**
    Decoding a Base64 string.

    @param text        Base64 encoded string.
    @return            Decoded string.
    @throw codec_error Bad character.
    @throw codec_error Bad padding.
    **/
    std::string decode(std::string_view text) const
    {
        std::string dec_text;
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;
        std::string_view::size_type ch = 0;

        for (; ch < text.length() && text[ch] != EQUAL_CHAR; ch++)
        {
            if (!is_allowed(text[ch]))
                throw codec_error("Bad character `" + std::string(1, text[ch]) + "`.");

            sextets[count_4_chars++] = static_cast<unsigned char>(CHARSET.find(text[ch]));
            if (count_4_chars == SEXTETS_NO)
            {
                append_octets(dec_text, sextets, OCTETS_NO);
                count_4_chars = 0;
            }
        }

        // The padding must complete the last quantum and nothing may follow it.
        std::string_view::size_type padding = text.length() - ch;
        if (count_4_chars == 1)
            throw codec_error("Bad padding.");
        if (count_4_chars == 0 && padding != 0)
            throw codec_error("Bad padding.");
        if (count_4_chars > 0)
        {
            if (padding != static_cast<std::string_view::size_type>(SEXTETS_NO - count_4_chars))
                throw codec_error("Bad padding.");
            for (; ch < text.length(); ch++)
                if (text[ch] != EQUAL_CHAR)
                    throw codec_error("Bad padding.");

            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            append_octets(dec_text, sextets, count_4_chars - 1);
        }

        return dec_text;
    }

private:

    static void append_octets(std::string& out, const unsigned char* sextets, int count)
    {
        unsigned char octets[OCTETS_NO];
        octets[0] = static_cast<unsigned char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
        octets[1] = static_cast<unsigned char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
        octets[2] = static_cast<unsigned char>(((sextets[2] & 0x3) << 6) + sextets[3]);
        for (int i = 0; i < count; i++)
            out += static_cast<char>(octets[i]);
    }

    /**
    Checking if the given character is in the base64 character set.

    @param ch Character to check.
    @return   True if it is, false if not.
    **/
    static bool is_allowed(char ch)
    {
        return detail::is_ascii_alnum(ch) || ch == PLUS_CHAR || ch == SLASH_CHAR;
    }

	/**
	Number of six bit chunks.
	**/
	static constexpr int SEXTETS_NO = 4;

	/**
	Number of eight bit characters.
	**/
	static constexpr int OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace rendmail
