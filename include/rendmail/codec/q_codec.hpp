/*

q_codec.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <rendmail/codec/base64.hpp>
#include <rendmail/codec/charset.hpp>
#include <rendmail/codec/codec.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Q codec, the decoder of RFC 2047 encoded-words.

An encoded-word has the form `=?charset?encoding?encoded-text?=` where the encoding is `B` (Base64) or `Q` (a variant of Quoted Printable).
**/
class RENDMAIL_EXPORT q_codec : public codec
{
public:

    q_codec() = default;

    ~q_codec() = default;

    /**
    Decoding every encoded-word in a header field value to UTF-8.

    Text outside of encoded-words is kept as it is. Linear white space between two adjacent encoded-words is removed, see RFC 2047 section 6.2.
    An encoded-word whose payload is broken is kept literally.

    @param header      Unfolded header field value.
    @return            Decoded value in UTF-8, except for the untouched text outside of encoded-words.
    @throw codec_error Unsupported charset of an encoded-word.
    @throw *           `charset::to_utf8(std::string_view, std::string_view)`.
    **/
    std::string decode_header(std::string_view header) const
    {
        std::string::size_type start = header.find(ENCODED_WORD_BEGIN);
        if (start == std::string_view::npos)
            return std::string(header);

        std::string dec_text(header.substr(0, start));
        header.remove_prefix(start);
        bool between_words = false;

        while (true)
        {
            start = header.find(ENCODED_WORD_BEGIN);
            if (start == std::string_view::npos)
                break;

            std::string_view::size_type cur = start + ENCODED_WORD_BEGIN.length();
            std::string_view::size_type charset_end = header.find(QUESTION_MARK_CHAR, cur);
            if (charset_end == std::string_view::npos)
                break;
            std::string_view charset_name = header.substr(cur, charset_end - cur);
            cur = charset_end + 1;

            // The encoding letter, a question mark and the closing `?=`.
            if (header.length() < cur + MIN_WORD_TAIL)
                break;
            char encoding = header[cur++];
            if (header[cur] != QUESTION_MARK_CHAR)
                break;
            cur++;

            std::string_view::size_type text_end = header.find(ENCODED_WORD_END, cur);
            if (text_end == std::string_view::npos)
                break;
            std::string_view text = header.substr(cur, text_end - cur);
            std::string_view::size_type end = text_end + ENCODED_WORD_END.length();

            std::optional<std::string> content = decode_payload(encoding, text);
            if (!content)
            {
                between_words = false;
                dec_text.append(header.substr(0, start + ENCODED_WORD_BEGIN.length()));
                header.remove_prefix(start + ENCODED_WORD_BEGIN.length());
                continue;
            }

            std::string_view before = header.substr(0, start);
            if (start > 0 && (!between_words || has_non_whitespace(before)))
                dec_text.append(before);

            dec_text += charset::to_utf8(*content, charset_name);
            header.remove_prefix(end);
            between_words = true;
        }

        dec_text.append(header);
        return dec_text;
    }

    /**
    Decoding the encoded text of a single encoded-word.

    @param encoding Encoding letter, `B` or `Q` in either case.
    @param text     Encoded text.
    @return         Decoded bytes, or empty if the text is not valid for the encoding.
    **/
    static std::optional<std::string> decode_payload(char encoding, std::string_view text)
    {
        try
        {
            if (encoding == 'B' || encoding == 'b')
                return base64().decode(text);
            if (encoding == 'Q' || encoding == 'q')
                return decode_q(text);
        }
        catch (const codec_error&)
        {
            return std::nullopt;
        }
        return std::nullopt;
    }

    /**
    Decoding by using variation of the Quoted Printable method: the underscore stands for a space.

    @param text        String to decode.
    @return            Decoded string.
    @throw codec_error Bad hexadecimal escape.
    @throw codec_error Bad character.
    **/
    static std::string decode_q(std::string_view text)
    {
        std::string dec_text;
        dec_text.reserve(text.length());
        for (std::string_view::size_type i = 0; i < text.length(); i++)
        {
            char ch = text[i];
            if (ch == UNDERSCORE_CHAR)
                dec_text += SPACE_CHAR;
            else if (ch == EQUAL_CHAR)
            {
                if (i + 2 >= text.length() || !is_hex_digit(text[i + 1]) || !is_hex_digit(text[i + 2]))
                    throw codec_error("Bad hexadecimal escape.");
                dec_text += static_cast<char>(hex_digit_to_int(text[i + 1]) * 16 + hex_digit_to_int(text[i + 2]));
                i += 2;
            }
            else if ((ch >= SPACE_CHAR && ch <= '~') || ch == LF_CHAR || ch == CR_CHAR || ch == '\t')
                dec_text += ch;
            else
                throw codec_error("Bad character `" + std::string(1, ch) + "`.");
        }
        return dec_text;
    }

private:

    inline static constexpr std::string_view ENCODED_WORD_BEGIN{"=?"};

    inline static constexpr std::string_view ENCODED_WORD_END{"?="};

    /**
    Shortest possible remainder after the charset: encoding letter, question mark, empty text and `?=`.
    **/
    static constexpr std::string_view::size_type MIN_WORD_TAIL = 4;

    static bool has_non_whitespace(std::string_view text)
    {
        for (char ch : text)
            if (ch != SPACE_CHAR && ch != '\t' && ch != LF_CHAR && ch != CR_CHAR)
                return true;
        return false;
    }
};


} // namespace rendmail
